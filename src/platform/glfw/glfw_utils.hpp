#pragma once

#ifdef CASEMENT_USE_GLFW

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <casement/logger.hpp>
    #include <casement/viewport.hpp>
    #include <cstring>
    #include <memory>
    #include <stb_image.h>
    #include <string>
    #include <vector>

namespace casement
{

// Downscale RGBA image to target_size x target_size using box filter.
// Returns empty vector if src is already <= target_size.
inline std::vector<unsigned char> downscale_icon(const unsigned char* src,
                                                 int                  src_w,
                                                 int                  src_h,
                                                 int                  target_size)
{
    if (src_w <= target_size && src_h <= target_size)
        return {};

    std::vector<unsigned char> dst(static_cast<size_t>(target_size) * target_size * 4);
    const float                sx = static_cast<float>(src_w) / target_size;
    const float                sy = static_cast<float>(src_h) / target_size;

    for (int dy = 0; dy < target_size; ++dy)
    {
        for (int dx = 0; dx < target_size; ++dx)
        {
            int x0 = static_cast<int>(dx * sx);
            int y0 = static_cast<int>(dy * sy);
            int x1 = std::min(static_cast<int>((dx + 1) * sx), src_w);
            int y1 = std::min(static_cast<int>((dy + 1) * sy), src_h);

            float r = 0, g = 0, b = 0, a = 0;
            int   count = 0;
            for (int py = y0; py < y1; ++py)
            {
                for (int px = x0; px < x1; ++px)
                {
                    const unsigned char* p = src + (static_cast<size_t>(py) * src_w + px) * 4;
                    r += p[0];
                    g += p[1];
                    b += p[2];
                    a += p[3];
                    ++count;
                }
            }

            unsigned char* d = dst.data() + (static_cast<size_t>(dy) * target_size + dx) * 4;
            if (count > 0)
            {
                d[0] = static_cast<unsigned char>(r / count);
                d[1] = static_cast<unsigned char>(g / count);
                d[2] = static_cast<unsigned char>(b / count);
                d[3] = static_cast<unsigned char>(a / count);
            }
            else
            {
                std::memset(d, 0, 4);
            }
        }
    }
    return dst;
}

// Decodes a PNG into icon pixels. Returns null (and logs) when unreadable.
inline std::shared_ptr<const IconData> load_icon_file(const std::string& path)
{
    int            w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!pixels)
    {
        CASEMENT_LOG_WARN("glfw", "Could not load window icon '{}': {}", path, stbi_failure_reason());
        return nullptr;
    }

    auto icon    = std::make_shared<IconData>();
    icon->width  = static_cast<uint32_t>(w);
    icon->height = static_cast<uint32_t>(h);
    icon->rgba.assign(pixels, pixels + static_cast<size_t>(w) * h * 4);
    stbi_image_free(pixels);
    return icon;
}

// Hands GLFW the icon at 16, 32 and 48 px; null restores the default icon.
inline void set_window_icon(GLFWwindow* window, const IconData* icon)
{
    if (!window)
        return;

    if (!icon || icon->rgba.empty())
    {
        glfwSetWindowIcon(window, 0, nullptr);
        return;
    }

    constexpr int ICON_SIZES[] = {16, 32, 48};
    constexpr int N            = sizeof(ICON_SIZES) / sizeof(ICON_SIZES[0]);

    const int                  w = static_cast<int>(icon->width);
    const int                  h = static_cast<int>(icon->height);
    std::vector<unsigned char> source(icon->rgba.begin(), icon->rgba.end());
    std::vector<unsigned char> buffers[N];
    GLFWimage                  images[N];

    for (int i = 0; i < N; ++i)
    {
        buffers[i] = downscale_icon(source.data(), w, h, ICON_SIZES[i]);
        if (!buffers[i].empty())
        {
            images[i].width  = ICON_SIZES[i];
            images[i].height = ICON_SIZES[i];
            images[i].pixels = buffers[i].data();
        }
        else
        {
            images[i].width  = w;
            images[i].height = h;
            images[i].pixels = source.data();
        }
    }

    glfwSetWindowIcon(window, N, images);
}

// On GNOME/Wayland the title bar icon comes from the .desktop file matching
// this app_id. Must be called before glfwCreateWindow().
inline void set_wayland_app_id(const std::string& app_id)
{
    #ifdef GLFW_WAYLAND_APP_ID
    glfwWindowHintString(GLFW_WAYLAND_APP_ID, app_id.c_str());
    #else
    (void)app_id;
    #endif
}

}   // namespace casement

#endif   // CASEMENT_USE_GLFW
