#ifdef CASEMENT_USE_GLFW

    #include "glfw_platform.hpp"

    #include <casement/errors.hpp>
    #include <casement/logger.hpp>
    #include <cmath>

    #include "glfw_utils.hpp"
    #include "render/vulkan/vk_context.hpp"

namespace casement
{

namespace
{

void glfw_error_callback(int code, const char* description)
{
    CASEMENT_LOG_ERROR("glfw", "GLFW error {}: {}", code, description ? description : "");
}

Modifiers translate_mods(int mods)
{
    Modifiers m;
    m.alt   = (mods & GLFW_MOD_ALT) != 0;
    m.ctrl  = (mods & GLFW_MOD_CONTROL) != 0;
    m.shift = (mods & GLFW_MOD_SHIFT) != 0;
    #ifdef __APPLE__
    m.command = (mods & GLFW_MOD_SUPER) != 0;
    #else
    m.command = m.ctrl;
    #endif
    return m;
}

Key translate_key(int key)
{
    switch (key)
    {
        case GLFW_KEY_A:
            return Key::A;
        case GLFW_KEY_C:
            return Key::C;
        case GLFW_KEY_V:
            return Key::V;
        case GLFW_KEY_X:
            return Key::X;
        case GLFW_KEY_Z:
            return Key::Z;
        case GLFW_KEY_ESCAPE:
            return Key::Escape;
        case GLFW_KEY_ENTER:
        case GLFW_KEY_KP_ENTER:
            return Key::Enter;
        case GLFW_KEY_TAB:
            return Key::Tab;
        case GLFW_KEY_SPACE:
            return Key::Space;
        case GLFW_KEY_BACKSPACE:
            return Key::Backspace;
        case GLFW_KEY_DELETE:
            return Key::Delete;
        case GLFW_KEY_INSERT:
            return Key::Insert;
        case GLFW_KEY_HOME:
            return Key::Home;
        case GLFW_KEY_END:
            return Key::End;
        case GLFW_KEY_PAGE_UP:
            return Key::PageUp;
        case GLFW_KEY_PAGE_DOWN:
            return Key::PageDown;
        case GLFW_KEY_LEFT:
            return Key::ArrowLeft;
        case GLFW_KEY_RIGHT:
            return Key::ArrowRight;
        case GLFW_KEY_UP:
            return Key::ArrowUp;
        case GLFW_KEY_DOWN:
            return Key::ArrowDown;
        case GLFW_KEY_F1:
            return Key::F1;
        case GLFW_KEY_F11:
            return Key::F11;
        default:
            return Key::Unknown;
    }
}

PointerButton translate_button(int button)
{
    switch (button)
    {
        case GLFW_MOUSE_BUTTON_RIGHT:
            return PointerButton::Secondary;
        case GLFW_MOUSE_BUTTON_MIDDLE:
            return PointerButton::Middle;
        case GLFW_MOUSE_BUTTON_4:
            return PointerButton::Extra1;
        case GLFW_MOUSE_BUTTON_5:
            return PointerButton::Extra2;
        default:
            return PointerButton::Primary;
    }
}

int cursor_shape(CursorIcon icon)
{
    switch (icon)
    {
        case CursorIcon::PointingHand:
        case CursorIcon::Grab:
        case CursorIcon::Grabbing:
            return GLFW_HAND_CURSOR;
        case CursorIcon::Text:
            return GLFW_IBEAM_CURSOR;
        case CursorIcon::Crosshair:
            return GLFW_CROSSHAIR_CURSOR;
        case CursorIcon::ResizeHorizontal:
            return GLFW_HRESIZE_CURSOR;
        case CursorIcon::ResizeVertical:
            return GLFW_VRESIZE_CURSOR;
    #ifdef GLFW_RESIZE_NWSE_CURSOR
        case CursorIcon::ResizeNwSe:
            return GLFW_RESIZE_NWSE_CURSOR;
        case CursorIcon::ResizeNeSw:
            return GLFW_RESIZE_NESW_CURSOR;
        case CursorIcon::Move:
            return GLFW_RESIZE_ALL_CURSOR;
        case CursorIcon::NotAllowed:
            return GLFW_NOT_ALLOWED_CURSOR;
    #endif
        default:
            return GLFW_ARROW_CURSOR;
    }
}

int glfw_bool(bool v)
{
    return v ? GLFW_TRUE : GLFW_FALSE;
}

}   // namespace

// ─── GlfwWindow ──────────────────────────────────────────────────────────────

GlfwWindow::GlfwWindow(GlfwPlatform& platform, GLFWwindow* handle, WindowId id)
    : platform_(platform), window_(handle), id_(id)
{
}

GlfwWindow::~GlfwWindow()
{
    if (!window_)
        return;
    platform_.forget_window(window_);
    glfwDestroyWindow(window_);
    window_ = nullptr;
}

float GlfwWindow::pixels_per_screen_unit() const
{
    int fb_w = 0, fb_h = 0, win_w = 0, win_h = 0;
    glfwGetFramebufferSize(window_, &fb_w, &fb_h);
    glfwGetWindowSize(window_, &win_w, &win_h);
    if (win_w <= 0 || fb_w <= 0)
        return 1.0f;
    return static_cast<float>(fb_w) / static_cast<float>(win_w);
}

SizePx GlfwWindow::inner_size_px() const
{
    int w = 0, h = 0;
    glfwGetFramebufferSize(window_, &w, &h);
    return {static_cast<uint32_t>(std::max(w, 0)), static_cast<uint32_t>(std::max(h, 0))};
}

SizePx GlfwWindow::outer_size_px() const
{
    int left = 0, top = 0, right = 0, bottom = 0;
    glfwGetWindowFrameSize(window_, &left, &top, &right, &bottom);
    SizePx inner = inner_size_px();
    float  k     = pixels_per_screen_unit();
    return {inner.width + static_cast<uint32_t>(std::lround((left + right) * k)),
            inner.height + static_cast<uint32_t>(std::lround((top + bottom) * k))};
}

std::optional<Vec2> GlfwWindow::inner_position_px() const
{
    int x = 0, y = 0;
    glfwGetWindowPos(window_, &x, &y);
    float k = pixels_per_screen_unit();
    return Vec2{x * k, y * k};
}

std::optional<Vec2> GlfwWindow::outer_position_px() const
{
    int left = 0, top = 0, right = 0, bottom = 0;
    glfwGetWindowFrameSize(window_, &left, &top, &right, &bottom);
    auto  inner = inner_position_px();
    float k     = pixels_per_screen_unit();
    return *inner - Vec2{left * k, top * k};
}

float GlfwWindow::scale_factor() const
{
    float xs = 1.0f, ys = 1.0f;
    glfwGetWindowContentScale(window_, &xs, &ys);
    return xs > 0.0f ? xs : 1.0f;
}

std::optional<Vec2> GlfwWindow::monitor_size_px() const
{
    GLFWmonitor* monitor = glfwGetWindowMonitor(window_);
    if (!monitor)
        monitor = glfwGetPrimaryMonitor();
    if (!monitor)
        return std::nullopt;
    const GLFWvidmode* mode = glfwGetVideoMode(monitor);
    if (!mode)
        return std::nullopt;
    return Vec2{static_cast<float>(mode->width), static_cast<float>(mode->height)};
}

std::optional<bool> GlfwWindow::is_minimized() const
{
    return glfwGetWindowAttrib(window_, GLFW_ICONIFIED) != 0;
}

bool GlfwWindow::is_maximized() const
{
    return glfwGetWindowAttrib(window_, GLFW_MAXIMIZED) != 0;
}

bool GlfwWindow::is_fullscreen() const
{
    return glfwGetWindowMonitor(window_) != nullptr;
}

bool GlfwWindow::has_focus() const
{
    return glfwGetWindowAttrib(window_, GLFW_FOCUSED) != 0;
}

void GlfwWindow::set_title(const std::string& title)
{
    title_ = title;
    glfwSetWindowTitle(window_, title.c_str());
}

void GlfwWindow::set_inner_size(Vec2 size)
{
    // Points to screen units: points * scale gives pixels.
    float k = scale_factor() / pixels_per_screen_unit();
    int   w = std::max(1, static_cast<int>(std::lround(size.x * k)));
    int   h = std::max(1, static_cast<int>(std::lround(size.y * k)));
    glfwSetWindowSize(window_, w, h);
}

void GlfwWindow::set_min_inner_size(std::optional<Vec2> size)
{
    min_size_ = size;
    apply_size_limits();
}

void GlfwWindow::set_max_inner_size(std::optional<Vec2> size)
{
    max_size_ = size;
    apply_size_limits();
}

void GlfwWindow::apply_size_limits()
{
    float k = scale_factor() / pixels_per_screen_unit();
    auto  to_units = [k](std::optional<Vec2> v, bool x_axis)
    {
        if (!v)
            return GLFW_DONT_CARE;
        return std::max(1, static_cast<int>(std::lround((x_axis ? v->x : v->y) * k)));
    };
    glfwSetWindowSizeLimits(window_,
                            to_units(min_size_, true),
                            to_units(min_size_, false),
                            to_units(max_size_, true),
                            to_units(max_size_, false));
}

void GlfwWindow::set_outer_position(Vec2 pos)
{
    float k = scale_factor() / pixels_per_screen_unit();
    int   left = 0, top = 0, right = 0, bottom = 0;
    glfwGetWindowFrameSize(window_, &left, &top, &right, &bottom);
    glfwSetWindowPos(window_,
                     static_cast<int>(std::lround(pos.x * k)) + left,
                     static_cast<int>(std::lround(pos.y * k)) + top);
}

void GlfwWindow::set_visible(bool visible)
{
    if (visible)
        glfwShowWindow(window_);
    else
        glfwHideWindow(window_);
}

void GlfwWindow::set_transparent(bool transparent)
{
    // The framebuffer alpha is fixed at creation.
    CASEMENT_LOG_DEBUG("glfw",
                       "Window {}: transparency ({}) only applies at creation",
                       id_,
                       transparent ? "on" : "off");
}

void GlfwWindow::set_resizable(bool resizable)
{
    glfwSetWindowAttrib(window_, GLFW_RESIZABLE, glfw_bool(resizable));
}

void GlfwWindow::set_minimized(bool minimized)
{
    if (minimized)
        glfwIconifyWindow(window_);
    else
        glfwRestoreWindow(window_);
}

void GlfwWindow::set_maximized(bool maximized)
{
    if (maximized)
        glfwMaximizeWindow(window_);
    else
        glfwRestoreWindow(window_);
}

void GlfwWindow::set_fullscreen(bool fullscreen)
{
    if (fullscreen == is_fullscreen())
        return;

    if (fullscreen)
    {
        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        if (!monitor)
        {
            CASEMENT_LOG_WARN("glfw", "No monitor available for fullscreen");
            return;
        }
        const GLFWvidmode* mode = glfwGetVideoMode(monitor);
        glfwGetWindowPos(window_, &saved_x_, &saved_y_);
        glfwGetWindowSize(window_, &saved_w_, &saved_h_);
        glfwSetWindowMonitor(window_, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
    }
    else
    {
        glfwSetWindowMonitor(window_, nullptr, saved_x_, saved_y_, saved_w_, saved_h_, GLFW_DONT_CARE);
    }
}

void GlfwWindow::set_decorations(bool decorations)
{
    glfwSetWindowAttrib(window_, GLFW_DECORATED, glfw_bool(decorations));
}

void GlfwWindow::set_window_level(WindowLevel level)
{
    if (level == WindowLevel::AlwaysOnBottom)
        CASEMENT_LOG_DEBUG("glfw", "Window {}: always-on-bottom is not supported", id_);
    glfwSetWindowAttrib(window_, GLFW_FLOATING, glfw_bool(level == WindowLevel::AlwaysOnTop));
}

void GlfwWindow::set_icon(const IconData* icon)
{
    set_window_icon(window_, icon);
}

void GlfwWindow::focus()
{
    glfwFocusWindow(window_);
}

void GlfwWindow::request_user_attention()
{
    glfwRequestWindowAttention(window_);
}

bool GlfwWindow::drag_window()
{
    // GLFW exposes no compositor-driven move.
    CASEMENT_LOG_DEBUG("glfw", "Window {}: drag requested, not supported", id_);
    return false;
}

void GlfwWindow::set_cursor_icon(CursorIcon icon)
{
    if (icon == CursorIcon::None)
    {
        glfwSetInputMode(window_, GLFW_CURSOR, GLFW_CURSOR_HIDDEN);
        return;
    }
    glfwSetCursor(window_, platform_.standard_cursor(icon));
}

void GlfwWindow::set_cursor_visible(bool visible)
{
    glfwSetInputMode(window_, GLFW_CURSOR, visible ? GLFW_CURSOR_NORMAL : GLFW_CURSOR_HIDDEN);
}

bool GlfwWindow::set_cursor_position(Vec2 pos)
{
    float k = scale_factor() / pixels_per_screen_unit();
    glfwSetCursorPos(window_, pos.x * k, pos.y * k);
    return true;
}

bool GlfwWindow::set_mouse_passthrough(bool passthrough)
{
    #ifdef GLFW_MOUSE_PASSTHROUGH
    glfwSetWindowAttrib(window_, GLFW_MOUSE_PASSTHROUGH, glfw_bool(passthrough));
    return true;
    #else
    (void)passthrough;
    return false;
    #endif
}

void GlfwWindow::request_redraw()
{
    platform_.post(PlatformEvent::for_window(id_, WindowEvent::redraw_requested()));
}

// ─── GlfwPlatform ────────────────────────────────────────────────────────────

GlfwPlatform::GlfwPlatform()
{
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
        throw SurfaceCreationError("glfwInit failed");
    if (!glfwVulkanSupported())
    {
        glfwTerminate();
        throw SurfaceCreationError("GLFW reports no Vulkan loader");
    }
    CASEMENT_LOG_INFO("glfw", "GLFW {} initialized", glfwGetVersionString());
}

GlfwPlatform::~GlfwPlatform()
{
    if (!windows_.empty())
        CASEMENT_LOG_WARN("glfw", "{} windows still open at platform shutdown", windows_.size());
    for (auto& [shape, cursor] : cursors_)
        glfwDestroyCursor(cursor);
    cursors_.clear();
    glfwTerminate();
}

GlfwPlatform* GlfwPlatform::from(GLFWwindow* window)
{
    return static_cast<GlfwPlatform*>(glfwGetWindowUserPointer(window));
}

std::unique_ptr<NativeWindow> GlfwPlatform::create_window(const ViewportAttributes& attributes)
{
    // GLFW has no window-type hint; popups default to undecorated, always-on-top windows.
    bool popup = attributes.window_type.value_or(WindowType::Normal) == WindowType::Popup;

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, glfw_bool(attributes.resizable.value_or(true)));
    glfwWindowHint(GLFW_DECORATED, glfw_bool(attributes.decorations.value_or(!popup)));
    glfwWindowHint(GLFW_VISIBLE, glfw_bool(attributes.visible.value_or(true)));
    glfwWindowHint(GLFW_MAXIMIZED, glfw_bool(attributes.maximized.value_or(false)));
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, glfw_bool(attributes.transparent.value_or(false)));
    glfwWindowHint(GLFW_FLOATING,
                   glfw_bool(attributes.window_level.value_or(popup ? WindowLevel::AlwaysOnTop
                                                                    : WindowLevel::Normal)
                             == WindowLevel::AlwaysOnTop));
    glfwWindowHint(GLFW_FOCUS_ON_SHOW, glfw_bool(attributes.active.value_or(true)));
    glfwWindowHint(GLFW_FOCUSED, glfw_bool(attributes.active.value_or(true)));
    glfwWindowHint(GLFW_SCALE_TO_MONITOR, GLFW_TRUE);
    #ifdef GLFW_MOUSE_PASSTHROUGH
    glfwWindowHint(GLFW_MOUSE_PASSTHROUGH, glfw_bool(attributes.mouse_passthrough.value_or(false)));
    #endif
    set_wayland_app_id(attributes.app_id.value_or("casement"));

    Vec2        size  = attributes.inner_size.value_or(Vec2{800.0f, 600.0f});
    std::string title = attributes.title.value_or("casement");

    GLFWmonitor* monitor = nullptr;
    int          w       = std::max(1, static_cast<int>(std::lround(size.x)));
    int          h       = std::max(1, static_cast<int>(std::lround(size.y)));
    if (attributes.fullscreen.value_or(false))
    {
        monitor = glfwGetPrimaryMonitor();
        if (const GLFWvidmode* mode = monitor ? glfwGetVideoMode(monitor) : nullptr)
        {
            w = mode->width;
            h = mode->height;
        }
    }

    GLFWwindow* handle = glfwCreateWindow(w, h, title.c_str(), monitor, nullptr);
    if (!handle)
        throw SurfaceCreationError("glfwCreateWindow failed for '" + title + "'");

    auto window = std::make_unique<GlfwWindow>(*this, handle, next_window_id_++);
    window->set_title(title);
    windows_[handle] = window.get();

    glfwSetWindowUserPointer(handle, this);
    install_callbacks(handle);

    if (attributes.position)
        window->set_outer_position(*attributes.position);
    if (attributes.min_inner_size || attributes.max_inner_size)
    {
        window->set_min_inner_size(attributes.min_inner_size);
        window->set_max_inner_size(attributes.max_inner_size);
    }
    if (attributes.icon)
        window->set_icon(attributes.icon.get());

    return window;
}

void GlfwPlatform::install_callbacks(GLFWwindow* window)
{
    glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);
    glfwSetWindowPosCallback(window, window_pos_callback);
    glfwSetWindowCloseCallback(window, window_close_callback);
    glfwSetWindowFocusCallback(window, window_focus_callback);
    glfwSetWindowIconifyCallback(window, window_iconify_callback);
    glfwSetWindowMaximizeCallback(window, window_maximize_callback);
    glfwSetWindowRefreshCallback(window, window_refresh_callback);
    glfwSetWindowContentScaleCallback(window, content_scale_callback);
    glfwSetCursorPosCallback(window, cursor_pos_callback);
    glfwSetCursorEnterCallback(window, cursor_enter_callback);
    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetScrollCallback(window, scroll_callback);
    glfwSetKeyCallback(window, key_callback);
    glfwSetCharCallback(window, char_callback);
}

void GlfwPlatform::forget_window(GLFWwindow* handle)
{
    windows_.erase(handle);
    // Events still queued for it are dropped by the registry lookup.
}

std::unique_ptr<GraphicsContext> GlfwPlatform::create_context(const ContextConfig& config)
{
    return std::make_unique<VulkanContext>(config);
}

std::unique_ptr<Painter> GlfwPlatform::create_painter(GraphicsContext& context)
{
    return std::make_unique<VulkanPainter>(static_cast<VulkanContext&>(context));
}

std::optional<std::string> GlfwPlatform::clipboard_text()
{
    const char* text = glfwGetClipboardString(nullptr);
    if (!text)
        return std::nullopt;
    return std::string(text);
}

void GlfwPlatform::set_clipboard_text(const std::string& text)
{
    glfwSetClipboardString(nullptr, text.c_str());
}

GLFWcursor* GlfwPlatform::standard_cursor(CursorIcon icon)
{
    int shape = cursor_shape(icon);
    if (auto it = cursors_.find(shape); it != cursors_.end())
        return it->second;
    GLFWcursor* cursor = glfwCreateStandardCursor(shape);
    cursors_[shape]    = cursor;
    return cursor;
}

void GlfwPlatform::post(PlatformEvent event)
{
    queue_.push_back(std::move(event));
    glfwPostEmptyEvent();
}

void GlfwPlatform::post_window(GLFWwindow* window, WindowEvent event)
{
    auto it = windows_.find(window);
    if (it == windows_.end())
        return;
    queue_.push_back(PlatformEvent::for_window(it->second->id(), event));
}

bool GlfwPlatform::pump_events(std::chrono::milliseconds timeout, std::vector<PlatformEvent>& out)
{
    if (!resumed_sent_)
    {
        resumed_sent_ = true;
        out.push_back(PlatformEvent::resumed());
        return true;
    }

    if (!queue_.empty() || timeout.count() == 0)
        glfwPollEvents();
    else if (timeout.count() < 0)
        glfwWaitEvents();
    else
        glfwWaitEventsTimeout(static_cast<double>(timeout.count()) / 1000.0);

    while (!queue_.empty())
    {
        out.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    // A display connection can always produce more events.
    return true;
}

// ─── GLFW callback trampolines ───────────────────────────────────────────────

void GlfwPlatform::framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    auto* self = from(window);
    if (!self)
        return;
    self->post_window(window,
                      WindowEvent::resized(static_cast<uint32_t>(std::max(width, 0)),
                                           static_cast<uint32_t>(std::max(height, 0))));
}

void GlfwPlatform::window_pos_callback(GLFWwindow* window, int x, int y)
{
    auto* self = from(window);
    if (!self)
        return;
    auto it = self->windows_.find(window);
    float k = it != self->windows_.end() ? it->second->pixels_per_screen_unit() : 1.0f;
    self->post_window(window, WindowEvent::moved(Vec2{x * k, y * k}));
}

void GlfwPlatform::window_close_callback(GLFWwindow* window)
{
    auto* self = from(window);
    if (!self)
        return;
    // The layer above decides; keep GLFW from treating the window as closed.
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    self->post_window(window, WindowEvent::close_requested());
}

void GlfwPlatform::window_focus_callback(GLFWwindow* window, int focused)
{
    auto* self = from(window);
    if (!self)
        return;
    if (!focused)
        self->last_cursor_.reset();
    self->post_window(window, WindowEvent::focused(focused != 0));
}

void GlfwPlatform::window_iconify_callback(GLFWwindow* window, int iconified)
{
    auto* self = from(window);
    if (self)
        self->post_window(window, WindowEvent::minimized(iconified != 0));
}

void GlfwPlatform::window_maximize_callback(GLFWwindow* window, int maximized)
{
    auto* self = from(window);
    if (self)
        self->post_window(window, WindowEvent::maximized(maximized != 0));
}

void GlfwPlatform::window_refresh_callback(GLFWwindow* window)
{
    auto* self = from(window);
    if (self)
        self->post_window(window, WindowEvent::redraw_requested());
}

void GlfwPlatform::content_scale_callback(GLFWwindow* window, float xscale, float /*yscale*/)
{
    auto* self = from(window);
    if (self)
        self->post_window(window, WindowEvent::scale_factor_changed(xscale));
}

void GlfwPlatform::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* self = from(window);
    if (!self)
        return;
    auto it = self->windows_.find(window);
    if (it == self->windows_.end())
        return;

    float k   = it->second->pixels_per_screen_unit();
    Vec2  pos = {static_cast<float>(x) * k, static_cast<float>(y) * k};
    self->post_window(window, WindowEvent::cursor_moved(pos));

    // GLFW has no raw motion stream; derive one for the focused window.
    if (glfwGetWindowAttrib(window, GLFW_FOCUSED))
    {
        if (self->last_cursor_)
        {
            self->queue_.push_back(PlatformEvent::device(
                {.kind = DeviceEvent::Kind::MouseMotion, .delta = pos - *self->last_cursor_}));
        }
        self->last_cursor_ = pos;
    }
}

void GlfwPlatform::cursor_enter_callback(GLFWwindow* window, int entered)
{
    auto* self = from(window);
    if (!self || entered)
        return;
    self->last_cursor_.reset();
    self->post_window(window, WindowEvent::cursor_left());
}

void GlfwPlatform::mouse_button_callback(GLFWwindow* window, int button, int action, int mods)
{
    auto* self = from(window);
    if (!self || action == GLFW_REPEAT)
        return;
    self->post_window(window,
                      WindowEvent::mouse_button(translate_button(button),
                                                action == GLFW_PRESS,
                                                translate_mods(mods)));
}

void GlfwPlatform::scroll_callback(GLFWwindow* window, double x_offset, double y_offset)
{
    auto* self = from(window);
    if (self)
    {
        self->post_window(window,
                          WindowEvent::mouse_wheel(
                              Vec2{static_cast<float>(x_offset), static_cast<float>(y_offset)}));
    }
}

void GlfwPlatform::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    auto* self = from(window);
    if (!self)
        return;
    self->post_window(window,
                      WindowEvent::keyboard(translate_key(key),
                                            action != GLFW_RELEASE,
                                            translate_mods(mods),
                                            action == GLFW_REPEAT));
}

void GlfwPlatform::char_callback(GLFWwindow* window, unsigned int codepoint)
{
    auto* self = from(window);
    if (self)
        self->post_window(window, WindowEvent::text(codepoint));
}

}   // namespace casement

#endif   // CASEMENT_USE_GLFW
