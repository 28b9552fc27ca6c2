#pragma once

#include <algorithm>
#include <cstdint>

namespace casement
{

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(Vec2 o) const { return {x + o.x, y + o.y}; }
    constexpr Vec2 operator-(Vec2 o) const { return {x - o.x, y - o.y}; }
    constexpr Vec2 operator*(float s) const { return {x * s, y * s}; }
    constexpr Vec2 operator/(float s) const { return {x / s, y / s}; }
    Vec2&          operator+=(Vec2 o)
    {
        x += o.x;
        y += o.y;
        return *this;
    }

    constexpr bool operator==(const Vec2&) const = default;
};

// Physical pixel extent of a window or surface.
struct SizePx
{
    uint32_t width  = 0;
    uint32_t height = 0;

    constexpr bool is_empty() const { return width == 0 || height == 0; }
    constexpr bool operator==(const SizePx&) const = default;

    // Surfaces cannot be zero-sized; minimized windows report 0x0 on some platforms.
    constexpr SizePx at_least_one() const
    {
        return {width == 0 ? 1u : width, height == 0 ? 1u : height};
    }
};

struct Rect
{
    Vec2 min;
    Vec2 max;

    static constexpr Rect from_min_size(Vec2 min, Vec2 size) { return {min, min + size}; }

    constexpr Vec2  size() const { return max - min; }
    constexpr float width() const { return max.x - min.x; }
    constexpr float height() const { return max.y - min.y; }
    constexpr bool  operator==(const Rect&) const = default;
};

struct Rgba
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;

    static constexpr Rgba transparent() { return {0.0f, 0.0f, 0.0f, 0.0f}; }

    constexpr bool operator==(const Rgba&) const = default;
};

inline SizePx to_pixels(Vec2 points, float pixels_per_point)
{
    auto px = [&](float v)
    { return static_cast<uint32_t>(std::max(0.0f, v * pixels_per_point + 0.5f)); };
    return {px(points.x), px(points.y)};
}

inline Vec2 to_points(SizePx size, float pixels_per_point)
{
    return {static_cast<float>(size.width) / pixels_per_point,
            static_cast<float>(size.height) / pixels_per_point};
}

}   // namespace casement
