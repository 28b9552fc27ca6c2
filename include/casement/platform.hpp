#pragma once

#include <casement/input.hpp>
#include <casement/math.hpp>
#include <casement/viewport.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace casement
{

using WindowId = uint64_t;

inline constexpr WindowId INVALID_WINDOW_ID = 0;

// ─── Window ──────────────────────────────────────────────────────────────────

// An OS-level window. Owned by exactly one viewport record.
class NativeWindow
{
   public:
    virtual ~NativeWindow() = default;

    virtual WindowId id() const = 0;

    virtual SizePx              inner_size_px() const      = 0;
    virtual SizePx              outer_size_px() const      = 0;
    virtual std::optional<Vec2> inner_position_px() const  = 0;
    virtual std::optional<Vec2> outer_position_px() const  = 0;
    virtual float               scale_factor() const       = 0;
    virtual std::optional<Vec2> monitor_size_px() const    = 0;
    virtual std::string         title() const              = 0;
    virtual std::optional<bool> is_minimized() const       = 0;
    virtual bool                is_maximized() const       = 0;
    virtual bool                is_fullscreen() const      = 0;
    virtual bool                has_focus() const          = 0;

    // Sizes and positions below are in points (logical pixels).
    virtual void set_title(const std::string& title)           = 0;
    virtual void set_inner_size(Vec2 size)                     = 0;
    virtual void set_min_inner_size(std::optional<Vec2> size)  = 0;
    virtual void set_max_inner_size(std::optional<Vec2> size)  = 0;
    virtual void set_outer_position(Vec2 pos)                  = 0;
    virtual void set_visible(bool visible)                     = 0;
    virtual void set_transparent(bool transparent)             = 0;
    virtual void set_resizable(bool resizable)                 = 0;
    virtual void set_minimized(bool minimized)                 = 0;
    virtual void set_maximized(bool maximized)                 = 0;
    virtual void set_fullscreen(bool fullscreen)               = 0;
    virtual void set_decorations(bool decorations)             = 0;
    virtual void set_window_level(WindowLevel level)           = 0;
    virtual void set_icon(const IconData* icon)                = 0;
    virtual void focus()                                       = 0;
    virtual void request_user_attention()                      = 0;
    virtual bool drag_window()                                 = 0;
    virtual void set_cursor_icon(CursorIcon icon)              = 0;
    virtual void set_cursor_visible(bool visible)              = 0;
    virtual bool set_cursor_position(Vec2 pos)                 = 0;
    virtual bool set_mouse_passthrough(bool passthrough)       = 0;
    virtual void request_redraw()                              = 0;

    virtual void* native_handle() const = 0;
};

// ─── Surface & context ───────────────────────────────────────────────────────

// Drawable bound to one window. Must be destroyed before its window.
class Surface
{
   public:
    virtual ~Surface() = default;

    virtual SizePx size_px() const = 0;

    // The shared context must be current against this surface.
    virtual void resize(SizePx size) = 0;

    // Returns false when the platform rejected the swap; the frame is dropped.
    virtual bool present() = 0;
};

struct ContextConfig
{
    bool vsync       = true;
    bool transparent = false;
    bool validation  = false;
};

// The single shared graphics context. Only ContextCell drives make_current /
// make_not_current.
class GraphicsContext
{
   public:
    virtual ~GraphicsContext() = default;

    // Throws SurfaceCreationError.
    virtual std::unique_ptr<Surface> create_surface(NativeWindow& window, SizePx size) = 0;

    virtual bool make_current(Surface& surface) = 0;
    virtual bool make_not_current()             = 0;

    virtual bool set_swap_interval(Surface& surface, bool vsync) = 0;
};

// ─── Painter ─────────────────────────────────────────────────────────────────

// Rasterizes into whatever surface the context is currently bound to.
class Painter
{
   public:
    virtual ~Painter() = default;

    virtual void clear(SizePx size, Rgba color) = 0;
    virtual void paint(SizePx                               size,
                       float                                pixels_per_point,
                       const std::vector<ClippedPrimitive>& primitives) = 0;

    // Asks the current surface to keep a copy of the frame it presents next.
    // Backends that can always read back may ignore it.
    virtual void capture_next_frame() {}

    // Reads back the most recently presented image.
    virtual std::optional<ColorImage> read_screen_rgba(SizePx size) = 0;
};

// ─── Platform ────────────────────────────────────────────────────────────────

struct PlatformEvent
{
    enum class Kind
    {
        Resumed,
        Suspended,
        Window,
        Device,
    };

    Kind        kind   = Kind::Resumed;
    WindowId    window = INVALID_WINDOW_ID;
    WindowEvent window_event;
    DeviceEvent device_event;

    static PlatformEvent resumed() { return {.kind = Kind::Resumed}; }
    static PlatformEvent suspended() { return {.kind = Kind::Suspended}; }
    static PlatformEvent for_window(WindowId id, WindowEvent ev)
    {
        return {.kind = Kind::Window, .window = id, .window_event = ev};
    }
    static PlatformEvent device(DeviceEvent ev)
    {
        return {.kind = Kind::Device, .device_event = ev};
    }
};

class Platform
{
   public:
    virtual ~Platform() = default;

    virtual const char* name() const = 0;

    // Throws SurfaceCreationError when the window system refuses.
    virtual std::unique_ptr<NativeWindow> create_window(const ViewportAttributes& attributes) = 0;

    // Throws ContextBindError when no usable graphics context exists.
    virtual std::unique_ptr<GraphicsContext> create_context(const ContextConfig& config) = 0;

    virtual std::unique_ptr<Painter> create_painter(GraphicsContext& context) = 0;

    virtual std::optional<std::string> clipboard_text()                      = 0;
    virtual void                       set_clipboard_text(const std::string&) = 0;

    // Appends pending events to `out`, blocking for at most `timeout` when none
    // are queued (a negative timeout blocks until an event arrives). Returns
    // false when nothing was delivered and the source cannot produce more.
    virtual bool pump_events(std::chrono::milliseconds timeout, std::vector<PlatformEvent>& out) = 0;
};

}   // namespace casement
