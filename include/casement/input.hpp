#pragma once

#include <casement/math.hpp>
#include <casement/viewport.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace casement
{

// ─── Keys & modifiers ────────────────────────────────────────────────────────

enum class Key
{
    Unknown,
    A,
    C,
    V,
    X,
    Z,
    Escape,
    Enter,
    Tab,
    Space,
    Backspace,
    Delete,
    Insert,
    Home,
    End,
    PageUp,
    PageDown,
    ArrowLeft,
    ArrowRight,
    ArrowUp,
    ArrowDown,
    F1,
    F11,
};

struct Modifiers
{
    bool alt     = false;
    bool ctrl    = false;
    bool shift   = false;
    bool command = false;   // ctrl on Linux/Windows, cmd on macOS

    bool operator==(const Modifiers&) const = default;
};

enum class PointerButton
{
    Primary,
    Secondary,
    Middle,
    Extra1,
    Extra2,
};

// ─── Platform → core ─────────────────────────────────────────────────────────

// Raw window event as delivered by the platform backend. Positions and sizes
// are in physical pixels.
struct WindowEvent
{
    enum class Kind
    {
        Resized,
        Moved,
        CloseRequested,
        Focused,
        CursorMoved,
        CursorLeft,
        MouseButton,
        MouseWheel,
        Keyboard,
        Text,
        ScaleFactorChanged,
        Minimized,
        Maximized,
        RedrawRequested,
    };

    Kind          kind = Kind::RedrawRequested;
    SizePx        size;
    Vec2          position;
    Vec2          delta;
    bool          flag    = false;   // focused / pressed / minimized / maximized
    bool          repeat  = false;
    float         scale   = 1.0f;
    PointerButton button  = PointerButton::Primary;
    Key           key     = Key::Unknown;
    Modifiers     modifiers;
    uint32_t      codepoint = 0;

    static WindowEvent resized(uint32_t w, uint32_t h)
    {
        return {.kind = Kind::Resized, .size = {w, h}};
    }
    static WindowEvent moved(Vec2 p) { return {.kind = Kind::Moved, .position = p}; }
    static WindowEvent close_requested() { return {.kind = Kind::CloseRequested}; }
    static WindowEvent focused(bool f) { return {.kind = Kind::Focused, .flag = f}; }
    static WindowEvent cursor_moved(Vec2 p) { return {.kind = Kind::CursorMoved, .position = p}; }
    static WindowEvent cursor_left() { return {.kind = Kind::CursorLeft}; }
    static WindowEvent mouse_button(PointerButton b, bool pressed, Modifiers m = {})
    {
        return {.kind = Kind::MouseButton, .flag = pressed, .button = b, .modifiers = m};
    }
    static WindowEvent mouse_wheel(Vec2 lines) { return {.kind = Kind::MouseWheel, .delta = lines}; }
    static WindowEvent keyboard(Key k, bool pressed, Modifiers m = {}, bool repeat = false)
    {
        return {.kind      = Kind::Keyboard,
                .flag      = pressed,
                .repeat    = repeat,
                .key       = k,
                .modifiers = m};
    }
    static WindowEvent text(uint32_t cp) { return {.kind = Kind::Text, .codepoint = cp}; }
    static WindowEvent scale_factor_changed(float s)
    {
        return {.kind = Kind::ScaleFactorChanged, .scale = s};
    }
    static WindowEvent minimized(bool on) { return {.kind = Kind::Minimized, .flag = on}; }
    static WindowEvent maximized(bool on) { return {.kind = Kind::Maximized, .flag = on}; }
    static WindowEvent redraw_requested() { return {.kind = Kind::RedrawRequested}; }
};

// Events not tied to a window; routed to the focused viewport.
struct DeviceEvent
{
    enum class Kind
    {
        MouseMotion,
    };

    Kind kind = Kind::MouseMotion;
    Vec2 delta;
};

// ─── Core → UI layer ─────────────────────────────────────────────────────────

struct ColorImage
{
    SizePx               size;
    std::vector<uint8_t> rgba;
};

// Input event in the UI layer's vocabulary. Positions are in points.
struct InputEvent
{
    enum class Kind
    {
        PointerMoved,
        MouseMoved,   // raw device delta
        PointerButton,
        PointerGone,
        Scroll,
        Key,
        Text,
        Copy,
        Cut,
        Paste,
        WindowFocused,
        Screenshot,
    };

    Kind                              kind = Kind::PointerGone;
    Vec2                              pos;
    Vec2                              delta;
    casement::PointerButton           button  = casement::PointerButton::Primary;
    bool                              pressed = false;
    bool                              repeat  = false;
    casement::Key                     key     = casement::Key::Unknown;
    Modifiers                         modifiers;
    std::string                       text;
    ViewportId                        viewport;
    uint64_t                          user_data = 0;
    std::shared_ptr<const ColorImage> image;
};

struct RawInput
{
    ViewportId          viewport_id = ROOT_VIEWPORT;
    ViewportInfoMap     viewports;
    std::optional<Rect> screen_rect;   // points
    std::optional<double> time;        // seconds since start
    Modifiers           modifiers;
    std::vector<InputEvent> events;
    bool                focused = false;

    // Info for the viewport this input belongs to.
    const ViewportInfo* viewport() const
    {
        auto it = viewports.find(viewport_id);
        return it == viewports.end() ? nullptr : &it->second;
    }
};

struct PlatformOutput
{
    CursorIcon                 cursor_icon = CursorIcon::Default;
    std::optional<std::string> copied_text;
};

// ─── Paint primitives ────────────────────────────────────────────────────────

struct Vertex
{
    Vec2     pos;
    Vec2     uv;
    uint32_t color = 0xffffffff;
};

struct Mesh
{
    std::vector<Vertex>   vertices;
    std::vector<uint32_t> indices;
    uint64_t              texture_id = 0;
};

struct PaintCallbackInfo
{
    Rect   clip_rect;   // points
    SizePx screen_size_px;
    float  pixels_per_point = 1.0f;
    void*  native_encoder   = nullptr;   // backend command buffer, if any
};

// Custom drawing hook embedded in the primitive list. prepare() runs once per
// primitive before the painter starts; paint() runs inside the painter.
class PaintCallback
{
   public:
    virtual ~PaintCallback() = default;

    virtual void prepare(const PaintCallbackInfo& /*info*/) {}
    virtual void paint(const PaintCallbackInfo& info) = 0;
};

struct ClippedPrimitive
{
    Rect                                               clip_rect;
    std::variant<Mesh, std::shared_ptr<PaintCallback>> primitive;
};

// Everything one UI pass produces for one viewport.
struct FullOutput
{
    PlatformOutput                platform_output;
    std::vector<ClippedPrimitive> primitives;
    float                         pixels_per_point = 1.0f;
    ViewportOutputMap             viewport_output;
};

}   // namespace casement
