#pragma once

#include <casement/math.hpp>
#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace casement
{

class ImmediateRenderer;

// ─── Identity ────────────────────────────────────────────────────────────────

struct ViewportId
{
    uint64_t value = 0;

    // Stable across runs; never collides with the root id.
    static ViewportId from_name(std::string_view name);

    constexpr auto operator<=>(const ViewportId&) const = default;
};

inline constexpr ViewportId ROOT_VIEWPORT{0};

enum class ViewportClass
{
    Root,        // exactly one, never garbage-collected
    Deferred,    // owns a window and a stored UI callback
    Immediate,   // rendered synchronously inside its parent's pass
};

const char* viewport_class_name(ViewportClass cls);

// ─── Window attributes ───────────────────────────────────────────────────────

struct IconData
{
    uint32_t             width  = 0;
    uint32_t             height = 0;
    std::vector<uint8_t> rgba;   // width * height * 4, unmultiplied

    bool operator==(const IconData&) const = default;
};

enum class WindowLevel
{
    Normal,
    AlwaysOnBottom,
    AlwaysOnTop,
};

// How the window manager should treat a window. Fixed at construction.
enum class WindowType
{
    Normal,
    Utility,
    Dialog,
    Popup,
};

enum class CursorIcon
{
    Default,
    None,
    PointingHand,
    Text,
    Crosshair,
    Grab,
    Grabbing,
    Move,
    NotAllowed,
    ResizeHorizontal,
    ResizeVertical,
    ResizeNwSe,
    ResizeNeSw,
};

// A request from the UI layer to change a live window. Sizes and positions are in points.
struct ViewportCommand
{
    enum class Kind
    {
        Close,
        CancelClose,
        Title,
        Transparent,
        Visible,
        StartDrag,
        OuterPosition,
        InnerSize,
        MinInnerSize,
        MaxInnerSize,
        Resizable,
        Minimized,
        Maximized,
        Fullscreen,
        Decorations,
        Level,
        Icon,
        Focus,
        RequestUserAttention,
        MousePassthrough,
        CursorVisible,
        CursorPosition,
        Screenshot,
        RequestCut,
        RequestCopy,
        RequestPaste,
    };

    Kind                            kind = Kind::Focus;
    std::string                     text;
    std::optional<Vec2>             vec;
    bool                            flag      = false;
    WindowLevel                     level     = WindowLevel::Normal;
    std::shared_ptr<const IconData> icon;
    uint64_t                        user_data = 0;

    static ViewportCommand close() { return {.kind = Kind::Close}; }
    static ViewportCommand cancel_close() { return {.kind = Kind::CancelClose}; }
    static ViewportCommand title(std::string t) { return {.kind = Kind::Title, .text = std::move(t)}; }
    static ViewportCommand transparent(bool on) { return {.kind = Kind::Transparent, .flag = on}; }
    static ViewportCommand visible(bool on) { return {.kind = Kind::Visible, .flag = on}; }
    static ViewportCommand start_drag() { return {.kind = Kind::StartDrag}; }
    static ViewportCommand outer_position(Vec2 p) { return {.kind = Kind::OuterPosition, .vec = p}; }
    static ViewportCommand inner_size(Vec2 s) { return {.kind = Kind::InnerSize, .vec = s}; }
    static ViewportCommand min_inner_size(std::optional<Vec2> s)
    {
        return {.kind = Kind::MinInnerSize, .vec = s};
    }
    static ViewportCommand max_inner_size(std::optional<Vec2> s)
    {
        return {.kind = Kind::MaxInnerSize, .vec = s};
    }
    static ViewportCommand resizable(bool on) { return {.kind = Kind::Resizable, .flag = on}; }
    static ViewportCommand minimized(bool on) { return {.kind = Kind::Minimized, .flag = on}; }
    static ViewportCommand maximized(bool on) { return {.kind = Kind::Maximized, .flag = on}; }
    static ViewportCommand fullscreen(bool on) { return {.kind = Kind::Fullscreen, .flag = on}; }
    static ViewportCommand decorations(bool on) { return {.kind = Kind::Decorations, .flag = on}; }
    static ViewportCommand window_level(WindowLevel l) { return {.kind = Kind::Level, .level = l}; }
    static ViewportCommand set_icon(std::shared_ptr<const IconData> i)
    {
        return {.kind = Kind::Icon, .icon = std::move(i)};
    }
    static ViewportCommand focus() { return {.kind = Kind::Focus}; }
    static ViewportCommand request_user_attention() { return {.kind = Kind::RequestUserAttention}; }
    static ViewportCommand mouse_passthrough(bool on)
    {
        return {.kind = Kind::MousePassthrough, .flag = on};
    }
    static ViewportCommand cursor_visible(bool on) { return {.kind = Kind::CursorVisible, .flag = on}; }
    static ViewportCommand cursor_position(Vec2 p) { return {.kind = Kind::CursorPosition, .vec = p}; }
    static ViewportCommand screenshot(uint64_t user_data = 0)
    {
        return {.kind = Kind::Screenshot, .user_data = user_data};
    }
    static ViewportCommand request_cut() { return {.kind = Kind::RequestCut}; }
    static ViewportCommand request_copy() { return {.kind = Kind::RequestCopy}; }
    static ViewportCommand request_paste() { return {.kind = Kind::RequestPaste}; }

    bool operator==(const ViewportCommand&) const = default;
};

const char* command_kind_name(ViewportCommand::Kind kind);

// Requested window attributes. Unset fields mean "no preference" and are left
// untouched by patch().
struct ViewportAttributes
{
    std::optional<std::string> title;
    std::optional<std::string> app_id;
    std::optional<Vec2>        position;
    std::optional<Vec2>        inner_size;
    std::optional<Vec2>        min_inner_size;
    std::optional<Vec2>        max_inner_size;
    std::optional<bool>        fullscreen;
    std::optional<bool>        maximized;
    std::optional<bool>        resizable;
    std::optional<bool>        transparent;
    std::optional<bool>        decorations;
    std::optional<bool>        visible;
    std::optional<bool>        mouse_passthrough;
    std::optional<WindowLevel> window_level;

    std::shared_ptr<const IconData> icon;

    // Only honoured at window construction; changing any of these recreates the window.
    std::optional<bool>       active;
    std::optional<bool>       close_button;
    std::optional<bool>       minimize_button;
    std::optional<bool>       maximize_button;
    std::optional<bool>       title_shown;
    std::optional<bool>       has_shadow;
    std::optional<bool>       taskbar;
    std::optional<bool>       drag_and_drop;
    std::optional<bool>       clamp_size_to_monitor_size;
    std::optional<WindowType> window_type;

    ViewportAttributes& with_title(std::string t)
    {
        title = std::move(t);
        return *this;
    }
    ViewportAttributes& with_app_id(std::string id)
    {
        app_id = std::move(id);
        return *this;
    }
    ViewportAttributes& with_position(Vec2 p)
    {
        position = p;
        return *this;
    }
    ViewportAttributes& with_inner_size(Vec2 s)
    {
        inner_size = s;
        return *this;
    }
    ViewportAttributes& with_min_inner_size(Vec2 s)
    {
        min_inner_size = s;
        return *this;
    }
    ViewportAttributes& with_max_inner_size(Vec2 s)
    {
        max_inner_size = s;
        return *this;
    }
    ViewportAttributes& with_fullscreen(bool on)
    {
        fullscreen = on;
        return *this;
    }
    ViewportAttributes& with_maximized(bool on)
    {
        maximized = on;
        return *this;
    }
    ViewportAttributes& with_resizable(bool on)
    {
        resizable = on;
        return *this;
    }
    ViewportAttributes& with_transparent(bool on)
    {
        transparent = on;
        return *this;
    }
    ViewportAttributes& with_decorations(bool on)
    {
        decorations = on;
        return *this;
    }
    ViewportAttributes& with_visible(bool on)
    {
        visible = on;
        return *this;
    }
    ViewportAttributes& with_window_level(WindowLevel l)
    {
        window_level = l;
        return *this;
    }
    ViewportAttributes& with_icon(std::shared_ptr<const IconData> i)
    {
        icon = std::move(i);
        return *this;
    }
    ViewportAttributes& with_taskbar(bool on)
    {
        taskbar = on;
        return *this;
    }
    ViewportAttributes& with_window_type(WindowType t)
    {
        window_type = t;
        return *this;
    }

    struct PatchResult
    {
        std::vector<ViewportCommand> commands;
        bool                         recreate = false;
    };

    // Merge the fields set in `next` into this set. Live-updatable differences
    // come back as commands; construction-only differences set `recreate`.
    PatchResult patch(const ViewportAttributes& next);

    bool operator==(const ViewportAttributes&) const = default;
};

// ─── Observed state ──────────────────────────────────────────────────────────

enum class ViewportEvent
{
    Close,
};

// What the platform reports about a viewport's window, refreshed every pass.
struct ViewportInfo
{
    std::optional<ViewportId>  parent;
    std::optional<std::string> title;
    std::vector<ViewportEvent> events;

    std::optional<float> native_pixels_per_point;
    std::optional<Vec2>  monitor_size;
    std::optional<Rect>  inner_rect;
    std::optional<Rect>  outer_rect;
    std::optional<bool>  minimized;
    std::optional<bool>  maximized;
    std::optional<bool>  fullscreen;
    std::optional<bool>  focused;

    bool close_requested() const;
};

// ─── Desired-viewport output ─────────────────────────────────────────────────

// Renders one viewport's content. The immediate renderer is the capability for
// drawing nested immediate viewports from inside the callback.
using ViewportUiCallback = std::function<void(ImmediateRenderer&)>;

struct ViewportOutput
{
    ViewportId                                parent         = ROOT_VIEWPORT;
    ViewportClass                             viewport_class = ViewportClass::Deferred;
    ViewportAttributes                        attributes;
    std::shared_ptr<const ViewportUiCallback> ui;
    std::vector<ViewportCommand>              commands;

    // Zero asks for another pass as soon as possible.
    std::optional<std::chrono::milliseconds> repaint_delay;
};

using ViewportOutputMap = std::map<ViewportId, ViewportOutput>;
using ViewportInfoMap   = std::map<ViewportId, ViewportInfo>;

}   // namespace casement

template <>
struct std::hash<casement::ViewportId>
{
    size_t operator()(const casement::ViewportId& id) const noexcept
    {
        return std::hash<uint64_t>{}(id.value);
    }
};
