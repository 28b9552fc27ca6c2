#include "viewport_commands.hpp"

#include <algorithm>
#include <casement/logger.hpp>

namespace casement
{

namespace
{

Vec2 clamp_inner_size(Vec2 size)
{
    return {std::max(size.x, 1.0f), std::max(size.y, 1.0f)};
}

}   // namespace

void process_viewport_commands(ViewportInfo&                       info,
                               const std::vector<ViewportCommand>& commands,
                               NativeWindow&                       window,
                               bool                                is_focused,
                               std::vector<ActionRequested>&       actions)
{
    using K = ViewportCommand::Kind;

    for (const auto& cmd : commands)
    {
        CASEMENT_LOG_TRACE("registry", "Processing command {}", command_kind_name(cmd.kind));

        switch (cmd.kind)
        {
            case K::Close:
                info.events.push_back(ViewportEvent::Close);
                break;
            case K::CancelClose:
                std::erase(info.events, ViewportEvent::Close);
                break;
            case K::Title:
                window.set_title(cmd.text);
                info.title = cmd.text;
                break;
            case K::Transparent:
                window.set_transparent(cmd.flag);
                break;
            case K::Visible:
                window.set_visible(cmd.flag);
                break;
            case K::StartDrag:
                // Only the window under the user's hand may be dragged.
                if (is_focused && !window.drag_window())
                    CASEMENT_LOG_WARN("registry", "Window refused to start a drag");
                break;
            case K::OuterPosition:
                if (cmd.vec)
                    window.set_outer_position(*cmd.vec);
                break;
            case K::InnerSize:
                if (cmd.vec)
                    window.set_inner_size(clamp_inner_size(*cmd.vec));
                break;
            case K::MinInnerSize:
                window.set_min_inner_size(cmd.vec);
                break;
            case K::MaxInnerSize:
                window.set_max_inner_size(cmd.vec);
                break;
            case K::Resizable:
                window.set_resizable(cmd.flag);
                break;
            case K::Minimized:
                window.set_minimized(cmd.flag);
                info.minimized = cmd.flag;
                break;
            case K::Maximized:
                window.set_maximized(cmd.flag);
                info.maximized = cmd.flag;
                break;
            case K::Fullscreen:
                window.set_fullscreen(cmd.flag);
                info.fullscreen = cmd.flag;
                break;
            case K::Decorations:
                window.set_decorations(cmd.flag);
                break;
            case K::Level:
                window.set_window_level(cmd.level);
                break;
            case K::Icon:
                window.set_icon(cmd.icon.get());
                break;
            case K::Focus:
                if (!window.has_focus())
                    window.focus();
                break;
            case K::RequestUserAttention:
                window.request_user_attention();
                break;
            case K::MousePassthrough:
                if (!window.set_mouse_passthrough(cmd.flag))
                    CASEMENT_LOG_WARN("registry", "Mouse passthrough is not supported");
                break;
            case K::CursorVisible:
                window.set_cursor_visible(cmd.flag);
                break;
            case K::CursorPosition:
                if (cmd.vec && !window.set_cursor_position(*cmd.vec))
                    CASEMENT_LOG_WARN("registry", "Setting the cursor position failed");
                break;
            case K::Screenshot:
                actions.push_back({.kind = ActionRequested::Kind::Screenshot, .user_data = cmd.user_data});
                break;
            case K::RequestCut:
                actions.push_back({.kind = ActionRequested::Kind::Cut});
                break;
            case K::RequestCopy:
                actions.push_back({.kind = ActionRequested::Kind::Copy});
                break;
            case K::RequestPaste:
                actions.push_back({.kind = ActionRequested::Kind::Paste});
                break;
        }
    }
}

void update_viewport_info(ViewportInfo& info, const NativeWindow& window)
{
    float ppp = window.scale_factor();
    if (ppp <= 0.0f)
        ppp = 1.0f;

    std::optional<bool> minimized = window.is_minimized();

    // Minimized windows report garbage positions on several platforms.
    bool has_position = minimized.has_value() && !*minimized;

    info.inner_rect.reset();
    info.outer_rect.reset();
    if (has_position)
    {
        if (auto pos = window.inner_position_px())
            info.inner_rect = Rect::from_min_size(*pos / ppp, to_points(window.inner_size_px(), ppp));
        if (auto pos = window.outer_position_px())
            info.outer_rect = Rect::from_min_size(*pos / ppp, to_points(window.outer_size_px(), ppp));
    }

    if (auto monitor = window.monitor_size_px())
        info.monitor_size = *monitor / ppp;
    else
        info.monitor_size.reset();

    info.focused    = window.has_focus();
    info.fullscreen = window.is_fullscreen();
    info.title      = window.title();
    info.native_pixels_per_point = ppp;

    if (minimized)
        info.minimized = minimized;
    info.maximized = window.is_maximized();
}

}   // namespace casement
