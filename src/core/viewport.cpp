#include <algorithm>
#include <casement/viewport.hpp>

namespace casement
{

ViewportId ViewportId::from_name(std::string_view name)
{
    // FNV-1a, 64 bit
    uint64_t hash = 0xcbf29ce484222325ull;
    for (unsigned char c : name)
    {
        hash ^= c;
        hash *= 0x100000001b3ull;
    }
    if (hash == ROOT_VIEWPORT.value)
        hash = 1;
    return ViewportId{hash};
}

const char* viewport_class_name(ViewportClass cls)
{
    switch (cls)
    {
        case ViewportClass::Root:
            return "root";
        case ViewportClass::Deferred:
            return "deferred";
        case ViewportClass::Immediate:
            return "immediate";
    }
    return "unknown";
}

const char* command_kind_name(ViewportCommand::Kind kind)
{
    using K = ViewportCommand::Kind;
    switch (kind)
    {
        case K::Close:
            return "Close";
        case K::CancelClose:
            return "CancelClose";
        case K::Title:
            return "Title";
        case K::Transparent:
            return "Transparent";
        case K::Visible:
            return "Visible";
        case K::StartDrag:
            return "StartDrag";
        case K::OuterPosition:
            return "OuterPosition";
        case K::InnerSize:
            return "InnerSize";
        case K::MinInnerSize:
            return "MinInnerSize";
        case K::MaxInnerSize:
            return "MaxInnerSize";
        case K::Resizable:
            return "Resizable";
        case K::Minimized:
            return "Minimized";
        case K::Maximized:
            return "Maximized";
        case K::Fullscreen:
            return "Fullscreen";
        case K::Decorations:
            return "Decorations";
        case K::Level:
            return "WindowLevel";
        case K::Icon:
            return "Icon";
        case K::Focus:
            return "Focus";
        case K::RequestUserAttention:
            return "RequestUserAttention";
        case K::MousePassthrough:
            return "MousePassthrough";
        case K::CursorVisible:
            return "CursorVisible";
        case K::CursorPosition:
            return "CursorPosition";
        case K::Screenshot:
            return "Screenshot";
        case K::RequestCut:
            return "RequestCut";
        case K::RequestCopy:
            return "RequestCopy";
        case K::RequestPaste:
            return "RequestPaste";
    }
    return "Unknown";
}

namespace
{

// Copies `next` into `current` when set and different. Returns true on change.
template <typename T>
bool take_if_changed(std::optional<T>& current, const std::optional<T>& next)
{
    if (!next || next == current)
        return false;
    current = next;
    return true;
}

}   // namespace

ViewportAttributes::PatchResult ViewportAttributes::patch(const ViewportAttributes& next)
{
    PatchResult result;
    auto&       cmds = result.commands;

    if (take_if_changed(title, next.title))
        cmds.push_back(ViewportCommand::title(*title));
    if (take_if_changed(position, next.position))
        cmds.push_back(ViewportCommand::outer_position(*position));
    if (take_if_changed(inner_size, next.inner_size))
        cmds.push_back(ViewportCommand::inner_size(*inner_size));
    if (take_if_changed(min_inner_size, next.min_inner_size))
        cmds.push_back(ViewportCommand::min_inner_size(min_inner_size));
    if (take_if_changed(max_inner_size, next.max_inner_size))
        cmds.push_back(ViewportCommand::max_inner_size(max_inner_size));
    if (take_if_changed(fullscreen, next.fullscreen))
        cmds.push_back(ViewportCommand::fullscreen(*fullscreen));
    if (take_if_changed(maximized, next.maximized))
        cmds.push_back(ViewportCommand::maximized(*maximized));
    if (take_if_changed(resizable, next.resizable))
        cmds.push_back(ViewportCommand::resizable(*resizable));
    if (take_if_changed(transparent, next.transparent))
        cmds.push_back(ViewportCommand::transparent(*transparent));
    if (take_if_changed(decorations, next.decorations))
        cmds.push_back(ViewportCommand::decorations(*decorations));
    if (take_if_changed(visible, next.visible))
        cmds.push_back(ViewportCommand::visible(*visible));
    if (take_if_changed(mouse_passthrough, next.mouse_passthrough))
        cmds.push_back(ViewportCommand::mouse_passthrough(*mouse_passthrough));
    if (take_if_changed(window_level, next.window_level))
        cmds.push_back(ViewportCommand::window_level(*window_level));

    // Icons compare by identity; decoding the same file twice counts as a change.
    if (next.icon && next.icon != icon)
    {
        icon = next.icon;
        cmds.push_back(ViewportCommand::set_icon(icon));
    }

    bool& recreate = result.recreate;
    recreate |= take_if_changed(app_id, next.app_id);
    recreate |= take_if_changed(active, next.active);
    recreate |= take_if_changed(close_button, next.close_button);
    recreate |= take_if_changed(minimize_button, next.minimize_button);
    recreate |= take_if_changed(maximize_button, next.maximize_button);
    recreate |= take_if_changed(title_shown, next.title_shown);
    recreate |= take_if_changed(has_shadow, next.has_shadow);
    recreate |= take_if_changed(taskbar, next.taskbar);
    recreate |= take_if_changed(drag_and_drop, next.drag_and_drop);
    recreate |= take_if_changed(clamp_size_to_monitor_size, next.clamp_size_to_monitor_size);
    recreate |= take_if_changed(window_type, next.window_type);

    return result;
}

bool ViewportInfo::close_requested() const
{
    return std::find(events.begin(), events.end(), ViewportEvent::Close) != events.end();
}

}   // namespace casement
