#pragma once

#include <casement/platform.hpp>
#include <casement/viewport.hpp>
#include <memory>
#include <vector>

#include "input_adapter.hpp"

namespace casement
{

// Work a viewport command asked for that can only happen around a paint.
struct ActionRequested
{
    enum class Kind
    {
        Screenshot,
        Cut,
        Copy,
        Paste,
    };

    Kind     kind      = Kind::Screenshot;
    uint64_t user_data = 0;
};

struct ViewportRecord
{
    ViewportId    id;
    ViewportId    parent_id      = ROOT_VIEWPORT;
    ViewportClass viewport_class = ViewportClass::Deferred;

    ViewportAttributes requested_attributes;
    ViewportInfo       actual_info;

    // Commands waiting for a live window.
    std::vector<ViewportCommand> deferred_commands;
    std::vector<ActionRequested> actions_requested;

    // Null for immediate viewports and the root.
    std::shared_ptr<const ViewportUiCallback> render_callback;

    // Declaration order is destruction order in reverse: surface, adapter, window.
    std::unique_ptr<NativeWindow> window_handle;
    std::unique_ptr<InputAdapter> input_adapter;
    std::unique_ptr<Surface>      surface;

    bool has_window() const { return window_handle != nullptr; }
    bool is_initialized() const { return window_handle && surface && input_adapter; }
};

}   // namespace casement
