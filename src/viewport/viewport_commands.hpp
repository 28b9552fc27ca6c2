#pragma once

#include <casement/platform.hpp>
#include <casement/viewport.hpp>
#include <vector>

#include "viewport_record.hpp"

namespace casement
{

// Applies `commands` to a live window. Effects that need the frame (screenshots,
// clipboard actions) are appended to `actions`.
void process_viewport_commands(ViewportInfo&                       info,
                               const std::vector<ViewportCommand>& commands,
                               NativeWindow&                       window,
                               bool                                is_focused,
                               std::vector<ActionRequested>&       actions);

// Refreshes `info` from what the window currently reports.
void update_viewport_info(ViewportInfo& info, const NativeWindow& window);

}   // namespace casement
