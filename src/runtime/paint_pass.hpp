#pragma once

#include <casement/input.hpp>
#include <casement/platform.hpp>
#include <optional>

#include "viewport/viewport_record.hpp"

namespace casement
{

class ContextCell;

// Rebinds the context to the record's surface, then clear (optional), paint
// and present. Returns false when the present was rejected.
bool paint_viewport(ViewportRecord&     record,
                    ContextCell&        context,
                    Painter&            painter,
                    const FullOutput&   output,
                    std::optional<Rgba> clear_color);

void prepare_paint_callbacks(const std::vector<ClippedPrimitive>& primitives,
                             SizePx                               size,
                             float                                pixels_per_point);

// Runs the screenshot and clipboard actions queued by viewport commands. The
// results reach the UI as input events on the viewport's next pass. When the
// frame was not presented, screenshots stay queued for the next frame.
void handle_requested_actions(ViewportRecord& record, Painter& painter, Platform& platform, bool presented);

}   // namespace casement
