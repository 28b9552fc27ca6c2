#include "paint_pass.hpp"

#include <algorithm>
#include <casement/logger.hpp>

#include "render/context_cell.hpp"

namespace casement
{

void prepare_paint_callbacks(const std::vector<ClippedPrimitive>& primitives,
                             SizePx                               size,
                             float                                pixels_per_point)
{
    for (const auto& prim : primitives)
    {
        const auto* callback = std::get_if<std::shared_ptr<PaintCallback>>(&prim.primitive);
        if (!callback || !*callback)
            continue;
        (*callback)->prepare({.clip_rect        = prim.clip_rect,
                              .screen_size_px   = size,
                              .pixels_per_point = pixels_per_point});
    }
}

bool paint_viewport(ViewportRecord&     record,
                    ContextCell&        context,
                    Painter&            painter,
                    const FullOutput&   output,
                    std::optional<Rgba> clear_color)
{
    Surface& surface = *record.surface;

    // Never trust an earlier bind: the UI pass may have painted a nested viewport.
    context.rebind(surface);

    SizePx size = surface.size_px();
    if (clear_color)
        painter.clear(size, *clear_color);

    bool wants_screenshot = std::any_of(record.actions_requested.begin(),
                                        record.actions_requested.end(),
                                        [](const ActionRequested& a)
                                        { return a.kind == ActionRequested::Kind::Screenshot; });
    if (wants_screenshot)
        painter.capture_next_frame();

    prepare_paint_callbacks(output.primitives, size, output.pixels_per_point);
    painter.paint(size, output.pixels_per_point, output.primitives);

    if (!surface.present())
    {
        CASEMENT_LOG_WARN("frame", "Present failed on viewport {}, frame dropped", record.id.value);
        return false;
    }
    return true;
}

void handle_requested_actions(ViewportRecord& record, Painter& painter, Platform& platform, bool presented)
{
    if (record.actions_requested.empty() || !record.input_adapter || !record.surface)
        return;

    auto actions = std::move(record.actions_requested);
    record.actions_requested.clear();

    for (const auto& action : actions)
    {
        switch (action.kind)
        {
            case ActionRequested::Kind::Screenshot:
            {
                if (!presented)
                {
                    record.actions_requested.push_back(action);
                    break;
                }
                auto image = painter.read_screen_rgba(record.surface->size_px());
                if (!image)
                {
                    CASEMENT_LOG_WARN("frame", "Screenshot readback failed on viewport {}", record.id.value);
                    break;
                }
                record.input_adapter->push_event(
                    {.kind      = InputEvent::Kind::Screenshot,
                     .viewport  = record.id,
                     .user_data = action.user_data,
                     .image     = std::make_shared<const ColorImage>(std::move(*image))});
                break;
            }
            case ActionRequested::Kind::Cut:
                record.input_adapter->push_event({.kind = InputEvent::Kind::Cut});
                break;
            case ActionRequested::Kind::Copy:
                record.input_adapter->push_event({.kind = InputEvent::Kind::Copy});
                break;
            case ActionRequested::Kind::Paste:
                if (auto text = platform.clipboard_text())
                    record.input_adapter->push_event({.kind = InputEvent::Kind::Paste, .text = *text});
                break;
        }
    }
}

}   // namespace casement
