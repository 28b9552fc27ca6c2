#include "immediate_renderer.hpp"

#include <casement/errors.hpp>
#include <casement/logger.hpp>

#include "paint_pass.hpp"
#include "render/context_cell.hpp"
#include "viewport/viewport_commands.hpp"
#include "viewport/viewport_registry.hpp"

namespace casement
{

namespace
{

// Counts one level of nesting for as long as it lives.
class DepthScope
{
   public:
    explicit DepthScope(uint32_t& depth) : depth_(depth) { depth_++; }
    ~DepthScope() { depth_--; }

    DepthScope(const DepthScope&)            = delete;
    DepthScope& operator=(const DepthScope&) = delete;

   private:
    uint32_t& depth_;
};

}   // namespace

ImmediateViewportRenderer::ImmediateViewportRenderer(std::weak_ptr<ViewportRegistry>       registry,
                                                     std::weak_ptr<ContextCell>            context,
                                                     std::weak_ptr<Painter>                painter,
                                                     UiLayer&                              ui,
                                                     std::chrono::steady_clock::time_point start_time)
    : registry_(std::move(registry)), context_(std::move(context)), painter_(std::move(painter)),
      ui_(ui), start_time_(start_time)
{
}

void ImmediateViewportRenderer::warn_stale(ViewportId id)
{
    skipped_++;
    CASEMENT_LOG_WARN("immediate",
                      "Skipping immediate viewport {}: render callback invoked after owning window closed",
                      id.value);
}

void ImmediateViewportRenderer::render(ImmediateViewport viewport)
{
    RawInput input;
    {
        auto registry = registry_.lock();
        if (!registry || context_.expired() || painter_.expired())
        {
            warn_stale(viewport.id);
            return;
        }

        ViewportId parent = registry->resolve_stored_parent(viewport.id, viewport.parent);

        registry->initialize_or_update(viewport.id,
                                       parent,
                                       ViewportClass::Immediate,
                                       std::move(viewport.attributes),
                                       nullptr);
        try
        {
            registry->initialize(viewport.id);
        }
        catch (const SurfaceCreationError& e)
        {
            CASEMENT_LOG_ERROR("immediate",
                               "Failed to create immediate viewport {}: {}",
                               viewport.id.value,
                               e.what());
            return;
        }

        ViewportRecord* record = registry->find(viewport.id);
        if (!record || !record->is_initialized())
            return;

        update_viewport_info(record->actual_info, *record->window_handle);
        input          = record->input_adapter->take_input(*record->window_handle);
        input.time     = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
        input.viewports = registry->info_snapshot();
        record->actual_info.events.clear();
    }

    // No strong handle is held while the UI runs: it may reconcile, nest
    // further immediate viewports, or trigger teardown.
    FullOutput output;
    {
        DepthScope scope(depth_);
        output = ui_.run(input, &viewport.ui, *this);
    }

    auto registry = registry_.lock();
    auto context  = context_.lock();
    auto painter  = painter_.lock();
    if (!registry || !context || !painter)
    {
        warn_stale(viewport.id);
        return;
    }

    ViewportRecord* record = registry->find(viewport.id);
    if (!record || !record->is_initialized())
    {
        CASEMENT_LOG_DEBUG("immediate", "Viewport {} went away during its own pass", viewport.id.value);
        registry->reconcile(output.viewport_output);
        registry->initialize_all();
        return;
    }

    record->input_adapter->handle_platform_output(*record->window_handle, output.platform_output);
    bool presented = paint_viewport(*record, *context, *painter, output, ui_.clear_color(record->actual_info));
    handle_requested_actions(*record, *painter, registry->platform(), presented);
    rendered_++;

    registry->reconcile(output.viewport_output);
    registry->initialize_all();
}

}   // namespace casement
