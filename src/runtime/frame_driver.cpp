#include "frame_driver.hpp"

#include <algorithm>
#include <casement/logger.hpp>

#include "paint_pass.hpp"
#include "render/context_cell.hpp"
#include "viewport/viewport_commands.hpp"
#include "viewport/viewport_registry.hpp"

namespace casement
{

const char* event_result_name(EventResult::Kind kind)
{
    switch (kind)
    {
        case EventResult::Kind::Wait:
            return "Wait";
        case EventResult::Kind::RepaintNow:
            return "RepaintNow";
        case EventResult::Kind::RepaintNext:
            return "RepaintNext";
        case EventResult::Kind::Exit:
            return "Exit";
    }
    return "Unknown";
}

FrameDriver::FrameDriver(std::shared_ptr<ViewportRegistry> registry,
                         std::shared_ptr<ContextCell>      context,
                         std::shared_ptr<Painter>          painter,
                         UiLayer&                          ui,
                         Platform&                         platform,
                         FrameDriverOptions                options)
    : registry_(std::move(registry)), context_(std::move(context)), painter_(std::move(painter)),
      ui_(ui), platform_(platform), options_(options), start_time_(std::chrono::steady_clock::now()),
      immediate_(registry_, context_, painter_, ui_, start_time_)
{
}

double FrameDriver::seconds_since_start() const
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
}

bool FrameDriver::should_clear_before_ui() const
{
    switch (options_.clear_policy)
    {
        case ClearPolicy::BeforeUi:
            return true;
        case ClearPolicy::AfterUi:
            return false;
        case ClearPolicy::Auto:
            return registry_->size() == 1;
    }
    return false;
}

// ─── Per-viewport pass ───────────────────────────────────────────────────────

EventResult FrameDriver::run_ui_and_paint_window(WindowId window_id)
{
    auto id = registry_->viewport_for_window(window_id);
    if (!id)
    {
        CASEMENT_LOG_TRACE("frame", "Repaint for unknown window {}", window_id);
        return EventResult::wait();
    }
    return run_ui_and_paint(*id);
}

EventResult FrameDriver::run_ui_and_paint(ViewportId id)
{
    ViewportRecord* record = registry_->find(id);
    if (!record)
        return EventResult::wait();

    // Immediate viewports are only drawn from inside their parent's pass.
    if (record->viewport_class == ViewportClass::Immediate)
    {
        auto parent_window = registry_->window_for_viewport(record->parent_id);
        return parent_window ? EventResult::repaint_next(*parent_window) : EventResult::wait();
    }

    if (!record->is_initialized())
        return EventResult::wait();

    NativeWindow& window    = *record->window_handle;
    WindowId      window_id = window.id();

    update_viewport_info(record->actual_info, window);
    RawInput input  = record->input_adapter->take_input(window);
    input.time      = seconds_since_start();
    input.viewports = registry_->info_snapshot();
    record->actual_info.events.clear();

    // Keeps a deferred viewport's callback alive even if this pass removes it.
    auto callback = record->render_callback;

    bool clear_before = should_clear_before_ui();
    Rgba clear_color  = ui_.clear_color(record->actual_info);
    if (clear_before)
    {
        context_->rebind(*record->surface);
        painter_->clear(record->surface->size_px(), clear_color);
    }

    // The UI may re-enter the registry; `record` is stale from here on.
    record = nullptr;
    FullOutput output = ui_.run(input, callback.get(), immediate_);
    passes_++;

    if (id == ROOT_VIEWPORT)
    {
        const ViewportInfo* info = input.viewport();
        if (info && info->close_requested())
        {
            bool cancelled = false;
            if (auto it = output.viewport_output.find(ROOT_VIEWPORT); it != output.viewport_output.end())
            {
                const auto& cmds = it->second.commands;
                cancelled        = std::any_of(cmds.begin(),
                                        cmds.end(),
                                        [](const ViewportCommand& c)
                                        { return c.kind == ViewportCommand::Kind::CancelClose; });
            }

            if (cancelled)
            {
                CASEMENT_LOG_INFO("frame", "Close request cancelled by the application");
            }
            else
            {
                CASEMENT_LOG_INFO("frame", "Root viewport close acknowledged");
                close_ = true;
            }
        }
    }

    record = registry_->find(id);
    if (record && record->is_initialized())
    {
        record->input_adapter->handle_platform_output(*record->window_handle, output.platform_output);
        std::optional<Rgba> late_clear;
        if (!clear_before)
            late_clear = clear_color;
        bool presented = paint_viewport(*record, *context_, *painter_, output, late_clear);
        if (!presented)
            dropped_frames_++;
        handle_requested_actions(*record, *painter_, platform_, presented);
    }
    else
    {
        CASEMENT_LOG_DEBUG("frame", "Viewport {} went away during its own pass", id.value);
    }
    record = nullptr;

    registry_->reconcile(output.viewport_output);
    registry_->initialize_all();

    if (close_)
        return EventResult::exit();

    std::optional<std::chrono::milliseconds> delay;
    if (auto it = output.viewport_output.find(id); it != output.viewport_output.end())
        delay = it->second.repaint_delay;

    // Queued screenshot or clipboard results must reach the UI, and a
    // screenshot held back by a dropped frame needs another frame.
    if (ViewportRecord* again = registry_->find(id); again && again->input_adapter)
    {
        if (again->input_adapter->has_pending_events() || !again->actions_requested.empty())
            delay = std::chrono::milliseconds{0};
    }

    if (!delay)
        return EventResult::wait();
    if (delay->count() <= 0)
        return EventResult::repaint_next(window_id);
    return EventResult::repaint_after(window_id, *delay);
}

// ─── Events ──────────────────────────────────────────────────────────────────

EventResult FrameDriver::on_window_event(WindowId window_id, const WindowEvent& event)
{
    auto id = registry_->viewport_for_window(window_id);
    if (!id)
        return EventResult::wait();

    bool repaint_asap = false;

    switch (event.kind)
    {
        case WindowEvent::Kind::Focused:
            if (event.flag)
                registry_->set_focused_viewport(*id);
            else if (registry_->focused_viewport() == *id)
                registry_->set_focused_viewport(std::nullopt);
            break;

        case WindowEvent::Kind::Resized:
            // 0x0 is how several platforms report minimization.
            if (event.size.is_empty())
            {
                CASEMENT_LOG_DEBUG("frame", "Ignoring empty resize of viewport {}", id->value);
                break;
            }
            repaint_asap = true;
            registry_->resize(*id, event.size);
            break;

        case WindowEvent::Kind::ScaleFactorChanged:
            repaint_asap = true;
            break;

        case WindowEvent::Kind::CloseRequested:
        {
            if (*id == ROOT_VIEWPORT && close_)
                return EventResult::exit();

            ViewportRecord* record = registry_->find(*id);
            if (!record)
                break;
            record->actual_info.events.push_back(ViewportEvent::Close);
            CASEMENT_LOG_DEBUG("frame", "Close requested for viewport {}", id->value);

            // The parent decides whether the child goes away, so it needs a pass too.
            if (record->parent_id != *id)
            {
                if (ViewportRecord* parent = registry_->find(record->parent_id);
                    parent && parent->window_handle)
                    parent->window_handle->request_redraw();
            }
            break;
        }

        default:
            break;
    }

    ViewportRecord* record = registry_->find(*id);
    if (!record || !record->input_adapter)
        return EventResult::wait();

    EventResponse response = record->input_adapter->on_window_event(event);
    if (!response.repaint)
        return EventResult::wait();
    return repaint_asap ? EventResult::repaint_now(window_id) : EventResult::repaint_next(window_id);
}

EventResult FrameDriver::on_device_event(const DeviceEvent& event)
{
    if (event.kind != DeviceEvent::Kind::MouseMotion)
        return EventResult::wait();

    auto focused = registry_->focused_viewport();
    if (!focused)
        return EventResult::wait();

    ViewportRecord* record = registry_->find(*focused);
    if (!record || !record->input_adapter || !record->window_handle)
        return EventResult::wait();

    record->input_adapter->on_mouse_motion(event.delta);
    return EventResult::repaint_next(record->window_handle->id());
}

}   // namespace casement
