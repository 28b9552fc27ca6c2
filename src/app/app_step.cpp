// app_step.cpp: frame-by-frame control for App. run() is a loop over step();
// tests and external drivers call step() directly.

#include <casement/app.hpp>
#include <casement/errors.hpp>
#include <casement/logger.hpp>

#include "app_runtime.hpp"
#include "runtime/frame_scheduler.hpp"
#include "runtime/lifecycle.hpp"
#include "viewport/viewport_registry.hpp"

#include <algorithm>
#include <thread>

namespace casement
{

App::~App()
{
    shutdown();
}

ViewportRegistry* App::registry()
{
    return runtime_ ? runtime_->registry.get() : nullptr;
}

FrameDriver* App::driver()
{
    return runtime_ ? runtime_->driver.get() : nullptr;
}

ContextCell* App::context()
{
    return runtime_ ? runtime_->context.get() : nullptr;
}

// ─── Startup ─────────────────────────────────────────────────────────────────

void App::init_runtime()
{
    auto rt = std::make_unique<AppRuntime>();

    ContextConfig ctx_config{.vsync       = config_.vsync,
                             .transparent = config_.root_attributes.transparent.value_or(false),
                             .validation  = config_.validation};
    rt->context = std::make_shared<ContextCell>(platform_->create_context(ctx_config));
    rt->context->set_skip_redundant_rebind(config_.skip_redundant_rebind);

    rt->painter  = platform_->create_painter(rt->context->graphics());
    rt->registry = std::make_shared<ViewportRegistry>(*platform_,
                                                      rt->context,
                                                      RegistryOptions{.vsync = config_.vsync});

    rt->registry->insert_root(config_.root_attributes);
    rt->registry->initialize(ROOT_VIEWPORT);

    rt->driver = std::make_unique<FrameDriver>(rt->registry,
                                               rt->context,
                                               rt->painter,
                                               *ui_,
                                               *platform_,
                                               FrameDriverOptions{.clear_policy = config_.clear_policy});

    lifecycle_->attach(rt->registry, rt->context);
    runtime_ = std::move(rt);

    CASEMENT_LOG_INFO("app", "Root viewport ready");
}

// ─── Step ────────────────────────────────────────────────────────────────────

App::StepResult App::step(std::chrono::milliseconds timeout)
{
    StepResult result;
    if (should_exit_)
    {
        result.should_exit = true;
        return result;
    }

    uint64_t passes_before = runtime_ ? runtime_->driver->pass_count() : 0;

    std::vector<PlatformEvent> events;
    bool delivered = platform_->pump_events(timeout, events);
    result.events  = events.size();

    for (const auto& event : events)
    {
        handle_event(event);
        if (should_exit_)
            break;
    }

    if (!should_exit_ && runtime_ && lifecycle_->state() == LifecycleState::Running)
    {
        for (WindowId window : scheduler_->take_due(FrameScheduler::Clock::now()))
        {
            run_pass(window);
            if (should_exit_)
                break;
        }
    }

    if (runtime_)
    {
        result.passes = runtime_->driver->pass_count() - passes_before;
        if (config_.max_passes > 0 && runtime_->driver->pass_count() >= config_.max_passes)
        {
            CASEMENT_LOG_INFO("app", "Pass limit of {} reached", config_.max_passes);
            should_exit_ = true;
        }
    }

    // Nothing more can arrive and nothing is waiting: a finished run.
    if (!should_exit_ && !delivered && result.passes == 0)
    {
        auto deadline = scheduler_->next_deadline();
        if (!deadline)
        {
            CASEMENT_LOG_DEBUG("app", "Event source drained, exiting");
            should_exit_ = true;
        }
        else if (timeout.count() != 0)
        {
            auto limit = FrameScheduler::Clock::now() + std::max(timeout, std::chrono::milliseconds{0});
            std::this_thread::sleep_until(timeout.count() < 0 ? *deadline : std::min(*deadline, limit));
        }
    }

    result.should_exit = should_exit_;
    return result;
}

void App::handle_event(const PlatformEvent& event)
{
    switch (event.kind)
    {
        case PlatformEvent::Kind::Resumed:
            lifecycle_->on_resumed();
            schedule_all_windows();
            break;

        case PlatformEvent::Kind::Suspended:
            lifecycle_->on_suspended();
            scheduler_->clear();
            if (runtime_)
                runtime_->known_windows.clear();
            break;

        case PlatformEvent::Kind::Window:
            if (runtime_ && lifecycle_->state() == LifecycleState::Running)
                apply(runtime_->driver->on_window_event(event.window, event.window_event));
            break;

        case PlatformEvent::Kind::Device:
            if (runtime_ && lifecycle_->state() == LifecycleState::Running)
                apply(runtime_->driver->on_device_event(event.device_event));
            break;
    }
}

void App::apply(const EventResult& result)
{
    switch (result.kind)
    {
        case EventResult::Kind::Wait:
            break;
        case EventResult::Kind::RepaintNow:
            scheduler_->forget(result.window);
            run_pass(result.window);
            break;
        case EventResult::Kind::RepaintNext:
            scheduler_->request_repaint(result.window, FrameScheduler::Clock::now() + result.delay);
            break;
        case EventResult::Kind::Exit:
            CASEMENT_LOG_INFO("app", "Exit requested");
            should_exit_ = true;
            break;
    }
}

void App::run_pass(WindowId window)
{
    scheduler_->begin_frame();
    EventResult result = runtime_->driver->run_ui_and_paint_window(window);
    scheduler_->end_frame();

    // Windows opened by this pass have never been drawn.
    schedule_all_windows();
    apply(result);
}

void App::schedule_all_windows()
{
    if (!runtime_)
        return;

    std::unordered_set<WindowId> live;
    for (ViewportId id : runtime_->registry->ids())
    {
        auto window = runtime_->registry->window_for_viewport(id);
        if (!window)
            continue;
        live.insert(*window);
        if (runtime_->known_windows.insert(*window).second)
            scheduler_->request_repaint_now(*window);
    }

    for (auto it = runtime_->known_windows.begin(); it != runtime_->known_windows.end();)
    {
        if (live.count(*it) == 0)
        {
            scheduler_->forget(*it);
            it = runtime_->known_windows.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

std::chrono::milliseconds App::wait_timeout() const
{
    auto deadline = scheduler_->next_deadline();
    if (!deadline)
        return std::chrono::milliseconds{-1};

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - FrameScheduler::Clock::now());
    return std::max(remaining, std::chrono::milliseconds{0});
}

// ─── Shutdown ────────────────────────────────────────────────────────────────

void App::shutdown()
{
    if (!lifecycle_)
        return;
    if (lifecycle_->state() != LifecycleState::ShutDown)
    {
        try
        {
            lifecycle_->on_shutdown();
        }
        catch (const ContextBindError& e)
        {
            CASEMENT_LOG_ERROR("app", "Releasing the context at shutdown failed: {}", e.what());
        }
        CASEMENT_LOG_INFO("app", "Shut down");
    }
    if (runtime_)
    {
        runtime_->driver.reset();
        runtime_.reset();
    }
    scheduler_->clear();
}

}   // namespace casement
