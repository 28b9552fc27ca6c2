#include "lifecycle.hpp"

#include <casement/logger.hpp>

#include "render/context_cell.hpp"
#include "viewport/viewport_registry.hpp"

namespace casement
{

const char* lifecycle_state_name(LifecycleState state)
{
    switch (state)
    {
        case LifecycleState::NotStarted:
            return "not-started";
        case LifecycleState::Running:
            return "running";
        case LifecycleState::Suspended:
            return "suspended";
        case LifecycleState::ShutDown:
            return "shut-down";
    }
    return "unknown";
}

LifecycleHandler::LifecycleHandler(StartupFn startup) : startup_(std::move(startup)) {}

void LifecycleHandler::attach(std::weak_ptr<ViewportRegistry> registry,
                              std::weak_ptr<ContextCell>      context)
{
    registry_ = std::move(registry);
    context_  = std::move(context);
}

void LifecycleHandler::on_resumed()
{
    switch (state_)
    {
        case LifecycleState::ShutDown:
            CASEMENT_LOG_WARN("lifecycle", "Resume after shutdown ignored");
            return;

        case LifecycleState::NotStarted:
            CASEMENT_LOG_INFO("lifecycle", "First resume, starting up");
            if (startup_)
                startup_();
            break;

        case LifecycleState::Running:
        case LifecycleState::Suspended:
            if (auto registry = registry_.lock())
            {
                size_t failures = registry->initialize_all();
                CASEMENT_LOG_INFO("lifecycle",
                                  "Resumed, rebuilt {} viewports ({} failed)",
                                  registry->size() - failures,
                                  failures);
            }
            break;
    }

    state_ = LifecycleState::Running;
    resumes_++;
}

void LifecycleHandler::on_suspended()
{
    switch (state_)
    {
        case LifecycleState::Suspended:
            CASEMENT_LOG_WARN("lifecycle", "Suspend received while already suspended, ignoring");
            return;
        case LifecycleState::NotStarted:
            CASEMENT_LOG_DEBUG("lifecycle", "Suspend before first resume, nothing to release");
            return;
        case LifecycleState::ShutDown:
            return;
        case LifecycleState::Running:
            break;
    }

    release_all();
    state_ = LifecycleState::Suspended;
    CASEMENT_LOG_INFO("lifecycle", "Suspended");
}

void LifecycleHandler::on_shutdown()
{
    if (state_ == LifecycleState::ShutDown)
        return;
    release_all();
    state_ = LifecycleState::ShutDown;
}

void LifecycleHandler::release_all()
{
    if (auto registry = registry_.lock())
        registry->release_all_windows();
    if (auto context = context_.lock())
        context->release_for_suspend();
}

}   // namespace casement
