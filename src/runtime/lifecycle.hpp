#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace casement
{

class ContextCell;
class ViewportRegistry;

enum class LifecycleState
{
    NotStarted,
    Running,
    Suspended,
    ShutDown,
};

const char* lifecycle_state_name(LifecycleState state);

// Suspend/resume state machine. Desktop platforms fire a single resume at
// startup and never suspend; mobile-style platforms may cycle many times.
class LifecycleHandler
{
   public:
    using StartupFn = std::function<void()>;

    explicit LifecycleHandler(StartupFn startup);

    // Wires in the runtime created by the startup hook.
    void attach(std::weak_ptr<ViewportRegistry> registry, std::weak_ptr<ContextCell> context);

    // First call runs the startup hook (exceptions propagate: a failed start
    // is fatal). Later calls rebuild every declared viewport.
    void on_resumed();

    // Drops every window and surface and releases the context.
    void on_suspended();

    // Same teardown as suspend; terminal.
    void on_shutdown();

    LifecycleState state() const { return state_; }
    uint32_t       resume_count() const { return resumes_; }

   private:
    void release_all();

    StartupFn                       startup_;
    std::weak_ptr<ViewportRegistry> registry_;
    std::weak_ptr<ContextCell>      context_;
    LifecycleState                  state_   = LifecycleState::NotStarted;
    uint32_t                        resumes_ = 0;
};

}   // namespace casement
