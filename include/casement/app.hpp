#pragma once

#include <casement/config.hpp>
#include <casement/platform.hpp>
#include <casement/ui.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

namespace casement
{

class ContextCell;
class FrameDriver;
class FrameScheduler;
class LifecycleHandler;
class ViewportRegistry;
struct EventResult;

class App
{
   public:
    // Without a platform, one is picked from the config: headless, or GLFW
    // when built with it.
    App(AppConfig config, std::shared_ptr<UiLayer> ui, std::unique_ptr<Platform> platform = nullptr);
    ~App();

    App(const App&)            = delete;
    App& operator=(const App&) = delete;

    // Blocks until the root viewport closes. Returns the process exit code;
    // startup failures (no context, no root window) return 1.
    int run();

    // Frame-by-frame control (alternative to run()).
    struct StepResult
    {
        bool     should_exit = false;
        size_t   events      = 0;
        uint64_t passes      = 0;
    };

    // Pumps platform events once and runs every pass that is due. Startup
    // errors propagate.
    StepResult step(std::chrono::milliseconds timeout);
    void       shutdown();

    const AppConfig& config() const { return config_; }
    Platform&        platform() { return *platform_; }

    // Null until the first resume.
    ViewportRegistry* registry();
    FrameDriver*      driver();
    ContextCell*      context();
    LifecycleHandler& lifecycle() { return *lifecycle_; }

   private:
    void init_runtime();
    void handle_event(const PlatformEvent& event);
    void apply(const EventResult& result);
    void run_pass(WindowId window);
    void schedule_all_windows();
    std::chrono::milliseconds wait_timeout() const;

    struct AppRuntime;

    AppConfig                         config_;
    std::shared_ptr<UiLayer>          ui_;
    std::unique_ptr<Platform>         platform_;
    std::unique_ptr<FrameScheduler>   scheduler_;
    std::unique_ptr<LifecycleHandler> lifecycle_;
    std::unique_ptr<AppRuntime>       runtime_;
    bool                              should_exit_ = false;
};

}   // namespace casement
