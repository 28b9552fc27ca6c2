// app.cpp: App construction, platform selection and the blocking run loop.

#include <casement/app.hpp>
#include <casement/errors.hpp>
#include <casement/logger.hpp>

#include "app_runtime.hpp"
#include "platform/headless/headless_platform.hpp"
#include "runtime/frame_scheduler.hpp"
#include "runtime/lifecycle.hpp"

#ifdef CASEMENT_USE_GLFW
    #include "platform/glfw/glfw_platform.hpp"
#endif

#include <stdexcept>
#include <string>

namespace casement
{

namespace
{

std::unique_ptr<Platform> make_default_platform(const AppConfig& config)
{
    if (config.headless)
        return std::make_unique<HeadlessPlatform>();

#ifdef CASEMENT_USE_GLFW
    try
    {
        return std::make_unique<GlfwPlatform>();
    }
    catch (const SurfaceCreationError& e)
    {
        CASEMENT_LOG_ERROR("app", "Window system unavailable: {}", e.what());
        CASEMENT_LOG_WARN("app", "Falling back to the headless platform");
    }
#else
    CASEMENT_LOG_WARN("app", "Built without CASEMENT_USE_GLFW, running headless");
#endif
    return std::make_unique<HeadlessPlatform>();
}

}   // namespace

App::App(AppConfig config, std::shared_ptr<UiLayer> ui, std::unique_ptr<Platform> platform)
    : config_(std::move(config)), ui_(std::move(ui)), platform_(std::move(platform))
{
    auto& logger = Logger::instance();
    logger.set_level(config_.log_level);

    if (config_.log_to_console)
        logger.add_sink(sinks::console_sink());

    if (!config_.log_file.empty())
    {
        try
        {
            logger.add_sink(sinks::file_sink(config_.log_file));
            CASEMENT_LOG_INFO("app", "Log file: {}", config_.log_file);
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_WARN("app", "Failed to create log file: {}", e.what());
        }
    }

    if (!ui_)
        throw std::invalid_argument("App requires a UI layer");

    if (!platform_)
        platform_ = make_default_platform(config_);

    CASEMENT_LOG_INFO("app",
                      "Initializing casement (platform: {}, clear policy: {}, vsync: {})",
                      platform_->name(),
                      clear_policy_name(config_.clear_policy),
                      config_.vsync ? "on" : "off");

    scheduler_ = std::make_unique<FrameScheduler>();
    lifecycle_ = std::make_unique<LifecycleHandler>([this] { init_runtime(); });
}

int App::run()
{
    try
    {
        while (!should_exit_)
        {
            step(wait_timeout());
        }
    }
    catch (const ContextBindError& e)
    {
        CASEMENT_LOG_CRITICAL("app", "Graphics context lost: {}", e.what());
        shutdown();
        return 1;
    }
    catch (const SurfaceCreationError& e)
    {
        CASEMENT_LOG_CRITICAL("app", "Could not create the root viewport: {}", e.what());
        shutdown();
        return 1;
    }

    shutdown();
    return 0;
}

}   // namespace casement
