#pragma once

#include <casement/config.hpp>
#include <casement/platform.hpp>
#include <casement/ui.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

#include "event_result.hpp"
#include "immediate_renderer.hpp"

namespace casement
{

class ContextCell;
class ViewportRegistry;

struct FrameDriverOptions
{
    ClearPolicy clear_policy = ClearPolicy::Auto;
};

// Runs UI passes and routes window events for every live viewport.
class FrameDriver
{
   public:
    FrameDriver(std::shared_ptr<ViewportRegistry> registry,
                std::shared_ptr<ContextCell>      context,
                std::shared_ptr<Painter>          painter,
                UiLayer&                          ui,
                Platform&                         platform,
                FrameDriverOptions                options = {});

    FrameDriver(const FrameDriver&)            = delete;
    FrameDriver& operator=(const FrameDriver&) = delete;

    // Input, UI, paint, present, reconcile for one viewport.
    EventResult run_ui_and_paint(ViewportId id);
    EventResult run_ui_and_paint_window(WindowId window_id);

    EventResult on_window_event(WindowId window_id, const WindowEvent& event);
    EventResult on_device_event(const DeviceEvent& event);

    // Set once the root has seen a close request it did not cancel.
    bool close_acknowledged() const { return close_; }

    ImmediateViewportRenderer& immediate_renderer() { return immediate_; }

    void        set_clear_policy(ClearPolicy policy) { options_.clear_policy = policy; }
    ClearPolicy clear_policy() const { return options_.clear_policy; }

    uint64_t pass_count() const { return passes_; }
    uint64_t dropped_frames() const { return dropped_frames_; }

   private:
    bool   should_clear_before_ui() const;
    double seconds_since_start() const;

    std::shared_ptr<ViewportRegistry> registry_;
    std::shared_ptr<ContextCell>      context_;
    std::shared_ptr<Painter>          painter_;
    UiLayer&                          ui_;
    Platform&                         platform_;
    FrameDriverOptions                options_;

    std::chrono::steady_clock::time_point start_time_;
    ImmediateViewportRenderer             immediate_;

    bool     close_          = false;
    uint64_t passes_         = 0;
    uint64_t dropped_frames_ = 0;
};

}   // namespace casement
