#pragma once

#include <casement/platform.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace casement
{

// Tracks which windows want a pass and when, plus pass timing statistics.
class FrameScheduler
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit FrameScheduler(float target_fps = 60.0f);

    // Keeps the earliest deadline when a window is requested twice.
    void request_repaint(WindowId window, TimePoint when);
    void request_repaint_now(WindowId window) { request_repaint(window, Clock::now()); }

    // Removes and returns every window whose deadline is at or before `now`.
    std::vector<WindowId> take_due(TimePoint now);

    std::optional<TimePoint> next_deadline() const;
    bool                     has_pending() const { return !deadlines_.empty(); }
    bool                     is_scheduled(WindowId window) const { return deadlines_.count(window) > 0; }

    void forget(WindowId window) { deadlines_.erase(window); }
    void clear() { deadlines_.clear(); }

    // Bracket each UI pass.
    void begin_frame();
    void end_frame();

    float    dt() const { return dt_; }
    uint64_t frame_number() const { return frame_number_; }
    float    last_dt_ms() const { return last_dt_ms_; }

    // Hitch detection stats (rolling window)
    struct FrameStats
    {
        float    max_frame_time_ms  = 0.0f;
        float    avg_frame_time_ms  = 0.0f;
        uint32_t hitch_count        = 0;   // frames > 2x target in window
        uint64_t window_frame_count = 0;
    };
    FrameStats frame_stats() const { return stats_; }

   private:
    void update_stats(float dt_ms);

    std::unordered_map<WindowId, TimePoint> deadlines_;

    float     target_fps_;
    TimePoint last_frame_start_;
    TimePoint frame_start_;
    bool      first_frame_  = true;
    float     dt_           = 0.0f;
    uint64_t  frame_number_ = 0;

    static constexpr uint64_t STATS_WINDOW_FRAMES = 600;
    FrameStats                stats_;
    float                     last_dt_ms_        = 0.0f;
    float                     max_dt_in_window_  = 0.0f;
    double                    dt_sum_in_window_  = 0.0;
    uint32_t                  hitches_in_window_ = 0;
    uint64_t                  window_counter_    = 0;
};

}   // namespace casement
