#include "frame_scheduler.hpp"

#include <algorithm>
#include <casement/logger.hpp>

namespace casement
{

FrameScheduler::FrameScheduler(float target_fps) : target_fps_(target_fps > 0.0f ? target_fps : 60.0f)
{
}

void FrameScheduler::request_repaint(WindowId window, TimePoint when)
{
    auto [it, inserted] = deadlines_.emplace(window, when);
    if (!inserted && when < it->second)
        it->second = when;
}

std::vector<WindowId> FrameScheduler::take_due(TimePoint now)
{
    std::vector<WindowId> due;
    for (auto it = deadlines_.begin(); it != deadlines_.end();)
    {
        if (it->second <= now)
        {
            due.push_back(it->first);
            it = deadlines_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    // Deterministic order: window ids grow with creation, so parents go first.
    std::sort(due.begin(), due.end());
    return due;
}

std::optional<FrameScheduler::TimePoint> FrameScheduler::next_deadline() const
{
    if (deadlines_.empty())
        return std::nullopt;
    auto it = std::min_element(deadlines_.begin(),
                               deadlines_.end(),
                               [](const auto& a, const auto& b) { return a.second < b.second; });
    return it->second;
}

void FrameScheduler::begin_frame()
{
    frame_start_ = Clock::now();
    if (first_frame_)
    {
        first_frame_      = false;
        last_frame_start_ = frame_start_;
        dt_               = 0.0f;
        frame_number_     = 0;
        return;
    }

    float raw_dt      = std::chrono::duration<float>(frame_start_ - last_frame_start_).count();
    last_frame_start_ = frame_start_;

    // Idle gaps between passes are expected; cap them so they don't read as hitches.
    dt_ = std::min(raw_dt, 0.25f);
    frame_number_++;
}

void FrameScheduler::end_frame()
{
    float pass_ms = std::chrono::duration<float, std::milli>(Clock::now() - frame_start_).count();
    update_stats(pass_ms);
}

void FrameScheduler::update_stats(float dt_ms)
{
    last_dt_ms_ = dt_ms;
    max_dt_in_window_ = std::max(max_dt_in_window_, dt_ms);
    dt_sum_in_window_ += dt_ms;
    window_counter_++;

    float target_ms = 1000.0f / target_fps_;
    if (dt_ms > target_ms * 2.0f)
    {
        hitches_in_window_++;
        CASEMENT_LOG_DEBUG("scheduler",
                           "Pass {} took {}ms (target {}ms)",
                           frame_number_,
                           dt_ms,
                           target_ms);
    }

    if (window_counter_ >= STATS_WINDOW_FRAMES)
    {
        stats_.max_frame_time_ms  = max_dt_in_window_;
        stats_.avg_frame_time_ms  = static_cast<float>(dt_sum_in_window_ / window_counter_);
        stats_.hitch_count        = hitches_in_window_;
        stats_.window_frame_count = window_counter_;

        if (hitches_in_window_ > 0)
        {
            CASEMENT_LOG_INFO("scheduler",
                              "Stats ({} passes): avg={}ms max={}ms hitches={}",
                              window_counter_,
                              stats_.avg_frame_time_ms,
                              stats_.max_frame_time_ms,
                              hitches_in_window_);
        }

        max_dt_in_window_  = 0.0f;
        dt_sum_in_window_  = 0.0;
        hitches_in_window_ = 0;
        window_counter_    = 0;
    }
}

}   // namespace casement
