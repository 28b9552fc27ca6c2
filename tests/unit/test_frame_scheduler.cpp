#include <chrono>
#include <gtest/gtest.h>
#include <thread>

#include "runtime/frame_scheduler.hpp"

using namespace casement;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════════
// FrameScheduler: per-window repaint deadlines and pass timing.
// ═══════════════════════════════════════════════════════════════════════════════

class FrameSchedulerTest : public ::testing::Test
{
   protected:
    FrameScheduler            scheduler_;
    FrameScheduler::TimePoint now_ = FrameScheduler::Clock::now();
};

TEST_F(FrameSchedulerTest, StartsEmpty)
{
    EXPECT_FALSE(scheduler_.has_pending());
    EXPECT_FALSE(scheduler_.next_deadline().has_value());
    EXPECT_TRUE(scheduler_.take_due(now_).empty());
}

TEST_F(FrameSchedulerTest, EarliestDeadlineWins)
{
    scheduler_.request_repaint(1, now_ + 50ms);
    scheduler_.request_repaint(1, now_ + 10ms);
    scheduler_.request_repaint(1, now_ + 30ms);

    ASSERT_TRUE(scheduler_.next_deadline().has_value());
    EXPECT_EQ(*scheduler_.next_deadline(), now_ + 10ms);
}

TEST_F(FrameSchedulerTest, TakeDueReturnsOnlyExpiredInIdOrder)
{
    scheduler_.request_repaint(3, now_);
    scheduler_.request_repaint(1, now_ - 5ms);
    scheduler_.request_repaint(2, now_ + 100ms);
    scheduler_.request_repaint(7, now_ - 1ms);

    auto due = scheduler_.take_due(now_);

    EXPECT_EQ(due, (std::vector<WindowId>{1, 3, 7}));
    EXPECT_FALSE(scheduler_.is_scheduled(1));
    EXPECT_TRUE(scheduler_.is_scheduled(2));
    EXPECT_EQ(*scheduler_.next_deadline(), now_ + 100ms);
}

TEST_F(FrameSchedulerTest, TakeDueRemovesWhatItReturns)
{
    scheduler_.request_repaint(4, now_);
    EXPECT_EQ(scheduler_.take_due(now_).size(), 1u);
    EXPECT_TRUE(scheduler_.take_due(now_).empty());
    EXPECT_FALSE(scheduler_.has_pending());
}

TEST_F(FrameSchedulerTest, RequestNowIsDueImmediately)
{
    scheduler_.request_repaint_now(9);
    auto due = scheduler_.take_due(FrameScheduler::Clock::now());
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0], 9u);
}

TEST_F(FrameSchedulerTest, ForgetAndClear)
{
    scheduler_.request_repaint(1, now_);
    scheduler_.request_repaint(2, now_);

    scheduler_.forget(1);
    EXPECT_FALSE(scheduler_.is_scheduled(1));
    EXPECT_TRUE(scheduler_.is_scheduled(2));

    scheduler_.clear();
    EXPECT_FALSE(scheduler_.has_pending());
}

TEST_F(FrameSchedulerTest, FrameNumberCountsPasses)
{
    scheduler_.begin_frame();
    scheduler_.end_frame();
    EXPECT_EQ(scheduler_.frame_number(), 0u);
    EXPECT_FLOAT_EQ(scheduler_.dt(), 0.0f);

    std::this_thread::sleep_for(2ms);
    scheduler_.begin_frame();
    scheduler_.end_frame();
    EXPECT_EQ(scheduler_.frame_number(), 1u);
    EXPECT_GT(scheduler_.dt(), 0.0f);
    EXPECT_LE(scheduler_.dt(), 0.25f);
    EXPECT_GE(scheduler_.last_dt_ms(), 0.0f);
}

TEST_F(FrameSchedulerTest, StatsPublishedAfterWindow)
{
    for (int i = 0; i < 600; ++i)
    {
        scheduler_.begin_frame();
        scheduler_.end_frame();
    }
    EXPECT_EQ(scheduler_.frame_stats().window_frame_count, 600u);
    EXPECT_GE(scheduler_.frame_stats().max_frame_time_ms, scheduler_.frame_stats().avg_frame_time_ms);
}
