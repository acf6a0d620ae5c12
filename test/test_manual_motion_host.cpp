#include <gtest/gtest.h>
#include <marker_motion/manual_motion_host.hpp>
#include <vector>

using namespace std::chrono_literals;
using marker_motion::ManualMotionHost;
using marker_motion::Timestamp;

// ============================================================================
// Test Suite: ManualMotionHost_Frames
// ============================================================================

TEST(ManualMotionHost_Frames, PumpAdvancesTimeAndDeliversOneFrame) {
    ManualMotionHost host;
    std::vector<Timestamp> frames;
    host.add_frame_callback([&](Timestamp now) { frames.push_back(now); });

    host.pump(500ms);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], Timestamp(500ms));
    EXPECT_EQ(host.now(), Timestamp(500ms));
}

TEST(ManualMotionHost_Frames, PumpFramesUsesFixedCadence) {
    ManualMotionHost host;
    std::vector<Timestamp> frames;
    host.add_frame_callback([&](Timestamp now) { frames.push_back(now); });

    host.pump_frames(100ms, 25ms);
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(frames.back(), Timestamp(100ms));
}

TEST(ManualMotionHost_Frames, RemovedCallbackStopsFiring) {
    ManualMotionHost host;
    int calls = 0;
    const auto id = host.add_frame_callback([&](Timestamp) { ++calls; });
    host.pump();
    host.remove_frame_callback(id);
    host.pump(16ms);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(host.frame_callback_count(), 0u);
}

TEST(ManualMotionHost_Frames, CallbackRemovedDuringDispatchDoesNotFire) {
    ManualMotionHost host;
    int second_calls = 0;
    marker_motion::MotionHost::CallbackId second = 0;
    host.add_frame_callback([&](Timestamp) { host.remove_frame_callback(second); });
    second = host.add_frame_callback([&](Timestamp) { ++second_calls; });

    host.pump();
    EXPECT_EQ(second_calls, 0);
}

// ============================================================================
// Test Suite: ManualMotionHost_Timers
// ============================================================================

TEST(ManualMotionHost_Timers, PeriodicTimerFiresAtEachDueTime) {
    ManualMotionHost host;
    std::vector<Timestamp> fired;
    host.start_periodic_timer(100ms, [&](Timestamp now) { fired.push_back(now); });

    host.pump(350ms);
    ASSERT_EQ(fired.size(), 3u);
    EXPECT_EQ(fired[0], Timestamp(100ms));
    EXPECT_EQ(fired[1], Timestamp(200ms));
    EXPECT_EQ(fired[2], Timestamp(300ms));
    EXPECT_EQ(host.now(), Timestamp(350ms));
}

TEST(ManualMotionHost_Timers, TimersInterleaveInDueOrder) {
    ManualMotionHost host;
    std::vector<int> order;
    host.start_periodic_timer(30ms, [&](Timestamp) { order.push_back(30); });
    host.start_periodic_timer(20ms, [&](Timestamp) { order.push_back(20); });

    host.pump(60ms);
    EXPECT_EQ(order, (std::vector<int>{20, 30, 20, 30, 20}));
}

TEST(ManualMotionHost_Timers, TimerCanCancelItself) {
    ManualMotionHost host;
    int calls = 0;
    marker_motion::MotionHost::CallbackId id = 0;
    id = host.start_periodic_timer(10ms, [&](Timestamp) {
        ++calls;
        host.cancel_timer(id);
    });

    host.pump(100ms);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(host.timer_count(), 0u);
}

TEST(ManualMotionHost_Timers, PumpUntilIdleStopsWhenNothingIsScheduled) {
    ManualMotionHost host;
    int remaining = 3;
    marker_motion::MotionHost::CallbackId id = 0;
    id = host.add_frame_callback([&](Timestamp) {
        if (--remaining == 0) host.remove_frame_callback(id);
    });

    EXPECT_TRUE(host.pump_until_idle());
    EXPECT_EQ(remaining, 0);
}

TEST(ManualMotionHost_Timers, PumpUntilIdleGivesUpAtLimit) {
    ManualMotionHost host;
    host.start_periodic_timer(10ms, [](Timestamp) {});
    EXPECT_FALSE(host.pump_until_idle(16ms, 200ms));
}
