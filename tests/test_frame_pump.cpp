#include "core/frame_pump.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace retrohost {
namespace {

using TickResult = FramePump::TickResult;

// Spin until the predicate holds or a generous timeout expires
template <typename Predicate>
bool wait_for(Predicate predicate) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

TEST(FramePumpTest, InactiveUntilArmed) {
    FramePump pump;
    EXPECT_FALSE(pump.is_armed());
    EXPECT_EQ(pump.tick(), TickResult::Inactive);
}

TEST(FramePumpTest, RunsCallbackOncePerTick) {
    FramePump pump;
    int frames = 0;
    pump.arm([&]() { frames++; return true; }, 60.0);

    EXPECT_EQ(pump.tick(), TickResult::Ran);
    EXPECT_EQ(pump.tick(), TickResult::Ran);
    EXPECT_EQ(frames, 2);
    EXPECT_EQ(pump.get_frames_run(), 2u);
    EXPECT_EQ(pump.get_frames_dropped(), 0u);
}

TEST(FramePumpTest, FrameIntervalFollowsTargetRate) {
    FramePump pump;
    pump.arm([]() { return true; }, 50.0);
    EXPECT_DOUBLE_EQ(pump.get_frame_interval_ms(), 20.0);

    // Nonsense rates fall back to 60 fps
    pump.arm([]() { return true; }, 0.0);
    EXPECT_DOUBLE_EQ(pump.get_target_fps(), 60.0);
}

TEST(FramePumpTest, CallbackRefusalCountsAsDropped) {
    FramePump pump;
    pump.arm([]() { return false; }, 60.0);
    EXPECT_EQ(pump.tick(), TickResult::Dropped);
    EXPECT_EQ(pump.get_frames_dropped(), 1u);
    EXPECT_EQ(pump.get_frames_run(), 0u);
}

TEST(FramePumpTest, TickDuringInFlightFrameIsDropped) {
    FramePump pump;
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::atomic<int> frames{0};

    pump.arm([&]() {
        frames++;
        entered = true;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }, 60.0);

    std::thread first([&]() { EXPECT_EQ(pump.tick(), TickResult::Ran); });
    ASSERT_TRUE(wait_for([&]() { return entered.load(); }));

    EXPECT_EQ(pump.tick(), TickResult::Dropped);
    EXPECT_EQ(pump.tick(), TickResult::Dropped);

    release = true;
    first.join();

    EXPECT_EQ(frames.load(), 1);
    EXPECT_EQ(pump.get_frames_dropped(), 2u);
}

TEST(FramePumpTest, InvalidateWaitsForInFlightFrame) {
    FramePump pump;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};

    pump.arm([&]() {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
        return true;
    }, 60.0);

    std::thread ticker([&]() { pump.tick(); });
    ASSERT_TRUE(wait_for([&]() { return entered.load(); }));

    pump.invalidate();
    EXPECT_TRUE(finished.load());
    EXPECT_FALSE(pump.is_armed());
    EXPECT_EQ(pump.tick(), TickResult::Inactive);

    ticker.join();
}

TEST(FramePumpTest, DisarmFromInsideCallbackStopsLaterTicks) {
    FramePump pump;
    int frames = 0;
    pump.arm([&]() {
        frames++;
        pump.disarm();
        return true;
    }, 60.0);

    EXPECT_EQ(pump.tick(), TickResult::Ran);
    EXPECT_EQ(pump.tick(), TickResult::Inactive);
    EXPECT_EQ(frames, 1);
}

} // namespace
} // namespace retrohost
