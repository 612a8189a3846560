/// @file game_loop_test.cpp
/// @brief Unit tests for GameLoop.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "msim/service/game_loop.hpp"

using namespace msim::service;
using namespace std::chrono_literals;

class GameLoopTest : public ::testing::Test {
protected:
    GameLoop loop_{20}; // 20 Hz
};

TEST_F(GameLoopTest, TargetFrameTimeForTwentyHz) {
    EXPECT_EQ(loop_.tickRate(), 20u);
    EXPECT_EQ(loop_.targetFrameTime(), 50000us);
    EXPECT_FLOAT_EQ(loop_.deltaSeconds(), 0.05f);
}

TEST_F(GameLoopTest, ZeroTickRateDefaultsToTwenty) {
    GameLoop zeroRate(0);
    EXPECT_EQ(zeroRate.tickRate(), 20u);
}

TEST_F(GameLoopTest, ManualTickPassesConstantDelta) {
    int callCount = 0;
    float receivedDt = 0.0f;
    loop_.setTickCallback([&](float dt) {
        ++callCount;
        receivedDt = dt;
    });

    auto first = loop_.tick();
    auto second = loop_.tick();

    EXPECT_EQ(callCount, 2);
    EXPECT_FLOAT_EQ(receivedDt, 0.05f);
    EXPECT_EQ(first.tickNumber, 0u);
    EXPECT_EQ(second.tickNumber, 1u);
    EXPECT_EQ(loop_.tickCount(), 2u);
}

TEST_F(GameLoopTest, SlowTickCountsAsOverrun) {
    GameLoop fast(1000); // 1 ms budget
    fast.setTickCallback([](float) { std::this_thread::sleep_for(5ms); });

    auto metrics = fast.tick();
    EXPECT_TRUE(metrics.overrun);
    EXPECT_GT(metrics.budgetUtilization, 1.0f);
    EXPECT_EQ(fast.overrunCount(), 1u);
}

TEST_F(GameLoopTest, MetricsCallbackSeesEveryTick) {
    std::atomic<int> seen{0};
    loop_.setMetricsCallback([&](const TickMetrics&) { ++seen; });
    (void)loop_.tick();
    EXPECT_EQ(seen.load(), 1);
}

TEST_F(GameLoopTest, StartAndStopLifecycle) {
    std::atomic<int> ticks{0};
    loop_.setTickCallback([&](float) { ++ticks; });

    ASSERT_TRUE(loop_.start());
    EXPECT_TRUE(loop_.isRunning());
    EXPECT_FALSE(loop_.start());

    std::this_thread::sleep_for(200ms);
    loop_.stop();

    EXPECT_FALSE(loop_.isRunning());
    EXPECT_GE(ticks.load(), 1);
}

TEST_F(GameLoopTest, StopWhenNotRunningIsSafe) {
    loop_.stop();
    EXPECT_FALSE(loop_.isRunning());
}

TEST_F(GameLoopTest, DestructorStopsRunningLoop) {
    std::atomic<int> ticks{0};
    {
        GameLoop scoped(100);
        scoped.setTickCallback([&](float) { ++ticks; });
        ASSERT_TRUE(scoped.start());
        std::this_thread::sleep_for(50ms);
    }
    const int after = ticks.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(ticks.load(), after);
}
