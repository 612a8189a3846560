#include <gtest/gtest.h>

#include "msim/game/respawn_scheduler.hpp"

using namespace msim::game;
using msim::foundation::MobId;

TEST(RespawnSchedulerTest, PopDueReturnsOnlyDueEntries) {
    RespawnScheduler scheduler;
    scheduler.Schedule(MobId(1), 1000);
    scheduler.Schedule(MobId(2), 3000);

    EXPECT_TRUE(scheduler.PopDue(999).empty());

    auto due = scheduler.PopDue(1000);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0], MobId(1));
    EXPECT_FALSE(scheduler.IsScheduled(MobId(1)));
    EXPECT_TRUE(scheduler.IsScheduled(MobId(2)));
    EXPECT_EQ(scheduler.Size(), 1u);
}

TEST(RespawnSchedulerTest, DueOrderThenIdOrder) {
    RespawnScheduler scheduler;
    scheduler.Schedule(MobId(5), 2000);
    scheduler.Schedule(MobId(3), 1000);
    scheduler.Schedule(MobId(4), 1000);

    auto due = scheduler.PopDue(5000);
    ASSERT_EQ(due.size(), 3u);
    EXPECT_EQ(due[0], MobId(3));
    EXPECT_EQ(due[1], MobId(4));
    EXPECT_EQ(due[2], MobId(5));
    EXPECT_EQ(scheduler.Size(), 0u);
}

TEST(RespawnSchedulerTest, RescheduleReplacesEntry) {
    RespawnScheduler scheduler;
    scheduler.Schedule(MobId(1), 1000);
    scheduler.Schedule(MobId(1), 4000);

    EXPECT_EQ(scheduler.Size(), 1u);
    EXPECT_EQ(scheduler.DueTime(MobId(1)), 4000);
    EXPECT_TRUE(scheduler.PopDue(1000).empty());
    EXPECT_EQ(scheduler.PopDue(4000).size(), 1u);
}

TEST(RespawnSchedulerTest, CancelRemovesEntry) {
    RespawnScheduler scheduler;
    scheduler.Schedule(MobId(1), 1000);

    EXPECT_TRUE(scheduler.Cancel(MobId(1)));
    EXPECT_FALSE(scheduler.Cancel(MobId(1)));
    EXPECT_FALSE(scheduler.DueTime(MobId(1)).has_value());
    EXPECT_TRUE(scheduler.PopDue(10'000).empty());
}

TEST(RespawnSchedulerTest, Clear) {
    RespawnScheduler scheduler;
    scheduler.Schedule(MobId(1), 1);
    scheduler.Schedule(MobId(2), 2);
    scheduler.Clear();
    EXPECT_EQ(scheduler.Size(), 0u);
    EXPECT_TRUE(scheduler.PopDue(100).empty());
}
