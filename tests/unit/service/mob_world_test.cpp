/// @file mob_world_test.cpp
/// @brief Unit tests for MobWorld wiring and lifecycle.

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "msim/foundation/error_code.hpp"
#include "msim/game/combat_bridge.hpp"
#include "msim/game/world_entity_manager.hpp"
#include "msim/service/mob_world.hpp"

using namespace msim::service;
using msim::foundation::ErrorCode;
using msim::foundation::MobId;
using msim::foundation::PlayerId;
using msim::game::DamageOutcome;
using msim::game::EntityKind;
using msim::game::MobAIState;
using msim::game::PlayerView;
using msim::game::Vector3;

namespace {

MobWorldConfig emptyWorld() {
    MobWorldConfig cfg;
    cfg.populateOnStart = false;
    return cfg;
}

PlayerView player(uint64_t id, Vector3 pos, int32_t level = 1) {
    PlayerView view;
    view.id = PlayerId(id);
    view.position = pos;
    view.combatLevel = level;
    view.health = 100;
    return view;
}

} // namespace

class MobWorldTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(world_.initialize()); }

    void runTicks(int count) {
        for (int i = 0; i < count; ++i) {
            (void)world_.tick();
        }
    }

    MobWorld world_{emptyWorld()};
};

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_F(MobWorldTest, SecondInitializeRejected) {
    auto again = world_.initialize();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST(MobWorldLifecycleTest, StartRequiresInitialize) {
    MobWorld world(emptyWorld());
    auto started = world.start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().code(), ErrorCode::WorldNotInitialized);
    EXPECT_FALSE(world.isRunning());
}

TEST_F(MobWorldTest, StartTwiceRejected) {
    ASSERT_TRUE(world_.start());
    auto again = world_.start();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code(), ErrorCode::GameLoopAlreadyRunning);

    world_.stop();
    EXPECT_FALSE(world_.isRunning());
}

TEST_F(MobWorldTest, EmptyWorldHasNoMobs) {
    auto s = world_.stats();
    EXPECT_EQ(s.mobCount, 0u);
    EXPECT_EQ(s.entityCount, 0u);
    EXPECT_EQ(s.totalTicks, 0u);
}

// ===========================================================================
// Simulation through the tick
// ===========================================================================

TEST_F(MobWorldTest, SpawnedMobGetsWorldEntity) {
    auto id = world_.mobs().SpawnMobOfType("goblin", {0.0f, 0.0f, 0.0f});
    ASSERT_TRUE(id);

    EXPECT_TRUE(world_.entities().Contains(id.value()));
    EXPECT_EQ(world_.stats().entityCount, 1u);
}

TEST_F(MobWorldTest, NearbyPlayerIsChasedAndEngaged) {
    auto id = world_.mobs().SpawnMobOfType("goblin", {0.0f, 0.0f, 0.0f}).value();
    world_.upsertPlayer(player(1, {5.0f, 0.0f, 0.0f}, 3));

    runTicks(100); // 5 s of simulation time at 20 Hz

    auto mob = world_.mobs().GetMob(id);
    ASSERT_TRUE(mob.has_value());
    EXPECT_EQ(mob->target, PlayerId(1));
    EXPECT_EQ(mob->aiState, MobAIState::Attacking);
    EXPECT_EQ(world_.combat().EngagedTarget(id), PlayerId(1));

    auto s = world_.stats();
    EXPECT_EQ(s.totalTicks, 100u);
    EXPECT_EQ(s.playerCount, 1u);
    EXPECT_EQ(s.engagements, 1u);
}

TEST_F(MobWorldTest, RemovedPlayerIsDropped) {
    auto id = world_.mobs().SpawnMobOfType("goblin", {0.0f, 0.0f, 0.0f}).value();
    world_.upsertPlayer(player(1, {5.0f, 0.0f, 0.0f}, 3));
    runTicks(100);

    EXPECT_TRUE(world_.removePlayer(PlayerId(1)));
    runTicks(40);

    auto mob = world_.mobs().GetMob(id);
    EXPECT_FALSE(mob->target.has_value());
    EXPECT_EQ(world_.stats().engagements, 0u);
}

TEST_F(MobWorldTest, KillLeavesHeadstoneAndSchedulesRespawn) {
    auto id = world_.mobs().SpawnMobOfType("goblin", {2.0f, 0.0f, 2.0f}).value();

    EXPECT_EQ(world_.mobs().ApplyDamage(id, 100000, PlayerId(7)), DamageOutcome::Killed);

    EXPECT_FALSE(world_.entities().Contains(id));
    auto stones = world_.entities().EntitiesOfKind(EntityKind::Headstone);
    ASSERT_EQ(stones.size(), 1u);
    EXPECT_EQ(world_.entities().GetEntity(stones[0])->identity.subtype, "goblin_drops");

    auto s = world_.stats();
    EXPECT_EQ(s.lootDrops, 1u);
    EXPECT_EQ(s.pendingRespawns, 1u);
    EXPECT_EQ(s.aliveMobs, 0u);
}

TEST_F(MobWorldTest, MovedMobIsReplicated) {
    auto id = world_.mobs().SpawnMobOfType("goblin", {0.0f, 0.0f, 0.0f}).value();
    world_.upsertPlayer(player(1, {6.0f, 0.0f, 0.0f}, 3));

    bool replicated = false;
    for (int i = 0; i < 60 && !replicated; ++i) {
        (void)world_.tick();
        for (auto entity : world_.entities().LastReplicated()) {
            replicated = replicated || entity == id;
        }
    }
    EXPECT_TRUE(replicated);
}

// ===========================================================================
// Mob operations while the loop runs
// ===========================================================================

TEST_F(MobWorldTest, MobOperationsWhileRunning) {
    ASSERT_TRUE(world_.start());

    auto first = world_.spawnMob("goblin", {0.0f, 0.0f, 0.0f});
    auto second = world_.spawnMob("bandit", {30.0f, 0.0f, 0.0f});
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(world_.spawnMob("troll", {}).error().code(), ErrorCode::UnknownMobType);

    world_.upsertPlayer(player(1, {3.0f, 0.0f, 0.0f}, 3));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (world_.stats().totalTicks < 10 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    EXPECT_EQ(world_.applyDamage(first.value(), 100000, PlayerId(1)), DamageOutcome::Killed);
    EXPECT_EQ(world_.applyDamage(first.value(), 5, PlayerId(1)), DamageOutcome::Ignored);
    EXPECT_TRUE(world_.despawnMob(second.value()));
    EXPECT_FALSE(world_.despawnMob(second.value()));
    EXPECT_FALSE(world_.killMob(second.value()));

    auto dead = world_.getMob(first.value());
    ASSERT_TRUE(dead.has_value());
    EXPECT_FALSE(dead->isAlive);
    EXPECT_FALSE(world_.getMob(second.value()).has_value());

    world_.stop();
    auto s = world_.stats();
    EXPECT_GE(s.totalTicks, 10u);
    EXPECT_EQ(s.mobCount, 1u);
    EXPECT_EQ(s.aliveMobs, 0u);
    EXPECT_EQ(s.lootDrops, 1u);
    EXPECT_EQ(s.engagements, 0u);
}

// ===========================================================================
// Data file
// ===========================================================================

TEST(MobWorldDataTest, PopulatesAreasFromDataFile) {
    auto path = std::filesystem::temp_directory_path() / "msim_mob_world_test.yaml";
    {
        std::ofstream out(path);
        out << "areas:\n"
               "  - id: camp\n"
               "    mob_type: goblin\n"
               "    center: [10, 0, 10]\n"
               "    spawn_radius: 3\n"
               "    max_count: 3\n";
    }

    MobWorldConfig cfg;
    cfg.mobDataFile = path;
    MobWorld world(cfg);
    ASSERT_TRUE(world.initialize());

    auto s = world.stats();
    EXPECT_EQ(s.mobCount, 3u);
    EXPECT_EQ(s.entityCount, 3u);
    EXPECT_EQ(world.mobs().GetMobsInArea({10.0f, 0.0f, 10.0f}, 3.5f).size(), 3u);

    std::filesystem::remove(path);
}

TEST(MobWorldDataTest, MissingDataFileFailsInitialize) {
    MobWorldConfig cfg;
    cfg.mobDataFile = "/nonexistent/msim/mob_data.yaml";
    MobWorld world(cfg);

    auto result = world.initialize();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}
