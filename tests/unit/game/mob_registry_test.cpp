#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

#include <yaml-cpp/yaml.h>

#include "mock_logger.hpp"
#include "msim/game/mob_registry.hpp"

using namespace msim::game;
using msim::foundation::ErrorCode;

// ═══════════════════════════════════════════════════════════════════════════
// Built-in archetypes
// ═══════════════════════════════════════════════════════════════════════════

TEST(MobRegistryTest, DefaultArchetypesPresent) {
    auto registry = MobRegistry::WithDefaultArchetypes();
    EXPECT_EQ(registry.ArchetypeCount(), 9u);

    for (const char* type : {"goblin", "bandit", "barbarian", "hobgoblin", "guard",
                             "dark_warrior", "black_knight", "ice_warrior", "dark_ranger"}) {
        EXPECT_NE(registry.FindArchetype(type), nullptr) << type;
    }
}

TEST(MobRegistryTest, BuiltInValues) {
    auto registry = MobRegistry::WithDefaultArchetypes();

    const auto* goblin = registry.FindArchetype("goblin");
    ASSERT_NE(goblin, nullptr);
    EXPECT_EQ(goblin->stats.level, 2);
    EXPECT_EQ(goblin->MaxHealth(), 30);
    EXPECT_FLOAT_EQ(goblin->behavior.aggroRange, 8.0f);
    EXPECT_TRUE(goblin->behavior.aggressive);
    EXPECT_EQ(goblin->lootTable, "goblin_drops");

    const auto* ranger = registry.FindArchetype("dark_ranger");
    ASSERT_NE(ranger, nullptr);
    EXPECT_EQ(ranger->equipment.weapon, WeaponStyle::Ranged);
    EXPECT_FLOAT_EQ(ranger->equipment.AttackRange(), kRangedAttackRange);
}

TEST(MobRegistryTest, AlwaysAggressiveTypes) {
    EXPECT_TRUE(IsAlwaysAggressive("dark_warrior"));
    EXPECT_TRUE(IsAlwaysAggressive("black_knight"));
    EXPECT_TRUE(IsAlwaysAggressive("ice_warrior"));
    EXPECT_TRUE(IsAlwaysAggressive("dark_ranger"));
    EXPECT_FALSE(IsAlwaysAggressive("goblin"));
    EXPECT_FALSE(IsAlwaysAggressive("guard"));
}

TEST(MobRegistryTest, UnknownTypeIsError) {
    MobRegistry registry;
    auto result = registry.GetArchetype("dragon");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownMobType);
}

TEST(MobRegistryTest, AdHocConfig) {
    auto cfg = MakeAdHocSpawnConfig("wolf", 7);
    EXPECT_EQ(cfg.type, "wolf");
    EXPECT_EQ(cfg.stats.level, 7);
    EXPECT_EQ(cfg.stats.attack, 7);
    EXPECT_EQ(cfg.stats.defense, 7);
    EXPECT_TRUE(cfg.behavior.aggressive);
    EXPECT_FLOAT_EQ(cfg.behavior.aggroRange, 5.0f);
    EXPECT_GT(cfg.MaxHealth(), 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// YAML loading
// ═══════════════════════════════════════════════════════════════════════════

TEST(MobRegistryYamlTest, OverridesAndNewTypes) {
    auto registry = MobRegistry::WithDefaultArchetypes();
    auto root = YAML::Load(
        "mobs:\n"
        "  - type: goblin\n"
        "    respawn_ms: 60000\n"
        "  - type: skeleton\n"
        "    level: 10\n"
        "    weapon: ranged\n"
        "    aggressive: true\n"
        "    aggro_range: 7\n"
        "    stats: {constitution: 6}\n"
        "areas:\n"
        "  - id: crypt\n"
        "    mob_type: skeleton\n"
        "    center: [1, 2, 3]\n"
        "    spawn_radius: 4\n"
        "    max_count: 2\n"
        "  - id: camp\n"
        "    mob_type: goblin\n"
        "    center: {x: -5, z: 5}\n");

    ASSERT_TRUE(registry.LoadFromYaml(root));

    const auto* goblin = registry.FindArchetype("goblin");
    ASSERT_NE(goblin, nullptr);
    EXPECT_EQ(goblin->respawnTimeMs, 60000);
    EXPECT_EQ(goblin->stats.level, 2);

    const auto* skeleton = registry.FindArchetype("skeleton");
    ASSERT_NE(skeleton, nullptr);
    EXPECT_EQ(skeleton->stats.level, 10);
    EXPECT_EQ(skeleton->MaxHealth(), 60);
    EXPECT_EQ(skeleton->equipment.weapon, WeaponStyle::Ranged);
    EXPECT_FLOAT_EQ(skeleton->behavior.aggroRange, 7.0f);
    EXPECT_FLOAT_EQ(skeleton->behavior.chaseRange, 14.0f);
    EXPECT_EQ(skeleton->lootTable, "skeleton_drops");

    ASSERT_EQ(registry.Areas().size(), 2u);
    EXPECT_EQ(registry.Areas()[0].center, (Vector3{1.0f, 2.0f, 3.0f}));
    EXPECT_EQ(registry.Areas()[0].maxCount, 2u);
    EXPECT_EQ(registry.Areas()[1].center, (Vector3{-5.0f, 0.0f, 5.0f}));
    EXPECT_EQ(registry.Areas()[1].maxCount, 1u);
}

TEST(MobRegistryYamlTest, BadDocumentLeavesRegistryUntouched) {
    auto registry = MobRegistry::WithDefaultArchetypes();
    auto root = YAML::Load(
        "mobs:\n"
        "  - type: wraith\n"
        "  - type: ghoul\n"
        "    weapon: halberd\n");

    auto result = registry.LoadFromYaml(root);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
    EXPECT_EQ(registry.FindArchetype("wraith"), nullptr);
    EXPECT_EQ(registry.ArchetypeCount(), 9u);
}

TEST(MobRegistryYamlTest, AreaWithoutIdFails) {
    MobRegistry registry;
    auto result = registry.LoadFromYaml(YAML::Load("areas:\n  - mob_type: goblin\n"));
    ASSERT_FALSE(result);
    EXPECT_TRUE(registry.Areas().empty());
}

TEST(MobRegistryYamlTest, LoadFromMissingFile) {
    MobRegistry registry;
    auto result = registry.LoadFromFile("/nonexistent/msim/mob_data.yaml");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(MobRegistryYamlTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "msim_mob_registry_test.yaml";
    {
        std::ofstream out(path);
        out << "mobs:\n  - type: imp\n    level: 3\n";
    }

    MobRegistry registry;
    EXPECT_TRUE(registry.LoadFromFile(path));
    EXPECT_NE(registry.FindArchetype("imp"), nullptr);
    std::filesystem::remove(path);
}

// ═══════════════════════════════════════════════════════════════════════════
// Spawn points
// ═══════════════════════════════════════════════════════════════════════════

TEST(MobRegistrySpawnPointTest, PointsStayInsideArea) {
    auto registry = MobRegistry::WithDefaultArchetypes();
    registry.AddArea(MobSpawnArea{"camp", "goblin", {10.0f, 5.0f, -10.0f}, 6.0f, 5});

    std::mt19937 rng(42);
    auto points = registry.GenerateSpawnPoints(rng);

    ASSERT_EQ(points.size(), 5u);
    for (std::size_t i = 0; i < points.size(); ++i) {
        EXPECT_EQ(points[i].id, "camp_spawn_" + std::to_string(i));
        EXPECT_EQ(points[i].areaId, "camp");
        EXPECT_EQ(points[i].config.type, "goblin");
        EXPECT_FLOAT_EQ(points[i].position.y, 5.0f);
        EXPECT_LE(PlanarDistance(points[i].position, {10.0f, 5.0f, -10.0f}), 6.0f + 1e-4f);
    }
}

TEST(MobRegistrySpawnPointTest, UnknownAreaTypeSkippedAndLogged) {
    msim::test::ScopedMockLogger log;
    MobRegistry registry;
    registry.AddArea(MobSpawnArea{"lair", "dragon", {}, 1.0f, 3});

    std::mt19937 rng(1);
    EXPECT_TRUE(registry.GenerateSpawnPoints(rng).empty());
    EXPECT_EQ(log->count("lair"), 1u);
}

TEST(MobRegistrySpawnPointTest, SameSeedSamePoints) {
    auto registry = MobRegistry::WithDefaultArchetypes();
    registry.AddArea(MobSpawnArea{"camp", "bandit", {}, 10.0f, 4});

    std::mt19937 a(7);
    std::mt19937 b(7);
    auto first = registry.GenerateSpawnPoints(a);
    auto second = registry.GenerateSpawnPoints(b);

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].position, second[i].position);
    }
}
