#pragma once

/// @file mob_registry.hpp
/// @brief Mob archetypes, spawn areas and spawn-point generation.

#include "msim/foundation/game_result.hpp"
#include "msim/game/math_types.hpp"
#include "msim/game/mob_types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
class Node;
}

namespace msim::game {

/// Archetype a mob is spawned from.
struct MobSpawnConfig {
    std::string type;
    std::string name;
    MobStats stats;
    MobEquipment equipment;
    MobBehavior behavior;
    std::string lootTable;
    /// Per-archetype respawn delay in ms. 0 selects the global default.
    int64_t respawnTimeMs = 0;
    float moveSpeed = kDefaultMoveSpeed;
    float wanderRadius = kDefaultWanderRadius;
    int32_t xpReward = 0;

    [[nodiscard]] int32_t MaxHealth() const noexcept {
        return stats.constitution * kHealthPerConstitution;
    }
};

/// Ad-hoc archetype for runtime spawns of unregistered types: aggressive,
/// aggro range 5, attack/strength/defense equal to @p level.
MobSpawnConfig MakeAdHocSpawnConfig(std::string type, int32_t level);

/// Immutable seed for initial and respawned mobs.
struct SpawnPoint {
    std::string id;
    std::string areaId;
    MobSpawnConfig config;
    Vector3 position;
};

/// Region that holds up to @c maxCount mobs of one type.
struct MobSpawnArea {
    std::string areaId;
    std::string mobType;
    Vector3 center;
    float spawnRadius = 0.0f;
    uint32_t maxCount = 1;
};

/// Elite archetypes that ignore the level gate.
[[nodiscard]] bool IsAlwaysAggressive(std::string_view mobType) noexcept;

/// Static mob configuration.
///
/// Holds archetypes keyed by type and the spawn areas of the world.
/// Archetypes can be defined in code, taken from the built-in set, or
/// loaded from YAML:
///
/// @code
///   mobs:
///     - type: goblin
///       level: 2
///       aggro_range: 8
///       weapon: melee
///       loot_table: goblin_drops
///   areas:
///     - id: goblin_camp
///       mob_type: goblin
///       center: [10, 0, 10]
///       spawn_radius: 6
///       max_count: 4
/// @endcode
class MobRegistry {
public:
    MobRegistry() = default;

    /// Registry pre-filled with the built-in archetypes.
    [[nodiscard]] static MobRegistry WithDefaultArchetypes();

    /// Add or replace an archetype.
    void RegisterArchetype(MobSpawnConfig config);

    [[nodiscard]] const MobSpawnConfig* FindArchetype(std::string_view type) const;

    /// Archetype by type, or UnknownMobType.
    [[nodiscard]] foundation::GameResult<MobSpawnConfig> GetArchetype(std::string_view type) const;

    [[nodiscard]] std::vector<std::string> ArchetypeTypes() const;
    [[nodiscard]] std::size_t ArchetypeCount() const noexcept { return archetypes_.size(); }

    void AddArea(MobSpawnArea area);
    [[nodiscard]] const std::vector<MobSpawnArea>& Areas() const noexcept { return areas_; }

    /// Merge `mobs` and `areas` from a parsed YAML document. Entries for an
    /// existing type start from the existing archetype.
    foundation::GameResult<void> LoadFromYaml(const YAML::Node& root);

    foundation::GameResult<void> LoadFromFile(const std::filesystem::path& path);

    /// Place maxCount points per area uniformly within its radius. Areas
    /// naming an unknown type are logged and skipped.
    [[nodiscard]] std::vector<SpawnPoint> GenerateSpawnPoints(std::mt19937& rng) const;

private:
    std::map<std::string, MobSpawnConfig, std::less<>> archetypes_;
    std::vector<MobSpawnArea> areas_;
};

}  // namespace msim::game
