/// @file mob_registry.cpp
/// @brief Built-in archetypes, YAML loading and spawn-point generation.

#include "msim/game/mob_registry.hpp"

#include "msim/foundation/game_logger.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <cmath>
#include <numbers>

namespace msim::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::array<std::string_view, 4> kAlwaysAggressiveTypes = {
    "dark_warrior", "black_knight", "ice_warrior", "dark_ranger"
};

struct BuiltInArchetype {
    std::string_view type;
    std::string_view name;
    int32_t level;
    int32_t constitution;
    WeaponStyle weapon;
    float detectionRange;
    float leashRange;
};

// Detection and leash ranges follow the game design data for each type.
constexpr std::array<BuiltInArchetype, 9> kBuiltIns = {{
    {"goblin",       "Goblin",       2,  3,  WeaponStyle::Melee,  8.0f,  15.0f},
    {"bandit",       "Bandit",       5,  5,  WeaponStyle::Melee,  8.0f,  15.0f},
    {"barbarian",    "Barbarian",    8,  8,  WeaponStyle::Melee,  10.0f, 20.0f},
    {"hobgoblin",    "Hobgoblin",    12, 10, WeaponStyle::Melee,  12.0f, 25.0f},
    {"guard",        "Guard",        15, 12, WeaponStyle::Melee,  12.0f, 25.0f},
    {"dark_warrior", "Dark Warrior", 18, 15, WeaponStyle::Melee,  15.0f, 30.0f},
    {"black_knight", "Black Knight", 25, 20, WeaponStyle::Melee,  15.0f, 30.0f},
    {"ice_warrior",  "Ice Warrior",  28, 22, WeaponStyle::Melee,  12.0f, 25.0f},
    {"dark_ranger",  "Dark Ranger",  30, 18, WeaponStyle::Ranged, 20.0f, 35.0f},
}};

MobSpawnConfig fromBuiltIn(const BuiltInArchetype& def) {
    MobSpawnConfig cfg;
    cfg.type = std::string(def.type);
    cfg.name = std::string(def.name);
    cfg.stats.level = def.level;
    cfg.stats.attack = def.level;
    cfg.stats.strength = def.level;
    cfg.stats.defense = def.level;
    cfg.stats.constitution = def.constitution;
    cfg.stats.ranged = def.weapon == WeaponStyle::Ranged ? def.level : 1;
    cfg.equipment.weapon = def.weapon;
    cfg.behavior.aggressive = true;
    cfg.behavior.aggroRange = def.detectionRange;
    cfg.behavior.chaseRange = def.leashRange;
    cfg.lootTable = cfg.type + "_drops";
    cfg.xpReward = def.level * 10;
    return cfg;
}

template <typename T>
void readIfPresent(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

Vector3 readVector(const YAML::Node& node) {
    if (node.IsSequence() && node.size() == 3) {
        return {node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
    }
    if (node.IsMap()) {
        return {node["x"].as<float>(0.0f), node["y"].as<float>(0.0f),
                node["z"].as<float>(0.0f)};
    }
    throw YAML::RepresentationException(node.Mark(), "expected [x, y, z] or {x, y, z}");
}

MobSpawnConfig parseArchetype(const YAML::Node& node, const MobSpawnConfig* base) {
    MobSpawnConfig cfg;
    auto type = node["type"].as<std::string>();
    bool hasLevel = static_cast<bool>(node["level"]);

    if (base != nullptr) {
        cfg = *base;
    } else {
        int32_t level = node["level"].as<int32_t>(1);
        cfg = MakeAdHocSpawnConfig(type, level);
        cfg.behavior.aggressive = false;
        cfg.behavior.aggroRange = 5.0f;
        cfg.behavior.chaseRange = cfg.behavior.aggroRange * 2.0f;
        cfg.stats.constitution = 10;
    }
    cfg.type = type;

    if (hasLevel) {
        cfg.stats.level = node["level"].as<int32_t>();
        cfg.xpReward = cfg.stats.level * 10;
    }
    readIfPresent(node, "name", cfg.name);
    if (const auto& stats = node["stats"]) {
        readIfPresent(stats, "attack", cfg.stats.attack);
        readIfPresent(stats, "strength", cfg.stats.strength);
        readIfPresent(stats, "defense", cfg.stats.defense);
        readIfPresent(stats, "constitution", cfg.stats.constitution);
        readIfPresent(stats, "ranged", cfg.stats.ranged);
    }
    if (node["weapon"]) {
        auto weapon = node["weapon"].as<std::string>();
        if (weapon != "melee" && weapon != "ranged") {
            throw YAML::RepresentationException(node["weapon"].Mark(),
                                                "weapon must be melee or ranged");
        }
        cfg.equipment.weapon = weapon == "ranged" ? WeaponStyle::Ranged : WeaponStyle::Melee;
    }
    readIfPresent(node, "armor_bonus", cfg.equipment.armorBonus);
    readIfPresent(node, "aggressive", cfg.behavior.aggressive);
    if (node["aggro_range"]) {
        cfg.behavior.aggroRange = node["aggro_range"].as<float>();
        if (!node["chase_range"]) {
            cfg.behavior.chaseRange = cfg.behavior.aggroRange * 2.0f;
        }
    }
    readIfPresent(node, "chase_range", cfg.behavior.chaseRange);
    readIfPresent(node, "return_to_spawn", cfg.behavior.returnToSpawn);
    readIfPresent(node, "level_ignore_threshold", cfg.behavior.levelIgnoreThreshold);
    readIfPresent(node, "loot_table", cfg.lootTable);
    readIfPresent(node, "respawn_ms", cfg.respawnTimeMs);
    readIfPresent(node, "move_speed", cfg.moveSpeed);
    readIfPresent(node, "wander_radius", cfg.wanderRadius);
    readIfPresent(node, "xp_reward", cfg.xpReward);

    if (cfg.name.empty()) {
        cfg.name = cfg.type;
    }
    if (cfg.lootTable.empty()) {
        cfg.lootTable = cfg.type + "_drops";
    }
    return cfg;
}

MobSpawnArea parseArea(const YAML::Node& node) {
    MobSpawnArea area;
    area.areaId = node["id"].as<std::string>();
    area.mobType = node["mob_type"].as<std::string>();
    if (node["center"]) {
        area.center = readVector(node["center"]);
    }
    readIfPresent(node, "spawn_radius", area.spawnRadius);
    readIfPresent(node, "max_count", area.maxCount);
    return area;
}

} // namespace

MobSpawnConfig MakeAdHocSpawnConfig(std::string type, int32_t level) {
    MobSpawnConfig cfg;
    cfg.name = type;
    cfg.lootTable = type + "_drops";
    cfg.type = std::move(type);
    cfg.stats.level = level;
    cfg.stats.attack = level;
    cfg.stats.strength = level;
    cfg.stats.defense = level;
    cfg.stats.constitution = 30;
    cfg.behavior.aggressive = true;
    cfg.behavior.aggroRange = 5.0f;
    cfg.behavior.chaseRange = 10.0f;
    cfg.xpReward = level * 10;
    return cfg;
}

bool IsAlwaysAggressive(std::string_view mobType) noexcept {
    for (auto type : kAlwaysAggressiveTypes) {
        if (type == mobType) {
            return true;
        }
    }
    return false;
}

MobRegistry MobRegistry::WithDefaultArchetypes() {
    MobRegistry registry;
    for (const auto& def : kBuiltIns) {
        registry.RegisterArchetype(fromBuiltIn(def));
    }
    return registry;
}

void MobRegistry::RegisterArchetype(MobSpawnConfig config) {
    auto type = config.type;
    archetypes_.insert_or_assign(std::move(type), std::move(config));
}

const MobSpawnConfig* MobRegistry::FindArchetype(std::string_view type) const {
    auto it = archetypes_.find(type);
    return it != archetypes_.end() ? &it->second : nullptr;
}

GameResult<MobSpawnConfig> MobRegistry::GetArchetype(std::string_view type) const {
    if (const auto* cfg = FindArchetype(type)) {
        return GameResult<MobSpawnConfig>::ok(*cfg);
    }
    return GameResult<MobSpawnConfig>::err(
        GameError(ErrorCode::UnknownMobType, "unknown mob type: " + std::string(type)));
}

std::vector<std::string> MobRegistry::ArchetypeTypes() const {
    std::vector<std::string> types;
    types.reserve(archetypes_.size());
    for (const auto& [type, cfg] : archetypes_) {
        types.push_back(type);
    }
    return types;
}

void MobRegistry::AddArea(MobSpawnArea area) {
    areas_.push_back(std::move(area));
}

GameResult<void> MobRegistry::LoadFromYaml(const YAML::Node& root) {
    // Parse into temporaries so a bad document leaves the registry untouched.
    std::vector<MobSpawnConfig> parsedMobs;
    std::vector<MobSpawnArea> parsedAreas;
    try {
        if (const auto& mobs = root["mobs"]) {
            for (const auto& node : mobs) {
                auto type = node["type"].as<std::string>();
                const MobSpawnConfig* base = FindArchetype(type);
                for (const auto& earlier : parsedMobs) {
                    if (earlier.type == type) {
                        base = &earlier;
                    }
                }
                parsedMobs.push_back(parseArchetype(node, base));
            }
        }
        if (const auto& areas = root["areas"]) {
            for (const auto& node : areas) {
                parsedAreas.push_back(parseArea(node));
            }
        }
    } catch (const YAML::Exception& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("invalid mob data: ") + e.what()));
    }

    for (auto& cfg : parsedMobs) {
        RegisterArchetype(std::move(cfg));
    }
    for (auto& area : parsedAreas) {
        AddArea(std::move(area));
    }
    MSIM_LOG_INFO(LogCategory::Config,
                  "loaded " + std::to_string(parsedMobs.size()) + " mob archetypes and " +
                  std::to_string(parsedAreas.size()) + " spawn areas");
    return GameResult<void>::ok();
}

GameResult<void> MobRegistry::LoadFromFile(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open mob data: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return LoadFromYaml(root);
}

std::vector<SpawnPoint> MobRegistry::GenerateSpawnPoints(std::mt19937& rng) const {
    std::vector<SpawnPoint> points;
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    for (const auto& area : areas_) {
        const auto* cfg = FindArchetype(area.mobType);
        if (cfg == nullptr) {
            MSIM_LOG_WARN(LogCategory::Config,
                          "spawn area " + area.areaId + " references unknown mob type " +
                          area.mobType);
            continue;
        }

        for (uint32_t i = 0; i < area.maxCount; ++i) {
            const float angle = unit(rng) * 2.0f * std::numbers::pi_v<float>;
            const float distance = unit(rng) * area.spawnRadius;

            SpawnPoint point;
            point.id = area.areaId + "_spawn_" + std::to_string(i);
            point.areaId = area.areaId;
            point.config = *cfg;
            point.position = {area.center.x + std::cos(angle) * distance,
                              area.center.y,
                              area.center.z + std::sin(angle) * distance};
            points.push_back(std::move(point));
        }
    }
    return points;
}

}  // namespace msim::game
