#pragma once

/// @file mob_world.hpp
/// @brief MobWorld: host that wires the mob simulation to a world and a loop.
///
/// MobWorld owns the event channels, the connected-player registry, the
/// world entity layer, the mob registry and MobSystem, the combat and loot
/// bridges, and a GameLoop. Systems run in stage order every tick.

#include "msim/foundation/game_result.hpp"
#include "msim/foundation/types.hpp"
#include "msim/game/mob_system.hpp"
#include "msim/game/player_directory.hpp"
#include "msim/service/game_loop.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace msim::foundation {
class ConfigManager;
}

namespace msim::game {
class CombatBridge;
class WorldEntityManager;
}

namespace msim::service {

struct MobWorldConfig {
    uint32_t tickRate = 20;
    /// YAML with `mobs` and `areas`. Empty uses the built-in archetypes only.
    std::filesystem::path mobDataFile;
    /// Spawn one mob per generated spawn point during initialize().
    bool populateOnStart = true;
    game::MobSystemConfig mobs;

    /// Read `server.tick_rate`, `mobs.data_file`, `mobs.populate_on_start`
    /// and the MobSystemConfig keys. A relative data file resolves against
    /// the directory of the loaded config file.
    [[nodiscard]] static MobWorldConfig FromConfig(const foundation::ConfigManager& config);
};

struct MobWorldStats {
    uint64_t totalTicks = 0;
    uint64_t overruns = 0;
    float lastUpdateTimeMs = 0.0f;
    std::size_t mobCount = 0;
    std::size_t aliveMobs = 0;
    std::size_t pendingRespawns = 0;
    std::size_t entityCount = 0;
    std::size_t playerCount = 0;
    std::size_t engagements = 0;
    uint64_t lootDrops = 0;
    std::size_t lastReplicated = 0;
};

/// @code
///   MobWorld world(MobWorldConfig::FromConfig(config));
///   if (auto r = world.initialize(); !r) { ... }
///   world.upsertPlayer({PlayerId(1), Vector3{3, 0, 0}, 5, 10});
///   world.tick();          // manual, for tests
///   world.start();         // or on the loop thread
/// @endcode
class MobWorld {
public:
    explicit MobWorld(MobWorldConfig config);
    ~MobWorld();

    MobWorld(const MobWorld&) = delete;
    MobWorld& operator=(const MobWorld&) = delete;

    /// Load mob data and populate spawn points. Call once before ticking.
    [[nodiscard]] foundation::GameResult<void> initialize();

    /// Run the loop on its own thread.
    [[nodiscard]] foundation::GameResult<void> start();
    void stop();
    [[nodiscard]] bool isRunning() const noexcept;

    /// Run one tick on the calling thread. Only valid while not started.
    TickMetrics tick();

    // ── Players ──────────────────────────────────────────────────────

    void upsertPlayer(const game::PlayerView& player);
    bool removePlayer(foundation::PlayerId id);
    bool movePlayer(foundation::PlayerId id, const game::Vector3& position);

    // ── Mobs ─────────────────────────────────────────────────────────
    //
    // Serialized with the loop thread; safe while started. Channel
    // subscribers run under the same lock and must not call back into
    // these.

    [[nodiscard]] foundation::GameResult<foundation::MobId>
    spawnMob(std::string_view type, const game::Vector3& position);
    bool despawnMob(foundation::MobId id);
    bool killMob(foundation::MobId id);
    game::DamageOutcome applyDamage(foundation::MobId id, int32_t amount,
                                    std::optional<foundation::PlayerId> source = std::nullopt);
    [[nodiscard]] std::optional<game::MobInstance> getMob(foundation::MobId id) const;

    // ── Direct access ────────────────────────────────────────────────
    //
    // Unsynchronized. Use only while the loop is stopped, driving it with
    // tick() from the same thread, or from a channel subscriber.

    [[nodiscard]] game::MobSystem& mobs();
    [[nodiscard]] game::WorldEntityManager& entities();
    [[nodiscard]] game::CombatBridge& combat();
    [[nodiscard]] game::MobRegistry& registry();
    [[nodiscard]] game::MobChannel& mobChannel();
    [[nodiscard]] game::WorldChannel& worldChannel();

    [[nodiscard]] MobWorldStats stats() const;
    [[nodiscard]] const MobWorldConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace msim::service
