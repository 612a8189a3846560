#pragma once

/// @file mob_system.hpp
/// @brief MobSystem: mob table, AI state machine, damage and respawn.
///
/// MobSystem owns every MobInstance. Once per AI interval it evaluates each
/// live mob's state machine against the connected players, moves the mob
/// toward its current intent, and publishes the results on the mob channel.
/// Damage arrives through ApplyDamage or MobDamaged events; deaths schedule a
/// respawn that is processed after the AI pass of the tick it falls due in.
///
/// Time is a simulation clock advanced by Execute(deltaTime), so a run is
/// reproducible for a given sequence of ticks and a given seed.

#include "msim/ecs/system.hpp"
#include "msim/foundation/game_result.hpp"
#include "msim/foundation/types.hpp"
#include "msim/game/combat_bridge.hpp"
#include "msim/game/mob_events.hpp"
#include "msim/game/mob_instance.hpp"
#include "msim/game/mob_registry.hpp"
#include "msim/game/player_directory.hpp"
#include "msim/game/respawn_scheduler.hpp"
#include "msim/game/world_types.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace msim::foundation {
class ConfigManager;
}

namespace msim::game {

/// Tunables of the mob simulation. Defaults match the shipped game.
struct MobSystemConfig {
    int64_t aiUpdateIntervalMs = kAIUpdateIntervalMs;
    /// Leash: a chasing mob farther than this from home gives up.
    float maxChaseDistance = kMaxChaseDistance;
    /// Respawn delay for archetypes that do not set their own.
    int64_t globalRespawnMs = kGlobalRespawnMs;
    /// Wait for MobSpawned before a mob runs degraded.
    int64_t registrationTimeoutMs = kRegistrationTimeoutMs;
    int64_t patrolIntervalMs = kPatrolIntervalMs;
    int64_t idleBeforePatrolMs = kIdleBeforePatrolMs;
    WorldBounds bounds;
    uint32_t seed = 0x6d6f62u;

    /// Read the `mobs.*` and `world.*` keys, keeping defaults for missing ones.
    [[nodiscard]] static MobSystemConfig FromConfig(const foundation::ConfigManager& config);
};

class MobSystem final : public ecs::ISystem {
public:
    MobSystem(const MobRegistry& registry,
              const IPlayerDirectory& players,
              MobChannel& mobChannel,
              WorldChannel& worldChannel,
              CombatBridge& combat,
              MobSystemConfig config = {});
    ~MobSystem() override;

    MobSystem(const MobSystem&) = delete;
    MobSystem& operator=(const MobSystem&) = delete;

    // ── ISystem ──────────────────────────────────────────────────────

    /// Advance the clock, settle registrations, run the AI pass for mobs
    /// whose interval elapsed, then process due respawns.
    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override { return ecs::SystemStage::Update; }
    [[nodiscard]] std::string_view GetName() const override { return "MobSystem"; }

    // ── Population ───────────────────────────────────────────────────

    /// Generate spawn points from the registry's areas and spawn one mob
    /// per point. Returns the number of mobs spawned.
    std::size_t PopulateSpawnPoints();

    /// Spawn a mob from @p config at @p position and request its entity.
    ///
    /// @return InvalidArgument for an unusable config, InvalidPosition for
    ///         non-finite coordinates, PositionOutOfBounds outside the world.
    [[nodiscard]] foundation::GameResult<foundation::MobId>
    SpawnMob(const MobSpawnConfig& config, const Vector3& position);

    /// Spawn a registered archetype. Unknown types return UnknownMobType
    /// and are logged.
    [[nodiscard]] foundation::GameResult<foundation::MobId>
    SpawnMobOfType(std::string_view type, const Vector3& position);

    /// Remove a live mob at once: no loot, no respawn. False for unknown
    /// or dead mobs.
    bool DespawnMob(foundation::MobId id);

    /// Despawn every live mob and forget the dead ones with their pending
    /// respawns. Returns the number of live mobs despawned.
    std::size_t DespawnAllMobs();

    /// Force a live mob to die without loot. Its respawn is still scheduled.
    bool KillMob(foundation::MobId id);

    /// Apply @p amount damage. Killing blows emit MobDied exactly once.
    /// A non-lethal hit from a player makes an idle or patrolling mob chase
    /// the attacker.
    DamageOutcome ApplyDamage(foundation::MobId id, int32_t amount,
                              std::optional<foundation::PlayerId> source = std::nullopt);

    // ── Queries ──────────────────────────────────────────────────────

    /// Every mob in the table, dead ones included, in table order.
    [[nodiscard]] std::vector<MobInstance> GetAllMobs() const;

    [[nodiscard]] std::optional<MobInstance> GetMob(foundation::MobId id) const;

    /// Live mobs within @p radius of @p center.
    [[nodiscard]] std::vector<MobInstance> GetMobsInArea(const Vector3& center, float radius) const;

    /// Registration of the mob's current lifecycle, or nullopt for unknown ids.
    [[nodiscard]] std::optional<std::shared_future<RegistrationState>>
    GetRegistration(foundation::MobId id) const;

    [[nodiscard]] std::size_t MobCount() const noexcept { return mobs_.size(); }
    [[nodiscard]] std::size_t AliveCount() const;

    [[nodiscard]] const std::vector<SpawnPoint>& SpawnPoints() const noexcept { return spawnPoints_; }
    [[nodiscard]] const RespawnScheduler& Respawns() const noexcept { return respawns_; }
    [[nodiscard]] const MobSystemConfig& Config() const noexcept { return config_; }

    /// Simulation time in ms.
    [[nodiscard]] int64_t NowMs() const noexcept { return nowMs_; }

    /// Mobs evaluated by the last AI pass.
    [[nodiscard]] uint32_t GetLastAIUpdateCount() const noexcept { return lastAIUpdateCount_; }

private:
    struct MobRecord {
        MobInstance mob;
        std::promise<RegistrationState> registration;
        std::shared_future<RegistrationState> registrationFuture;
        bool registrationSettled = false;
        int64_t registrationDeadline = 0;
    };

    // mob_system.cpp
    void onWorldEvent(const WorldEvent& event);
    void beginRegistration(MobRecord& record);
    void settleRegistration(MobRecord& record);
    void processRespawns();
    void respawn(MobRecord& record);
    void killInternal(MobRecord& record, std::optional<foundation::PlayerId> killer, bool dropsLoot);
    void emitSpawnRequest(const MobInstance& mob);
    MobRecord* find(foundation::MobId id);
    const MobRecord* find(foundation::MobId id) const;
    /// The mob if it is still in the table and alive. Used to re-check a
    /// mob after anything that emits on the mob channel.
    MobInstance* liveMob(foundation::MobId id);

    // mob_ai.cpp
    void runAI();
    void evaluate(foundation::MobId id, const std::vector<PlayerView>& players, int64_t elapsedMs);
    void evaluateIdle(MobInstance& mob, const std::vector<PlayerView>& players);
    void evaluatePatrolling(MobInstance& mob, const std::vector<PlayerView>& players);
    bool evaluateChasing(MobInstance& mob);
    bool evaluateAttacking(MobInstance& mob);
    void evaluateReturning(MobInstance& mob);
    bool applyMovement(MobInstance& mob, int64_t elapsedMs);
    [[nodiscard]] std::optional<PlayerView>
    findNearbyPlayer(const MobInstance& mob, const std::vector<PlayerView>& players) const;
    [[nodiscard]] std::optional<PlayerView> resolveTarget(const MobInstance& mob) const;
    void setState(MobInstance& mob, MobAIState state);
    void dropTarget(MobInstance& mob, MobAIState next);
    [[nodiscard]] Vector3 pickPatrolPoint(const MobInstance& mob);

    const MobRegistry& registry_;
    const IPlayerDirectory& players_;
    MobChannel& mobChannel_;
    WorldChannel& worldChannel_;
    CombatBridge& combat_;
    MobSystemConfig config_;
    foundation::Signal<const WorldEvent&>::SlotId worldSlot_ = 0;

    /// Ascending id order, which is spawn order.
    std::map<foundation::MobId, MobRecord> mobs_;
    std::vector<SpawnPoint> spawnPoints_;
    RespawnScheduler respawns_;
    std::mt19937 rng_;

    int64_t nowMs_ = 0;
    double clockRemainderMs_ = 0.0;
    uint32_t lastAIUpdateCount_ = 0;
};

}  // namespace msim::game
