/// @file mob_system.cpp
/// @brief MobSystem lifecycle: spawning, registration, damage, death, respawn.

#include "msim/game/mob_system.hpp"

#include "msim/foundation/config_manager.hpp"
#include "msim/foundation/game_logger.hpp"

#include <chrono>
#include <cmath>

namespace msim::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::MobId;
using foundation::PlayerId;

namespace {

void logMob(LogLevel level, LogCategory cat, const MobInstance& mob, const std::string& msg) {
    auto& logger = foundation::GameLogger::instance();
    if (!logger.isEnabled(level, cat)) {
        return;
    }
    LogContext ctx;
    ctx.entityId = mob.id;
    ctx.extra["type"] = mob.type;
    logger.logWithContext(level, cat, msg, ctx);
}

} // namespace

// ── Configuration ────────────────────────────────────────────────────

MobSystemConfig MobSystemConfig::FromConfig(const foundation::ConfigManager& config) {
    MobSystemConfig cfg;
    cfg.aiUpdateIntervalMs = config.getOr<int64_t>("mobs.ai_update_interval_ms", cfg.aiUpdateIntervalMs);
    cfg.maxChaseDistance = config.getOr<float>("mobs.max_chase_distance", cfg.maxChaseDistance);
    cfg.globalRespawnMs = config.getOr<int64_t>("mobs.global_respawn_ms", cfg.globalRespawnMs);
    cfg.registrationTimeoutMs =
        config.getOr<int64_t>("mobs.registration_timeout_ms", cfg.registrationTimeoutMs);
    cfg.patrolIntervalMs = config.getOr<int64_t>("mobs.patrol_interval_ms", cfg.patrolIntervalMs);
    cfg.idleBeforePatrolMs =
        config.getOr<int64_t>("mobs.idle_before_patrol_ms", cfg.idleBeforePatrolMs);
    cfg.seed = config.getOr<uint32_t>("mobs.seed", cfg.seed);
    cfg.bounds.minY = config.getOr<float>("world.min_y", cfg.bounds.minY);
    cfg.bounds.maxY = config.getOr<float>("world.max_y", cfg.bounds.maxY);

    if (cfg.aiUpdateIntervalMs <= 0) {
        MSIM_LOG_WARN(LogCategory::Config, "mobs.ai_update_interval_ms must be positive, using default");
        cfg.aiUpdateIntervalMs = kAIUpdateIntervalMs;
    }
    return cfg;
}

// ── Construction ─────────────────────────────────────────────────────

MobSystem::MobSystem(const MobRegistry& registry,
                     const IPlayerDirectory& players,
                     MobChannel& mobChannel,
                     WorldChannel& worldChannel,
                     CombatBridge& combat,
                     MobSystemConfig config)
    : registry_(registry),
      players_(players),
      mobChannel_(mobChannel),
      worldChannel_(worldChannel),
      combat_(combat),
      config_(config),
      rng_(config.seed) {
    worldSlot_ = worldChannel_.connect([this](const WorldEvent& event) { onWorldEvent(event); });
}

MobSystem::~MobSystem() {
    worldChannel_.disconnect(worldSlot_);
}

// ── Tick ─────────────────────────────────────────────────────────────

void MobSystem::Execute(float deltaTime) {
    if (deltaTime > 0.0f) {
        clockRemainderMs_ += static_cast<double>(deltaTime) * 1000.0;
        auto wholeMs = static_cast<int64_t>(std::floor(clockRemainderMs_ + 1e-6));
        clockRemainderMs_ -= static_cast<double>(wholeMs);
        nowMs_ += wholeMs;
    }

    for (auto& [id, record] : mobs_) {
        settleRegistration(record);
    }
    runAI();
    processRespawns();
}

// ── Population ───────────────────────────────────────────────────────

std::size_t MobSystem::PopulateSpawnPoints() {
    spawnPoints_ = registry_.GenerateSpawnPoints(rng_);

    std::size_t spawned = 0;
    for (const auto& point : spawnPoints_) {
        auto result = SpawnMob(point.config, point.position);
        if (!result) {
            MSIM_LOG_WARN(LogCategory::AI, "spawn point " + point.id + " skipped: " +
                                           std::string(result.error().message()));
            continue;
        }
        ++spawned;
    }
    MSIM_LOG_INFO(LogCategory::AI, "populated " + std::to_string(spawned) + " of " +
                                   std::to_string(spawnPoints_.size()) + " spawn points");
    return spawned;
}

GameResult<MobId> MobSystem::SpawnMob(const MobSpawnConfig& config, const Vector3& position) {
    if (config.type.empty()) {
        return GameResult<MobId>::err(
            GameError(ErrorCode::InvalidArgument, "mob config has no type"));
    }
    if (config.MaxHealth() <= 0) {
        return GameResult<MobId>::err(
            GameError(ErrorCode::InvalidArgument,
                      "mob type " + config.type + " has no health (constitution " +
                      std::to_string(config.stats.constitution) + ")"));
    }
    if (!IsFinite(position)) {
        return GameResult<MobId>::err(
            GameError(ErrorCode::InvalidPosition,
                      "spawn position for " + config.type + " is not finite", position));
    }
    if (!config_.bounds.ContainsY(position.y)) {
        return GameResult<MobId>::err(
            GameError(ErrorCode::PositionOutOfBounds,
                      "spawn Y " + std::to_string(position.y) + " for " + config.type +
                      " is outside the world", position));
    }

    MobInstance mob;
    mob.id = GenerateEntityId();
    mob.type = config.type;
    mob.name = config.name.empty() ? config.type : config.name;
    mob.level = config.stats.level;
    mob.position = position;
    mob.homePosition = position;
    mob.spawnLocation = position;
    mob.aggroRange = config.behavior.aggroRange;
    mob.wanderRadius = config.wanderRadius;
    mob.moveSpeed = config.moveSpeed;
    mob.maxHealth = config.MaxHealth();
    mob.health = mob.maxHealth;
    mob.isAlive = true;
    mob.isAggressive = config.behavior.aggressive;
    mob.behavior = config.behavior;
    mob.aiState = MobAIState::Idle;
    mob.lastAI = nowMs_;
    mob.stateEnteredAt = nowMs_;
    mob.lastPatrolPick = nowMs_;
    mob.equipment = config.equipment;
    mob.stats = config.stats;
    mob.lootTable = config.lootTable;
    mob.respawnTimeMs = config.respawnTimeMs > 0 ? config.respawnTimeMs : config_.globalRespawnMs;
    mob.xpReward = config.xpReward;

    auto id = mob.id;
    auto& record = mobs_.try_emplace(id).first->second;
    record.mob = std::move(mob);

    beginRegistration(record);
    logMob(LogLevel::Info, LogCategory::AI, record.mob, "mob spawned");
    emitSpawnRequest(record.mob);

    // The entity layer may have confirmed synchronously.
    if (auto* current = find(id)) {
        settleRegistration(*current);
    }
    return GameResult<MobId>::ok(id);
}

GameResult<MobId> MobSystem::SpawnMobOfType(std::string_view type, const Vector3& position) {
    auto archetype = registry_.GetArchetype(type);
    if (!archetype) {
        MSIM_LOG_ERROR(LogCategory::Config, std::string(archetype.error().message()));
        return GameResult<MobId>::err(archetype.error());
    }
    return SpawnMob(archetype.value(), position);
}

bool MobSystem::DespawnMob(MobId id) {
    auto* record = find(id);
    if (record == nullptr || !record->mob.isAlive) {
        return false;
    }

    MobDespawn event{id, record->mob.type, record->mob.position};
    respawns_.Cancel(id);
    mobs_.erase(id);
    combat_.StopCombat(id);

    MSIM_LOG_INFO(LogCategory::AI, "mob " + foundation::toString(id) + " despawned");
    mobChannel_.emit(event);
    return true;
}

std::size_t MobSystem::DespawnAllMobs() {
    std::vector<MobId> ids;
    ids.reserve(mobs_.size());
    for (const auto& [id, record] : mobs_) {
        ids.push_back(id);
    }

    std::size_t despawned = 0;
    for (auto id : ids) {
        if (DespawnMob(id)) {
            ++despawned;
        }
    }

    // Whatever is left is dead and waiting to respawn.
    for (const auto& [id, record] : mobs_) {
        respawns_.Cancel(id);
    }
    mobs_.clear();
    return despawned;
}

bool MobSystem::KillMob(MobId id) {
    auto* record = find(id);
    if (record == nullptr || !record->mob.isAlive) {
        return false;
    }
    killInternal(*record, std::nullopt, false);
    return true;
}

DamageOutcome MobSystem::ApplyDamage(MobId id, int32_t amount, std::optional<PlayerId> source) {
    auto* record = find(id);
    if (record == nullptr || !record->mob.isAlive || amount <= 0) {
        return DamageOutcome::Ignored;
    }

    auto& mob = record->mob;
    mob.SetHealth(mob.health - amount);

    auto& logger = foundation::GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        LogContext ctx;
        ctx.entityId = id;
        if (source) {
            ctx.playerId = *source;
        }
        ctx.extra["damage"] = std::to_string(amount);
        ctx.extra["health"] = std::to_string(mob.health);
        logger.logWithContext(LogLevel::Debug, LogCategory::Combat, "mob damaged", ctx);
    }

    if (mob.health == 0) {
        // SetHealth already moved the mob to Dead; finish the death path.
        killInternal(*record, source, true);
        return DamageOutcome::Killed;
    }

    if (source && (mob.aiState == MobAIState::Idle || mob.aiState == MobAIState::Patrolling)) {
        auto attacker = players_.FindPlayer(*source);
        if (attacker && attacker->position) {
            mob.target = *source;
            mob.patrolTarget.reset();
            setState(mob, MobAIState::Chasing);
        }
    }
    return DamageOutcome::Damaged;
}

// ── Queries ──────────────────────────────────────────────────────────

std::vector<MobInstance> MobSystem::GetAllMobs() const {
    std::vector<MobInstance> result;
    result.reserve(mobs_.size());
    for (const auto& [id, record] : mobs_) {
        result.push_back(record.mob);
    }
    return result;
}

std::optional<MobInstance> MobSystem::GetMob(MobId id) const {
    const auto* record = find(id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->mob;
}

std::vector<MobInstance> MobSystem::GetMobsInArea(const Vector3& center, float radius) const {
    std::vector<MobInstance> result;
    for (const auto& [id, record] : mobs_) {
        if (record.mob.isAlive && Distance(record.mob.position, center) <= radius) {
            result.push_back(record.mob);
        }
    }
    return result;
}

std::optional<std::shared_future<RegistrationState>> MobSystem::GetRegistration(MobId id) const {
    const auto* record = find(id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->registrationFuture;
}

std::size_t MobSystem::AliveCount() const {
    std::size_t alive = 0;
    for (const auto& [id, record] : mobs_) {
        if (record.mob.isAlive) {
            ++alive;
        }
    }
    return alive;
}

// ── Registration ─────────────────────────────────────────────────────

void MobSystem::beginRegistration(MobRecord& record) {
    // Futures handed out for the previous life resolve instead of breaking.
    if (record.registrationFuture.valid() && !record.registrationSettled) {
        record.registration.set_value(RegistrationState::Degraded);
    }
    record.registration = std::promise<RegistrationState>();
    record.registrationFuture = record.registration.get_future().share();
    record.registrationSettled = false;
    record.registrationDeadline = nowMs_ + config_.registrationTimeoutMs;
    record.mob.registration = RegistrationState::Pending;
}

void MobSystem::settleRegistration(MobRecord& record) {
    auto& mob = record.mob;
    if (!mob.isAlive || mob.registration != RegistrationState::Pending) {
        return;
    }

    using namespace std::chrono_literals;
    if (record.registrationFuture.wait_for(0ms) == std::future_status::ready) {
        mob.registration = record.registrationFuture.get();
        return;
    }

    if (nowMs_ >= record.registrationDeadline) {
        record.registration.set_value(RegistrationState::Degraded);
        record.registrationSettled = true;
        mob.registration = RegistrationState::Degraded;
        logMob(LogLevel::Warning, LogCategory::AI, mob,
               "entity registration timed out, running degraded");
    }
}

// ── World events ─────────────────────────────────────────────────────

void MobSystem::onWorldEvent(const WorldEvent& event) {
    if (const auto* spawned = std::get_if<MobSpawned>(&event)) {
        auto* record = find(spawned->mobId);
        if (record == nullptr) {
            return;
        }
        if (!record->registrationSettled) {
            record->registration.set_value(RegistrationState::Confirmed);
            record->registrationSettled = true;
        } else if (record->mob.registration == RegistrationState::Degraded) {
            record->mob.registration = RegistrationState::Confirmed;
            logMob(LogLevel::Info, LogCategory::AI, record->mob, "late entity registration");
        }
    } else if (const auto* damaged = std::get_if<MobDamaged>(&event)) {
        ApplyDamage(damaged->mobId, damaged->damage, damaged->sourceId);
    }
}

// ── Death and respawn ────────────────────────────────────────────────

void MobSystem::killInternal(MobRecord& record, std::optional<PlayerId> killer, bool dropsLoot) {
    auto& mob = record.mob;
    const MobId id = mob.id;

    mob.SetHealth(0);
    setState(mob, MobAIState::Dead);
    respawns_.Schedule(id, nowMs_ + mob.respawnTimeMs);

    LogContext ctx;
    ctx.entityId = id;
    if (killer) {
        ctx.playerId = *killer;
    }
    ctx.extra["respawn_in_ms"] = std::to_string(mob.respawnTimeMs);
    foundation::GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Combat,
                                                      "mob died", ctx);

    MobDied died{id, killer, mob.position, mob.type, mob.lootTable, mob.xpReward, dropsLoot};

    // `record` is not used past this point: stop-attack subscribers may
    // remove the mob.
    combat_.StopCombat(id);
    mobChannel_.emit(died);
}

void MobSystem::processRespawns() {
    for (auto id : respawns_.PopDue(nowMs_)) {
        auto* record = find(id);
        if (record == nullptr || record->mob.isAlive) {
            continue;
        }
        respawn(*record);
    }
}

void MobSystem::respawn(MobRecord& record) {
    auto& mob = record.mob;
    mob.health = mob.maxHealth;
    mob.isAlive = true;
    mob.position = mob.spawnLocation;
    mob.target.reset();
    mob.patrolTarget.reset();
    mob.aiState = MobAIState::Idle;
    mob.stateEnteredAt = nowMs_;
    mob.lastAI = nowMs_;
    mob.lastPatrolPick = nowMs_;

    beginRegistration(record);
    logMob(LogLevel::Info, LogCategory::AI, mob, "mob respawned");

    auto id = mob.id;
    emitSpawnRequest(mob);
    if (auto* current = find(id)) {
        settleRegistration(*current);
    }
}

void MobSystem::emitSpawnRequest(const MobInstance& mob) {
    mobChannel_.emit(MobSpawnRequest{mob.id, mob.type, mob.name, mob.position, mob.level});
}

MobSystem::MobRecord* MobSystem::find(MobId id) {
    auto it = mobs_.find(id);
    return it != mobs_.end() ? &it->second : nullptr;
}

const MobSystem::MobRecord* MobSystem::find(MobId id) const {
    auto it = mobs_.find(id);
    return it != mobs_.end() ? &it->second : nullptr;
}

}  // namespace msim::game
