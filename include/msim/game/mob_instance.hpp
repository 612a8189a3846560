#pragma once

/// @file mob_instance.hpp
/// @brief MobInstance: the authoritative per-mob record owned by MobSystem.

#include "msim/foundation/types.hpp"
#include "msim/game/math_types.hpp"
#include "msim/game/mob_types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

namespace msim::game {

/// One mob, alive or awaiting respawn.
///
/// Only MobSystem writes these fields. Other systems read copies through
/// the query API and affect mobs through events.
struct MobInstance {
    // ── Identity ─────────────────────────────────────────────────────
    foundation::MobId id;
    std::string type;
    std::string name;
    int32_t level = 1;

    // ── Spatial ──────────────────────────────────────────────────────
    Vector3 position;
    /// Chase anchor. Fixed for the lifetime of the mob.
    Vector3 homePosition;
    /// Respawn target. Fixed for the lifetime of the mob.
    Vector3 spawnLocation;
    float aggroRange = 5.0f;
    float wanderRadius = kDefaultWanderRadius;
    float moveSpeed = kDefaultMoveSpeed;

    // ── Vitals ───────────────────────────────────────────────────────
    int32_t health = 0;
    int32_t maxHealth = 0;
    bool isAlive = true;

    // ── Behavior ─────────────────────────────────────────────────────
    bool isAggressive = false;
    MobBehavior behavior;
    MobAIState aiState = MobAIState::Idle;
    /// Weak reference, resolved through the player directory every tick.
    std::optional<foundation::PlayerId> target;
    /// Simulation time (ms) of the last AI evaluation.
    int64_t lastAI = 0;
    /// Simulation time (ms) at which aiState last changed.
    int64_t stateEnteredAt = 0;
    /// Simulation time (ms) of the last patrol waypoint pick.
    int64_t lastPatrolPick = 0;
    std::optional<Vector3> patrolTarget;

    // ── Combat ───────────────────────────────────────────────────────
    MobEquipment equipment;
    MobStats stats;
    std::string lootTable;
    int64_t respawnTimeMs = kGlobalRespawnMs;
    int32_t xpReward = 0;
    RegistrationState registration = RegistrationState::Pending;

    /// Set health clamped to [0, maxHealth], keeping isAlive in step.
    void SetHealth(int32_t value) noexcept {
        health = std::clamp(value, static_cast<int32_t>(0), maxHealth);
        if (health == 0) {
            isAlive = false;
            aiState = MobAIState::Dead;
            target.reset();
            patrolTarget.reset();
        }
    }

    [[nodiscard]] float AttackRange() const noexcept { return equipment.AttackRange(); }

    /// True once the entity layer confirmed or the wait timed out.
    [[nodiscard]] bool CanEngage() const noexcept {
        return registration != RegistrationState::Pending;
    }
};

}  // namespace msim::game
