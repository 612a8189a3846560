#pragma once

/// @file mob_types.hpp
/// @brief Enumerations, stat blocks and tuning constants for mobs.

#include <cstdint>
#include <string_view>

namespace msim::game {

// ═══════════════════════════════════════════════════════════════════════════
// State machine
// ═══════════════════════════════════════════════════════════════════════════

/// Behavior state of a mob. Dead is left only by respawn.
enum class MobAIState : uint8_t {
    Idle,
    Patrolling,
    Chasing,
    Attacking,
    Returning,
    Dead
};

constexpr std::string_view mobAIStateName(MobAIState state) {
    switch (state) {
        case MobAIState::Idle:       return "idle";
        case MobAIState::Patrolling: return "patrolling";
        case MobAIState::Chasing:    return "chasing";
        case MobAIState::Attacking:  return "attacking";
        case MobAIState::Returning:  return "returning";
        case MobAIState::Dead:       return "dead";
    }
    return "unknown";
}

/// Whether the world entity layer has confirmed the mob's entity.
enum class RegistrationState : uint8_t {
    Pending,    ///< Spawn request emitted, no confirmation yet
    Confirmed,  ///< MobSpawned received
    Degraded    ///< Confirmation timed out; the mob runs anyway
};

/// Result of ApplyDamage.
enum class DamageOutcome : uint8_t {
    Ignored,  ///< Unknown or already-dead mob, or non-positive amount
    Damaged,  ///< Health reduced, mob still alive
    Killed    ///< This hit took health to zero
};

// ═══════════════════════════════════════════════════════════════════════════
// Equipment and stats
// ═══════════════════════════════════════════════════════════════════════════

enum class WeaponStyle : uint8_t {
    Melee,
    Ranged
};

inline constexpr float kMeleeAttackRange = 2.0f;
inline constexpr float kRangedAttackRange = 8.0f;

/// Engagement distance for a weapon style.
constexpr float attackRangeFor(WeaponStyle style) {
    return style == WeaponStyle::Ranged ? kRangedAttackRange : kMeleeAttackRange;
}

/// Flat combat stats. Health is constitution * kHealthPerConstitution.
struct MobStats {
    int32_t level = 1;
    int32_t attack = 1;
    int32_t strength = 1;
    int32_t defense = 1;
    int32_t constitution = 10;
    int32_t ranged = 1;
};

inline constexpr int32_t kHealthPerConstitution = 10;

/// Weapon and armor only matter to the simulation through attack range.
struct MobEquipment {
    WeaponStyle weapon = WeaponStyle::Melee;
    int32_t armorBonus = 0;

    [[nodiscard]] constexpr float AttackRange() const noexcept {
        return attackRangeFor(weapon);
    }
};

/// Aggression parameters copied onto every mob at spawn.
struct MobBehavior {
    bool aggressive = false;
    float aggroRange = 5.0f;
    float chaseRange = 10.0f;
    bool returnToSpawn = true;
    /// Mobs below this level skip players above twice their level.
    int32_t levelIgnoreThreshold = 15;
};

// ═══════════════════════════════════════════════════════════════════════════
// Tuning
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr int64_t kAIUpdateIntervalMs = 1000;
inline constexpr float kMaxChaseDistance = 20.0f;
inline constexpr int64_t kGlobalRespawnMs = 15 * 60 * 1000;
inline constexpr int64_t kRegistrationTimeoutMs = 2000;
inline constexpr int64_t kPatrolIntervalMs = 3000;
inline constexpr int64_t kIdleBeforePatrolMs = 5000;

/// Target beyond attackRange * kAttackRangeSlack drops the mob back to chasing.
inline constexpr float kAttackRangeSlack = 1.5f;

/// Returning mobs become idle within this distance of home.
inline constexpr float kHomeArrivalDistance = 1.0f;

/// Patrolling mobs consider a waypoint reached within this distance.
inline constexpr float kWaypointArrivalDistance = 1.0f;

inline constexpr float kDefaultWanderRadius = 5.0f;
inline constexpr float kDefaultMoveSpeed = 3.0f;

}  // namespace msim::game
