/// @file mob_ai.cpp
/// @brief Mob state machine, perception and movement.
///
/// Each live mob is evaluated at most once per AI interval: exactly one
/// state handler runs, then the mob moves toward the intent of the state it
/// ended in (chase target, patrol waypoint or home).

#include "msim/game/mob_system.hpp"

#include "msim/foundation/game_logger.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace msim::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::MobId;

namespace {

// Chasing mobs stop a little inside attack range instead of on the target.
constexpr float kChaseStandOffFactor = 0.8f;

void warnSkipped(const MobInstance& mob, std::string_view reason) {
    LogContext ctx;
    ctx.entityId = mob.id;
    ctx.extra["state"] = std::string(mobAIStateName(mob.aiState));
    if (mob.target) {
        ctx.playerId = *mob.target;
    }
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Warning, LogCategory::AI,
        "AI evaluation skipped: " + std::string(reason), ctx);
}

} // namespace

void MobSystem::runAI() {
    const auto players = players_.ConnectedPlayers();

    std::vector<MobId> ids;
    ids.reserve(mobs_.size());
    for (const auto& [id, record] : mobs_) {
        ids.push_back(id);
    }

    uint32_t updated = 0;
    for (auto id : ids) {
        auto* record = find(id);
        if (record == nullptr || !record->mob.isAlive) {
            continue;
        }

        auto& mob = record->mob;
        const int64_t elapsed = nowMs_ - mob.lastAI;
        if (elapsed < config_.aiUpdateIntervalMs) {
            continue;
        }
        mob.lastAI = nowMs_;

        evaluate(id, players, elapsed);
        ++updated;
    }
    lastAIUpdateCount_ = updated;
}

void MobSystem::evaluate(MobId id, const std::vector<PlayerView>& players, int64_t elapsedMs) {
    auto* live = liveMob(id);
    if (live == nullptr) {
        return;
    }

    auto& mob = *live;
    if (!IsFinite(mob.position)) {
        warnSkipped(mob, "mob position is not finite");
        return;
    }

    bool valid = true;
    switch (mob.aiState) {
        case MobAIState::Idle:
            evaluateIdle(mob, players);
            break;
        case MobAIState::Patrolling:
            evaluatePatrolling(mob, players);
            break;
        case MobAIState::Chasing:
            valid = evaluateChasing(mob);
            break;
        case MobAIState::Attacking:
            valid = evaluateAttacking(mob);
            break;
        case MobAIState::Returning:
            evaluateReturning(mob);
            break;
        case MobAIState::Dead:
            return;
    }
    if (!valid) {
        return;
    }

    // Combat intents are delivered synchronously; a subscriber may have
    // killed or despawned the mob while the handler ran.
    live = liveMob(id);
    if (live == nullptr) {
        return;
    }
    if (applyMovement(*live, elapsedMs)) {
        mobChannel_.emit(MobPositionUpdated{id, live->position, live->aiState});
    }
}

// ── State handlers ───────────────────────────────────────────────────

void MobSystem::evaluateIdle(MobInstance& mob, const std::vector<PlayerView>& players) {
    if (mob.isAggressive) {
        if (auto player = findNearbyPlayer(mob, players)) {
            mob.target = player->id;
            setState(mob, MobAIState::Chasing);
            return;
        }
    }

    if (mob.wanderRadius > 0.0f && nowMs_ - mob.stateEnteredAt >= config_.idleBeforePatrolMs) {
        mob.patrolTarget = pickPatrolPoint(mob);
        mob.lastPatrolPick = nowMs_;
        setState(mob, MobAIState::Patrolling);
    }
}

void MobSystem::evaluatePatrolling(MobInstance& mob, const std::vector<PlayerView>& players) {
    if (mob.isAggressive) {
        if (auto player = findNearbyPlayer(mob, players)) {
            mob.target = player->id;
            mob.patrolTarget.reset();
            setState(mob, MobAIState::Chasing);
            return;
        }
    }

    if (!mob.patrolTarget || nowMs_ - mob.lastPatrolPick >= config_.patrolIntervalMs) {
        mob.patrolTarget = pickPatrolPoint(mob);
        mob.lastPatrolPick = nowMs_;
        return;
    }

    if (Distance(mob.position, *mob.patrolTarget) < kWaypointArrivalDistance) {
        mob.patrolTarget.reset();
        setState(mob, MobAIState::Idle);
    }
}

bool MobSystem::evaluateChasing(MobInstance& mob) {
    auto target = resolveTarget(mob);
    if (!target || target->health <= 0) {
        dropTarget(mob, MobAIState::Returning);
        return true;
    }

    const Vector3 targetPos = *target->position;
    if (!IsFinite(targetPos)) {
        warnSkipped(mob, "target position is not finite");
        return false;
    }

    // Leash: both the mob and its target must stay within reach of home.
    if (Distance(mob.position, mob.homePosition) > config_.maxChaseDistance ||
        Distance(targetPos, mob.homePosition) > config_.maxChaseDistance) {
        dropTarget(mob, MobAIState::Returning);
        return true;
    }

    if (Distance(mob.position, targetPos) <= mob.AttackRange()) {
        if (!mob.CanEngage()) {
            return true;
        }
        const MobId id = mob.id;
        CombatOptions options{mob.equipment.weapon, mob.AttackRange()};
        const bool engaged = combat_.StartCombat(id, target->id, options);

        // `mob` may be dangling from here on.
        auto* live = liveMob(id);
        if (live == nullptr) {
            if (engaged) {
                combat_.StopCombat(id);
            }
            return false;
        }
        if (engaged) {
            setState(*live, MobAIState::Attacking);
        }
    }
    return true;
}

bool MobSystem::evaluateAttacking(MobInstance& mob) {
    auto target = resolveTarget(mob);
    if (!target || target->health <= 0) {
        dropTarget(mob, MobAIState::Idle);
        return true;
    }

    const Vector3 targetPos = *target->position;
    if (!IsFinite(targetPos)) {
        warnSkipped(mob, "target position is not finite");
        return false;
    }

    if (Distance(mob.position, targetPos) > mob.AttackRange() * kAttackRangeSlack) {
        setState(mob, MobAIState::Chasing);
        combat_.StopCombat(mob.id);
    }
    return true;
}

void MobSystem::evaluateReturning(MobInstance& mob) {
    if (Distance(mob.position, mob.homePosition) <= kHomeArrivalDistance) {
        setState(mob, MobAIState::Idle);
    }
}

// ── Movement ─────────────────────────────────────────────────────────

bool MobSystem::applyMovement(MobInstance& mob, int64_t elapsedMs) {
    float step = mob.moveSpeed * static_cast<float>(elapsedMs) / 1000.0f;
    if (step <= 0.0f) {
        return false;
    }

    std::optional<Vector3> goal;
    float standOff = 0.0f;
    switch (mob.aiState) {
        case MobAIState::Chasing:
            if (auto target = resolveTarget(mob); target && IsFinite(*target->position)) {
                goal = *target->position;
                standOff = mob.AttackRange() * kChaseStandOffFactor;
            }
            break;
        case MobAIState::Returning:
            goal = mob.homePosition;
            break;
        case MobAIState::Patrolling:
            goal = mob.patrolTarget;
            break;
        default:
            break;
    }
    if (!goal) {
        return false;
    }

    if (standOff > 0.0f) {
        const float dist = Distance(mob.position, *goal);
        if (dist <= standOff) {
            return false;
        }
        step = std::min(step, dist - standOff);
    }

    const Vector3 next = MoveTowards(mob.position, *goal, step);
    if (next == mob.position) {
        return false;
    }
    mob.position = next;
    return true;
}

// ── Perception ───────────────────────────────────────────────────────

std::optional<PlayerView> MobSystem::findNearbyPlayer(const MobInstance& mob,
                                                      const std::vector<PlayerView>& players) const {
    const bool ignoresLevelGate = IsAlwaysAggressive(mob.type);

    std::optional<PlayerView> nearest;
    float nearestDistance = 0.0f;
    for (const auto& player : players) {
        if (!player.position || !IsFinite(*player.position) || player.health <= 0) {
            continue;
        }

        const float dist = Distance(mob.position, *player.position);
        if (dist > mob.aggroRange) {
            continue;
        }

        // Low-level mobs leave much stronger players alone.
        if (!ignoresLevelGate && mob.level < mob.behavior.levelIgnoreThreshold &&
            player.combatLevel > mob.level * 2) {
            continue;
        }

        if (!nearest || dist < nearestDistance) {
            nearest = player;
            nearestDistance = dist;
        }
    }
    return nearest;
}

std::optional<PlayerView> MobSystem::resolveTarget(const MobInstance& mob) const {
    if (!mob.target) {
        return std::nullopt;
    }
    auto player = players_.FindPlayer(*mob.target);
    if (!player || !player->position) {
        return std::nullopt;
    }
    return player;
}

// ── Helpers ──────────────────────────────────────────────────────────

void MobSystem::setState(MobInstance& mob, MobAIState state) {
    if (mob.aiState == state) {
        return;
    }

    auto& logger = foundation::GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::AI)) {
        LogContext ctx;
        ctx.entityId = mob.id;
        if (mob.target) {
            ctx.playerId = *mob.target;
        }
        ctx.extra["from"] = std::string(mobAIStateName(mob.aiState));
        ctx.extra["to"] = std::string(mobAIStateName(state));
        logger.logWithContext(LogLevel::Debug, LogCategory::AI, "state change", ctx);
    }

    mob.aiState = state;
    mob.stateEnteredAt = nowMs_;
}

void MobSystem::dropTarget(MobInstance& mob, MobAIState next) {
    const MobId id = mob.id;
    mob.target.reset();
    setState(mob, next);
    // Last: the stop intent may reach a subscriber that removes the mob.
    combat_.StopCombat(id);
}

MobInstance* MobSystem::liveMob(MobId id) {
    auto* record = find(id);
    if (record == nullptr || !record->mob.isAlive) {
        return nullptr;
    }
    return &record->mob;
}

Vector3 MobSystem::pickPatrolPoint(const MobInstance& mob) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const float angle = unit(rng_) * 2.0f * std::numbers::pi_v<float>;
    const float distance = unit(rng_) * mob.wanderRadius;
    return {mob.homePosition.x + std::cos(angle) * distance,
            mob.homePosition.y,
            mob.homePosition.z + std::sin(angle) * distance};
}

}  // namespace msim::game
