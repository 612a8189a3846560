/// @file combat_bridge.cpp
/// @brief CombatBridge and RegisteredEntityResolver.

#include "msim/game/combat_bridge.hpp"

#include "msim/foundation/game_logger.hpp"
#include "msim/game/player_directory.hpp"
#include "msim/game/world_entity_manager.hpp"

namespace msim::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::MobId;
using foundation::PlayerId;

// ── RegisteredEntityResolver ─────────────────────────────────────────

RegisteredEntityResolver::RegisteredEntityResolver(const WorldEntityManager& world,
                                                   const IPlayerDirectory& players)
    : world_(world), players_(players) {}

bool RegisteredEntityResolver::StartCombat(MobId attacker, PlayerId target,
                                           const CombatOptions& /*options*/) {
    if (!world_.Contains(attacker)) {
        return false;
    }
    auto player = players_.FindPlayer(target);
    return player.has_value() && player->position.has_value();
}

void RegisteredEntityResolver::StopCombat(MobId /*attacker*/) {}

// ── CombatBridge ─────────────────────────────────────────────────────

CombatBridge::CombatBridge(MobChannel& mobChannel, ICombatResolver* resolver)
    : mobChannel_(mobChannel), resolver_(resolver) {}

bool CombatBridge::StartCombat(MobId attacker, PlayerId target, const CombatOptions& options) {
    auto it = engagements_.find(attacker);
    if (it != engagements_.end()) {
        if (it->second == target) {
            return true;
        }
        StopCombat(attacker);
    }

    if (resolver_ == nullptr || !resolver_->StartCombat(attacker, target, options)) {
        LogContext ctx;
        ctx.entityId = attacker;
        ctx.playerId = target;
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Combat, "combat start refused", ctx);
        return false;
    }

    engagements_.emplace(attacker, target);
    mobChannel_.emit(CombatStartAttack{attacker, target});
    return true;
}

void CombatBridge::StopCombat(MobId attacker) {
    auto it = engagements_.find(attacker);
    if (it == engagements_.end()) {
        return;
    }

    auto target = it->second;
    engagements_.erase(it);
    if (resolver_ != nullptr) {
        resolver_->StopCombat(attacker);
    }
    mobChannel_.emit(CombatStopAttack{attacker, target});
}

std::optional<PlayerId> CombatBridge::EngagedTarget(MobId attacker) const {
    auto it = engagements_.find(attacker);
    if (it == engagements_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MobId> CombatBridge::AttackersOf(PlayerId target) const {
    std::vector<MobId> attackers;
    for (const auto& [attacker, engaged] : engagements_) {
        if (engaged == target) {
            attackers.push_back(attacker);
        }
    }
    return attackers;
}

}  // namespace msim::game
