#pragma once

/// @file combat_bridge.hpp
/// @brief Engagement handshake between mob AI and the external combat resolver.

#include "msim/foundation/types.hpp"
#include "msim/game/mob_events.hpp"
#include "msim/game/mob_types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace msim::game {

class IPlayerDirectory;
class WorldEntityManager;

struct CombatOptions {
    WeaponStyle style = WeaponStyle::Melee;
    float attackRange = kMeleeAttackRange;
};

/// Resolves hits and damage. The mob simulation only asks it to begin or
/// end an engagement.
class ICombatResolver {
public:
    virtual ~ICombatResolver() = default;

    /// Begin an engagement. False when a precondition fails, such as either
    /// side not being registered yet.
    virtual bool StartCombat(foundation::MobId attacker, foundation::PlayerId target,
                             const CombatOptions& options) = 0;

    virtual void StopCombat(foundation::MobId attacker) = 0;
};

/// Accepts an engagement once the attacker has a world entity and the
/// target is connected with a position.
class RegisteredEntityResolver final : public ICombatResolver {
public:
    RegisteredEntityResolver(const WorldEntityManager& world, const IPlayerDirectory& players);

    bool StartCombat(foundation::MobId attacker, foundation::PlayerId target,
                     const CombatOptions& options) override;
    void StopCombat(foundation::MobId attacker) override;

private:
    const WorldEntityManager& world_;
    const IPlayerDirectory& players_;
};

/// Tracks which mob is engaged with which player and publishes the
/// CombatStartAttack / CombatStopAttack intents.
///
/// Several mobs may engage the same player; the resolver aggregates them.
/// A mob engages at most one player at a time.
class CombatBridge {
public:
    explicit CombatBridge(MobChannel& mobChannel, ICombatResolver* resolver = nullptr);

    /// The resolver is not owned and must outlive the bridge.
    void SetResolver(ICombatResolver* resolver) noexcept { resolver_ = resolver; }

    /// Ask the resolver to start an engagement. Re-engaging the current
    /// target returns true without a new intent. Switching target stops the
    /// previous engagement first.
    bool StartCombat(foundation::MobId attacker, foundation::PlayerId target,
                     const CombatOptions& options = {});

    /// End the attacker's engagement, if any.
    void StopCombat(foundation::MobId attacker);

    [[nodiscard]] std::optional<foundation::PlayerId> EngagedTarget(foundation::MobId attacker) const;

    /// Mobs currently engaged with @p target, ascending.
    [[nodiscard]] std::vector<foundation::MobId> AttackersOf(foundation::PlayerId target) const;

    [[nodiscard]] std::size_t EngagementCount() const noexcept { return engagements_.size(); }

private:
    MobChannel& mobChannel_;
    ICombatResolver* resolver_;
    std::map<foundation::MobId, foundation::PlayerId> engagements_;
};

}  // namespace msim::game
