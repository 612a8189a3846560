#pragma once

/// @file mob_events.hpp
/// @brief Typed payloads for the two channels between MobSystem and the world.
///
/// MobChannel carries requests and notifications produced by the mob
/// simulation. WorldChannel carries what the entity layer and the combat
/// resolver report back. Each channel is a closed std::variant, so adding a
/// payload forces every std::visit over it to handle the new case.

#include "msim/foundation/signal.hpp"
#include "msim/foundation/types.hpp"
#include "msim/game/math_types.hpp"
#include "msim/game/mob_types.hpp"
#include "msim/game/world_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace msim::game {

// ═══════════════════════════════════════════════════════════════════════════
// Mob channel (mob simulation -> world)
// ═══════════════════════════════════════════════════════════════════════════

/// Ask the entity layer to create the entity for a mob under @c mobId.
struct MobSpawnRequest {
    foundation::MobId mobId;
    std::string type;
    std::string name;
    Vector3 position;
    int32_t level = 1;
};

/// A mob's health reached zero.
struct MobDied {
    foundation::MobId mobId;
    std::optional<foundation::PlayerId> killerId;
    Vector3 position;
    std::string mobType;
    std::string lootTable;
    int32_t xpReward = 0;
    /// False for administrative kills.
    bool dropsLoot = true;
};

/// Remove a mob's entity immediately, without loot or respawn.
struct MobDespawn {
    foundation::MobId mobId;
    std::string type;
    Vector3 position;
};

/// Engagement intent consumed by the combat resolver.
struct CombatStartAttack {
    foundation::MobId attackerId;
    foundation::PlayerId targetId;
};

/// The mob dropped its target, died or was removed.
struct CombatStopAttack {
    foundation::MobId attackerId;
    std::optional<foundation::PlayerId> targetId;
};

/// Emitted at most once per mob per tick in which its position changed.
struct MobPositionUpdated {
    foundation::MobId mobId;
    Vector3 position;
    MobAIState state = MobAIState::Idle;
};

using MobEvent = std::variant<MobSpawnRequest, MobDied, MobDespawn,
                              CombatStartAttack, CombatStopAttack,
                              MobPositionUpdated>;

// ═══════════════════════════════════════════════════════════════════════════
// World channel (world -> mob simulation)
// ═══════════════════════════════════════════════════════════════════════════

/// Any entity finished registration in the entity layer.
struct EntitySpawned {
    foundation::EntityId entityId;
    EntityKind kind = EntityKind::Item;
    Vector3 position;
};

/// The entity for a mob exists; confirms the mob's registration.
struct MobSpawned {
    foundation::MobId mobId;
    std::string type;
    Vector3 position;
};

/// Damage resolved by the combat system against a mob.
struct MobDamaged {
    foundation::MobId mobId;
    int32_t damage = 0;
    std::optional<foundation::PlayerId> sourceId;
};

struct EntityDestroyed {
    foundation::EntityId entityId;
    EntityKind kind = EntityKind::Item;
};

using WorldEvent = std::variant<EntitySpawned, MobSpawned, MobDamaged, EntityDestroyed>;

using MobChannel = foundation::Signal<const MobEvent&>;
using WorldChannel = foundation::Signal<const WorldEvent&>;

}  // namespace msim::game
