#pragma once

/// @file world_components.hpp
/// @brief ECS components attached to every world entity.

#include "msim/foundation/types.hpp"
#include "msim/game/math_types.hpp"
#include "msim/game/world_types.hpp"

#include <cstdint>
#include <string>

namespace msim::game {

struct Transform {
    Vector3 position;
};

/// Stable identity of a world entity.
struct Identity {
    foundation::EntityId id;
    EntityKind kind = EntityKind::Item;
    std::string name;
    /// Archetype key for mobs, item id for items, and so on.
    std::string subtype;
};

/// Replication bookkeeping. @c dirty is set at most once between two
/// replication passes.
struct NetworkSync {
    bool dirty = false;
    uint64_t lastReplicatedTick = 0;
};

}  // namespace msim::game
