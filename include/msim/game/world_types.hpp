#pragma once

/// @file world_types.hpp
/// @brief Entity kinds, world bounds and entity id allocation.

#include "msim/foundation/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace msim::game {

/// Closed set of entities the world layer can create.
enum class EntityKind : uint8_t {
    Item,
    Mob,
    Resource,
    Npc,
    Headstone
};

constexpr std::string_view entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Item:      return "item";
        case EntityKind::Mob:       return "mob";
        case EntityKind::Resource:  return "resource";
        case EntityKind::Npc:       return "npc";
        case EntityKind::Headstone: return "headstone";
    }
    return "unknown";
}

/// Parse a kind name as written in configuration. Unknown names yield nullopt.
inline std::optional<EntityKind> parseEntityKind(std::string_view name) {
    if (name == "item") return EntityKind::Item;
    if (name == "mob") return EntityKind::Mob;
    if (name == "resource") return EntityKind::Resource;
    if (name == "npc") return EntityKind::Npc;
    if (name == "headstone") return EntityKind::Headstone;
    return std::nullopt;
}

/// Vertical limits of the playable world.
struct WorldBounds {
    float minY = -200.0f;
    float maxY = 2000.0f;

    [[nodiscard]] constexpr bool ContainsY(float y) const noexcept {
        return y >= minY && y <= maxY;
    }
};

/// Process-unique entity id. Starts at 1; 0 is the invalid id.
///
/// Mob ids and world entity ids come from the same sequence so a mob can
/// ask the world layer to create its entity under the mob's own id.
inline foundation::EntityId GenerateEntityId() noexcept {
    static std::atomic<uint64_t> counter{0};
    return foundation::EntityId(counter.fetch_add(1, std::memory_order_relaxed) + 1);
}

}  // namespace msim::game
