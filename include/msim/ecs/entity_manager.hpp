#pragma once

/// @file entity_manager.hpp
/// @brief Entity slot allocation, versioned recycling and component cleanup.

#include "msim/ecs/component_storage.hpp"
#include "msim/ecs/entity.hpp"
#include "msim/foundation/game_result.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace msim::ecs {

/// Owns entity slots.
///
/// Destroying an entity bumps its slot version and queues the slot for
/// reuse in FIFO order. Registered storages lose the entity's components
/// on destruction. The manager does not own the storages.
class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    /// Allocate an entity, recycling the oldest free slot first.
    /// @return EntityLimitReached once all 24-bit slots are in use.
    [[nodiscard]] foundation::GameResult<Entity> Create();

    /// Destroy @p entity. Returns false for a dead or stale handle.
    bool Destroy(Entity entity);

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;
    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    void RegisterStorage(IComponentStorage* storage);

private:
    std::vector<uint8_t> versions_;
    std::vector<bool> alive_;
    std::deque<uint32_t> freeList_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

}  // namespace msim::ecs
