/// @file entity_manager.cpp
/// @brief Entity slot allocation and recycling.

#include "msim/ecs/entity_manager.hpp"

namespace msim::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

GameResult<Entity> EntityManager::Create() {
    uint32_t index = 0;

    if (!freeList_.empty()) {
        index = freeList_.front();
        freeList_.pop_front();
        alive_[index] = true;
    } else {
        index = static_cast<uint32_t>(versions_.size());
        if (index > Entity::kMaxId) {
            return GameResult<Entity>::err(
                GameError(ErrorCode::EntityLimitReached, "entity index space exhausted"));
        }
        versions_.push_back(0);
        alive_.push_back(true);
    }

    ++count_;
    return GameResult<Entity>::ok(Entity(index, versions_[index]));
}

bool EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return false;
    }

    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    const auto idx = entity.id();
    alive_[idx] = false;
    versions_[idx] = static_cast<uint8_t>(versions_[idx] + 1);
    freeList_.push_back(idx);
    --count_;
    return true;
}

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }
    const auto idx = entity.id();
    return idx < versions_.size() && alive_[idx] && versions_[idx] == entity.version();
}

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    if (storage != nullptr) {
        storages_.push_back(storage);
    }
}

}  // namespace msim::ecs
