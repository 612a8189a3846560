/// @file world_entity_manager.cpp
/// @brief WorldEntityManager: entity validation, registration and replication.

#include "msim/game/world_entity_manager.hpp"

#include "msim/foundation/game_logger.hpp"

#include <algorithm>

namespace msim::game {

using foundation::EntityId;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

WorldEntityManager::WorldEntityManager(MobChannel& mobChannel, WorldChannel& worldChannel,
                                       WorldBounds bounds)
    : mobChannel_(mobChannel), worldChannel_(worldChannel), bounds_(bounds) {
    entities_.RegisterStorage(&transforms_);
    entities_.RegisterStorage(&identities_);
    entities_.RegisterStorage(&syncs_);

    mobSlot_ = mobChannel_.connect([this](const MobEvent& event) { onMobEvent(event); });
}

WorldEntityManager::~WorldEntityManager() {
    mobChannel_.disconnect(mobSlot_);
}

GameResult<EntityId> WorldEntityManager::SpawnEntity(const EntitySpawnConfig& config) {
    if (!IsFinite(config.position)) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::InvalidPosition,
                      "spawn position must be finite for " + config.name, config.position));
    }
    if (!bounds_.ContainsY(config.position.y)) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::PositionOutOfBounds,
                      "spawn Y " + std::to_string(config.position.y) +
                      " is outside the world bounds for " + config.name,
                      config.position));
    }

    EntityId id = config.customId.value_or(EntityId{});
    if (id.isValid() && handles_.count(id) > 0) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::AlreadyExists,
                      "entity " + foundation::toString(id) + " already registered"));
    }

    auto created = entities_.Create();
    if (!created) {
        return GameResult<EntityId>::err(created.error());
    }
    while (!id.isValid() || handles_.count(id) > 0) {
        id = GenerateEntityId();
    }

    const auto handle = created.value();
    transforms_.Add(handle, Transform{config.position});
    identities_.Add(handle, Identity{id, config.kind, config.name, config.subtype});
    syncs_.Add(handle);
    handles_.emplace(id, handle);

    LogContext ctx;
    ctx.entityId = id;
    ctx.extra["kind"] = std::string(entityKindName(config.kind));
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::World, "entity spawned", ctx);

    worldChannel_.emit(EntitySpawned{id, config.kind, config.position});
    if (config.kind == EntityKind::Mob) {
        worldChannel_.emit(MobSpawned{id, config.subtype, config.position});
    }
    return GameResult<EntityId>::ok(id);
}

bool WorldEntityManager::DestroyEntity(EntityId id) {
    auto it = handles_.find(id);
    if (it == handles_.end()) {
        return false;
    }

    const auto handle = it->second;
    const auto kind = identities_.Get(handle).kind;
    handles_.erase(it);
    std::erase(dirty_, id);
    entities_.Destroy(handle);

    worldChannel_.emit(EntityDestroyed{id, kind});
    return true;
}

bool WorldEntityManager::MoveEntity(EntityId id, const Vector3& position) {
    auto handle = handleOf(id);
    if (!handle || !IsFinite(position)) {
        return false;
    }

    auto& transform = transforms_.Get(*handle);
    if (transform.position == position) {
        return true;
    }
    transform.position = position;

    auto& sync = syncs_.Get(*handle);
    if (!sync.dirty) {
        sync.dirty = true;
        dirty_.push_back(id);
    }
    return true;
}

bool WorldEntityManager::Contains(EntityId id) const {
    return handles_.count(id) > 0;
}

std::optional<WorldEntity> WorldEntityManager::GetEntity(EntityId id) const {
    auto handle = handleOf(id);
    if (!handle) {
        return std::nullopt;
    }
    WorldEntity view;
    view.identity = identities_.Get(*handle);
    view.position = transforms_.Get(*handle).position;
    view.networkDirty = syncs_.Get(*handle).dirty;
    return view;
}

std::vector<EntityId> WorldEntityManager::EntitiesOfKind(EntityKind kind) const {
    std::vector<EntityId> ids;
    for (const auto& identity : identities_) {
        if (identity.kind == kind) {
            ids.push_back(identity.id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<EntityId> WorldEntityManager::EntitiesInRange(const Vector3& center,
                                                          float radius) const {
    std::vector<EntityId> ids;
    for (std::size_t i = 0; i < transforms_.Size(); ++i) {
        auto handle = transforms_.EntityAt(i);
        if (Distance(transforms_.Get(handle).position, center) <= radius) {
            ids.push_back(identities_.Get(handle).id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<EntityId> WorldEntityManager::TakeNetworkDirty() {
    auto taken = std::move(dirty_);
    dirty_.clear();
    for (auto id : taken) {
        if (auto handle = handleOf(id)) {
            auto& sync = syncs_.Get(*handle);
            sync.dirty = false;
            sync.lastReplicatedTick = replicationTick_;
        }
    }
    return taken;
}

void WorldEntityManager::Execute(float /*deltaTime*/) {
    ++replicationTick_;
    lastReplicated_ = TakeNetworkDirty();
}

void WorldEntityManager::onMobEvent(const MobEvent& event) {
    if (const auto* request = std::get_if<MobSpawnRequest>(&event)) {
        EntitySpawnConfig config;
        config.kind = EntityKind::Mob;
        config.name = request->name;
        config.subtype = request->type;
        config.position = request->position;
        config.customId = request->mobId;

        auto spawned = SpawnEntity(config);
        if (!spawned) {
            LogContext ctx;
            ctx.entityId = request->mobId;
            foundation::GameLogger::instance().logWithContext(
                LogLevel::Error, LogCategory::World,
                "mob entity spawn rejected: " + std::string(spawned.error().message()), ctx);
        }
    } else if (const auto* moved = std::get_if<MobPositionUpdated>(&event)) {
        MoveEntity(moved->mobId, moved->position);
    } else if (const auto* died = std::get_if<MobDied>(&event)) {
        DestroyEntity(died->mobId);
    } else if (const auto* despawn = std::get_if<MobDespawn>(&event)) {
        DestroyEntity(despawn->mobId);
    }
}

std::optional<ecs::Entity> WorldEntityManager::handleOf(EntityId id) const {
    auto it = handles_.find(id);
    if (it == handles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace msim::game
