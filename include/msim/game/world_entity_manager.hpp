#pragma once

/// @file world_entity_manager.hpp
/// @brief Authoritative registry of world entities and their replication state.

#include "msim/ecs/component_storage.hpp"
#include "msim/ecs/entity_manager.hpp"
#include "msim/ecs/system.hpp"
#include "msim/foundation/game_result.hpp"
#include "msim/game/mob_events.hpp"
#include "msim/game/world_components.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace msim::game {

/// Parameters of SpawnEntity.
struct EntitySpawnConfig {
    EntityKind kind = EntityKind::Item;
    std::string name;
    std::string subtype;
    Vector3 position;
    /// Register under this id instead of allocating one.
    std::optional<foundation::EntityId> customId;
};

/// Read-only copy of an entity's components.
struct WorldEntity {
    Identity identity;
    Vector3 position;
    bool networkDirty = false;
};

/// Owns every render and network facing entity.
///
/// The mob simulation never calls this class directly. It subscribes to the
/// mob channel and reacts:
///
/// | Event              | Reaction                                      |
/// |--------------------|-----------------------------------------------|
/// | MobSpawnRequest    | SpawnEntity(kind = Mob, customId = mobId)     |
/// | MobPositionUpdated | move the entity, flag it network-dirty        |
/// | MobDied            | DestroyEntity                                 |
/// | MobDespawn         | DestroyEntity                                 |
///
/// Spawns and destroys are announced on the world channel. As a PostUpdate
/// system it collects the dirty set once per tick for replication.
class WorldEntityManager final : public ecs::ISystem {
public:
    WorldEntityManager(MobChannel& mobChannel, WorldChannel& worldChannel,
                       WorldBounds bounds = {});
    ~WorldEntityManager() override;

    WorldEntityManager(const WorldEntityManager&) = delete;
    WorldEntityManager& operator=(const WorldEntityManager&) = delete;

    /// Validate and register an entity, then emit EntitySpawned (and
    /// MobSpawned for mobs).
    ///
    /// @return InvalidPosition for non-finite coordinates,
    ///         PositionOutOfBounds for Y outside the world bounds,
    ///         AlreadyExists when @c customId is in use.
    [[nodiscard]] foundation::GameResult<foundation::EntityId>
    SpawnEntity(const EntitySpawnConfig& config);

    /// Remove an entity and emit EntityDestroyed. False for unknown ids.
    bool DestroyEntity(foundation::EntityId id);

    /// Move an entity and flag it for replication. False for unknown ids
    /// and non-finite positions.
    bool MoveEntity(foundation::EntityId id, const Vector3& position);

    [[nodiscard]] bool Contains(foundation::EntityId id) const;
    [[nodiscard]] std::optional<WorldEntity> GetEntity(foundation::EntityId id) const;

    /// Ids of one kind, ascending.
    [[nodiscard]] std::vector<foundation::EntityId> EntitiesOfKind(EntityKind kind) const;

    /// Ids within @p radius of @p center, ascending.
    [[nodiscard]] std::vector<foundation::EntityId>
    EntitiesInRange(const Vector3& center, float radius) const;

    [[nodiscard]] std::size_t Count() const noexcept { return entities_.Count(); }

    /// Entities changed since the last call, each listed once. Clears the flags.
    std::vector<foundation::EntityId> TakeNetworkDirty();

    [[nodiscard]] const WorldBounds& Bounds() const noexcept { return bounds_; }

    // ── ISystem ──────────────────────────────────────────────────────

    /// Run one replication pass over the dirty set.
    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "WorldEntityManager"; }

    /// Entities sent by the last replication pass.
    [[nodiscard]] const std::vector<foundation::EntityId>& LastReplicated() const noexcept {
        return lastReplicated_;
    }

    [[nodiscard]] uint64_t ReplicationTick() const noexcept { return replicationTick_; }

private:
    void onMobEvent(const MobEvent& event);
    [[nodiscard]] std::optional<ecs::Entity> handleOf(foundation::EntityId id) const;

    MobChannel& mobChannel_;
    WorldChannel& worldChannel_;
    WorldBounds bounds_;
    foundation::Signal<const MobEvent&>::SlotId mobSlot_ = 0;

    ecs::EntityManager entities_;
    ecs::ComponentStorage<Transform> transforms_;
    ecs::ComponentStorage<Identity> identities_;
    ecs::ComponentStorage<NetworkSync> syncs_;

    std::unordered_map<foundation::EntityId, ecs::Entity> handles_;
    std::vector<foundation::EntityId> dirty_;
    std::vector<foundation::EntityId> lastReplicated_;
    uint64_t replicationTick_ = 0;
};

}  // namespace msim::game
