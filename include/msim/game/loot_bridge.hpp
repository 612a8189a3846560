#pragma once

/// @file loot_bridge.hpp
/// @brief Hands mob deaths to the loot pipeline.

#include "msim/foundation/types.hpp"
#include "msim/game/math_types.hpp"
#include "msim/game/mob_events.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace msim::game {

class WorldEntityManager;

struct LootDropRequest {
    foundation::MobId mobId;
    std::optional<foundation::PlayerId> killerId;
    Vector3 position;
    std::string mobType;
    std::string lootTable;
    int32_t xpReward = 0;
};

/// Consumer of loot drops. Loot table contents live behind this interface.
class ILootPipeline {
public:
    virtual ~ILootPipeline() = default;

    virtual void DropLoot(const LootDropRequest& request) = 0;
};

/// Drops loot as a headstone entity at the death position. The headstone's
/// subtype names the loot table to roll.
class HeadstoneLootPipeline final : public ILootPipeline {
public:
    explicit HeadstoneLootPipeline(WorldEntityManager& world) : world_(world) {}

    void DropLoot(const LootDropRequest& request) override;

private:
    WorldEntityManager& world_;
};

/// Subscribes to MobDied and forwards every death that drops loot.
/// Administrative kills (dropsLoot == false) are skipped.
class LootBridge {
public:
    LootBridge(MobChannel& mobChannel, ILootPipeline& pipeline);
    ~LootBridge();

    LootBridge(const LootBridge&) = delete;
    LootBridge& operator=(const LootBridge&) = delete;

    [[nodiscard]] uint64_t DropsDispatched() const noexcept { return dispatched_; }

private:
    MobChannel& mobChannel_;
    ILootPipeline& pipeline_;
    foundation::Signal<const MobEvent&>::SlotId slot_ = 0;
    uint64_t dispatched_ = 0;
};

}  // namespace msim::game
