/// @file loot_bridge.cpp
/// @brief LootBridge and HeadstoneLootPipeline.

#include "msim/game/loot_bridge.hpp"

#include "msim/foundation/game_logger.hpp"
#include "msim/game/world_entity_manager.hpp"

namespace msim::game {

using foundation::LogCategory;

void HeadstoneLootPipeline::DropLoot(const LootDropRequest& request) {
    EntitySpawnConfig config;
    config.kind = EntityKind::Headstone;
    config.name = request.mobType + " remains";
    config.subtype = request.lootTable;
    config.position = request.position;

    auto spawned = world_.SpawnEntity(config);
    if (!spawned) {
        MSIM_LOG_WARN(LogCategory::World,
                      "loot drop for mob " + foundation::toString(request.mobId) +
                      " failed: " + std::string(spawned.error().message()));
    }
}

LootBridge::LootBridge(MobChannel& mobChannel, ILootPipeline& pipeline)
    : mobChannel_(mobChannel), pipeline_(pipeline) {
    slot_ = mobChannel_.connect([this](const MobEvent& event) {
        const auto* died = std::get_if<MobDied>(&event);
        if (died == nullptr || !died->dropsLoot) {
            return;
        }
        pipeline_.DropLoot(LootDropRequest{died->mobId, died->killerId, died->position,
                                           died->mobType, died->lootTable, died->xpReward});
        ++dispatched_;
    });
}

LootBridge::~LootBridge() {
    mobChannel_.disconnect(slot_);
}

}  // namespace msim::game
