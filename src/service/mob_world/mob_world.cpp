/// @file mob_world.cpp
/// @brief MobWorld implementation wiring channels, systems and the loop.

#include "msim/service/mob_world.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

#include "msim/ecs/system.hpp"
#include "msim/foundation/config_manager.hpp"
#include "msim/foundation/error_code.hpp"
#include "msim/foundation/game_error.hpp"
#include "msim/foundation/game_logger.hpp"
#include "msim/game/combat_bridge.hpp"
#include "msim/game/loot_bridge.hpp"
#include "msim/game/world_entity_manager.hpp"

namespace msim::service {

using msim::foundation::ErrorCode;
using msim::foundation::GameError;
using msim::foundation::GameResult;
using msim::foundation::LogCategory;
using msim::foundation::MobId;
using msim::foundation::PlayerId;

// -- Config -------------------------------------------------------------------

MobWorldConfig MobWorldConfig::FromConfig(const foundation::ConfigManager& config) {
    MobWorldConfig cfg;
    cfg.tickRate = config.getOr<uint32_t>("server.tick_rate", cfg.tickRate);
    cfg.populateOnStart = config.getOr<bool>("mobs.populate_on_start", cfg.populateOnStart);
    cfg.mobs = game::MobSystemConfig::FromConfig(config);

    auto dataFile = config.getOr<std::string>("mobs.data_file", {});
    if (!dataFile.empty()) {
        std::filesystem::path path(dataFile);
        auto source = config.sourcePath();
        if (path.is_relative() && !source.empty()) {
            path = source.parent_path() / path;
        }
        cfg.mobDataFile = path;
    }
    return cfg;
}

// -- Impl ---------------------------------------------------------------------

struct MobWorld::Impl {
    MobWorldConfig config;

    // Channels first: everything below subscribes to them.
    game::MobChannel mobChannel;
    game::WorldChannel worldChannel;

    game::PlayerRegistry players;
    game::MobRegistry registry;

    game::WorldEntityManager entities;
    game::RegisteredEntityResolver resolver;
    game::CombatBridge combat;
    game::MobSystem mobs;
    game::HeadstoneLootPipeline lootPipeline;
    game::LootBridge loot;

    GameLoop gameLoop;

    /// Guards the simulation state between the loop thread and callers.
    mutable std::mutex worldMutex;
    std::vector<ecs::ISystem*> systems;
    bool initialized = false;

    std::atomic<uint64_t> lastUpdateMicros{0};

    explicit Impl(MobWorldConfig cfg)
        : config(std::move(cfg))
        , registry(game::MobRegistry::WithDefaultArchetypes())
        , entities(mobChannel, worldChannel, config.mobs.bounds)
        , resolver(entities, players)
        , combat(mobChannel, &resolver)
        , mobs(registry, players, mobChannel, worldChannel, combat, config.mobs)
        , lootPipeline(entities)
        , loot(mobChannel, lootPipeline)
        , gameLoop(config.tickRate) {
        systems = {&mobs, &entities};
        std::stable_sort(systems.begin(), systems.end(),
                         [](const ecs::ISystem* a, const ecs::ISystem* b) {
                             return a->GetStage() < b->GetStage();
                         });

        gameLoop.setTickCallback([this](float dt) { runSystems(dt); });
        gameLoop.setMetricsCallback([this](const TickMetrics& metrics) {
            lastUpdateMicros.store(static_cast<uint64_t>(metrics.updateTime.count()));
            if (metrics.overrun) {
                MSIM_LOG_WARN(LogCategory::Core,
                              "tick " + std::to_string(metrics.tickNumber) + " overran its budget");
            }
        });
    }

    void runSystems(float dt) {
        std::lock_guard lock(worldMutex);
        for (auto* system : systems) {
            system->Execute(dt);
        }
    }
};

// -- Construction / destruction -------------------------------------------------

MobWorld::MobWorld(MobWorldConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

MobWorld::~MobWorld() {
    if (impl_->gameLoop.isRunning()) {
        stop();
    }
}

// -- Lifecycle ----------------------------------------------------------------

GameResult<void> MobWorld::initialize() {
    std::lock_guard lock(impl_->worldMutex);
    if (impl_->initialized) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "mob world is already initialized"));
    }

    if (!impl_->config.mobDataFile.empty()) {
        auto loaded = impl_->registry.LoadFromFile(impl_->config.mobDataFile);
        if (!loaded) {
            return loaded;
        }
        MSIM_LOG_INFO(LogCategory::Config,
                      "loaded mob data from " + impl_->config.mobDataFile.string() + " ("
                          + std::to_string(impl_->registry.ArchetypeCount()) + " archetypes, "
                          + std::to_string(impl_->registry.Areas().size()) + " areas)");
    }

    if (impl_->config.populateOnStart) {
        impl_->mobs.PopulateSpawnPoints();
    }

    impl_->initialized = true;
    return GameResult<void>::ok();
}

GameResult<void> MobWorld::start() {
    if (!impl_->initialized) {
        return GameResult<void>::err(
            GameError(ErrorCode::WorldNotInitialized, "mob world must be initialized before start"));
    }
    if (!impl_->gameLoop.start()) {
        return GameResult<void>::err(
            GameError(ErrorCode::GameLoopAlreadyRunning, "mob world is already running"));
    }

    MSIM_LOG_INFO(LogCategory::Core,
                  "mob world started at " + std::to_string(impl_->gameLoop.tickRate()) + " Hz");
    return GameResult<void>::ok();
}

void MobWorld::stop() {
    if (!impl_->gameLoop.isRunning()) {
        return;
    }
    impl_->gameLoop.stop();
    MSIM_LOG_INFO(LogCategory::Core,
                  "mob world stopped after " + std::to_string(impl_->gameLoop.tickCount()) + " ticks");
}

bool MobWorld::isRunning() const noexcept {
    return impl_->gameLoop.isRunning();
}

TickMetrics MobWorld::tick() {
    return impl_->gameLoop.tick();
}

// -- Players ------------------------------------------------------------------

void MobWorld::upsertPlayer(const game::PlayerView& player) {
    std::lock_guard lock(impl_->worldMutex);
    impl_->players.Upsert(player);
}

bool MobWorld::removePlayer(PlayerId id) {
    std::lock_guard lock(impl_->worldMutex);
    return impl_->players.Remove(id);
}

bool MobWorld::movePlayer(PlayerId id, const game::Vector3& position) {
    std::lock_guard lock(impl_->worldMutex);
    return impl_->players.SetPosition(id, position);
}

// -- Mobs ---------------------------------------------------------------------

GameResult<MobId> MobWorld::spawnMob(std::string_view type, const game::Vector3& position) {
    std::lock_guard lock(impl_->worldMutex);
    return impl_->mobs.SpawnMobOfType(type, position);
}

bool MobWorld::despawnMob(MobId id) {
    std::lock_guard lock(impl_->worldMutex);
    return impl_->mobs.DespawnMob(id);
}

bool MobWorld::killMob(MobId id) {
    std::lock_guard lock(impl_->worldMutex);
    return impl_->mobs.KillMob(id);
}

game::DamageOutcome MobWorld::applyDamage(MobId id, int32_t amount,
                                          std::optional<PlayerId> source) {
    std::lock_guard lock(impl_->worldMutex);
    return impl_->mobs.ApplyDamage(id, amount, source);
}

std::optional<game::MobInstance> MobWorld::getMob(MobId id) const {
    std::lock_guard lock(impl_->worldMutex);
    return impl_->mobs.GetMob(id);
}

// -- Access -------------------------------------------------------------------

game::MobSystem& MobWorld::mobs() {
    return impl_->mobs;
}

game::WorldEntityManager& MobWorld::entities() {
    return impl_->entities;
}

game::CombatBridge& MobWorld::combat() {
    return impl_->combat;
}

game::MobRegistry& MobWorld::registry() {
    return impl_->registry;
}

game::MobChannel& MobWorld::mobChannel() {
    return impl_->mobChannel;
}

game::WorldChannel& MobWorld::worldChannel() {
    return impl_->worldChannel;
}

MobWorldStats MobWorld::stats() const {
    MobWorldStats s;
    s.totalTicks = impl_->gameLoop.tickCount();
    s.overruns = impl_->gameLoop.overrunCount();
    s.lastUpdateTimeMs = static_cast<float>(impl_->lastUpdateMicros.load()) / 1000.0f;

    std::lock_guard lock(impl_->worldMutex);
    s.mobCount = impl_->mobs.MobCount();
    s.aliveMobs = impl_->mobs.AliveCount();
    s.pendingRespawns = impl_->mobs.Respawns().Size();
    s.entityCount = impl_->entities.Count();
    s.playerCount = impl_->players.Count();
    s.engagements = impl_->combat.EngagementCount();
    s.lootDrops = impl_->loot.DropsDispatched();
    s.lastReplicated = impl_->entities.LastReplicated().size();
    return s;
}

const MobWorldConfig& MobWorld::config() const noexcept {
    return impl_->config;
}

} // namespace msim::service
