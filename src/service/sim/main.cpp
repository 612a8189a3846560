/// @file main.cpp
/// @brief mob_sim_server entry point.
///
/// Loads the configuration, populates the mob world and runs it at the
/// configured tick rate until SIGINT/SIGTERM. With `--ticks <n>` it runs
/// n ticks on the main thread instead and prints the final stats.

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "msim/foundation/config_manager.hpp"
#include "msim/service/mob_world.hpp"
#include "msim/service/service_runner.hpp"

namespace {

void printStats(const msim::service::MobWorldStats& stats) {
    std::cout << "ticks: " << stats.totalTicks
              << ", mobs: " << stats.aliveMobs << "/" << stats.mobCount
              << ", pending respawns: " << stats.pendingRespawns
              << ", entities: " << stats.entityCount
              << ", players: " << stats.playerCount
              << ", loot drops: " << stats.lootDrops << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    msim::service::SignalHandler signals;

    auto configPath = msim::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/mobs.yaml";
    }

    msim::foundation::ConfigManager config;
    auto loadResult = msim::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto ticksArg = msim::service::parseTickCountArg(argc, argv);
    if (!ticksArg) {
        std::cerr << ticksArg.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    const uint64_t headlessTicks = ticksArg.value();

    auto worldCfg = msim::service::MobWorldConfig::FromConfig(config);
    msim::service::MobWorld world(worldCfg);

    auto initResult = world.initialize();
    if (!initResult) {
        std::cerr << "Failed to initialize mob world: " << initResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    if (headlessTicks > 0) {
        for (uint64_t i = 0; i < headlessTicks && !signals.shutdownRequested(); ++i) {
            world.tick();
        }
        printStats(world.stats());
        return EXIT_SUCCESS;
    }

    auto startResult = world.start();
    if (!startResult) {
        std::cerr << "Failed to start mob world: " << startResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Mob world started (tick_rate: " << worldCfg.tickRate
              << " Hz, mobs: " << world.stats().mobCount << ")\n";

    signals.waitForShutdown();

    std::cout << "Shutting down mob world...\n";
    world.stop();
    printStats(world.stats());
    std::cout << "Mob world stopped\n";
    return EXIT_SUCCESS;
}
