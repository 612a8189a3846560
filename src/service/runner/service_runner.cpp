/// @file service_runner.cpp
/// @brief Entry-point helpers for mob_sim_server.

#include "msim/service/service_runner.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>

#include "msim/foundation/game_logger.hpp"

namespace msim::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // Only a lock-free atomic store is safe here.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    for (int sig : {SIGINT, SIGTERM}) {
        std::signal(sig, &SignalHandler::handler);
    }
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    for (int sig : {SIGINT, SIGTERM}) {
        std::signal(sig, SIG_DFL);
    }
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownRequested()) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

GameResult<void> loadConfig(foundation::ConfigManager& config,
                            const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;
    if (const char* env = std::getenv("MSIM_CONFIG_PATH"); env != nullptr && *env != '\0') {
        configPath = env;
    }

    auto loaded = config.load(configPath);
    if (loaded) {
        MSIM_LOG_INFO(foundation::LogCategory::Config, "loaded config " + configPath.string());
    }
    return loaded;
}

// -- CLI argument parsing ----------------------------------------------------

std::optional<std::string> parseOptionArg(int argc, char* argv[], std::string_view name) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (name == argv[i]) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    return parseOptionArg(argc, argv, "--config").value_or(std::string{});
}

GameResult<uint64_t> parseTickCountArg(int argc, char* argv[]) {
    auto text = parseOptionArg(argc, argv, "--ticks");
    if (!text) {
        return GameResult<uint64_t>::ok(0);
    }

    uint64_t ticks = 0;
    const char* first = text->data();
    const char* last = first + text->size();
    auto [ptr, ec] = std::from_chars(first, last, ticks);
    if (ec != std::errc() || ptr != last || text->empty()) {
        return GameResult<uint64_t>::err(
            GameError(ErrorCode::InvalidArgument, "invalid --ticks value: " + *text, *text));
    }
    return GameResult<uint64_t>::ok(ticks);
}

} // namespace msim::service
