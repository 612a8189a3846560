#pragma once

/// @file service_runner.hpp
/// @brief Entry-point helpers: signal handling, config loading, CLI parsing.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "msim/foundation/config_manager.hpp"
#include "msim/foundation/game_result.hpp"

namespace msim::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The default
/// handlers are restored on destruction, so a second signal after shutdown
/// terminates the process.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag without a signal.
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into @p config.
///
/// The MSIM_CONFIG_PATH environment variable, when set, takes precedence
/// over @p defaultPath.
[[nodiscard]] foundation::GameResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath);

/// Value following @p name (`--name value`), or nullopt.
[[nodiscard]] std::optional<std::string>
parseOptionArg(int argc, char* argv[], std::string_view name);

/// Parse `--config <path>`. Empty when not given.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Parse `--ticks <n>` for a headless run. Zero when not given,
/// InvalidArgument when the value is not a non-negative integer.
[[nodiscard]] foundation::GameResult<uint64_t> parseTickCountArg(int argc, char* argv[]);

} // namespace msim::service
