#pragma once

/// @file game_logger.hpp
/// @brief Category-filtered structured logging on top of kcenon common_system.
///
/// GameLogger forwards to loggers registered in kcenon's
/// GlobalLoggerRegistry. Each simulation subsystem logs under its own
/// category, and each category has an independent runtime level.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "msim/foundation/game_result.hpp"
#include "msim/foundation/types.hpp"

namespace msim::foundation {

/// Log severity. Maps one-to-one onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem a log line belongs to.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Host, game loop, startup and shutdown
    ECS    = 1, ///< Entity storage
    Config = 2, ///< Configuration and archetype loading
    Combat = 3, ///< Damage, death and combat engagement
    World  = 4, ///< World entity layer and spawning
    AI     = 5  ///< Mob state machine and perception
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Config", "Combat", "World", "AI"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line as `{key=value, ...}`.
///
/// @code
///   LogContext ctx;
///   ctx.entityId = mob.id;
///   ctx.playerId = attacker;
///   ctx.extra["damage"] = "12";
///   GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Combat,
///                                         "mob damaged", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::optional<PlayerId> playerId;
    std::unordered_map<std::string, std::string> extra;
};

/// Structured logger with per-category minimum levels.
///
/// Default levels:
/// | Category | Level   |
/// |----------|---------|
/// | Core     | Info    |
/// | ECS      | Info    |
/// | Config   | Info    |
/// | Combat   | Debug   |
/// | World    | Info    |
/// | AI       | Info    |
///
/// A category logger named `msim.<Category>` is used when registered,
/// otherwise the registry's default logger receives the line.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Emit `[Category] msg` when the level passes the category filter.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Same as log() with structured context appended.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    /// Process-wide logger used by the MSIM_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace msim::foundation

/// @name MSIM_LOG macros
/// Runtime-filtered logging through GameLogger::instance().
/// Define MSIM_MIN_LOG_LEVEL (0=Trace .. 6=Off) to compile out lower levels.
/// @{

#ifndef MSIM_MIN_LOG_LEVEL
    #define MSIM_MIN_LOG_LEVEL 0
#endif

#define MSIM_LOG(level, cat, msg)                                                 \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= MSIM_MIN_LOG_LEVEL &&                      \
            ::msim::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::msim::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define MSIM_LOG_DEBUG(cat, msg) \
    MSIM_LOG(::msim::foundation::LogLevel::Debug, (cat), (msg))

#define MSIM_LOG_INFO(cat, msg) \
    MSIM_LOG(::msim::foundation::LogLevel::Info, (cat), (msg))

#define MSIM_LOG_WARN(cat, msg) \
    MSIM_LOG(::msim::foundation::LogLevel::Warning, (cat), (msg))

#define MSIM_LOG_ERROR(cat, msg) \
    MSIM_LOG(::msim::foundation::LogLevel::Error, (cat), (msg))

/// @}
