/// @file game_logger.cpp
/// @brief GameLogger forwarding to kcenon's GlobalLoggerRegistry.

#include "msim/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace msim::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level toKcenonLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

constexpr std::array<LogLevel, kLogCategoryCount> kDefaultLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // ECS
    LogLevel::Info,   // Config
    LogLevel::Debug,  // Combat
    LogLevel::Info,   // World
    LogLevel::Info    // AI
};

std::string formatLine(LogCategory cat, std::string_view msg,
                       const LogContext* ctx) {
    std::ostringstream oss;
    oss << '[' << logCategoryName(cat) << "] " << msg;
    if (ctx == nullptr) {
        return oss.str();
    }

    std::ostringstream fields;
    bool first = true;
    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            fields << ", ";
        }
        fields << key << '=' << val;
        first = false;
    };

    if (ctx->entityId && ctx->entityId->isValid()) {
        append("entity_id", toString(*ctx->entityId));
    }
    if (ctx->playerId && ctx->playerId->isValid()) {
        append("player_id", toString(*ctx->playerId));
    }
    for (const auto& [key, val] : ctx->extra) {
        append(key, val);
    }

    if (!first) {
        oss << " {" << fields.str() << '}';
    }
    return oss.str();
}

} // namespace

struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> levels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            levels[i].store(kDefaultLevels[i], std::memory_order_relaxed);
            loggerNames[i] = "msim." +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    // Named category logger if one is registered, otherwise the default.
    std::shared_ptr<kci::ILogger> resolve(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[static_cast<std::size_t>(cat)]);
        if (!logger || logger == kci::GlobalLoggerRegistry::null_logger() ||
            !logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, const std::string& line) const {
        auto logger = resolve(cat);
        if (logger) {
            // Sink failures are not propagated into simulation code.
            (void)logger->log(toKcenonLevel(level), line);
        }
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, formatLine(cat, msg, nullptr));
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, formatLine(cat, msg, &ctx));
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->levels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->levels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto minLevel = getCategoryLevel(cat);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GameResult<void> GameLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (!logger) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerNotInitialized, "no default logger registered"));
    }
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace msim::foundation
