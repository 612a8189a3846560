#pragma once

/// @file error_code.hpp
/// @brief Error codes for the mob simulation, grouped by subsystem.

#include <cstdint>
#include <string_view>

namespace msim::foundation {

/// Error codes grouped into 256-value subsystem ranges.
///
/// The high byte identifies the subsystem, so the origin of an error can be
/// read from the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // ECS (0x0100 - 0x01FF)
    EntityNotFound = 0x0100,
    ComponentNotFound = 0x0101,
    EntityLimitReached = 0x0102,

    // Config (0x0200 - 0x02FF)
    ConfigLoadFailed = 0x0200,
    ConfigKeyNotFound = 0x0201,
    ConfigTypeMismatch = 0x0202,

    // Logger (0x0300 - 0x03FF)
    LoggerError = 0x0300,
    LoggerNotInitialized = 0x0301,
    LoggerFlushFailed = 0x0302,

    // World (0x0400 - 0x04FF)
    InvalidPosition = 0x0400,
    PositionOutOfBounds = 0x0401,
    InvalidEntityKind = 0x0402,

    // Mob (0x0500 - 0x05FF)
    UnknownMobType = 0x0500,
    MobNotFound = 0x0501,
    MobNotAlive = 0x0502,
    RegistrationTimeout = 0x0503,

    // Service (0x0600 - 0x06FF)
    GameLoopAlreadyRunning = 0x0600,
    WorldNotInitialized = 0x0601,
};

/// Subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "ECS";
        case 0x0200: return "Config";
        case 0x0300: return "Logger";
        case 0x0400: return "World";
        case 0x0500: return "Mob";
        case 0x0600: return "Service";
        default: return "Unknown";
    }
}

} // namespace msim::foundation
