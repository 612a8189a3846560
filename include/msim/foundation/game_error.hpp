#pragma once

/// @file game_error.hpp
/// @brief Error type carried by GameResult<T>.

#include <any>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "msim/foundation/error_code.hpp"

namespace msim::foundation {

/// Error code, readable message and optional typed context. Spawn
/// validation attaches the rejected Vector3 so callers can report it.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code, std::string message = {}, std::any context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    [[nodiscard]] bool is(ErrorCode code) const noexcept { return code_ == code; }

    /// `[Mob 0x0500] unknown mob type: troll`, for logs and stderr.
    [[nodiscard]] std::string describe() const {
        char prefix[32];
        std::snprintf(prefix, sizeof(prefix), " 0x%04X] ", static_cast<unsigned>(code_));
        return "[" + std::string(subsystem()) + prefix + message_;
    }

    /// Typed context, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace msim::foundation
