#pragma once

/// @file result.hpp
/// @brief Result<T,E> value-or-error type used across the simulation.

#include <string>
#include <utility>
#include <variant>

namespace msim {

/// Minimal error payload for Result when no richer type is needed.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a success value or an error, never both.
///
/// Operations that can fail in the mob simulation return Result<T, E>.
/// Exceptions thrown by third-party code are caught at the boundary and
/// converted into an error value.
///
/// @tparam T The success value type.
/// @tparam E The error type (defaults to msim::Error).
///
/// Example:
/// @code
///   auto spawned = mobSystem.SpawnMob(config, position);
///   if (!spawned) {
///       MSIM_LOG_WARN(LogCategory::AI, std::string(spawned.error().message()));
///       return;
///   }
///   auto mobId = spawned.value();
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<E>(data_); }

    /// True when the result carries a value.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Success value. Only valid when hasValue().
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Error payload. Only valid when hasError().
    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }
    [[nodiscard]] E& error() & { return std::get<E>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(E error) : data_(std::move(error)) {}

    std::variant<T, E> data_;
};

/// Result for operations that succeed without producing a value.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace msim
