#pragma once

/// @file entity.hpp
/// @brief Versioned 32-bit entity handle.
///
/// The low 24 bits index a slot, the high 8 bits hold the slot's version so
/// that a handle to a destroyed entity never matches the slot's next owner.

#include <cstdint>
#include <functional>
#include <limits>

namespace msim::ecs {

struct Entity {
    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kIdMask - 1;

    uint32_t raw = kInvalidRaw;

    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace msim::ecs

template <>
struct std::hash<msim::ecs::Entity> {
    std::size_t operator()(const msim::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
