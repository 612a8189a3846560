#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the simulation modules.

#include <cstdint>
#include <functional>
#include <string>

namespace msim::foundation {

/// Tag-based strong typedef so that mob, entity and player ids cannot be
/// mixed up while sharing one integral representation.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EntityIdTag {};
struct PlayerIdTag {};

/// Identifier of an entity in the world entity layer.
using EntityId = StrongId<EntityIdTag>;

/// Identifier of a connected player.
using PlayerId = StrongId<PlayerIdTag>;

/// A mob is addressed by the id of the entity that represents it.
using MobId = EntityId;

/// Printable form used in logs and event payloads.
template <typename Tag, typename T>
std::string toString(const StrongId<Tag, T>& id) {
    return std::to_string(id.value());
}

} // namespace msim::foundation

template <typename Tag, typename T>
struct std::hash<msim::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const msim::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
