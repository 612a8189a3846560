#pragma once

/// @file player_directory.hpp
/// @brief Read-only view of connected players used by mob perception.

#include "msim/foundation/types.hpp"
#include "msim/game/math_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace msim::game {

/// Snapshot of the player fields the mob simulation reads.
struct PlayerView {
    foundation::PlayerId id;
    /// Absent while the player has no valid world position (loading, dead).
    std::optional<Vector3> position;
    int32_t combatLevel = 1;
    int32_t health = 1;
};

/// Source of connected players. Owned by the host, queried every AI tick.
class IPlayerDirectory {
public:
    virtual ~IPlayerDirectory() = default;

    /// All connected players in a stable iteration order.
    [[nodiscard]] virtual std::vector<PlayerView> ConnectedPlayers() const = 0;

    /// The player with @p id, or nullopt once disconnected.
    [[nodiscard]] virtual std::optional<PlayerView> FindPlayer(foundation::PlayerId id) const = 0;
};

/// In-memory directory kept up to date by the host.
class PlayerRegistry final : public IPlayerDirectory {
public:
    /// Add or replace a player.
    void Upsert(const PlayerView& player);

    /// Returns false when the player was not connected.
    bool Remove(foundation::PlayerId id);

    /// Returns false when the player is not connected.
    bool SetPosition(foundation::PlayerId id, const Vector3& position);
    bool SetHealth(foundation::PlayerId id, int32_t health);

    [[nodiscard]] std::size_t Count() const noexcept { return players_.size(); }

    [[nodiscard]] std::vector<PlayerView> ConnectedPlayers() const override;
    [[nodiscard]] std::optional<PlayerView> FindPlayer(foundation::PlayerId id) const override;

private:
    std::map<foundation::PlayerId, PlayerView> players_;
};

}  // namespace msim::game
