/// @file player_directory.cpp
/// @brief PlayerRegistry implementation.

#include "msim/game/player_directory.hpp"

namespace msim::game {

using foundation::PlayerId;

void PlayerRegistry::Upsert(const PlayerView& player) {
    players_[player.id] = player;
}

bool PlayerRegistry::Remove(PlayerId id) {
    return players_.erase(id) > 0;
}

bool PlayerRegistry::SetPosition(PlayerId id, const Vector3& position) {
    auto it = players_.find(id);
    if (it == players_.end()) {
        return false;
    }
    it->second.position = position;
    return true;
}

bool PlayerRegistry::SetHealth(PlayerId id, int32_t health) {
    auto it = players_.find(id);
    if (it == players_.end()) {
        return false;
    }
    it->second.health = health;
    return true;
}

std::vector<PlayerView> PlayerRegistry::ConnectedPlayers() const {
    std::vector<PlayerView> result;
    result.reserve(players_.size());
    for (const auto& [id, view] : players_) {
        result.push_back(view);
    }
    return result;
}

std::optional<PlayerView> PlayerRegistry::FindPlayer(PlayerId id) const {
    auto it = players_.find(id);
    if (it == players_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace msim::game
