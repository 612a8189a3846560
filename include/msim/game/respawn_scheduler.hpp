#pragma once

/// @file respawn_scheduler.hpp
/// @brief Time-keyed table of dead mobs waiting to respawn.

#include "msim/foundation/types.hpp"

#include <cstdint>
#include <set>
#include <utility>
#include <optional>
#include <unordered_map>
#include <vector>

namespace msim::game {

/// Maps each dead mob to the simulation time (ms) at which it respawns.
///
/// A mob has at most one pending entry. Due entries are returned in due-time
/// order, ties broken by mob id.
class RespawnScheduler {
public:
    /// Schedule or reschedule @p mobId at @p dueMs.
    void Schedule(foundation::MobId mobId, int64_t dueMs);

    /// Drop the pending entry. False when nothing was scheduled.
    bool Cancel(foundation::MobId mobId);

    /// Remove and return every entry due at or before @p nowMs.
    [[nodiscard]] std::vector<foundation::MobId> PopDue(int64_t nowMs);

    [[nodiscard]] bool IsScheduled(foundation::MobId mobId) const;
    [[nodiscard]] std::optional<int64_t> DueTime(foundation::MobId mobId) const;
    [[nodiscard]] std::size_t Size() const noexcept { return due_.size(); }

    void Clear();

private:
    std::unordered_map<foundation::MobId, int64_t> due_;
    std::set<std::pair<int64_t, foundation::MobId>> queue_;
};

}  // namespace msim::game
