/// @file respawn_scheduler.cpp
/// @brief RespawnScheduler implementation.

#include "msim/game/respawn_scheduler.hpp"

namespace msim::game {

using foundation::MobId;

void RespawnScheduler::Schedule(MobId mobId, int64_t dueMs) {
    Cancel(mobId);
    due_.emplace(mobId, dueMs);
    queue_.emplace(dueMs, mobId);
}

bool RespawnScheduler::Cancel(MobId mobId) {
    auto it = due_.find(mobId);
    if (it == due_.end()) {
        return false;
    }

    queue_.erase(std::make_pair(it->second, mobId));
    due_.erase(it);
    return true;
}

std::vector<MobId> RespawnScheduler::PopDue(int64_t nowMs) {
    std::vector<MobId> ready;
    auto it = queue_.begin();
    while (it != queue_.end() && it->first <= nowMs) {
        ready.push_back(it->second);
        due_.erase(it->second);
        it = queue_.erase(it);
    }
    return ready;
}

bool RespawnScheduler::IsScheduled(MobId mobId) const {
    return due_.count(mobId) > 0;
}

std::optional<int64_t> RespawnScheduler::DueTime(MobId mobId) const {
    auto it = due_.find(mobId);
    if (it == due_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RespawnScheduler::Clear() {
    due_.clear();
    queue_.clear();
}

}  // namespace msim::game
