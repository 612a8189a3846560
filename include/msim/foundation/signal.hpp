#pragma once

/// @file signal.hpp
/// @brief Signal<Args...>: synchronous publish/subscribe for typed channels.
///
/// Slots run in the order they were connected. emit() copies the slot list
/// under a shared lock and invokes it unlocked, so a slot may connect,
/// disconnect or emit on the same signal.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace msim::foundation {

/// Observer list dispatching a fixed argument list to every connected slot.
///
/// @code
///   Signal<const MobEvent&> mobChannel;
///   auto id = mobChannel.connect([](const MobEvent& e) { ... });
///   mobChannel.emit(MobDespawn{mobId});
///   mobChannel.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a slot. The returned id is never reused by this signal.
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a slot. Returns false when the id is not connected.
    bool disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        return slots_.erase(id) > 0;
    }

    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

private:
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace msim::foundation
