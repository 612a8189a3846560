#pragma once

/// @file game_loop.hpp
/// @brief Fixed-rate tick driver for the mob world.
///
/// The loop invokes one callback per tick with a constant delta time equal
/// to the target frame time, so simulation time does not depend on how long
/// a tick actually took. Overruns are reported, not compensated.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace msim::service {

struct TickMetrics {
    /// Time spent inside the tick callback.
    std::chrono::microseconds updateTime{0};
    /// updateTime divided by the target frame time.
    float budgetUtilization = 0.0f;
    /// Zero-based tick counter.
    uint64_t tickNumber = 0;
    bool overrun = false;
};

/// @code
///   GameLoop loop(20);
///   loop.setTickCallback([&](float dt) { world.tick(dt); });
///   loop.start();
///   signals.waitForShutdown();
///   loop.stop();
/// @endcode
class GameLoop {
public:
    using TickCallback = std::function<void(float deltaTime)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// @param tickRate Ticks per second. Zero selects 20.
    explicit GameLoop(uint32_t tickRate = 20);
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    void setTickCallback(TickCallback callback);
    void setMetricsCallback(MetricsCallback callback);

    /// Run ticks on a dedicated thread. False if already running.
    [[nodiscard]] bool start();

    /// Stop the thread and wait for the current tick to finish.
    void stop();

    /// Run one tick on the calling thread. Only valid while not started.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] uint32_t tickRate() const noexcept { return tickRate_; }
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept { return targetFrameTime_; }
    [[nodiscard]] float deltaSeconds() const noexcept;
    [[nodiscard]] uint64_t tickCount() const noexcept { return tickCount_.load(); }
    [[nodiscard]] uint64_t overrunCount() const noexcept { return overruns_.load(); }

private:
    void run();
    TickMetrics executeTick();

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    std::mutex callbackMutex_;
    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::atomic<uint64_t> overruns_{0};
    std::thread thread_;
};

}  // namespace msim::service
