/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "msim/service/game_loop.hpp"

namespace msim::service {

namespace {

constexpr uint32_t kDefaultTickRate = 20;

} // namespace

GameLoop::GameLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : kDefaultTickRate),
      targetFrameTime_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::setTickCallback(TickCallback callback) {
    std::lock_guard lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

bool GameLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    thread_ = std::thread([this] { run(); });
    return true;
}

void GameLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

TickMetrics GameLoop::tick() {
    return executeTick();
}

float GameLoop::deltaSeconds() const noexcept {
    return static_cast<float>(targetFrameTime_.count()) / 1'000'000.0f;
}

void GameLoop::run() {
    auto nextTick = std::chrono::steady_clock::now();

    while (running_.load()) {
        nextTick += targetFrameTime_;
        executeTick();

        auto now = std::chrono::steady_clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
        } else {
            // Behind schedule: restart pacing from now instead of bursting.
            nextTick = now;
        }
    }
}

TickMetrics GameLoop::executeTick() {
    std::lock_guard lock(callbackMutex_);

    auto start = std::chrono::steady_clock::now();
    if (tickCallback_) {
        tickCallback_(deltaSeconds());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    TickMetrics metrics;
    metrics.updateTime = elapsed;
    metrics.budgetUtilization = static_cast<float>(elapsed.count()) /
                                static_cast<float>(targetFrameTime_.count());
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = elapsed > targetFrameTime_;
    if (metrics.overrun) {
        overruns_.fetch_add(1);
    }

    if (metricsCallback_) {
        metricsCallback_(metrics);
    }
    return metrics;
}

}  // namespace msim::service
