#pragma once

#include <atomic>
#include <chrono>
#include <thread>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <spdlog/spdlog.h>

#include <watchman/core/poller/probe_poller.hpp>
#include <watchman/core/reconciler/state_reconciler.hpp>
#include <watchman/microservice/health_service.hpp>

namespace Watchman {

class WatchLoop {
public:
    WatchLoop(ProbePoller& poller,
              StateReconciler& reconciler,
              std::chrono::milliseconds interval,
              watchman::microservice::HealthService* health = nullptr);
    ~WatchLoop() noexcept;

    void start();
    void stop();

    /**
     * @brief One tick: poll a round, reconcile it, report
     * Called by the loop thread; also usable directly (cold start, tests)
     */
    ApplyReport runOnce();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    uint64_t roundsApplied() const { return rounds_applied_.load(std::memory_order_relaxed); }

private:
    void loop();
    void reportRound(const Round& round, const ApplyReport& report);

    ProbePoller& poller_;
    StateReconciler& reconciler_;
    std::chrono::milliseconds interval_;
    watchman::microservice::HealthService* health_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> rounds_applied_{0};
    std::thread worker_thread_;

    // Only the loop thread calls runOnce() while running
    std::mutex tick_mutex_;
    int consecutive_unhealthy_ = 0;   // guarded by tick_mutex_

    // For interruptible sleep during shutdown
    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace Watchman
