#include <watchman/core/watch/watch_loop.hpp>
#include <watchman/core/utils/clock.hpp>

using namespace Watchman;

WatchLoop::WatchLoop(ProbePoller& poller,
                     StateReconciler& reconciler,
                     std::chrono::milliseconds interval,
                     watchman::microservice::HealthService* health)
    : poller_(poller),
      reconciler_(reconciler),
      interval_(interval),
      health_(health) {
    spdlog::info("[WatchLoop] Initialized (interval: {}ms, failure threshold: {})",
                 interval_.count(), reconciler_.policy().failure_threshold);
}

WatchLoop::~WatchLoop() noexcept {
    stop();
}

void WatchLoop::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&WatchLoop::loop, this);
    spdlog::info("[WatchLoop] Started watch loop (interval: {}ms)", interval_.count());
}

void WatchLoop::stop() {
    running_.store(false, std::memory_order_release);
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        if (health_ != nullptr) {
            health_->set_ready(false);
        }
        spdlog::info("[WatchLoop] Stopped after {} rounds", roundsApplied());
    }
}

ApplyReport WatchLoop::runOnce() {
    std::lock_guard<std::mutex> tick(tick_mutex_);

    Round round = poller_.runRound();
    ApplyReport report = reconciler_.apply(round);

    if (report.applied) {
        rounds_applied_.fetch_add(1, std::memory_order_relaxed);
        if (health_ != nullptr) {
            health_->record_round(round.id, round.closed_at_ms,
                                  report.healthy + report.unhealthy + report.unknown,
                                  report.unhealthy);
        }
    }
    reportRound(round, report);
    return report;
}

void WatchLoop::loop() {
    while (running_.load(std::memory_order_acquire)) {
        const auto tickStart = std::chrono::steady_clock::now();

        runOnce();

        // Interval is start-to-start; a slow round shortens the sleep
        const auto nextTick = tickStart + interval_;
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_until(lock, nextTick, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }
    }
}

void WatchLoop::reportRound(const Round& round, const ApplyReport& report) {
    if (!report.applied) {
        spdlog::debug("[WatchLoop] Round {} not applied", round.id);
        return;
    }

    const uint64_t elapsed = round.closed_at_ms >= round.started_at_ms
        ? round.closed_at_ms - round.started_at_ms : 0;

    auto log_level = (report.unhealthy == 0 && round.abandoned == 0)
        ? spdlog::level::info
        : spdlog::level::warn;

    spdlog::log(log_level,
                "[WatchLoop] Round {} ({}ms): {} healthy, {} unhealthy, {} unknown | "
                "probes {} done / {} abandoned | {} transitions, {} pruned",
                round.id, elapsed, report.healthy, report.unhealthy, report.unknown,
                round.completed, round.abandoned, report.transitions.size(), report.pruned);

    // Track consecutive rounds with unhealthy targets for escalation
    if (report.unhealthy > 0) {
        consecutive_unhealthy_++;
        if (consecutive_unhealthy_ >= 3) {
            spdlog::error("[WatchLoop] {} targets unhealthy for {} consecutive rounds",
                          report.unhealthy, consecutive_unhealthy_);
        }
    } else {
        if (consecutive_unhealthy_ > 0) {
            spdlog::info("[WatchLoop] Fleet recovered after {} rounds with unhealthy targets",
                         consecutive_unhealthy_);
        }
        consecutive_unhealthy_ = 0;
    }

    if (report.missing > 0 || report.carried > 0) {
        spdlog::info("[WatchLoop] Round {}: {} targets without a result ({} not probed yet), {} replaced mid-round",
                     round.id, report.missing, report.unprobed, report.carried);
    }
}
