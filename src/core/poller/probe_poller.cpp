#include <watchman/core/poller/probe_poller.hpp>
#include <watchman/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Watchman {

namespace {

// Shared between runRound() and the probe tasks of one round. Once closed is
// set, tasks neither start probing nor publish results.
struct RoundState {
    explicit RoundState(size_t n)
        : results(n), started(n, false), remaining(n) {}

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::optional<ProbeResult>> results;
    std::vector<bool> started;
    size_t remaining;
    bool closed = false;
};

} // namespace

ProbePoller::ProbePoller(const TargetRegistry& registry, ProbeClient& client, PollerSettings settings)
    : registry_(registry),
      client_(client),
      settings_(settings),
      pool_(settings.max_in_flight) {
    spdlog::info("[ProbePoller] Initialized (max_in_flight={}, probe_timeout={}ms, round_deadline={}ms)",
                 settings_.max_in_flight, settings_.probe_timeout.count(), settings_.round_deadline.count());
}

ProbePoller::~ProbePoller() {
    pool_.shutdown();
}

Round ProbePoller::runRound() {
    Round round;
    round.id = next_round_.fetch_add(1, std::memory_order_acq_rel);
    round.started_at_ms = Clock::wall_ms();

    // Registry changes after this point belong to the next round
    const auto snapshot = registry_.snapshot();
    std::vector<DeploymentTarget> targets;
    targets.reserve(snapshot->size());
    for (const auto& [name, target] : *snapshot) {
        targets.push_back(target);
    }

    const auto deadline = std::chrono::steady_clock::now() + settings_.round_deadline;
    auto state = std::make_shared<RoundState>(targets.size());
    const uint64_t roundId = round.id;

    for (size_t i = 0; i < targets.size(); ++i) {
        bool queued = pool_.submit([this, state, i, roundId, target = targets[i]]() {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->closed) return;
                state->started[i] = true;
            }

            ProbeResult result;
            try {
                result = client_.probe(target, settings_.probe_timeout);
            } catch (const std::exception& e) {
                // ProbeClient must not throw; keep the failure on this target only
                spdlog::error("[ProbePoller] Probe of '{}' threw: {}", target.name, e.what());
                result = ProbeResult::unreachable(target, std::string("probe raised: ") + e.what());
            }
            result.round = roundId;

            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed) {
                spdlog::debug("[ProbePoller] Late result for '{}' in closed round {} dropped",
                              target.name, roundId);
                return;
            }
            state->results[i] = std::move(result);
            if (--state->remaining == 0) {
                state->cv.notify_all();
            }
        });

        if (!queued) {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto result = ProbeResult::unreachable(targets[i], "poller is shutting down");
            result.round = roundId;
            state->results[i] = std::move(result);
            --state->remaining;
        }
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait_until(lock, deadline, [&state]() { return state->remaining == 0; });
        state->closed = true;

        round.results.reserve(targets.size());
        for (size_t i = 0; i < targets.size(); ++i) {
            if (state->results[i]) {
                round.results.push_back(std::move(*state->results[i]));
                ++round.completed;
                continue;
            }

            auto synthesized = ProbeResult::timeout(targets[i],
                state->started[i] ? "probe did not finish before the round deadline"
                                  : "probe not started before the round deadline");
            synthesized.round = roundId;
            synthesized.latency_ms = static_cast<uint64_t>(settings_.round_deadline.count());
            round.results.push_back(std::move(synthesized));
            ++round.abandoned;
        }
    }
    round.closed_at_ms = Clock::wall_ms();

    if (round.abandoned > 0) {
        total_abandoned_.fetch_add(round.abandoned, std::memory_order_relaxed);
        spdlog::warn("[ProbePoller] Round {} closed with {} of {} probes abandoned at the deadline "
                     "({} still queued, {} running)",
                     round.id, round.abandoned, targets.size(),
                     pool_.getPendingTasks(), pool_.getActiveTasks());
    }

    for (const auto& result : round.results) {
        if (!result.isSuccess()) {
            spdlog::debug("[ProbePoller] Round {} '{}' -> {} ({})",
                          round.id, result.target, toString(result.outcome), result.reason);
        }
    }
    return round;
}

} // namespace Watchman
