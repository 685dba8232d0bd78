#pragma once

#include <watchman/core/poller/round.hpp>
#include <watchman/core/probe/probe_client.hpp>
#include <watchman/core/registry/target_registry.hpp>
#include <watchman/core/utils/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace Watchman {

struct PollerSettings {
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds round_deadline{5000};
    size_t max_in_flight = 16;
};

/**
 * @class ProbePoller
 * @brief Fans one round of probes out over a bounded worker pool.
 *
 * runRound() snapshots the registry, queues one probe per target and waits
 * until every probe has reported or the round deadline passes. Probes that
 * are still queued or running at the deadline are abandoned: the round gets a
 * synthesized TIMEOUT for them and whatever they produce later is dropped.
 */
class ProbePoller {
public:
    ProbePoller(const TargetRegistry& registry, ProbeClient& client, PollerSettings settings);
    ~ProbePoller();

    ProbePoller(const ProbePoller&) = delete;
    ProbePoller& operator=(const ProbePoller&) = delete;

    /**
     * @brief Run one complete round; blocks for at most the round deadline
     */
    Round runRound();

    // Id the next round will get
    uint64_t nextRoundId() const { return next_round_.load(std::memory_order_acquire); }

    uint64_t totalAbandoned() const { return total_abandoned_.load(std::memory_order_relaxed); }

    const PollerSettings& settings() const { return settings_; }

private:
    const TargetRegistry& registry_;
    ProbeClient& client_;
    PollerSettings settings_;
    ThreadPool pool_;

    std::atomic<uint64_t> next_round_{1};
    std::atomic<uint64_t> total_abandoned_{0};
};

} // namespace Watchman
