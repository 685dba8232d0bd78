#pragma once

#include <watchman/core/poller/round.hpp>
#include <watchman/core/reconciler/reconcile_policy.hpp>
#include <watchman/core/registry/target_registry.hpp>
#include <watchman/core/status/status_store.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace Watchman {

struct HealthTransition {
    std::string target;
    HealthState from = HealthState::UNKNOWN;
    HealthState to = HealthState::UNKNOWN;
    uint64_t at_ms = 0;
    std::string reason;
};

/**
 * @struct ApplyReport
 * @brief What one apply() did to the status table.
 */
struct ApplyReport {
    bool applied = false;
    uint64_t round = 0;
    size_t healthy = 0;
    size_t unhealthy = 0;
    size_t unknown = 0;
    size_t pruned = 0;     // entries dropped because their target was deregistered
    size_t missing = 0;    // registered targets with no result in the batch
    size_t unprobed = 0;   // of those, targets no round has covered yet
    size_t carried = 0;    // results ignored because the target's endpoint changed mid-round
    std::vector<HealthTransition> transitions;
};

/**
 * @class StateReconciler
 * @brief Merges one round of probe results with the prior table.
 *
 * The registry decides existence: entries for deregistered targets are pruned,
 * registered targets missing from the batch count as UNREACHABLE. Rounds are
 * applied in id order only; a round not newer than the last applied one is a
 * no-op.
 */
class StateReconciler {
public:
    StateReconciler(const TargetRegistry& registry, StatusStore& store, ReconcilePolicy policy = {});
    ~StateReconciler() = default;

    ApplyReport apply(const Round& round);

    uint64_t lastAppliedRound() const;

    const ReconcilePolicy& policy() const { return policy_; }

    /**
     * @brief Next entry for one target given its prior entry and a new result
     */
    static StatusEntry classify(const StatusEntry& prior, const ProbeResult& result,
                                const ReconcilePolicy& policy);

private:
    const TargetRegistry& registry_;
    StatusStore& store_;
    ReconcilePolicy policy_;

    mutable std::mutex mutex_;   // serializes apply(); guards last_applied_
    uint64_t last_applied_ = 0;
};

} // namespace Watchman
