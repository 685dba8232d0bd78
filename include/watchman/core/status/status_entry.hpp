#pragma once

#include <watchman/core/probe/probe_result.hpp>
#include <watchman/core/registry/deployment_target.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace Watchman {

/**
 * Health classification published for a target.
 * UNKNOWN until the first success or until failures reach the threshold.
 */
enum class HealthState : uint8_t {
    UNKNOWN = 0,
    HEALTHY = 1,
    UNHEALTHY = 2
};

const char* toString(HealthState state);

/**
 * @struct StatusEntry
 * @brief Authoritative per-target state. Written only by StateReconciler.
 */
struct StatusEntry {
    std::string name;
    std::string endpoint;
    HealthState health = HealthState::UNKNOWN;
    uint32_t consecutive_failures = 0;
    uint64_t last_success_ms = 0;      // 0 = never
    uint64_t last_transition_ms = 0;   // 0 = never changed since registration
    uint64_t last_probe_ms = 0;        // freshness
    uint64_t round = 0;                // round that last wrote this entry
    std::optional<ProbeOutcome> last_outcome;
    std::string last_reason;
    std::optional<ModelMetadata> reported;   // from the last probe that carried metadata

    bool isHealthy() const { return health == HealthState::HEALTHY; }

    // Entry for a registered target that no round has covered yet
    static StatusEntry placeholder(const DeploymentTarget& target) {
        StatusEntry e;
        e.name = target.name;
        e.endpoint = target.endpoint;
        return e;
    }
};

using StatusTable = std::map<std::string, StatusEntry>;

} // namespace Watchman
