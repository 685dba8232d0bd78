#pragma once

#include <watchman/core/registry/deployment_target.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace Watchman {

/**
 * Closed set of probe outcomes. Everything a probe can run into is mapped to
 * one of these; the reconciler never looks at raw responses.
 *
 * UNHEALTHY   - the instance answered, but reported a degraded state or the
 *               wrong model ("wrong model serving")
 * UNREACHABLE - nothing answered at the endpoint ("no model serving")
 * TIMEOUT     - no answer within the probe timeout / round deadline
 */
enum class ProbeOutcome : uint8_t {
    HEALTHY = 0,
    UNHEALTHY = 1,
    UNREACHABLE = 2,
    TIMEOUT = 3
};

const char* toString(ProbeOutcome outcome);

/**
 * @struct ProbeResult
 * @brief Immutable outcome of one health check against one target.
 */
struct ProbeResult {
    std::string target;
    std::string endpoint;          // endpoint actually probed
    uint64_t round = 0;
    uint64_t timestamp_ms = 0;     // wall clock, when the outcome was decided
    uint64_t latency_ms = 0;
    ProbeOutcome outcome = ProbeOutcome::UNREACHABLE;
    std::string reason;            // empty for HEALTHY
    std::optional<ModelMetadata> reported;

    bool isSuccess() const { return outcome == ProbeOutcome::HEALTHY; }

    static ProbeResult healthy(const DeploymentTarget& target,
                               std::optional<ModelMetadata> reported = std::nullopt);
    static ProbeResult unhealthy(const DeploymentTarget& target, std::string reason,
                                 std::optional<ModelMetadata> reported = std::nullopt);
    static ProbeResult unreachable(const DeploymentTarget& target, std::string reason);
    static ProbeResult timeout(const DeploymentTarget& target, std::string reason);
};

} // namespace Watchman
