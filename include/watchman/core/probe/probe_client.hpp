#pragma once

#include <watchman/core/probe/probe_result.hpp>
#include <watchman/core/registry/deployment_target.hpp>

#include <chrono>

namespace Watchman {

/**
 * @class ProbeClient
 * @brief Performs one health/status check against one deployed instance.
 *
 * Implementations must not throw: every failure mode is reported as a
 * ProbeResult outcome. Implementations must be safe to call from several
 * poller workers at once.
 */
class ProbeClient {
public:
    virtual ~ProbeClient() = default;

    virtual ProbeResult probe(const DeploymentTarget& target,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace Watchman
