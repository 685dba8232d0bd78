/**
 * @file health_service.hpp
 * @brief Watchman's own health (as opposed to the fleet's)
 *
 * Backs GET /healthcheck so Kubernetes liveness/readiness probes and
 * monitoring can tell whether the watch loop is alive and current.
 */

#pragma once

#include <string>
#include <atomic>
#include <cstdint>

namespace watchman::microservice {

/**
 * @brief Health status enumeration
 */
enum class HealthStatus {
    UNKNOWN,
    HEALTHY,
    DEGRADED,
    UNHEALTHY
};

const char* toString(HealthStatus status);

/**
 * @brief Health check response
 */
struct HealthResponse {
    HealthStatus status = HealthStatus::UNKNOWN;
    std::string message;
    uint64_t last_round = 0;
    uint64_t last_round_at_ms = 0;
    size_t targets = 0;
    size_t unhealthy_targets = 0;
};

/**
 * @brief Health service for Watchman
 */
class HealthService {
public:
    /**
     * @param stale_after_ms Report DEGRADED when no round was applied for this
     *                       long (0 disables the check)
     */
    explicit HealthService(uint64_t stale_after_ms = 0);
    ~HealthService() = default;

    /**
     * @brief Liveness check - is the process alive?
     */
    bool is_alive() const;

    /**
     * @brief Readiness check - has at least one round been reconciled?
     */
    bool is_ready() const;

    /**
     * @brief Get detailed health status
     */
    HealthResponse get_health() const;

    /**
     * @brief Record an applied round; marks the service ready
     */
    void record_round(uint64_t round, uint64_t at_ms, size_t targets, size_t unhealthy);

    // Cleared when the watch loop stops
    void set_ready(bool ready);

private:
    uint64_t stale_after_ms_;
    std::atomic<bool> ready_{false};
    std::atomic<uint64_t> last_round_{0};
    std::atomic<uint64_t> last_round_at_ms_{0};
    std::atomic<size_t> targets_{0};
    std::atomic<size_t> unhealthy_{0};
};

} // namespace watchman::microservice
