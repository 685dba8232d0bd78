/**
 * @file health_service.cpp
 * @brief Health service implementation
 */

#include <watchman/microservice/health_service.hpp>
#include <watchman/core/utils/clock.hpp>

namespace watchman::microservice {

const char* toString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:   return "healthy";
        case HealthStatus::DEGRADED:  return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
        default:                      return "unknown";
    }
}

HealthService::HealthService(uint64_t stale_after_ms)
    : stale_after_ms_(stale_after_ms) {
}

bool HealthService::is_alive() const {
    return true;  // If we're running, we're alive
}

bool HealthService::is_ready() const {
    return ready_.load(std::memory_order_acquire);
}

HealthResponse HealthService::get_health() const {
    HealthResponse response;
    response.last_round = last_round_.load(std::memory_order_relaxed);
    response.last_round_at_ms = last_round_at_ms_.load(std::memory_order_relaxed);
    response.targets = targets_.load(std::memory_order_relaxed);
    response.unhealthy_targets = unhealthy_.load(std::memory_order_relaxed);

    const uint64_t now = Watchman::Clock::wall_ms();
    const uint64_t age = now > response.last_round_at_ms ? now - response.last_round_at_ms : 0;

    if (!is_ready()) {
        response.status = HealthStatus::UNHEALTHY;
        response.message = "No round reconciled yet";
    } else if (stale_after_ms_ > 0 && age > stale_after_ms_) {
        response.status = HealthStatus::DEGRADED;
        response.message = "Last reconciled round is " + std::to_string(age) + "ms old";
    } else {
        response.status = HealthStatus::HEALTHY;
        response.message = "OK";
    }

    return response;
}

void HealthService::record_round(uint64_t round, uint64_t at_ms, size_t targets, size_t unhealthy) {
    last_round_.store(round, std::memory_order_relaxed);
    last_round_at_ms_.store(at_ms, std::memory_order_relaxed);
    targets_.store(targets, std::memory_order_relaxed);
    unhealthy_.store(unhealthy, std::memory_order_relaxed);
    ready_.store(true, std::memory_order_release);
}

void HealthService::set_ready(bool ready) {
    ready_.store(ready, std::memory_order_release);
}

} // namespace watchman::microservice
