#include <watchman/core/status/status_entry.hpp>

namespace Watchman {

const char* toString(HealthState state) {
    switch (state) {
        case HealthState::UNKNOWN:   return "UNKNOWN";
        case HealthState::HEALTHY:   return "HEALTHY";
        case HealthState::UNHEALTHY: return "UNHEALTHY";
        default:                     return "INVALID";
    }
}

} // namespace Watchman
