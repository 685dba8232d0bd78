#pragma once

#include <cstdint>

namespace Watchman {

/**
 * @struct ReconcilePolicy
 * @brief Debounce ("flapping") policy applied by the StateReconciler.
 *
 * - Any successful probe:         HEALTHY, failure count reset to 0
 * - Failed probe (any non-success): failure count + 1, health unchanged
 *                                   until the count reaches failure_threshold,
 *                                   then UNHEALTHY
 */
struct ReconcilePolicy {
    // Consecutive failed probes before HEALTHY/UNKNOWN -> UNHEALTHY
    uint32_t failure_threshold = 3;
};

} // namespace Watchman
