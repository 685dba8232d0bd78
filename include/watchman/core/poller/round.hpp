#pragma once

#include <watchman/core/probe/probe_result.hpp>

#include <cstdint>
#include <vector>

namespace Watchman {

/**
 * @struct Round
 * @brief One poll cycle: sequence number, timing, and the complete result batch.
 *
 * Round ids are strictly increasing per poller. The batch holds exactly one
 * result per target in the snapshot the round was started from.
 */
struct Round {
    uint64_t id = 0;
    uint64_t started_at_ms = 0;    // wall clock
    uint64_t closed_at_ms = 0;     // wall clock
    size_t completed = 0;          // probes that returned before the deadline
    size_t abandoned = 0;          // probes replaced by a synthesized TIMEOUT
    std::vector<ProbeResult> results;
};

} // namespace Watchman
