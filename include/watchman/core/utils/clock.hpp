// ============================================================================
// MONOTONIC + WALL CLOCK HELPERS

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace Watchman {

class Clock {
public:
    // Monotonic time in milliseconds (deadlines, latency)
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Wall-clock time in milliseconds since the Unix epoch (reported timestamps)
    static inline uint64_t wall_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    // "2019-06-03T10:15:02.123Z"; empty for 0 (never set)
    static std::string toIso8601(uint64_t epoch_ms) {
        if (epoch_ms == 0) return {};

        std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
        std::tm tm{};
        gmtime_r(&secs, &tm);

        char date[32];
        std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);

        char out[48];
        std::snprintf(out, sizeof(out), "%s.%03uZ", date,
                      static_cast<unsigned>(epoch_ms % 1000));
        return out;
    }
};

} // namespace Watchman
