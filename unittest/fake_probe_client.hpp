#pragma once

#include <watchman/core/probe/probe_client.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace Watchman {

/**
 * Scripted ProbeClient for poller and loop tests. Each target name maps to
 * an outcome and a delay; unscripted targets answer HEALTHY immediately.
 */
class FakeProbeClient : public ProbeClient {
public:
    struct Script {
        ProbeOutcome outcome = ProbeOutcome::HEALTHY;
        std::chrono::milliseconds delay{0};
        bool throws = false;
    };

    void script(const std::string& name, Script s) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[name] = s;
    }

    ProbeResult probe(const DeploymentTarget& target, std::chrono::milliseconds timeout) override {
        Script s;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = scripts_.find(target.name);
            if (it != scripts_.end()) s = it->second;
            ++calls_[target.name];
            last_timeout_ = timeout;
        }

        const int now = ++in_flight_;
        int peak = peak_in_flight_.load();
        while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {
        }

        if (s.delay.count() > 0) {
            std::this_thread::sleep_for(s.delay);
        }
        --in_flight_;

        if (s.throws) {
            throw std::runtime_error("scripted failure");
        }
        switch (s.outcome) {
            case ProbeOutcome::HEALTHY:     return ProbeResult::healthy(target);
            case ProbeOutcome::UNHEALTHY:   return ProbeResult::unhealthy(target, "scripted unhealthy");
            case ProbeOutcome::TIMEOUT:     return ProbeResult::timeout(target, "scripted timeout");
            default:                        return ProbeResult::unreachable(target, "scripted unreachable");
        }
    }

    int calls(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(name);
        return it == calls_.end() ? 0 : it->second;
    }

    int peakInFlight() const { return peak_in_flight_.load(); }

    std::chrono::milliseconds lastTimeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Script> scripts_;
    std::map<std::string, int> calls_;
    std::chrono::milliseconds last_timeout_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_in_flight_{0};
};

} // namespace Watchman
