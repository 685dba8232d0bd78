#include <watchman/core/reconciler/state_reconciler.hpp>
#include <watchman/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <unordered_map>

using namespace Watchman;

StateReconciler::StateReconciler(const TargetRegistry& registry, StatusStore& store, ReconcilePolicy policy)
    : registry_(registry), store_(store), policy_(policy) {
    if (policy_.failure_threshold == 0) {
        policy_.failure_threshold = 1;
    }
    spdlog::debug("[StateReconciler] Initialized with failure_threshold={}", policy_.failure_threshold);
}

uint64_t StateReconciler::lastAppliedRound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_applied_;
}

StatusEntry StateReconciler::classify(const StatusEntry& prior, const ProbeResult& result,
                                      const ReconcilePolicy& policy) {
    StatusEntry next = prior;
    next.endpoint = result.endpoint;
    next.round = result.round;
    next.last_probe_ms = std::max(prior.last_probe_ms, result.timestamp_ms);
    next.last_outcome = result.outcome;
    next.last_reason = result.reason;
    if (result.reported) {
        next.reported = result.reported;
    }

    if (result.isSuccess()) {
        next.health = HealthState::HEALTHY;
        next.consecutive_failures = 0;
        next.last_success_ms = std::max(prior.last_success_ms, result.timestamp_ms);
    } else {
        if (next.consecutive_failures < std::numeric_limits<uint32_t>::max()) {
            ++next.consecutive_failures;
        }
        if (next.consecutive_failures >= policy.failure_threshold) {
            next.health = HealthState::UNHEALTHY;
        }
    }

    if (next.health != prior.health) {
        next.last_transition_ms = next.last_probe_ms;
    }
    return next;
}

ApplyReport StateReconciler::apply(const Round& round) {
    ApplyReport report;
    report.round = round.id;

    std::lock_guard<std::mutex> lock(mutex_);
    if (round.id <= last_applied_) {
        spdlog::debug("[StateReconciler] Discarding round {} (round {} already applied)",
                      round.id, last_applied_);
        return report;
    }

    const auto targets = registry_.snapshot();
    const auto prior = store_.view();

    std::unordered_map<std::string, const ProbeResult*> byTarget;
    byTarget.reserve(round.results.size());
    for (const auto& result : round.results) {
        if (!byTarget.emplace(result.target, &result).second) {
            spdlog::warn("[StateReconciler] Round {} has duplicate results for '{}', keeping the first",
                         round.id, result.target);
        }
    }

    const uint64_t missingAt = round.closed_at_ms != 0 ? round.closed_at_ms : Clock::wall_ms();

    StatusTable next;
    for (const auto& [name, target] : *targets) {
        auto priorIt = prior->entries.find(name);
        const StatusEntry base = priorIt != prior->entries.end()
            ? priorIt->second
            : StatusEntry::placeholder(target);

        StatusEntry entry;
        auto resultIt = byTarget.find(name);
        if (resultIt == byTarget.end()) {
            // Registered after this round's snapshot was taken, or lost by the poller
            ++report.missing;
            const bool neverProbed = priorIt == prior->entries.end();
            if (neverProbed) {
                ++report.unprobed;
                spdlog::info("[StateReconciler] '{}' registered after round {} was snapshotted, "
                             "counted unreachable before its first probe", name, round.id);
            }
            ProbeResult synthesized = ProbeResult::unreachable(
                target, neverProbed
                    ? "registered after round " + std::to_string(round.id) + " started, not probed yet"
                    : "no probe result in round " + std::to_string(round.id));
            synthesized.round = round.id;
            synthesized.timestamp_ms = missingAt;
            entry = classify(base, synthesized, policy_);
        } else if (resultIt->second->endpoint != target.endpoint) {
            // Target was replaced mid-round; this result says nothing about the new endpoint
            ++report.carried;
            entry = base;
            entry.endpoint = target.endpoint;
        } else {
            entry = classify(base, *resultIt->second, policy_);
        }

        if (entry.health != base.health) {
            HealthTransition t;
            t.target = name;
            t.from = base.health;
            t.to = entry.health;
            t.at_ms = entry.last_transition_ms;
            t.reason = entry.last_reason;
            report.transitions.push_back(std::move(t));
        }

        switch (entry.health) {
            case HealthState::HEALTHY:   ++report.healthy; break;
            case HealthState::UNHEALTHY: ++report.unhealthy; break;
            default:                     ++report.unknown; break;
        }
        next.emplace(name, std::move(entry));
    }

    for (const auto& [name, entry] : prior->entries) {
        if (targets->find(name) == targets->end()) {
            ++report.pruned;
            spdlog::info("[StateReconciler] Pruned '{}' (deregistered, was {})", name, toString(entry.health));
        }
    }

    if (!store_.replace(round.id, std::move(next))) {
        // Only this class writes the store, and it writes in round order
        spdlog::error("[StateReconciler] StatusStore refused round {} (store at round {})",
                      round.id, store_.round());
        return report;
    }
    last_applied_ = round.id;
    report.applied = true;

    for (const auto& t : report.transitions) {
        if (t.to == HealthState::UNHEALTHY) {
            spdlog::warn("[StateReconciler] '{}' {} -> {} ({})", t.target, toString(t.from), toString(t.to), t.reason);
        } else {
            spdlog::info("[StateReconciler] '{}' {} -> {}", t.target, toString(t.from), toString(t.to));
        }
    }
    return report;
}
