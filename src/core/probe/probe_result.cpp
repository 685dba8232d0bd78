#include <watchman/core/probe/probe_result.hpp>
#include <watchman/core/utils/clock.hpp>

namespace Watchman {

namespace {

ProbeResult make(const DeploymentTarget& target, ProbeOutcome outcome, std::string reason,
                 std::optional<ModelMetadata> reported) {
    ProbeResult r;
    r.target = target.name;
    r.endpoint = target.endpoint;
    r.timestamp_ms = Clock::wall_ms();
    r.outcome = outcome;
    r.reason = std::move(reason);
    r.reported = std::move(reported);
    return r;
}

} // namespace

const char* toString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::HEALTHY:     return "HEALTHY";
        case ProbeOutcome::UNHEALTHY:   return "UNHEALTHY";
        case ProbeOutcome::UNREACHABLE: return "UNREACHABLE";
        case ProbeOutcome::TIMEOUT:     return "TIMEOUT";
        default:                        return "UNKNOWN";
    }
}

ProbeResult ProbeResult::healthy(const DeploymentTarget& target,
                                 std::optional<ModelMetadata> reported) {
    return make(target, ProbeOutcome::HEALTHY, {}, std::move(reported));
}

ProbeResult ProbeResult::unhealthy(const DeploymentTarget& target, std::string reason,
                                   std::optional<ModelMetadata> reported) {
    return make(target, ProbeOutcome::UNHEALTHY, std::move(reason), std::move(reported));
}

ProbeResult ProbeResult::unreachable(const DeploymentTarget& target, std::string reason) {
    return make(target, ProbeOutcome::UNREACHABLE, std::move(reason), std::nullopt);
}

ProbeResult ProbeResult::timeout(const DeploymentTarget& target, std::string reason) {
    return make(target, ProbeOutcome::TIMEOUT, std::move(reason), std::nullopt);
}

} // namespace Watchman
