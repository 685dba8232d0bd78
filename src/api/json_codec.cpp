#include <watchman/api/json_codec.hpp>
#include <watchman/core/utils/clock.hpp>

using nlohmann::json;

namespace Watchman {

namespace {

json timestamp(uint64_t epoch_ms) {
    if (epoch_ms == 0) return nullptr;
    return Clock::toIso8601(epoch_ms);
}

} // namespace

void to_json(json& j, const ModelMetadata& metadata) {
    j = json{
        {"project", metadata.project},
        {"model-version", metadata.model_version},
        {"labels", metadata.labels}
    };
}

void from_json(const json& j, ModelMetadata& metadata) {
    metadata = ModelMetadata{};
    if (j.is_null()) return;

    metadata.project = j.value("project", std::string());
    metadata.model_version = j.value("model-version", std::string());
    if (j.contains("labels") && !j.at("labels").is_null()) {
        metadata.labels = j.at("labels").get<std::map<std::string, std::string>>();
    }
}

void to_json(json& j, const DeploymentTarget& target) {
    j = json{
        {"name", target.name},
        {"endpoint", target.endpoint},
        {"metadata", target.expected}
    };
}

void from_json(const json& j, DeploymentTarget& target) {
    target = DeploymentTarget{};
    j.at("name").get_to(target.name);
    j.at("endpoint").get_to(target.endpoint);
    if (j.contains("metadata")) {
        j.at("metadata").get_to(target.expected);
    }
}

void to_json(json& j, const StatusEntry& entry) {
    j = json{
        {"name", entry.name},
        {"endpoint", entry.endpoint},
        {"health", toString(entry.health)},
        {"healthy", entry.isHealthy()},
        {"consecutive-failures", entry.consecutive_failures},
        {"last-success", timestamp(entry.last_success_ms)},
        {"last-transition", timestamp(entry.last_transition_ms)},
        {"last-probe", timestamp(entry.last_probe_ms)},
        {"last-outcome", entry.last_outcome ? json(toString(*entry.last_outcome)) : json(nullptr)},
        {"reason", entry.last_reason},
        {"round", entry.round}
    };
    if (entry.reported) {
        j["reported-metadata"] = *entry.reported;
    }
}

} // namespace Watchman

namespace watchman::microservice {

void to_json(json& j, const HealthResponse& health) {
    j = json{
        {"status", toString(health.status)},
        {"message", health.message},
        {"last-round", health.last_round},
        {"last-round-at", Watchman::timestamp(health.last_round_at_ms)},
        {"targets", health.targets},
        {"unhealthy-targets", health.unhealthy_targets}
    };
}

} // namespace watchman::microservice
