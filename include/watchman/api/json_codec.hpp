#pragma once

#include <watchman/core/registry/deployment_target.hpp>
#include <watchman/core/status/status_entry.hpp>
#include <watchman/microservice/health_service.hpp>

#include <nlohmann/json.hpp>

// nlohmann::json ADL hooks; they must live in the namespace of the type.
namespace Watchman {

void to_json(nlohmann::json& j, const ModelMetadata& metadata);
void from_json(const nlohmann::json& j, ModelMetadata& metadata);

void to_json(nlohmann::json& j, const DeploymentTarget& target);
// Throws nlohmann::json::exception on missing/mistyped fields
void from_json(const nlohmann::json& j, DeploymentTarget& target);

void to_json(nlohmann::json& j, const StatusEntry& entry);

} // namespace Watchman

namespace watchman::microservice {

void to_json(nlohmann::json& j, const HealthResponse& health);

} // namespace watchman::microservice
