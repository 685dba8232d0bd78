#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace Watchman {

/**
 * @struct ModelMetadata
 * @brief Identity of the model a serving instance is expected to (or reports to) serve.
 *
 * Empty fields in an *expected* ModelMetadata are wildcards.
 */
struct ModelMetadata {
    std::string project;
    std::string model_version;
    std::map<std::string, std::string> labels;
    // Complete /metadata response as reported; null for expected metadata
    nlohmann::json document;

    bool empty() const {
        return project.empty() && model_version.empty() && labels.empty() && document.is_null();
    }

    bool operator==(const ModelMetadata& other) const {
        return project == other.project &&
               model_version == other.model_version &&
               labels == other.labels &&
               document == other.document;
    }
    bool operator!=(const ModelMetadata& other) const { return !(*this == other); }
};

/**
 * Compare what an instance reports against what the target expects.
 * @return std::nullopt on match, otherwise a human readable mismatch reason
 */
std::optional<std::string> describeMismatch(const ModelMetadata& expected,
                                            const ModelMetadata& reported);

/**
 * @struct DeploymentTarget
 * @brief One model deployment Watchman is responsible for.
 */
struct DeploymentTarget {
    std::string name;
    std::string endpoint;      // http://host[:port][/base-path]
    ModelMetadata expected;

    bool operator==(const DeploymentTarget& other) const {
        return name == other.name && endpoint == other.endpoint && expected == other.expected;
    }
    bool operator!=(const DeploymentTarget& other) const { return !(*this == other); }
};

/**
 * Validate a target before it enters the registry.
 * @throws InvalidTargetError describing the first problem found
 */
void validateTarget(const DeploymentTarget& target);

} // namespace Watchman
