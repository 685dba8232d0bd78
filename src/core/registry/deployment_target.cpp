#include <watchman/core/registry/deployment_target.hpp>
#include <watchman/core/probe/endpoint.hpp>
#include <watchman/core/errors.hpp>

namespace Watchman {

std::optional<std::string> describeMismatch(const ModelMetadata& expected,
                                            const ModelMetadata& reported) {
    if (!expected.project.empty() && expected.project != reported.project) {
        return "project mismatch: expected '" + expected.project +
               "', instance reports '" + reported.project + "'";
    }
    if (!expected.model_version.empty() && expected.model_version != reported.model_version) {
        return "model version mismatch: expected '" + expected.model_version +
               "', instance reports '" + reported.model_version + "'";
    }
    for (const auto& [key, value] : expected.labels) {
        auto it = reported.labels.find(key);
        if (it == reported.labels.end()) {
            return "label '" + key + "' missing from instance metadata";
        }
        if (it->second != value) {
            return "label '" + key + "' mismatch: expected '" + value +
                   "', instance reports '" + it->second + "'";
        }
    }
    return std::nullopt;
}

void validateTarget(const DeploymentTarget& target) {
    if (target.name.empty()) {
        throw InvalidTargetError("Target name must not be empty");
    }
    if (target.name.find('/') != std::string::npos) {
        throw InvalidTargetError("Target name must not contain '/': " + target.name);
    }
    if (target.endpoint.empty()) {
        throw InvalidTargetError("Target '" + target.name + "' has no endpoint");
    }
    if (!parseEndpoint(target.endpoint)) {
        throw InvalidTargetError("Target '" + target.name +
                                 "' has an invalid endpoint (expected http://host[:port][/path]): " +
                                 target.endpoint);
    }
}

} // namespace Watchman
