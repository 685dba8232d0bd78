#pragma once

#include <watchman/core/registry/target_registry.hpp>
#include <watchman/core/status/status_store.hpp>

#include <optional>
#include <string>
#include <vector>

namespace watchman::api {

struct ProjectInfo {
    std::string name;
    std::string version;
};

struct ProjectEndpoint {
    std::string target;
    std::string endpoint;   // path below the serving host, e.g. /gordo/v0/proj/machine-a/
    std::string url;        // endpoint as registered
    Watchman::HealthState health = Watchman::HealthState::UNKNOWN;
    std::optional<Watchman::ModelMetadata> metadata;   // as last reported by the instance
};

/**
 * @brief Project-wide index: every registered target with its health
 */
struct ProjectIndex {
    ProjectInfo project;
    uint64_t round = 0;
    std::vector<ProjectEndpoint> endpoints;
};

/**
 * @class StatusApi
 * @brief Transport independent query/command surface.
 *
 * Reads are filtered through the current registry: a deregistered target is
 * not found from the moment deregistration returns, and a registered target
 * that no round has covered yet reads as UNKNOWN. The endpoint reported is
 * always the registered one.
 */
class StatusApi {
public:
    StatusApi(Watchman::TargetRegistry& registry, const Watchman::StatusStore& store,
              ProjectInfo project = {});

    std::vector<Watchman::StatusEntry> listStatus() const;

    /**
     * @throws Watchman::TargetNotFoundError if name is not registered
     */
    Watchman::StatusEntry getStatus(const std::string& name) const;

    /**
     * @brief Register or replace (last write wins)
     * @throws Watchman::InvalidTargetError
     * @return the target as accepted
     */
    Watchman::DeploymentTarget registerTarget(Watchman::DeploymentTarget target);

    // @return true if the target existed
    bool deregisterTarget(const std::string& name);

    std::vector<Watchman::DeploymentTarget> listTargets() const;

    ProjectIndex projectIndex() const;

    const ProjectInfo& project() const { return project_; }

private:
    Watchman::TargetRegistry& registry_;
    const Watchman::StatusStore& store_;
    ProjectInfo project_;
};

} // namespace watchman::api
