#include <watchman/api/status_api.hpp>
#include <watchman/core/errors.hpp>
#include <watchman/core/probe/endpoint.hpp>

namespace watchman::api {

using Watchman::DeploymentTarget;
using Watchman::StatusEntry;

namespace {

// Stored entry, or a placeholder, under the target's current endpoint
StatusEntry entryFor(const DeploymentTarget& target, const StatusEntry* stored) {
    if (stored == nullptr) {
        return StatusEntry::placeholder(target);
    }
    StatusEntry entry = *stored;
    entry.endpoint = target.endpoint;
    return entry;
}

// One registry snapshot joined with one store view
std::vector<StatusEntry> merge(const Watchman::TargetRegistry::TargetMap& targets,
                               const Watchman::StatusView& view) {
    std::vector<StatusEntry> out;
    out.reserve(targets.size());
    for (const auto& [name, target] : targets) {
        auto it = view.entries.find(name);
        out.push_back(entryFor(target, it != view.entries.end() ? &it->second : nullptr));
    }
    return out;
}

std::string relativeEndpoint(const std::string& url) {
    auto parsed = Watchman::parseEndpoint(url);
    if (!parsed) {
        return url;
    }
    return parsed->base_path + "/";
}

} // namespace

StatusApi::StatusApi(Watchman::TargetRegistry& registry, const Watchman::StatusStore& store,
                     ProjectInfo project)
    : registry_(registry), store_(store), project_(std::move(project)) {
}

std::vector<StatusEntry> StatusApi::listStatus() const {
    return merge(*registry_.snapshot(), *store_.view());
}

StatusEntry StatusApi::getStatus(const std::string& name) const {
    const auto targets = registry_.snapshot();
    auto target = targets->find(name);
    if (target == targets->end()) {
        throw Watchman::TargetNotFoundError(name);
    }

    auto stored = store_.get(name);
    return entryFor(target->second, stored ? &*stored : nullptr);
}

DeploymentTarget StatusApi::registerTarget(DeploymentTarget target) {
    DeploymentTarget accepted = target;
    registry_.registerTarget(std::move(target));
    return accepted;
}

bool StatusApi::deregisterTarget(const std::string& name) {
    return registry_.deregisterTarget(name);
}

std::vector<DeploymentTarget> StatusApi::listTargets() const {
    const auto targets = registry_.snapshot();
    std::vector<DeploymentTarget> out;
    out.reserve(targets->size());
    for (const auto& [name, target] : *targets) {
        out.push_back(target);
    }
    return out;
}

ProjectIndex StatusApi::projectIndex() const {
    ProjectIndex index;
    index.project = project_;
    const auto targets = registry_.snapshot();
    const auto view = store_.view();
    index.round = view->round;

    for (const auto& entry : merge(*targets, *view)) {
        ProjectEndpoint ep;
        ep.target = entry.name;
        ep.endpoint = relativeEndpoint(entry.endpoint);
        ep.url = entry.endpoint;
        ep.health = entry.health;
        ep.metadata = entry.reported;
        index.endpoints.push_back(std::move(ep));
    }
    return index;
}

} // namespace watchman::api
