#pragma once

#include <watchman/core/registry/deployment_target.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Watchman {

/**
 * @class TargetRegistry
 * @brief Desired set of model deployments ("what should exist").
 *
 * Copy-on-write: writers are serialized by write_mutex_, build a new map and
 * publish it with an atomic pointer store. Readers load the published pointer
 * and never wait for a writer; a snapshot stays valid and unchanged for as
 * long as the caller holds it.
 */
class TargetRegistry {
public:
    using TargetMap = std::map<std::string, DeploymentTarget>;
    using Snapshot = std::shared_ptr<const TargetMap>;

    TargetRegistry();
    ~TargetRegistry() = default;

    TargetRegistry(const TargetRegistry&) = delete;
    TargetRegistry& operator=(const TargetRegistry&) = delete;

    /**
     * @brief Add or replace a target by name (last write wins)
     * @throws InvalidTargetError if the target is malformed
     * @return true if an existing target with that name was replaced
     */
    bool registerTarget(DeploymentTarget target);

    /**
     * @brief Register several targets in one publication
     * @throws InvalidTargetError before anything is published
     */
    void registerAll(const std::vector<DeploymentTarget>& targets);

    /**
     * @brief Remove a target; absent names are not an error
     * @return true if a target was removed
     */
    bool deregisterTarget(const std::string& name);

    /**
     * @brief Immutable view of the current target set
     */
    Snapshot snapshot() const;

    bool contains(const std::string& name) const;
    size_t size() const;

    // Bumped on every published mutation
    uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

private:
    void publish(std::shared_ptr<const TargetMap> next);

    mutable std::mutex write_mutex_;
    std::shared_ptr<const TargetMap> current_;
    std::atomic<uint64_t> generation_{0};
};

} // namespace Watchman
