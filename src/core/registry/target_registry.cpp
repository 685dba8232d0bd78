#include <watchman/core/registry/target_registry.hpp>
#include <spdlog/spdlog.h>

using namespace Watchman;

TargetRegistry::TargetRegistry()
    : current_(std::make_shared<const TargetMap>()) {
}

bool TargetRegistry::registerTarget(DeploymentTarget target) {
    validateTarget(target);

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<TargetMap>(*std::atomic_load(&current_));

    auto it = next->find(target.name);
    bool replaced = it != next->end();
    if (replaced) {
        if (it->second == target) {
            spdlog::debug("[TargetRegistry] '{}' re-registered unchanged", target.name);
            return true;
        }
        spdlog::info("[TargetRegistry] Replacing '{}' (endpoint {} -> {})",
                     target.name, it->second.endpoint, target.endpoint);
        it->second = std::move(target);
    } else {
        spdlog::info("[TargetRegistry] Registered '{}' at {}", target.name, target.endpoint);
        std::string name = target.name;
        next->emplace(std::move(name), std::move(target));
    }

    publish(std::move(next));
    return replaced;
}

void TargetRegistry::registerAll(const std::vector<DeploymentTarget>& targets) {
    for (const auto& target : targets) {
        validateTarget(target);
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<TargetMap>(*std::atomic_load(&current_));
    for (const auto& target : targets) {
        (*next)[target.name] = target;
    }
    spdlog::info("[TargetRegistry] Seeded {} targets (total {})", targets.size(), next->size());
    publish(std::move(next));
}

bool TargetRegistry::deregisterTarget(const std::string& name) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = std::atomic_load(&current_);
    if (current->find(name) == current->end()) {
        spdlog::debug("[TargetRegistry] Deregister of unknown '{}' ignored", name);
        return false;
    }

    auto next = std::make_shared<TargetMap>(*current);
    next->erase(name);
    publish(std::move(next));
    spdlog::info("[TargetRegistry] Deregistered '{}'", name);
    return true;
}

TargetRegistry::Snapshot TargetRegistry::snapshot() const {
    return std::atomic_load(&current_);
}

bool TargetRegistry::contains(const std::string& name) const {
    auto snap = snapshot();
    return snap->find(name) != snap->end();
}

size_t TargetRegistry::size() const {
    return snapshot()->size();
}

void TargetRegistry::publish(std::shared_ptr<const TargetMap> next) {
    std::atomic_store(&current_, std::move(next));
    generation_.fetch_add(1, std::memory_order_acq_rel);
}
