#include <watchman/core/status/status_store.hpp>
#include <watchman/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace Watchman {

StatusStore::StatusStore()
    : current_(std::make_shared<const StatusView>()) {
}

bool StatusStore::replace(uint64_t round, StatusTable entries) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto current = std::atomic_load(&current_);
    if (round <= current->round) {
        spdlog::debug("[StatusStore] Rejected table from round {} (current round {})",
                      round, current->round);
        return false;
    }

    auto next = std::make_shared<StatusView>();
    next->round = round;
    next->updated_at_ms = Clock::wall_ms();
    next->entries = std::move(entries);

    std::atomic_store(&current_, std::shared_ptr<const StatusView>(std::move(next)));
    return true;
}

std::optional<StatusEntry> StatusStore::get(const std::string& name) const {
    auto snap = view();
    auto it = snap->entries.find(name);
    if (it == snap->entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<StatusEntry> StatusStore::list() const {
    auto snap = view();
    std::vector<StatusEntry> out;
    out.reserve(snap->entries.size());
    for (const auto& [name, entry] : snap->entries) {
        out.push_back(entry);
    }
    return out;
}

std::shared_ptr<const StatusView> StatusStore::view() const {
    return std::atomic_load(&current_);
}

} // namespace Watchman
