#pragma once

#include <watchman/core/status/status_entry.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Watchman {

/**
 * @struct StatusView
 * @brief One fully reconciled table, immutable once published.
 */
struct StatusView {
    uint64_t round = 0;          // 0 = nothing reconciled yet
    uint64_t updated_at_ms = 0;
    StatusTable entries;
};

/**
 * @class StatusStore
 * @brief Holds the current authoritative status table.
 *
 * Single writer (StateReconciler), many readers. replace() publishes a whole
 * new StatusView with one atomic pointer store, so a reader either sees the
 * old table or the new one, never a mix.
 */
class StatusStore {
public:
    StatusStore();
    ~StatusStore() = default;

    StatusStore(const StatusStore&) = delete;
    StatusStore& operator=(const StatusStore&) = delete;

    /**
     * @brief Publish the table produced by a round
     * @return false (and nothing published) if round is not newer than the current one
     */
    bool replace(uint64_t round, StatusTable entries);

    std::optional<StatusEntry> get(const std::string& name) const;
    std::vector<StatusEntry> list() const;

    // Consistent point-in-time view; stays valid while held
    std::shared_ptr<const StatusView> view() const;

    uint64_t round() const { return view()->round; }

private:
    std::mutex write_mutex_;
    std::shared_ptr<const StatusView> current_;
};

} // namespace Watchman
