#pragma once

/**
 * @file memory_snapshot_store.hpp
 * @brief In-process snapshot store
 */

#include <shared_mutex>
#include <unordered_map>

#include "esflow/snapshot/snapshot.hpp"

namespace esflow {

class MemorySnapshotStore : public SnapshotStore {
public:
    void save(const Snapshot& snapshot) override;

    [[nodiscard]] Result<Snapshot> load(
        const std::string& aggregate_id,
        std::optional<SchemaVersion> expected_state_schema = std::nullopt) const override;

    void remove(const std::string& aggregate_id) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Snapshot> snapshots_;
};

} // namespace esflow
