#pragma once

/**
 * @file sqlite_snapshot_store.hpp
 * @brief Snapshot store persisted in the `snapshots` table
 */

#include <memory>

#include "esflow/sqlite/database.hpp"
#include "esflow/snapshot/snapshot.hpp"

namespace esflow {

class SqliteSnapshotStore : public SnapshotStore {
public:
    explicit SqliteSnapshotStore(std::shared_ptr<sqlite::Database> db);

    void save(const Snapshot& snapshot) override;

    [[nodiscard]] Result<Snapshot> load(
        const std::string& aggregate_id,
        std::optional<SchemaVersion> expected_state_schema = std::nullopt) const override;

    void remove(const std::string& aggregate_id) override;

private:
    std::shared_ptr<sqlite::Database> db_;
};

} // namespace esflow
