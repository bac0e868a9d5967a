#include "esflow/snapshot/memory_snapshot_store.hpp"

#include <mutex>

namespace esflow {

void MemorySnapshotStore::save(const Snapshot& snapshot) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = snapshots_.find(snapshot.aggregate_id);
    if (it != snapshots_.end() && it->second.version > snapshot.version) {
        return;
    }
    snapshots_.insert_or_assign(snapshot.aggregate_id, snapshot);
}

Result<Snapshot> MemorySnapshotStore::load(
    const std::string& aggregate_id,
    std::optional<SchemaVersion> expected_state_schema) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = snapshots_.find(aggregate_id);
    if (it == snapshots_.end()) {
        return Error::not_found("no snapshot").with("aggregate_id", aggregate_id);
    }
    return check_snapshot_schema(it->second, expected_state_schema);
}

void MemorySnapshotStore::remove(const std::string& aggregate_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    snapshots_.erase(aggregate_id);
}

std::size_t MemorySnapshotStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshots_.size();
}

} // namespace esflow
