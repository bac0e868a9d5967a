#include "esflow/snapshot/snapshot.hpp"

namespace esflow {

Result<Snapshot> check_snapshot_schema(Snapshot snapshot, std::optional<SchemaVersion> expected_state_schema) {
    if (expected_state_schema && snapshot.state_schema_version != *expected_state_schema) {
        return Error(ErrorCode::SnapshotIncompatible,
                     "snapshot state schema v" + std::to_string(snapshot.state_schema_version) +
                     " does not match expected v" + std::to_string(*expected_state_schema))
            .with("aggregate_id", snapshot.aggregate_id);
    }
    return snapshot;
}

} // namespace esflow
