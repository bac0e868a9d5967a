#include "esflow/snapshot/sqlite_snapshot_store.hpp"

namespace esflow {

SqliteSnapshotStore::SqliteSnapshotStore(std::shared_ptr<sqlite::Database> db)
    : db_(std::move(db)) {
    if (!db_) {
        throw ConfigurationError("SqliteSnapshotStore needs a database");
    }
}

void SqliteSnapshotStore::save(const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    // The WHERE clause keeps a stale writer from replacing a newer snapshot
    auto stmt = db_->prepare(
        "INSERT INTO snapshots (aggregate_id, aggregate_type, version, state_schema_version, "
        "state_payload, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
        "ON CONFLICT(aggregate_id) DO UPDATE SET "
        "aggregate_type = excluded.aggregate_type, version = excluded.version, "
        "state_schema_version = excluded.state_schema_version, "
        "state_payload = excluded.state_payload, created_at = excluded.created_at "
        "WHERE excluded.version >= snapshots.version");
    stmt.bind(1, snapshot.aggregate_id)
        .bind(2, snapshot.aggregate_type)
        .bind(3, static_cast<std::int64_t>(snapshot.version))
        .bind(4, static_cast<std::int64_t>(snapshot.state_schema_version))
        .bind(5, snapshot.state_payload.dump())
        .bind(6, format_timestamp(snapshot.created_at));
    stmt.step();
}

Result<Snapshot> SqliteSnapshotStore::load(
    const std::string& aggregate_id,
    std::optional<SchemaVersion> expected_state_schema) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare(
        "SELECT aggregate_type, version, state_schema_version, state_payload, created_at "
        "FROM snapshots WHERE aggregate_id = ?1");
    stmt.bind(1, aggregate_id);
    if (!stmt.step()) {
        return Error::not_found("no snapshot").with("aggregate_id", aggregate_id);
    }

    Snapshot snapshot;
    snapshot.aggregate_id = aggregate_id;
    snapshot.aggregate_type = stmt.column_text(0);
    snapshot.version = static_cast<Version>(stmt.column_int64(1));
    snapshot.state_schema_version = static_cast<SchemaVersion>(stmt.column_int64(2));

    auto payload = Payload::parse(stmt.column_text(3), nullptr, false);
    if (payload.is_discarded()) {
        return Error(ErrorCode::SnapshotIncompatible, "snapshot payload is not valid JSON")
            .with("aggregate_id", aggregate_id);
    }
    snapshot.state_payload = std::move(payload);

    auto created = parse_timestamp(stmt.column_text(4));
    snapshot.created_at = created ? *created : Timestamp{};

    return check_snapshot_schema(std::move(snapshot), expected_state_schema);
}

void SqliteSnapshotStore::remove(const std::string& aggregate_id) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare("DELETE FROM snapshots WHERE aggregate_id = ?1");
    stmt.bind(1, aggregate_id);
    stmt.step();
}

} // namespace esflow
