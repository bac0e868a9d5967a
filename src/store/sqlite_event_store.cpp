#include "esflow/store/sqlite_event_store.hpp"

namespace esflow {

namespace {

constexpr const char* kSelectColumns =
    "SELECT global_position, event_id, aggregate_id, aggregate_type, event_type, schema_version, "
    "sequence_number, occurred_at, correlation_id, causation_id, payload FROM events ";

StoredEvent row_to_event(const sqlite::Statement& stmt) {
    EventRecord record;
    record.event_id = stmt.column_text(1);
    record.aggregate_id = stmt.column_text(2);
    record.aggregate_type = stmt.column_text(3);
    record.event_type = stmt.column_text(4);
    record.schema_version = static_cast<SchemaVersion>(stmt.column_int64(5));
    record.sequence_number = static_cast<Version>(stmt.column_int64(6));

    auto occurred = parse_timestamp(stmt.column_text(7));
    if (!occurred) {
        throw StoreUnavailable("corrupt occurred_at for event " + record.event_id);
    }
    record.occurred_at = *occurred;
    record.correlation_id = stmt.column_text(8);
    record.causation_id = stmt.column_text(9);

    try {
        record.payload = Payload::parse(stmt.column_text(10));
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreUnavailable("corrupt payload for event " + record.event_id + ": " + e.what());
    }

    return StoredEvent{static_cast<std::uint64_t>(stmt.column_int64(0)),
                       Event::rehydrate(std::move(record))};
}

} // namespace

SqliteEventStore::SqliteEventStore(std::shared_ptr<sqlite::Database> db, bool stage_outbox)
    : db_(std::move(db))
    , stage_outbox_(stage_outbox)
    , logger_(logging::get("esflow.store")) {
    if (!db_) {
        throw ConfigurationError("SqliteEventStore needs a database");
    }
}

Version SqliteEventStore::current_version_locked(const std::string& aggregate_id) const {
    auto stmt = db_->prepare("SELECT COALESCE(MAX(sequence_number), 0) FROM events WHERE aggregate_id = ?1");
    stmt.bind(1, aggregate_id);
    stmt.step();
    return static_cast<Version>(stmt.column_int64(0));
}

Result<Version> SqliteEventStore::append(
    const std::string& aggregate_id,
    Version expected_version,
    const std::vector<NewEvent>& events,
    const CancellationToken& cancel) {
    auto valid = validate_append_batch(aggregate_id, events);
    if (!valid.ok()) {
        return valid.error();
    }

    std::lock_guard<std::mutex> lock(db_->mutex());
    sqlite::Transaction tx(*db_);

    Version current = current_version_locked(aggregate_id);
    if (current != expected_version) {
        logger_->warn("Append to '{}' rejected: expected v{}, actual v{}",
                      aggregate_id, expected_version, current);
        return Error::conflict(aggregate_id, expected_version, current);
    }
    if (cancel.is_cancelled()) {
        return Error::cancelled("append cancelled before commit").with("aggregate_id", aggregate_id);
    }
    if (events.empty()) {
        return current;
    }

    auto insert = db_->prepare(
        "INSERT INTO events (event_id, aggregate_id, aggregate_type, event_type, schema_version, "
        "sequence_number, occurred_at, correlation_id, causation_id, payload) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");
    auto outbox = db_->prepare(
        "INSERT OR IGNORE INTO outbox_events (message_id, payload, processed, created_at) "
        "VALUES (?1, ?2, 0, ?3)");

    std::size_t i = 0;
    try {
        for (; i < events.size(); i++) {
            const auto& pending = events[i];
            Version sequence = current + i + 1;
            std::string occurred = format_timestamp(pending.occurred_at());

            insert.reset();
            insert.bind(1, pending.event_id())
                .bind(2, aggregate_id)
                .bind(3, pending.aggregate_type())
                .bind(4, pending.event_type())
                .bind(5, static_cast<std::int64_t>(pending.schema_version()))
                .bind(6, static_cast<std::int64_t>(sequence))
                .bind(7, occurred)
                .bind(8, pending.correlation_id())
                .bind(9, pending.causation_id())
                .bind(10, pending.payload().dump());
            insert.step();

            if (stage_outbox_) {
                Event appended = Event::appended(pending, sequence);
                outbox.reset();
                outbox.bind(1, appended.event_id())
                    .bind(2, event_to_json(appended).dump())
                    .bind(3, format_timestamp(now_utc()));
                outbox.step();
            }
        }
    } catch (const sqlite::SqliteError& e) {
        if (!e.is_constraint()) {
            throw;
        }
        tx.rollback();

        // Whatever is left after the rollback was stored by earlier appends
        auto stored = db_->prepare("SELECT 1 FROM events WHERE event_id = ?1");
        stored.bind(1, events[i].event_id());
        if (stored.step()) {
            logger_->warn("Append to '{}' rejected: event {} is already stored",
                          aggregate_id, events[i].event_id());
            return Error::validation("duplicate event_id")
                .with("aggregate_id", aggregate_id)
                .with("event_id", events[i].event_id());
        }
        Version actual = current_version_locked(aggregate_id);
        logger_->warn("Append to '{}' lost a race: {}", aggregate_id, e.what());
        return Error::conflict(aggregate_id, expected_version, actual);
    }

    tx.commit();
    Version new_version = current + events.size();
    logger_->debug("Appended {} event(s) to '{}' (v{} -> v{})",
                   events.size(), aggregate_id, current, new_version);
    return new_version;
}

Result<std::vector<Event>> SqliteEventStore::read(const std::string& aggregate_id, Version from_version) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare(std::string(kSelectColumns) +
                             "WHERE aggregate_id = ?1 AND sequence_number > ?2 ORDER BY sequence_number ASC");
    stmt.bind(1, aggregate_id).bind(2, static_cast<std::int64_t>(from_version));

    std::vector<Event> result;
    while (stmt.step()) {
        result.push_back(row_to_event(stmt).event);
    }
    return result;
}

Result<std::vector<StoredEvent>> SqliteEventStore::read_all(std::uint64_t after_position, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare(std::string(kSelectColumns) +
                             "WHERE global_position > ?1 ORDER BY global_position ASC LIMIT ?2");
    stmt.bind(1, static_cast<std::int64_t>(after_position))
        .bind(2, limit == 0 ? std::int64_t{-1} : static_cast<std::int64_t>(limit));

    std::vector<StoredEvent> result;
    while (stmt.step()) {
        result.push_back(row_to_event(stmt));
    }
    return result;
}

Result<Version> SqliteEventStore::current_version(const std::string& aggregate_id) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    return current_version_locked(aggregate_id);
}

} // namespace esflow
