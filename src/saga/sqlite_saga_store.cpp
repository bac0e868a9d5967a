#include "esflow/saga/sqlite_saga_store.hpp"

namespace esflow {

namespace {

constexpr const char* kSelectColumns =
    "SELECT saga_id, saga_type, status, data, progress, version, updated_at FROM sagas ";

Payload progress_to_json(const SagaInstance& instance) {
    Payload log = Payload::array();
    for (const auto& record : instance.compensation_log) {
        log.push_back({
            {"step", record.step},
            {"command_type", record.command_type},
            {"succeeded", record.succeeded},
            {"error", record.error},
            {"at", format_timestamp(record.at)}
        });
    }
    return Payload{
        {"completed_steps", instance.completed_steps},
        {"compensation_log", std::move(log)},
        {"retry_count", instance.retry_count},
        {"failure_reason", instance.failure_reason}
    };
}

// Rows are only written by this store; a malformed one means the file was edited
SagaInstance row_to_instance(const sqlite::Statement& stmt) {
    SagaInstance instance;
    instance.saga_id = stmt.column_text(0);
    instance.saga_type = stmt.column_text(1);

    auto status = saga_status_from_string(stmt.column_text(2));
    if (!status) {
        throw StoreUnavailable("saga '" + instance.saga_id + "' has unknown status '" +
                               stmt.column_text(2) + "'");
    }
    instance.status = *status;

    auto data = Payload::parse(stmt.column_text(3), nullptr, false);
    auto progress = Payload::parse(stmt.column_text(4), nullptr, false);
    if (data.is_discarded() || progress.is_discarded() || !progress.is_object()) {
        throw StoreUnavailable("saga '" + instance.saga_id + "' has a corrupt row");
    }
    instance.data = std::move(data);

    try {
        instance.completed_steps = progress.value("completed_steps", std::vector<std::string>{});
        instance.retry_count = progress.value("retry_count", std::uint32_t{0});
        instance.failure_reason = progress.value("failure_reason", std::string{});
        for (const auto& entry : progress.value("compensation_log", Payload::array())) {
            CompensationRecord record;
            record.step = entry.at("step").get<std::string>();
            record.command_type = entry.value("command_type", std::string{});
            record.succeeded = entry.value("succeeded", false);
            record.error = entry.value("error", std::string{});
            auto at = parse_timestamp(entry.value("at", std::string{}));
            record.at = at ? *at : Timestamp{};
            instance.compensation_log.push_back(std::move(record));
        }
    } catch (const nlohmann::json::exception& e) {
        throw StoreUnavailable("saga '" + instance.saga_id + "' has corrupt progress: " + e.what());
    }

    instance.version = static_cast<Version>(stmt.column_int64(5));
    auto updated = parse_timestamp(stmt.column_text(6));
    instance.updated_at = updated ? *updated : Timestamp{};
    return instance;
}

} // namespace

SqliteSagaStore::SqliteSagaStore(std::shared_ptr<sqlite::Database> db)
    : db_(std::move(db)) {
    if (!db_) {
        throw ConfigurationError("SqliteSagaStore needs a database");
    }
}

Result<SagaInstance> SqliteSagaStore::load(const std::string& saga_id) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare(std::string(kSelectColumns) + "WHERE saga_id = ?1");
    stmt.bind(1, saga_id);
    if (!stmt.step()) {
        return Error::not_found("no saga instance").with("saga_id", saga_id);
    }
    return row_to_instance(stmt);
}

Result<Version> SqliteSagaStore::save(const SagaInstance& instance, Version expected_version) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    sqlite::Transaction tx(*db_);

    Version actual = 0;
    {
        auto stmt = db_->prepare("SELECT version FROM sagas WHERE saga_id = ?1");
        stmt.bind(1, instance.saga_id);
        if (stmt.step()) {
            actual = static_cast<Version>(stmt.column_int64(0));
        }
    }
    if (actual != expected_version) {
        return Error::conflict(instance.saga_id, expected_version, actual);
    }

    Version next = expected_version + 1;
    auto stmt = db_->prepare(
        "INSERT INTO sagas (saga_id, saga_type, status, data, progress, version, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
        "ON CONFLICT(saga_id) DO UPDATE SET "
        "saga_type = excluded.saga_type, status = excluded.status, data = excluded.data, "
        "progress = excluded.progress, version = excluded.version, updated_at = excluded.updated_at");
    stmt.bind(1, instance.saga_id)
        .bind(2, instance.saga_type)
        .bind(3, to_string(instance.status))
        .bind(4, instance.data.dump())
        .bind(5, progress_to_json(instance).dump())
        .bind(6, static_cast<std::int64_t>(next))
        .bind(7, format_timestamp(instance.updated_at));
    stmt.step();

    tx.commit();
    return next;
}

std::vector<SagaInstance> SqliteSagaStore::list_by_status(SagaStatus status) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare(std::string(kSelectColumns) + "WHERE status = ?1 ORDER BY saga_id");
    stmt.bind(1, to_string(status));

    std::vector<SagaInstance> result;
    while (stmt.step()) {
        result.push_back(row_to_instance(stmt));
    }
    return result;
}

bool SqliteSagaStore::remove(const std::string& saga_id) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare("DELETE FROM sagas WHERE saga_id = ?1");
    stmt.bind(1, saga_id);
    stmt.step();
    return db_->changes() > 0;
}

} // namespace esflow
