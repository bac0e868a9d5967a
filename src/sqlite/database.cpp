#include "esflow/sqlite/database.hpp"

#include <sqlite3.h>

#include "esflow/core/logging.hpp"

namespace esflow::sqlite {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS events (
    global_position INTEGER PRIMARY KEY AUTOINCREMENT,
    event_id TEXT NOT NULL UNIQUE,
    aggregate_id TEXT NOT NULL,
    aggregate_type TEXT NOT NULL,
    event_type TEXT NOT NULL,
    schema_version INTEGER NOT NULL,
    sequence_number INTEGER NOT NULL,
    occurred_at TEXT NOT NULL,
    correlation_id TEXT NOT NULL DEFAULT '',
    causation_id TEXT NOT NULL DEFAULT '',
    payload TEXT NOT NULL,
    UNIQUE (aggregate_id, sequence_number)
);
CREATE INDEX IF NOT EXISTS idx_events_event_type ON events (event_type);

CREATE TABLE IF NOT EXISTS snapshots (
    aggregate_id TEXT PRIMARY KEY,
    aggregate_type TEXT NOT NULL,
    version INTEGER NOT NULL,
    state_schema_version INTEGER NOT NULL,
    state_payload TEXT NOT NULL,
    created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS outbox_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    message_id TEXT NOT NULL UNIQUE,
    payload TEXT NOT NULL,
    processed INTEGER NOT NULL DEFAULT 0,
    created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_outbox_events_pending ON outbox_events (processed, created_at);

CREATE TABLE IF NOT EXISTS outbox_commands (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    message_id TEXT NOT NULL UNIQUE,
    payload TEXT NOT NULL,
    processed INTEGER NOT NULL DEFAULT 0,
    created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_outbox_commands_pending ON outbox_commands (processed, created_at);

CREATE TABLE IF NOT EXISTS sagas (
    saga_id TEXT PRIMARY KEY,
    saga_type TEXT NOT NULL,
    status TEXT NOT NULL,
    data TEXT NOT NULL,
    progress TEXT NOT NULL,
    version INTEGER NOT NULL,
    updated_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_sagas_status ON sagas (status);

CREATE TABLE IF NOT EXISTS processed_events (
    dedup_key TEXT PRIMARY KEY,
    processed_at TEXT NOT NULL
);
)sql";

[[noreturn]] void raise(sqlite3* db, int rc, const std::string& what) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw SqliteError(rc, what + ": " + detail);
}

} // namespace

bool SqliteError::is_constraint() const noexcept {
    return (code_ & 0xFF) == SQLITE_CONSTRAINT;
}

Statement::Statement(sqlite3* db, std::string_view sql)
    : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "prepare failed");
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_)
    , stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind failed");
    }
    return *this;
}

Statement& Statement::bind(int index, std::int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind failed");
    }
    return *this;
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind failed");
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    raise(db_, rc, "step failed");
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::column_int64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::column_text(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return {};
    }
    auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column));
    return std::string(reinterpret_cast<const char*>(text), size);
}

bool Statement::column_is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::Database(SqliteConfig config)
    : config_(std::move(config)) {
    auto status = config_.validate();
    if (!status.ok()) {
        throw ConfigurationError(status.error().to_string());
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(config_.path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw SqliteError(rc, "cannot open '" + config_.path + "': " + detail);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout.count()));
    execute("PRAGMA foreign_keys = ON;");
    if (config_.wal && config_.path != ":memory:") {
        execute("PRAGMA journal_mode = WAL;");
    }
    logging::get("esflow.store")->info("Opened sqlite database '{}'", config_.path);
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::execute(std::string_view sql) {
    std::string text(sql);
    char* message = nullptr;
    int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string detail = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        throw SqliteError(rc, "exec failed: " + detail);
    }
}

Statement Database::prepare(std::string_view sql) {
    return Statement(db_, sql);
}

std::int64_t Database::last_insert_rowid() const {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

Transaction::Transaction(Database& db)
    : db_(db) {
    db_.execute("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!done_) {
        try {
            db_.execute("ROLLBACK;");
        } catch (const SqliteError& e) {
            logging::get("esflow.store")->error("Rollback failed: {}", e.what());
        }
    }
}

void Transaction::commit() {
    db_.execute("COMMIT;");
    done_ = true;
}

void Transaction::rollback() {
    done_ = true;
    db_.execute("ROLLBACK;");
}

std::shared_ptr<Database> open(SqliteConfig config) {
    auto db = std::make_shared<Database>(std::move(config));
    ensure_schema(*db);
    return db;
}

void ensure_schema(Database& db) {
    std::lock_guard<std::mutex> lock(db.mutex());
    db.execute(kSchema);
}

} // namespace esflow::sqlite
