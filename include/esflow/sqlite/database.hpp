#pragma once

/**
 * @file database.hpp
 * @brief RAII wrappers over the SQLite C API
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "esflow/core/config.hpp"
#include "esflow/core/error.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace esflow::sqlite {

/**
 * @brief SQLite failure with its primary result code
 */
class SqliteError : public StoreUnavailable {
public:
    SqliteError(int code, const std::string& message)
        : StoreUnavailable(message)
        , code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

    /**
     * @brief True for UNIQUE / PRIMARY KEY / CHECK violations
     */
    [[nodiscard]] bool is_constraint() const noexcept;

private:
    int code_;
};

/**
 * @brief Prepared statement; finalized on destruction
 *
 * Bind indexes are 1-based, column indexes 0-based, as in SQLite.
 */
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) = delete;

    Statement& bind(int index, std::string_view value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind_null(int index);

    /**
     * @brief Advance the statement
     * @return true if a row is available, false when done
     * @throws SqliteError on failure
     */
    bool step();

    void reset();

    [[nodiscard]] std::int64_t column_int64(int column) const;
    [[nodiscard]] std::string column_text(int column) const;
    [[nodiscard]] bool column_is_null(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief One SQLite connection shared by the stores built on it
 *
 * Stores lock mutex() for the duration of each operation, so a single
 * connection (including ":memory:") can be used from many threads.
 */
class Database {
public:
    explicit Database(SqliteConfig config = {});
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Run one or more statements without results
     */
    void execute(std::string_view sql);

    [[nodiscard]] Statement prepare(std::string_view sql);

    [[nodiscard]] std::int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;

    [[nodiscard]] std::mutex& mutex() noexcept { return mutex_; }
    [[nodiscard]] const SqliteConfig& config() const noexcept { return config_; }

private:
    SqliteConfig config_;
    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

/**
 * @brief Scoped BEGIN IMMEDIATE transaction, rolled back unless committed
 */
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

private:
    Database& db_;
    bool done_{false};
};

/**
 * @brief Open a database and create all esflow tables if missing
 */
[[nodiscard]] std::shared_ptr<Database> open(SqliteConfig config = {});

/**
 * @brief Create the esflow tables and indexes (idempotent)
 */
void ensure_schema(Database& db);

} // namespace esflow::sqlite
