#pragma once

/**
 * @file sqlite_event_store.hpp
 * @brief Event store persisted in SQLite
 */

#include <memory>

#include "esflow/core/logging.hpp"
#include "esflow/sqlite/database.hpp"
#include "esflow/store/event_store.hpp"

namespace esflow {

/**
 * @brief SQLite event store
 *
 * Appends run in a BEGIN IMMEDIATE transaction; the UNIQUE(aggregate_id,
 * sequence_number) constraint turns a lost race into ConcurrencyConflict.
 * With `stage_outbox` set, every appended event is also written to
 * outbox_events inside the same transaction.
 */
class SqliteEventStore : public EventStore {
public:
    explicit SqliteEventStore(std::shared_ptr<sqlite::Database> db, bool stage_outbox = false);

    Result<Version> append(
        const std::string& aggregate_id,
        Version expected_version,
        const std::vector<NewEvent>& events,
        const CancellationToken& cancel = {}) override;

    [[nodiscard]] Result<std::vector<Event>> read(
        const std::string& aggregate_id,
        Version from_version = 0) const override;

    [[nodiscard]] Result<std::vector<StoredEvent>> read_all(
        std::uint64_t after_position = 0,
        std::size_t limit = 0) const override;

    [[nodiscard]] Result<Version> current_version(const std::string& aggregate_id) const override;

    [[nodiscard]] bool stages_outbox() const noexcept override { return stage_outbox_; }

private:
    [[nodiscard]] Version current_version_locked(const std::string& aggregate_id) const;

    std::shared_ptr<sqlite::Database> db_;
    bool stage_outbox_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
