#include "esflow/bus/outbox.hpp"

#include <algorithm>

namespace esflow {

const char* outbox_table(Channel channel) noexcept {
    switch (channel) {
        case Channel::Events: return "outbox_events";
        case Channel::Commands: return "outbox_commands";
    }
    return "outbox_events";
}

OutboxMessage outbox_message(const Event& event) {
    return OutboxMessage{event.event_id(), event_to_json(event)};
}

OutboxMessage outbox_message(const Command& command) {
    return OutboxMessage{command.command_id, command_to_json(command)};
}

void MemoryOutbox::enqueue(const std::vector<OutboxMessage>& messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& message : messages) {
        bool exists = std::any_of(rows_.begin(), rows_.end(), [&](const OutboxRecord& row) {
            return row.message_id == message.message_id;
        });
        if (exists) {
            continue;
        }
        rows_.push_back(OutboxRecord{next_id_++, message.message_id, message.payload, false, now_utc()});
    }
}

std::vector<OutboxRecord> MemoryOutbox::fetch_pending(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutboxRecord> result;
    for (const auto& row : rows_) {
        if (limit != 0 && result.size() >= limit) {
            break;
        }
        if (!row.processed) {
            result.push_back(row);
        }
    }
    return result;
}

void MemoryOutbox::mark_processed(std::int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& row : rows_) {
        if (row.id == id) {
            row.processed = true;
            return;
        }
    }
}

void MemoryOutbox::mark_processed(const std::vector<std::string>& message_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& row : rows_) {
        if (std::find(message_ids.begin(), message_ids.end(), row.message_id) != message_ids.end()) {
            row.processed = true;
        }
    }
}

std::size_t MemoryOutbox::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(rows_.begin(), rows_.end(), [](const OutboxRecord& row) {
        return !row.processed;
    }));
}

SqliteOutbox::SqliteOutbox(std::shared_ptr<sqlite::Database> db, Channel channel)
    : db_(std::move(db))
    , channel_(channel)
    , table_(outbox_table(channel)) {
    if (!db_) {
        throw ConfigurationError("SqliteOutbox needs a database");
    }
}

void SqliteOutbox::enqueue(const std::vector<OutboxMessage>& messages) {
    if (messages.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(db_->mutex());
    sqlite::Transaction tx(*db_);
    auto stmt = db_->prepare("INSERT OR IGNORE INTO " + table_ +
                             " (message_id, payload, processed, created_at) VALUES (?1, ?2, 0, ?3)");
    for (const auto& message : messages) {
        stmt.reset();
        stmt.bind(1, message.message_id)
            .bind(2, message.payload.dump())
            .bind(3, format_timestamp(now_utc()));
        stmt.step();
    }
    tx.commit();
}

std::vector<OutboxRecord> SqliteOutbox::fetch_pending(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare("SELECT id, message_id, payload, created_at FROM " + table_ +
                             " WHERE processed = 0 ORDER BY id ASC LIMIT ?1");
    stmt.bind(1, limit == 0 ? std::int64_t{-1} : static_cast<std::int64_t>(limit));

    std::vector<OutboxRecord> result;
    while (stmt.step()) {
        OutboxRecord record;
        record.id = stmt.column_int64(0);
        record.message_id = stmt.column_text(1);
        record.payload = Payload::parse(stmt.column_text(2), nullptr, false);
        auto created = parse_timestamp(stmt.column_text(3));
        record.created_at = created ? *created : Timestamp{};
        result.push_back(std::move(record));
    }
    return result;
}

void SqliteOutbox::mark_processed(std::int64_t id) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare("UPDATE " + table_ + " SET processed = 1 WHERE id = ?1");
    stmt.bind(1, id);
    stmt.step();
}

void SqliteOutbox::mark_processed(const std::vector<std::string>& message_ids) {
    if (message_ids.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(db_->mutex());
    sqlite::Transaction tx(*db_);
    auto stmt = db_->prepare("UPDATE " + table_ + " SET processed = 1 WHERE message_id = ?1");
    for (const auto& message_id : message_ids) {
        stmt.reset();
        stmt.bind(1, message_id);
        stmt.step();
    }
    tx.commit();
}

std::size_t SqliteOutbox::pending_count() const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare("SELECT COUNT(*) FROM " + table_ + " WHERE processed = 0");
    stmt.step();
    return static_cast<std::size_t>(stmt.column_int64(0));
}

} // namespace esflow
