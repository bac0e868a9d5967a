#pragma once

/**
 * @file outbox.hpp
 * @brief Durable queue tables for events and commands awaiting delivery
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "esflow/event/command.hpp"
#include "esflow/sqlite/database.hpp"

namespace esflow {

enum class Channel { Events, Commands };

[[nodiscard]] const char* outbox_table(Channel channel) noexcept;

/**
 * @brief A message to stage; message_id is the event or command id
 */
struct OutboxMessage {
    std::string message_id;
    Payload payload;
};

struct OutboxRecord {
    std::int64_t id{0};
    std::string message_id;
    Payload payload;
    bool processed{false};
    Timestamp created_at;
};

[[nodiscard]] OutboxMessage outbox_message(const Event& event);
[[nodiscard]] OutboxMessage outbox_message(const Command& command);

/**
 * @brief Queue table contract
 *
 * Rows are handed out in id order. Enqueuing a message_id that is already
 * present is a no-op. Backend failures throw StoreUnavailable.
 */
class Outbox {
public:
    virtual ~Outbox() = default;

    virtual void enqueue(const std::vector<OutboxMessage>& messages) = 0;

    [[nodiscard]] virtual std::vector<OutboxRecord> fetch_pending(std::size_t limit) const = 0;

    virtual void mark_processed(std::int64_t id) = 0;

    /**
     * @brief Mark rows by message id (used right after a direct publish)
     */
    virtual void mark_processed(const std::vector<std::string>& message_ids) = 0;

    [[nodiscard]] virtual std::size_t pending_count() const = 0;
};

class MemoryOutbox : public Outbox {
public:
    void enqueue(const std::vector<OutboxMessage>& messages) override;
    [[nodiscard]] std::vector<OutboxRecord> fetch_pending(std::size_t limit) const override;
    void mark_processed(std::int64_t id) override;
    void mark_processed(const std::vector<std::string>& message_ids) override;
    [[nodiscard]] std::size_t pending_count() const override;

private:
    mutable std::mutex mutex_;
    std::vector<OutboxRecord> rows_;
    std::int64_t next_id_{1};
};

/**
 * @brief Outbox in the outbox_events / outbox_commands table
 */
class SqliteOutbox : public Outbox {
public:
    SqliteOutbox(std::shared_ptr<sqlite::Database> db, Channel channel);

    void enqueue(const std::vector<OutboxMessage>& messages) override;
    [[nodiscard]] std::vector<OutboxRecord> fetch_pending(std::size_t limit) const override;
    void mark_processed(std::int64_t id) override;
    void mark_processed(const std::vector<std::string>& message_ids) override;
    [[nodiscard]] std::size_t pending_count() const override;

    [[nodiscard]] Channel channel() const noexcept { return channel_; }

private:
    std::shared_ptr<sqlite::Database> db_;
    Channel channel_;
    std::string table_;
};

} // namespace esflow
