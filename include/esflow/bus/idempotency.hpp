#pragma once

/**
 * @file idempotency.hpp
 * @brief Exactly-once side effects on top of at-least-once delivery
 */

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_set>

#include "esflow/bus/subscription.hpp"
#include "esflow/sqlite/database.hpp"

namespace esflow {

/**
 * @brief Set of dedup keys whose handling already succeeded
 */
class ProcessedEventLog {
public:
    virtual ~ProcessedEventLog() = default;

    [[nodiscard]] virtual bool contains(const std::string& key) const = 0;

    /**
     * @return true if the key was newly recorded
     */
    virtual bool mark(const std::string& key) = 0;
};

class MemoryProcessedEventLog : public ProcessedEventLog {
public:
    [[nodiscard]] bool contains(const std::string& key) const override;
    bool mark(const std::string& key) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_set<std::string> keys_;
};

/**
 * @brief Processed-key log in the `processed_events` table
 */
class SqliteProcessedEventLog : public ProcessedEventLog {
public:
    explicit SqliteProcessedEventLog(std::shared_ptr<sqlite::Database> db);

    [[nodiscard]] bool contains(const std::string& key) const override;
    bool mark(const std::string& key) override;

private:
    std::shared_ptr<sqlite::Database> db_;
};

/**
 * @brief Dedup key of a handler/event pair
 */
[[nodiscard]] inline std::string dedup_key(const std::string& handler_name, const std::string& event_id) {
    return handler_name + ":" + event_id;
}

/**
 * @brief Wrap a handler so each event id is handled successfully at most once
 *
 * The key is recorded only after the handler succeeds; a failed attempt
 * stays eligible for redelivery. Concurrent deliveries of the same key
 * are collapsed to one.
 */
[[nodiscard]] EventHandler make_idempotent(std::string handler_name,
                                           EventHandler handler,
                                           std::shared_ptr<ProcessedEventLog> log);

} // namespace esflow
