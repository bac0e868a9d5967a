#pragma once

/**
 * @file memory_event_store.hpp
 * @brief In-process event store
 */

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "esflow/core/logging.hpp"
#include "esflow/store/event_store.hpp"

namespace esflow {

/**
 * @brief Event store kept in memory
 *
 * Each stream has its own mutex, which is the single serialization point
 * for the version check and sequence assignment. A separate log keeps the
 * global append order for read_all().
 */
class MemoryEventStore : public EventStore {
public:
    MemoryEventStore();

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

    [[nodiscard]] std::size_t stream_count() const;
    [[nodiscard]] std::size_t event_count() const;

private:
    struct Stream {
        std::mutex mutex;
        std::vector<Event> events;
    };

    Stream& stream_for_write(const std::string& aggregate_id);
    [[nodiscard]] Stream* find_stream(const std::string& aggregate_id) const;

    mutable std::shared_mutex streams_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Stream>> streams_;

    mutable std::shared_mutex log_mutex_;
    std::vector<StoredEvent> log_;
    std::unordered_set<std::string> event_ids_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
