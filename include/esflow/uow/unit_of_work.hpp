#pragma once

/**
 * @file unit_of_work.hpp
 * @brief Append-then-publish coordination for pending events
 */

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "esflow/bus/event_bus.hpp"
#include "esflow/bus/outbox.hpp"
#include "esflow/core/logging.hpp"
#include "esflow/store/event_store.hpp"

namespace esflow {

/**
 * @brief What a commit wrote and how publishing went
 */
struct CommitReceipt {
    std::map<std::string, Version> versions;  // new version per stream
    std::vector<Event> events;                // appended, in commit order
    Status publish_status;                    // error if any handler failed
};

/**
 * @brief Collects pending events per stream and commits them
 *
 * commit() appends every stream (each stream is atomic on its own), stages
 * the events in the outbox, publishes them and marks the outbox rows of
 * cleanly delivered events processed. Rows of events that failed delivery
 * stay pending for OutboxRelay. A publish failure does not fail the
 * commit; it is reported in CommitReceipt::publish_status.
 */
class UnitOfWork {
public:
    using CommitCallback = std::function<void(const CommitReceipt&)>;

    explicit UnitOfWork(EventStore& store,
                        EventBus* bus = nullptr,
                        std::shared_ptr<Outbox> outbox = nullptr);

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    /**
     * @brief Stage events for one stream
     *
     * Staging the same stream twice appends to the batch; the expected
     * version must then match the first registration.
     */
    Status register_events(const std::string& aggregate_id,
                           Version expected_version,
                           std::vector<NewEvent> events);

    /**
     * @brief Run after a commit wrote anything, in registration order
     *
     * After a partial commit the receipt lists only the streams that were
     * written.
     */
    void on_committed(CommitCallback callback);

    Result<CommitReceipt> commit(const CancellationToken& cancel = {});

    /**
     * @brief Drop everything staged
     */
    void rollback();

    [[nodiscard]] bool has_pending() const noexcept { return !streams_.empty(); }
    [[nodiscard]] std::size_t pending_count() const noexcept;

private:
    struct PendingStream {
        std::string aggregate_id;
        Version expected_version{0};
        std::vector<NewEvent> events;
    };

    void deliver(CommitReceipt& receipt);

    EventStore& store_;
    EventBus* bus_;
    std::shared_ptr<Outbox> outbox_;

    std::vector<PendingStream> streams_;
    std::vector<CommitCallback> callbacks_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
