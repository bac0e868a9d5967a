#pragma once

/**
 * @file outbox_relay.hpp
 * @brief Drains pending outbox rows to a bus
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "esflow/bus/event_bus.hpp"
#include "esflow/bus/outbox.hpp"
#include "esflow/command/command_bus.hpp"
#include "esflow/core/config.hpp"
#include "esflow/core/logging.hpp"

namespace esflow {

/**
 * @brief Accepts one outbox row; an error leaves the row pending
 */
using OutboxSink = std::function<Status(const OutboxRecord&)>;

struct RelayReport {
    std::size_t delivered{0};
    std::size_t failed{0};
    std::size_t deferred{0};  // skipped behind a failed row of the same stream
};

/**
 * @brief Delivers outbox rows in id order
 *
 * A row is marked processed only after the sink accepted it. Rows are
 * ordered per stream: the aggregate_id of an event envelope, else the
 * correlation_id of a command envelope. A failing row holds back the later
 * rows of its own stream for the rest of the sweep; other streams carry on.
 */
class OutboxRelay {
public:
    OutboxRelay(std::shared_ptr<Outbox> outbox, OutboxSink sink, OutboxRelayConfig config = {});
    ~OutboxRelay();

    OutboxRelay(const OutboxRelay&) = delete;
    OutboxRelay& operator=(const OutboxRelay&) = delete;

    /**
     * @brief Sink that decodes an event envelope and publishes it
     */
    [[nodiscard]] static OutboxSink event_sink(EventBus& bus);

    /**
     * @brief Sink that decodes a command envelope and dispatches it
     */
    [[nodiscard]] static OutboxSink command_sink(CommandBus& bus);

    /**
     * @brief One recovery sweep over up to batch_limit pending rows
     */
    RelayReport run_once();

    /**
     * @brief Start the background sweeper
     */
    void start();

    /**
     * @brief Stop and join the background sweeper
     */
    void stop();

    /**
     * @brief Wake the sweeper now instead of at the next poll
     */
    void notify();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

private:
    void run();

    std::shared_ptr<Outbox> outbox_;
    OutboxSink sink_;
    OutboxRelayConfig config_;

    std::mutex sweep_mutex_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_pending_{false};

    std::atomic<bool> running_{false};
    std::thread thread_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
