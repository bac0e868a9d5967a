#pragma once

/**
 * @file event_bus.hpp
 * @brief Publish/subscribe dispatch of domain events
 */

#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "esflow/bus/dead_letter.hpp"
#include "esflow/bus/middleware.hpp"
#include "esflow/bus/subscription.hpp"
#include "esflow/core/cancellation.hpp"
#include "esflow/core/config.hpp"
#include "esflow/core/logging.hpp"
#include "esflow/core/metrics.hpp"
#include "esflow/core/task_pool.hpp"

namespace esflow {

/**
 * @brief Event bus contract
 */
class EventBus {
public:
    virtual ~EventBus() = default;

    /**
     * @brief Register a handler for event types matching `topic_pattern`
     *
     * The handler may return Status or void. Higher priority runs first;
     * equal priorities run in registration order.
     */
    template<typename F>
    SubscriptionId subscribe(std::string topic_pattern, F&& handler, int priority = 0, std::string name = {}) {
        return add_subscription(std::move(topic_pattern), to_event_handler(std::forward<F>(handler)),
                                priority, std::move(name));
    }

    virtual bool unsubscribe(SubscriptionId id) = 0;

    /**
     * @brief Deliver one event to every matching handler, in priority order
     */
    virtual Status publish(const Event& event) = 0;

    /**
     * @brief Deliver events in windows of `batch_size` (0 = configured size)
     *
     * Failures of all windows are collected into one Handler error.
     */
    virtual Status publish_many(const std::vector<Event>& events,
                                std::size_t batch_size = 0,
                                const CancellationToken& cancel = {}) = 0;

protected:
    virtual SubscriptionId add_subscription(std::string topic_pattern,
                                            EventHandler handler,
                                            int priority,
                                            std::string name) = 0;
};

/**
 * @brief In-process event bus backed by a task pool
 *
 * Within publish_many, events of the same aggregate keep their order (they
 * run on one task); different aggregates are dispatched concurrently.
 */
class InMemoryEventBus : public EventBus {
public:
    explicit InMemoryEventBus(EventBusConfig config = {}, std::shared_ptr<TaskPool> pool = nullptr);
    ~InMemoryEventBus() override;

    InMemoryEventBus(const InMemoryEventBus&) = delete;
    InMemoryEventBus& operator=(const InMemoryEventBus&) = delete;

    bool unsubscribe(SubscriptionId id) override;

    Status publish(const Event& event) override;

    Status publish_many(const std::vector<Event>& events,
                        std::size_t batch_size = 0,
                        const CancellationToken& cancel = {}) override;

    /**
     * @brief Append a middleware; the first added is the outermost
     */
    void use(std::shared_ptr<Middleware> middleware);

    void set_dead_letter_queue(std::shared_ptr<DeadLetterQueue> queue);

    [[nodiscard]] std::shared_ptr<DeadLetterQueue> dead_letter_queue() const;

    [[nodiscard]] std::size_t subscription_count() const;

    [[nodiscard]] BusMetrics& metrics() noexcept { return metrics_; }
    [[nodiscard]] const EventBusConfig& config() const noexcept { return config_; }

protected:
    SubscriptionId add_subscription(std::string topic_pattern,
                                    EventHandler handler,
                                    int priority,
                                    std::string name) override;

private:
    using SubscriptionPtr = std::shared_ptr<const Subscription>;
    using MiddlewareChain = std::vector<std::shared_ptr<Middleware>>;

    [[nodiscard]] std::vector<SubscriptionPtr> matching(const std::string& event_type) const;
    [[nodiscard]] MiddlewareChain middleware_chain() const;

    std::vector<HandlerFailure> dispatch_event(const Event& event, std::size_t batch_index);
    Status deliver(const Event& event, const Subscription& subscription, const MiddlewareChain& chain);
    Status run_chain(const MiddlewareChain& chain, std::size_t index, const Delivery& delivery);
    static Status invoke_handler(const Delivery& delivery);

    EventBusConfig config_;
    std::shared_ptr<TaskPool> pool_;

    mutable std::shared_mutex subscriptions_mutex_;
    std::vector<SubscriptionPtr> subscriptions_;
    MiddlewareChain middleware_;
    std::shared_ptr<DeadLetterQueue> dead_letters_;
    SubscriptionId next_id_{1};

    std::mutex in_flight_mutex_;
    std::set<std::pair<SubscriptionId, std::string>> in_flight_;

    BusMetrics metrics_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
