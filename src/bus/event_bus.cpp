#include "esflow/bus/event_bus.hpp"

#include <algorithm>
#include <future>
#include <map>
#include <thread>

namespace esflow {

InMemoryEventBus::InMemoryEventBus(EventBusConfig config, std::shared_ptr<TaskPool> pool)
    : config_(config)
    , pool_(std::move(pool))
    , logger_(logging::get("esflow.bus")) {
    auto status = config_.validate();
    if (!status.ok()) {
        throw ConfigurationError(status.error().to_string());
    }
    if (!pool_) {
        TaskPoolConfig pool_config;
        pool_config.num_workers = static_cast<std::uint32_t>(config_.max_concurrency);
        pool_ = std::make_shared<TaskPool>(pool_config);
    }
    pool_->start();
    if (config_.dead_letter_enabled) {
        dead_letters_ = std::make_shared<DeadLetterQueue>();
    }
}

InMemoryEventBus::~InMemoryEventBus() = default;

SubscriptionId InMemoryEventBus::add_subscription(std::string topic_pattern,
                                                  EventHandler handler,
                                                  int priority,
                                                  std::string name) {
    if (topic_pattern.empty()) {
        throw ConfigurationError("subscription topic pattern must not be empty");
    }
    if (!handler) {
        throw ConfigurationError("subscription handler for '" + topic_pattern + "' is empty");
    }

    std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
    auto subscription = std::make_shared<Subscription>();
    subscription->id = next_id_++;
    subscription->topic_pattern = std::move(topic_pattern);
    subscription->name = name.empty() ? "handler-" + std::to_string(subscription->id) : std::move(name);
    subscription->priority = priority;
    subscription->handler = std::move(handler);

    logger_->debug("Subscribed '{}' to '{}' (priority {})",
                   subscription->name, subscription->topic_pattern, priority);
    subscriptions_.push_back(subscription);
    return subscription->id;
}

bool InMemoryEventBus::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const SubscriptionPtr& s) { return s->id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

void InMemoryEventBus::use(std::shared_ptr<Middleware> middleware) {
    if (!middleware) {
        throw ConfigurationError("middleware must not be null");
    }
    std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
    middleware_.push_back(std::move(middleware));
}

void InMemoryEventBus::set_dead_letter_queue(std::shared_ptr<DeadLetterQueue> queue) {
    std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
    dead_letters_ = std::move(queue);
}

std::shared_ptr<DeadLetterQueue> InMemoryEventBus::dead_letter_queue() const {
    std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
    return dead_letters_;
}

std::size_t InMemoryEventBus::subscription_count() const {
    std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
    return subscriptions_.size();
}

std::vector<InMemoryEventBus::SubscriptionPtr> InMemoryEventBus::matching(const std::string& event_type) const {
    std::vector<SubscriptionPtr> result;
    {
        std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
        for (const auto& subscription : subscriptions_) {
            if (topic_matches(subscription->topic_pattern, event_type)) {
                result.push_back(subscription);
            }
        }
    }
    // Registration order is id order, so a stable sort keeps ties in order
    std::stable_sort(result.begin(), result.end(), [](const SubscriptionPtr& a, const SubscriptionPtr& b) {
        return a->priority > b->priority;
    });
    return result;
}

InMemoryEventBus::MiddlewareChain InMemoryEventBus::middleware_chain() const {
    std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
    return middleware_;
}

Status InMemoryEventBus::publish(const Event& event) {
    auto failures = dispatch_event(event, 0);
    if (!failures.empty()) {
        return Error::handler(std::move(failures));
    }
    return ok_status();
}

Status InMemoryEventBus::publish_many(const std::vector<Event>& events,
                                      std::size_t batch_size,
                                      const CancellationToken& cancel) {
    std::size_t window = batch_size == 0 ? config_.batch_size : batch_size;
    std::vector<HandlerFailure> failures;

    for (std::size_t start = 0; start < events.size(); start += window) {
        if (cancel.is_cancelled()) {
            logger_->info("publish_many cancelled with {} of {} event(s) undelivered",
                          events.size() - start, events.size());
            Error error = Error::cancelled("publish_many cancelled")
                .with("delivered", std::to_string(start))
                .with("undelivered", std::to_string(events.size() - start))
                .with("failures", std::to_string(failures.size()));
            return error;
        }

        std::size_t end = std::min(start + window, events.size());

        // One task per aggregate keeps per-stream order inside the window
        std::map<std::string, std::vector<std::size_t>> groups;
        std::vector<std::string> group_order;
        for (std::size_t i = start; i < end; i++) {
            auto& indexes = groups[events[i].aggregate_id()];
            if (indexes.empty()) {
                group_order.push_back(events[i].aggregate_id());
            }
            indexes.push_back(i);
        }

        std::vector<std::future<std::vector<HandlerFailure>>> futures;
        futures.reserve(group_order.size());
        for (const auto& aggregate_id : group_order) {
            const auto& indexes = groups.at(aggregate_id);
            futures.push_back(pool_->submit([this, &events, &indexes] {
                std::vector<HandlerFailure> group_failures;
                for (auto index : indexes) {
                    auto event_failures = dispatch_event(events[index], index);
                    group_failures.insert(group_failures.end(),
                                          std::make_move_iterator(event_failures.begin()),
                                          std::make_move_iterator(event_failures.end()));
                }
                return group_failures;
            }));
        }

        // Collect the whole window before surfacing anything
        std::vector<HandlerFailure> window_failures;
        for (auto& future : futures) {
            auto group_failures = future.get();
            window_failures.insert(window_failures.end(),
                                   std::make_move_iterator(group_failures.begin()),
                                   std::make_move_iterator(group_failures.end()));
        }
        std::sort(window_failures.begin(), window_failures.end(),
                  [](const HandlerFailure& a, const HandlerFailure& b) {
                      return a.batch_index < b.batch_index;
                  });
        failures.insert(failures.end(),
                        std::make_move_iterator(window_failures.begin()),
                        std::make_move_iterator(window_failures.end()));
    }

    if (!failures.empty()) {
        logger_->error("publish_many: {} handler failure(s) across {} event(s)", failures.size(), events.size());
        return Error::handler(std::move(failures));
    }
    return ok_status();
}

std::vector<HandlerFailure> InMemoryEventBus::dispatch_event(const Event& event, std::size_t batch_index) {
    metrics_.published().increment();
    auto subscriptions = matching(event.event_type());
    auto chain = middleware_chain();

    if (subscriptions.empty()) {
        logger_->debug("No subscribers for {} ({})", event.event_type(), event.event_id());
    }

    std::vector<HandlerFailure> failures;
    for (const auto& subscription : subscriptions) {
        auto status = deliver(event, *subscription, chain);
        if (!status.ok()) {
            failures.push_back(HandlerFailure{
                subscription->id,
                subscription->name,
                event.event_id(),
                event.event_type(),
                batch_index,
                status.error().message()
            });
        }
    }
    return failures;
}

Status InMemoryEventBus::deliver(const Event& event, const Subscription& subscription, const MiddlewareChain& chain) {
    auto key = std::make_pair(subscription.id, event.event_id());
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        if (!in_flight_.insert(key).second) {
            metrics_.duplicates().increment();
            logger_->debug("Skipping concurrent duplicate of {} for '{}'", event.event_id(), subscription.name);
            return ok_status();
        }
    }
    struct InFlightGuard {
        InMemoryEventBus& bus;
        const std::pair<SubscriptionId, std::string>& key;
        ~InFlightGuard() {
            std::lock_guard<std::mutex> lock(bus.in_flight_mutex_);
            bus.in_flight_.erase(key);
        }
    } guard{*this, key};

    std::uint32_t max_attempts = 1 + config_.retry_attempts;
    Status status;
    for (std::uint32_t attempt = 1; attempt <= max_attempts; attempt++) {
        if (attempt > 1) {
            metrics_.retried().increment();
            logger_->info("Retrying '{}' on {} ({}), attempt {}/{}",
                          subscription.name, event.event_type(), event.event_id(), attempt, max_attempts);
            std::this_thread::sleep_for(config_.retry_delay);
        }

        Delivery delivery{event, subscription, attempt};
        try {
            status = run_chain(chain, 0, delivery);
        } catch (const std::exception& e) {
            status = Error::handler(std::string("middleware threw: ") + e.what());
        }
        if (status.ok()) {
            metrics_.delivered().increment();
            return status;
        }
    }

    metrics_.failed().increment();
    logger_->error("Handler '{}' failed on {} ({}) after {} attempt(s): {}",
                   subscription.name, event.event_type(), event.event_id(),
                   max_attempts, status.error().to_string());

    auto dead_letters = dead_letter_queue();
    if (dead_letters) {
        dead_letters->record(DeadLetter{
            event,
            subscription.id,
            subscription.name,
            config_.retry_attempts > 0 ? DeadLetterReason::MaxRetriesExceeded : DeadLetterReason::HandlerError,
            status.error().message(),
            max_attempts,
            now_utc()
        });
        metrics_.dead_lettered().increment();
    }
    return status;
}

Status InMemoryEventBus::run_chain(const MiddlewareChain& chain, std::size_t index, const Delivery& delivery) {
    if (index == chain.size()) {
        return invoke_handler(delivery);
    }
    return chain[index]->handle(delivery, [this, &chain, index](const Delivery& next) {
        return run_chain(chain, index + 1, next);
    });
}

Status InMemoryEventBus::invoke_handler(const Delivery& delivery) {
    try {
        return delivery.subscription.handler(delivery.event);
    } catch (const std::exception& e) {
        return Error::handler(e.what())
            .with("handler", delivery.subscription.name)
            .with("event_id", delivery.event.event_id());
    } catch (...) {
        return Error::handler("handler threw a non-standard exception")
            .with("handler", delivery.subscription.name)
            .with("event_id", delivery.event.event_id());
    }
}

} // namespace esflow
