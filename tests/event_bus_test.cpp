/**
 * @file event_bus_test.cpp
 * @brief Tests for the in-memory event bus, middleware, DLQ and idempotency
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"

using namespace esflow;
using namespace esflow::test;

namespace {

/**
 * @brief Thread-safe append-only log of strings
 */
class Trace {
public:
    void add(std::string entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(std::move(entry));
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

class RecordingMiddleware : public Middleware {
public:
    RecordingMiddleware(std::string name, Trace& trace) : name_(std::move(name)), trace_(trace) {}

    std::string_view name() const noexcept override { return name_; }

    Status handle(const Delivery& delivery, const NextFn& next) override {
        trace_.add(name_ + ":before");
        auto status = next(delivery);
        trace_.add(name_ + ":after");
        return status;
    }

private:
    std::string name_;
    Trace& trace_;
};

class RejectingMiddleware : public Middleware {
public:
    std::string_view name() const noexcept override { return "reject"; }

    Status handle(const Delivery& delivery, const NextFn&) override {
        return Error::validation("rejected " + delivery.event.event_type());
    }
};

} // namespace

class EventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.retry_delay = std::chrono::milliseconds(1);
    }

    void TearDown() override {}

    std::vector<Event> events_for(const std::string& aggregate_id, int count) {
        std::vector<Event> events;
        for (int i = 0; i < count; i++) {
            events.push_back(stored_event(aggregate_id, "Deposited", static_cast<Version>(i + 1), amount(i)));
        }
        return events;
    }

    EventBusConfig config_;
};

TEST_F(EventBusTest, PriorityOrderWithStableTies) {
    InMemoryEventBus bus(config_);
    Trace trace;

    bus.subscribe("Deposited", [&](const Event&) { trace.add("low"); }, 1);
    bus.subscribe("Deposited", [&](const Event&) { trace.add("tie-a"); });
    bus.subscribe("Deposited", [&](const Event&) { trace.add("high"); }, 10);
    bus.subscribe("Deposited", [&](const Event&) { trace.add("tie-b"); });
    bus.subscribe("Deposited", [&](const Event&) { trace.add("mid"); }, 5);

    ASSERT_TRUE(bus.publish(stored_event("acc-1", "Deposited", 1)).ok());

    std::vector<std::string> expected{"high", "mid", "low", "tie-a", "tie-b"};
    EXPECT_EQ(trace.entries(), expected);
}

TEST_F(EventBusTest, TopicPatterns) {
    EXPECT_TRUE(topic_matches("*", "Deposited"));
    EXPECT_TRUE(topic_matches("Order*", "OrderPlaced"));
    EXPECT_TRUE(topic_matches("*Failed", "PaymentFailed"));
    EXPECT_TRUE(topic_matches("Step*Completed", "Step12Completed"));
    EXPECT_FALSE(topic_matches("Order*", "PaymentProcessed"));
    EXPECT_FALSE(topic_matches("Deposited", "Deposit"));

    InMemoryEventBus bus(config_);
    std::atomic<int> orders{0};
    std::atomic<int> everything{0};
    bus.subscribe("Order*", [&](const Event&) { orders++; });
    bus.subscribe("*", [&](const Event&) { everything++; });

    ASSERT_TRUE(bus.publish(stored_event("o-1", "OrderPlaced", 1)).ok());
    ASSERT_TRUE(bus.publish(stored_event("o-1", "PaymentProcessed", 2)).ok());

    EXPECT_EQ(orders.load(), 1);
    EXPECT_EQ(everything.load(), 2);
}

TEST_F(EventBusTest, FailingHandlerDoesNotStopTheBatch) {
    InMemoryEventBus bus(config_);
    std::atomic<int> seen_by_g{0};

    bus.subscribe("Deposited", [](const Event& event) {
        if (event.payload().at("amount").get<int>() == 4) {
            throw std::runtime_error("cannot handle #5");
        }
    }, 0, "H");
    bus.subscribe("Deposited", [&](const Event&) { seen_by_g++; }, 0, "G");

    std::vector<Event> events;
    for (int i = 0; i < 10; i++) {
        events.push_back(stored_event("acc-" + std::to_string(i), "Deposited", 1, amount(i)));
    }

    auto status = bus.publish_many(events);
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().code(), ErrorCode::Handler);

    const auto* failures = status.error().details_as<std::vector<HandlerFailure>>();
    ASSERT_NE(failures, nullptr);
    ASSERT_EQ(failures->size(), 1u);
    EXPECT_EQ(failures->front().batch_index, 4u);
    EXPECT_EQ(failures->front().handler_name, "H");
    EXPECT_EQ(failures->front().event_id, events[4].event_id());
    EXPECT_NE(failures->front().message.find("cannot handle #5"), std::string::npos);

    EXPECT_EQ(seen_by_g.load(), 10);
}

TEST_F(EventBusTest, FailuresAreOrderedByBatchIndex) {
    InMemoryEventBus bus(config_);
    bus.subscribe("Deposited", [](const Event& event) -> Status {
        if (event.payload().at("amount").get<int>() % 3 == 0) {
            return Error::validation("multiple of three");
        }
        return ok_status();
    });

    std::vector<Event> events;
    for (int i = 0; i < 12; i++) {
        events.push_back(stored_event("acc-" + std::to_string(i % 4), "Deposited", static_cast<Version>(i / 4 + 1), amount(i)));
    }

    auto status = bus.publish_many(events, 5);
    ASSERT_FALSE(status.ok());
    const auto* failures = status.error().details_as<std::vector<HandlerFailure>>();
    ASSERT_NE(failures, nullptr);

    std::vector<std::size_t> indexes;
    for (const auto& failure : *failures) {
        indexes.push_back(failure.batch_index);
    }
    std::vector<std::size_t> expected{0, 3, 6, 9};
    EXPECT_EQ(indexes, expected);
}

TEST_F(EventBusTest, SameAggregateKeepsStreamOrder) {
    InMemoryEventBus bus(config_);
    Trace trace;
    bus.subscribe("Deposited", [&](const Event& event) {
        trace.add(event.aggregate_id() + "#" + std::to_string(event.sequence_number()));
    });

    auto a = events_for("acc-a", 15);
    auto b = events_for("acc-b", 15);
    std::vector<Event> interleaved;
    for (std::size_t i = 0; i < a.size(); i++) {
        interleaved.push_back(a[i]);
        interleaved.push_back(b[i]);
    }
    ASSERT_TRUE(bus.publish_many(interleaved, 8).ok());

    auto entries = trace.entries();
    ASSERT_EQ(entries.size(), 30u);
    for (const std::string prefix : {"acc-a#", "acc-b#"}) {
        int last = 0;
        for (const auto& entry : entries) {
            if (entry.rfind(prefix, 0) == 0) {
                int seq = std::stoi(entry.substr(prefix.size()));
                EXPECT_EQ(seq, last + 1);
                last = seq;
            }
        }
        EXPECT_EQ(last, 15);
    }
}

TEST_F(EventBusTest, MiddlewareWrapsInRegistrationOrder) {
    InMemoryEventBus bus(config_);
    Trace trace;
    bus.use(std::make_shared<RecordingMiddleware>("outer", trace));
    bus.use(std::make_shared<RecordingMiddleware>("inner", trace));
    bus.subscribe("Deposited", [&](const Event&) { trace.add("handler"); });

    ASSERT_TRUE(bus.publish(stored_event("acc-1", "Deposited", 1)).ok());

    std::vector<std::string> expected{"outer:before", "inner:before", "handler", "inner:after", "outer:after"};
    EXPECT_EQ(trace.entries(), expected);

    EXPECT_THROW(bus.use(nullptr), ConfigurationError);
}

TEST_F(EventBusTest, MiddlewareCanShortCircuit) {
    InMemoryEventBus bus(config_);
    std::atomic<int> calls{0};
    bus.use(std::make_shared<RejectingMiddleware>());
    bus.subscribe("Deposited", [&](const Event&) { calls++; });

    auto status = bus.publish(stored_event("acc-1", "Deposited", 1));
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(bus.metrics().failed().value(), 1u);
}

TEST_F(EventBusTest, TimingMiddlewareFeedsLatency) {
    InMemoryEventBus bus(config_);
    bus.use(std::make_shared<LoggingMiddleware>());
    bus.use(std::make_shared<TimingMiddleware>(bus.metrics()));
    bus.subscribe("Deposited", [](const Event&) {});

    ASSERT_TRUE(bus.publish_many(events_for("acc-1", 5)).ok());

    EXPECT_EQ(bus.metrics().dispatch_latency().count(), 5u);
    auto snapshot = bus.metrics().snapshot();
    EXPECT_EQ(snapshot.published, 5u);
    EXPECT_EQ(snapshot.delivered, 5u);
}

TEST_F(EventBusTest, CircuitBreakerOpensAfterThreshold) {
    InMemoryEventBus bus(config_);
    CircuitBreakerConfig breaker_config;
    breaker_config.failure_threshold = 2;
    breaker_config.recovery_timeout = std::chrono::hours(1);
    auto breaker = std::make_shared<CircuitBreakerMiddleware>(breaker_config, &bus.metrics());
    bus.use(breaker);

    std::atomic<int> calls{0};
    bus.subscribe("Charged", [&](const Event&) -> Status {
        calls++;
        return Error::validation("gateway down");
    });

    for (Version seq = 1; seq <= 3; seq++) {
        EXPECT_FALSE(bus.publish(stored_event("pay-1", "Charged", seq)).ok());
    }

    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(breaker->state("Charged"), CircuitBreakerMiddleware::State::Open);
    EXPECT_EQ(breaker->state("Deposited"), CircuitBreakerMiddleware::State::Closed);
    EXPECT_EQ(bus.metrics().short_circuited().value(), 1u);
}

TEST_F(EventBusTest, CircuitBreakerRecoversThroughHalfOpen) {
    InMemoryEventBus bus(config_);
    CircuitBreakerConfig breaker_config;
    breaker_config.failure_threshold = 1;
    breaker_config.recovery_timeout = std::chrono::milliseconds(0);
    auto breaker = std::make_shared<CircuitBreakerMiddleware>(breaker_config);
    bus.use(breaker);

    std::atomic<bool> healthy{false};
    bus.subscribe("Charged", [&](const Event&) -> Status {
        if (!healthy) {
            return Error::validation("gateway down");
        }
        return ok_status();
    });

    EXPECT_FALSE(bus.publish(stored_event("pay-1", "Charged", 1)).ok());
    EXPECT_EQ(breaker->state("Charged"), CircuitBreakerMiddleware::State::Open);

    healthy = true;
    EXPECT_TRUE(bus.publish(stored_event("pay-1", "Charged", 2)).ok());
    EXPECT_EQ(breaker->state("Charged"), CircuitBreakerMiddleware::State::Closed);
}

TEST_F(EventBusTest, RetriesThenDeadLetters) {
    config_.retry_attempts = 2;
    InMemoryEventBus bus(config_);

    std::atomic<int> attempts{0};
    bus.subscribe("Deposited", [&](const Event&) -> Status {
        attempts++;
        return Error::validation("still broken");
    }, 0, "ledger");

    auto event = stored_event("acc-1", "Deposited", 1);
    EXPECT_FALSE(bus.publish(event).ok());
    EXPECT_EQ(attempts.load(), 3);

    auto dlq = bus.dead_letter_queue();
    ASSERT_NE(dlq, nullptr);
    auto letters = dlq->entries();
    ASSERT_EQ(letters.size(), 1u);
    EXPECT_EQ(letters[0].event.event_id(), event.event_id());
    EXPECT_EQ(letters[0].handler_name, "ledger");
    EXPECT_EQ(letters[0].reason, DeadLetterReason::MaxRetriesExceeded);
    EXPECT_EQ(letters[0].attempts, 3u);
    EXPECT_EQ(letters[0].error, "still broken");

    auto metrics = bus.metrics().snapshot();
    EXPECT_EQ(metrics.retried, 2u);
    EXPECT_EQ(metrics.failed, 1u);
    EXPECT_EQ(metrics.dead_lettered, 1u);

    EXPECT_EQ(dlq->drain().size(), 1u);
    EXPECT_EQ(dlq->size(), 0u);
}

TEST_F(EventBusTest, TransientFailureRecoversOnRetry) {
    config_.retry_attempts = 3;
    InMemoryEventBus bus(config_);

    std::atomic<int> attempts{0};
    bus.subscribe("Deposited", [&](const Event&) -> Status {
        if (++attempts < 3) {
            return Error::validation("flaky");
        }
        return ok_status();
    });

    EXPECT_TRUE(bus.publish(stored_event("acc-1", "Deposited", 1)).ok());
    EXPECT_EQ(attempts.load(), 3);
    EXPECT_EQ(bus.dead_letter_queue()->size(), 0u);
}

TEST_F(EventBusTest, NoRetryRecordsHandlerError) {
    InMemoryEventBus bus(config_);
    bus.subscribe("Deposited", [](const Event&) -> Status { throw std::runtime_error("boom"); });

    EXPECT_FALSE(bus.publish(stored_event("acc-1", "Deposited", 1)).ok());
    auto letters = bus.dead_letter_queue()->entries();
    ASSERT_EQ(letters.size(), 1u);
    EXPECT_EQ(letters[0].reason, DeadLetterReason::HandlerError);
    EXPECT_STREQ(to_string(letters[0].reason), "HANDLER_ERROR");
}

TEST_F(EventBusTest, DeadLetteringCanBeDisabled) {
    config_.dead_letter_enabled = false;
    InMemoryEventBus bus(config_);
    bus.subscribe("Deposited", [](const Event&) -> Status { return Error::validation("no"); });

    EXPECT_FALSE(bus.publish(stored_event("acc-1", "Deposited", 1)).ok());
    EXPECT_EQ(bus.dead_letter_queue(), nullptr);
    EXPECT_EQ(bus.metrics().dead_lettered().value(), 0u);
}

TEST_F(EventBusTest, IdempotentHandlerRunsOncePerEvent) {
    InMemoryEventBus bus(config_);
    auto log = std::make_shared<MemoryProcessedEventLog>();
    std::atomic<int> side_effects{0};

    bus.subscribe("Deposited", make_idempotent("projector", [&](const Event&) -> Status {
        side_effects++;
        return ok_status();
    }, log));

    auto event = stored_event("acc-1", "Deposited", 1);
    ASSERT_TRUE(bus.publish(event).ok());
    ASSERT_TRUE(bus.publish(event).ok());
    ASSERT_TRUE(bus.publish_many({event, event, event}).ok());

    EXPECT_EQ(side_effects.load(), 1);
    EXPECT_TRUE(log->contains(dedup_key("projector", event.event_id())));
    EXPECT_EQ(log->size(), 1u);
}

TEST_F(EventBusTest, ConcurrentDuplicateIsSkipped) {
    InMemoryEventBus bus(config_);
    std::mutex latch_mutex;
    std::condition_variable latch;
    bool entered = false;
    bool released = false;
    std::atomic<int> invocations{0};

    bus.subscribe("Deposited", [&](const Event&) -> Status {
        invocations++;
        std::unique_lock<std::mutex> lock(latch_mutex);
        entered = true;
        latch.notify_all();
        latch.wait(lock, [&] { return released; });
        return ok_status();
    });

    auto event = stored_event("acc-1", "Deposited", 1);
    std::thread first([&] { EXPECT_TRUE(bus.publish(event).ok()); });
    {
        std::unique_lock<std::mutex> lock(latch_mutex);
        latch.wait(lock, [&] { return entered; });
    }

    // The first delivery is still inside the handler
    EXPECT_TRUE(bus.publish(event).ok());
    EXPECT_EQ(invocations.load(), 1);
    EXPECT_EQ(bus.metrics().duplicates().value(), 1u);

    {
        std::lock_guard<std::mutex> lock(latch_mutex);
        released = true;
    }
    latch.notify_all();
    first.join();

    EXPECT_EQ(invocations.load(), 1);
    EXPECT_EQ(bus.metrics().snapshot().duplicates, 1u);

    // Once the first delivery is done the event may be delivered again
    ASSERT_TRUE(bus.publish(event).ok());
    EXPECT_EQ(invocations.load(), 2);
}

TEST_F(EventBusTest, FailedIdempotentDeliveryIsNotRecorded) {
    InMemoryEventBus bus(config_);
    auto log = std::make_shared<MemoryProcessedEventLog>();
    std::atomic<int> calls{0};

    bus.subscribe("Deposited", make_idempotent("projector", [&](const Event&) -> Status {
        if (++calls == 1) {
            return Error::validation("first try fails");
        }
        return ok_status();
    }, log));

    auto event = stored_event("acc-1", "Deposited", 1);
    EXPECT_FALSE(bus.publish(event).ok());
    EXPECT_EQ(log->size(), 0u);

    EXPECT_TRUE(bus.publish(event).ok());
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(log->size(), 1u);
}

TEST_F(EventBusTest, SqliteProcessedLogSurvivesNewHandler) {
    auto db = sqlite::open();
    auto event = stored_event("acc-1", "Deposited", 1);
    std::atomic<int> side_effects{0};

    for (int round = 0; round < 2; round++) {
        InMemoryEventBus bus(config_);
        auto log = std::make_shared<SqliteProcessedEventLog>(db);
        bus.subscribe("Deposited", make_idempotent("mailer", [&](const Event&) -> Status {
            side_effects++;
            return ok_status();
        }, log));
        ASSERT_TRUE(bus.publish(event).ok());
    }

    EXPECT_EQ(side_effects.load(), 1);

    SqliteProcessedEventLog log(db);
    EXPECT_TRUE(log.contains(dedup_key("mailer", event.event_id())));
    EXPECT_FALSE(log.mark(dedup_key("mailer", event.event_id())));
}

TEST_F(EventBusTest, CancellationStopsBetweenWindows) {
    InMemoryEventBus bus(config_);
    CancellationSource source;
    std::atomic<int> handled{0};

    bus.subscribe("Deposited", [&](const Event&) {
        handled++;
        source.cancel();
    });

    auto status = bus.publish_many(events_for("acc-1", 6), 2, source.token());
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().code(), ErrorCode::Cancelled);
    EXPECT_EQ(status.error().context().at("delivered"), "2");
    EXPECT_EQ(status.error().context().at("undelivered"), "4");

    // The window in flight finishes
    EXPECT_EQ(handled.load(), 2);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    InMemoryEventBus bus(config_);
    std::atomic<int> calls{0};
    auto id = bus.subscribe("Deposited", [&](const Event&) { calls++; });
    EXPECT_EQ(bus.subscription_count(), 1u);

    ASSERT_TRUE(bus.publish(stored_event("acc-1", "Deposited", 1)).ok());
    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    ASSERT_TRUE(bus.publish(stored_event("acc-1", "Deposited", 2)).ok());

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(bus.subscription_count(), 0u);
}

TEST_F(EventBusTest, DefaultHandlerNames) {
    InMemoryEventBus bus(config_);
    auto id = bus.subscribe("Deposited", [](const Event&) -> Status { return Error::validation("x"); });

    auto status = bus.publish(stored_event("acc-1", "Deposited", 1));
    ASSERT_FALSE(status.ok());
    const auto* failures = status.error().details_as<std::vector<HandlerFailure>>();
    ASSERT_NE(failures, nullptr);
    EXPECT_EQ(failures->front().handler_name, "handler-" + std::to_string(id));
    EXPECT_EQ(failures->front().subscription_id, id);

    EXPECT_THROW(bus.subscribe("", [](const Event&) {}), ConfigurationError);
}

TEST_F(EventBusTest, SharedPoolIsNotStoppedByBus) {
    TaskPoolConfig pool_config;
    pool_config.num_workers = 2;
    auto pool = std::make_shared<TaskPool>(pool_config);

    {
        InMemoryEventBus bus(config_, pool);
        bus.subscribe("Deposited", [](const Event&) {});
        ASSERT_TRUE(bus.publish_many(events_for("acc-1", 4)).ok());
    }

    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->submit([] { return 1; }).get(), 1);
    pool->stop();
}
