/**
 * @file saga_test.cpp
 * @brief Tests for saga orchestration, compensation and saga stores
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "test_support.hpp"

using namespace esflow;
using namespace esflow::test;

namespace {

/**
 * @brief Reserve inventory, charge payment, ship
 */
class OrderSaga : public Saga {
public:
    std::string saga_type() const override { return "OrderFulfillment"; }

    bool handles(const std::string& event_type) const override {
        static const std::set<std::string> types{
            "OrderPlaced", "InventoryReserved", "PaymentProcessed", "PaymentFailed", "PaymentTimedOut"};
        return types.count(event_type) != 0;
    }

    bool starts_on(const std::string& event_type) const override {
        return event_type == "OrderPlaced";
    }

    Status handle_event(SagaInstance& instance, const Event& event, SagaContext& context) override {
        const auto& type = event.event_type();
        if (type == "OrderPlaced") {
            instance.data["order_id"] = event.aggregate_id();
            context.send(Command::make("ReserveInventory", Payload{{"order_id", event.aggregate_id()}}));
        } else if (type == "InventoryReserved") {
            context.complete_step("reserve_inventory");
            context.send(Command::make("ChargePayment", Payload{{"order_id", event.aggregate_id()}}));
        } else if (type == "PaymentProcessed") {
            context.complete_step("charge_payment");
            context.send(Command::make("ShipOrder", Payload{{"order_id", event.aggregate_id()}}));
            context.complete();
        } else if (type == "PaymentFailed") {
            context.compensate("payment failed");
        } else if (type == "PaymentTimedOut") {
            context.retry_step(Command::make("ChargePayment", Payload{{"order_id", event.aggregate_id()}}));
        }
        return ok_status();
    }

    std::optional<Command> compensation_for(const std::string& step, const SagaInstance& instance) const override {
        if (step == "reserve_inventory") {
            return Command::make("ReleaseInventory", Payload{{"order_id", instance.data.at("order_id")}});
        }
        if (step == "charge_payment") {
            return Command::make("RefundPayment", Payload{{"order_id", instance.data.at("order_id")}});
        }
        return std::nullopt;
    }
};

/**
 * @brief Two steps, each undone by a Compensate<Step> command
 */
class TwoStepSaga : public Saga {
public:
    std::string saga_type() const override { return "TwoStep"; }

    bool handles(const std::string& event_type) const override {
        return event_type == "Step1Completed" || event_type == "Step2Completed" || event_type == "Step2Failed";
    }

    bool starts_on(const std::string& event_type) const override {
        return event_type == "Step1Completed";
    }

    Status handle_event(SagaInstance&, const Event& event, SagaContext& context) override {
        if (event.event_type() == "Step1Completed") {
            context.complete_step("Step1");
        } else if (event.event_type() == "Step2Completed") {
            context.complete_step("Step2");
        } else {
            context.compensate("step 2 reported failure");
        }
        return ok_status();
    }

    std::optional<Command> compensation_for(const std::string& step, const SagaInstance&) const override {
        return Command::make("Compensate" + step);
    }
};

/**
 * @brief Counts ticks; every tick rewrites the same instance
 */
class TickSaga : public Saga {
public:
    std::string saga_type() const override { return "Ticker"; }
    bool handles(const std::string& event_type) const override { return event_type == "Tick"; }
    bool starts_on(const std::string&) const override { return true; }

    Status handle_event(SagaInstance& instance, const Event&, SagaContext&) override {
        instance.data["ticks"] = instance.data.value("ticks", 0) + 1;
        return ok_status();
    }

    std::optional<Command> compensation_for(const std::string&, const SagaInstance&) const override {
        return std::nullopt;
    }
};

/**
 * @brief Store that lets an outside writer bump the instance before each save
 */
class InterferingSagaStore : public SagaStore {
public:
    Result<SagaInstance> load(const std::string& saga_id) const override { return inner_.load(saga_id); }

    Result<Version> save(const SagaInstance& instance, Version expected_version) override {
        if (interference_ > 0) {
            auto current = inner_.load(instance.saga_id);
            if (current.ok()) {
                interference_--;
                auto other = current.value();
                other.data["external_writes"] = other.data.value("external_writes", 0) + 1;
                auto written = inner_.save(other, other.version);
                if (!written.ok()) {
                    return written.error();
                }
            }
        }
        return inner_.save(instance, expected_version);
    }

    std::vector<SagaInstance> list_by_status(SagaStatus status) const override {
        return inner_.list_by_status(status);
    }

    bool remove(const std::string& saga_id) override { return inner_.remove(saga_id); }

    void interfere(int times) { interference_ = times; }

private:
    MemorySagaStore inner_;
    std::atomic<int> interference_{0};
};

} // namespace

class SagaManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* type : {"ReserveInventory", "ReleaseInventory", "RefundPayment",
                                 "CompensateStep1", "CompensateStep2"}) {
            register_recording(type);
        }
        commands_.register_handler("ShipOrder", [this](const Command& command) -> Result<Payload> {
            record(command);
            if (shipping_down_) {
                return Error::validation("carrier unavailable");
            }
            return Payload::object();
        });
        commands_.register_handler("ChargePayment", [this](const Command& command) -> Result<Payload> {
            record(command);
            if (payment_down_) {
                return Error::validation("card declined");
            }
            return Payload::object();
        });

        store_ = std::make_shared<MemorySagaStore>();
        manager_ = std::make_unique<SagaManager>(store_, commands_);
        manager_->register_saga(std::make_shared<OrderSaga>());
        manager_->register_saga(std::make_shared<TwoStepSaga>());
    }

    void TearDown() override {
        manager_.reset();
    }

    void register_recording(const std::string& type) {
        commands_.register_handler(type, [this](const Command& command) -> Result<Payload> {
            record(command);
            return Payload::object();
        });
    }

    void record(const Command& command) {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(command);
    }

    std::vector<std::string> sent_types() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> types;
        for (const auto& command : sent_) {
            types.push_back(command.command_type);
        }
        return types;
    }

    Event order_event(const std::string& type, Version seq, const std::string& order_id = "order-1") {
        return stored_event(order_id, type, seq);
    }

    SagaInstance instance(const std::string& saga_id) {
        auto found = manager_->find(saga_id);
        EXPECT_TRUE(found.ok()) << saga_id;
        return found.ok() ? found.value() : SagaInstance{};
    }

    CommandBus commands_;
    std::shared_ptr<MemorySagaStore> store_;
    std::unique_ptr<SagaManager> manager_;
    std::atomic<bool> payment_down_{false};
    std::atomic<bool> shipping_down_{false};
    std::mutex mutex_;
    std::vector<Command> sent_;
};

TEST_F(SagaManagerTest, HappyPathCompletes) {
    ASSERT_TRUE(manager_->handle(order_event("OrderPlaced", 1)).ok());
    EXPECT_EQ(instance("OrderFulfillment/order-1").status, SagaStatus::Waiting);

    ASSERT_TRUE(manager_->handle(order_event("InventoryReserved", 2)).ok());
    ASSERT_TRUE(manager_->handle(order_event("PaymentProcessed", 3)).ok());

    EXPECT_EQ(sent_types(), (std::vector<std::string>{"ReserveInventory", "ChargePayment", "ShipOrder"}));

    auto saga = instance("OrderFulfillment/order-1");
    EXPECT_EQ(saga.status, SagaStatus::Completed);
    EXPECT_EQ(saga.saga_type, "OrderFulfillment");
    EXPECT_EQ(saga.version, 3u);
    EXPECT_EQ(saga.completed_steps, (std::vector<std::string>{"reserve_inventory", "charge_payment"}));
    EXPECT_EQ(saga.data.at("order_id"), "order-1");
    EXPECT_EQ(manager_->list_by_status(SagaStatus::Completed).size(), 1u);

    // Terminal instances ignore further events
    ASSERT_TRUE(manager_->handle(order_event("PaymentFailed", 4)).ok());
    EXPECT_EQ(instance("OrderFulfillment/order-1").status, SagaStatus::Completed);
    EXPECT_EQ(sent_types().size(), 3u);
}

TEST_F(SagaManagerTest, OnlyStartingEventsCreateInstances) {
    ASSERT_TRUE(manager_->handle(order_event("InventoryReserved", 1, "order-9")).ok());
    EXPECT_TRUE(manager_->find("OrderFulfillment/order-9").error().is(ErrorCode::NotFound));
    EXPECT_TRUE(sent_types().empty());

    ASSERT_TRUE(manager_->handle(stored_event("acc-1", "Deposited", 1)).ok());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(SagaManagerTest, CompensatesCompletedStepsInReverse) {
    ASSERT_TRUE(manager_->handle(stored_event("job-1", "Step1Completed", 1)).ok());
    ASSERT_TRUE(manager_->handle(stored_event("job-1", "Step2Completed", 2)).ok());
    ASSERT_TRUE(manager_->handle(stored_event("job-1", "Step2Failed", 3)).ok());

    EXPECT_EQ(sent_types(), (std::vector<std::string>{"CompensateStep2", "CompensateStep1"}));

    auto saga = instance("TwoStep/job-1");
    EXPECT_EQ(saga.status, SagaStatus::Compensated);
    EXPECT_EQ(saga.failure_reason, "step 2 reported failure");
    ASSERT_EQ(saga.compensation_log.size(), 2u);
    EXPECT_EQ(saga.compensation_log[0].step, "Step2");
    EXPECT_EQ(saga.compensation_log[0].command_type, "CompensateStep2");
    EXPECT_TRUE(saga.compensation_log[0].succeeded);
    EXPECT_EQ(saga.compensation_log[1].step, "Step1");
    EXPECT_TRUE(saga.compensation_log[1].succeeded);
}

TEST_F(SagaManagerTest, FailedCompensationFailsTheSaga) {
    CommandBus commands;
    commands.register_handler("CompensateStep2", [](const Command&) -> Result<Payload> {
        return Payload::object();
    });
    commands.register_handler("CompensateStep1", [](const Command&) -> Result<Payload> {
        return Error::validation("ledger locked");
    });
    SagaManager manager(std::make_shared<MemorySagaStore>(), commands);
    manager.register_saga(std::make_shared<TwoStepSaga>());

    ASSERT_TRUE(manager.handle(stored_event("job-1", "Step1Completed", 1)).ok());
    ASSERT_TRUE(manager.handle(stored_event("job-1", "Step2Completed", 2)).ok());
    auto status = manager.handle(stored_event("job-1", "Step2Failed", 3));

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().code(), ErrorCode::SagaCompensation);
    const auto* log = status.error().details_as<std::vector<CompensationRecord>>();
    ASSERT_NE(log, nullptr);
    ASSERT_EQ(log->size(), 2u);
    EXPECT_TRUE((*log)[0].succeeded);
    EXPECT_FALSE((*log)[1].succeeded);
    EXPECT_EQ((*log)[1].error, "ledger locked");

    auto saga = manager.find("TwoStep/job-1").value();
    EXPECT_EQ(saga.status, SagaStatus::Failed);
    EXPECT_NE(saga.failure_reason.find("compensation of step 'Step1' failed"), std::string::npos);
    EXPECT_EQ(manager.list_by_status(SagaStatus::Failed).size(), 1u);
}

TEST_F(SagaManagerTest, FailedForwardCommandTriggersCompensation) {
    payment_down_ = true;

    ASSERT_TRUE(manager_->handle(order_event("OrderPlaced", 1)).ok());
    auto status = manager_->handle(order_event("InventoryReserved", 2));
    EXPECT_TRUE(status.ok()) << status.error().to_string();

    EXPECT_EQ(sent_types(), (std::vector<std::string>{"ReserveInventory", "ChargePayment", "ReleaseInventory"}));

    auto saga = instance("OrderFulfillment/order-1");
    EXPECT_EQ(saga.status, SagaStatus::Compensated);
    EXPECT_NE(saga.failure_reason.find("ChargePayment"), std::string::npos);
    ASSERT_EQ(saga.compensation_log.size(), 1u);
    EXPECT_EQ(saga.compensation_log[0].command_type, "ReleaseInventory");
}

TEST_F(SagaManagerTest, FailedFinalCommandReopensCompletedSaga) {
    shipping_down_ = true;

    ASSERT_TRUE(manager_->handle(order_event("OrderPlaced", 1)).ok());
    ASSERT_TRUE(manager_->handle(order_event("InventoryReserved", 2)).ok());
    auto status = manager_->handle(order_event("PaymentProcessed", 3));
    EXPECT_TRUE(status.ok()) << status.error().to_string();

    EXPECT_EQ(sent_types(), (std::vector<std::string>{"ReserveInventory", "ChargePayment", "ShipOrder",
                                                      "RefundPayment", "ReleaseInventory"}));

    auto saga = instance("OrderFulfillment/order-1");
    EXPECT_EQ(saga.status, SagaStatus::Compensated);
    EXPECT_NE(saga.failure_reason.find("ShipOrder"), std::string::npos);
    ASSERT_EQ(saga.compensation_log.size(), 2u);
    EXPECT_EQ(saga.compensation_log[0].command_type, "RefundPayment");
    EXPECT_EQ(saga.compensation_log[1].command_type, "ReleaseInventory");
    EXPECT_TRUE(manager_->list_by_status(SagaStatus::Completed).empty());
}

TEST_F(SagaManagerTest, RetryBudgetThenFailure) {
    ASSERT_TRUE(manager_->handle(order_event("OrderPlaced", 1)).ok());
    ASSERT_TRUE(manager_->handle(order_event("InventoryReserved", 2)).ok());

    for (Version seq = 3; seq <= 5; seq++) {
        ASSERT_TRUE(manager_->handle(order_event("PaymentTimedOut", seq)).ok());
        auto saga = instance("OrderFulfillment/order-1");
        EXPECT_EQ(saga.status, SagaStatus::Waiting);
        EXPECT_EQ(saga.retry_count, static_cast<std::uint32_t>(seq - 2));
    }

    ASSERT_TRUE(manager_->handle(order_event("PaymentTimedOut", 6)).ok());
    auto saga = instance("OrderFulfillment/order-1");
    EXPECT_EQ(saga.status, SagaStatus::Failed);
    EXPECT_NE(saga.failure_reason.find("exhausted 3 retries"), std::string::npos);

    auto types = sent_types();
    EXPECT_EQ(std::count(types.begin(), types.end(), "ChargePayment"), 4);
}

TEST_F(SagaManagerTest, CommandsCarryCorrelationAndCausation) {
    auto placed = stored_event("order-1", "OrderPlaced", 1, Payload::object(), EventOrigin{"checkout-42", ""});
    ASSERT_TRUE(manager_->handle(placed).ok());

    // The correlation id routes the instance
    EXPECT_TRUE(manager_->find("OrderFulfillment/checkout-42").ok());

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_[0].correlation_id, "checkout-42");
    EXPECT_EQ(sent_[0].causation_id, placed.event_id());
}

TEST_F(SagaManagerTest, RegistrationRules) {
    EXPECT_THROW(manager_->register_saga(std::make_shared<OrderSaga>()), ConfigurationError);
    EXPECT_THROW(manager_->register_saga(nullptr), ConfigurationError);
    EXPECT_THROW(SagaManager(nullptr, commands_), ConfigurationError);
}

TEST_F(SagaManagerTest, ConcurrentDeliveriesToOneInstance) {
    manager_->register_saga(std::make_shared<TickSaga>());
    constexpr int num_threads = 8;
    constexpr int ticks_per_thread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < ticks_per_thread; i++) {
                auto tick = stored_event("clock", "Tick", static_cast<Version>(t * ticks_per_thread + i + 1));
                EXPECT_TRUE(manager_->handle(tick).ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto saga = instance("Ticker/clock");
    EXPECT_EQ(saga.data.at("ticks").get<int>(), num_threads * ticks_per_thread);
    EXPECT_EQ(saga.version, static_cast<Version>(num_threads * ticks_per_thread));
}

TEST_F(SagaManagerTest, ConflictingWriterIsRetried) {
    auto store = std::make_shared<InterferingSagaStore>();
    SagaManagerConfig config;
    config.max_conflict_retries = 3;
    SagaManager manager(store, commands_, config);
    manager.register_saga(std::make_shared<OrderSaga>());

    ASSERT_TRUE(manager.handle(order_event("OrderPlaced", 1)).ok());

    store->interfere(2);
    ASSERT_TRUE(manager.handle(order_event("InventoryReserved", 2)).ok());

    auto saga = manager.find("OrderFulfillment/order-1").value();
    EXPECT_EQ(saga.data.at("external_writes"), 2);
    EXPECT_EQ(saga.completed_steps, (std::vector<std::string>{"reserve_inventory"}));

    // Commands go out once, after the save that stuck
    auto types = sent_types();
    EXPECT_EQ(std::count(types.begin(), types.end(), "ChargePayment"), 1);

    store->interfere(100);
    auto status = manager.handle(order_event("PaymentProcessed", 3));
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().code(), ErrorCode::ConcurrencyConflict);
    types = sent_types();
    EXPECT_EQ(std::count(types.begin(), types.end(), "ShipOrder"), 0);
}

TEST_F(SagaManagerTest, EventDrivenChainThroughBus) {
    InMemoryEventBus bus;
    CommandBus commands;
    SagaManager manager(std::make_shared<MemorySagaStore>(), commands);
    manager.register_saga(std::make_shared<OrderSaga>());

    std::atomic<int> shipped{0};
    commands.register_handler("ReserveInventory", [&](const Command& command) -> Result<Payload> {
        auto id = command.payload.at("order_id").get<std::string>();
        auto status = bus.publish(stored_event(id, "InventoryReserved", 2));
        if (!status.ok()) {
            return status.error();
        }
        return Payload::object();
    });
    commands.register_handler("ChargePayment", [&](const Command& command) -> Result<Payload> {
        auto id = command.payload.at("order_id").get<std::string>();
        auto status = bus.publish(stored_event(id, "PaymentProcessed", 3));
        if (!status.ok()) {
            return status.error();
        }
        return Payload::object();
    });
    commands.register_handler("ShipOrder", [&](const Command&) -> Result<Payload> {
        shipped++;
        return Payload::object();
    });

    bus.subscribe("*", manager.as_handler(), 0, "sagas");

    ASSERT_TRUE(bus.publish(stored_event("order-7", "OrderPlaced", 1)).ok());

    EXPECT_EQ(shipped.load(), 1);
    EXPECT_EQ(manager.find("OrderFulfillment/order-7").value().status, SagaStatus::Completed);
}

class SagaStoreTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        if (GetParam() == "sqlite") {
            store_ = std::make_shared<SqliteSagaStore>(sqlite::open());
        } else {
            store_ = std::make_shared<MemorySagaStore>();
        }
    }

    void TearDown() override {
        store_.reset();
    }

    SagaInstance make_instance(const std::string& id, SagaStatus status = SagaStatus::Waiting) {
        SagaInstance instance;
        instance.saga_id = id;
        instance.saga_type = "OrderFulfillment";
        instance.status = status;
        instance.data = Payload{{"order_id", id}};
        instance.updated_at = now_utc();
        return instance;
    }

    std::shared_ptr<SagaStore> store_;
};

TEST_P(SagaStoreTest, SaveAndLoadEveryField) {
    auto original = make_instance("s-1", SagaStatus::Compensating);
    original.completed_steps = {"reserve_inventory", "charge_payment"};
    CompensationRecord record;
    record.step = "charge_payment";
    record.command_type = "RefundPayment";
    record.succeeded = false;
    record.error = "gateway timeout";
    record.at = now_utc();
    original.compensation_log.push_back(record);
    original.retry_count = 2;
    original.failure_reason = "payment failed";

    auto saved = store_->save(original, 0);
    ASSERT_TRUE(saved.ok());
    EXPECT_EQ(saved.value(), 1u);

    auto loaded = store_->load("s-1");
    ASSERT_TRUE(loaded.ok());
    const auto& saga = loaded.value();
    EXPECT_EQ(saga.version, 1u);
    EXPECT_EQ(saga.saga_type, "OrderFulfillment");
    EXPECT_EQ(saga.status, SagaStatus::Compensating);
    EXPECT_EQ(saga.data, original.data);
    EXPECT_EQ(saga.completed_steps, original.completed_steps);
    EXPECT_EQ(saga.retry_count, 2u);
    EXPECT_EQ(saga.failure_reason, "payment failed");
    EXPECT_EQ(saga.updated_at, original.updated_at);
    ASSERT_EQ(saga.compensation_log.size(), 1u);
    EXPECT_EQ(saga.compensation_log[0].command_type, "RefundPayment");
    EXPECT_FALSE(saga.compensation_log[0].succeeded);
    EXPECT_EQ(saga.compensation_log[0].error, "gateway timeout");
    EXPECT_EQ(saga.compensation_log[0].at, record.at);
}

TEST_P(SagaStoreTest, StaleVersionConflicts) {
    auto instance = make_instance("s-1");
    ASSERT_EQ(store_->save(instance, 0).value(), 1u);
    ASSERT_EQ(store_->save(instance, 1).value(), 2u);

    auto stale = store_->save(instance, 1);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error().code(), ErrorCode::ConcurrencyConflict);

    auto duplicate_create = store_->save(make_instance("s-1"), 0);
    EXPECT_FALSE(duplicate_create.ok());
    EXPECT_EQ(store_->load("s-1").value().version, 2u);
}

TEST_P(SagaStoreTest, ListByStatusAndRemove) {
    ASSERT_TRUE(store_->save(make_instance("s-b", SagaStatus::Waiting), 0).ok());
    ASSERT_TRUE(store_->save(make_instance("s-a", SagaStatus::Waiting), 0).ok());
    ASSERT_TRUE(store_->save(make_instance("s-c", SagaStatus::Completed), 0).ok());

    auto waiting = store_->list_by_status(SagaStatus::Waiting);
    ASSERT_EQ(waiting.size(), 2u);
    EXPECT_EQ(waiting[0].saga_id, "s-a");
    EXPECT_EQ(waiting[1].saga_id, "s-b");
    EXPECT_TRUE(store_->list_by_status(SagaStatus::Failed).empty());

    EXPECT_TRUE(store_->remove("s-a"));
    EXPECT_FALSE(store_->remove("s-a"));
    EXPECT_TRUE(store_->load("s-a").error().is(ErrorCode::NotFound));
}

INSTANTIATE_TEST_SUITE_P(Adapters, SagaStoreTest, ::testing::Values("memory", "sqlite"));

TEST(SagaStatusTest, StringsRoundTrip) {
    for (auto status : {SagaStatus::Started, SagaStatus::Waiting, SagaStatus::Compensating,
                        SagaStatus::Compensated, SagaStatus::Completed, SagaStatus::Failed}) {
        EXPECT_EQ(saga_status_from_string(to_string(status)), status);
    }
    EXPECT_STREQ(to_string(SagaStatus::Compensating), "COMPENSATING");
    EXPECT_FALSE(saga_status_from_string("PAUSED").has_value());
    EXPECT_TRUE(is_terminal(SagaStatus::Compensated));
    EXPECT_FALSE(is_terminal(SagaStatus::Compensating));
}

TEST(SqliteSagaRecoveryTest, ResumesAfterRestart) {
    auto db = sqlite::open();
    CommandBus commands;
    std::vector<std::string> sent;
    std::mutex mutex;
    for (const char* type : {"ReserveInventory", "ChargePayment", "ShipOrder"}) {
        commands.register_handler(type, [&, type](const Command&) -> Result<Payload> {
            std::lock_guard<std::mutex> lock(mutex);
            sent.push_back(type);
            return Payload::object();
        });
    }

    {
        SagaManager manager(std::make_shared<SqliteSagaStore>(db), commands);
        manager.register_saga(std::make_shared<OrderSaga>());
        ASSERT_TRUE(manager.handle(stored_event("order-1", "OrderPlaced", 1)).ok());
        ASSERT_TRUE(manager.handle(stored_event("order-1", "InventoryReserved", 2)).ok());
    }

    SagaManager restarted(std::make_shared<SqliteSagaStore>(db), commands);
    restarted.register_saga(std::make_shared<OrderSaga>());
    EXPECT_EQ(restarted.list_by_status(SagaStatus::Waiting).size(), 1u);

    ASSERT_TRUE(restarted.handle(stored_event("order-1", "PaymentProcessed", 3)).ok());

    auto saga = restarted.find("OrderFulfillment/order-1").value();
    EXPECT_EQ(saga.status, SagaStatus::Completed);
    EXPECT_EQ(saga.completed_steps.size(), 2u);
    EXPECT_EQ(sent, (std::vector<std::string>{"ReserveInventory", "ChargePayment", "ShipOrder"}));
}

TEST(SqliteSagaRecoveryTest, FinishesInterruptedCompensation) {
    auto db = sqlite::open();
    CommandBus commands;
    std::vector<std::string> sent;
    for (const char* type : {"CompensateStep1", "CompensateStep2"}) {
        commands.register_handler(type, [&sent, type](const Command&) -> Result<Payload> {
            sent.push_back(type);
            return Payload::object();
        });
    }

    // A crash after Step2 was undone leaves the instance Compensating
    auto store = std::make_shared<SqliteSagaStore>(db);
    SagaInstance interrupted;
    interrupted.saga_id = "TwoStep/job-1";
    interrupted.saga_type = "TwoStep";
    interrupted.status = SagaStatus::Compensating;
    interrupted.completed_steps = {"Step1", "Step2"};
    interrupted.failure_reason = "step 2 reported failure";
    CompensationRecord undone;
    undone.step = "Step2";
    undone.command_type = "CompensateStep2";
    undone.succeeded = true;
    undone.at = now_utc();
    interrupted.compensation_log.push_back(undone);
    interrupted.updated_at = now_utc();
    ASSERT_TRUE(store->save(interrupted, 0).ok());

    SagaInstance orphan = interrupted;
    orphan.saga_id = "Retired/job-2";
    orphan.saga_type = "Retired";
    ASSERT_TRUE(store->save(orphan, 0).ok());

    SagaManager restarted(std::make_shared<SqliteSagaStore>(db), commands);
    restarted.register_saga(std::make_shared<TwoStepSaga>());
    auto status = restarted.recover();

    // The unregistered type is reported, the other instance still finishes
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(status.error().context().at("saga_type"), "Retired");

    EXPECT_EQ(sent, (std::vector<std::string>{"CompensateStep1"}));
    auto saga = restarted.find("TwoStep/job-1").value();
    EXPECT_EQ(saga.status, SagaStatus::Compensated);
    ASSERT_EQ(saga.compensation_log.size(), 2u);
    EXPECT_EQ(saga.compensation_log[1].step, "Step1");

    // Nothing left to resume
    EXPECT_TRUE(restarted.resume("TwoStep/job-1").ok());
    EXPECT_EQ(sent.size(), 1u);
    EXPECT_EQ(restarted.list_by_status(SagaStatus::Compensating).size(), 1u);
}
