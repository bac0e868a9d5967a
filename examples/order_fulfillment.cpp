/**
 * @file order_fulfillment.cpp
 * @brief Example: orders driven by a saga over a SQLite event store
 *
 * PlaceOrder commands append OrderPlaced through a unit of work. The
 * fulfillment saga reacts on the bus and sends ReserveInventory,
 * ChargePayment and ShipOrder. Orders above the card limit are declined
 * and the saga releases the reserved inventory again.
 */

#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "esflow/esflow.hpp"

namespace {

constexpr std::int64_t CARD_LIMIT = 500;

struct Order {
    std::string status;
    std::int64_t amount{0};
};

void to_json(nlohmann::json& j, const Order& order) {
    j = nlohmann::json{{"status", order.status}, {"amount", order.amount}};
}

void from_json(const nlohmann::json& j, Order& order) {
    j.at("status").get_to(order.status);
    j.at("amount").get_to(order.amount);
}

esflow::ApplyDispatch<Order> order_dispatch() {
    esflow::ApplyDispatch<Order> dispatch;
    dispatch
        .on("OrderPlaced", [](Order& o, const esflow::Payload& p) {
            o.status = "placed";
            o.amount = p.at("amount").get<std::int64_t>();
        })
        .on("InventoryReserved", [](Order& o, const esflow::Payload&) { o.status = "reserved"; })
        .on("InventoryReleased", [](Order& o, const esflow::Payload&) { o.status = "released"; })
        .on("PaymentProcessed", [](Order& o, const esflow::Payload&) { o.status = "paid"; })
        .on("PaymentFailed", [](Order& o, const esflow::Payload&) { o.status = "declined"; })
        .on("OrderShipped", [](Order& o, const esflow::Payload&) { o.status = "shipped"; });
    return dispatch;
}

class FulfillmentSaga : public esflow::Saga {
public:
    std::string saga_type() const override { return "OrderFulfillment"; }

    bool handles(const std::string& event_type) const override {
        static const std::set<std::string> types{
            "OrderPlaced", "InventoryReserved", "PaymentProcessed", "PaymentFailed"};
        return types.count(event_type) != 0;
    }

    bool starts_on(const std::string& event_type) const override {
        return event_type == "OrderPlaced";
    }

    esflow::Status handle_event(esflow::SagaInstance& instance,
                                const esflow::Event& event,
                                esflow::SagaContext& context) override {
        const auto& id = event.aggregate_id();
        const auto& type = event.event_type();
        if (type == "OrderPlaced") {
            instance.data["order_id"] = id;
            instance.data["amount"] = event.payload().at("amount");
            context.send(esflow::Command::make("ReserveInventory", esflow::Payload{{"order_id", id}}));
        } else if (type == "InventoryReserved") {
            context.complete_step("reserve_inventory");
            context.send(esflow::Command::make(
                "ChargePayment", esflow::Payload{{"order_id", id}, {"amount", instance.data.at("amount")}}));
        } else if (type == "PaymentProcessed") {
            context.complete_step("charge_payment");
            context.send(esflow::Command::make("ShipOrder", esflow::Payload{{"order_id", id}}));
            context.complete();
        } else {
            context.compensate(event.payload().value("reason", "payment failed"));
        }
        return esflow::ok_status();
    }

    std::optional<esflow::Command> compensation_for(const std::string& step,
                                                    const esflow::SagaInstance& instance) const override {
        if (step == "reserve_inventory") {
            return esflow::Command::make("ReleaseInventory",
                                         esflow::Payload{{"order_id", instance.data.at("order_id")}});
        }
        return std::nullopt;
    }
};

} // namespace

int main() {
    esflow::LoggingConfig log_config;
    log_config.level = spdlog::level::info;
    esflow::logging::configure(log_config);
    auto log = esflow::logging::get("example");

    std::cout << "=== esflow Order Fulfillment ===" << std::endl;
    std::cout << "Version: " << esflow::VERSION << std::endl;
    std::cout << std::endl;

    // Storage: one in-memory SQLite database for events, snapshots, sagas and the outbox
    auto db = esflow::sqlite::open();
    esflow::SqliteEventStore store(db, true);
    esflow::SqliteSnapshotStore snapshots(db);
    auto outbox = std::make_shared<esflow::SqliteOutbox>(db, esflow::Channel::Events);

    esflow::UpcasterRegistry upcasters;
    esflow::ReplayEngine engine(store, upcasters, &snapshots);
    auto dispatch = order_dispatch();
    esflow::EventSourcedRepository<Order> orders(
        "Order", engine, dispatch, &snapshots, std::make_shared<esflow::EventCountStrategy>(3));

    esflow::InMemoryEventBus bus;
    esflow::CommandBus commands;
    esflow::SagaManager sagas(std::make_shared<esflow::SqliteSagaStore>(db), commands);
    sagas.register_saga(std::make_shared<FulfillmentSaga>());

    // Append one event to an order and publish it
    auto record = [&](const std::string& order_id, const std::string& event_type,
                      esflow::Payload payload) -> esflow::Result<esflow::Payload> {
        auto loaded = orders.load(order_id);
        if (!loaded.ok() && !loaded.error().is(esflow::ErrorCode::NotFound)) {
            return loaded.error();
        }
        auto order = loaded.ok() ? std::move(loaded).value() : orders.create(order_id);

        auto raised = order.raise(event_type, std::move(payload));
        if (!raised.ok()) {
            return raised.error();
        }

        esflow::UnitOfWork uow(store, &bus, outbox);
        auto saved = orders.save(order, uow);
        if (!saved.ok()) {
            return saved.error();
        }
        auto receipt = uow.commit();
        if (!receipt.ok()) {
            return receipt.error();
        }
        if (!receipt.value().publish_status.ok()) {
            log->warn("{} on {} left for the relay: {}", event_type, order_id,
                      receipt.value().publish_status.error().to_string());
        }
        return esflow::Payload{{"version", order.version()}};
    };

    commands.register_handler("PlaceOrder", [&](const esflow::Command& command) {
        return record(command.payload.at("order_id").get<std::string>(), "OrderPlaced",
                      esflow::Payload{{"amount", command.payload.at("amount")}});
    });
    commands.register_handler("ReserveInventory", [&](const esflow::Command& command) {
        return record(command.payload.at("order_id").get<std::string>(), "InventoryReserved",
                      esflow::Payload::object());
    });
    commands.register_handler("ReleaseInventory", [&](const esflow::Command& command) {
        return record(command.payload.at("order_id").get<std::string>(), "InventoryReleased",
                      esflow::Payload::object());
    });
    commands.register_handler("ChargePayment", [&](const esflow::Command& command) {
        auto order_id = command.payload.at("order_id").get<std::string>();
        if (command.payload.at("amount").get<std::int64_t>() > CARD_LIMIT) {
            return record(order_id, "PaymentFailed", esflow::Payload{{"reason", "card limit exceeded"}});
        }
        return record(order_id, "PaymentProcessed", esflow::Payload::object());
    });
    commands.register_handler("ShipOrder", [&](const esflow::Command& command) {
        return record(command.payload.at("order_id").get<std::string>(), "OrderShipped",
                      esflow::Payload::object());
    });

    // Read model: orders per status, updated at most once per event
    std::mutex summary_mutex;
    std::map<std::string, std::string> summary;
    auto processed = std::make_shared<esflow::SqliteProcessedEventLog>(db);
    bus.subscribe("*", esflow::make_idempotent("order-summary", [&](const esflow::Event& event) {
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary[event.aggregate_id()] = event.event_type();
        return esflow::ok_status();
    }, processed), 10, "order-summary");

    bus.subscribe("*", sagas.as_handler(), 0, "sagas");

    // Backstop for events whose delivery failed during commit
    esflow::OutboxRelayConfig relay_config;
    relay_config.poll_interval = std::chrono::milliseconds(100);
    esflow::OutboxRelay relay(outbox, esflow::OutboxRelay::event_sink(bus), relay_config);
    relay.start();

    const std::map<std::string, std::int64_t> incoming{
        {"order-1", 120}, {"order-2", 900}, {"order-3", 45}};
    for (const auto& [order_id, amount] : incoming) {
        auto result = commands.dispatch(esflow::Command::make(
            "PlaceOrder", esflow::Payload{{"order_id", order_id}, {"amount", amount}}));
        if (!result.ok()) {
            log->error("PlaceOrder {} failed: {}", order_id, result.error().to_string());
        }
    }

    relay.stop();
    auto drained = relay.run_once();

    std::cout << "\n=== Orders ===" << std::endl;
    for (const auto& entry : incoming) {
        const auto& order_id = entry.first;
        auto order = orders.load(order_id);
        auto saga = sagas.find("OrderFulfillment/" + order_id);
        if (!order.ok() || !saga.ok()) {
            std::cout << order_id << ": unavailable" << std::endl;
            continue;
        }
        std::cout << order_id
                  << ": status=" << order.value().state().status
                  << " amount=" << order.value().state().amount
                  << " version=" << order.value().version()
                  << " snapshot=" << order.value().snapshot_version()
                  << " saga=" << esflow::to_string(saga.value().status) << std::endl;
    }

    std::cout << "\n=== Read Model ===" << std::endl;
    {
        std::lock_guard<std::mutex> lock(summary_mutex);
        for (const auto& [order_id, last_event] : summary) {
            std::cout << order_id << ": " << last_event << std::endl;
        }
    }

    auto stats = commands.stats();
    std::cout << "\nCommands dispatched: " << stats.dispatched
              << " (failed: " << stats.failed << ")" << std::endl;
    std::cout << "Relayed after stop: " << drained.delivered
              << ", still pending: " << outbox->pending_count() << std::endl;

    return 0;
}
