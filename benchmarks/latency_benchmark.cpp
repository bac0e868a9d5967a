/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for esflow
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "esflow/esflow.hpp"

using namespace esflow;

namespace {

struct Balance {
    std::int64_t amount{0};
    std::uint64_t deposits{0};
};

void to_json(nlohmann::json& j, const Balance& b) {
    j = nlohmann::json{{"amount", b.amount}, {"deposits", b.deposits}};
}

void from_json(const nlohmann::json& j, Balance& b) {
    j.at("amount").get_to(b.amount);
    j.at("deposits").get_to(b.deposits);
}

ApplyDispatch<Balance> balance_dispatch() {
    ApplyDispatch<Balance> dispatch;
    dispatch.on("Deposited", [](Balance& b, const Payload& p) {
        b.amount += p.at("amount").get<std::int64_t>();
        b.deposits++;
    });
    return dispatch;
}

void fill_stream(EventStore& store, const std::string& id, std::size_t length) {
    std::vector<NewEvent> events;
    events.reserve(length);
    for (std::size_t i = 0; i < length; i++) {
        events.push_back(NewEvent::create(id, "Account", "Deposited", Payload{{"amount", 1}}).value());
    }
    store.append(id, 0, events).value();
}

/**
 * @brief Saga that records a step and sends one command per event
 */
class PingSaga : public Saga {
public:
    std::string saga_type() const override { return "Ping"; }
    bool handles(const std::string& event_type) const override { return event_type == "Pinged"; }
    bool starts_on(const std::string&) const override { return true; }

    Status handle_event(SagaInstance& instance, const Event&, SagaContext& context) override {
        context.complete_step("ping-" + std::to_string(instance.completed_steps.size()));
        context.send(Command::make("Pong"));
        return ok_status();
    }

    std::optional<Command> compensation_for(const std::string&, const SagaInstance&) const override {
        return std::nullopt;
    }
};

} // namespace

static void BM_ReplayFull(benchmark::State& state) {
    const auto length = static_cast<std::size_t>(state.range(0));
    MemoryEventStore store;
    UpcasterRegistry upcasters;
    auto dispatch = balance_dispatch();
    fill_stream(store, "acc-1", length);
    ReplayEngine engine(store, upcasters);

    for (auto _ : state) {
        auto loaded = engine.load_full<Balance>("acc-1", dispatch);
        benchmark::DoNotOptimize(loaded);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(length));
}
BENCHMARK(BM_ReplayFull)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ReplayFromSnapshot(benchmark::State& state) {
    const auto length = static_cast<std::size_t>(state.range(0));
    MemoryEventStore store;
    MemorySnapshotStore snapshots;
    UpcasterRegistry upcasters;
    auto dispatch = balance_dispatch();
    fill_stream(store, "acc-1", length);

    // Snapshot everything but the last 10 events
    ReplayEngine engine(store, upcasters, &snapshots);
    auto events = store.read("acc-1").value();
    Balance state_at;
    std::vector<Event> head(events.begin(), events.end() - 10);
    engine.apply_events(state_at, head, dispatch).value();

    Snapshot snapshot;
    snapshot.aggregate_id = "acc-1";
    snapshot.aggregate_type = "Account";
    snapshot.version = head.size();
    snapshot.state_payload = state_at;
    snapshot.created_at = now_utc();
    snapshots.save(snapshot);

    for (auto _ : state) {
        auto loaded = engine.load<Balance>("acc-1", dispatch);
        benchmark::DoNotOptimize(loaded);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ReplayFromSnapshot)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_CommitLatency(benchmark::State& state) {
    MemoryEventStore store;
    InMemoryEventBus bus;
    auto outbox = std::make_shared<MemoryOutbox>();
    bus.subscribe("Deposited", [](const Event&) {});
    Version version = 0;

    for (auto _ : state) {
        state.PauseTiming();
        auto event = NewEvent::create("acc-1", "Account", "Deposited", Payload{{"amount", 1}}).value();
        state.ResumeTiming();

        auto start = std::chrono::high_resolution_clock::now();
        UnitOfWork uow(store, &bus, outbox);
        uow.register_events("acc-1", version, {event});
        auto receipt = uow.commit();
        auto end = std::chrono::high_resolution_clock::now();

        version = receipt.value().versions.at("acc-1");
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_CommitLatency)->UseManualTime();

static void BM_SagaStep(benchmark::State& state) {
    CommandBus commands;
    commands.register_handler("Pong", [](const Command&) -> Result<Payload> { return Payload::object(); });
    SagaManager manager(std::make_shared<MemorySagaStore>(), commands);
    manager.register_saga(std::make_shared<PingSaga>());

    std::uint64_t n = 0;
    for (auto _ : state) {
        state.PauseTiming();
        auto pending = NewEvent::create("ping-" + std::to_string(n++ % 64), "Ping", "Pinged", Payload::object()).value();
        auto event = Event::appended(pending, 1);
        state.ResumeTiming();

        auto status = manager.handle(event);
        benchmark::DoNotOptimize(status);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SagaStep);

BENCHMARK_MAIN();
