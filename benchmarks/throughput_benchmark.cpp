/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for esflow
 */

#include <benchmark/benchmark.h>
#include <atomic>
#include <string>
#include <vector>

#include "esflow/esflow.hpp"

using namespace esflow;

namespace {

std::vector<NewEvent> deposits(const std::string& aggregate_id, std::size_t count) {
    std::vector<NewEvent> events;
    events.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        events.push_back(NewEvent::create(aggregate_id, "Account", "Deposited",
                                          Payload{{"amount", static_cast<std::int64_t>(i)}}).value());
    }
    return events;
}

std::vector<Event> stored(const std::vector<NewEvent>& pending) {
    std::vector<Event> events;
    events.reserve(pending.size());
    for (std::size_t i = 0; i < pending.size(); i++) {
        events.push_back(Event::appended(pending[i], i + 1));
    }
    return events;
}

} // namespace

static void BM_QueuePushPop(benchmark::State& state) {
    BoundedQueue<std::int64_t, 4096> queue;

    for (auto _ : state) {
        queue.push(42);
        auto result = queue.pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueuePushPop);

static void BM_EventCreation(benchmark::State& state) {
    for (auto _ : state) {
        auto e = NewEvent::create("acc-1", "Account", "Deposited", Payload{{"amount", 42}});
        benchmark::DoNotOptimize(e);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EventCreation);

static void BM_MemoryAppend(benchmark::State& state) {
    const auto batch = static_cast<std::size_t>(state.range(0));
    MemoryEventStore store;
    auto events = deposits("acc-1", batch);
    Version version = 0;

    for (auto _ : state) {
        auto result = store.append("acc-1", version, events);
        version = result.value();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(batch));
}
BENCHMARK(BM_MemoryAppend)->Arg(1)->Arg(10)->Arg(100);

static void BM_SqliteAppend(benchmark::State& state) {
    const auto batch = static_cast<std::size_t>(state.range(0));
    SqliteEventStore store(sqlite::open());
    std::size_t stream = 0;

    for (auto _ : state) {
        state.PauseTiming();
        // Event ids are unique per row, so every iteration gets fresh events
        auto events = deposits("acc-" + std::to_string(stream++), batch);
        state.ResumeTiming();

        auto result = store.append(events.front().aggregate_id(), 0, events);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(batch));
}
BENCHMARK(BM_SqliteAppend)->Arg(1)->Arg(10)->Arg(100);

static void BM_PublishMany(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    InMemoryEventBus bus;
    std::atomic<std::int64_t> total{0};
    bus.subscribe("Deposited", [&](const Event& event) {
        total.fetch_add(event.payload().at("amount").get<std::int64_t>(), std::memory_order_relaxed);
    });
    bus.subscribe("*", [](const Event&) {});

    // Spread over 8 aggregates so windows run in parallel
    std::vector<Event> events;
    for (std::size_t a = 0; a < 8; a++) {
        auto stream = stored(deposits("acc-" + std::to_string(a), count / 8));
        events.insert(events.end(), stream.begin(), stream.end());
    }

    for (auto _ : state) {
        auto status = bus.publish_many(events, 64);
        benchmark::DoNotOptimize(status);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(events.size()));
}
BENCHMARK(BM_PublishMany)->Arg(512)->Arg(4096);

static void BM_IdempotentPublish(benchmark::State& state) {
    InMemoryEventBus bus;
    auto log = std::make_shared<MemoryProcessedEventLog>();
    bus.subscribe("Deposited", make_idempotent("projector", [](const Event&) { return ok_status(); }, log));
    auto events = stored(deposits("acc-1", 1));

    for (auto _ : state) {
        auto status = bus.publish(events.front());
        benchmark::DoNotOptimize(status);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_IdempotentPublish);

BENCHMARK_MAIN();
