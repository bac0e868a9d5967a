#include "esflow/bus/outbox_relay.hpp"

#include <unordered_set>

namespace esflow {

namespace {

// Rows sharing a key keep their relative order; a row without one stands alone
std::string ordering_key(const OutboxRecord& record) {
    if (record.payload.is_object()) {
        for (const char* field : {"aggregate_id", "correlation_id"}) {
            auto it = record.payload.find(field);
            if (it != record.payload.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
                return std::string(field) + ":" + it->get<std::string>();
            }
        }
    }
    return "message_id:" + record.message_id;
}

} // namespace

OutboxRelay::OutboxRelay(std::shared_ptr<Outbox> outbox, OutboxSink sink, OutboxRelayConfig config)
    : outbox_(std::move(outbox))
    , sink_(std::move(sink))
    , config_(config)
    , logger_(logging::get("esflow.outbox")) {
    if (!outbox_ || !sink_) {
        throw ConfigurationError("OutboxRelay needs an outbox and a sink");
    }
    auto status = config_.validate();
    if (!status.ok()) {
        throw ConfigurationError(status.error().to_string());
    }
}

OutboxRelay::~OutboxRelay() {
    stop();
}

OutboxSink OutboxRelay::event_sink(EventBus& bus) {
    return [&bus](const OutboxRecord& record) -> Status {
        auto event = event_from_json(record.payload);
        if (!event.ok()) {
            return event.error();
        }
        return bus.publish(event.value());
    };
}

OutboxSink OutboxRelay::command_sink(CommandBus& bus) {
    return [&bus](const OutboxRecord& record) -> Status {
        auto command = command_from_json(record.payload);
        if (!command.ok()) {
            return command.error();
        }
        auto result = bus.dispatch(command.value());
        if (!result.ok()) {
            return result.error();
        }
        return ok_status();
    };
}

RelayReport OutboxRelay::run_once() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    RelayReport report;

    std::unordered_set<std::string> held;
    auto pending = outbox_->fetch_pending(config_.batch_limit);
    for (const auto& record : pending) {
        std::string key = ordering_key(record);
        if (held.count(key) != 0) {
            report.deferred++;
            continue;
        }

        Status status = [&]() -> Status {
            try {
                return sink_(record);
            } catch (const std::exception& e) {
                return Error::handler(std::string("outbox sink threw: ") + e.what());
            }
        }();

        if (!status.ok()) {
            report.failed++;
            logger_->warn("Outbox row {} ({}) not delivered, will retry: {}",
                          record.id, record.message_id, status.error().to_string());
            held.insert(std::move(key));
            continue;
        }

        outbox_->mark_processed(record.id);
        report.delivered++;
    }

    if (report.delivered > 0 || report.failed > 0) {
        logger_->debug("Relayed {} outbox row(s), {} failed, {} held back",
                       report.delivered, report.failed, report.deferred);
    }
    return report;
}

void OutboxRelay::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this] { run(); });
    logger_->info("Outbox relay started (poll every {}ms)", config_.poll_interval.count());
}

void OutboxRelay::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    logger_->info("Outbox relay stopped");
}

void OutboxRelay::notify() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_one();
}

void OutboxRelay::run() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            run_once();
        } catch (const StoreUnavailable& e) {
            logger_->error("Outbox sweep failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, config_.poll_interval, [this] { return wake_pending_; });
        wake_pending_ = false;
    }
}

} // namespace esflow
