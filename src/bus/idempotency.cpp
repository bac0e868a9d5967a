#include "esflow/bus/idempotency.hpp"

#include "esflow/core/logging.hpp"

namespace esflow {

bool MemoryProcessedEventLog::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_.count(key) != 0;
}

bool MemoryProcessedEventLog::mark(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return keys_.insert(key).second;
}

std::size_t MemoryProcessedEventLog::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_.size();
}

SqliteProcessedEventLog::SqliteProcessedEventLog(std::shared_ptr<sqlite::Database> db)
    : db_(std::move(db)) {
    if (!db_) {
        throw ConfigurationError("SqliteProcessedEventLog needs a database");
    }
}

bool SqliteProcessedEventLog::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare("SELECT 1 FROM processed_events WHERE dedup_key = ?1");
    stmt.bind(1, key);
    return stmt.step();
}

bool SqliteProcessedEventLog::mark(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmt = db_->prepare(
        "INSERT OR IGNORE INTO processed_events (dedup_key, processed_at) VALUES (?1, ?2)");
    stmt.bind(1, key).bind(2, format_timestamp(now_utc()));
    stmt.step();
    return db_->changes() > 0;
}

namespace {

struct InFlightKeys {
    std::mutex mutex;
    std::unordered_set<std::string> keys;
};

} // namespace

EventHandler make_idempotent(std::string handler_name,
                             EventHandler handler,
                             std::shared_ptr<ProcessedEventLog> log) {
    if (!handler || !log) {
        throw ConfigurationError("make_idempotent needs a handler and a log");
    }

    auto in_flight = std::make_shared<InFlightKeys>();
    auto logger = logging::get("esflow.bus");

    return [name = std::move(handler_name), handler = std::move(handler),
            log = std::move(log), in_flight, logger](const Event& event) -> Status {
        std::string key = dedup_key(name, event.event_id());

        {
            std::lock_guard<std::mutex> lock(in_flight->mutex);
            if (log->contains(key) || !in_flight->keys.insert(key).second) {
                logger->debug("Skipping already handled {} for '{}'", event.event_id(), name);
                return ok_status();
            }
        }

        struct Release {
            InFlightKeys& in_flight;
            const std::string& key;
            ~Release() {
                std::lock_guard<std::mutex> lock(in_flight.mutex);
                in_flight.keys.erase(key);
            }
        } release{*in_flight, key};

        Status status = handler(event);
        if (status.ok()) {
            log->mark(key);
        }
        return status;
    };
}

} // namespace esflow
