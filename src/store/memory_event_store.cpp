#include "esflow/store/memory_event_store.hpp"

#include <algorithm>

namespace esflow {

MemoryEventStore::MemoryEventStore()
    : logger_(logging::get("esflow.store")) {}

MemoryEventStore::Stream& MemoryEventStore::stream_for_write(const std::string& aggregate_id) {
    {
        std::shared_lock<std::shared_mutex> lock(streams_mutex_);
        auto it = streams_.find(aggregate_id);
        if (it != streams_.end()) {
            return *it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(streams_mutex_);
    auto& slot = streams_[aggregate_id];
    if (!slot) {
        slot = std::make_unique<Stream>();
    }
    return *slot;
}

MemoryEventStore::Stream* MemoryEventStore::find_stream(const std::string& aggregate_id) const {
    std::shared_lock<std::shared_mutex> lock(streams_mutex_);
    auto it = streams_.find(aggregate_id);
    return it == streams_.end() ? nullptr : it->second.get();
}

Result<Version> MemoryEventStore::append(
    const std::string& aggregate_id,
    Version expected_version,
    const std::vector<NewEvent>& events,
    const CancellationToken& cancel) {
    auto valid = validate_append_batch(aggregate_id, events);
    if (!valid.ok()) {
        return valid.error();
    }

    Stream& stream = stream_for_write(aggregate_id);
    std::lock_guard<std::mutex> stream_lock(stream.mutex);

    Version current = stream.events.size();
    if (current != expected_version) {
        logger_->warn("Append to '{}' rejected: expected v{}, actual v{}",
                      aggregate_id, expected_version, current);
        return Error::conflict(aggregate_id, expected_version, current);
    }
    if (cancel.is_cancelled()) {
        return Error::cancelled("append cancelled before commit").with("aggregate_id", aggregate_id);
    }
    if (events.empty()) {
        return current;
    }

    std::unique_lock<std::shared_mutex> log_lock(log_mutex_);
    for (const auto& pending : events) {
        if (event_ids_.count(pending.event_id()) != 0) {
            return Error::validation("duplicate event_id")
                .with("aggregate_id", aggregate_id)
                .with("event_id", pending.event_id());
        }
    }

    // Commit point: nothing below can fail on a domain rule
    stream.events.reserve(stream.events.size() + events.size());
    for (std::size_t i = 0; i < events.size(); i++) {
        Event event = Event::appended(events[i], current + i + 1);
        event_ids_.insert(event.event_id());
        log_.push_back(StoredEvent{log_.size() + 1, event});
        stream.events.push_back(std::move(event));
    }

    Version new_version = stream.events.size();
    logger_->debug("Appended {} event(s) to '{}' (v{} -> v{})",
                   events.size(), aggregate_id, current, new_version);
    return new_version;
}

Result<std::vector<Event>> MemoryEventStore::read(const std::string& aggregate_id, Version from_version) const {
    std::vector<Event> result;
    Stream* stream = find_stream(aggregate_id);
    if (!stream) {
        return result;
    }

    std::lock_guard<std::mutex> lock(stream->mutex);
    if (from_version < stream->events.size()) {
        result.assign(stream->events.begin() + static_cast<std::ptrdiff_t>(from_version),
                      stream->events.end());
    }
    return result;
}

Result<std::vector<StoredEvent>> MemoryEventStore::read_all(std::uint64_t after_position, std::size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(log_mutex_);
    std::vector<StoredEvent> result;
    if (after_position >= log_.size()) {
        return result;
    }

    auto first = log_.begin() + static_cast<std::ptrdiff_t>(after_position);
    std::size_t available = log_.size() - after_position;
    std::size_t count = limit == 0 ? available : std::min(limit, available);
    result.assign(first, first + static_cast<std::ptrdiff_t>(count));
    return result;
}

Result<Version> MemoryEventStore::current_version(const std::string& aggregate_id) const {
    Stream* stream = find_stream(aggregate_id);
    if (!stream) {
        return Version{0};
    }
    std::lock_guard<std::mutex> lock(stream->mutex);
    return Version{stream->events.size()};
}

std::size_t MemoryEventStore::stream_count() const {
    std::shared_lock<std::shared_mutex> lock(streams_mutex_);
    return streams_.size();
}

std::size_t MemoryEventStore::event_count() const {
    std::shared_lock<std::shared_mutex> lock(log_mutex_);
    return log_.size();
}

} // namespace esflow
