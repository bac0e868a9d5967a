#include "esflow/uow/unit_of_work.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace esflow {

UnitOfWork::UnitOfWork(EventStore& store, EventBus* bus, std::shared_ptr<Outbox> outbox)
    : store_(store)
    , bus_(bus)
    , outbox_(std::move(outbox))
    , logger_(logging::get("esflow.uow")) {}

Status UnitOfWork::register_events(const std::string& aggregate_id,
                                   Version expected_version,
                                   std::vector<NewEvent> events) {
    if (aggregate_id.empty()) {
        return Error::validation("aggregate_id must not be empty");
    }
    auto valid = validate_append_batch(aggregate_id, events);
    if (!valid.ok()) {
        return valid;
    }
    if (events.empty()) {
        return ok_status();
    }

    auto it = std::find_if(streams_.begin(), streams_.end(), [&](const PendingStream& stream) {
        return stream.aggregate_id == aggregate_id;
    });
    if (it == streams_.end()) {
        streams_.push_back(PendingStream{aggregate_id, expected_version, std::move(events)});
        return ok_status();
    }

    if (it->expected_version != expected_version) {
        return Error::validation("stream staged twice with different expected versions")
            .with("aggregate_id", aggregate_id)
            .with("first", std::to_string(it->expected_version))
            .with("second", std::to_string(expected_version));
    }
    it->events.insert(it->events.end(),
                      std::make_move_iterator(events.begin()),
                      std::make_move_iterator(events.end()));
    return ok_status();
}

void UnitOfWork::on_committed(CommitCallback callback) {
    if (callback) {
        callbacks_.push_back(std::move(callback));
    }
}

std::size_t UnitOfWork::pending_count() const noexcept {
    std::size_t count = 0;
    for (const auto& stream : streams_) {
        count += stream.events.size();
    }
    return count;
}

void UnitOfWork::rollback() {
    logger_->debug("Rolled back {} staged event(s)", pending_count());
    streams_.clear();
    callbacks_.clear();
}

Result<CommitReceipt> UnitOfWork::commit(const CancellationToken& cancel) {
    CommitReceipt receipt;
    if (streams_.empty()) {
        return receipt;
    }

    // Catch stale streams before anything is written
    for (const auto& stream : streams_) {
        auto current = store_.current_version(stream.aggregate_id);
        if (!current.ok()) {
            return current.error();
        }
        if (current.value() != stream.expected_version) {
            logger_->warn("Commit rejected: '{}' is at v{}, expected v{}",
                          stream.aggregate_id, current.value(), stream.expected_version);
            return Error::conflict(stream.aggregate_id, stream.expected_version, current.value());
        }
    }

    std::optional<Error> failure;
    for (const auto& stream : streams_) {
        auto appended = store_.append(stream.aggregate_id, stream.expected_version, stream.events, cancel);
        if (!appended.ok()) {
            failure = appended.error();
            break;
        }
        receipt.versions[stream.aggregate_id] = appended.value();
        for (std::size_t i = 0; i < stream.events.size(); i++) {
            receipt.events.push_back(Event::appended(stream.events[i], stream.expected_version + i + 1));
        }
    }

    // Nothing written: leave the staged events for a retry or rollback()
    if (failure && receipt.events.empty()) {
        return *failure;
    }

    deliver(receipt);
    streams_.clear();
    auto callbacks = std::move(callbacks_);
    callbacks_.clear();

    // Callbacks see only the streams that were written
    for (const auto& callback : callbacks) {
        callback(receipt);
    }

    if (failure) {
        logger_->error("Commit partially applied: {} stream(s) written before: {}",
                       receipt.versions.size(), failure->to_string());
        Error error = *failure;
        error.with("committed_streams", std::to_string(receipt.versions.size()));
        return error;
    }

    logger_->debug("Committed {} event(s) across {} stream(s)", receipt.events.size(), receipt.versions.size());
    return receipt;
}

void UnitOfWork::deliver(CommitReceipt& receipt) {
    if (outbox_ && !store_.stages_outbox()) {
        std::vector<OutboxMessage> messages;
        messages.reserve(receipt.events.size());
        for (const auto& event : receipt.events) {
            messages.push_back(outbox_message(event));
        }
        outbox_->enqueue(messages);
    }

    if (!bus_) {
        return;
    }

    auto status = bus_->publish_many(receipt.events);
    std::unordered_set<std::string> undelivered;
    if (!status.ok()) {
        receipt.publish_status = status;
        const auto* failures = status.error().details_as<std::vector<HandlerFailure>>();
        if (!failures) {
            logger_->warn("Publish after commit did not finish, {} event(s) left for the relay: {}",
                          receipt.events.size(), status.error().to_string());
            return;
        }
        for (const auto& failure : *failures) {
            undelivered.insert(failure.event_id);
        }
        logger_->warn("{} event(s) failed delivery after commit and stay in the outbox", undelivered.size());
    }

    if (outbox_) {
        std::vector<std::string> delivered;
        for (const auto& event : receipt.events) {
            if (undelivered.count(event.event_id()) == 0) {
                delivered.push_back(event.event_id());
            }
        }
        outbox_->mark_processed(delivered);
    }
}

} // namespace esflow
