#include "esflow/event/upcaster.hpp"

#include <mutex>

namespace esflow {

void UpcasterRegistry::register_upcaster(const std::string& event_type, SchemaVersion from_version, UpcastFn fn) {
    if (event_type.empty()) {
        throw ConfigurationError("upcaster event_type must not be empty");
    }
    if (from_version < 1) {
        throw ConfigurationError("upcaster for '" + event_type + "' must start at version >= 1");
    }
    if (!fn) {
        throw ConfigurationError("upcaster for '" + event_type + "' is empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& chain = upcasters_[event_type];
    if (chain.count(from_version) != 0) {
        throw ConfigurationError("upcaster for '" + event_type + "' from v" +
                                 std::to_string(from_version) + " is already registered");
    }
    auto pinned = pinned_.find(event_type);
    if (pinned != pinned_.end() && from_version + 1 > pinned->second) {
        throw ConfigurationError("upcaster for '" + event_type + "' targets v" +
                                 std::to_string(from_version + 1) + " beyond pinned v" +
                                 std::to_string(pinned->second));
    }
    chain.emplace(from_version, std::move(fn));
}

void UpcasterRegistry::set_current_version(const std::string& event_type, SchemaVersion version) {
    if (version < 1) {
        throw ConfigurationError("current version of '" + event_type + "' must be >= 1");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = upcasters_.find(event_type);
    if (it != upcasters_.end() && !it->second.empty()) {
        SchemaVersion highest_target = it->second.rbegin()->first + 1;
        if (version < highest_target) {
            throw ConfigurationError("current version v" + std::to_string(version) + " of '" +
                                     event_type + "' is below registered upcaster target v" +
                                     std::to_string(highest_target));
        }
    }
    pinned_[event_type] = version;
}

SchemaVersion UpcasterRegistry::current_version(const std::string& event_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto pinned = pinned_.find(event_type);
    if (pinned != pinned_.end()) {
        return pinned->second;
    }
    auto it = upcasters_.find(event_type);
    if (it == upcasters_.end() || it->second.empty()) {
        return 1;
    }
    return it->second.rbegin()->first + 1;
}

bool UpcasterRegistry::has_upcaster(const std::string& event_type, SchemaVersion from_version) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = upcasters_.find(event_type);
    return it != upcasters_.end() && it->second.count(from_version) != 0;
}

Result<Payload> UpcasterRegistry::upcast(
    const std::string& event_type,
    SchemaVersion from_version,
    SchemaVersion to_version,
    Payload payload) const {
    UpcastDetails details{event_type, from_version, to_version, 0};

    if (from_version < 1) {
        details.missing_from_version = from_version;
        return Error::upcast(details, "source version must be >= 1");
    }
    if (from_version > to_version) {
        return Error::upcast(details, "cannot downcast");
    }
    if (from_version == to_version) {
        return payload;
    }

    // Copy the steps out so user functions run without the lock held
    std::vector<std::pair<SchemaVersion, UpcastFn>> steps;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = upcasters_.find(event_type);
        for (SchemaVersion v = from_version; v < to_version; v++) {
            if (it == upcasters_.end() || it->second.count(v) == 0) {
                details.missing_from_version = v;
                return Error::upcast(details, "no upcaster registered from v" + std::to_string(v));
            }
            steps.emplace_back(v, it->second.at(v));
        }
    }

    for (const auto& [version, fn] : steps) {
        try {
            payload = fn(payload);
        } catch (const std::exception& e) {
            details.missing_from_version = 0;
            return Error::upcast(details, "upcaster from v" + std::to_string(version) +
                                          " threw: " + e.what());
        }
        if (!payload.is_object()) {
            return Error::upcast(details, "upcaster from v" + std::to_string(version) +
                                          " did not return an object");
        }
    }
    return payload;
}

Result<Event> UpcasterRegistry::upcast_event(const Event& event) const {
    SchemaVersion target = current_version(event.event_type());
    if (event.schema_version() == target) {
        return event;
    }
    auto upcasted = upcast(event.event_type(), event.schema_version(), target, event.payload());
    if (!upcasted.ok()) {
        Error error = upcasted.error();
        error.with("event_id", event.event_id());
        return error;
    }
    return event.with_payload(std::move(upcasted).value(), target);
}

} // namespace esflow
