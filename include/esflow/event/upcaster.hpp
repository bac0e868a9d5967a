#pragma once

/**
 * @file upcaster.hpp
 * @brief Schema-version migration of event payloads
 */

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "esflow/event/event.hpp"

namespace esflow {

/**
 * @brief Pure payload migration from version N to N + 1
 */
using UpcastFn = std::function<Payload(const Payload&)>;

/**
 * @brief Registry of upcasters keyed by (event_type, from_version)
 *
 * Built at startup and passed by reference to the stores' readers; reads
 * are safe from any thread once registration is finished.
 */
class UpcasterRegistry {
public:
    UpcasterRegistry() = default;

    UpcasterRegistry(const UpcasterRegistry&) = delete;
    UpcasterRegistry& operator=(const UpcasterRegistry&) = delete;

    /**
     * @brief Register the migration from `from_version` to `from_version + 1`
     * @throws ConfigurationError on a duplicate key or from_version < 1
     */
    void register_upcaster(const std::string& event_type, SchemaVersion from_version, UpcastFn fn);

    /**
     * @brief Pin the current schema version of an event type
     * @throws ConfigurationError if version < 1 or below a registered target
     */
    void set_current_version(const std::string& event_type, SchemaVersion version);

    /**
     * @brief Pinned version, else 1 + highest registered from_version, else 1
     */
    [[nodiscard]] SchemaVersion current_version(const std::string& event_type) const;

    [[nodiscard]] bool has_upcaster(const std::string& event_type, SchemaVersion from_version) const;

    /**
     * @brief Chain upcasters from `from_version` up to `to_version`
     *
     * from == to returns the payload untouched. Upcast errors name the
     * first missing link in their details.
     */
    [[nodiscard]] Result<Payload> upcast(
        const std::string& event_type,
        SchemaVersion from_version,
        SchemaVersion to_version,
        Payload payload) const;

    /**
     * @brief Upcast an envelope to the current version of its type
     */
    [[nodiscard]] Result<Event> upcast_event(const Event& event) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::map<SchemaVersion, UpcastFn>> upcasters_;
    std::unordered_map<std::string, SchemaVersion> pinned_;
};

} // namespace esflow
