#pragma once

/**
 * @file test_support.hpp
 * @brief Shared event builders and a small account aggregate for tests
 */

#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "esflow/esflow.hpp"

namespace esflow::test {

inline NewEvent new_event(const std::string& aggregate_id,
                          const std::string& event_type,
                          Payload payload = Payload::object(),
                          SchemaVersion schema_version = 1,
                          EventOrigin origin = {}) {
    auto pending = NewEvent::create(aggregate_id, "Account", event_type, std::move(payload),
                                    schema_version, std::move(origin));
    if (!pending.ok()) {
        throw std::logic_error(pending.error().to_string());
    }
    return std::move(pending).value();
}

/**
 * @brief An event as a store would hand it out
 */
inline Event stored_event(const std::string& aggregate_id,
                          const std::string& event_type,
                          Version sequence_number,
                          Payload payload = Payload::object(),
                          EventOrigin origin = {}) {
    return Event::appended(new_event(aggregate_id, event_type, std::move(payload), 1, std::move(origin)),
                           sequence_number);
}

struct AccountState {
    std::string owner;
    std::int64_t balance{0};
    std::uint32_t deposits{0};

    bool operator==(const AccountState& other) const {
        return owner == other.owner && balance == other.balance && deposits == other.deposits;
    }
};

inline void to_json(nlohmann::json& j, const AccountState& state) {
    j = nlohmann::json{{"owner", state.owner}, {"balance", state.balance}, {"deposits", state.deposits}};
}

inline void from_json(const nlohmann::json& j, AccountState& state) {
    j.at("owner").get_to(state.owner);
    j.at("balance").get_to(state.balance);
    j.at("deposits").get_to(state.deposits);
}

inline ApplyDispatch<AccountState> account_dispatch() {
    ApplyDispatch<AccountState> dispatch;
    dispatch.on("AccountOpened", [](AccountState& state, const Payload& payload) {
        state.owner = payload.at("owner").get<std::string>();
    });
    dispatch.on("Deposited", [](AccountState& state, const Payload& payload) {
        state.balance += payload.at("amount").get<std::int64_t>();
        state.deposits++;
    });
    dispatch.on("Withdrawn", [](AccountState& state, const Payload& payload) {
        state.balance -= payload.at("amount").get<std::int64_t>();
    });
    return dispatch;
}

inline Payload amount(std::int64_t value) {
    return Payload{{"amount", value}};
}

} // namespace esflow::test
