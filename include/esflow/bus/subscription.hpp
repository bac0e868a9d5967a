#pragma once

/**
 * @file subscription.hpp
 * @brief Handler registrations and topic matching
 */

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include "esflow/core/result.hpp"
#include "esflow/event/event.hpp"

namespace esflow {

using SubscriptionId = std::uint64_t;

/**
 * @brief Event handler; failures are returned or thrown
 */
using EventHandler = std::function<Status(const Event&)>;

struct Subscription {
    SubscriptionId id{0};
    std::string topic_pattern;
    std::string name;
    int priority{0};
    EventHandler handler;
};

/**
 * @brief Match an event type against a subscription pattern
 *
 * "*" matches everything; otherwise '*' matches any run of characters
 * ("Order*", "*Failed", "Order*Failed") and the rest must match exactly.
 */
[[nodiscard]] bool topic_matches(std::string_view pattern, std::string_view topic) noexcept;

/**
 * @brief Adapt a callable returning Status or void into an EventHandler
 */
template<typename F>
EventHandler to_event_handler(F&& f) {
    using R = std::invoke_result_t<std::decay_t<F>&, const Event&>;
    if constexpr (std::is_void_v<R>) {
        return [fn = std::forward<F>(f)](const Event& event) mutable -> Status {
            fn(event);
            return ok_status();
        };
    } else {
        static_assert(std::is_convertible_v<R, Status>, "event handler must return Status or void");
        return EventHandler(std::forward<F>(f));
    }
}

} // namespace esflow
