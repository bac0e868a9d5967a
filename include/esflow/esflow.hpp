#pragma once

/**
 * @file esflow.hpp
 * @brief Main header for esflow - event sourcing core
 *
 * Include this single header to access the full esflow API.
 */

#include "esflow/core/cancellation.hpp"
#include "esflow/core/clock.hpp"
#include "esflow/core/config.hpp"
#include "esflow/core/error.hpp"
#include "esflow/core/id.hpp"
#include "esflow/core/logging.hpp"
#include "esflow/core/metrics.hpp"
#include "esflow/core/result.hpp"
#include "esflow/core/task_pool.hpp"

#include "esflow/event/command.hpp"
#include "esflow/event/event.hpp"
#include "esflow/event/upcaster.hpp"

#include "esflow/store/event_store.hpp"
#include "esflow/store/memory_event_store.hpp"
#include "esflow/store/sqlite_event_store.hpp"

#include "esflow/snapshot/memory_snapshot_store.hpp"
#include "esflow/snapshot/snapshot.hpp"
#include "esflow/snapshot/snapshot_strategy.hpp"
#include "esflow/snapshot/sqlite_snapshot_store.hpp"

#include "esflow/aggregate/aggregate.hpp"
#include "esflow/aggregate/replay_engine.hpp"
#include "esflow/aggregate/repository.hpp"

#include "esflow/bus/dead_letter.hpp"
#include "esflow/bus/event_bus.hpp"
#include "esflow/bus/idempotency.hpp"
#include "esflow/bus/middleware.hpp"
#include "esflow/bus/outbox.hpp"
#include "esflow/bus/outbox_relay.hpp"

#include "esflow/command/command_bus.hpp"

#include "esflow/saga/saga.hpp"
#include "esflow/saga/saga_manager.hpp"
#include "esflow/saga/saga_store.hpp"
#include "esflow/saga/sqlite_saga_store.hpp"

#include "esflow/uow/unit_of_work.hpp"

namespace esflow {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace esflow
