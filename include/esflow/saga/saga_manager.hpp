#pragma once

/**
 * @file saga_manager.hpp
 * @brief Routes events to saga instances and drives their commands
 */

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "esflow/bus/subscription.hpp"
#include "esflow/command/command_bus.hpp"
#include "esflow/core/config.hpp"
#include "esflow/core/logging.hpp"
#include "esflow/saga/saga_store.hpp"

namespace esflow {

/**
 * @brief Saga orchestration
 *
 * Each instance is serialized by a striped in-process lock while it is
 * loaded, handled and saved; the stored version guards against writers in
 * other processes. Commands are dispatched after the save, outside the
 * lock, so their handlers may publish events back into the same saga.
 */
class SagaManager {
public:
    SagaManager(std::shared_ptr<SagaStore> store, CommandBus& commands, SagaManagerConfig config = {});

    SagaManager(const SagaManager&) = delete;
    SagaManager& operator=(const SagaManager&) = delete;

    /**
     * @throws ConfigurationError on a second saga with the same type
     */
    void register_saga(std::shared_ptr<Saga> saga);

    /**
     * @brief Feed one event to every saga that handles its type
     *
     * Returns the first error among the sagas involved; a compensation
     * that fails is reported as SagaCompensation.
     */
    Status handle(const Event& event);

    /**
     * @brief Adapter for EventBus::subscribe
     */
    [[nodiscard]] EventHandler as_handler();

    [[nodiscard]] Result<SagaInstance> find(const std::string& saga_id) const;

    [[nodiscard]] std::vector<SagaInstance> list_by_status(SagaStatus status) const;

    /**
     * @brief Finish an interrupted compensation of one instance
     *
     * Instances that are not Compensating are left alone. NotFound if the
     * instance is missing or its saga type is not registered.
     */
    Status resume(const std::string& saga_id);

    /**
     * @brief resume() every Compensating instance in the store
     *
     * Call at startup, after the sagas are registered. Returns the first
     * error; the remaining instances are still visited.
     */
    Status recover();

    /**
     * @brief Id of the instance `saga` keeps for `event`
     */
    [[nodiscard]] static std::string saga_id_for(const Saga& saga, const Event& event);

private:
    static constexpr std::size_t kLockStripes = 64;

    using Mutation = std::function<bool(SagaInstance&)>;

    [[nodiscard]] std::vector<std::shared_ptr<Saga>> sagas_for(const std::string& event_type) const;
    [[nodiscard]] std::mutex& stripe(const std::string& saga_id);

    Status handle_for(Saga& saga, const Event& event);

    /**
     * @brief Load, mutate and save under the stripe lock, retrying on conflict
     *
     * The mutation returns false to leave the stored instance untouched.
     */
    Result<SagaInstance> update(const std::string& saga_id, const Mutation& mutate);

    /**
     * @brief Send the commands queued by one delivery
     *
     * `completed_at` is the version saved by that delivery when it completed
     * the saga (0 otherwise); a failed command then reopens it for
     * compensation unless another write came in between.
     */
    Status dispatch_forward(const Saga& saga, const std::string& saga_id,
                            const Event& event, std::vector<Command> commands,
                            Version completed_at);

    /**
     * @brief Undo completed steps last-first; `cause` (may be null) stamps the commands
     */
    Status run_compensation(const Saga& saga, const std::string& saga_id, const Event* cause);

    void stamp(Command& command, const Event* cause) const;

    std::shared_ptr<SagaStore> store_;
    CommandBus& commands_;
    SagaManagerConfig config_;

    mutable std::shared_mutex sagas_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Saga>> sagas_;
    std::vector<std::shared_ptr<Saga>> registration_order_;

    std::array<std::mutex, kLockStripes> stripes_;

    std::mutex compensating_mutex_;
    std::unordered_set<std::string> compensating_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
