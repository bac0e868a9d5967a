#include "esflow/saga/saga_manager.hpp"

#include <optional>

namespace esflow {

SagaManager::SagaManager(std::shared_ptr<SagaStore> store, CommandBus& commands, SagaManagerConfig config)
    : store_(std::move(store))
    , commands_(commands)
    , config_(config)
    , logger_(logging::get("esflow.saga")) {
    if (!store_) {
        throw ConfigurationError("SagaManager needs a saga store");
    }
    auto status = config_.validate();
    if (!status.ok()) {
        throw ConfigurationError(status.error().to_string());
    }
}

void SagaManager::register_saga(std::shared_ptr<Saga> saga) {
    if (!saga) {
        throw ConfigurationError("saga must not be null");
    }
    auto type = saga->saga_type();
    if (type.empty()) {
        throw ConfigurationError("saga type must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(sagas_mutex_);
    if (sagas_.count(type) != 0) {
        throw ConfigurationError("saga '" + type + "' is already registered");
    }
    sagas_.emplace(type, saga);
    registration_order_.push_back(std::move(saga));
    logger_->info("Registered saga {}", type);
}

std::vector<std::shared_ptr<Saga>> SagaManager::sagas_for(const std::string& event_type) const {
    std::shared_lock<std::shared_mutex> lock(sagas_mutex_);
    std::vector<std::shared_ptr<Saga>> result;
    for (const auto& saga : registration_order_) {
        if (saga->handles(event_type)) {
            result.push_back(saga);
        }
    }
    return result;
}

std::mutex& SagaManager::stripe(const std::string& saga_id) {
    return stripes_[std::hash<std::string>{}(saga_id) % kLockStripes];
}

std::string SagaManager::saga_id_for(const Saga& saga, const Event& event) {
    return saga.saga_type() + "/" + saga.correlation_key(event);
}

EventHandler SagaManager::as_handler() {
    return [this](const Event& event) { return handle(event); };
}

Result<SagaInstance> SagaManager::find(const std::string& saga_id) const {
    return store_->load(saga_id);
}

std::vector<SagaInstance> SagaManager::list_by_status(SagaStatus status) const {
    return store_->list_by_status(status);
}

Status SagaManager::handle(const Event& event) {
    std::optional<Error> first_error;
    for (const auto& saga : sagas_for(event.event_type())) {
        auto status = handle_for(*saga, event);
        if (!status.ok() && !first_error) {
            first_error = status.error();
        }
    }
    if (first_error) {
        return *first_error;
    }
    return ok_status();
}

Status SagaManager::handle_for(Saga& saga, const Event& event) {
    if (saga.correlation_key(event).empty()) {
        return Error::validation("event has no correlation key")
            .with("saga_type", saga.saga_type())
            .with("event_id", event.event_id());
    }
    const std::string saga_id = saga_id_for(saga, event);

    std::vector<Command> outgoing;
    std::optional<SagaInstance> current;
    std::optional<Error> last_conflict;

    for (std::uint32_t attempt = 0; attempt <= config_.max_conflict_retries && !current; attempt++) {
        std::lock_guard<std::mutex> lock(stripe(saga_id));

        SagaInstance instance;
        auto loaded = store_->load(saga_id);
        if (loaded.ok()) {
            instance = std::move(loaded).value();
        } else if (!loaded.error().is(ErrorCode::NotFound)) {
            return loaded.error();
        } else if (!saga.starts_on(event.event_type())) {
            logger_->debug("No {} instance for {}, {} does not start one",
                           saga.saga_type(), saga_id, event.event_type());
            return ok_status();
        } else {
            instance.saga_id = saga_id;
            instance.saga_type = saga.saga_type();
        }

        if (is_terminal(instance.status) || instance.status == SagaStatus::Compensating) {
            logger_->debug("Saga {} is {}, ignoring {}", saga_id, to_string(instance.status), event.event_type());
            return ok_status();
        }

        SagaInstance working = instance;
        SagaContext context(working, saga.max_retries());
        Status status = [&]() -> Status {
            try {
                return saga.handle_event(working, event, context);
            } catch (const std::exception& e) {
                return Error::handler(std::string("saga handler threw: ") + e.what());
            }
        }();
        if (!status.ok()) {
            logger_->error("Saga {} failed on {} ({}): {}",
                           saga_id, event.event_type(), event.event_id(), status.error().to_string());
            return status;
        }

        if (working.status == SagaStatus::Started) {
            working.status = SagaStatus::Waiting;
        }
        working.updated_at = now_utc();

        auto saved = store_->save(working, instance.version);
        if (!saved.ok()) {
            if (!saved.error().is(ErrorCode::ConcurrencyConflict)) {
                return saved.error();
            }
            logger_->warn("Saga {} changed concurrently, reloading (attempt {})", saga_id, attempt + 1);
            last_conflict = saved.error();
            continue;
        }
        working.version = saved.value();

        if (working.status != instance.status) {
            logger_->info("Saga {} {} -> {} on {}", saga_id,
                          to_string(instance.status), to_string(working.status), event.event_type());
        }
        outgoing = context.take_commands();
        current = std::move(working);
    }

    if (!current) {
        return *last_conflict;
    }

    // A saga that completed on this event is reopened if its last commands fail
    Version completed_at = current->status == SagaStatus::Completed ? current->version : 0;
    auto forwarded = dispatch_forward(saga, saga_id, event, std::move(outgoing), completed_at);
    if (!forwarded.ok()) {
        return forwarded;
    }
    if (current->status == SagaStatus::Compensating) {
        return run_compensation(saga, saga_id, &event);
    }
    return ok_status();
}

Status SagaManager::resume(const std::string& saga_id) {
    auto loaded = store_->load(saga_id);
    if (!loaded.ok()) {
        return loaded.error();
    }
    const SagaInstance& instance = loaded.value();
    if (instance.status != SagaStatus::Compensating) {
        return ok_status();
    }

    std::shared_ptr<Saga> saga;
    {
        std::shared_lock<std::shared_mutex> lock(sagas_mutex_);
        auto it = sagas_.find(instance.saga_type);
        if (it != sagas_.end()) {
            saga = it->second;
        }
    }
    if (!saga) {
        return Error::not_found("no saga registered for an interrupted instance")
            .with("saga_id", saga_id)
            .with("saga_type", instance.saga_type);
    }

    logger_->info("Resuming compensation of saga {} ({} of {} step(s) undone)",
                  saga_id, instance.compensation_log.size(), instance.completed_steps.size());
    return run_compensation(*saga, saga_id, nullptr);
}

Status SagaManager::recover() {
    std::optional<Error> first_error;
    auto interrupted = store_->list_by_status(SagaStatus::Compensating);
    for (const auto& instance : interrupted) {
        auto status = resume(instance.saga_id);
        if (!status.ok()) {
            logger_->error("Saga {} could not be recovered: {}", instance.saga_id, status.error().to_string());
            if (!first_error) {
                first_error = status.error();
            }
        }
    }
    if (!interrupted.empty()) {
        logger_->info("Recovery visited {} interrupted saga(s)", interrupted.size());
    }
    if (first_error) {
        return *first_error;
    }
    return ok_status();
}

Result<SagaInstance> SagaManager::update(const std::string& saga_id, const Mutation& mutate) {
    std::optional<Error> last_conflict;
    for (std::uint32_t attempt = 0; attempt <= config_.max_conflict_retries; attempt++) {
        std::lock_guard<std::mutex> lock(stripe(saga_id));

        auto loaded = store_->load(saga_id);
        if (!loaded.ok()) {
            return loaded.error();
        }
        SagaInstance instance = std::move(loaded).value();
        Version expected = instance.version;
        if (!mutate(instance)) {
            return instance;
        }

        instance.updated_at = now_utc();
        auto saved = store_->save(instance, expected);
        if (saved.ok()) {
            instance.version = saved.value();
            return instance;
        }
        if (!saved.error().is(ErrorCode::ConcurrencyConflict)) {
            return saved.error();
        }
        logger_->warn("Saga {} changed concurrently, reloading (attempt {})", saga_id, attempt + 1);
        last_conflict = saved.error();
    }
    return *last_conflict;
}

void SagaManager::stamp(Command& command, const Event* cause) const {
    if (!cause) {
        return;
    }
    command.causation_id = cause->event_id();
    if (!cause->correlation_id().empty()) {
        command.correlation_id = cause->correlation_id();
    }
}

Status SagaManager::dispatch_forward(const Saga& saga, const std::string& saga_id,
                                     const Event& event, std::vector<Command> commands,
                                     Version completed_at) {
    for (auto& command : commands) {
        stamp(command, &event);
        auto result = commands_.dispatch(command);
        if (result.ok()) {
            continue;
        }

        std::string reason = "command '" + command.command_type + "' failed: " + result.error().message();
        logger_->warn("Saga {}: {}", saga_id, reason);

        bool compensating = false;
        auto moved = update(saga_id, [&](SagaInstance& instance) {
            compensating = instance.status == SagaStatus::Compensating;
            bool reopened = instance.status == SagaStatus::Completed && completed_at != 0 &&
                            instance.version == completed_at;
            if (compensating || (is_terminal(instance.status) && !reopened)) {
                return false;
            }
            instance.status = SagaStatus::Compensating;
            instance.failure_reason = reason;
            compensating = true;
            return true;
        });
        if (!moved.ok()) {
            return moved.error();
        }
        if (!compensating) {
            // Nothing left to undo once the saga has finished
            return Error::handler(reason).with("saga_id", saga_id);
        }
        return run_compensation(saga, saga_id, &event);
    }
    return ok_status();
}

Status SagaManager::run_compensation(const Saga& saga, const std::string& saga_id, const Event* cause) {
    {
        std::lock_guard<std::mutex> lock(compensating_mutex_);
        if (!compensating_.insert(saga_id).second) {
            logger_->debug("Saga {} is already being compensated", saga_id);
            return ok_status();
        }
    }
    struct Release {
        SagaManager& manager;
        const std::string& saga_id;
        ~Release() {
            std::lock_guard<std::mutex> lock(manager.compensating_mutex_);
            manager.compensating_.erase(saga_id);
        }
    } release{*this, saga_id};

    while (true) {
        auto loaded = [&] {
            std::lock_guard<std::mutex> lock(stripe(saga_id));
            return store_->load(saga_id);
        }();
        if (!loaded.ok()) {
            return loaded.error();
        }
        const SagaInstance& instance = loaded.value();

        if (instance.status == SagaStatus::Failed) {
            return Error::compensation(instance.failure_reason, instance.compensation_log)
                .with("saga_id", saga_id);
        }
        if (instance.status != SagaStatus::Compensating) {
            return ok_status();
        }

        // Steps are undone last-first; the log holds one record per undone step
        std::size_t undone = instance.compensation_log.size();
        if (undone >= instance.completed_steps.size()) {
            auto finished = update(saga_id, [](SagaInstance& current) {
                if (current.status != SagaStatus::Compensating) {
                    return false;
                }
                current.status = SagaStatus::Compensated;
                return true;
            });
            if (!finished.ok()) {
                return finished.error();
            }
            logger_->info("Saga {} compensated {} step(s)", saga_id, undone);
            return ok_status();
        }

        const std::string step = instance.completed_steps[instance.completed_steps.size() - 1 - undone];
        CompensationRecord record;
        record.step = step;
        record.succeeded = true;

        std::optional<Command> command;
        try {
            command = saga.compensation_for(step, instance);
        } catch (const std::exception& e) {
            record.succeeded = false;
            record.error = std::string("compensation_for threw: ") + e.what();
        }

        if (command) {
            stamp(*command, cause);
            record.command_type = command->command_type;
            auto result = commands_.dispatch(*command);
            if (!result.ok()) {
                record.succeeded = false;
                record.error = result.error().message();
            }
        }
        record.at = now_utc();

        auto saved = update(saga_id, [&](SagaInstance& current) {
            if (current.status != SagaStatus::Compensating || current.compensation_log.size() != undone) {
                return false;
            }
            current.compensation_log.push_back(record);
            if (!record.succeeded) {
                current.status = SagaStatus::Failed;
                current.failure_reason = "compensation of step '" + step + "' failed: " + record.error;
            }
            return true;
        });
        if (!saved.ok()) {
            return saved.error();
        }

        if (!record.succeeded) {
            logger_->error("Saga {} failed while compensating step '{}': {}", saga_id, step, record.error);
        } else {
            logger_->debug("Saga {} compensated step '{}'", saga_id, step);
        }
    }
}

} // namespace esflow
