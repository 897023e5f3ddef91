#include "executors/action_dispatcher.hpp"
#include "common/logging.hpp"

#include <future>
#include <optional>
#include <unordered_map>

namespace trustnet {

namespace {

ActionRecord baseRecord(const ResponseAction& action) {
    ActionRecord rec;
    rec.action_id = action.action_id;
    rec.action_type = action.action_type;
    rec.executed_at = now();
    return rec;
}

ActionRecord failedRecord(const ResponseAction& action, ErrorKind kind, std::string reason) {
    ActionRecord rec = baseRecord(action);
    rec.status = ActionStatus::Failed;
    rec.error = kind;
    rec.result = std::move(reason);
    return rec;
}

ActionRecord cancelledRecord(const ResponseAction& action, std::string reason) {
    ActionRecord rec = baseRecord(action);
    rec.status = ActionStatus::Cancelled;
    rec.result = std::move(reason);
    return rec;
}

} // anonymous namespace

/// One action in flight: its executor, the pending attempt and the
/// record being filled in.
struct ActionDispatcher::Flight {
    const ResponseAction* action = nullptr;
    std::shared_ptr<const ActionExecutor> executor;
    std::future<Result<ActionResult>> pending;
    std::future<Timestamp> picked_up;
    Clock::time_point attempt_queued{};
    Clock::time_point started{};
    ActionRecord record;
};

ActionDispatcher::ActionDispatcher(const ExecutorRegistry& registry, DispatchConfig config)
    : registry_(registry), config_(config), pool_(config.worker_threads) {}

ActionRecord ActionDispatcher::dispatch(const ResponseAction& action) {
    return dispatchBatch({action}).front();
}

std::vector<ActionRecord> ActionDispatcher::dispatchBatch(const std::vector<ResponseAction>& actions) {
    const size_t n = actions.size();
    std::vector<ActionRecord> records(n);
    std::vector<bool> settled(n, false);

    // First occurrence wins when ids repeat.
    std::unordered_map<std::string, size_t> by_id;
    for (size_t i = 0; i < n; i++) {
        if (!actions[i].action_id.empty()) by_id.emplace(actions[i].action_id, i);
    }

    size_t remaining = n;
    while (remaining > 0) {
        std::vector<size_t> wave;
        bool progressed = false;

        for (size_t i = 0; i < n; i++) {
            if (settled[i]) continue;

            bool waiting = false;
            std::string blocked_by;
            for (const auto& dep : actions[i].dependencies) {
                auto it = by_id.find(dep);
                if (it == by_id.end() || it->second == i) continue;   // outside the batch
                size_t d = it->second;
                if (!settled[d]) {
                    waiting = true;
                } else if (records[d].status != ActionStatus::Completed) {
                    blocked_by = dep;
                    break;
                }
            }

            if (!blocked_by.empty()) {
                records[i] = cancelledRecord(actions[i],
                                             "Dependency " + blocked_by + " did not complete");
                settled[i] = true;
                remaining--;
                progressed = true;
            } else if (!waiting) {
                wave.push_back(i);
            }
        }

        if (wave.empty()) {
            if (progressed) continue;
            // Everything left waits on something unsettled: a cycle.
            for (size_t i = 0; i < n; i++) {
                if (settled[i]) continue;
                records[i] = cancelledRecord(actions[i], "Dependency cycle");
                settled[i] = true;
                remaining--;
            }
            logWarn("Cancelled actions caught in a dependency cycle");
            break;
        }

        std::vector<Flight> flights(wave.size());
        for (size_t k = 0; k < wave.size(); k++) {
            Flight& f = flights[k];
            f.action = &actions[wave[k]];
            f.record = baseRecord(*f.action);

            f.executor = registry_.resolve(f.action->action_type, config_.fallback_to_any_executor);
            if (!f.executor) {
                f.record = failedRecord(*f.action, ErrorKind::DispatchMismatch,
                                        std::string("No executor registered for action type ") +
                                            actionTypeName(f.action->action_type));
                logWarn("Dispatch mismatch for action " + f.action->action_id + ": " + f.record.result);
                continue;
            }
            f.record.executor = f.executor->name();
            if (!f.executor->isHealthy()) {
                f.record = failedRecord(*f.action, ErrorKind::DispatchMismatch,
                                        "Executor " + f.executor->name() + " is unhealthy");
                f.record.executor = f.executor->name();
                logWarn("Dispatch mismatch for action " + f.action->action_id + ": " + f.record.result);
                f.executor.reset();
                continue;
            }
            f.started = Clock::now();
            launch(f);
        }

        for (size_t k = 0; k < wave.size(); k++) {
            Flight& f = flights[k];
            if (f.executor) settle(f);
            records[wave[k]] = std::move(f.record);
            settled[wave[k]] = true;
            remaining--;
        }
    }

    return records;
}

void ActionDispatcher::launch(Flight& flight) {
    auto executor = flight.executor;
    ResponseAction action = *flight.action;
    flight.record.attempts++;
    flight.attempt_queued = Clock::now();
    auto submission = pool_.submit([executor, action]() { return executor->execute(action); });
    flight.pending = std::move(submission.result);
    flight.picked_up = std::move(submission.started);
}

void ActionDispatcher::settle(Flight& flight) {
    const ResponseAction& action = *flight.action;
    unsigned max_attempts = 1 + (config_.enforce_retries ? action.retry_count : 0);
    Millis timeout = timeoutFor(action);

    for (;;) {
        std::string timed_out;
        if (config_.enforce_timeouts) {
            // The timeout runs from when a worker picks the attempt up.
            std::optional<Timestamp> began;
            if (config_.queue_wait_limit_ms > 0) {
                auto limit = flight.attempt_queued + Millis(config_.queue_wait_limit_ms);
                if (flight.picked_up.wait_until(limit) == std::future_status::ready) {
                    Timestamp t = flight.picked_up.get();
                    if (t <= limit) began = t;
                }
            } else {
                began = flight.picked_up.get();
            }
            if (!began) {
                timed_out = "Not picked up by a worker within " +
                            std::to_string(config_.queue_wait_limit_ms) + " ms";
            } else if (flight.pending.wait_until(*began + timeout) != std::future_status::ready) {
                timed_out = "Timed out after " + std::to_string(timeout.count()) + " ms";
            }
        }

        if (!timed_out.empty()) {
            flight.record.status = ActionStatus::Failed;
            flight.record.error = ErrorKind::Timeout;
            flight.record.result = std::move(timed_out);
            flight.record.metrics.clear();
        } else {
            Result<ActionResult> outcome = flight.pending.get();
            if (outcome.ok() && outcome.value.success) {
                flight.record.status = ActionStatus::Completed;
                flight.record.error = ErrorKind::None;
                flight.record.result = outcome.value.message;
                flight.record.metrics = outcome.value.metrics;
            } else {
                flight.record.status = ActionStatus::Failed;
                flight.record.error = ErrorKind::ExecutorFailure;
                flight.record.result = outcome.ok() ? outcome.value.message : outcome.status.message;
                flight.record.metrics = outcome.value.metrics;
            }
        }

        if (flight.record.status == ActionStatus::Completed ||
            flight.record.attempts >= max_attempts) {
            break;
        }
        logDebug("Retrying action " + action.action_id + " (attempt " +
                 std::to_string(flight.record.attempts + 1) + ")");
        launch(flight);
    }

    flight.record.duration = std::chrono::duration_cast<Millis>(Clock::now() - flight.started);
    if (flight.record.status != ActionStatus::Completed) {
        logWarn("Action " + action.action_id + " on " + flight.record.executor + " failed: " +
                flight.record.result);
    }
}

Millis ActionDispatcher::timeoutFor(const ResponseAction& action) const {
    if (action.timeout.count() > 0) return action.timeout;
    return Millis(config_.default_timeout_ms);
}

} // namespace trustnet
