#pragma once

#include "executors/action_worker_pool.hpp"
#include "executors/dispatch_config.hpp"
#include "executors/executor_registry.hpp"
#include "incident/action_record.hpp"

#include <vector>

namespace trustnet {

// ─── Action Dispatcher ─────────────────────────────────────────
// Runs a batch of actions through the executor registry and turns every
// outcome into an ActionRecord. Nothing here throws for a bad action:
//   no executor / unhealthy executor   → Failed, DispatchMismatch
//   executor error or exception        → Failed, ExecutorFailure
//   attempt outlives its timeout       → Failed, Timeout
//   dependency did not complete        → Cancelled
// Actions whose dependencies are settled run concurrently on the pool;
// failed attempts are retried up to retry_count more times.

class ActionDispatcher {
public:
    ActionDispatcher(const ExecutorRegistry& registry, DispatchConfig config = {});

    /// One record per action, in input order.
    std::vector<ActionRecord> dispatchBatch(const std::vector<ResponseAction>& actions);

    ActionRecord dispatch(const ResponseAction& action);

    const DispatchConfig& config() const { return config_; }

private:
    const ExecutorRegistry& registry_;
    DispatchConfig config_;
    ActionWorkerPool pool_;

    struct Flight;

    void launch(Flight& flight);
    void settle(Flight& flight);
    Millis timeoutFor(const ResponseAction& action) const;
};

} // namespace trustnet
