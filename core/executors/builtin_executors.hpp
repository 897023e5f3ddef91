#pragma once

#include "executors/action_executor.hpp"

namespace trustnet {

class ExecutorRegistry;

// ─── Built-in Executors ────────────────────────────────────────
// Each one accepts a single action type and rejects anything else.

/// IsolateComponent. Metrics: components_isolated, isolation_time.
class IsolationExecutor : public ActionExecutor {
public:
    std::string name() const override { return "isolation"; }
    Result<ActionResult> execute(const ResponseAction& action) const override;
};

/// ScaleResources. Parameter scale_factor (default 2.0).
class ScalingExecutor : public ActionExecutor {
public:
    static constexpr double DEFAULT_SCALE_FACTOR = 2.0;

    std::string name() const override { return "scaling"; }
    Result<ActionResult> execute(const ResponseAction& action) const override;
};

/// UpdateConfiguration. Parameters config_key / config_value
/// (default security_policy = enhanced).
class ConfigurationExecutor : public ActionExecutor {
public:
    std::string name() const override { return "configuration"; }
    Result<ActionResult> execute(const ResponseAction& action) const override;
};

/// TriggerWorkflow. Parameter workflow_id (default security_response).
class WorkflowExecutor : public ActionExecutor {
public:
    std::string name() const override { return "workflow"; }
    Result<ActionResult> execute(const ResponseAction& action) const override;
};

/// Register the four built-in executors.
void registerDefaultExecutors(ExecutorRegistry& registry);

} // namespace trustnet
