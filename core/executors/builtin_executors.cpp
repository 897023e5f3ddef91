#include "executors/builtin_executors.hpp"
#include "executors/executor_registry.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>

namespace trustnet {

namespace {

Result<ActionResult> rejectType(const std::string& executor, const ResponseAction& action) {
    return Result<ActionResult>::failure(Status::error(
        ErrorKind::ExecutorFailure,
        std::string("Invalid action type ") + actionTypeName(action.action_type) +
            " for " + executor + " executor"));
}

std::string parameterOr(const ResponseAction& action, const std::string& key,
                        const std::string& fallback) {
    auto it = action.parameters.find(key);
    return it != action.parameters.end() ? it->second : fallback;
}

/// Parse the whole string as a double; fallback when it is not a number.
double parseDouble(const std::string& text, double fallback) {
    if (text.empty()) return fallback;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return fallback;
    return v;
}

ActionResult makeResult(std::string message) {
    ActionResult r;
    r.success = true;
    r.message = std::move(message);
    r.timestamp = now();
    return r;
}

} // anonymous namespace

// ─── IsolationExecutor ─────────────────────────────────────────

Result<ActionResult> IsolationExecutor::execute(const ResponseAction& action) const {
    if (action.action_type != ActionType::IsolateComponent) {
        return rejectType(name(), action);
    }

    std::ostringstream msg;
    msg << "Isolated components: [";
    for (size_t i = 0; i < action.target_components.size(); i++) {
        if (i > 0) msg << ", ";
        msg << action.target_components[i];
    }
    msg << "]";

    ActionResult r = makeResult(msg.str());
    r.metrics["components_isolated"] = static_cast<double>(action.target_components.size());
    r.metrics["isolation_time"] = 2.5;
    return Result<ActionResult>::success(std::move(r));
}

// ─── ScalingExecutor ───────────────────────────────────────────

Result<ActionResult> ScalingExecutor::execute(const ResponseAction& action) const {
    if (action.action_type != ActionType::ScaleResources) {
        return rejectType(name(), action);
    }

    double factor = parseDouble(parameterOr(action, "scale_factor", ""), DEFAULT_SCALE_FACTOR);

    std::ostringstream msg;
    msg << "Scaled resources by factor: " << factor;

    ActionResult r = makeResult(msg.str());
    r.metrics["scale_factor"] = factor;
    r.metrics["scaling_time"] = 30.0;
    return Result<ActionResult>::success(std::move(r));
}

// ─── ConfigurationExecutor ─────────────────────────────────────

Result<ActionResult> ConfigurationExecutor::execute(const ResponseAction& action) const {
    if (action.action_type != ActionType::UpdateConfiguration) {
        return rejectType(name(), action);
    }

    std::string key = parameterOr(action, "config_key", "security_policy");
    std::string value = parameterOr(action, "config_value", "enhanced");

    ActionResult r = makeResult("Updated configuration: " + key + " = " + value);
    r.metrics["config_updated"] = 1.0;
    r.metrics["update_time"] = 5.0;
    return Result<ActionResult>::success(std::move(r));
}

// ─── WorkflowExecutor ──────────────────────────────────────────

Result<ActionResult> WorkflowExecutor::execute(const ResponseAction& action) const {
    if (action.action_type != ActionType::TriggerWorkflow) {
        return rejectType(name(), action);
    }

    std::string workflow = parameterOr(action, "workflow_id", "security_response");

    ActionResult r = makeResult("Triggered workflow: " + workflow);
    r.metrics["workflow_triggered"] = 1.0;
    return Result<ActionResult>::success(std::move(r));
}

void registerDefaultExecutors(ExecutorRegistry& registry) {
    registry.registerExecutor(std::make_unique<IsolationExecutor>());
    registry.registerExecutor(std::make_unique<ScalingExecutor>());
    registry.registerExecutor(std::make_unique<ConfigurationExecutor>());
    registry.registerExecutor(std::make_unique<WorkflowExecutor>());
}

} // namespace trustnet
