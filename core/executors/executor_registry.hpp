#pragma once

#include "executors/action_executor.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace trustnet {

/// Fixed action type → executor name mapping. Unmapped types have none.
///   IsolateComponent → "isolation"      ScaleResources  → "scaling"
///   UpdateConfiguration → "configuration"  TriggerWorkflow → "workflow"
std::optional<std::string> executorNameFor(ActionType type);

/// Registry for action executors, keyed by name().
class ExecutorRegistry {
public:
    /// Register an executor (takes ownership). Replaces an executor of
    /// the same name. Throws std::invalid_argument on null.
    void registerExecutor(std::unique_ptr<ActionExecutor> executor);

    bool remove(const std::string& name);

    std::shared_ptr<const ActionExecutor> get(const std::string& name) const;

    /// Executor for an action type. Unmapped types resolve to nothing
    /// unless fallback_to_any is set, in which case the lexicographically
    /// first registered executor is used.
    std::shared_ptr<const ActionExecutor> resolve(ActionType type, bool fallback_to_any) const;

    /// Sorted.
    std::vector<std::string> names() const;
    size_t count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const ActionExecutor>> executors_;
};

} // namespace trustnet
