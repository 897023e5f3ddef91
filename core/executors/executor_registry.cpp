#include "executors/executor_registry.hpp"
#include "common/logging.hpp"

#include <mutex>
#include <stdexcept>

namespace trustnet {

std::optional<std::string> executorNameFor(ActionType type) {
    switch (type) {
        case ActionType::IsolateComponent:    return std::string("isolation");
        case ActionType::ScaleResources:      return std::string("scaling");
        case ActionType::UpdateConfiguration: return std::string("configuration");
        case ActionType::TriggerWorkflow:     return std::string("workflow");
        default:                              return std::nullopt;
    }
}

void ExecutorRegistry::registerExecutor(std::unique_ptr<ActionExecutor> executor) {
    if (!executor) {
        throw std::invalid_argument("Cannot register a null action executor");
    }
    std::string n = executor->name();
    if (n.empty()) {
        throw std::invalid_argument("Action executor name must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool replaced = executors_.count(n) > 0;
    executors_[n] = std::shared_ptr<const ActionExecutor>(std::move(executor));
    logInfo((replaced ? "Replaced action executor: " : "Registered action executor: ") + n);
}

bool ExecutorRegistry::remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return executors_.erase(name) > 0;
}

std::shared_ptr<const ActionExecutor> ExecutorRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = executors_.find(name);
    return it != executors_.end() ? it->second : nullptr;
}

std::shared_ptr<const ActionExecutor> ExecutorRegistry::resolve(ActionType type,
                                                                bool fallback_to_any) const {
    auto mapped = executorNameFor(type);

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (mapped) {
        auto it = executors_.find(*mapped);
        return it != executors_.end() ? it->second : nullptr;
    }
    if (fallback_to_any && !executors_.empty()) {
        return executors_.begin()->second;
    }
    return nullptr;
}

std::vector<std::string> ExecutorRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(executors_.size());
    for (const auto& [n, e] : executors_) {
        result.push_back(n);
    }
    return result;
}

size_t ExecutorRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return executors_.size();
}

} // namespace trustnet
