#include "response/condition_evaluator.hpp"

#include <algorithm>
#include <cmath>

namespace trustnet {

bool compareValues(double value, ComparisonOperator op, double threshold) {
    switch (op) {
        case ComparisonOperator::GreaterThan:        return value > threshold;
        case ComparisonOperator::LessThan:           return value < threshold;
        case ComparisonOperator::EqualTo:            return std::fabs(value - threshold) < 0.001;
        case ComparisonOperator::NotEqualTo:         return std::fabs(value - threshold) >= 0.001;
        case ComparisonOperator::GreaterThanOrEqual: return value >= threshold;
        case ComparisonOperator::LessThanOrEqual:    return value <= threshold;
    }
    return false;
}

bool evaluateCondition(const ResponseCondition& condition, const TrustContext& context) {
    switch (condition.condition_type) {
        case ConditionType::TrustScore:
            return compareValues(context.trust_score, condition.op, condition.threshold);

        case ConditionType::SecurityEvent:
            return std::any_of(context.security_events.begin(), context.security_events.end(),
                               [&](const SecurityEvent& e) {
                                   return compareValues(e.severity, condition.op, condition.threshold);
                               });

        case ConditionType::PerformanceMetric: {
            auto it = context.performance_metrics.find(condition.metric_name);
            if (it == context.performance_metrics.end()) return false;
            return compareValues(it->second, condition.op, condition.threshold);
        }

        case ConditionType::BehavioralAnomaly:
            return compareValues(static_cast<double>(context.behavioral_anomalies.size()),
                                 condition.op, condition.threshold);

        case ConditionType::DependencyFailure:
            return compareValues(static_cast<double>(context.failed_dependencies.size()),
                                 condition.op, condition.threshold);

        case ConditionType::CommunicationFailure:
            return compareValues(static_cast<double>(context.communication_failures.size()),
                                 condition.op, condition.threshold);
    }
    return false;
}

bool ConditionEvaluator::evaluatePolicy(const ResponsePolicy& policy,
                                        const TrustContext& context) {
    bool all_hold = true;

    // No short-circuit: every windowed condition must see every sample
    for (size_t i = 0; i < policy.conditions.size(); i++) {
        const ResponseCondition& condition = policy.conditions[i];
        bool holds = evaluateCondition(condition, context);

        if (condition.duration) {
            WindowKey key{policy.policy_id, context.component_id, i};
            std::lock_guard<std::mutex> lock(mutex_);
            if (!holds) {
                held_since_.erase(key);
            } else {
                auto [it, inserted] = held_since_.emplace(key, context.timestamp);
                holds = (context.timestamp - it->second) >= *condition.duration;
            }
        }

        if (!holds) all_hold = false;
    }
    return all_hold;
}

void ConditionEvaluator::forgetComponent(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = held_since_.begin(); it != held_since_.end();) {
        if (std::get<1>(it->first) == component_id) {
            it = held_since_.erase(it);
        } else {
            ++it;
        }
    }
}

void ConditionEvaluator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_since_.clear();
}

size_t ConditionEvaluator::trackedWindows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_since_.size();
}

} // namespace trustnet
