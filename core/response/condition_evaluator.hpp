#pragma once

#include "response/response_policy.hpp"
#include "response/trust_context.hpp"

#include <map>
#include <mutex>
#include <string>
#include <tuple>

namespace trustnet {

/// value <op> threshold. Equality uses a 0.001 tolerance.
bool compareValues(double value, ComparisonOperator op, double threshold);

/// Instantaneous check of one condition, ignoring its duration.
///   TrustScore            trust_score <op> threshold
///   SecurityEvent         some event's severity <op> threshold
///   PerformanceMetric     metrics[metric_name] <op> threshold (absent → false)
///   BehavioralAnomaly     anomaly count <op> threshold
///   DependencyFailure     failed dependency count <op> threshold
///   CommunicationFailure  communication failure count <op> threshold
bool evaluateCondition(const ResponseCondition& condition, const TrustContext& context);

// ─── Condition Evaluator ───────────────────────────────────────
// Evaluates a policy's conditions with AND semantics and tracks the
// hold windows of conditions that carry a duration. Windows are keyed by
// (policy, component, condition index) and measured on context
// timestamps; any evaluation where the comparison fails resets them.

class ConditionEvaluator {
public:
    /// True when every condition holds. A policy without conditions holds.
    bool evaluatePolicy(const ResponsePolicy& policy, const TrustContext& context);

    /// Drop all hold windows for a component.
    void forgetComponent(const std::string& component_id);

    void reset();
    size_t trackedWindows() const;

private:
    using WindowKey = std::tuple<std::string, std::string, size_t>;

    mutable std::mutex mutex_;
    std::map<WindowKey, Timestamp> held_since_;
};

} // namespace trustnet
