#pragma once

#include "common/clock.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

enum class ConditionType {
    TrustScore,
    SecurityEvent,
    PerformanceMetric,
    BehavioralAnomaly,
    DependencyFailure,
    CommunicationFailure,
};

enum class ComparisonOperator {
    GreaterThan,
    LessThan,
    EqualTo,
    NotEqualTo,
    GreaterThanOrEqual,
    LessThanOrEqual,
};

enum class ActionType {
    IsolateComponent,
    ScaleResources,
    UpdateConfiguration,
    TriggerWorkflow,
    SendNotification,
    UpdateSecurityPolicy,
    FailoverToBackup,
    RestartService,
    UpdateFirewallRules,
    QuarantineData,
    EnableMonitoring,
    DisableAccess,
};

const char* conditionTypeName(ConditionType type);
const char* comparisonOperatorName(ComparisonOperator op);
const char* actionTypeName(ActionType type);

/// (metric, operator, threshold[, duration]).
/// With a duration, the comparison must hold continuously for at least
/// that long before the condition counts as met.
struct ResponseCondition {
    ConditionType condition_type = ConditionType::TrustScore;
    std::string metric_name;
    ComparisonOperator op = ComparisonOperator::LessThan;
    double threshold = 0.0;
    std::optional<Millis> duration;
};

struct ResponseAction {
    std::string action_id;
    ActionType action_type = ActionType::SendNotification;
    std::vector<std::string> target_components;   // empty → the evaluated component
    std::unordered_map<std::string, std::string> parameters;
    Millis timeout{0};                             // 0 → dispatcher default
    unsigned retry_count = 0;                      // extra attempts after the first
    std::vector<std::string> dependencies;         // action ids in the same batch
};

struct EscalationStep {
    std::string step_id;
    Millis delay{0};                               // since previous step / incident creation
    std::vector<ResponseAction> actions;
    std::vector<std::string> notification_channels;
    bool approval_required = false;
};

/// All conditions must hold (AND). Lower priority is evaluated first.
struct ResponsePolicy {
    std::string policy_id;
    std::string name;
    std::vector<ResponseCondition> conditions;
    std::vector<ResponseAction> actions;
    unsigned priority = 0;
    bool enabled = true;
    std::vector<EscalationStep> escalation_chain;
};

} // namespace trustnet
