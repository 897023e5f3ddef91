#pragma once

#include "graph/node.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

enum class CompositionRuleType {
    TrustThreshold,
    DependencyFailure,
    SecurityViolation,
    PerformanceDegradation,
    ComplianceViolation,
};

struct SecurityCondition {
    double vulnerability_threshold = 1.0;   // vulnerability above this matches
    bool patch_status_required = false;     // patch_status below 1.0 matches
    double compliance_threshold = 0.0;      // compliance below this matches
};

/// Graph-wide predicate. Matches when some node (of component_type, if
/// given) satisfies the trust threshold or the security condition.
struct CompositionCondition {
    std::optional<ComponentType> component_type;
    std::optional<double> trust_threshold;   // node trust below this matches
    std::optional<SecurityCondition> security_condition;
};

enum class CompositionActionType {
    IsolateComponent,
    ReduceTrustWeight,
    TriggerAlert,
    UpdateSecurityPolicy,
    ScaleResources,
    FailoverToBackup,
};

const char* compositionActionTypeName(CompositionActionType type);

struct CompositionAction {
    CompositionActionType action_type = CompositionActionType::TriggerAlert;
    std::vector<std::string> target_components;
    std::unordered_map<std::string, std::string> parameters;
};

/// A rule fires when any of its conditions matches. Rules are kept in
/// ascending priority order and never short-circuit each other.
struct CompositionRule {
    std::string rule_id;
    CompositionRuleType rule_type = CompositionRuleType::TrustThreshold;
    std::vector<CompositionCondition> conditions;
    std::vector<CompositionAction> actions;
    unsigned priority = 0;
};

/// An action collected from a matching rule.
struct TriggeredCompositionAction {
    std::string rule_id;
    CompositionAction action;
};

} // namespace trustnet
