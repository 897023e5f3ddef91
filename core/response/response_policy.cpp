#include "response/response_policy.hpp"

namespace trustnet {

const char* conditionTypeName(ConditionType type) {
    switch (type) {
        case ConditionType::TrustScore:           return "trust_score";
        case ConditionType::SecurityEvent:        return "security_event";
        case ConditionType::PerformanceMetric:    return "performance_metric";
        case ConditionType::BehavioralAnomaly:    return "behavioral_anomaly";
        case ConditionType::DependencyFailure:    return "dependency_failure";
        case ConditionType::CommunicationFailure: return "communication_failure";
    }
    return "unknown";
}

const char* comparisonOperatorName(ComparisonOperator op) {
    switch (op) {
        case ComparisonOperator::GreaterThan:        return ">";
        case ComparisonOperator::LessThan:           return "<";
        case ComparisonOperator::EqualTo:            return "==";
        case ComparisonOperator::NotEqualTo:         return "!=";
        case ComparisonOperator::GreaterThanOrEqual: return ">=";
        case ComparisonOperator::LessThanOrEqual:    return "<=";
    }
    return "?";
}

const char* actionTypeName(ActionType type) {
    switch (type) {
        case ActionType::IsolateComponent:     return "isolate_component";
        case ActionType::ScaleResources:       return "scale_resources";
        case ActionType::UpdateConfiguration:  return "update_configuration";
        case ActionType::TriggerWorkflow:      return "trigger_workflow";
        case ActionType::SendNotification:     return "send_notification";
        case ActionType::UpdateSecurityPolicy: return "update_security_policy";
        case ActionType::FailoverToBackup:     return "failover_to_backup";
        case ActionType::RestartService:       return "restart_service";
        case ActionType::UpdateFirewallRules:  return "update_firewall_rules";
        case ActionType::QuarantineData:       return "quarantine_data";
        case ActionType::EnableMonitoring:     return "enable_monitoring";
        case ActionType::DisableAccess:        return "disable_access";
    }
    return "unknown";
}

} // namespace trustnet
