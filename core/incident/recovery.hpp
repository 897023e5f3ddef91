#pragma once

#include "common/clock.hpp"
#include "response/response_policy.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

struct RecoveryStep {
    std::string step_id;
    std::string step_name;
    ActionType action_type = ActionType::RestartService;
    std::unordered_map<std::string, std::string> parameters;
    Millis timeout{0};
    unsigned retry_count = 0;
};

/// metric <op> threshold over the merged metrics of the executed steps.
struct SuccessCriterion {
    std::string criterion_id;
    std::string metric_name;
    ComparisonOperator op = ComparisonOperator::GreaterThanOrEqual;
    double threshold = 0.0;
    std::string description;
};

struct RecoveryPlan {
    std::string plan_id;
    std::string name;
    std::vector<std::string> target_components;   // empty → the recovering component
    std::vector<RecoveryStep> recovery_steps;
    std::vector<SuccessCriterion> success_criteria;
};

enum class RecoveryStatus {
    InProgress,
    Completed,
    Failed,
    Cancelled,
};

const char* recoveryStatusName(RecoveryStatus status);

struct RecoveryRecord {
    std::string recovery_id;
    std::string plan_id;
    std::string component_id;
    Timestamp started_at{};
    std::optional<Timestamp> completed_at;
    RecoveryStatus status = RecoveryStatus::InProgress;
    std::vector<std::string> steps_completed;
    std::vector<std::string> success_criteria_met;
    std::string failure_reason;
};

} // namespace trustnet
