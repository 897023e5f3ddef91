#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "response/response_policy.hpp"

#include <string>
#include <unordered_map>

namespace trustnet {

enum class ActionStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
    Cancelled,
};

const char* actionStatusName(ActionStatus status);

/// Outcome of one dispatched action.
struct ActionRecord {
    std::string action_id;
    ActionType action_type = ActionType::SendNotification;
    std::string executor;            // empty when no executor was found
    Timestamp executed_at{};
    ActionStatus status = ActionStatus::Pending;
    std::string result;              // executor message or failure reason
    ErrorKind error = ErrorKind::None;
    Millis duration{0};
    unsigned attempts = 0;
    std::unordered_map<std::string, double> metrics;

    bool succeeded() const { return status == ActionStatus::Completed; }
};

} // namespace trustnet
