#pragma once

#include "common/clock.hpp"

#include <string>

namespace trustnet {

enum class AlertType {
    TrustScoreLow,
    SecurityViolation,
    PerformanceDegradation,
    BehavioralAnomaly,
    DependencyFailure,
    CommunicationFailure,
};

enum class AlertSeverity {
    Low,
    Medium,
    High,
    Critical,
};

/// Active → Acknowledged → Resolved, or → Suppressed.
/// Resolved and Suppressed are terminal.
enum class AlertStatus {
    Active,
    Acknowledged,
    Resolved,
    Suppressed,
};

const char* alertTypeName(AlertType type);
const char* alertSeverityName(AlertSeverity severity);
const char* alertStatusName(AlertStatus status);

/// Advisory notice about a component. Independent of incidents.
struct Alert {
    std::string alert_id;
    std::string component_id;
    AlertType alert_type = AlertType::TrustScoreLow;
    AlertSeverity severity = AlertSeverity::Low;
    std::string message;
    Timestamp timestamp{};
    AlertStatus status = AlertStatus::Active;
};

/// Score thresholds for trust alerts. A score at or above `normal`
/// resolves the component's outstanding TrustScoreLow alerts.
struct TrustThresholds {
    double critical = 0.2;
    double warning  = 0.5;
    double normal   = 0.8;
};

} // namespace trustnet
