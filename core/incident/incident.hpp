#pragma once

#include "incident/action_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trustnet {

enum class IncidentSeverity {
    Low,
    Medium,
    High,
    Critical,
    Emergency,
};

/// Open → Investigating → Mitigating → {Resolved | Closed | Escalated}.
/// Resolved and Closed are terminal.
enum class IncidentStatus {
    Open,
    Investigating,
    Mitigating,
    Resolved,
    Closed,
    Escalated,
};

const char* incidentSeverityName(IncidentSeverity severity);
const char* incidentStatusName(IncidentStatus status);

inline bool isTerminal(IncidentStatus status) {
    return status == IncidentStatus::Resolved || status == IncidentStatus::Closed;
}

/// Severity implied by a trust score.
IncidentSeverity severityForTrustScore(double trust_score);

struct EscalationRecord {
    Timestamp escalated_at{};
    std::string policy_id;
    std::string escalated_to;    // escalation step id
    std::string reason;
    bool awaiting_approval = false;
    std::optional<Timestamp> approved_at;
    std::vector<std::string> actions_taken;
};

struct IncidentMetrics {
    Millis detection_time{0};
    Millis response_time{0};     // creation → first recorded action
    Millis resolution_time{0};   // creation → resolution
    double business_impact = 0.0;
    unsigned long affected_users = 0;
    bool data_compromised = false;
};

struct Incident {
    std::string incident_id;
    std::string title;
    std::string description;
    IncidentSeverity severity = IncidentSeverity::Medium;
    IncidentStatus status = IncidentStatus::Open;
    std::vector<std::string> affected_components;
    std::optional<std::string> root_cause;
    Timestamp created_at{};
    Timestamp updated_at{};
    std::optional<Timestamp> resolved_at;
    std::vector<ActionRecord> actions_taken;
    std::vector<EscalationRecord> escalation_history;
    IncidentMetrics metrics;
};

} // namespace trustnet
