#pragma once

#include "common/status.hpp"
#include "incident/incident.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

// ─── Incident Store ────────────────────────────────────────────
// Incidents keyed by incident id, plus a component → open incident
// index. Opening a second incident for a component moves the index to
// the new one; the older incident stays addressable by id.
// One lock for the whole store: appends and creations are serialized.

class IncidentStore {
public:
    /// Open a new incident for component. Returns its id.
    std::string create(const std::string& component_id, IncidentSeverity severity,
                       const std::string& description);

    struct AppendResult {
        std::string incident_id;
        bool created = false;
    };

    /// Append a record to the component's open incident, opening one with
    /// the given severity and description if there is none.
    AppendResult appendAction(const std::string& component_id, const ActionRecord& record,
                              IncidentSeverity severity_if_new,
                              const std::string& description_if_new);

    /// Append to the component's open incident only. NotFound if none.
    Status appendToOpen(const std::string& component_id, const ActionRecord& record);

    /// Append to a specific incident. InvalidArgument once it is terminal.
    Status appendToIncident(const std::string& incident_id, const ActionRecord& record);

    Status setStatus(const std::string& incident_id, IncidentStatus status);
    Status resolve(const std::string& incident_id);
    Status addEscalation(const std::string& incident_id, EscalationRecord record);

    /// Mark the latest escalation to step_id that awaits approval as
    /// approved and return it. Only one caller can claim a given step.
    Result<EscalationRecord> claimApproval(const std::string& incident_id,
                                           const std::string& step_id);

    /// Replace the first Pending record with the same action id by each
    /// record; records with no Pending counterpart are appended.
    Status settlePendingActions(const std::string& incident_id,
                                const std::vector<ActionRecord>& records);

    std::optional<Incident> get(const std::string& incident_id) const;
    std::optional<Incident> openForComponent(const std::string& component_id) const;

    /// Non-terminal incidents, oldest first.
    std::vector<Incident> active() const;
    /// Every incident ever opened, oldest first.
    std::vector<Incident> all() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Incident> incidents_;
    std::unordered_map<std::string, std::string> open_by_component_;
    std::vector<std::string> order_;

    std::string createLocked(const std::string& component_id, IncidentSeverity severity,
                             const std::string& description);
    void appendLocked(Incident& incident, const ActionRecord& record);
    void releaseIndexLocked(const Incident& incident);
};

} // namespace trustnet
