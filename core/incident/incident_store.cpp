#include "incident/incident_store.hpp"
#include "common/logging.hpp"

#include <algorithm>

namespace trustnet {

const char* actionStatusName(ActionStatus status) {
    switch (status) {
        case ActionStatus::Pending:    return "pending";
        case ActionStatus::InProgress: return "in_progress";
        case ActionStatus::Completed:  return "completed";
        case ActionStatus::Failed:     return "failed";
        case ActionStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

const char* incidentSeverityName(IncidentSeverity severity) {
    switch (severity) {
        case IncidentSeverity::Low:       return "low";
        case IncidentSeverity::Medium:    return "medium";
        case IncidentSeverity::High:      return "high";
        case IncidentSeverity::Critical:  return "critical";
        case IncidentSeverity::Emergency: return "emergency";
    }
    return "unknown";
}

const char* incidentStatusName(IncidentStatus status) {
    switch (status) {
        case IncidentStatus::Open:          return "open";
        case IncidentStatus::Investigating: return "investigating";
        case IncidentStatus::Mitigating:    return "mitigating";
        case IncidentStatus::Resolved:      return "resolved";
        case IncidentStatus::Closed:        return "closed";
        case IncidentStatus::Escalated:     return "escalated";
    }
    return "unknown";
}

IncidentSeverity severityForTrustScore(double trust_score) {
    if (trust_score < 0.1) return IncidentSeverity::Emergency;
    if (trust_score < 0.2) return IncidentSeverity::Critical;
    if (trust_score < 0.5) return IncidentSeverity::High;
    if (trust_score < 0.8) return IncidentSeverity::Medium;
    return IncidentSeverity::Low;
}

// ─── Creation ──────────────────────────────────────────────────

std::string IncidentStore::create(const std::string& component_id, IncidentSeverity severity,
                                  const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return createLocked(component_id, severity, description);
}

std::string IncidentStore::createLocked(const std::string& component_id,
                                        IncidentSeverity severity,
                                        const std::string& description) {
    Incident incident;
    incident.incident_id = generateId("inc");
    incident.title = "Trust Score Incident - " + component_id;
    incident.description = description;
    incident.severity = severity;
    incident.status = IncidentStatus::Open;
    incident.affected_components.push_back(component_id);
    incident.created_at = now();
    incident.updated_at = incident.created_at;

    auto previous = open_by_component_.find(component_id);
    if (previous != open_by_component_.end()) {
        logWarn("Incident " + previous->second + " for " + component_id +
                " superseded by a new incident");
    }

    std::string id = incident.incident_id;
    open_by_component_[component_id] = id;
    order_.push_back(id);
    incidents_.emplace(id, std::move(incident));

    logInfo("Opened incident " + id + " for " + component_id +
            " (" + incidentSeverityName(severity) + ")");
    return id;
}

// ─── Action records ────────────────────────────────────────────

IncidentStore::AppendResult IncidentStore::appendAction(const std::string& component_id,
                                                        const ActionRecord& record,
                                                        IncidentSeverity severity_if_new,
                                                        const std::string& description_if_new) {
    std::lock_guard<std::mutex> lock(mutex_);
    AppendResult result;

    auto it = open_by_component_.find(component_id);
    if (it == open_by_component_.end()) {
        result.incident_id = createLocked(component_id, severity_if_new, description_if_new);
        result.created = true;
    } else {
        result.incident_id = it->second;
    }
    appendLocked(incidents_.at(result.incident_id), record);
    return result;
}

Status IncidentStore::appendToOpen(const std::string& component_id, const ActionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_by_component_.find(component_id);
    if (it == open_by_component_.end()) {
        return Status::notFound("No open incident for " + component_id);
    }
    appendLocked(incidents_.at(it->second), record);
    return Status::success();
}

Status IncidentStore::appendToIncident(const std::string& incident_id,
                                       const ActionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return Status::notFound("Incident " + incident_id + " not found");
    }
    if (isTerminal(it->second.status)) {
        return Status::invalidArgument("Incident " + incident_id + " is already " +
                                       incidentStatusName(it->second.status));
    }
    appendLocked(it->second, record);
    return Status::success();
}

void IncidentStore::appendLocked(Incident& incident, const ActionRecord& record) {
    if (incident.actions_taken.empty()) {
        incident.metrics.response_time =
            std::chrono::duration_cast<Millis>(record.executed_at - incident.created_at);
    }
    incident.actions_taken.push_back(record);
    incident.updated_at = now();
}

// ─── Lifecycle ─────────────────────────────────────────────────

Status IncidentStore::setStatus(const std::string& incident_id, IncidentStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return Status::notFound("Incident " + incident_id + " not found");
    }
    Incident& incident = it->second;
    if (isTerminal(incident.status)) {
        return Status::invalidArgument("Incident " + incident_id + " is already " +
                                       incidentStatusName(incident.status));
    }

    incident.status = status;
    incident.updated_at = now();
    if (isTerminal(status)) {
        incident.resolved_at = incident.updated_at;
        incident.metrics.resolution_time =
            std::chrono::duration_cast<Millis>(incident.updated_at - incident.created_at);
        releaseIndexLocked(incident);
    }
    return Status::success();
}

Status IncidentStore::resolve(const std::string& incident_id) {
    Status s = setStatus(incident_id, IncidentStatus::Resolved);
    if (s.ok()) logInfo("Resolved incident " + incident_id);
    return s;
}

Status IncidentStore::addEscalation(const std::string& incident_id, EscalationRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return Status::notFound("Incident " + incident_id + " not found");
    }
    Incident& incident = it->second;
    if (isTerminal(incident.status)) {
        return Status::invalidArgument("Incident " + incident_id + " is already " +
                                       incidentStatusName(incident.status));
    }
    incident.escalation_history.push_back(std::move(record));
    incident.status = IncidentStatus::Escalated;
    incident.updated_at = now();
    return Status::success();
}

Result<EscalationRecord> IncidentStore::claimApproval(const std::string& incident_id,
                                                     const std::string& step_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return Result<EscalationRecord>::failure(
            Status::notFound("Incident " + incident_id + " not found"));
    }
    Incident& incident = it->second;
    if (isTerminal(incident.status)) {
        return Result<EscalationRecord>::failure(Status::invalidArgument(
            "Incident " + incident_id + " is already " + incidentStatusName(incident.status)));
    }

    auto& history = incident.escalation_history;
    for (auto e = history.rbegin(); e != history.rend(); ++e) {
        if (e->escalated_to != step_id || !e->awaiting_approval) continue;
        e->awaiting_approval = false;
        e->approved_at = now();
        incident.updated_at = *e->approved_at;
        return Result<EscalationRecord>::success(*e);
    }
    return Result<EscalationRecord>::failure(Status::invalidArgument(
        "No escalation to " + step_id + " awaits approval on incident " + incident_id));
}

Status IncidentStore::settlePendingActions(const std::string& incident_id,
                                           const std::vector<ActionRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return Status::notFound("Incident " + incident_id + " not found");
    }
    Incident& incident = it->second;
    for (const auto& record : records) {
        auto pending = std::find_if(incident.actions_taken.begin(), incident.actions_taken.end(),
                                    [&](const ActionRecord& r) {
                                        return r.status == ActionStatus::Pending &&
                                               r.action_id == record.action_id;
                                    });
        if (pending != incident.actions_taken.end()) {
            *pending = record;
        } else {
            incident.actions_taken.push_back(record);
        }
    }
    incident.updated_at = now();
    return Status::success();
}

void IncidentStore::releaseIndexLocked(const Incident& incident) {
    for (const auto& component : incident.affected_components) {
        auto it = open_by_component_.find(component);
        if (it != open_by_component_.end() && it->second == incident.incident_id) {
            open_by_component_.erase(it);
        }
    }
}

// ─── Queries ───────────────────────────────────────────────────

std::optional<Incident> IncidentStore::get(const std::string& incident_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) return std::nullopt;
    return it->second;
}

std::optional<Incident> IncidentStore::openForComponent(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_by_component_.find(component_id);
    if (it == open_by_component_.end()) return std::nullopt;
    return incidents_.at(it->second);
}

std::vector<Incident> IncidentStore::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Incident> result;
    for (const auto& id : order_) {
        const Incident& incident = incidents_.at(id);
        if (!isTerminal(incident.status)) result.push_back(incident);
    }
    return result;
}

std::vector<Incident> IncidentStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Incident> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(incidents_.at(id));
    }
    return result;
}

size_t IncidentStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incidents_.size();
}

} // namespace trustnet
