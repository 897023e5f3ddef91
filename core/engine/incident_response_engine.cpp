#include "engine/incident_response_engine.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace trustnet {

const char* recoveryStatusName(RecoveryStatus status) {
    switch (status) {
        case RecoveryStatus::InProgress: return "in_progress";
        case RecoveryStatus::Completed:  return "completed";
        case RecoveryStatus::Failed:     return "failed";
        case RecoveryStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

size_t ResponseReport::failedActions() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const DispatchOutcome& o) { return !o.record.succeeded(); }));
}

IncidentResponseEngine::IncidentResponseEngine(DispatchConfig config)
    : dispatcher_(executors_, config) {}

void IncidentResponseEngine::addResponsePolicy(ResponsePolicy policy) {
    policies_.addPolicy(std::move(policy));
}

bool IncidentResponseEngine::removeResponsePolicy(const std::string& policy_id) {
    return policies_.removePolicy(policy_id);
}

void IncidentResponseEngine::addActionExecutor(std::unique_ptr<ActionExecutor> executor) {
    executors_.registerExecutor(std::move(executor));
}

// ─── Evaluation ────────────────────────────────────────────────

ResponseReport IncidentResponseEngine::processTrustUpdate(const TrustContext& context) {
    ResponseReport report;
    report.component_id = context.component_id;

    // Decide first, in priority order.
    std::vector<ResponsePolicy> fired;
    for (auto& policy : policies_.enabledPolicies()) {
        if (evaluator_.evaluatePolicy(policy, context)) {
            report.fired_policies.push_back(policy.policy_id);
            fired.push_back(std::move(policy));
        }
    }
    if (fired.empty()) return report;

    std::ostringstream score;
    score << std::fixed << std::setprecision(2) << context.trust_score;
    IncidentSeverity severity = severityForTrustScore(context.trust_score);

    for (const auto& policy : fired) {
        logInfo("Policy " + policy.policy_id + " fired for " + context.component_id);

        std::vector<ActionRecord> records = dispatcher_.dispatchBatch(policy.actions);
        std::string description = "Policy " + policy.name + " triggered for " +
                                  context.component_id + " at trust " + score.str();

        for (size_t i = 0; i < records.size(); i++) {
            const ResponseAction& action = policy.actions[i];

            DispatchOutcome outcome;
            outcome.policy_id = policy.policy_id;
            outcome.record = std::move(records[i]);
            outcome.targets = action.target_components.empty()
                ? std::vector<std::string>{context.component_id}
                : action.target_components;

            for (const auto& target : outcome.targets) {
                auto appended = incidents_.appendAction(target, outcome.record, severity, description);
                outcome.incident_ids.push_back(appended.incident_id);
                if (appended.created) report.opened_incidents.push_back(appended.incident_id);
            }
            report.outcomes.push_back(std::move(outcome));
        }
    }

    size_t failed = report.failedActions();
    if (failed > 0) {
        logWarn(std::to_string(failed) + " of " + std::to_string(report.outcomes.size()) +
                " actions for " + context.component_id + " did not complete");
    }
    return report;
}

// ─── Incidents ─────────────────────────────────────────────────

std::string IncidentResponseEngine::createIncident(const std::string& component_id,
                                                   IncidentSeverity severity,
                                                   const std::string& description) {
    return incidents_.create(component_id, severity, description);
}

Status IncidentResponseEngine::updateIncidentStatus(const std::string& incident_id,
                                                    IncidentStatus status) {
    Status s = incidents_.setStatus(incident_id, status);
    if (!s.ok()) logWarn(s.toString());
    return s;
}

Status IncidentResponseEngine::resolveIncident(const std::string& incident_id) {
    Status s = incidents_.resolve(incident_id);
    if (!s.ok()) logWarn(s.toString());
    return s;
}

Result<EscalationRecord> IncidentResponseEngine::escalateIncident(const std::string& incident_id,
                                                                  const std::string& policy_id,
                                                                  const std::string& reason) {
    auto current = incidents_.get(incident_id);
    if (!current) {
        logWarn("Cannot escalate unknown incident " + incident_id);
        return Result<EscalationRecord>::failure(
            Status::notFound("Incident " + incident_id + " not found"));
    }
    if (isTerminal(current->status)) {
        return Result<EscalationRecord>::failure(Status::invalidArgument(
            "Incident " + incident_id + " is already " + incidentStatusName(current->status)));
    }
    auto policy = policies_.getPolicy(policy_id);
    if (!policy) {
        logWarn("Cannot escalate with unknown policy " + policy_id);
        return Result<EscalationRecord>::failure(
            Status::notFound("Policy " + policy_id + " not found"));
    }

    // Steps already taken under this policy, and when the last one was.
    size_t taken = 0;
    Timestamp since = current->created_at;
    for (const auto& e : current->escalation_history) {
        if (e.policy_id == policy_id) {
            taken++;
            since = e.escalated_at;
        }
    }
    if (taken >= policy->escalation_chain.size()) {
        return Result<EscalationRecord>::failure(Status::invalidArgument(
            "Escalation chain of policy " + policy_id + " is exhausted"));
    }

    const EscalationStep& step = policy->escalation_chain[taken];
    Timestamp at = now();
    if (at - since < step.delay) {
        auto wait = std::chrono::duration_cast<Millis>(step.delay - (at - since));
        return Result<EscalationRecord>::failure(Status::invalidArgument(
            "Escalation step " + step.step_id + " is due in " + std::to_string(wait.count()) + " ms"));
    }

    EscalationRecord record;
    record.escalated_at = at;
    record.policy_id = policy_id;
    record.escalated_to = step.step_id;
    record.reason = reason;
    record.awaiting_approval = step.approval_required;

    std::vector<ActionRecord> records;
    if (step.approval_required) {
        for (const auto& action : step.actions) {
            ActionRecord pending;
            pending.action_id = action.action_id;
            pending.action_type = action.action_type;
            pending.executed_at = at;
            pending.status = ActionStatus::Pending;
            pending.result = "Awaiting approval";
            records.push_back(std::move(pending));
        }
    } else {
        records = dispatcher_.dispatchBatch(step.actions);
    }

    for (const auto& r : records) {
        record.actions_taken.push_back(r.action_id);
        Status s = incidents_.appendToIncident(incident_id, r);
        if (!s.ok()) {
            return Result<EscalationRecord>::failure(s);
        }
    }

    Status s = incidents_.addEscalation(incident_id, record);
    if (!s.ok()) {
        return Result<EscalationRecord>::failure(s);
    }

    std::string channels;
    for (const auto& c : step.notification_channels) {
        channels += (channels.empty() ? "" : ", ") + c;
    }
    logInfo("Escalated incident " + incident_id + " to " + step.step_id +
            (step.approval_required ? " (awaiting approval)" : "") +
            (channels.empty() ? "" : ", notifying " + channels));
    return Result<EscalationRecord>::success(std::move(record));
}

Result<EscalationRecord> IncidentResponseEngine::approveEscalation(const std::string& incident_id,
                                                                   const std::string& step_id) {
    auto claimed = incidents_.claimApproval(incident_id, step_id);
    if (!claimed.ok()) {
        logWarn(claimed.status.toString());
        return claimed;
    }
    const EscalationRecord& record = claimed.value;

    const EscalationStep* step = nullptr;
    auto policy = policies_.getPolicy(record.policy_id);
    if (policy) {
        for (const auto& s : policy->escalation_chain) {
            if (s.step_id == step_id) {
                step = &s;
                break;
            }
        }
    }

    if (!step) {
        std::vector<ActionRecord> cancelled;
        auto current = incidents_.get(incident_id);
        if (current) {
            for (const auto& r : current->actions_taken) {
                if (r.status != ActionStatus::Pending) continue;
                if (std::find(record.actions_taken.begin(), record.actions_taken.end(),
                              r.action_id) == record.actions_taken.end()) {
                    continue;
                }
                ActionRecord c = r;
                c.status = ActionStatus::Cancelled;
                c.result = "Escalation step no longer defined";
                cancelled.push_back(std::move(c));
            }
        }
        Status s = incidents_.settlePendingActions(incident_id, cancelled);
        if (!s.ok()) logWarn(s.toString());
        Status missing = Status::notFound("Policy " + record.policy_id +
                                          " no longer defines escalation step " + step_id);
        logWarn(missing.toString());
        return Result<EscalationRecord>::failure(missing);
    }

    std::vector<ActionRecord> records = dispatcher_.dispatchBatch(step->actions);
    Status s = incidents_.settlePendingActions(incident_id, records);
    if (!s.ok()) {
        return Result<EscalationRecord>::failure(s);
    }
    logInfo("Approved escalation of incident " + incident_id + " to " + step_id + ", dispatched " +
            std::to_string(records.size()) + " action(s)");
    return claimed;
}

std::optional<Incident> IncidentResponseEngine::incident(const std::string& incident_id) const {
    return incidents_.get(incident_id);
}

std::optional<Incident> IncidentResponseEngine::incidentForComponent(const std::string& component_id) const {
    return incidents_.openForComponent(component_id);
}

std::vector<Incident> IncidentResponseEngine::activeIncidents() const {
    return incidents_.active();
}

std::vector<Incident> IncidentResponseEngine::allIncidents() const {
    return incidents_.all();
}

// ─── Recovery ──────────────────────────────────────────────────

void IncidentResponseEngine::addRecoveryPlan(RecoveryPlan plan) {
    std::lock_guard<std::mutex> lock(recovery_mutex_);
    auto it = std::find_if(plans_.begin(), plans_.end(), [&](const RecoveryPlan& p) {
        return p.plan_id == plan.plan_id;
    });
    if (it != plans_.end()) {
        *it = std::move(plan);
    } else {
        plans_.push_back(std::move(plan));
    }
}

std::optional<RecoveryPlan> IncidentResponseEngine::recoveryPlan(const std::string& plan_id) const {
    std::lock_guard<std::mutex> lock(recovery_mutex_);
    for (const auto& p : plans_) {
        if (p.plan_id == plan_id) return p;
    }
    return std::nullopt;
}

Result<std::string> IncidentResponseEngine::startRecovery(const std::string& component_id,
                                                          const std::string& plan_id) {
    auto plan = recoveryPlan(plan_id);
    if (!plan) {
        logWarn("Recovery plan " + plan_id + " not found");
        return Result<std::string>::failure(
            Status::notFound("Recovery plan " + plan_id + " not found"));
    }

    RecoveryRecord rec;
    rec.recovery_id = generateId("rec");
    rec.plan_id = plan_id;
    rec.component_id = component_id;
    rec.started_at = now();
    rec.status = RecoveryStatus::InProgress;
    logInfo("Starting recovery " + rec.recovery_id + " (" + plan->name + ") for " + component_id);

    std::unordered_map<std::string, double> metrics;
    for (const auto& step : plan->recovery_steps) {
        ResponseAction action;
        action.action_id = step.step_id;
        action.action_type = step.action_type;
        action.target_components = plan->target_components.empty()
            ? std::vector<std::string>{component_id}
            : plan->target_components;
        action.parameters = step.parameters;
        action.timeout = step.timeout;
        action.retry_count = step.retry_count;

        ActionRecord result = dispatcher_.dispatch(action);
        Status appended = incidents_.appendToOpen(component_id, result);
        if (appended.kind == ErrorKind::NotFound) {
            logDebug("Recovery step " + step.step_id + " has no open incident to record into");
        }

        if (!result.succeeded()) {
            rec.status = RecoveryStatus::Failed;
            rec.failure_reason = "Step " + step.step_id + " failed: " + result.result;
            break;
        }
        rec.steps_completed.push_back(step.step_id);
        for (const auto& [k, v] : result.metrics) {
            metrics[k] = v;
        }
    }

    if (rec.status == RecoveryStatus::InProgress) {
        std::vector<std::string> unmet;
        for (const auto& c : plan->success_criteria) {
            auto it = metrics.find(c.metric_name);
            if (it != metrics.end() && compareValues(it->second, c.op, c.threshold)) {
                rec.success_criteria_met.push_back(c.criterion_id);
            } else {
                unmet.push_back(c.criterion_id);
            }
        }
        if (unmet.empty()) {
            rec.status = RecoveryStatus::Completed;
        } else {
            rec.status = RecoveryStatus::Failed;
            rec.failure_reason = "Success criteria not met:";
            for (const auto& id : unmet) rec.failure_reason += " " + id;
        }
    }
    rec.completed_at = now();

    if (rec.status == RecoveryStatus::Completed) {
        logInfo("Recovery " + rec.recovery_id + " completed");
    } else {
        logWarn("Recovery " + rec.recovery_id + " failed: " + rec.failure_reason);
    }

    std::string id = rec.recovery_id;
    std::lock_guard<std::mutex> lock(recovery_mutex_);
    recoveries_.push_back(std::move(rec));
    return Result<std::string>::success(id);
}

std::optional<RecoveryRecord> IncidentResponseEngine::recovery(const std::string& recovery_id) const {
    std::lock_guard<std::mutex> lock(recovery_mutex_);
    for (const auto& r : recoveries_) {
        if (r.recovery_id == recovery_id) return r;
    }
    return std::nullopt;
}

std::vector<RecoveryRecord> IncidentResponseEngine::recoveryHistory() const {
    std::lock_guard<std::mutex> lock(recovery_mutex_);
    return recoveries_;
}

} // namespace trustnet
