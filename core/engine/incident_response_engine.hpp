#pragma once

#include "common/status.hpp"
#include "executors/action_dispatcher.hpp"
#include "executors/executor_registry.hpp"
#include "incident/incident_store.hpp"
#include "incident/recovery.hpp"
#include "response/condition_evaluator.hpp"
#include "response/policy_set.hpp"
#include "response/trust_context.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trustnet {

/// One dispatched action and where its record went.
struct DispatchOutcome {
    std::string policy_id;
    ActionRecord record;
    std::vector<std::string> targets;
    std::vector<std::string> incident_ids;    // parallel to targets
};

/// Everything one trust update caused.
struct ResponseReport {
    std::string component_id;
    std::vector<std::string> fired_policies;  // in evaluation order
    std::vector<DispatchOutcome> outcomes;
    std::vector<std::string> opened_incidents;

    size_t failedActions() const;
};

// ─── Incident Response Engine ──────────────────────────────────
// Evaluates the enabled policies against a component's trust context,
// dispatches the actions of every policy that fires and records each
// outcome into the incident of every target component.
//
// Which policies fire is decided up front in priority order. The
// actions of one policy then run as one concurrent batch; batches run
// in the same priority order. A failed action never stops the others.

class IncidentResponseEngine {
public:
    explicit IncidentResponseEngine(DispatchConfig config = {});

    // ── Policies ──
    void addResponsePolicy(ResponsePolicy policy);
    bool removeResponsePolicy(const std::string& policy_id);
    PolicySet& policies() { return policies_; }
    const PolicySet& policies() const { return policies_; }

    // ── Executors ──
    /// Throws std::invalid_argument on null.
    void addActionExecutor(std::unique_ptr<ActionExecutor> executor);
    ExecutorRegistry& executors() { return executors_; }
    const ExecutorRegistry& executors() const { return executors_; }

    // ── Evaluation ──
    ResponseReport processTrustUpdate(const TrustContext& context);

    // ── Incidents ──
    std::string createIncident(const std::string& component_id, IncidentSeverity severity,
                               const std::string& description);
    Status updateIncidentStatus(const std::string& incident_id, IncidentStatus status);
    Status resolveIncident(const std::string& incident_id);

    /// Take the next step of the policy's escalation chain for this
    /// incident. The step is due once its delay has passed since the
    /// previous step (or since the incident opened). Its actions are
    /// dispatched, or recorded Pending when the step needs approval.
    Result<EscalationRecord> escalateIncident(const std::string& incident_id,
                                              const std::string& policy_id,
                                              const std::string& reason);

    /// Approve an escalation step that was recorded awaiting approval:
    /// its actions are dispatched now and their Pending records replaced
    /// by the outcomes. InvalidArgument when nothing awaits approval for
    /// that step; NotFound when the policy no longer defines the step, in
    /// which case the Pending records are Cancelled.
    Result<EscalationRecord> approveEscalation(const std::string& incident_id,
                                               const std::string& step_id);

    std::optional<Incident> incident(const std::string& incident_id) const;
    std::optional<Incident> incidentForComponent(const std::string& component_id) const;
    std::vector<Incident> activeIncidents() const;
    std::vector<Incident> allIncidents() const;

    // ── Recovery ──
    /// Adding a plan with an existing id replaces it.
    void addRecoveryPlan(RecoveryPlan plan);
    std::optional<RecoveryPlan> recoveryPlan(const std::string& plan_id) const;

    /// Run a plan's steps in order against component, stopping at the
    /// first failed step. Returns the recovery id; NotFound for an
    /// unknown plan.
    Result<std::string> startRecovery(const std::string& component_id, const std::string& plan_id);

    std::optional<RecoveryRecord> recovery(const std::string& recovery_id) const;
    std::vector<RecoveryRecord> recoveryHistory() const;

    const DispatchConfig& dispatchConfig() const { return dispatcher_.config(); }

private:
    PolicySet policies_;
    ConditionEvaluator evaluator_;
    ExecutorRegistry executors_;
    ActionDispatcher dispatcher_;
    IncidentStore incidents_;

    mutable std::mutex recovery_mutex_;
    std::vector<RecoveryPlan> plans_;
    std::vector<RecoveryRecord> recoveries_;
};

} // namespace trustnet
