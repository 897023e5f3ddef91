// PyBind11 bindings for the trustnet core.
// Exposes the reporting surface: topology setup, score ingestion,
// system trust, propagation analysis, incidents and alerts.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include "pipeline/trust_pipeline.hpp"

#include <stdexcept>

namespace py = pybind11;

namespace {

/// Failed Status → Python exception (KeyError for NotFound).
void raiseIfFailed(const trustnet::Status& status) {
    if (status.ok()) return;
    if (status.kind == trustnet::ErrorKind::NotFound) {
        throw py::key_error(status.message);
    }
    throw std::runtime_error(status.toString());
}

} // anonymous namespace

PYBIND11_MODULE(trustnet_bindings, m) {
    m.doc() = "trustnet C++ Core Bindings";

    // ── Enums ──
    py::enum_<trustnet::ComponentType>(m, "ComponentType")
        .value("Microservice", trustnet::ComponentType::Microservice)
        .value("Database", trustnet::ComponentType::Database)
        .value("API", trustnet::ComponentType::API)
        .value("LoadBalancer", trustnet::ComponentType::LoadBalancer)
        .value("MessageQueue", trustnet::ComponentType::MessageQueue)
        .value("Cache", trustnet::ComponentType::Cache)
        .value("ExternalService", trustnet::ComponentType::ExternalService)
        .value("LegacySystem", trustnet::ComponentType::LegacySystem)
        .value("EdgeDevice", trustnet::ComponentType::EdgeDevice)
        .value("Container", trustnet::ComponentType::Container);

    py::enum_<trustnet::RelationshipType>(m, "RelationshipType")
        .value("DataFlow", trustnet::RelationshipType::DataFlow)
        .value("Dependency", trustnet::RelationshipType::Dependency)
        .value("Communication", trustnet::RelationshipType::Communication)
        .value("Control", trustnet::RelationshipType::Control)
        .value("Monitoring", trustnet::RelationshipType::Monitoring)
        .value("Backup", trustnet::RelationshipType::Backup)
        .value("LoadBalancing", trustnet::RelationshipType::LoadBalancing);

    py::enum_<trustnet::ConditionType>(m, "ConditionType")
        .value("TrustScore", trustnet::ConditionType::TrustScore)
        .value("SecurityEvent", trustnet::ConditionType::SecurityEvent)
        .value("PerformanceMetric", trustnet::ConditionType::PerformanceMetric)
        .value("BehavioralAnomaly", trustnet::ConditionType::BehavioralAnomaly)
        .value("DependencyFailure", trustnet::ConditionType::DependencyFailure)
        .value("CommunicationFailure", trustnet::ConditionType::CommunicationFailure);

    py::enum_<trustnet::ComparisonOperator>(m, "ComparisonOperator")
        .value("GreaterThan", trustnet::ComparisonOperator::GreaterThan)
        .value("LessThan", trustnet::ComparisonOperator::LessThan)
        .value("EqualTo", trustnet::ComparisonOperator::EqualTo)
        .value("NotEqualTo", trustnet::ComparisonOperator::NotEqualTo)
        .value("GreaterThanOrEqual", trustnet::ComparisonOperator::GreaterThanOrEqual)
        .value("LessThanOrEqual", trustnet::ComparisonOperator::LessThanOrEqual);

    py::enum_<trustnet::ActionType>(m, "ActionType")
        .value("IsolateComponent", trustnet::ActionType::IsolateComponent)
        .value("ScaleResources", trustnet::ActionType::ScaleResources)
        .value("UpdateConfiguration", trustnet::ActionType::UpdateConfiguration)
        .value("TriggerWorkflow", trustnet::ActionType::TriggerWorkflow)
        .value("SendNotification", trustnet::ActionType::SendNotification)
        .value("UpdateSecurityPolicy", trustnet::ActionType::UpdateSecurityPolicy)
        .value("FailoverToBackup", trustnet::ActionType::FailoverToBackup)
        .value("RestartService", trustnet::ActionType::RestartService)
        .value("UpdateFirewallRules", trustnet::ActionType::UpdateFirewallRules)
        .value("QuarantineData", trustnet::ActionType::QuarantineData)
        .value("EnableMonitoring", trustnet::ActionType::EnableMonitoring)
        .value("DisableAccess", trustnet::ActionType::DisableAccess);

    py::enum_<trustnet::ActionStatus>(m, "ActionStatus")
        .value("Pending", trustnet::ActionStatus::Pending)
        .value("InProgress", trustnet::ActionStatus::InProgress)
        .value("Completed", trustnet::ActionStatus::Completed)
        .value("Failed", trustnet::ActionStatus::Failed)
        .value("Cancelled", trustnet::ActionStatus::Cancelled);

    py::enum_<trustnet::IncidentSeverity>(m, "IncidentSeverity")
        .value("Low", trustnet::IncidentSeverity::Low)
        .value("Medium", trustnet::IncidentSeverity::Medium)
        .value("High", trustnet::IncidentSeverity::High)
        .value("Critical", trustnet::IncidentSeverity::Critical)
        .value("Emergency", trustnet::IncidentSeverity::Emergency);

    py::enum_<trustnet::IncidentStatus>(m, "IncidentStatus")
        .value("Open", trustnet::IncidentStatus::Open)
        .value("Investigating", trustnet::IncidentStatus::Investigating)
        .value("Mitigating", trustnet::IncidentStatus::Mitigating)
        .value("Resolved", trustnet::IncidentStatus::Resolved)
        .value("Closed", trustnet::IncidentStatus::Closed)
        .value("Escalated", trustnet::IncidentStatus::Escalated);

    py::enum_<trustnet::AlertSeverity>(m, "AlertSeverity")
        .value("Low", trustnet::AlertSeverity::Low)
        .value("Medium", trustnet::AlertSeverity::Medium)
        .value("High", trustnet::AlertSeverity::High)
        .value("Critical", trustnet::AlertSeverity::Critical);

    py::enum_<trustnet::AlertStatus>(m, "AlertStatus")
        .value("Active", trustnet::AlertStatus::Active)
        .value("Acknowledged", trustnet::AlertStatus::Acknowledged)
        .value("Resolved", trustnet::AlertStatus::Resolved)
        .value("Suppressed", trustnet::AlertStatus::Suppressed);

    // ── Topology ──
    py::class_<trustnet::TrustNode>(m, "TrustNode")
        .def(py::init<>())
        .def(py::init<std::string, double, trustnet::ComponentType>(),
             py::arg("id"), py::arg("trust_score"),
             py::arg("component_type") = trustnet::ComponentType::Microservice)
        .def_readwrite("id", &trustnet::TrustNode::id)
        .def_readwrite("trust_score", &trustnet::TrustNode::trust_score)
        .def_readwrite("component_type", &trustnet::TrustNode::component_type)
        .def_readwrite("last_updated", &trustnet::TrustNode::last_updated)
        .def("set_metadata", &trustnet::TrustNode::setMetadata)
        .def("get_metadata", &trustnet::TrustNode::getMetadata,
             py::arg("key"), py::arg("default_val") = "");

    py::class_<trustnet::TrustEdge>(m, "TrustEdge")
        .def(py::init<>())
        .def(py::init<std::string, std::string, double, trustnet::RelationshipType>(),
             py::arg("source"), py::arg("target"), py::arg("trust_weight"),
             py::arg("relationship_type") = trustnet::RelationshipType::Dependency)
        .def_readwrite("source", &trustnet::TrustEdge::from)
        .def_readwrite("target", &trustnet::TrustEdge::to)
        .def_readwrite("relationship_type", &trustnet::TrustEdge::relationship_type)
        .def_readwrite("trust_weight", &trustnet::TrustEdge::trust_weight)
        .def_readwrite("criticality", &trustnet::TrustEdge::criticality);

    // ── Analysis results ──
    py::class_<trustnet::CriticalPath>(m, "CriticalPath")
        .def_readonly("path", &trustnet::CriticalPath::path)
        .def_readonly("criticality", &trustnet::CriticalPath::criticality)
        .def_readonly("description", &trustnet::CriticalPath::description);

    py::class_<trustnet::ImpactAssessment>(m, "ImpactAssessment")
        .def_readonly("affected_components", &trustnet::ImpactAssessment::affected_components)
        .def_readonly("severity", &trustnet::ImpactAssessment::severity)
        .def_readonly("business_impact", &trustnet::ImpactAssessment::business_impact);

    py::class_<trustnet::WeakLink>(m, "WeakLink")
        .def_readonly("component_id", &trustnet::WeakLink::component_id)
        .def_readonly("trust_score", &trustnet::WeakLink::trust_score)
        .def_readonly("impact_assessment", &trustnet::WeakLink::impact_assessment)
        .def_readonly("mitigation_suggestions", &trustnet::WeakLink::mitigation_suggestions);

    py::class_<trustnet::SystemTrustScore>(m, "SystemTrustScore")
        .def_readonly("overall_trust", &trustnet::SystemTrustScore::overall_trust)
        .def_readonly("component_scores", &trustnet::SystemTrustScore::component_scores)
        .def_readonly("critical_paths", &trustnet::SystemTrustScore::critical_paths)
        .def_readonly("critical_paths_truncated", &trustnet::SystemTrustScore::critical_paths_truncated)
        .def_readonly("weak_links", &trustnet::SystemTrustScore::weak_links)
        .def_readonly("timestamp", &trustnet::SystemTrustScore::timestamp);

    py::class_<trustnet::PropagationAnalysis>(m, "PropagationAnalysis")
        .def_readonly("source_component", &trustnet::PropagationAnalysis::source_component)
        .def_readonly("propagation_results", &trustnet::PropagationAnalysis::propagation_results)
        .def_readonly("timestamp", &trustnet::PropagationAnalysis::timestamp);

    // ── Policies ──
    py::class_<trustnet::ResponseCondition>(m, "ResponseCondition")
        .def(py::init<>())
        .def_readwrite("condition_type", &trustnet::ResponseCondition::condition_type)
        .def_readwrite("metric_name", &trustnet::ResponseCondition::metric_name)
        .def_readwrite("operator", &trustnet::ResponseCondition::op)
        .def_readwrite("threshold", &trustnet::ResponseCondition::threshold)
        .def_readwrite("duration", &trustnet::ResponseCondition::duration);

    py::class_<trustnet::ResponseAction>(m, "ResponseAction")
        .def(py::init<>())
        .def_readwrite("action_id", &trustnet::ResponseAction::action_id)
        .def_readwrite("action_type", &trustnet::ResponseAction::action_type)
        .def_readwrite("target_components", &trustnet::ResponseAction::target_components)
        .def_readwrite("parameters", &trustnet::ResponseAction::parameters)
        .def_readwrite("timeout", &trustnet::ResponseAction::timeout)
        .def_readwrite("retry_count", &trustnet::ResponseAction::retry_count)
        .def_readwrite("dependencies", &trustnet::ResponseAction::dependencies);

    py::class_<trustnet::ResponsePolicy>(m, "ResponsePolicy")
        .def(py::init<>())
        .def_readwrite("policy_id", &trustnet::ResponsePolicy::policy_id)
        .def_readwrite("name", &trustnet::ResponsePolicy::name)
        .def_readwrite("conditions", &trustnet::ResponsePolicy::conditions)
        .def_readwrite("actions", &trustnet::ResponsePolicy::actions)
        .def_readwrite("priority", &trustnet::ResponsePolicy::priority)
        .def_readwrite("enabled", &trustnet::ResponsePolicy::enabled);

    // ── Incidents and alerts ──
    py::class_<trustnet::ActionRecord>(m, "ActionRecord")
        .def_readonly("action_id", &trustnet::ActionRecord::action_id)
        .def_readonly("action_type", &trustnet::ActionRecord::action_type)
        .def_readonly("executor", &trustnet::ActionRecord::executor)
        .def_readonly("executed_at", &trustnet::ActionRecord::executed_at)
        .def_readonly("status", &trustnet::ActionRecord::status)
        .def_readonly("result", &trustnet::ActionRecord::result)
        .def_readonly("duration", &trustnet::ActionRecord::duration)
        .def_readonly("attempts", &trustnet::ActionRecord::attempts)
        .def_readonly("metrics", &trustnet::ActionRecord::metrics);

    py::class_<trustnet::Incident>(m, "Incident")
        .def_readonly("incident_id", &trustnet::Incident::incident_id)
        .def_readonly("title", &trustnet::Incident::title)
        .def_readonly("description", &trustnet::Incident::description)
        .def_readonly("severity", &trustnet::Incident::severity)
        .def_readonly("status", &trustnet::Incident::status)
        .def_readonly("affected_components", &trustnet::Incident::affected_components)
        .def_readonly("created_at", &trustnet::Incident::created_at)
        .def_readonly("updated_at", &trustnet::Incident::updated_at)
        .def_readonly("resolved_at", &trustnet::Incident::resolved_at)
        .def_readonly("actions_taken", &trustnet::Incident::actions_taken);

    py::class_<trustnet::Alert>(m, "Alert")
        .def_readonly("alert_id", &trustnet::Alert::alert_id)
        .def_readonly("component_id", &trustnet::Alert::component_id)
        .def_readonly("severity", &trustnet::Alert::severity)
        .def_readonly("message", &trustnet::Alert::message)
        .def_readonly("timestamp", &trustnet::Alert::timestamp)
        .def_readonly("status", &trustnet::Alert::status);

    // ── Configuration ──
    py::class_<trustnet::TrustThresholds>(m, "TrustThresholds")
        .def(py::init<>())
        .def_readwrite("critical", &trustnet::TrustThresholds::critical)
        .def_readwrite("warning", &trustnet::TrustThresholds::warning)
        .def_readwrite("normal", &trustnet::TrustThresholds::normal);

    py::class_<trustnet::AnalysisConfig>(m, "AnalysisConfig")
        .def(py::init<>())
        .def_readwrite("weak_link_threshold", &trustnet::AnalysisConfig::weak_link_threshold)
        .def_readwrite("high_impact_closure", &trustnet::AnalysisConfig::high_impact_closure)
        .def_readwrite("max_expansions", &trustnet::AnalysisConfig::max_expansions)
        .def_readwrite("max_seconds", &trustnet::AnalysisConfig::max_seconds);

    py::class_<trustnet::DispatchConfig>(m, "DispatchConfig")
        .def(py::init<>())
        .def_readwrite("fallback_to_any_executor", &trustnet::DispatchConfig::fallback_to_any_executor)
        .def_readwrite("enforce_timeouts", &trustnet::DispatchConfig::enforce_timeouts)
        .def_readwrite("default_timeout_ms", &trustnet::DispatchConfig::default_timeout_ms)
        .def_readwrite("queue_wait_limit_ms", &trustnet::DispatchConfig::queue_wait_limit_ms)
        .def_readwrite("enforce_retries", &trustnet::DispatchConfig::enforce_retries)
        .def_readwrite("worker_threads", &trustnet::DispatchConfig::worker_threads);

    py::class_<trustnet::PipelineConfig>(m, "PipelineConfig")
        .def(py::init<>())
        .def_readwrite("thresholds", &trustnet::PipelineConfig::thresholds)
        .def_readwrite("alerts_enabled", &trustnet::PipelineConfig::alerts_enabled)
        .def_readwrite("respond_to_updates", &trustnet::PipelineConfig::respond_to_updates)
        .def_readwrite("history_limit", &trustnet::PipelineConfig::history_limit);

    py::class_<trustnet::SystemStatus>(m, "SystemStatus")
        .def_readonly("overall_trust", &trustnet::SystemStatus::overall_trust)
        .def_readonly("component_count", &trustnet::SystemStatus::component_count)
        .def_readonly("active_incidents", &trustnet::SystemStatus::active_incidents)
        .def_readonly("active_alerts", &trustnet::SystemStatus::active_alerts)
        .def_readonly("health", &trustnet::SystemStatus::health)
        .def_readonly("timestamp", &trustnet::SystemStatus::timestamp);

    // ── Pipeline ──
    py::class_<trustnet::TrustPipeline>(m, "TrustPipeline")
        .def(py::init<trustnet::PipelineConfig, trustnet::AnalysisConfig, trustnet::DispatchConfig>(),
             py::arg("config") = trustnet::PipelineConfig{},
             py::arg("analysis") = trustnet::AnalysisConfig{},
             py::arg("dispatch") = trustnet::DispatchConfig{})
        .def("add_component", [](trustnet::TrustPipeline& p, trustnet::TrustNode node) {
            p.composition().addComponent(std::move(node));
        })
        .def("add_relationship", [](trustnet::TrustPipeline& p, trustnet::TrustEdge edge) {
            p.composition().addRelationship(std::move(edge));
        })
        .def("add_response_policy", [](trustnet::TrustPipeline& p, trustnet::ResponsePolicy policy) {
            p.response().addResponsePolicy(std::move(policy));
        })
        .def("ingest", [](trustnet::TrustPipeline& p, const std::string& component_id,
                          double trust_score, double confidence) {
            trustnet::ScoreUpdate update;
            update.component_id = component_id;
            update.trust_score = trust_score;
            update.confidence = confidence;
            auto result = p.ingest(update);
            raiseIfFailed(result.status);
            return result.value.response.fired_policies;
        }, py::arg("component_id"), py::arg("trust_score"), py::arg("confidence") = 1.0)
        .def("tick", &trustnet::TrustPipeline::tick)
        .def("status", &trustnet::TrustPipeline::status)
        .def("trust_scores", &trustnet::TrustPipeline::trustScores)
        .def("propagation_analysis", [](trustnet::TrustPipeline& p, const std::string& source) {
            return p.composition().propagationAnalysis(source);
        })
        .def("active_incidents", [](trustnet::TrustPipeline& p) {
            return p.response().activeIncidents();
        })
        .def("resolve_incident", [](trustnet::TrustPipeline& p, const std::string& incident_id) {
            raiseIfFailed(p.response().resolveIncident(incident_id));
        })
        .def("active_alerts", [](trustnet::TrustPipeline& p) {
            return p.alerts().activeAlerts();
        })
        .def("acknowledge_alert", [](trustnet::TrustPipeline& p, const std::string& alert_id) {
            raiseIfFailed(p.alerts().acknowledge(alert_id));
        });

    m.def("health_for_trust", &trustnet::healthForTrust);
}
