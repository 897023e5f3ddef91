#include "incident/alert_manager.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace trustnet {

const char* alertTypeName(AlertType type) {
    switch (type) {
        case AlertType::TrustScoreLow:          return "trust_score_low";
        case AlertType::SecurityViolation:      return "security_violation";
        case AlertType::PerformanceDegradation: return "performance_degradation";
        case AlertType::BehavioralAnomaly:      return "behavioral_anomaly";
        case AlertType::DependencyFailure:      return "dependency_failure";
        case AlertType::CommunicationFailure:   return "communication_failure";
    }
    return "unknown";
}

const char* alertSeverityName(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Low:      return "low";
        case AlertSeverity::Medium:   return "medium";
        case AlertSeverity::High:     return "high";
        case AlertSeverity::Critical: return "critical";
    }
    return "unknown";
}

const char* alertStatusName(AlertStatus status) {
    switch (status) {
        case AlertStatus::Active:       return "active";
        case AlertStatus::Acknowledged: return "acknowledged";
        case AlertStatus::Resolved:     return "resolved";
        case AlertStatus::Suppressed:   return "suppressed";
    }
    return "unknown";
}

std::string AlertManager::raise(const std::string& component_id, AlertType type,
                                AlertSeverity severity, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    Alert alert;
    alert.alert_id = component_id + "-" + alertSeverityName(severity) + "-" +
                     std::to_string(next_sequence_++);
    alert.component_id = component_id;
    alert.alert_type = type;
    alert.severity = severity;
    alert.message = message;
    alert.timestamp = now();
    alert.status = AlertStatus::Active;
    alerts_.push_back(alert);

    logInfo("Alert " + alert.alert_id + " [" + alertTypeName(type) + "]: " + message);
    return alert.alert_id;
}

std::optional<std::string> AlertManager::checkTrustThresholds(const std::string& component_id,
                                                              double score,
                                                              const TrustThresholds& thresholds) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << score;

    if (score < thresholds.critical) {
        return raise(component_id, AlertType::TrustScoreLow, AlertSeverity::Critical,
                     "Critical trust score: " + ss.str());
    }
    if (score < thresholds.warning) {
        return raise(component_id, AlertType::TrustScoreLow, AlertSeverity::Medium,
                     "Warning trust score: " + ss.str());
    }
    if (score >= thresholds.normal) {
        size_t resolved = resolveTrustAlerts(component_id);
        if (resolved > 0) {
            logInfo("Trust for " + component_id + " back to normal (" + ss.str() + "), resolved " +
                    std::to_string(resolved) + " alert(s)");
        }
    }
    return std::nullopt;
}

size_t AlertManager::resolveTrustAlerts(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t resolved = 0;
    for (auto& a : alerts_) {
        if (a.component_id != component_id || a.alert_type != AlertType::TrustScoreLow) continue;
        if (a.status == AlertStatus::Active || a.status == AlertStatus::Acknowledged) {
            a.status = AlertStatus::Resolved;
            resolved++;
        }
    }
    return resolved;
}

Status AlertManager::acknowledge(const std::string& alert_id) {
    return transition(alert_id, AlertStatus::Acknowledged);
}

Status AlertManager::resolve(const std::string& alert_id) {
    return transition(alert_id, AlertStatus::Resolved);
}

Status AlertManager::suppress(const std::string& alert_id) {
    return transition(alert_id, AlertStatus::Suppressed);
}

Status AlertManager::transition(const std::string& alert_id, AlertStatus to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(alerts_.begin(), alerts_.end(), [&](const Alert& a) {
        return a.alert_id == alert_id;
    });
    if (it == alerts_.end()) {
        return Status::notFound("Alert " + alert_id + " not found");
    }

    AlertStatus from = it->status;
    bool allowed = false;
    switch (to) {
        case AlertStatus::Acknowledged: allowed = from == AlertStatus::Active; break;
        case AlertStatus::Resolved:
        case AlertStatus::Suppressed:
            allowed = from == AlertStatus::Active || from == AlertStatus::Acknowledged;
            break;
        case AlertStatus::Active: allowed = false; break;
    }
    if (!allowed) {
        return Status::invalidArgument(std::string("Alert ") + alert_id + " cannot go from " +
                                       alertStatusName(from) + " to " + alertStatusName(to));
    }
    it->status = to;
    return Status::success();
}

std::optional<Alert> AlertManager::get(const std::string& alert_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& a : alerts_) {
        if (a.alert_id == alert_id) return a;
    }
    return std::nullopt;
}

std::vector<Alert> AlertManager::activeAlerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Alert> result;
    for (const auto& a : alerts_) {
        if (a.status == AlertStatus::Active) result.push_back(a);
    }
    return result;
}

std::vector<Alert> AlertManager::alertsForComponent(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Alert> result;
    for (const auto& a : alerts_) {
        if (a.component_id == component_id) result.push_back(a);
    }
    return result;
}

std::vector<Alert> AlertManager::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alerts_;
}

size_t AlertManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alerts_.size();
}

} // namespace trustnet
