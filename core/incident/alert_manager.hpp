#pragma once

#include "common/status.hpp"
#include "incident/alert.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trustnet {

/// Alert store. One lock for the whole store.
class AlertManager {
public:
    /// Record a new Active alert. Returns its id.
    std::string raise(const std::string& component_id, AlertType type,
                      AlertSeverity severity, const std::string& message);

    /// Raise a TrustScoreLow alert when score is below the critical
    /// (Critical) or warning (Medium) threshold. Returns the new alert id.
    /// At or above the normal threshold, the component's Active and
    /// Acknowledged TrustScoreLow alerts are resolved instead.
    std::optional<std::string> checkTrustThresholds(const std::string& component_id,
                                                    double score,
                                                    const TrustThresholds& thresholds);

    Status acknowledge(const std::string& alert_id);
    Status resolve(const std::string& alert_id);
    Status suppress(const std::string& alert_id);

    std::optional<Alert> get(const std::string& alert_id) const;
    std::vector<Alert> activeAlerts() const;
    std::vector<Alert> alertsForComponent(const std::string& component_id) const;
    std::vector<Alert> all() const;

    size_t size() const;

    /// Resolve every Active or Acknowledged TrustScoreLow alert for the
    /// component. Returns how many were resolved.
    size_t resolveTrustAlerts(const std::string& component_id);

private:
    mutable std::mutex mutex_;
    std::vector<Alert> alerts_;
    unsigned long next_sequence_ = 1;

    Status transition(const std::string& alert_id, AlertStatus to);
};

} // namespace trustnet
