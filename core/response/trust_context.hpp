#pragma once

#include "common/clock.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

struct SecurityEvent {
    std::string event_type;
    double severity = 0.0;
    std::string source;
    std::string description;
    Timestamp timestamp{};
};

struct BehavioralAnomaly {
    std::string anomaly_type;
    double severity = 0.0;
    std::string description;
    Timestamp timestamp{};
};

/// Everything the policy evaluator knows about one component at one
/// point in time.
struct TrustContext {
    std::string component_id;
    double trust_score = 1.0;
    std::vector<SecurityEvent> security_events;
    std::unordered_map<std::string, double> performance_metrics;
    std::vector<BehavioralAnomaly> behavioral_anomalies;
    std::vector<std::string> failed_dependencies;
    std::vector<std::string> communication_failures;
    Timestamp timestamp = now();
};

} // namespace trustnet
