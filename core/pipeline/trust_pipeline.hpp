#pragma once

#include "composition/composition_engine.hpp"
#include "engine/incident_response_engine.hpp"
#include "incident/alert_manager.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

/// One reading from the upstream scorer, plus whatever context the
/// caller has for the component at that moment.
struct ScoreUpdate {
    std::string component_id;
    double trust_score = 1.0;        // [0, 1]
    double confidence = 1.0;         // [0, 1]
    Timestamp timestamp = now();

    std::vector<SecurityEvent> security_events;
    std::unordered_map<std::string, double> performance_metrics;
    std::vector<BehavioralAnomaly> behavioral_anomalies;
    std::vector<std::string> failed_dependencies;
    std::vector<std::string> communication_failures;
};

struct PipelineConfig {
    TrustThresholds thresholds;
    bool alerts_enabled = true;
    bool respond_to_updates = true;
    size_t history_limit = 1000;     // samples kept per component
};

struct ScoreSample {
    double trust_score = 0.0;
    double confidence = 0.0;
    Timestamp timestamp{};
};

struct IngestResult {
    std::optional<std::string> alert_id;
    ResponseReport response;
};

struct SystemStatus {
    double overall_trust = 0.0;
    size_t component_count = 0;
    size_t active_incidents = 0;
    size_t active_alerts = 0;
    std::string health;              // "Healthy" | "Warning" | "Critical"
    Timestamp timestamp{};
};

/// Health label for an overall trust value.
const char* healthForTrust(double overall_trust);

// ─── Trust Pipeline ────────────────────────────────────────────
// Wires the score feed into the core:
//   ingest  → graph score update → threshold alert → policy response
//   tick    → system trust over the graph
// Starts with the default propagation models and built-in executors.

class TrustPipeline {
public:
    explicit TrustPipeline(PipelineConfig config = {}, AnalysisConfig analysis = {},
                           DispatchConfig dispatch = {});

    CompositionEngine& composition() { return composition_; }
    IncidentResponseEngine& response() { return response_; }
    AlertManager& alerts() { return alerts_; }
    const PipelineConfig& config() const { return config_; }

    /// InvalidArgument for scores or confidence outside [0, 1];
    /// NotFound for components that are not in the graph.
    Result<IngestResult> ingest(const ScoreUpdate& update);

    /// System trust from the given roots. The result backs status().
    SystemTrustScore tick(const std::vector<std::string>& roots);

    /// Overall trust is the last tick's value, or the mean node score
    /// before the first tick.
    SystemStatus status() const;

    TrustMap trustScores() const;

    /// Ingested samples for a component, oldest first.
    std::vector<ScoreSample> history(const std::string& component_id) const;

private:
    PipelineConfig config_;
    CompositionEngine composition_;
    IncidentResponseEngine response_;
    AlertManager alerts_;

    mutable std::mutex state_mutex_;
    std::unordered_map<std::string, std::deque<ScoreSample>> history_;
    std::optional<double> last_overall_;
};

} // namespace trustnet
