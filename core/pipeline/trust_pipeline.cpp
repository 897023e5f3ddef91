#include "pipeline/trust_pipeline.hpp"
#include "common/logging.hpp"
#include "executors/builtin_executors.hpp"
#include "propagation/default_models.hpp"

namespace trustnet {

const char* healthForTrust(double overall_trust) {
    if (overall_trust > 0.8) return "Healthy";
    if (overall_trust > 0.5) return "Warning";
    return "Critical";
}

TrustPipeline::TrustPipeline(PipelineConfig config, AnalysisConfig analysis, DispatchConfig dispatch)
    : config_(config), composition_(analysis), response_(dispatch) {
    registerDefaultModels(composition_.models());
    registerDefaultExecutors(response_.executors());
}

Result<IngestResult> TrustPipeline::ingest(const ScoreUpdate& update) {
    // Written as a negated range test so NaN is rejected too.
    if (!(update.trust_score >= 0.0 && update.trust_score <= 1.0)) {
        return Result<IngestResult>::failure(Status::invalidArgument(
            "Trust score for " + update.component_id + " out of range: " +
            std::to_string(update.trust_score)));
    }
    if (!(update.confidence >= 0.0 && update.confidence <= 1.0)) {
        return Result<IngestResult>::failure(Status::invalidArgument(
            "Confidence for " + update.component_id + " out of range: " +
            std::to_string(update.confidence)));
    }
    if (!composition_.graph().updateTrustScore(update.component_id, update.trust_score,
                                               update.timestamp)) {
        logWarn("Score update for unknown component " + update.component_id);
        return Result<IngestResult>::failure(
            Status::notFound("Component " + update.component_id + " not found"));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto& samples = history_[update.component_id];
        samples.push_back({update.trust_score, update.confidence, update.timestamp});
        while (config_.history_limit > 0 && samples.size() > config_.history_limit) {
            samples.pop_front();
        }
    }

    IngestResult result;
    if (config_.alerts_enabled) {
        result.alert_id = alerts_.checkTrustThresholds(update.component_id, update.trust_score,
                                                       config_.thresholds);
    }

    if (config_.respond_to_updates) {
        TrustContext context;
        context.component_id = update.component_id;
        context.trust_score = update.trust_score;
        context.security_events = update.security_events;
        context.performance_metrics = update.performance_metrics;
        context.behavioral_anomalies = update.behavioral_anomalies;
        context.failed_dependencies = update.failed_dependencies;
        context.communication_failures = update.communication_failures;
        context.timestamp = update.timestamp;
        result.response = response_.processTrustUpdate(context);
    }

    return Result<IngestResult>::success(std::move(result));
}

SystemTrustScore TrustPipeline::tick(const std::vector<std::string>& roots) {
    SystemTrustScore score = composition_.calculateSystemTrust(roots);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_overall_ = score.overall_trust;
    }
    logDebug("System trust " + std::to_string(score.overall_trust) + " over " +
             std::to_string(score.component_scores.size()) + " components");
    return score;
}

SystemStatus TrustPipeline::status() const {
    SystemStatus s;
    s.timestamp = now();
    s.component_count = composition_.graph().nodeCount();
    s.active_incidents = response_.activeIncidents().size();
    s.active_alerts = alerts_.activeAlerts().size();

    std::optional<double> overall;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        overall = last_overall_;
    }
    if (overall) {
        s.overall_trust = *overall;
    } else {
        auto scores = composition_.graph().trustScores();
        double sum = 0.0;
        for (const auto& [id, v] : scores) sum += v;
        s.overall_trust = scores.empty() ? 0.0 : sum / static_cast<double>(scores.size());
    }
    s.health = healthForTrust(s.overall_trust);
    return s;
}

TrustMap TrustPipeline::trustScores() const {
    return composition_.graph().trustScores();
}

std::vector<ScoreSample> TrustPipeline::history(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = history_.find(component_id);
    if (it == history_.end()) return {};
    return std::vector<ScoreSample>(it->second.begin(), it->second.end());
}

} // namespace trustnet
