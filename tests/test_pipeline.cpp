#include <gtest/gtest.h>
#include "common/logging.hpp"
#include "pipeline/trust_pipeline.hpp"

#include <cmath>
#include <mutex>
#include <vector>

using namespace trustnet;

static void addChain(TrustPipeline& pipeline) {
    pipeline.composition().addComponent(TrustNode("A", 0.9));
    pipeline.composition().addComponent(TrustNode("B", 0.8));
    pipeline.composition().addComponent(TrustNode("C", 0.7));
    pipeline.composition().addRelationship(TrustEdge("A", "B", 0.5));
    pipeline.composition().addRelationship(TrustEdge("B", "C", 0.4));
}

static ScoreUpdate update(const std::string& component, double score, double confidence = 0.9) {
    ScoreUpdate u;
    u.component_id = component;
    u.trust_score = score;
    u.confidence = confidence;
    return u;
}

TEST(TrustPipelineTest, StartsWithDefaults) {
    TrustPipeline pipeline;
    EXPECT_EQ(pipeline.composition().models().count(), 2u);
    EXPECT_EQ(pipeline.response().executors().count(), 4u);
}

TEST(TrustPipelineTest, IngestUpdatesGraphAndHistory) {
    TrustPipeline pipeline;
    addChain(pipeline);

    auto result = pipeline.ingest(update("B", 0.6));
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value.alert_id.has_value());
    EXPECT_DOUBLE_EQ(pipeline.trustScores().at("B"), 0.6);

    pipeline.ingest(update("B", 0.7));
    auto history = pipeline.history("B");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_DOUBLE_EQ(history[0].trust_score, 0.6);
    EXPECT_DOUBLE_EQ(history[1].trust_score, 0.7);
    EXPECT_TRUE(pipeline.history("A").empty());
}

TEST(TrustPipelineTest, IngestRejectsBadInput) {
    TrustPipeline pipeline;
    addChain(pipeline);

    EXPECT_EQ(pipeline.ingest(update("A", 1.2)).status.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(pipeline.ingest(update("A", -0.1)).status.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(pipeline.ingest(update("A", 0.5, 1.5)).status.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(pipeline.ingest(update("A", std::nan(""))).status.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(pipeline.ingest(update("A", 0.5, std::nan(""))).status.kind,
              ErrorKind::InvalidArgument);
    EXPECT_EQ(pipeline.ingest(update("ghost", 0.5)).status.kind, ErrorKind::NotFound);
    EXPECT_DOUBLE_EQ(pipeline.trustScores().at("A"), 0.9);
    EXPECT_TRUE(pipeline.history("A").empty());
}

TEST(TrustPipelineTest, HistoryIsBounded) {
    PipelineConfig config;
    config.history_limit = 3;
    TrustPipeline pipeline(config);
    addChain(pipeline);

    for (int i = 0; i < 5; i++) pipeline.ingest(update("A", 0.9 - i * 0.01));
    auto history = pipeline.history("A");
    ASSERT_EQ(history.size(), 3u);
    EXPECT_NEAR(history[0].trust_score, 0.88, 1e-12);
}

TEST(TrustPipelineTest, LowScoreRaisesAlertAndIncident) {
    TrustPipeline pipeline;
    pipeline.composition().addComponent(TrustNode("X", 0.9));

    ResponsePolicy policy;
    policy.policy_id = "isolate-low-trust";
    ResponseCondition c;
    c.condition_type = ConditionType::TrustScore;
    c.op = ComparisonOperator::LessThan;
    c.threshold = 0.2;
    policy.conditions.push_back(c);
    ResponseAction isolate;
    isolate.action_id = "isolate";
    isolate.action_type = ActionType::IsolateComponent;
    isolate.target_components = {"X"};
    policy.actions.push_back(isolate);
    pipeline.response().addResponsePolicy(policy);

    auto result = pipeline.ingest(update("X", 0.1));
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value.alert_id.has_value());
    EXPECT_EQ(pipeline.alerts().get(*result.value.alert_id)->severity, AlertSeverity::Critical);

    auto incidents = pipeline.response().activeIncidents();
    ASSERT_EQ(incidents.size(), 1u);
    EXPECT_EQ(incidents[0].status, IncidentStatus::Open);
    ASSERT_EQ(incidents[0].actions_taken.size(), 1u);
    EXPECT_EQ(incidents[0].actions_taken[0].action_type, ActionType::IsolateComponent);

    SystemStatus status = pipeline.status();
    EXPECT_EQ(status.active_incidents, 1u);
    EXPECT_EQ(status.active_alerts, 1u);
}

TEST(TrustPipelineTest, RecoveredScoreClearsTrustAlerts) {
    TrustPipeline pipeline;
    pipeline.composition().addComponent(TrustNode("X", 0.9));

    ASSERT_TRUE(pipeline.ingest(update("X", 0.3)).ok());
    EXPECT_EQ(pipeline.status().active_alerts, 1u);

    ASSERT_TRUE(pipeline.ingest(update("X", 0.85)).ok());
    EXPECT_EQ(pipeline.status().active_alerts, 0u);
    EXPECT_EQ(pipeline.alerts().size(), 1u);
}

TEST(TrustPipelineTest, ResponseAndAlertsCanBeDisabled) {
    PipelineConfig config;
    config.alerts_enabled = false;
    config.respond_to_updates = false;
    TrustPipeline pipeline(config);
    pipeline.composition().addComponent(TrustNode("X", 0.9));

    ResponsePolicy always;
    always.policy_id = "always";
    ResponseAction scale;
    scale.action_id = "scale";
    scale.action_type = ActionType::ScaleResources;
    always.actions.push_back(scale);
    pipeline.response().addResponsePolicy(always);

    auto result = pipeline.ingest(update("X", 0.05));
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value.alert_id.has_value());
    EXPECT_TRUE(result.value.response.fired_policies.empty());
    EXPECT_EQ(pipeline.alerts().size(), 0u);
    EXPECT_TRUE(pipeline.response().allIncidents().empty());
}

TEST(TrustPipelineTest, ContextCarriesCallerSignals) {
    TrustPipeline pipeline;
    pipeline.composition().addComponent(TrustNode("api", 0.9));

    ResponsePolicy slow;
    slow.policy_id = "slow";
    ResponseCondition latency;
    latency.condition_type = ConditionType::PerformanceMetric;
    latency.metric_name = "latency_ms";
    latency.op = ComparisonOperator::GreaterThan;
    latency.threshold = 500;
    slow.conditions.push_back(latency);
    ResponseAction scale;
    scale.action_id = "scale";
    scale.action_type = ActionType::ScaleResources;
    slow.actions.push_back(scale);
    pipeline.response().addResponsePolicy(slow);

    ScoreUpdate u = update("api", 0.85);
    u.performance_metrics["latency_ms"] = 900;
    auto result = pipeline.ingest(u);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.response.fired_policies, (std::vector<std::string>{"slow"}));
    EXPECT_EQ(pipeline.response().incidentForComponent("api")->severity, IncidentSeverity::Low);
}

TEST(TrustPipelineTest, TickAndStatusHealth) {
    TrustPipeline pipeline;
    addChain(pipeline);

    // Before any tick: mean node score (.9 + .8 + .7) / 3
    SystemStatus before = pipeline.status();
    EXPECT_NEAR(before.overall_trust, 0.8, 1e-12);
    EXPECT_STREQ(healthForTrust(before.overall_trust), "Warning");
    EXPECT_EQ(before.component_count, 3u);

    SystemTrustScore score = pipeline.tick({"A"});
    // A 1.0, B .5, C (.2 + .4) / 2
    EXPECT_NEAR(score.overall_trust, 0.6, 1e-12);
    SystemStatus after = pipeline.status();
    EXPECT_NEAR(after.overall_trust, 0.6, 1e-12);
    EXPECT_EQ(after.health, "Warning");

    EXPECT_STREQ(healthForTrust(0.81), "Healthy");
    EXPECT_STREQ(healthForTrust(0.5), "Critical");
}

TEST(TrustPipelineTest, LogsIncidentCreation) {
    std::vector<std::string> lines;
    std::mutex lines_mutex;
    setLogSink([&](LogLevel, const std::string& msg) {
        std::lock_guard<std::mutex> lock(lines_mutex);
        lines.push_back(msg);
    });

    TrustPipeline pipeline;
    pipeline.composition().addComponent(TrustNode("X", 0.9));
    pipeline.response().createIncident("X", IncidentSeverity::High, "manual");
    setLogSink(nullptr);

    bool found = false;
    for (const auto& l : lines) {
        if (l.find("Opened incident") != std::string::npos) found = true;
    }
    EXPECT_TRUE(found);
}
