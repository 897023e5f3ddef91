#include <gtest/gtest.h>
#include "response/condition_evaluator.hpp"
#include "response/policy_set.hpp"

#include <chrono>

using namespace trustnet;

static ResponseCondition condition(ConditionType type, ComparisonOperator op, double threshold,
                                   const std::string& metric = "") {
    ResponseCondition c;
    c.condition_type = type;
    c.op = op;
    c.threshold = threshold;
    c.metric_name = metric;
    return c;
}

static TrustContext contextFor(const std::string& component, double score) {
    TrustContext ctx;
    ctx.component_id = component;
    ctx.trust_score = score;
    return ctx;
}

// ─── Comparisons ───────────────────────────────────────────────

TEST(ConditionTest, CompareValues) {
    EXPECT_TRUE(compareValues(0.1, ComparisonOperator::LessThan, 0.2));
    EXPECT_FALSE(compareValues(0.2, ComparisonOperator::LessThan, 0.2));
    EXPECT_TRUE(compareValues(0.2, ComparisonOperator::LessThanOrEqual, 0.2));
    EXPECT_TRUE(compareValues(0.3, ComparisonOperator::GreaterThan, 0.2));
    EXPECT_TRUE(compareValues(0.2, ComparisonOperator::GreaterThanOrEqual, 0.2));
    EXPECT_TRUE(compareValues(0.5004, ComparisonOperator::EqualTo, 0.5));
    EXPECT_FALSE(compareValues(0.502, ComparisonOperator::EqualTo, 0.5));
    EXPECT_TRUE(compareValues(0.502, ComparisonOperator::NotEqualTo, 0.5));
}

TEST(ConditionTest, TrustScoreCondition) {
    auto c = condition(ConditionType::TrustScore, ComparisonOperator::LessThan, 0.2);
    EXPECT_TRUE(evaluateCondition(c, contextFor("x", 0.1)));
    EXPECT_FALSE(evaluateCondition(c, contextFor("x", 0.5)));
}

TEST(ConditionTest, SecurityEventCondition) {
    auto c = condition(ConditionType::SecurityEvent, ComparisonOperator::GreaterThan, 0.7);
    TrustContext ctx = contextFor("x", 0.9);
    EXPECT_FALSE(evaluateCondition(c, ctx));

    SecurityEvent minor;
    minor.event_type = "port_scan";
    minor.severity = 0.3;
    ctx.security_events.push_back(minor);
    EXPECT_FALSE(evaluateCondition(c, ctx));

    SecurityEvent major;
    major.event_type = "intrusion";
    major.severity = 0.9;
    ctx.security_events.push_back(major);
    EXPECT_TRUE(evaluateCondition(c, ctx));
}

TEST(ConditionTest, PerformanceMetricCondition) {
    auto c = condition(ConditionType::PerformanceMetric, ComparisonOperator::GreaterThan, 500.0,
                       "latency_ms");
    TrustContext ctx = contextFor("x", 0.9);
    EXPECT_FALSE(evaluateCondition(c, ctx));   // absent metric

    ctx.performance_metrics["latency_ms"] = 750.0;
    EXPECT_TRUE(evaluateCondition(c, ctx));
    ctx.performance_metrics["latency_ms"] = 120.0;
    EXPECT_FALSE(evaluateCondition(c, ctx));
}

TEST(ConditionTest, CountConditions) {
    TrustContext ctx = contextFor("x", 0.9);
    ctx.behavioral_anomalies.resize(3);
    ctx.failed_dependencies = {"db"};
    ctx.communication_failures = {"a", "b"};

    EXPECT_TRUE(evaluateCondition(
        condition(ConditionType::BehavioralAnomaly, ComparisonOperator::GreaterThan, 2), ctx));
    EXPECT_FALSE(evaluateCondition(
        condition(ConditionType::DependencyFailure, ComparisonOperator::GreaterThan, 1), ctx));
    EXPECT_TRUE(evaluateCondition(
        condition(ConditionType::DependencyFailure, ComparisonOperator::GreaterThanOrEqual, 1), ctx));
    EXPECT_TRUE(evaluateCondition(
        condition(ConditionType::CommunicationFailure, ComparisonOperator::EqualTo, 2), ctx));
}

// ─── Policy evaluation ─────────────────────────────────────────

TEST(ConditionEvaluatorTest, AndSemantics) {
    ResponsePolicy policy;
    policy.policy_id = "p";
    policy.conditions.push_back(condition(ConditionType::TrustScore, ComparisonOperator::LessThan, 0.5));
    policy.conditions.push_back(condition(ConditionType::DependencyFailure,
                                          ComparisonOperator::GreaterThan, 0));

    ConditionEvaluator evaluator;
    TrustContext ctx = contextFor("x", 0.3);
    EXPECT_FALSE(evaluator.evaluatePolicy(policy, ctx));

    ctx.failed_dependencies.push_back("db");
    EXPECT_TRUE(evaluator.evaluatePolicy(policy, ctx));

    ctx.trust_score = 0.8;
    EXPECT_FALSE(evaluator.evaluatePolicy(policy, ctx));
}

TEST(ConditionEvaluatorTest, EmptyPolicyHolds) {
    ResponsePolicy policy;
    policy.policy_id = "always";
    ConditionEvaluator evaluator;
    EXPECT_TRUE(evaluator.evaluatePolicy(policy, contextFor("x", 1.0)));
}

TEST(ConditionEvaluatorTest, DurationMustHoldContinuously) {
    ResponsePolicy policy;
    policy.policy_id = "sustained";
    auto c = condition(ConditionType::TrustScore, ComparisonOperator::LessThan, 0.5);
    c.duration = Millis(60000);
    policy.conditions.push_back(c);

    ConditionEvaluator evaluator;
    Timestamp t0 = now();
    TrustContext ctx = contextFor("x", 0.3);

    ctx.timestamp = t0;
    EXPECT_FALSE(evaluator.evaluatePolicy(policy, ctx));
    EXPECT_EQ(evaluator.trackedWindows(), 1u);

    ctx.timestamp = t0 + std::chrono::seconds(30);
    EXPECT_FALSE(evaluator.evaluatePolicy(policy, ctx));

    ctx.timestamp = t0 + std::chrono::seconds(60);
    EXPECT_TRUE(evaluator.evaluatePolicy(policy, ctx));

    // A recovered sample resets the window.
    ctx.trust_score = 0.9;
    ctx.timestamp = t0 + std::chrono::seconds(61);
    EXPECT_FALSE(evaluator.evaluatePolicy(policy, ctx));
    EXPECT_EQ(evaluator.trackedWindows(), 0u);

    ctx.trust_score = 0.3;
    ctx.timestamp = t0 + std::chrono::seconds(62);
    EXPECT_FALSE(evaluator.evaluatePolicy(policy, ctx));
}

TEST(ConditionEvaluatorTest, WindowsAreKeyedPerComponent) {
    ResponsePolicy policy;
    policy.policy_id = "sustained";
    auto c = condition(ConditionType::TrustScore, ComparisonOperator::LessThan, 0.5);
    c.duration = Millis(1000);
    policy.conditions.push_back(c);

    ConditionEvaluator evaluator;
    Timestamp t0 = now();
    TrustContext a = contextFor("a", 0.1);
    TrustContext b = contextFor("b", 0.1);
    a.timestamp = t0;
    b.timestamp = t0 + std::chrono::seconds(5);
    evaluator.evaluatePolicy(policy, a);
    EXPECT_FALSE(evaluator.evaluatePolicy(policy, b));
    EXPECT_EQ(evaluator.trackedWindows(), 2u);

    evaluator.forgetComponent("a");
    EXPECT_EQ(evaluator.trackedWindows(), 1u);
    evaluator.reset();
    EXPECT_EQ(evaluator.trackedWindows(), 0u);
}

// ─── Policy set ────────────────────────────────────────────────

static ResponsePolicy policy(const std::string& id, unsigned priority) {
    ResponsePolicy p;
    p.policy_id = id;
    p.name = id;
    p.priority = priority;
    return p;
}

TEST(PolicySetTest, OrderedByPriorityThenInsertion) {
    PolicySet set;
    set.addPolicy(policy("c", 10));
    set.addPolicy(policy("a", 1));
    set.addPolicy(policy("b", 10));

    auto all = set.policies();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].policy_id, "a");
    EXPECT_EQ(all[1].policy_id, "c");
    EXPECT_EQ(all[2].policy_id, "b");
}

TEST(PolicySetTest, AddReplacesById) {
    PolicySet set;
    set.addPolicy(policy("p", 5));
    set.addPolicy(policy("q", 3));
    set.addPolicy(policy("p", 1));
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set.policies()[0].policy_id, "p");
}

TEST(PolicySetTest, EnableDisable) {
    PolicySet set;
    set.addPolicy(policy("p", 0));
    set.addPolicy(policy("q", 1));

    EXPECT_TRUE(set.setEnabled("p", false).ok());
    auto enabled = set.enabledPolicies();
    ASSERT_EQ(enabled.size(), 1u);
    EXPECT_EQ(enabled[0].policy_id, "q");

    Status missing = set.setEnabled("zzz", true);
    EXPECT_EQ(missing.kind, ErrorKind::NotFound);
}

TEST(PolicySetTest, GetAndRemove) {
    PolicySet set;
    set.addPolicy(policy("p", 0));
    ASSERT_TRUE(set.getPolicy("p").has_value());
    EXPECT_FALSE(set.getPolicy("x").has_value());
    EXPECT_TRUE(set.removePolicy("p"));
    EXPECT_FALSE(set.removePolicy("p"));
    EXPECT_EQ(set.size(), 0u);
}
