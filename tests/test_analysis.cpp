#include <gtest/gtest.h>
#include "analysis/analysis_budget.hpp"
#include "analysis/structural_analyzer.hpp"

#include <algorithm>

using namespace trustnet;

static TrustGraph buildTriangle() {
    TrustGraph g;
    g.addNode(TrustNode("A", 1.0));
    g.addNode(TrustNode("B", 1.0));
    g.addNode(TrustNode("C", 1.0));
    g.addEdge(TrustEdge("A", "B", 1.0));
    g.addEdge(TrustEdge("B", "C", 1.0));
    g.addEdge(TrustEdge("C", "A", 1.0));
    return g;
}

// ─── Critical paths ────────────────────────────────────────────

TEST(StructuralAnalyzerTest, DetectsCycleInTraversalOrder) {
    TrustGraph g = buildTriangle();
    StructuralAnalyzer analyzer;
    CriticalPathReport report = analyzer.findCriticalPaths(g, {"A"});

    ASSERT_EQ(report.paths.size(), 1u);
    EXPECT_EQ(report.paths[0].path, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_DOUBLE_EQ(report.paths[0].criticality, 1.0);
    EXPECT_EQ(report.paths[0].description, "Circular dependency detected");
    EXPECT_FALSE(report.truncated);
}

TEST(StructuralAnalyzerTest, CycleReportedFromWhereItCloses) {
    // R → A → B → C → A: the cycle starts at A, not the root.
    TrustGraph g = buildTriangle();
    g.addNode(TrustNode("R", 1.0));
    g.addEdge(TrustEdge("R", "A", 1.0));

    StructuralAnalyzer analyzer;
    CriticalPathReport report = analyzer.findCriticalPaths(g, {"R"});
    ASSERT_EQ(report.paths.size(), 1u);
    EXPECT_EQ(report.paths[0].path, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(StructuralAnalyzerTest, AcyclicGraphHasNoPaths) {
    TrustGraph g;
    g.addEdge(TrustEdge("A", "B", 1.0));
    g.addEdge(TrustEdge("B", "C", 1.0));
    g.addEdge(TrustEdge("A", "C", 1.0));
    StructuralAnalyzer analyzer;
    EXPECT_TRUE(analyzer.findCriticalPaths(g, {"A"}).paths.empty());
}

TEST(StructuralAnalyzerTest, SameCycleFromTwoRootsReportedOnce) {
    TrustGraph g = buildTriangle();
    StructuralAnalyzer analyzer;
    CriticalPathReport report = analyzer.findCriticalPaths(g, {"A", "A"});
    EXPECT_EQ(report.paths.size(), 1u);
}

TEST(StructuralAnalyzerTest, SelfLoopIsACycle) {
    TrustGraph g;
    g.addEdge(TrustEdge("S", "S", 1.0));
    StructuralAnalyzer analyzer;
    CriticalPathReport report = analyzer.findCriticalPaths(g, {"S"});
    ASSERT_EQ(report.paths.size(), 1u);
    EXPECT_EQ(report.paths[0].path, (std::vector<std::string>{"S"}));
}

TEST(StructuralAnalyzerTest, BudgetTruncatesTraversal) {
    // Dense DAG: exponential number of paths.
    TrustGraph g;
    const int n = 40;
    for (int i = 0; i < n; i++) {
        for (int j = i + 1; j < std::min(n, i + 4); j++) {
            g.addEdge(TrustEdge("n" + std::to_string(i), "n" + std::to_string(j), 1.0));
        }
    }
    AnalysisConfig config;
    config.max_expansions = 500;
    StructuralAnalyzer analyzer(config);
    CriticalPathReport report = analyzer.findCriticalPaths(g, {"n0"});
    EXPECT_TRUE(report.truncated);
    EXPECT_LE(report.expansions, 500);
}

TEST(StructuralAnalyzerTest, DeepChainWithinDefaultBudget) {
    // Long enough that one call frame per node would exhaust the stack.
    TrustGraph g;
    const int n = 80000;
    for (int i = 0; i + 1 < n; i++) {
        g.addEdge(TrustEdge("n" + std::to_string(i), "n" + std::to_string(i + 1), 1.0));
    }
    g.addEdge(TrustEdge("n" + std::to_string(n - 1), "n0", 1.0));

    StructuralAnalyzer analyzer;
    CriticalPathReport report = analyzer.findCriticalPaths(g, {"n0"});
    EXPECT_FALSE(report.truncated);
    EXPECT_EQ(report.expansions, n);
    ASSERT_EQ(report.paths.size(), 1u);
    EXPECT_EQ(report.paths[0].path.size(), static_cast<size_t>(n));
    EXPECT_EQ(report.paths[0].path.front(), "n0");
}

TEST(AnalysisBudgetTest, ExpansionLimit) {
    AnalysisBudget budget(10.0, 3);
    budget.start();
    EXPECT_TRUE(budget.canContinue());
    budget.recordExpansion();
    budget.recordExpansion();
    budget.recordExpansion();
    EXPECT_FALSE(budget.canContinue());
    EXPECT_TRUE(budget.exhausted());
    EXPECT_EQ(budget.expansions(), 3);
}

// ─── Weak links ────────────────────────────────────────────────

TEST(StructuralAnalyzerTest, WeakLinkBoundaryIsExclusive) {
    TrustGraph g;
    g.addNode(TrustNode("low", 0.25));
    g.addNode(TrustNode("ok", 0.31));
    g.addNode(TrustNode("edge", 0.3));
    StructuralAnalyzer analyzer;

    auto links = analyzer.findWeakLinks(g, {{"low", 0.25}, {"ok", 0.31}, {"edge", 0.3}});
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].component_id, "low");
    EXPECT_DOUBLE_EQ(links[0].trust_score, 0.25);
}

TEST(StructuralAnalyzerTest, WeakLinksSortedByScore) {
    TrustGraph g;
    StructuralAnalyzer analyzer;
    auto links = analyzer.findWeakLinks(g, {{"b", 0.2}, {"a", 0.05}, {"c", 0.2}});
    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0].component_id, "a");
    EXPECT_EQ(links[1].component_id, "b");
    EXPECT_EQ(links[2].component_id, "c");
}

TEST(StructuralAnalyzerTest, ImpactIsForwardClosure) {
    TrustGraph g;
    g.addEdge(TrustEdge("up", "weak", 1.0));
    g.addEdge(TrustEdge("weak", "d1", 1.0));
    g.addEdge(TrustEdge("d1", "d2", 1.0));
    g.addEdge(TrustEdge("d2", "weak", 1.0));

    StructuralAnalyzer analyzer;
    ImpactAssessment impact = analyzer.assessImpact(g, "weak");
    EXPECT_EQ(impact.affected_components, (std::vector<std::string>{"weak", "d1", "d2"}));
    EXPECT_DOUBLE_EQ(impact.severity, 0.5);
    EXPECT_EQ(impact.business_impact, "Moderate");
}

TEST(StructuralAnalyzerTest, LargeClosureIsHighImpact) {
    TrustGraph g;
    for (int i = 0; i < 11; i++) {
        g.addEdge(TrustEdge("hub", "leaf" + std::to_string(i), 1.0));
    }
    StructuralAnalyzer analyzer;
    ImpactAssessment impact = analyzer.assessImpact(g, "hub");
    EXPECT_EQ(impact.affected_components.size(), 12u);
    EXPECT_DOUBLE_EQ(impact.severity, 1.0);
    EXPECT_EQ(impact.business_impact, "High");
}

TEST(StructuralAnalyzerTest, MitigationBands) {
    auto critical = StructuralAnalyzer::mitigationSuggestions(0.05);
    ASSERT_FALSE(critical.empty());
    EXPECT_EQ(critical[0], "Immediate isolation required");

    auto weak = StructuralAnalyzer::mitigationSuggestions(0.2);
    ASSERT_FALSE(weak.empty());
    EXPECT_EQ(weak[0], "Enhanced monitoring required");

    EXPECT_FALSE(StructuralAnalyzer::mitigationSuggestions(0.45).empty());
    EXPECT_TRUE(StructuralAnalyzer::mitigationSuggestions(0.9).empty());
}
