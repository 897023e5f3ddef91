#pragma once

#include "analysis/structural_analyzer.hpp"
#include "composition/composition_rule.hpp"
#include "graph/shared_graph.hpp"
#include "propagation/model_registry.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace trustnet {

// ─── System Trust ──────────────────────────────────────────────
// Result of one composition pass. Computed on demand, never stored.

struct SystemTrustScore {
    double overall_trust = 0.0;
    TrustMap component_scores;
    std::vector<CriticalPath> critical_paths;
    bool critical_paths_truncated = false;
    std::vector<WeakLink> weak_links;
    Timestamp timestamp{};
};

struct PropagationAnalysis {
    std::string source_component;
    std::map<std::string, TrustMap> propagation_results;  // model name → scores
    Timestamp timestamp{};
};

// ─── Composition Engine ────────────────────────────────────────
// Runs every registered propagation model from every root over one
// consistent view of the graph, averages the per-component results and
// attaches the structural analysis.

class CompositionEngine {
public:
    explicit CompositionEngine(AnalysisConfig config = {});

    SharedTrustGraph& graph() { return graph_; }
    const SharedTrustGraph& graph() const { return graph_; }
    ModelRegistry& models() { return models_; }
    const StructuralAnalyzer& analyzer() const { return analyzer_; }

    // ── Topology ──
    void addComponent(TrustNode node);
    void addRelationship(TrustEdge edge);

    // ── Models and rules ──
    void addPropagationModel(std::unique_ptr<PropagationModel> model);
    void addCompositionRule(CompositionRule rule);
    bool removeCompositionRule(const std::string& rule_id);
    std::vector<CompositionRule> compositionRules() const;

    // ── Analysis ──
    /// Component score = mean of every value any model produced for it
    /// from any root. Overall trust = mean of component scores (0 if none).
    SystemTrustScore calculateSystemTrust(const std::vector<std::string>& roots) const;

    /// Per-model propagation from one source.
    PropagationAnalysis propagationAnalysis(const std::string& source) const;

    /// Actions of every matching rule, in rule priority order.
    std::vector<TriggeredCompositionAction> evaluateCompositionRules() const;

private:
    SharedTrustGraph graph_;
    ModelRegistry models_;
    StructuralAnalyzer analyzer_;

    mutable std::shared_mutex rules_mutex_;
    std::vector<CompositionRule> rules_;

    static bool conditionMatches(const TrustGraph& graph, const CompositionCondition& condition);
};

} // namespace trustnet
