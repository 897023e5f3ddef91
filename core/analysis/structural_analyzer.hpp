#pragma once

#include "analysis/analysis_config.hpp"
#include "graph/graph.hpp"
#include "propagation/propagation_model.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace trustnet {

class AnalysisBudget;

// ─── Critical Path ─────────────────────────────────────────────
// A cycle found during depth-first traversal, listed from the node
// where the cycle closes, in traversal order.

struct CriticalPath {
    std::vector<std::string> path;
    double criticality = 1.0;
    std::string description;
};

struct CriticalPathReport {
    std::vector<CriticalPath> paths;
    bool truncated = false;   // budget exhausted before traversal finished
    int expansions = 0;
};

// ─── Weak Links ────────────────────────────────────────────────

struct ImpactAssessment {
    std::vector<std::string> affected_components;  // forward closure, BFS order
    double severity = 0.5;                         // 1.0 high, 0.5 moderate
    std::string business_impact;
};

struct WeakLink {
    std::string component_id;
    double trust_score = 0.0;
    ImpactAssessment impact_assessment;
    std::vector<std::string> mitigation_suggestions;
};

// ─── Structural Analyzer ───────────────────────────────────────
// Cycle detection and weak-link impact assessment over a trust graph.
// Stateless apart from its config; safe to share between threads.

class StructuralAnalyzer {
public:
    explicit StructuralAnalyzer(AnalysisConfig config = {});

    /// Depth-first from each root. A back-edge to a node on the current
    /// path reports the sub-path from that node to the top of the stack.
    /// Identical cycles found from several roots are reported once.
    CriticalPathReport findCriticalPaths(const TrustGraph& graph,
                                         const std::vector<std::string>& roots) const;

    /// Components scoring strictly below the weak-link threshold, lowest
    /// score first.
    std::vector<WeakLink> findWeakLinks(const TrustGraph& graph, const TrustMap& scores) const;

    /// Breadth-first closure of everything reachable from component,
    /// the component itself included.
    ImpactAssessment assessImpact(const TrustGraph& graph, const std::string& component_id) const;

    /// Canned remediation advice by score band.
    static std::vector<std::string> mitigationSuggestions(double score);

    bool isWeakLink(double score) const { return score < config_.weak_link_threshold; }

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;

    void walkCycles(const TrustGraph& graph, const std::string& root,
                    std::unordered_set<std::string>& seen_cycles,
                    AnalysisBudget& budget,
                    std::vector<CriticalPath>& out) const;
};

} // namespace trustnet
