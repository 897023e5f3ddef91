#include "analysis/structural_analyzer.hpp"
#include "analysis/analysis_budget.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <deque>

namespace trustnet {

StructuralAnalyzer::StructuralAnalyzer(AnalysisConfig config)
    : config_(config) {}

// ─── Critical paths ────────────────────────────────────────────

CriticalPathReport StructuralAnalyzer::findCriticalPaths(
    const TrustGraph& graph, const std::vector<std::string>& roots
) const {
    CriticalPathReport report;
    AnalysisBudget budget(config_.max_seconds, config_.max_expansions);
    budget.start();

    std::unordered_set<std::string> seen_cycles;
    for (const auto& root : roots) {
        walkCycles(graph, root, seen_cycles, budget, report.paths);
        if (budget.exhausted()) break;
    }

    report.truncated = budget.exhausted();
    report.expansions = budget.expansions();
    if (report.truncated) {
        logWarn("Critical path analysis truncated after " +
                std::to_string(report.expansions) + " expansions");
    }
    return report;
}

void StructuralAnalyzer::walkCycles(const TrustGraph& graph, const std::string& root,
                                    std::unordered_set<std::string>& seen_cycles,
                                    AnalysisBudget& budget,
                                    std::vector<CriticalPath>& out) const {
    // Explicit stack: path depth is bounded by the budget, not the call stack.
    struct Frame {
        const std::vector<std::string>* successors;
        size_t next;
    };
    std::vector<Frame> stack;
    std::vector<std::string> path;
    std::unordered_set<std::string> on_path;

    auto enter = [&](const std::string& id) {
        if (on_path.count(id)) {
            auto start = std::find(path.begin(), path.end(), id);
            std::vector<std::string> cycle(start, path.end());

            std::string signature;
            for (const auto& c : cycle) signature += c + "\n";
            if (seen_cycles.insert(signature).second) {
                out.push_back({std::move(cycle), 1.0, "Circular dependency detected"});
            }
            return;
        }
        if (!budget.canContinue()) return;
        budget.recordExpansion();

        on_path.insert(id);
        path.push_back(id);
        stack.push_back({&graph.successors(id), 0});
    };

    enter(root);
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (budget.exhausted() || top.next >= top.successors->size()) {
            on_path.erase(path.back());
            path.pop_back();
            stack.pop_back();
            continue;
        }
        const std::string& next = (*top.successors)[top.next++];
        enter(next);
    }
}

// ─── Weak links ────────────────────────────────────────────────

std::vector<WeakLink> StructuralAnalyzer::findWeakLinks(const TrustGraph& graph,
                                                        const TrustMap& scores) const {
    std::vector<WeakLink> links;
    for (const auto& [component_id, score] : scores) {
        if (!isWeakLink(score)) continue;
        WeakLink link;
        link.component_id = component_id;
        link.trust_score = score;
        link.impact_assessment = assessImpact(graph, component_id);
        link.mitigation_suggestions = mitigationSuggestions(score);
        links.push_back(std::move(link));
    }

    std::sort(links.begin(), links.end(), [](const WeakLink& a, const WeakLink& b) {
        if (a.trust_score != b.trust_score) return a.trust_score < b.trust_score;
        return a.component_id < b.component_id;
    });
    return links;
}

ImpactAssessment StructuralAnalyzer::assessImpact(const TrustGraph& graph,
                                                  const std::string& component_id) const {
    ImpactAssessment impact;
    std::unordered_set<std::string> affected;
    std::deque<std::string> queue{component_id};

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        if (!affected.insert(current).second) continue;
        impact.affected_components.push_back(current);

        for (const auto& next : graph.successors(current)) {
            if (!affected.count(next)) queue.push_back(next);
        }
    }

    bool high = static_cast<int>(impact.affected_components.size()) > config_.high_impact_closure;
    impact.severity = high ? 1.0 : 0.5;
    impact.business_impact = high ? "High" : "Moderate";
    return impact;
}

std::vector<std::string> StructuralAnalyzer::mitigationSuggestions(double score) {
    if (score < 0.1) {
        return {"Immediate isolation required", "Emergency security review"};
    }
    if (score < 0.3) {
        return {"Enhanced monitoring required", "Security patch deployment"};
    }
    if (score < 0.5) {
        return {"Regular security assessment", "Performance optimization"};
    }
    return {};
}

} // namespace trustnet
