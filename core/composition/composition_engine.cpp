#include "composition/composition_engine.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <mutex>
#include <numeric>

namespace trustnet {

const char* compositionActionTypeName(CompositionActionType type) {
    switch (type) {
        case CompositionActionType::IsolateComponent:     return "isolate_component";
        case CompositionActionType::ReduceTrustWeight:    return "reduce_trust_weight";
        case CompositionActionType::TriggerAlert:         return "trigger_alert";
        case CompositionActionType::UpdateSecurityPolicy: return "update_security_policy";
        case CompositionActionType::ScaleResources:       return "scale_resources";
        case CompositionActionType::FailoverToBackup:     return "failover_to_backup";
    }
    return "unknown";
}

CompositionEngine::CompositionEngine(AnalysisConfig config)
    : analyzer_(config) {}

// ─── Topology ──────────────────────────────────────────────────

void CompositionEngine::addComponent(TrustNode node) {
    graph_.addNode(std::move(node));
}

void CompositionEngine::addRelationship(TrustEdge edge) {
    graph_.addEdge(std::move(edge));
}

// ─── Models and rules ──────────────────────────────────────────

void CompositionEngine::addPropagationModel(std::unique_ptr<PropagationModel> model) {
    models_.registerModel(std::move(model));
}

void CompositionEngine::addCompositionRule(CompositionRule rule) {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(), [&](const CompositionRule& r) {
        return r.rule_id == rule.rule_id;
    });
    if (it != rules_.end()) {
        *it = std::move(rule);
    } else {
        rules_.push_back(std::move(rule));
    }
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const CompositionRule& a, const CompositionRule& b) {
                         return a.priority < b.priority;
                     });
}

bool CompositionEngine::removeCompositionRule(const std::string& rule_id) {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(), [&](const CompositionRule& r) {
        return r.rule_id == rule_id;
    });
    if (it == rules_.end()) return false;
    rules_.erase(it);
    return true;
}

std::vector<CompositionRule> CompositionEngine::compositionRules() const {
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    return rules_;
}

// ─── Analysis ──────────────────────────────────────────────────

SystemTrustScore CompositionEngine::calculateSystemTrust(
    const std::vector<std::string>& roots
) const {
    auto models = models_.getAll();

    return graph_.read([&](const TrustGraph& graph) {
        std::unordered_map<std::string, std::vector<double>> samples;
        for (const auto& model : models) {
            for (const auto& root : roots) {
                for (const auto& [component_id, score] : model->propagate(graph, root)) {
                    samples[component_id].push_back(score);
                }
            }
        }

        SystemTrustScore result;
        for (const auto& [component_id, values] : samples) {
            double sum = std::accumulate(values.begin(), values.end(), 0.0);
            result.component_scores[component_id] = sum / values.size();
        }

        if (!result.component_scores.empty()) {
            double total = 0.0;
            for (const auto& [_, score] : result.component_scores) total += score;
            result.overall_trust = total / result.component_scores.size();
        }

        CriticalPathReport paths = analyzer_.findCriticalPaths(graph, roots);
        result.critical_paths = std::move(paths.paths);
        result.critical_paths_truncated = paths.truncated;
        result.weak_links = analyzer_.findWeakLinks(graph, result.component_scores);
        result.timestamp = now();

        logDebug("System trust " + std::to_string(result.overall_trust) + " over " +
                 std::to_string(result.component_scores.size()) + " components, " +
                 std::to_string(result.weak_links.size()) + " weak links");
        return result;
    });
}

PropagationAnalysis CompositionEngine::propagationAnalysis(const std::string& source) const {
    auto models = models_.getAll();

    return graph_.read([&](const TrustGraph& graph) {
        PropagationAnalysis analysis;
        analysis.source_component = source;
        for (const auto& model : models) {
            analysis.propagation_results[model->name()] = model->propagate(graph, source);
        }
        analysis.timestamp = now();
        return analysis;
    });
}

std::vector<TriggeredCompositionAction> CompositionEngine::evaluateCompositionRules() const {
    std::vector<CompositionRule> rules = compositionRules();

    return graph_.read([&](const TrustGraph& graph) {
        std::vector<TriggeredCompositionAction> triggered;
        for (const auto& rule : rules) {
            bool fires = std::any_of(rule.conditions.begin(), rule.conditions.end(),
                                     [&](const CompositionCondition& c) {
                                         return conditionMatches(graph, c);
                                     });
            if (!fires) continue;
            for (const auto& action : rule.actions) {
                triggered.push_back({rule.rule_id, action});
            }
        }
        return triggered;
    });
}

bool CompositionEngine::conditionMatches(const TrustGraph& graph,
                                         const CompositionCondition& condition) {
    bool matched = false;
    graph.forEachNode([&](const TrustNode& node) {
        if (matched) return;
        if (condition.component_type && node.component_type != *condition.component_type) {
            return;
        }
        if (condition.trust_threshold && node.trust_score < *condition.trust_threshold) {
            matched = true;
            return;
        }
        if (condition.security_condition) {
            const SecurityCondition& sc = *condition.security_condition;
            const SecurityPosture& sp = node.security_posture;
            if (sp.vulnerability_score > sc.vulnerability_threshold ||
                sp.compliance_score < sc.compliance_threshold ||
                (sc.patch_status_required && sp.patch_status < 1.0)) {
                matched = true;
            }
        }
    });
    return matched;
}

} // namespace trustnet
