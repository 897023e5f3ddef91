#include "propagation/propagation_models.hpp"

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace trustnet {

namespace {

// Shared single-pass BFS for the multiplicative models.
// factor(from, to, edge) gives the per-edge attenuation.
template <typename FactorFn>
TrustMap firstVisitPropagate(const TrustGraph& graph, const std::string& source,
                             FactorFn factor) {
    TrustMap scores;
    std::unordered_set<std::string> visited;
    std::deque<std::pair<std::string, double>> queue;

    queue.emplace_back(source, 1.0);
    visited.insert(source);

    while (!queue.empty()) {
        auto [current, trust] = queue.front();
        queue.pop_front();
        scores[current] = trust;

        for (const TrustEdge* edge : graph.outgoingEdges(current)) {
            if (visited.count(edge->to)) continue;
            visited.insert(edge->to);
            queue.emplace_back(edge->to, trust * factor(*edge));
        }
    }
    return scores;
}

} // namespace

// ─── Weighted Average ──────────────────────────────────────────

std::string WeightedAverageModel::name() const { return "weighted_average"; }

TrustMap WeightedAverageModel::propagate(const TrustGraph& graph,
                                         const std::string& source) const {
    return firstVisitPropagate(graph, source, [](const TrustEdge& e) {
        return e.trust_weight;
    });
}

// ─── Minimum Trust ─────────────────────────────────────────────

std::string MinimumTrustModel::name() const { return "minimum_trust"; }

TrustMap MinimumTrustModel::propagate(const TrustGraph& graph,
                                      const std::string& source) const {
    TrustMap scores;
    std::deque<std::pair<std::string, double>> queue;

    scores[source] = 1.0;
    queue.emplace_back(source, 1.0);

    while (!queue.empty()) {
        auto [current, trust] = queue.front();
        queue.pop_front();

        // Superseded by a lower value queued later
        if (trust > scores[current]) continue;

        for (const TrustEdge* edge : graph.outgoingEdges(current)) {
            double propagated = std::min(trust, edge->trust_weight);
            auto it = scores.find(edge->to);
            if (it == scores.end() || propagated < it->second) {
                scores[edge->to] = propagated;
                queue.emplace_back(edge->to, propagated);
            }
        }
    }
    return scores;
}

// ─── Bayesian ──────────────────────────────────────────────────

BayesianPropagationModel::BayesianPropagationModel(
    std::unordered_map<std::string, double> conditional_probabilities)
    : conditional_probabilities_(std::move(conditional_probabilities)) {}

std::string BayesianPropagationModel::name() const { return "bayesian"; }

TrustMap BayesianPropagationModel::propagate(const TrustGraph& graph,
                                             const std::string& source) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return firstVisitPropagate(graph, source, [this](const TrustEdge& e) {
        auto it = conditional_probabilities_.find(e.key());
        double p = it != conditional_probabilities_.end()
                       ? it->second : DEFAULT_CONDITIONAL_PROBABILITY;
        return e.trust_weight * p;
    });
}

void BayesianPropagationModel::setConditionalProbability(const std::string& from,
                                                         const std::string& to, double p) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    conditional_probabilities_[edgeKey(from, to)] = p;
}

double BayesianPropagationModel::conditionalProbability(const std::string& from,
                                                        const std::string& to) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = conditional_probabilities_.find(edgeKey(from, to));
    return it != conditional_probabilities_.end() ? it->second : DEFAULT_CONDITIONAL_PROBABILITY;
}

} // namespace trustnet
