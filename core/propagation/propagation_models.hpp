#pragma once

#include "propagation/propagation_model.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace trustnet {

// Breadth-first, first visit wins: trust(target) = trust(current) × weight.
// A node's value is fixed when it is first reached; later paths to it are
// not reconsidered. Exact for tree-shaped subgraphs only.
class WeightedAverageModel : public PropagationModel {
public:
    std::string name() const override;
    TrustMap propagate(const TrustGraph& graph, const std::string& source) const override;
};

// Pessimistic: trust(target) = min(trust(current), weight). A node is
// re-queued whenever a strictly lower value reaches it, the source
// included when a back-edge leads to it.
class MinimumTrustModel : public PropagationModel {
public:
    std::string name() const override;
    TrustMap propagate(const TrustGraph& graph, const std::string& source) const override;
};

// Weighted-average traversal with an extra conditional-probability factor
// per edge, looked up by "from->to" (default 0.5).
class BayesianPropagationModel : public PropagationModel {
public:
    static constexpr double DEFAULT_CONDITIONAL_PROBABILITY = 0.5;

    BayesianPropagationModel() = default;
    explicit BayesianPropagationModel(std::unordered_map<std::string, double> conditional_probabilities);

    std::string name() const override;
    TrustMap propagate(const TrustGraph& graph, const std::string& source) const override;

    void setConditionalProbability(const std::string& from, const std::string& to, double p);
    double conditionalProbability(const std::string& from, const std::string& to) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, double> conditional_probabilities_;
};

} // namespace trustnet
