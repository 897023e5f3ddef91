#include "graph/shared_graph.hpp"

namespace trustnet {

void SharedTrustGraph::addNode(TrustNode node) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    graph_.addNode(std::move(node));
}

void SharedTrustGraph::addEdge(TrustEdge edge) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    graph_.addEdge(std::move(edge));
}

bool SharedTrustGraph::removeNode(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return graph_.removeNode(id);
}

bool SharedTrustGraph::removeEdge(const std::string& from, const std::string& to) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return graph_.removeEdge(from, to);
}

bool SharedTrustGraph::updateTrustScore(const std::string& id, double score, Timestamp at) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return graph_.updateTrustScore(id, score, at);
}

TrustGraph SharedTrustGraph::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.clone();
}

std::optional<TrustNode> SharedTrustGraph::node(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const TrustNode* n = graph_.getNode(id);
    if (!n) return std::nullopt;
    return *n;
}

std::unordered_map<std::string, double> SharedTrustGraph::trustScores() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::unordered_map<std::string, double> scores;
    graph_.forEachNode([&](const TrustNode& n) {
        scores[n.id] = n.trust_score;
    });
    return scores;
}

std::vector<std::string> SharedTrustGraph::nodeIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.getNodeIds();
}

size_t SharedTrustGraph::nodeCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.nodeCount();
}

size_t SharedTrustGraph::edgeCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.edgeCount();
}

} // namespace trustnet
