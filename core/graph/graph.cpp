#include "graph/graph.hpp"

#include <algorithm>

namespace trustnet {

const char* componentTypeName(ComponentType type) {
    switch (type) {
        case ComponentType::Microservice:    return "microservice";
        case ComponentType::Database:        return "database";
        case ComponentType::API:             return "api";
        case ComponentType::LoadBalancer:    return "load_balancer";
        case ComponentType::MessageQueue:    return "message_queue";
        case ComponentType::Cache:           return "cache";
        case ComponentType::ExternalService: return "external_service";
        case ComponentType::LegacySystem:    return "legacy_system";
        case ComponentType::EdgeDevice:      return "edge_device";
        case ComponentType::Container:       return "container";
    }
    return "unknown";
}

const char* relationshipTypeName(RelationshipType type) {
    switch (type) {
        case RelationshipType::DataFlow:      return "data_flow";
        case RelationshipType::Dependency:    return "dependency";
        case RelationshipType::Communication: return "communication";
        case RelationshipType::Control:       return "control";
        case RelationshipType::Monitoring:    return "monitoring";
        case RelationshipType::Backup:        return "backup";
        case RelationshipType::LoadBalancing: return "load_balancing";
    }
    return "unknown";
}

// ─── Node operations ───────────────────────────────────────────

void TrustGraph::addNode(TrustNode node) {
    std::string id = node.id;
    nodes_[id] = std::move(node);
}

bool TrustGraph::removeNode(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    // Remove all edges touching the node, both directions
    std::vector<std::pair<std::string, std::string>> edges_to_remove;
    for (const auto& [_, edge] : edges_) {
        if (edge.from == id || edge.to == id) {
            edges_to_remove.emplace_back(edge.from, edge.to);
        }
    }
    for (const auto& [from, to] : edges_to_remove) {
        removeEdge(from, to);
    }

    nodes_.erase(it);
    return true;
}

TrustNode* TrustGraph::getNode(const std::string& id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const TrustNode* TrustGraph::getNode(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<std::string> TrustGraph::getNodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool TrustGraph::updateTrustScore(const std::string& id, double score, Timestamp at) {
    TrustNode* node = getNode(id);
    if (!node) return false;
    node->trust_score = score;
    node->last_updated = at;
    return true;
}

// ─── Edge operations ───────────────────────────────────────────

void TrustGraph::addEdge(TrustEdge edge) {
    EdgeId key = edge.id();
    bool existed = edges_.count(key) > 0;
    std::string from = edge.from;
    std::string to = edge.to;
    edges_[key] = std::move(edge);

    // A replaced edge already has its index entry
    if (!existed) {
        dependencies_[from].push_back(to);
    }
}

bool TrustGraph::removeEdge(const std::string& from, const std::string& to) {
    auto it = edges_.find(EdgeId(from, to));
    if (it == edges_.end()) return false;
    edges_.erase(it);

    auto dit = dependencies_.find(from);
    if (dit != dependencies_.end()) {
        auto& succ = dit->second;
        succ.erase(std::remove(succ.begin(), succ.end(), to), succ.end());
        if (succ.empty()) dependencies_.erase(dit);
    }
    return true;
}

TrustEdge* TrustGraph::getEdge(const std::string& from, const std::string& to) {
    auto it = edges_.find(EdgeId(from, to));
    return it != edges_.end() ? &it->second : nullptr;
}

const TrustEdge* TrustGraph::getEdge(const std::string& from, const std::string& to) const {
    auto it = edges_.find(EdgeId(from, to));
    return it != edges_.end() ? &it->second : nullptr;
}

// ─── Adjacency queries ────────────────────────────────────────

const std::vector<std::string>& TrustGraph::successors(const std::string& id) const {
    static const std::vector<std::string> kEmpty;
    auto it = dependencies_.find(id);
    return it != dependencies_.end() ? it->second : kEmpty;
}

std::vector<const TrustEdge*> TrustGraph::outgoingEdges(const std::string& id) const {
    std::vector<const TrustEdge*> out;
    for (const auto& to : successors(id)) {
        const TrustEdge* e = getEdge(id, to);
        if (e) out.push_back(e);
    }
    return out;
}

std::vector<std::string> TrustGraph::predecessors(const std::string& id) const {
    std::vector<std::string> preds;
    for (const auto& [_, edge] : edges_) {
        if (edge.to == id) preds.push_back(edge.from);
    }
    std::sort(preds.begin(), preds.end());
    return preds;
}

// ─── Cloning ───────────────────────────────────────────────────

TrustGraph TrustGraph::clone() const {
    TrustGraph copy;
    copy.nodes_ = nodes_;
    copy.edges_ = edges_;
    copy.dependencies_ = dependencies_;
    return copy;
}

// ─── Iteration ─────────────────────────────────────────────────

void TrustGraph::forEachNode(const std::function<void(const TrustNode&)>& fn) const {
    for (const auto& [_, node] : nodes_) {
        fn(node);
    }
}

void TrustGraph::forEachEdge(const std::function<void(const TrustEdge&)>& fn) const {
    for (const auto& [_, edge] : edges_) {
        fn(edge);
    }
}

} // namespace trustnet
