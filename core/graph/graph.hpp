#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

// ─── TrustGraph ────────────────────────────────────────────────
// Components (nodes) and directed, weighted relationships (edges).
// Nodes are keyed by id, edges by (from, to). Both inserts are upserts.
//
// A dependency index (from → [to...], in insertion order) gives the
// successor lookup used by every traversal. It is kept consistent with
// the edge map on every insert and removal.
//
// Edges may reference unregistered nodes. Such edges still take part in
// traversal; callers treat results for unknown ids as "unknown trust".
//
// Not synchronized. See SharedTrustGraph for the guarded variant.

class TrustGraph {
public:
    TrustGraph() = default;

    // ── Node operations ──
    void addNode(TrustNode node);
    bool removeNode(const std::string& id);
    TrustNode* getNode(const std::string& id);
    const TrustNode* getNode(const std::string& id) const;
    bool hasNode(const std::string& id) const { return nodes_.count(id) > 0; }
    std::vector<std::string> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    /// Set a node's score and timestamp. False if the node is unknown.
    bool updateTrustScore(const std::string& id, double score, Timestamp at);

    // ── Edge operations ──
    void addEdge(TrustEdge edge);
    bool removeEdge(const std::string& from, const std::string& to);
    TrustEdge* getEdge(const std::string& from, const std::string& to);
    const TrustEdge* getEdge(const std::string& from, const std::string& to) const;
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──
    /// Successor ids in edge insertion order. Empty for unknown ids.
    const std::vector<std::string>& successors(const std::string& id) const;

    /// Outgoing edges in successor order.
    std::vector<const TrustEdge*> outgoingEdges(const std::string& id) const;

    /// Ids of nodes with an edge into id.
    std::vector<std::string> predecessors(const std::string& id) const;

    // ── Cloning ──
    TrustGraph clone() const;

    // ── Iteration ──
    void forEachNode(const std::function<void(const TrustNode&)>& fn) const;
    void forEachEdge(const std::function<void(const TrustEdge&)>& fn) const;

private:
    std::unordered_map<std::string, TrustNode> nodes_;
    std::map<EdgeId, TrustEdge> edges_;

    // Dependency index: from → successors, insertion order
    std::unordered_map<std::string, std::vector<std::string>> dependencies_;
};

} // namespace trustnet
