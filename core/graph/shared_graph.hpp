#pragma once

#include "graph/graph.hpp"

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trustnet {

// ─── SharedTrustGraph ──────────────────────────────────────────
// The process-wide trust graph behind a reader/writer lock.
// Mutations take the lock exclusively. read() holds the shared lock for
// the whole callback, so one traversal never observes a partial write.

class SharedTrustGraph {
public:
    SharedTrustGraph() = default;
    SharedTrustGraph(const SharedTrustGraph&) = delete;
    SharedTrustGraph& operator=(const SharedTrustGraph&) = delete;

    void addNode(TrustNode node);
    void addEdge(TrustEdge edge);
    bool removeNode(const std::string& id);
    bool removeEdge(const std::string& from, const std::string& to);
    bool updateTrustScore(const std::string& id, double score, Timestamp at);

    /// Read-only copy of the current state.
    TrustGraph snapshot() const;

    std::optional<TrustNode> node(const std::string& id) const;
    std::unordered_map<std::string, double> trustScores() const;
    std::vector<std::string> nodeIds() const;
    size_t nodeCount() const;
    size_t edgeCount() const;

    /// Run fn against the graph under the shared lock.
    template <typename Fn>
    auto read(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<const TrustGraph&>(graph_));
    }

    /// Run fn against the graph under the exclusive lock.
    template <typename Fn>
    auto write(Fn&& fn) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return std::forward<Fn>(fn)(graph_);
    }

private:
    mutable std::shared_mutex mutex_;
    TrustGraph graph_;
};

} // namespace trustnet
