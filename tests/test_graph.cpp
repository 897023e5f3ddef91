#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "graph/shared_graph.hpp"

#include <thread>
#include <vector>

using namespace trustnet;

// ─── Node/Edge CRUD ────────────────────────────────────────────

TEST(GraphTest, AddAndGetNode) {
    TrustGraph g;
    g.addNode(TrustNode("api", 0.9, ComponentType::API));
    ASSERT_EQ(g.nodeCount(), 1u);
    const TrustNode* n = g.getNode("api");
    ASSERT_NE(n, nullptr);
    EXPECT_DOUBLE_EQ(n->trust_score, 0.9);
    EXPECT_EQ(n->component_type, ComponentType::API);
}

TEST(GraphTest, AddNodeIsUpsert) {
    TrustGraph g;
    g.addNode(TrustNode("db", 0.9));
    g.addNode(TrustNode("db", 0.4));
    ASSERT_EQ(g.nodeCount(), 1u);
    EXPECT_DOUBLE_EQ(g.getNode("db")->trust_score, 0.4);
}

TEST(GraphTest, NodeMetadata) {
    TrustNode n("cache", 1.0, ComponentType::Cache);
    n.setMetadata("region", "eu-west");
    EXPECT_EQ(n.getMetadata("region"), "eu-west");
    EXPECT_EQ(n.getMetadata("zone", "none"), "none");
}

TEST(GraphTest, AddEdgeUpdatesSuccessors) {
    TrustGraph g;
    g.addNode(TrustNode("a", 1.0));
    g.addNode(TrustNode("b", 1.0));
    g.addNode(TrustNode("c", 1.0));
    g.addEdge(TrustEdge("a", "b", 0.5));
    g.addEdge(TrustEdge("a", "c", 0.7, RelationshipType::DataFlow));

    ASSERT_EQ(g.edgeCount(), 2u);
    const auto& succ = g.successors("a");
    ASSERT_EQ(succ.size(), 2u);
    EXPECT_EQ(succ[0], "b");
    EXPECT_EQ(succ[1], "c");
    EXPECT_EQ(g.getEdge("a", "c")->relationship_type, RelationshipType::DataFlow);
}

TEST(GraphTest, ReplacingEdgeKeepsSingleIndexEntry) {
    TrustGraph g;
    g.addEdge(TrustEdge("a", "b", 0.5));
    g.addEdge(TrustEdge("a", "b", 0.8));
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_EQ(g.successors("a").size(), 1u);
    EXPECT_DOUBLE_EQ(g.getEdge("a", "b")->trust_weight, 0.8);
}

TEST(GraphTest, RemoveEdgeUpdatesIndex) {
    TrustGraph g;
    g.addEdge(TrustEdge("a", "b", 0.5));
    g.addEdge(TrustEdge("a", "c", 0.5));
    ASSERT_TRUE(g.removeEdge("a", "b"));
    EXPECT_EQ(g.edgeCount(), 1u);
    ASSERT_EQ(g.successors("a").size(), 1u);
    EXPECT_EQ(g.successors("a")[0], "c");
    EXPECT_FALSE(g.removeEdge("a", "b"));
}

TEST(GraphTest, RemoveNodeRemovesTouchingEdges) {
    TrustGraph g;
    g.addNode(TrustNode("a", 1.0));
    g.addNode(TrustNode("b", 1.0));
    g.addNode(TrustNode("c", 1.0));
    g.addEdge(TrustEdge("a", "b", 0.5));
    g.addEdge(TrustEdge("b", "c", 0.5));
    g.addEdge(TrustEdge("c", "a", 0.5));

    ASSERT_TRUE(g.removeNode("b"));
    EXPECT_EQ(g.nodeCount(), 2u);
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_TRUE(g.successors("a").empty());
    EXPECT_TRUE(g.successors("b").empty());
    EXPECT_NE(g.getEdge("c", "a"), nullptr);
    EXPECT_FALSE(g.removeNode("b"));
}

TEST(GraphTest, DanglingEdgesAreTolerated) {
    TrustGraph g;
    g.addNode(TrustNode("a", 1.0));
    g.addEdge(TrustEdge("a", "ghost", 0.5));
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_EQ(g.getNode("ghost"), nullptr);
    EXPECT_EQ(g.outgoingEdges("a").size(), 1u);
}

TEST(GraphTest, UpdateTrustScore) {
    TrustGraph g;
    g.addNode(TrustNode("a", 1.0));
    Timestamp at = now();
    EXPECT_TRUE(g.updateTrustScore("a", 0.3, at));
    EXPECT_DOUBLE_EQ(g.getNode("a")->trust_score, 0.3);
    EXPECT_EQ(g.getNode("a")->last_updated, at);
    EXPECT_FALSE(g.updateTrustScore("missing", 0.3, at));
}

TEST(GraphTest, PredecessorsAndNodeIds) {
    TrustGraph g;
    g.addNode(TrustNode("c", 1.0));
    g.addNode(TrustNode("a", 1.0));
    g.addNode(TrustNode("b", 1.0));
    g.addEdge(TrustEdge("b", "c", 1.0));
    g.addEdge(TrustEdge("a", "c", 1.0));

    auto preds = g.predecessors("c");
    ASSERT_EQ(preds.size(), 2u);
    EXPECT_EQ(preds[0], "a");
    EXPECT_EQ(preds[1], "b");

    auto ids = g.getNodeIds();
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(GraphTest, CloneIsIndependent) {
    TrustGraph g;
    g.addNode(TrustNode("a", 1.0));
    g.addEdge(TrustEdge("a", "b", 0.5));

    TrustGraph copy = g.clone();
    copy.addNode(TrustNode("z", 0.1));
    copy.removeEdge("a", "b");

    EXPECT_EQ(g.nodeCount(), 1u);
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_EQ(copy.nodeCount(), 2u);
    EXPECT_EQ(copy.edgeCount(), 0u);
}

TEST(GraphTest, EdgeKey) {
    EXPECT_EQ(edgeKey("a", "b"), "a->b");
    EXPECT_EQ(TrustEdge("x", "y", 1.0).key(), "x->y");
    EXPECT_EQ(TrustEdge("x", "y", 1.0).id(), EdgeId("x", "y"));
}

TEST(GraphTest, ArrowInIdsDoesNotMergeEdges) {
    TrustGraph g;
    g.addEdge(TrustEdge("a->b", "c", 0.4));
    g.addEdge(TrustEdge("a", "b->c", 0.6));

    EXPECT_EQ(g.edgeCount(), 2u);
    EXPECT_EQ(g.successors("a->b"), (std::vector<std::string>{"c"}));
    EXPECT_EQ(g.successors("a"), (std::vector<std::string>{"b->c"}));

    auto out = g.outgoingEdges("a->b");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]->from, "a->b");
    EXPECT_DOUBLE_EQ(out[0]->trust_weight, 0.4);
    EXPECT_DOUBLE_EQ(g.getEdge("a", "b->c")->trust_weight, 0.6);

    EXPECT_TRUE(g.removeEdge("a", "b->c"));
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_TRUE(g.successors("a").empty());
    EXPECT_NE(g.getEdge("a->b", "c"), nullptr);
}

// ─── SharedTrustGraph ──────────────────────────────────────────

TEST(SharedGraphTest, SnapshotDoesNotSeeLaterWrites) {
    SharedTrustGraph g;
    g.addNode(TrustNode("a", 0.5));
    TrustGraph snap = g.snapshot();
    g.addNode(TrustNode("b", 0.5));

    EXPECT_EQ(snap.nodeCount(), 1u);
    EXPECT_EQ(g.nodeCount(), 2u);
}

TEST(SharedGraphTest, TrustScoresAndLookup) {
    SharedTrustGraph g;
    g.addNode(TrustNode("a", 0.5));
    g.addNode(TrustNode("b", 0.7));
    EXPECT_TRUE(g.updateTrustScore("a", 0.2, now()));

    auto scores = g.trustScores();
    EXPECT_DOUBLE_EQ(scores.at("a"), 0.2);
    EXPECT_DOUBLE_EQ(scores.at("b"), 0.7);
    ASSERT_TRUE(g.node("b").has_value());
    EXPECT_FALSE(g.node("c").has_value());
}

TEST(SharedGraphTest, ConcurrentWritersAndReaders) {
    SharedTrustGraph g;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&g, t]() {
            for (int i = 0; i < 100; i++) {
                std::string id = "n" + std::to_string(t) + "_" + std::to_string(i);
                g.addNode(TrustNode(id, 1.0));
                if (i > 0) {
                    g.addEdge(TrustEdge("n" + std::to_string(t) + "_" + std::to_string(i - 1), id, 0.9));
                }
                g.read([](const TrustGraph& view) { return view.edgeCount(); });
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(g.nodeCount(), 400u);
    EXPECT_EQ(g.edgeCount(), 396u);
}
