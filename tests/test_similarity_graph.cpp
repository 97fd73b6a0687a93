#include "HelixExceptions.h"
#include "SimilarityGraph.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>

#include <algorithm>

using HelixTest::LookupEmbedder;

// ===== Construction =====

TEST(SimilarityGraphTest, ConnectsOnlyPairsAboveThreshold) {
    const auto embedder = HelixTest::clusterEmbedder();
    const SimilarityGraph graph = SimilarityGraph::build(HelixTest::clusterCorpus(), *embedder, 0.3);

    EXPECT_EQ(graph.nodeCount(), 5u);
    // Three pairs inside cluster A and one inside cluster B.
    EXPECT_EQ(graph.edgeCount(), 4u);
    for (const auto& edge : graph.edges()) {
        EXPECT_GE(edge.weight, 0.3);
        EXPECT_EQ(graph.nodes()[edge.source].id[0], graph.nodes()[edge.target].id[0]);
    }
}

TEST(SimilarityGraphTest, ThresholdIsInclusive) {
    std::vector<GraphNode> nodes = {
        {"x", "", Tensor::fromVector({1.0, 0.0})},
        {"y", "", Tensor::fromVector({1.0, 0.0})},
    };
    const double same = nodes[0].embedding.cosine(nodes[1].embedding);
    const SimilarityGraph graph = SimilarityGraph::fromNodes(nodes, same);
    EXPECT_EQ(graph.edgeCount(), 1u);
}

TEST(SimilarityGraphTest, RejectsGeneratorWithWrongWidth) {
    LookupEmbedder lying(4, {{"P", {1.0, 2.0}}});
    const std::vector<Entity> entities = {{"p", "P", {}}};
    EXPECT_THROW(SimilarityGraph::build(entities, lying), Helix::ShapeMismatchException);
}

TEST(SimilarityGraphTest, EmptyCorpusYieldsEmptyGraph) {
    const auto embedder = HelixTest::clusterEmbedder();
    const SimilarityGraph graph = SimilarityGraph::build({}, *embedder);
    EXPECT_EQ(graph.nodeCount(), 0u);
    EXPECT_EQ(graph.edgeCount(), 0u);
}

// ===== Lookup =====

TEST(SimilarityGraphTest, IndexLookup) {
    const auto embedder = HelixTest::clusterEmbedder();
    const SimilarityGraph graph = SimilarityGraph::build(HelixTest::clusterCorpus(), *embedder);

    ASSERT_TRUE(graph.indexOf("b2").has_value());
    EXPECT_EQ(*graph.indexOf("b2"), 4u);
    EXPECT_FALSE(graph.indexOf("zz").has_value());
    EXPECT_THROW(graph.requireIndex("zz"), Helix::IndexNotFoundException);
    EXPECT_THROW(graph.neighborsOf(99), Helix::IndexNotFoundException);
}

TEST(SimilarityGraphTest, NeighborsOfReturnsAlignedEmbeddingsAndWeights) {
    const auto embedder = HelixTest::clusterEmbedder();
    const SimilarityGraph graph = SimilarityGraph::build(HelixTest::clusterCorpus(), *embedder);

    const Neighborhood hood = graph.neighborsOf(graph.requireIndex("a1"));
    ASSERT_EQ(hood.indices.size(), 2u);
    ASSERT_EQ(hood.weights.size(), 2u);
    ASSERT_EQ(hood.embeddings.size(), 2u);
    for (size_t i = 0; i < hood.indices.size(); ++i) {
        const auto& node = graph.nodes()[hood.indices[i]];
        EXPECT_TRUE(node.id == "a2" || node.id == "a3");
        EXPECT_NEAR(hood.weights[i], graph.nodes()[0].embedding.cosine(node.embedding), 1e-12);
    }
}

TEST(SimilarityGraphTest, NeighborsForOutOfGraphEmbedding) {
    const auto embedder = HelixTest::clusterEmbedder();
    const SimilarityGraph graph = SimilarityGraph::build(HelixTest::clusterCorpus(), *embedder);

    const Neighborhood hood = graph.neighborsFor(embedder->embed("QA"));
    EXPECT_EQ(hood.indices.size(), 3u);

    const Neighborhood excluding = graph.neighborsFor(embedder->embed("A1"), graph.requireIndex("a1"));
    EXPECT_EQ(excluding.indices.size(), 2u);
    EXPECT_EQ(std::count(excluding.indices.begin(), excluding.indices.end(), graph.requireIndex("a1")), 0);
}
