#pragma once

#include "EmbeddingGenerator.h"
#include "Tensor.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct GraphNode {
    std::string id;
    std::string payload;
    Tensor embedding;
};

struct GraphEdge {
    size_t source = 0;
    size_t target = 0;
    double weight = 0.0;
};

struct Neighborhood {
    std::vector<Tensor> embeddings;
    std::vector<double> weights;
    std::vector<size_t> indices;

    bool empty() const noexcept { return embeddings.empty(); }
};

/**
 * @brief Undirected cosine-similarity graph over raw entity embeddings.
 *
 * Built once and never mutated, so one snapshot can back a whole training
 * invocation. Construction compares every pair of nodes (O(n^2) time and
 * embedding calls linear in n); this is intended for small corpora.
 */
class SimilarityGraph {
public:
    static constexpr double kDefaultThreshold = 0.3;

    SimilarityGraph() = default;

    static SimilarityGraph build(const std::vector<Entity>& entities,
                                 const EmbeddingGenerator& generator,
                                 double threshold = kDefaultThreshold);
    static SimilarityGraph fromNodes(std::vector<GraphNode> nodes, double threshold = kDefaultThreshold);

    const std::vector<GraphNode>& nodes() const noexcept { return m_nodes; }
    const std::vector<GraphEdge>& edges() const noexcept { return m_edges; }
    size_t nodeCount() const noexcept { return m_nodes.size(); }
    size_t edgeCount() const noexcept { return m_edges.size(); }
    double threshold() const noexcept { return m_threshold; }

    std::optional<size_t> indexOf(const std::string& id) const;
    /// Throws Helix::IndexNotFoundException for unknown ids.
    size_t requireIndex(const std::string& id) const;

    Neighborhood neighborsOf(size_t index) const;
    /// Neighborhood of an embedding that is not (necessarily) part of the graph.
    Neighborhood neighborsFor(const Tensor& embedding, std::optional<size_t> excludeIndex = std::nullopt) const;

private:
    std::vector<GraphNode> m_nodes;
    std::vector<GraphEdge> m_edges;
    std::vector<std::vector<size_t>> m_adjacency; // edge indices per node
    std::unordered_map<std::string, size_t> m_index;
    double m_threshold = kDefaultThreshold;
};
