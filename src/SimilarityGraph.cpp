#include "SimilarityGraph.h"

#include "HelixExceptions.h"

#include <utility>

SimilarityGraph SimilarityGraph::build(const std::vector<Entity>& entities,
                                       const EmbeddingGenerator& generator,
                                       double threshold) {
    std::vector<GraphNode> nodes;
    nodes.reserve(entities.size());
    for (const auto& entity : entities) {
        Tensor embedding = generator.embed(entity.payload);
        if (embedding.size() != generator.dimension()) {
            throw Helix::ShapeMismatchException("generator returned " + std::to_string(embedding.size()) +
                                                " values for entity '" + entity.id + "', expected " +
                                                std::to_string(generator.dimension()));
        }
        nodes.push_back({entity.id, entity.payload, std::move(embedding)});
    }
    return fromNodes(std::move(nodes), threshold);
}

SimilarityGraph SimilarityGraph::fromNodes(std::vector<GraphNode> nodes, double threshold) {
    SimilarityGraph graph;
    graph.m_threshold = threshold;
    graph.m_nodes = std::move(nodes);
    graph.m_adjacency.assign(graph.m_nodes.size(), {});

    for (size_t i = 0; i < graph.m_nodes.size(); ++i) {
        // Duplicate ids resolve to the first occurrence.
        graph.m_index.emplace(graph.m_nodes[i].id, i);
    }

    for (size_t i = 0; i < graph.m_nodes.size(); ++i) {
        for (size_t j = i + 1; j < graph.m_nodes.size(); ++j) {
            const double similarity = graph.m_nodes[i].embedding.cosine(graph.m_nodes[j].embedding);
            if (similarity >= threshold) {
                graph.m_adjacency[i].push_back(graph.m_edges.size());
                graph.m_adjacency[j].push_back(graph.m_edges.size());
                graph.m_edges.push_back({i, j, similarity});
            }
        }
    }
    return graph;
}

std::optional<size_t> SimilarityGraph::indexOf(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) return std::nullopt;
    return it->second;
}

size_t SimilarityGraph::requireIndex(const std::string& id) const {
    auto idx = indexOf(id);
    if (!idx) throw Helix::IndexNotFoundException("no graph node with id '" + id + "'");
    return *idx;
}

Neighborhood SimilarityGraph::neighborsOf(size_t index) const {
    if (index >= m_nodes.size()) {
        throw Helix::IndexNotFoundException("node index " + std::to_string(index) + " out of range");
    }
    Neighborhood hood;
    for (size_t edgeIdx : m_adjacency[index]) {
        const GraphEdge& edge = m_edges[edgeIdx];
        const size_t other = edge.source == index ? edge.target : edge.source;
        hood.embeddings.push_back(m_nodes[other].embedding);
        hood.weights.push_back(edge.weight);
        hood.indices.push_back(other);
    }
    return hood;
}

Neighborhood SimilarityGraph::neighborsFor(const Tensor& embedding, std::optional<size_t> excludeIndex) const {
    Neighborhood hood;
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        if (excludeIndex && *excludeIndex == i) continue;
        const double similarity = embedding.cosine(m_nodes[i].embedding);
        if (similarity >= m_threshold) {
            hood.embeddings.push_back(m_nodes[i].embedding);
            hood.weights.push_back(similarity);
            hood.indices.push_back(i);
        }
    }
    return hood;
}
