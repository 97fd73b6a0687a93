#pragma once

#include "GraphAttentionLayer.h"
#include "Tensor.h"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>

struct NetworkConfig {
    size_t inputDim = 256;
    size_t hiddenDim = 512;
    size_t outputDim = 256;
    size_t numLayers = 3;
    double dropout = 0.1;
    double temperature = 0.07;
    uint32_t seed = 1337;
};

struct NetworkOutput {
    Tensor embedding;
    std::vector<Tensor> attention; // one per layer
};

struct ParameterRef {
    std::string name;
    Tensor* tensor = nullptr;
};

/// Anchor with its contrastive sets and the neighborhood it is refined with.
struct TrainingSample {
    Tensor anchor;
    std::vector<Tensor> positives;
    std::vector<Tensor> negatives;
    std::vector<Tensor> neighbors;
    std::vector<double> neighborWeights;
};

struct GradientResult {
    double loss = 0.0;
    std::vector<Tensor> gradients; // aligned with GraphNetwork::parameters()
};

/**
 * @brief Stack of graph attention layers with shallow aggregation.
 *
 * Every layer refines the previous layer's output as the center node, but all
 * layers attend over the same original neighbor embeddings.
 */
class GraphNetwork {
public:
    GraphNetwork() = default;
    explicit GraphNetwork(const NetworkConfig& config);

    const NetworkConfig& config() const noexcept { return m_config; }
    size_t layerCount() const noexcept { return m_layers.size(); }
    const GraphAttentionLayer& layer(size_t index) const { return m_layers.at(index); }

    bool isTrained() const noexcept { return m_trained; }
    void setTrained(bool trained) noexcept { m_trained = trained; }

    /// An empty neighbor list is replaced by the node itself.
    NetworkOutput forward(const Tensor& node,
                          const std::vector<Tensor>& neighbors,
                          const std::vector<double>* edgeWeights,
                          bool isTraining);

    std::vector<ParameterRef> parameters();
    std::vector<Tensor> zeroGradients() const;
    std::vector<Tensor> snapshotParameters() const;
    size_t parameterElementCount() const;

    /// Training-mode forward, InfoNCE loss and backprop; gradients are accumulated into grads.
    double accumulateSampleGradients(const TrainingSample& sample, double temperature, std::vector<Tensor>& grads);

    /// Mean loss and mean parameter gradients over the batch.
    GradientResult computeGradients(const std::vector<TrainingSample>& batch, double temperature);

    void writeParameters(std::ostream& out) const;
    void readParameters(std::istream& in);
    std::vector<uint8_t> saveParameters() const;
    void loadParameters(const std::vector<uint8_t>& blob);
    void saveModelBinary(const std::string& filename) const;
    void loadModelBinary(const std::string& filename);

private:
    NetworkConfig m_config;
    std::vector<GraphAttentionLayer> m_layers;
    uint64_t m_forwardCounter = 0;
    bool m_trained = false;
};
