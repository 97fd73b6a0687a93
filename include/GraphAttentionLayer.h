#pragma once

#include "Tensor.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

struct LayerOutput {
    Tensor output;
    Tensor attention;
};

/**
 * @brief Attention aggregation over neighbors fused into the node by a
 * single gated-recurrent step, followed by dropout and layer norm.
 *
 * Query comes from the center node (inputDim); keys and values come from the
 * neighbor embeddings (neighborDim). The gate matrices are [2*outputDim, outputDim]:
 * rows [0, outputDim) multiply the aggregated message, rows [outputDim, 2*outputDim)
 * multiply the hidden state (the projected query).
 */
class GraphAttentionLayer {
public:
    enum Param : size_t { WQ = 0, WK, WV, WO, WZ, WR, WH, GAMMA, BETA };
    static constexpr size_t kParameterCount = 9;
    static const std::array<const char*, kParameterCount> kParameterNames;

    GraphAttentionLayer() = default;
    GraphAttentionLayer(size_t inputDim,
                        size_t neighborDim,
                        size_t outputDim,
                        double dropoutRate,
                        double temperature,
                        std::mt19937& rng);

    size_t inputDim() const noexcept { return m_inputDim; }
    size_t neighborDim() const noexcept { return m_neighborDim; }
    size_t outputDim() const noexcept { return m_outputDim; }
    double dropoutRate() const noexcept { return m_dropoutRate; }
    double temperature() const noexcept { return m_temperature; }

    /**
     * @brief Runs the layer and caches every intermediate for backward().
     * @pre neighbors is non-empty; the caller substitutes the node itself when the graph has none.
     * @param edgeWeights optional, one per neighbor; zero entries leave the score unscaled.
     * @throws Helix::ShapeMismatchException on any dimension disagreement.
     */
    LayerOutput forward(const Tensor& node,
                        const std::vector<Tensor>& neighbors,
                        const std::vector<double>* edgeWeights,
                        bool isTraining,
                        uint32_t seedState,
                        uint64_t forwardCounter);

    /**
     * @brief Backpropagates through the most recent forward().
     *
     * Parameter gradients are accumulated into grads[offset .. offset + kParameterCount).
     * @return Gradient with respect to the center node input.
     */
    Tensor backward(const Tensor& gradOutput, std::vector<Tensor>& grads, size_t offset) const;

    std::array<Tensor*, kParameterCount> parameters() noexcept;
    std::array<const Tensor*, kParameterCount> parameters() const noexcept;

private:
    struct ForwardCache {
        Tensor input;
        std::vector<Tensor> neighbors;
        std::vector<double> scoreScale;
        Tensor query;
        std::vector<Tensor> keys;
        std::vector<Tensor> values;
        std::vector<double> cosines;
        Tensor attention;
        Tensor message;
        Tensor update;
        Tensor reset;
        Tensor candidate;
        Tensor fused;
        std::vector<double> dropoutScale;
        Tensor normalized;
        double invStd = 1.0;
        bool valid = false;
    };

    size_t m_inputDim = 0;
    size_t m_neighborDim = 0;
    size_t m_outputDim = 0;
    double m_dropoutRate = 0.0;
    double m_temperature = 0.07;

    Tensor m_wq;
    Tensor m_wk;
    Tensor m_wv;
    Tensor m_wo;
    Tensor m_wz;
    Tensor m_wr;
    Tensor m_wh;
    Tensor m_gamma;
    Tensor m_beta;

    ForwardCache m_cache;
};
