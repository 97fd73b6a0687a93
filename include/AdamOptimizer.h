#pragma once

#include "GraphNetwork.h"
#include "Tensor.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

struct AdamConfig {
    double learningRate = 0.001;
    double beta1 = 0.9;
    double beta2 = 0.999;
    double epsilon = 1e-8;
};

/**
 * @brief Adam with bias correction. Moment buffers are keyed by parameter
 * name, so the same optimizer can serve any network exposing stable names.
 */
class AdamOptimizer {
public:
    AdamOptimizer() = default;
    explicit AdamOptimizer(const AdamConfig& config) : m_config(config) {}

    double learningRate() const noexcept { return m_config.learningRate; }
    void setLearningRate(double lr) noexcept { m_config.learningRate = lr; }
    size_t stepCount() const noexcept { return m_step; }
    const AdamConfig& config() const noexcept { return m_config; }

    /// @throws Helix::ShapeMismatchException when grads does not align with params.
    void step(const std::vector<ParameterRef>& params, const std::vector<Tensor>& grads);

    void reset();

private:
    struct Moments {
        std::vector<double> m;
        std::vector<double> v;
    };

    AdamConfig m_config;
    std::unordered_map<std::string, Moments> m_moments;
    size_t m_step = 0;
};
