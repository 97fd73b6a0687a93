#pragma once

#include "GraphNetwork.h"
#include "Tensor.h"

#include <cstddef>
#include <vector>

/**
 * @brief Quadratic penalty anchoring parameters that mattered to earlier tasks.
 *
 * penalty = lambda/2 * sum_i F_i * (theta_i - theta*_i)^2, zero until the
 * first consolidate(). The Fisher diagonal F is the mean squared per-sample
 * gradient, merged across consolidations as a task-count-weighted mean.
 */
class ElasticWeightConsolidation {
public:
    explicit ElasticWeightConsolidation(double lambda = 0.4) : m_lambda(lambda) {}

    double lambda() const noexcept { return m_lambda; }
    size_t taskCount() const noexcept { return m_taskCount; }
    bool isConsolidated() const noexcept { return m_taskCount > 0; }
    const std::vector<Tensor>& fisher() const noexcept { return m_fisher; }
    const std::vector<Tensor>& anchor() const noexcept { return m_anchor; }

    double penalty(const std::vector<ParameterRef>& params) const;
    /// lambda * F_i * (theta_i - theta*_i); zeros before consolidation.
    std::vector<Tensor> penaltyGradient(const std::vector<ParameterRef>& params) const;

    /// No-op on an empty batch.
    void consolidate(GraphNetwork& network, const std::vector<TrainingSample>& batch, double temperature);

    void reset();

private:
    void requireAligned(const std::vector<ParameterRef>& params) const;

    double m_lambda;
    std::vector<Tensor> m_fisher;
    std::vector<Tensor> m_anchor;
    size_t m_taskCount = 0;
};
