#include "ElasticWeightConsolidation.h"

#include "HelixExceptions.h"

void ElasticWeightConsolidation::requireAligned(const std::vector<ParameterRef>& params) const {
    if (params.size() != m_anchor.size()) {
        throw Helix::ShapeMismatchException("EWC holds " + std::to_string(m_anchor.size()) + " anchors for " +
                                            std::to_string(params.size()) + " parameters");
    }
    for (size_t i = 0; i < params.size(); ++i) {
        if (params[i].tensor->size() != m_anchor[i].size()) {
            throw Helix::ShapeMismatchException("EWC anchor for " + params[i].name + " does not match its parameter");
        }
    }
}

double ElasticWeightConsolidation::penalty(const std::vector<ParameterRef>& params) const {
    if (m_taskCount == 0) return 0.0;
    requireAligned(params);

    double total = 0.0;
    for (size_t i = 0; i < params.size(); ++i) {
        const auto& theta = params[i].tensor->data();
        const auto& star = m_anchor[i].data();
        const auto& f = m_fisher[i].data();
        for (size_t k = 0; k < theta.size(); ++k) {
            const double d = theta[k] - star[k];
            total += f[k] * d * d;
        }
    }
    return 0.5 * m_lambda * total;
}

std::vector<Tensor> ElasticWeightConsolidation::penaltyGradient(const std::vector<ParameterRef>& params) const {
    std::vector<Tensor> grads;
    grads.reserve(params.size());
    for (const auto& p : params) grads.push_back(Tensor::zeros(p.tensor->shape()));
    if (m_taskCount == 0) return grads;
    requireAligned(params);

    for (size_t i = 0; i < params.size(); ++i) {
        const auto& theta = params[i].tensor->data();
        const auto& star = m_anchor[i].data();
        const auto& f = m_fisher[i].data();
        auto& g = grads[i].data();
        for (size_t k = 0; k < theta.size(); ++k) g[k] = m_lambda * f[k] * (theta[k] - star[k]);
    }
    return grads;
}

void ElasticWeightConsolidation::consolidate(GraphNetwork& network,
                                             const std::vector<TrainingSample>& batch,
                                             double temperature) {
    if (batch.empty()) return;

    std::vector<Tensor> fresh = network.zeroGradients();
    for (const auto& sample : batch) {
        std::vector<Tensor> grads = network.zeroGradients();
        network.accumulateSampleGradients(sample, temperature, grads);
        for (size_t i = 0; i < grads.size(); ++i) {
            auto& f = fresh[i].data();
            const auto& g = grads[i].data();
            for (size_t k = 0; k < g.size(); ++k) f[k] += g[k] * g[k];
        }
    }
    const double inv = 1.0 / static_cast<double>(batch.size());
    for (auto& f : fresh) {
        for (double& v : f.data()) v *= inv;
    }

    if (m_taskCount == 0 || m_fisher.size() != fresh.size()) {
        m_fisher = std::move(fresh);
    } else {
        const double tasks = static_cast<double>(m_taskCount);
        for (size_t i = 0; i < m_fisher.size(); ++i) {
            auto& f = m_fisher[i].data();
            const auto& nf = fresh[i].data();
            for (size_t k = 0; k < f.size(); ++k) f[k] = (f[k] * tasks + nf[k]) / (tasks + 1.0);
        }
    }

    m_anchor = network.snapshotParameters();
    ++m_taskCount;
}

void ElasticWeightConsolidation::reset() {
    m_fisher.clear();
    m_anchor.clear();
    m_taskCount = 0;
}
