#include "AdamOptimizer.h"

#include "HelixExceptions.h"

#include <cmath>

void AdamOptimizer::step(const std::vector<ParameterRef>& params, const std::vector<Tensor>& grads) {
    if (params.size() != grads.size()) {
        throw Helix::ShapeMismatchException(std::to_string(grads.size()) + " gradients for " +
                                            std::to_string(params.size()) + " parameters");
    }
    for (size_t i = 0; i < params.size(); ++i) {
        if (!params[i].tensor || params[i].tensor->size() != grads[i].size()) {
            throw Helix::ShapeMismatchException("gradient for " + params[i].name + " does not match its parameter");
        }
    }

    ++m_step;
    const double b1 = m_config.beta1;
    const double b2 = m_config.beta2;
    const double biasCorr1 = 1.0 - std::pow(b1, static_cast<double>(m_step));
    const double biasCorr2 = 1.0 - std::pow(b2, static_cast<double>(m_step));

    for (size_t i = 0; i < params.size(); ++i) {
        std::vector<double>& theta = params[i].tensor->data();
        const std::vector<double>& g = grads[i].data();

        Moments& mom = m_moments[params[i].name];
        if (mom.m.size() != theta.size()) {
            mom.m.assign(theta.size(), 0.0);
            mom.v.assign(theta.size(), 0.0);
        }

        for (size_t k = 0; k < theta.size(); ++k) {
            mom.m[k] = b1 * mom.m[k] + (1.0 - b1) * g[k];
            mom.v[k] = b2 * mom.v[k] + (1.0 - b2) * g[k] * g[k];
            const double mHat = mom.m[k] / biasCorr1;
            const double vHat = mom.v[k] / biasCorr2;
            theta[k] -= m_config.learningRate * mHat / (std::sqrt(vHat) + m_config.epsilon);
        }
    }
}

void AdamOptimizer::reset() {
    m_moments.clear();
    m_step = 0;
}
