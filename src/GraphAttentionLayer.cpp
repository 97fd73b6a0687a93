#include "GraphAttentionLayer.h"

#include "HelixExceptions.h"

#include <cmath>
#include <string>
#include <utility>

namespace {
constexpr double kLayerNormEps = 1e-5;
constexpr double kCosineEps = 1e-8;

uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

Tensor asVector(const Tensor& t) {
    return Tensor::fromVector(t.data());
}

Tensor concat(const Tensor& a, const Tensor& b) {
    std::vector<double> joined;
    joined.reserve(a.size() + b.size());
    joined.insert(joined.end(), a.data().begin(), a.data().end());
    joined.insert(joined.end(), b.data().begin(), b.data().end());
    return Tensor::fromVector(std::move(joined));
}

// grad[rowOffset + i][j] += x[i] * g[j]
void accumulateOuter(Tensor& grad, size_t rowOffset, const std::vector<double>& x, const std::vector<double>& g) {
    const size_t cols = g.size();
    double* base = grad.data().data();
    for (size_t i = 0; i < x.size(); ++i) {
        const double xi = x[i];
        if (xi == 0.0) continue;
        double* row = base + (rowOffset + i) * cols;
        for (size_t j = 0; j < cols; ++j) row[j] += xi * g[j];
    }
}

// out[i] += sum_j W[rowOffset + i][j] * g[j]
void addMatVec(std::vector<double>& out, const Tensor& weights, size_t rowOffset, const std::vector<double>& g) {
    const size_t cols = g.size();
    const double* base = weights.data().data();
    for (size_t i = 0; i < out.size(); ++i) {
        const double* row = base + (rowOffset + i) * cols;
        double acc = 0.0;
        for (size_t j = 0; j < cols; ++j) acc += row[j] * g[j];
        out[i] += acc;
    }
}
} // namespace

const std::array<const char*, GraphAttentionLayer::kParameterCount> GraphAttentionLayer::kParameterNames = {
    "Wq", "Wk", "Wv", "Wo", "Wz", "Wr", "Wh", "gamma", "beta"};

GraphAttentionLayer::GraphAttentionLayer(size_t inputDim,
                                         size_t neighborDim,
                                         size_t outputDim,
                                         double dropoutRate,
                                         double temperature,
                                         std::mt19937& rng)
    : m_inputDim(inputDim),
      m_neighborDim(neighborDim),
      m_outputDim(outputDim),
      m_dropoutRate(dropoutRate),
      m_temperature(temperature) {
    if (inputDim == 0 || neighborDim == 0 || outputDim == 0) {
        throw Helix::ShapeMismatchException("layer dimensions must be positive");
    }
    m_wq = Tensor::xavier({inputDim, outputDim}, rng);
    m_wk = Tensor::xavier({neighborDim, outputDim}, rng);
    m_wv = Tensor::xavier({neighborDim, outputDim}, rng);
    m_wo = Tensor::xavier({outputDim, outputDim}, rng);
    m_wz = Tensor::xavier({2 * outputDim, outputDim}, rng);
    m_wr = Tensor::xavier({2 * outputDim, outputDim}, rng);
    m_wh = Tensor::xavier({2 * outputDim, outputDim}, rng);
    m_gamma = Tensor::filled({outputDim}, 1.0);
    m_beta = Tensor::zeros({outputDim});
}

std::array<Tensor*, GraphAttentionLayer::kParameterCount> GraphAttentionLayer::parameters() noexcept {
    return {&m_wq, &m_wk, &m_wv, &m_wo, &m_wz, &m_wr, &m_wh, &m_gamma, &m_beta};
}

std::array<const Tensor*, GraphAttentionLayer::kParameterCount> GraphAttentionLayer::parameters() const noexcept {
    return {&m_wq, &m_wk, &m_wv, &m_wo, &m_wz, &m_wr, &m_wh, &m_gamma, &m_beta};
}

LayerOutput GraphAttentionLayer::forward(const Tensor& node,
                                         const std::vector<Tensor>& neighbors,
                                         const std::vector<double>* edgeWeights,
                                         bool isTraining,
                                         uint32_t seedState,
                                         uint64_t forwardCounter) {
    if (node.size() != m_inputDim) {
        throw Helix::ShapeMismatchException("layer expects node of size " + std::to_string(m_inputDim) + ", got " +
                                            std::to_string(node.size()));
    }
    if (neighbors.empty()) {
        throw Helix::ShapeMismatchException("layer requires at least one neighbor");
    }
    for (const auto& nb : neighbors) {
        if (nb.size() != m_neighborDim) {
            throw Helix::ShapeMismatchException("layer expects neighbors of size " + std::to_string(m_neighborDim) +
                                                ", got " + std::to_string(nb.size()));
        }
    }
    if (edgeWeights && edgeWeights->size() != neighbors.size()) {
        throw Helix::ShapeMismatchException(std::to_string(edgeWeights->size()) + " edge weights for " +
                                            std::to_string(neighbors.size()) + " neighbors");
    }

    ForwardCache c;
    c.input = asVector(node);
    c.query = c.input.matmul(m_wq);

    const size_t count = neighbors.size();
    Tensor scores = Tensor::zeros({count});
    c.scoreScale.assign(count, 1.0);
    c.cosines.assign(count, 0.0);
    for (size_t j = 0; j < count; ++j) {
        c.neighbors.push_back(asVector(neighbors[j]));
        c.keys.push_back(c.neighbors[j].matmul(m_wk));
        c.values.push_back(c.neighbors[j].matmul(m_wv));
        if (edgeWeights && (*edgeWeights)[j] != 0.0) c.scoreScale[j] = (*edgeWeights)[j];
        c.cosines[j] = c.query.cosine(c.keys[j]);
        scores[j] = c.cosines[j] * c.scoreScale[j];
    }

    c.attention = scores.softmax(m_temperature);
    c.message = Tensor::zeros({m_outputDim});
    for (size_t j = 0; j < count; ++j) c.message.addScaledInPlace(c.values[j], c.attention[j]);

    // Gated fusion: message is the input, projected query the hidden state.
    const Tensor joined = concat(c.message, c.query);
    c.update = joined.matmul(m_wz).sigmoid();
    c.reset = joined.matmul(m_wr).sigmoid();
    c.candidate = concat(c.message, c.reset.multiply(c.query)).matmul(m_wh).tanh();

    c.fused = Tensor::zeros({m_outputDim});
    for (size_t i = 0; i < m_outputDim; ++i) {
        c.fused[i] = (1.0 - c.update[i]) * c.query[i] + c.update[i] * c.candidate[i];
    }

    Tensor dropped = c.fused.clone();
    c.dropoutScale.assign(m_outputDim, 1.0);
    if (isTraining && m_dropoutRate > 0.0) {
        const double keepScale = 1.0 / (1.0 - m_dropoutRate);
        for (size_t n = 0; n < m_outputDim; ++n) {
            uint64_t key = static_cast<uint64_t>(seedState);
            key ^= (static_cast<uint64_t>(n) << 24);
            key ^= forwardCounter;
            const double u = (splitmix64(key) & 0xFFFFFF) / static_cast<double>(0x1000000);
            c.dropoutScale[n] = (u < m_dropoutRate) ? 0.0 : keepScale;
            dropped[n] *= c.dropoutScale[n];
        }
    }

    const double n = static_cast<double>(m_outputDim);
    const double mean = dropped.sum() / n;
    double var = 0.0;
    for (double v : dropped.data()) var += (v - mean) * (v - mean);
    var /= n;
    c.invStd = 1.0 / std::sqrt(var + kLayerNormEps);
    c.normalized = Tensor::zeros({m_outputDim});
    for (size_t i = 0; i < m_outputDim; ++i) c.normalized[i] = (dropped[i] - mean) * c.invStd;

    Tensor output = Tensor::zeros({m_outputDim});
    for (size_t i = 0; i < m_outputDim; ++i) output[i] = m_gamma[i] * c.normalized[i] + m_beta[i];

    LayerOutput out{std::move(output), c.attention};
    c.valid = true;
    m_cache = std::move(c);
    return out;
}

Tensor GraphAttentionLayer::backward(const Tensor& gradOutput, std::vector<Tensor>& grads, size_t offset) const {
    if (!m_cache.valid) throw Helix::HelixException("backward called before forward");
    if (gradOutput.size() != m_outputDim) {
        throw Helix::ShapeMismatchException("output gradient of size " + std::to_string(gradOutput.size()) +
                                            ", expected " + std::to_string(m_outputDim));
    }
    if (grads.size() < offset + kParameterCount) {
        throw Helix::ShapeMismatchException("gradient buffer too small for layer parameters");
    }

    const ForwardCache& c = m_cache;
    const size_t O = m_outputDim;
    const auto& g = gradOutput.data();
    const auto& xhat = c.normalized.data();

    // Layer norm over all elements, then the dropout mask.
    std::vector<double> dxhat(O);
    double meanD = 0.0;
    double meanDX = 0.0;
    for (size_t i = 0; i < O; ++i) {
        grads[offset + GAMMA][i] += g[i] * xhat[i];
        grads[offset + BETA][i] += g[i];
        dxhat[i] = g[i] * m_gamma[i];
        meanD += dxhat[i];
        meanDX += dxhat[i] * xhat[i];
    }
    meanD /= static_cast<double>(O);
    meanDX /= static_cast<double>(O);

    std::vector<double> dFused(O);
    for (size_t i = 0; i < O; ++i) {
        dFused[i] = c.invStd * (dxhat[i] - meanD - xhat[i] * meanDX) * c.dropoutScale[i];
    }

    const auto& H = c.query.data();
    const auto& X = c.message.data();
    const auto& z = c.update.data();
    const auto& r = c.reset.data();
    const auto& cand = c.candidate.data();

    std::vector<double> dH(O), dX(O, 0.0), dzPre(O), dhPre(O), rH(O);
    for (size_t i = 0; i < O; ++i) {
        dH[i] = dFused[i] * (1.0 - z[i]);
        dzPre[i] = dFused[i] * (cand[i] - H[i]) * z[i] * (1.0 - z[i]);
        dhPre[i] = dFused[i] * z[i] * (1.0 - cand[i] * cand[i]);
        rH[i] = r[i] * H[i];
    }

    // Candidate: tanh([X, r*H] Wh)
    accumulateOuter(grads[offset + WH], 0, X, dhPre);
    accumulateOuter(grads[offset + WH], O, rH, dhPre);
    addMatVec(dX, m_wh, 0, dhPre);
    std::vector<double> dRH(O, 0.0);
    addMatVec(dRH, m_wh, O, dhPre);

    std::vector<double> drPre(O);
    for (size_t i = 0; i < O; ++i) {
        dH[i] += dRH[i] * r[i];
        drPre[i] = dRH[i] * H[i] * r[i] * (1.0 - r[i]);
    }

    accumulateOuter(grads[offset + WR], 0, X, drPre);
    accumulateOuter(grads[offset + WR], O, H, drPre);
    addMatVec(dX, m_wr, 0, drPre);
    addMatVec(dH, m_wr, O, drPre);

    accumulateOuter(grads[offset + WZ], 0, X, dzPre);
    accumulateOuter(grads[offset + WZ], O, H, dzPre);
    addMatVec(dX, m_wz, 0, dzPre);
    addMatVec(dH, m_wz, O, dzPre);

    // Attention-weighted aggregation and temperature softmax.
    const size_t count = c.neighbors.size();
    std::vector<double> dAttn(count, 0.0);
    double weightedSum = 0.0;
    for (size_t j = 0; j < count; ++j) {
        const auto& v = c.values[j].data();
        for (size_t i = 0; i < O; ++i) dAttn[j] += dX[i] * v[i];
        weightedSum += c.attention[j] * dAttn[j];
    }

    std::vector<double> dQuery = dH;
    const double qNorm = c.query.norm();
    std::vector<double> dKey(O), dValue(O);
    for (size_t j = 0; j < count; ++j) {
        const double a = c.attention[j];
        const double dScore = (a / m_temperature) * (dAttn[j] - weightedSum);
        const double dCos = dScore * c.scoreScale[j];

        const auto& k = c.keys[j].data();
        const double kNorm = c.keys[j].norm();
        const double dotQK = c.query.dot(c.keys[j]);
        const double denom = qNorm * kNorm + kCosineEps;
        const double denom2 = denom * denom;
        for (size_t i = 0; i < O; ++i) {
            const double qTerm = qNorm > 0.0 ? dotQK * kNorm * H[i] / (qNorm * denom2) : 0.0;
            const double kTerm = kNorm > 0.0 ? dotQK * qNorm * k[i] / (kNorm * denom2) : 0.0;
            dQuery[i] += dCos * (k[i] / denom - qTerm);
            dKey[i] = dCos * (H[i] / denom - kTerm);
            dValue[i] = a * dX[i];
        }
        accumulateOuter(grads[offset + WK], 0, c.neighbors[j].data(), dKey);
        accumulateOuter(grads[offset + WV], 0, c.neighbors[j].data(), dValue);
    }

    accumulateOuter(grads[offset + WQ], 0, c.input.data(), dQuery);
    std::vector<double> dInput(m_inputDim, 0.0);
    addMatVec(dInput, m_wq, 0, dQuery);
    return Tensor::fromVector(std::move(dInput));
}
