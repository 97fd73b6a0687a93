#include "ContrastiveLoss.h"

#include "HelixExceptions.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kCosineEps = 1e-8;

void requirePositiveTemperature(double temperature) {
    if (!(temperature > 0.0)) throw Helix::HelixException("contrastive temperature must be positive");
}

std::vector<double> scaledSimilarities(const Tensor& anchor,
                                       const std::vector<Tensor>& positives,
                                       const std::vector<Tensor>& negatives,
                                       double temperature) {
    std::vector<double> scores;
    scores.reserve(positives.size() + negatives.size());
    for (const auto& p : positives) scores.push_back(anchor.cosine(p) / temperature);
    for (const auto& n : negatives) scores.push_back(anchor.cosine(n) / temperature);
    return scores;
}

double logSumExp(const std::vector<double>& values) {
    const double maxVal = *std::max_element(values.begin(), values.end());
    double acc = 0.0;
    for (double v : values) acc += std::exp(v - maxVal);
    return maxVal + std::log(acc);
}
} // namespace

double ContrastiveLoss::infoNCE(const Tensor& anchor,
                                const std::vector<Tensor>& positives,
                                const std::vector<Tensor>& negatives,
                                double temperature) {
    requirePositiveTemperature(temperature);
    const std::vector<double> scores = scaledSimilarities(anchor, positives, negatives, temperature);
    if (scores.empty()) return 0.0;

    double positiveMean = 0.0;
    if (!positives.empty()) {
        for (size_t i = 0; i < positives.size(); ++i) positiveMean += scores[i];
        positiveMean /= static_cast<double>(positives.size());
    }
    return -positiveMean + logSumExp(scores);
}

LossWithGradient ContrastiveLoss::infoNCEWithGradient(const Tensor& anchor,
                                                      const std::vector<Tensor>& positives,
                                                      const std::vector<Tensor>& negatives,
                                                      double temperature) {
    requirePositiveTemperature(temperature);
    LossWithGradient result{0.0, Tensor::zeros({anchor.size()})};
    const std::vector<double> scores = scaledSimilarities(anchor, positives, negatives, temperature);
    if (scores.empty()) return result;

    const double lse = logSumExp(scores);
    const size_t posCount = positives.size();
    double positiveMean = 0.0;
    for (size_t i = 0; i < posCount; ++i) positiveMean += scores[i];
    if (posCount) positiveMean /= static_cast<double>(posCount);
    result.loss = -positiveMean + lse;

    for (size_t i = 0; i < scores.size(); ++i) {
        double dScore = std::exp(scores[i] - lse);
        if (i < posCount) dScore -= 1.0 / static_cast<double>(posCount);
        if (dScore == 0.0) continue;
        const Tensor& other = i < posCount ? positives[i] : negatives[i - posCount];
        result.anchorGradient.addScaledInPlace(cosineGradient(anchor, other), dScore / temperature);
    }
    return result;
}

Tensor ContrastiveLoss::cosineGradient(const Tensor& a, const Tensor& b) {
    if (a.size() != b.size()) {
        throw Helix::ShapeMismatchException("cosine gradient of " + a.shapeString() + " and " + b.shapeString());
    }
    const double aNorm = a.norm();
    const double bNorm = b.norm();
    const double dotAB = a.dot(b);
    const double denom = aNorm * bNorm + kCosineEps;

    Tensor grad = Tensor::zeros({a.size()});
    for (size_t i = 0; i < a.size(); ++i) {
        const double normTerm = aNorm > 0.0 ? dotAB * bNorm * a[i] / (aNorm * denom * denom) : 0.0;
        grad[i] = b[i] / denom - normTerm;
    }
    return grad;
}
