#pragma once

#include "Tensor.h"

#include <vector>

struct LossWithGradient {
    double loss = 0.0;
    Tensor anchorGradient;
};

/**
 * @brief InfoNCE objective over cosine similarities.
 *
 * loss = -mean(pos / t) + logsumexp({pos, neg} / t)
 *
 * Without positives the first term is 0; with no candidates at all the loss is 0.
 */
class ContrastiveLoss {
public:
    static double infoNCE(const Tensor& anchor,
                          const std::vector<Tensor>& positives,
                          const std::vector<Tensor>& negatives,
                          double temperature);

    /// Loss plus its gradient with respect to the anchor.
    static LossWithGradient infoNCEWithGradient(const Tensor& anchor,
                                                const std::vector<Tensor>& positives,
                                                const std::vector<Tensor>& negatives,
                                                double temperature);

    /// d cosine(a, b) / d a, consistent with Tensor::cosine's epsilon.
    static Tensor cosineGradient(const Tensor& a, const Tensor& b);
};
