#include "MotifWeights.h"

#include <algorithm>
#include <unordered_set>

namespace {
const std::map<std::string, double>& priorWeights() {
    static const std::map<std::string, double> priors = {
        {"TATAAA", 2.0}, // TATA box
        {"CAAT", 1.5},   // CAAT box
        {"GCCGCC", 1.8}, // GC box
        {"AATAAA", 1.7}, // polyadenylation signal
        {"CACGTG", 1.6}, // E-box
        {"ATG", 1.5},    // start codon
        {"TAA", 1.4},
        {"TAG", 1.4},
        {"TGA", 1.4},
    };
    return priors;
}

double clampWeight(double value) {
    return std::clamp(value, MotifWeightTable::kMinWeight, MotifWeightTable::kMaxWeight);
}
} // namespace

MotifWeightTable::MotifWeightTable() : m_weights(priorWeights()) {}

bool MotifWeightTable::contains(const std::string& motif) const {
    return m_weights.find(motif) != m_weights.end();
}

double MotifWeightTable::weight(const std::string& motif) const {
    auto it = m_weights.find(motif);
    return it == m_weights.end() ? 1.0 : it->second;
}

void MotifWeightTable::setWeight(const std::string& motif, double value) {
    m_weights[motif] = clampWeight(value);
}

size_t MotifWeightTable::adjustShared(const std::string& first,
                                      const std::string& second,
                                      double factor,
                                      const std::vector<size_t>& motifSizes) {
    size_t adjusted = 0;
    for (size_t k : motifSizes) {
        if (k == 0 || first.size() < k || second.size() < k) continue;

        std::unordered_set<std::string> present;
        for (size_t i = 0; i + k <= first.size(); ++i) present.insert(first.substr(i, k));

        std::unordered_set<std::string> shared;
        for (size_t i = 0; i + k <= second.size(); ++i) {
            std::string motif = second.substr(i, k);
            if (present.count(motif)) shared.insert(std::move(motif));
        }

        for (const std::string& motif : shared) {
            m_weights[motif] = clampWeight(weight(motif) * factor);
            ++adjusted;
        }
    }
    return adjusted;
}

void MotifWeightTable::reset() {
    m_weights = priorWeights();
}
