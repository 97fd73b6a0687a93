#include "KmerEmbedder.h"

#include "CommonUtils.h"
#include "HelixExceptions.h"

#include <unordered_map>
#include <utility>

namespace {
constexpr char kNucleotides[] = {'A', 'T', 'G', 'C'};
constexpr size_t kMaxKmerSize = 10;

// A=0, T=1, G=2, C=3 so that indices follow vocabulary order.
int nucleotideIndex(char c) {
    switch (c) {
        case 'A': return 0;
        case 'T': return 1;
        case 'G': return 2;
        case 'C': return 3;
        default: return -1;
    }
}

size_t vocabSize(size_t k) {
    size_t n = 1;
    for (size_t i = 0; i < k; ++i) n *= 4;
    return n;
}
} // namespace

KmerEmbedder::KmerEmbedder(const MotifWeightTable& motifs,
                           size_t dimension,
                           std::vector<size_t> kmerSizes,
                           bool motifWeighting,
                           bool codonAware)
    : m_motifs(motifs),
      m_dimension(dimension),
      m_kmerSizes(std::move(kmerSizes)),
      m_motifWeighting(motifWeighting),
      m_codonAware(codonAware) {
    if (m_dimension == 0) throw Helix::ConfigurationException("embedding dimension must be positive");
    if (m_kmerSizes.empty()) throw Helix::ConfigurationException("at least one k-mer size is required");
    for (size_t k : m_kmerSizes) {
        if (k == 0 || k > kMaxKmerSize) {
            throw Helix::ConfigurationException("k-mer size out of range [1, " + std::to_string(kMaxKmerSize) +
                                                "]: " + std::to_string(k));
        }
    }
}

size_t KmerEmbedder::rawWidth() const noexcept {
    size_t width = 0;
    for (size_t k : m_kmerSizes) width += vocabSize(k);
    return width;
}

std::vector<std::string> KmerEmbedder::vocabulary(size_t k) {
    std::vector<std::string> vocab;
    vocab.reserve(vocabSize(k));
    const size_t total = vocabSize(k);
    for (size_t idx = 0; idx < total; ++idx) {
        std::string kmer(k, 'A');
        size_t rem = idx;
        for (size_t pos = k; pos-- > 0;) {
            kmer[pos] = kNucleotides[rem % 4];
            rem /= 4;
        }
        vocab.push_back(std::move(kmer));
    }
    return vocab;
}

std::vector<double> KmerEmbedder::projectToDimension(const std::vector<double>& values, size_t targetDim) {
    std::vector<double> out(targetDim, 0.0);
    if (values.empty() || targetDim == 0) return out;

    const double step = static_cast<double>(values.size()) / static_cast<double>(targetDim);
    for (size_t i = 0; i < targetDim; ++i) {
        const size_t start = static_cast<size_t>(static_cast<double>(i) * step);
        size_t end = static_cast<size_t>(static_cast<double>(i + 1) * step);
        if (end <= start) end = start + 1; // upsampling repeats the source element
        double sum = 0.0;
        size_t count = 0;
        for (size_t j = start; j < end && j < values.size(); ++j) {
            sum += values[j];
            ++count;
        }
        out[i] = count ? sum / static_cast<double>(count) : 0.0;
    }
    return out;
}

Tensor KmerEmbedder::embed(const std::string& payload) const {
    const std::string sequence = CommonUtils::normalizeNucleotides(payload);

    std::vector<double> combined;
    combined.reserve(rawWidth());

    for (size_t k : m_kmerSizes) {
        std::vector<double> counts(vocabSize(k), 0.0);
        double total = 0.0;

        for (size_t i = 0; i + k <= sequence.size(); ++i) {
            size_t index = 0;
            for (size_t p = 0; p < k; ++p) index = index * 4 + static_cast<size_t>(nucleotideIndex(sequence[i + p]));

            double weight = 1.0;
            if (m_motifWeighting) {
                const std::string kmer = sequence.substr(i, k);
                if (m_motifs.contains(kmer)) weight = m_motifs.weight(kmer);
            }
            if (m_codonAware && k == 3) weight *= kCodonPositionWeights[i % 3];

            counts[index] += weight;
            total += weight;
        }

        if (total > 0.0) {
            for (double& c : counts) c /= total;
        }
        combined.insert(combined.end(), counts.begin(), counts.end());
    }

    if (combined.size() == m_dimension) return Tensor::fromVector(std::move(combined));
    return Tensor::fromVector(projectToDimension(combined, m_dimension));
}
