#pragma once

#include "EmbeddingGenerator.h"
#include "MotifWeights.h"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Multi-scale k-mer frequency embedding of nucleotide sequences.
 *
 * For every k in kmerSizes the sequence is scanned for k-mers; each occurrence
 * counts with its motif weight (1.0 when the table has no entry) and, for k = 3,
 * with the codon-position weight of its offset. Counts are divided by their
 * total, the per-k vectors are concatenated in vocabulary order (A, T, G, C
 * lexicographic), then bucket-averaged down to dimension().
 *
 * The motif table is borrowed; it must outlive the embedder.
 */
class KmerEmbedder : public EmbeddingGenerator {
public:
    KmerEmbedder(const MotifWeightTable& motifs,
                 size_t dimension = 256,
                 std::vector<size_t> kmerSizes = {3, 4, 5, 6},
                 bool motifWeighting = true,
                 bool codonAware = true);

    Tensor embed(const std::string& payload) const override;
    size_t dimension() const noexcept override { return m_dimension; }

    const std::vector<size_t>& kmerSizes() const noexcept { return m_kmerSizes; }
    size_t rawWidth() const noexcept;

    static std::vector<std::string> vocabulary(size_t k);
    static std::vector<double> projectToDimension(const std::vector<double>& values, size_t targetDim);

private:
    static constexpr std::array<double, 3> kCodonPositionWeights = {1.0, 1.0, 0.7};

    const MotifWeightTable& m_motifs;
    size_t m_dimension;
    std::vector<size_t> m_kmerSizes;
    bool m_motifWeighting;
    bool m_codonAware;
};
