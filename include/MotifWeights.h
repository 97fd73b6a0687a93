#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Learned scalar weight per nucleotide motif.
 *
 * Seeded with regulatory and codon priors. Feedback nudges weights
 * multiplicatively; every stored weight stays within [kMinWeight, kMaxWeight].
 */
class MotifWeightTable {
public:
    static constexpr double kMinWeight = 0.1;
    static constexpr double kMaxWeight = 5.0;

    MotifWeightTable();

    bool contains(const std::string& motif) const;
    /// Stored weight, or 1.0 for motifs the table has never seen.
    double weight(const std::string& motif) const;
    void setWeight(const std::string& motif, double value);

    /**
     * @brief Multiplies the weight of every distinct motif of the given sizes
     * that occurs in both sequences.
     * @return Number of motifs adjusted.
     */
    size_t adjustShared(const std::string& first,
                        const std::string& second,
                        double factor,
                        const std::vector<size_t>& motifSizes = {4, 5, 6});

    /// Restores the prior seed.
    void reset();

    size_t size() const noexcept { return m_weights.size(); }
    const std::map<std::string, double>& weights() const noexcept { return m_weights; }

private:
    std::map<std::string, double> m_weights;
};
