#pragma once

#include "GraphNetwork.h"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

// Once the buffer is full, slot idx is overwritten when idx < capacity, where
// p counts every earlier add. COMPATIBLE draws idx = floor(u * (p + 1)),
// CLASSIC draws idx = floor(u * p).
enum class ReservoirPolicy { COMPATIBLE, CLASSIC };

struct ReplayExemplar {
    TrainingSample sample;
    double similarity = 0.0;
    uint64_t timestamp = 0;
};

/**
 * @brief Bounded exemplar store with reservoir replacement, running
 * similarity statistics and a windowed distribution-shift estimate.
 */
class ReplayBuffer {
public:
    explicit ReplayBuffer(size_t capacity = 10000,
                          ReservoirPolicy policy = ReservoirPolicy::COMPATIBLE,
                          uint32_t seed = 1337);

    /// Stores the exemplar (or drops it, per the reservoir policy) and feeds its similarity into the statistics.
    void add(ReplayExemplar exemplar);

    /// min(n, size()) distinct exemplars, uniform without replacement.
    std::vector<ReplayExemplar> sample(size_t n);

    /// Welford update of the running similarity mean and variance.
    void updateStats(double value);

    /**
     * @brief Gaussian KL approximation between the last `window` stored
     * exemplars and the `window` before them, by storage order.
     * @return |kl|, or 0 when fewer than 2*window exemplars are stored or either window has zero variance.
     */
    double detectDistributionShift(size_t window) const;

    void clear();

    size_t size() const noexcept { return m_buffer.size(); }
    bool empty() const noexcept { return m_buffer.empty(); }
    size_t capacity() const noexcept { return m_capacity; }
    size_t position() const noexcept { return m_position; }
    ReservoirPolicy policy() const noexcept { return m_policy; }
    const std::vector<ReplayExemplar>& exemplars() const noexcept { return m_buffer; }

    size_t statsCount() const noexcept { return m_statsCount; }
    double statsMean() const noexcept { return m_statsMean; }
    /// Population variance of every similarity seen so far.
    double statsVariance() const noexcept;

    static ReservoirPolicy parsePolicy(const std::string& name);

private:
    size_t m_capacity;
    ReservoirPolicy m_policy;
    std::vector<ReplayExemplar> m_buffer;
    size_t m_position = 0;
    std::mt19937 m_rng;

    size_t m_statsCount = 0;
    double m_statsMean = 0.0;
    double m_statsM2 = 0.0;
};
