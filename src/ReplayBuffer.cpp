#include "ReplayBuffer.h"

#include "CommonUtils.h"
#include "HelixExceptions.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <utility>

namespace {
struct WindowMoments {
    double mean = 0.0;
    double variance = 0.0;
};

WindowMoments momentsOf(const std::vector<ReplayExemplar>& buffer, size_t begin, size_t end) {
    WindowMoments w;
    const double n = static_cast<double>(end - begin);
    for (size_t i = begin; i < end; ++i) w.mean += buffer[i].similarity;
    w.mean /= n;
    for (size_t i = begin; i < end; ++i) {
        const double d = buffer[i].similarity - w.mean;
        w.variance += d * d;
    }
    w.variance /= n;
    return w;
}

uint64_t nowMillis() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}
} // namespace

ReplayBuffer::ReplayBuffer(size_t capacity, ReservoirPolicy policy, uint32_t seed)
    : m_capacity(capacity), m_policy(policy), m_rng(seed) {
    if (capacity == 0) throw Helix::ConfigurationException("replay buffer capacity must be positive");
}

void ReplayBuffer::add(ReplayExemplar exemplar) {
    if (exemplar.timestamp == 0) exemplar.timestamp = nowMillis();
    const double similarity = exemplar.similarity;

    if (m_buffer.size() < m_capacity) {
        m_buffer.push_back(std::move(exemplar));
    } else {
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        const size_t range = (m_policy == ReservoirPolicy::COMPATIBLE) ? m_position + 1 : m_position;
        const size_t idx = static_cast<size_t>(std::floor(unit(m_rng) * static_cast<double>(range)));
        if (idx < m_capacity) m_buffer[idx] = std::move(exemplar);
    }

    ++m_position;
    updateStats(similarity);
}

std::vector<ReplayExemplar> ReplayBuffer::sample(size_t n) {
    const size_t count = std::min(n, m_buffer.size());
    std::vector<size_t> available(m_buffer.size());
    std::iota(available.begin(), available.end(), size_t{0});

    std::vector<ReplayExemplar> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<size_t> pick(i, available.size() - 1);
        std::swap(available[i], available[pick(m_rng)]);
        out.push_back(m_buffer[available[i]]);
    }
    return out;
}

void ReplayBuffer::updateStats(double value) {
    ++m_statsCount;
    const double delta = value - m_statsMean;
    m_statsMean += delta / static_cast<double>(m_statsCount);
    m_statsM2 += delta * (value - m_statsMean);
}

double ReplayBuffer::statsVariance() const noexcept {
    return m_statsCount ? m_statsM2 / static_cast<double>(m_statsCount) : 0.0;
}

double ReplayBuffer::detectDistributionShift(size_t window) const {
    if (window == 0 || m_buffer.size() < 2 * window) return 0.0;

    const size_t end = m_buffer.size();
    const WindowMoments recent = momentsOf(m_buffer, end - window, end);
    const WindowMoments historical = momentsOf(m_buffer, end - 2 * window, end - window);
    if (historical.variance == 0.0 || recent.variance == 0.0) return 0.0;

    const double meanGap = recent.mean - historical.mean;
    const double kl = std::log(std::sqrt(historical.variance / recent.variance)) +
                      (recent.variance + meanGap * meanGap) / (2.0 * historical.variance) - 0.5;
    return std::fabs(kl);
}

void ReplayBuffer::clear() {
    m_buffer.clear();
    m_position = 0;
    m_statsCount = 0;
    m_statsMean = 0.0;
    m_statsM2 = 0.0;
}

ReservoirPolicy ReplayBuffer::parsePolicy(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    if (key == "compatible") return ReservoirPolicy::COMPATIBLE;
    if (key == "classic") return ReservoirPolicy::CLASSIC;
    throw Helix::ConfigurationException("unknown reservoir policy '" + name + "' (expected compatible|classic)");
}
