#include "LearningRateScheduler.h"

#include "CommonUtils.h"
#include "HelixExceptions.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;
}

LearningRateScheduler::LearningRateScheduler(const SchedulerConfig& config)
    : m_config(config), m_currentLR(config.baseLearningRate) {}

double LearningRateScheduler::update(size_t epoch, std::optional<double> metric) {
    ++m_step;
    const double base = m_config.baseLearningRate;
    const double minLR = m_config.minLearningRate;

    switch (m_config.policy) {
        case SchedulePolicy::COSINE: {
            const double total = static_cast<double>(std::max<size_t>(m_config.totalEpochs, 1));
            m_currentLR = minLR + 0.5 * (base - minLR) * (1.0 + std::cos(kPi * static_cast<double>(epoch) / total));
            break;
        }
        case SchedulePolicy::WARMUP_LINEAR: {
            const size_t warmup = m_config.warmupSteps;
            if (m_step < warmup) {
                m_currentLR = base * static_cast<double>(m_step) / static_cast<double>(warmup);
            } else if (m_config.totalSteps > warmup) {
                const double progress = static_cast<double>(m_step - warmup) /
                                        static_cast<double>(m_config.totalSteps - warmup);
                m_currentLR = base * (1.0 - progress);
            } else {
                m_currentLR = minLR;
            }
            break;
        }
        case SchedulePolicy::PLATEAU: {
            if (!metric) break;
            if (!m_bestMetric || *metric > *m_bestMetric) {
                m_bestMetric = *metric;
                m_plateauCount = 0;
            } else if (++m_plateauCount >= m_config.plateauPatience) {
                m_currentLR *= m_config.plateauFactor;
                m_plateauCount = 0;
            }
            break;
        }
        case SchedulePolicy::CONSTANT:
            break;
    }

    m_currentLR = std::max(m_currentLR, minLR);
    return m_currentLR;
}

SchedulePolicy LearningRateScheduler::parsePolicy(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    if (key == "cosine") return SchedulePolicy::COSINE;
    if (key == "warmup_linear" || key == "warmup-linear") return SchedulePolicy::WARMUP_LINEAR;
    if (key == "plateau") return SchedulePolicy::PLATEAU;
    if (key == "constant") return SchedulePolicy::CONSTANT;
    throw Helix::ConfigurationException("unknown scheduler policy '" + name +
                                        "' (expected cosine|warmup_linear|plateau|constant)");
}

std::string LearningRateScheduler::policyName(SchedulePolicy policy) {
    switch (policy) {
        case SchedulePolicy::COSINE: return "cosine";
        case SchedulePolicy::WARMUP_LINEAR: return "warmup_linear";
        case SchedulePolicy::PLATEAU: return "plateau";
        case SchedulePolicy::CONSTANT: return "constant";
    }
    return "constant";
}
