#pragma once

#include <cstddef>
#include <optional>
#include <string>

enum class SchedulePolicy { COSINE, WARMUP_LINEAR, PLATEAU, CONSTANT };

struct SchedulerConfig {
    SchedulePolicy policy = SchedulePolicy::CONSTANT;
    double baseLearningRate = 0.001;
    double minLearningRate = 1e-6;
    size_t totalEpochs = 100;
    size_t warmupSteps = 1000;
    // Decay horizon of warmup_linear, counted in update() calls.
    size_t totalSteps = 10000;
    size_t plateauPatience = 10;
    double plateauFactor = 0.5;
};

/**
 * @brief Produces the learning rate for each epoch.
 *
 * Every policy clamps its result to at least minLearningRate. The plateau
 * policy treats higher metrics as better and ignores updates without a metric.
 */
class LearningRateScheduler {
public:
    LearningRateScheduler() : LearningRateScheduler(SchedulerConfig{}) {}
    explicit LearningRateScheduler(const SchedulerConfig& config);

    double update(size_t epoch, std::optional<double> metric = std::nullopt);

    double currentLearningRate() const noexcept { return m_currentLR; }
    size_t stepCount() const noexcept { return m_step; }
    SchedulePolicy policy() const noexcept { return m_config.policy; }
    const SchedulerConfig& config() const noexcept { return m_config; }

    static SchedulePolicy parsePolicy(const std::string& name);
    static std::string policyName(SchedulePolicy policy);

private:
    SchedulerConfig m_config;
    double m_currentLR;
    size_t m_step = 0;
    size_t m_plateauCount = 0;
    std::optional<double> m_bestMetric;
};
