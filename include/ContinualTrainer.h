#pragma once

#include "AdamOptimizer.h"
#include "ElasticWeightConsolidation.h"
#include "EmbeddingGenerator.h"
#include "GraphNetwork.h"
#include "LearningRateScheduler.h"
#include "MotifWeights.h"
#include "ReplayBuffer.h"
#include "SimilarityGraph.h"
#include "ValidationOracle.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

struct TrainerConfig {
    NetworkConfig network;

    // Optimization
    size_t batchSize = 32;
    size_t epochs = 100;
    double learningRate = 0.001;
    double minLearningRate = 1e-6;
    size_t warmupSteps = 1000;
    SchedulePolicy scheduler = SchedulePolicy::COSINE;
    size_t plateauPatience = 10;
    double plateauFactor = 0.5;
    double gradientClipNorm = 5.0;

    // Continual learning
    double ewcLambda = 0.4;
    size_t replayBufferSize = 10000;
    ReservoirPolicy reservoirPolicy = ReservoirPolicy::COMPATIBLE;
    double replayProbability = 0.3;
    double shiftThreshold = 0.1;
    size_t shiftWindow = 100;
    size_t consolidationInterval = 10;

    // Graph and contrastive sampling
    double edgeThreshold = 0.3;
    size_t positivesPerSample = 3;
    size_t negativesPerSample = 5;

    // Search blends raw and refined cosine: w * raw + (1 - w) * refined.
    double searchRawWeight = 0.5;

    // Feedback
    double missedMatchThreshold = 0.9;
    double falsePositiveThreshold = 0.8;
    double upweightFactor = 1.1;
    double downweightFactor = 0.9;
    std::vector<size_t> feedbackMotifSizes = {4, 5, 6};

    // Default k-mer embedder
    std::vector<size_t> kmerSizes = {3, 4, 5, 6};
    bool motifWeighting = true;
    bool codonAware = true;

    uint32_t seed = 1337;
    bool verbose = false;
};

enum class TrainerState { IDLE, BUILDING_GRAPH, TRAINING, EVALUATING, CONSOLIDATING, TRAINED };

struct TrainingMetrics {
    std::vector<double> loss;
    std::vector<double> accuracy;
    std::vector<double> distributionShift;
    std::vector<double> learningRate;
    std::vector<size_t> consolidationEpochs;
};

struct EvaluationResult {
    double accuracy = 0.0;
    size_t evaluated = 0;
    size_t correct = 0;
    size_t excluded = 0;
};

struct SearchResult {
    std::string id;
    double similarity = 0.0;
    double rawSimilarity = 0.0;
    double refinedSimilarity = 0.0;
};

struct FeedbackLabel {
    bool isMatch = false;
    double confidence = 0.0;
};

struct FeedbackSummary {
    size_t processed = 0;
    size_t upweighted = 0;
    size_t downweighted = 0;
    size_t skipped = 0;
    size_t motifsAdjusted = 0;
};

/**
 * @brief Owns the network and every piece of continual-learning state, and
 * drives training, evaluation, feedback ingestion and search.
 *
 * Not thread-safe; callers serialize access.
 */
class ContinualTrainer {
public:
    /// With no generator, a KmerEmbedder over this trainer's motif table is used.
    explicit ContinualTrainer(const TrainerConfig& config, std::unique_ptr<EmbeddingGenerator> generator = nullptr);

    ContinualTrainer(const ContinualTrainer&) = delete;
    ContinualTrainer& operator=(const ContinualTrainer&) = delete;

    /**
     * @brief Builds the similarity graph once, then runs `epochs` epochs
     * (config epochs when 0). Shape errors abort and propagate.
     */
    TrainingMetrics train(const std::vector<Entity>& trainingSet,
                          const std::vector<Entity>& validationSet,
                          size_t epochs = 0);

    /// Nearest-neighbor accuracy against expectedSimilar; samples referencing unknown ids are excluded.
    EvaluationResult evaluate(const std::vector<Entity>& validationSet, const SimilarityGraph& graph);

    /// Inference-mode forward.
    NetworkOutput forward(const Tensor& node,
                          const std::vector<Tensor>& neighbors,
                          const std::vector<double>* edgeWeights = nullptr);

    std::vector<SearchResult> search(const std::string& queryPayload, const std::vector<Entity>& corpus, size_t topK);

    /// Entities without a label are skipped.
    FeedbackSummary learnFromFeedback(const std::string& queryPayload,
                                      const std::vector<Entity>& retrieved,
                                      const std::unordered_map<std::string, FeedbackLabel>& labels);
    FeedbackSummary learnFromFeedback(const Entity& query,
                                      const std::vector<Entity>& retrieved,
                                      ValidationOracle& oracle);

    /// Refines a payload against a graph (self-substituted when it has no neighbors there).
    Tensor refine(const Tensor& rawEmbedding, const SimilarityGraph& graph, std::optional<size_t> selfIndex);

    std::vector<uint8_t> saveParameters() const { return m_network.saveParameters(); }
    void loadParameters(const std::vector<uint8_t>& blob) { m_network.loadParameters(blob); }
    void saveModelBinary(const std::string& path) const { m_network.saveModelBinary(path); }
    void loadModelBinary(const std::string& path) { m_network.loadModelBinary(path); }

    TrainerState state() const noexcept { return m_state; }
    const TrainerConfig& config() const noexcept { return m_config; }
    const TrainingMetrics& metrics() const noexcept { return m_metrics; }
    GraphNetwork& network() noexcept { return m_network; }
    const GraphNetwork& network() const noexcept { return m_network; }
    const ReplayBuffer& replayBuffer() const noexcept { return m_replay; }
    const ElasticWeightConsolidation& ewc() const noexcept { return m_ewc; }
    const MotifWeightTable& motifWeights() const noexcept { return m_motifs; }
    MotifWeightTable& motifWeights() noexcept { return m_motifs; }
    const EmbeddingGenerator& generator() const noexcept { return *m_generator; }
    double learningRate() const noexcept { return m_optimizer.learningRate(); }

    static std::string stateName(TrainerState state);

private:
    std::vector<TrainingSample> freshBatch(const SimilarityGraph& graph);
    std::vector<TrainingSample> replayBatch();
    double trainStep(const std::vector<TrainingSample>& batch);
    void recordBatch(const std::vector<TrainingSample>& batch);

    TrainerConfig m_config;
    MotifWeightTable m_motifs;
    std::unique_ptr<EmbeddingGenerator> m_generator;
    GraphNetwork m_network;
    AdamOptimizer m_optimizer;
    LearningRateScheduler m_scheduler;
    ElasticWeightConsolidation m_ewc;
    ReplayBuffer m_replay;
    std::mt19937 m_rng;
    TrainingMetrics m_metrics;
    TrainerState m_state = TrainerState::IDLE;
};
