#include "ContinualTrainer.h"

#include "CommonUtils.h"
#include "HelixExceptions.h"
#include "KmerEmbedder.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace {
constexpr double kNumericEps = 1e-12;
// Fresh-sample rankings need an anchor plus at least one other node.
constexpr size_t kMinTrainingNodes = 2;
// Decay horizon of warmup_linear, in update() calls per epoch.
constexpr size_t kWarmupHorizonPerEpoch = 100;

SchedulerConfig schedulerConfigFor(const TrainerConfig& config, size_t epochs) {
    SchedulerConfig sc;
    sc.policy = config.scheduler;
    sc.baseLearningRate = config.learningRate;
    sc.minLearningRate = config.minLearningRate;
    sc.totalEpochs = epochs;
    sc.warmupSteps = config.warmupSteps;
    sc.totalSteps = epochs * kWarmupHorizonPerEpoch;
    sc.plateauPatience = config.plateauPatience;
    sc.plateauFactor = config.plateauFactor;
    return sc;
}

NetworkConfig networkConfigFor(const TrainerConfig& config) {
    NetworkConfig nc = config.network;
    nc.seed = config.seed;
    return nc;
}

double blendedScore(double raw, double refined, double rawWeight) {
    return rawWeight * raw + (1.0 - rawWeight) * refined;
}
} // namespace

ContinualTrainer::ContinualTrainer(const TrainerConfig& config, std::unique_ptr<EmbeddingGenerator> generator)
    : m_config(config),
      m_generator(std::move(generator)),
      m_network(networkConfigFor(config)),
      m_optimizer(AdamConfig{config.learningRate}),
      m_scheduler(schedulerConfigFor(config, config.epochs)),
      m_ewc(config.ewcLambda),
      m_replay(config.replayBufferSize, config.reservoirPolicy, config.seed),
      m_rng(config.seed) {
    if (!m_generator) {
        m_generator = std::make_unique<KmerEmbedder>(m_motifs, config.network.inputDim, config.kmerSizes,
                                                     config.motifWeighting, config.codonAware);
    }
    if (m_generator->dimension() != config.network.inputDim) {
        throw Helix::ConfigurationException("embedding generator produces " + std::to_string(m_generator->dimension()) +
                                            " values but the network expects " +
                                            std::to_string(config.network.inputDim));
    }
    if (config.network.outputDim != config.network.inputDim) {
        throw Helix::ConfigurationException("outputDim must equal inputDim so refined and raw embeddings are comparable");
    }
}

std::string ContinualTrainer::stateName(TrainerState state) {
    switch (state) {
        case TrainerState::IDLE: return "idle";
        case TrainerState::BUILDING_GRAPH: return "building_graph";
        case TrainerState::TRAINING: return "training";
        case TrainerState::EVALUATING: return "evaluating";
        case TrainerState::CONSOLIDATING: return "consolidating";
        case TrainerState::TRAINED: return "trained";
    }
    return "idle";
}

TrainingMetrics ContinualTrainer::train(const std::vector<Entity>& trainingSet,
                                        const std::vector<Entity>& validationSet,
                                        size_t epochs) {
    if (epochs == 0) epochs = m_config.epochs;
    const TrainerState entryState = m_state;

    try {
        m_state = TrainerState::BUILDING_GRAPH;
        const SimilarityGraph graph = SimilarityGraph::build(trainingSet, *m_generator, m_config.edgeThreshold);
        if (graph.nodeCount() < kMinTrainingNodes) {
            throw Helix::HelixException("training needs at least " + std::to_string(kMinTrainingNodes) + " entities");
        }
        if (m_config.verbose) {
            std::cout << "[Helix] Similarity graph: " << graph.nodeCount() << " nodes, " << graph.edgeCount()
                      << " edges (threshold " << m_config.edgeThreshold << ")" << std::endl;
        }

        m_scheduler = LearningRateScheduler(schedulerConfigFor(m_config, epochs));
        m_optimizer.setLearningRate(m_config.learningRate);

        TrainingMetrics run;
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        const double temperature = m_config.network.temperature;

        for (size_t epoch = 0; epoch < epochs; ++epoch) {
            m_state = TrainerState::TRAINING;
            std::vector<TrainingSample> batch;
            if (!m_replay.empty() && unit(m_rng) < m_config.replayProbability) {
                batch = replayBatch();
            } else {
                batch = freshBatch(graph);
            }

            const double loss = trainStep(batch);
            recordBatch(batch);

            m_state = TrainerState::EVALUATING;
            const EvaluationResult eval = evaluate(validationSet, graph);
            const double lr = m_scheduler.update(epoch, eval.accuracy);
            m_optimizer.setLearningRate(lr);

            const double shift = m_replay.detectDistributionShift(m_config.shiftWindow);

            run.loss.push_back(loss);
            run.accuracy.push_back(eval.accuracy);
            run.distributionShift.push_back(shift);
            run.learningRate.push_back(lr);

            const size_t interval = m_config.consolidationInterval;
            if (epoch > 0 && interval > 0 && epoch % interval == 0 && shift > m_config.shiftThreshold) {
                m_state = TrainerState::CONSOLIDATING;
                if (m_config.verbose) {
                    std::ostringstream line;
                    line << std::fixed << std::setprecision(4) << shift;
                    std::cout << "[Helix] Epoch " << epoch << ": distribution shift " << line.str()
                              << ", consolidating weights" << std::endl;
                }
                m_ewc.consolidate(m_network, batch, temperature);
                run.consolidationEpochs.push_back(epoch);
            }

            if (m_config.verbose && (epoch % 10 == 0 || epoch + 1 == epochs)) {
                std::ostringstream line;
                line << "[Epoch " << std::setw(3) << epoch << "/" << epochs << "] Loss: " << std::fixed
                     << std::setprecision(4) << loss << " | Accuracy: " << std::setprecision(2)
                     << eval.accuracy * 100.0 << "% | LR: " << std::scientific << std::setprecision(2) << lr;
                std::cout << line.str() << std::endl;
            }
        }

        m_network.setTrained(true);
        m_state = TrainerState::TRAINED;

        m_metrics.loss.insert(m_metrics.loss.end(), run.loss.begin(), run.loss.end());
        m_metrics.accuracy.insert(m_metrics.accuracy.end(), run.accuracy.begin(), run.accuracy.end());
        m_metrics.distributionShift.insert(m_metrics.distributionShift.end(), run.distributionShift.begin(),
                                           run.distributionShift.end());
        m_metrics.learningRate.insert(m_metrics.learningRate.end(), run.learningRate.begin(), run.learningRate.end());
        m_metrics.consolidationEpochs.insert(m_metrics.consolidationEpochs.end(), run.consolidationEpochs.begin(),
                                             run.consolidationEpochs.end());
        return run;
    } catch (const std::exception&) {
        m_state = entryState == TrainerState::TRAINED ? TrainerState::TRAINED : TrainerState::IDLE;
        throw;
    }
}

std::vector<TrainingSample> ContinualTrainer::freshBatch(const SimilarityGraph& graph) {
    const auto& nodes = graph.nodes();
    const size_t count = std::min(m_config.batchSize, nodes.size());
    std::uniform_int_distribution<size_t> pick(0, nodes.size() - 1);

    std::vector<TrainingSample> batch;
    batch.reserve(count);
    for (size_t s = 0; s < count; ++s) {
        const size_t idx = pick(m_rng);
        const Tensor& anchor = nodes[idx].embedding;

        std::vector<std::pair<double, size_t>> ranking;
        ranking.reserve(nodes.size() - 1);
        for (size_t j = 0; j < nodes.size(); ++j) {
            if (j == idx) continue;
            ranking.emplace_back(anchor.cosine(nodes[j].embedding), j);
        }
        std::stable_sort(ranking.begin(), ranking.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        TrainingSample sample;
        sample.anchor = anchor;
        const size_t posCount = std::min(m_config.positivesPerSample, ranking.size());
        for (size_t p = 0; p < posCount; ++p) sample.positives.push_back(nodes[ranking[p].second].embedding);

        // Negatives are the least similar of what remains, so the two sets never overlap.
        const size_t remaining = ranking.size() - posCount;
        const size_t negCount = std::min(m_config.negativesPerSample, remaining);
        for (size_t n = ranking.size() - negCount; n < ranking.size(); ++n) {
            sample.negatives.push_back(nodes[ranking[n].second].embedding);
        }

        Neighborhood hood = graph.neighborsOf(idx);
        sample.neighbors = std::move(hood.embeddings);
        sample.neighborWeights = std::move(hood.weights);
        batch.push_back(std::move(sample));
    }
    return batch;
}

std::vector<TrainingSample> ContinualTrainer::replayBatch() {
    std::vector<ReplayExemplar> exemplars = m_replay.sample(m_config.batchSize);
    std::vector<TrainingSample> batch;
    batch.reserve(exemplars.size());
    for (auto& ex : exemplars) batch.push_back(std::move(ex.sample));
    return batch;
}

double ContinualTrainer::trainStep(const std::vector<TrainingSample>& batch) {
    if (batch.empty()) return 0.0;

    const double temperature = m_config.network.temperature;
    GradientResult result = m_network.computeGradients(batch, temperature);
    const std::vector<ParameterRef> params = m_network.parameters();
    const double invBatch = 1.0 / static_cast<double>(batch.size());

    const double penalty = m_ewc.penalty(params);
    if (m_ewc.isConsolidated()) {
        const std::vector<Tensor> penaltyGrads = m_ewc.penaltyGradient(params);
        for (size_t i = 0; i < result.gradients.size(); ++i) {
            result.gradients[i].addScaledInPlace(penaltyGrads[i], invBatch);
        }
    }

    if (m_config.gradientClipNorm > 0.0) {
        double sq = 0.0;
        for (const auto& g : result.gradients) {
            for (double v : g.data()) sq += v * v;
        }
        const double norm = std::sqrt(sq);
        if (norm > m_config.gradientClipNorm && norm > kNumericEps) {
            const double scale = m_config.gradientClipNorm / norm;
            for (auto& g : result.gradients) {
                for (double& v : g.data()) v *= scale;
            }
        }
    }

    m_optimizer.step(params, result.gradients);
    return result.loss + penalty * invBatch;
}

void ContinualTrainer::recordBatch(const std::vector<TrainingSample>& batch) {
    for (const auto& sample : batch) {
        ReplayExemplar ex;
        ex.similarity = sample.positives.empty() ? 0.0 : sample.anchor.cosine(sample.positives.front());
        ex.sample = sample;
        m_replay.add(std::move(ex));
    }
}

NetworkOutput ContinualTrainer::forward(const Tensor& node,
                                        const std::vector<Tensor>& neighbors,
                                        const std::vector<double>* edgeWeights) {
    return m_network.forward(node, neighbors, edgeWeights, false);
}

Tensor ContinualTrainer::refine(const Tensor& rawEmbedding, const SimilarityGraph& graph, std::optional<size_t> selfIndex) {
    const Neighborhood hood = selfIndex ? graph.neighborsOf(*selfIndex) : graph.neighborsFor(rawEmbedding);
    const std::vector<double>* weights = hood.empty() ? nullptr : &hood.weights;
    return m_network.forward(rawEmbedding, hood.embeddings, weights, false).embedding;
}

EvaluationResult ContinualTrainer::evaluate(const std::vector<Entity>& validationSet, const SimilarityGraph& graph) {
    EvaluationResult result;
    const auto& nodes = graph.nodes();

    std::vector<Tensor> refinedNodes;
    refinedNodes.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) refinedNodes.push_back(refine(nodes[i].embedding, graph, i));

    for (const auto& sample : validationSet) {
        try {
            if (sample.expectedSimilar.empty()) {
                throw Helix::IndexNotFoundException("sample '" + sample.id + "' has no expected matches");
            }
            for (const auto& expected : sample.expectedSimilar) graph.requireIndex(expected);

            const std::optional<size_t> selfIndex = graph.indexOf(sample.id);
            const Tensor raw = selfIndex ? nodes[*selfIndex].embedding : m_generator->embed(sample.payload);
            const Tensor refined = refine(raw, graph, selfIndex);

            double bestScore = -std::numeric_limits<double>::infinity();
            std::optional<size_t> best;
            for (size_t i = 0; i < nodes.size(); ++i) {
                if (nodes[i].id == sample.id) continue;
                const double score = blendedScore(raw.cosine(nodes[i].embedding), refined.cosine(refinedNodes[i]),
                                                  m_config.searchRawWeight);
                if (score > bestScore) {
                    bestScore = score;
                    best = i;
                }
            }
            if (!best) throw Helix::IndexNotFoundException("no candidate nodes for sample '" + sample.id + "'");

            ++result.evaluated;
            const std::string& predicted = nodes[*best].id;
            if (std::find(sample.expectedSimilar.begin(), sample.expectedSimilar.end(), predicted) !=
                sample.expectedSimilar.end()) {
                ++result.correct;
            }
        } catch (const Helix::IndexNotFoundException& e) {
            ++result.excluded;
            if (m_config.verbose) std::cerr << "[Helix Warning] Evaluation skipped: " << e.what() << std::endl;
        }
    }

    result.accuracy = result.evaluated
                          ? static_cast<double>(result.correct) / static_cast<double>(result.evaluated)
                          : 0.0;
    return result;
}

std::vector<SearchResult> ContinualTrainer::search(const std::string& queryPayload,
                                                   const std::vector<Entity>& corpus,
                                                   size_t topK) {
    std::vector<SearchResult> results;
    if (corpus.empty() || topK == 0) return results;

    const Tensor rawQuery = m_generator->embed(queryPayload);
    results.reserve(corpus.size());

    if (!m_network.isTrained()) {
        for (const auto& entity : corpus) {
            const double raw = rawQuery.cosine(m_generator->embed(entity.payload));
            results.push_back({entity.id, raw, raw, raw});
        }
    } else {
        const SimilarityGraph graph = SimilarityGraph::build(corpus, *m_generator, m_config.edgeThreshold);
        const Tensor refinedQuery = refine(rawQuery, graph, std::nullopt);
        const auto& nodes = graph.nodes();
        for (size_t i = 0; i < nodes.size(); ++i) {
            const double raw = rawQuery.cosine(nodes[i].embedding);
            const double refined = refinedQuery.cosine(refine(nodes[i].embedding, graph, i));
            results.push_back({nodes[i].id, blendedScore(raw, refined, m_config.searchRawWeight), raw, refined});
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) { return a.similarity > b.similarity; });
    if (results.size() > topK) results.resize(topK);
    return results;
}

FeedbackSummary ContinualTrainer::learnFromFeedback(const std::string& queryPayload,
                                                    const std::vector<Entity>& retrieved,
                                                    const std::unordered_map<std::string, FeedbackLabel>& labels) {
    FeedbackSummary summary;
    const std::string querySeq = CommonUtils::normalizeNucleotides(queryPayload);
    const Tensor queryEmbedding = m_generator->embed(queryPayload);

    for (const auto& entity : retrieved) {
        auto it = labels.find(entity.id);
        if (it == labels.end()) {
            ++summary.skipped;
            continue;
        }
        const FeedbackLabel& label = it->second;
        const Tensor embedding = m_generator->embed(entity.payload);
        const double similarity = queryEmbedding.cosine(embedding);
        const std::string seq = CommonUtils::normalizeNucleotides(entity.payload);

        if (label.isMatch && similarity < m_config.missedMatchThreshold) {
            summary.motifsAdjusted += m_motifs.adjustShared(querySeq, seq, m_config.upweightFactor,
                                                            m_config.feedbackMotifSizes);
            ++summary.upweighted;
        } else if (!label.isMatch && similarity > m_config.falsePositiveThreshold) {
            summary.motifsAdjusted += m_motifs.adjustShared(querySeq, seq, m_config.downweightFactor,
                                                            m_config.feedbackMotifSizes);
            ++summary.downweighted;
        }

        ReplayExemplar ex;
        ex.sample.anchor = queryEmbedding;
        if (label.isMatch) {
            ex.sample.positives.push_back(embedding);
        } else {
            ex.sample.negatives.push_back(embedding);
        }
        ex.similarity = similarity;
        m_replay.add(std::move(ex));
        ++summary.processed;
    }

    if (m_config.verbose) {
        std::cout << "[Helix] Feedback: " << summary.processed << " judged, " << summary.upweighted
                  << " missed matches, " << summary.downweighted << " false positives, " << summary.motifsAdjusted
                  << " motif weights adjusted" << std::endl;
    }
    return summary;
}

FeedbackSummary ContinualTrainer::learnFromFeedback(const Entity& query,
                                                    const std::vector<Entity>& retrieved,
                                                    ValidationOracle& oracle) {
    std::unordered_map<std::string, FeedbackLabel> labels;
    for (const auto& entity : retrieved) {
        const OracleVerdict verdict = oracle.validate(query.id, entity.id);
        labels[entity.id] = FeedbackLabel{verdict.isMatch, verdict.confidence};
    }
    return learnFromFeedback(query.payload, retrieved, labels);
}
