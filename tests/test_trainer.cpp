#include "ContinualTrainer.h"
#include "HelixExceptions.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using HelixTest::LookupEmbedder;

namespace {
std::unique_ptr<EmbeddingGenerator> sequenceEmbedder() {
    auto table = HelixTest::clusterTable();
    table["ACGTACGTAC"] = table["QA"];
    table["ACGTACGTTT"] = table["A1"];
    table["TTTTGGGG"] = table["B1"];
    table["GGGGCCCC"] = table["B2"];
    return std::make_unique<LookupEmbedder>(HelixTest::kClusterDim, table);
}

class ScriptedOracle : public ValidationOracle {
public:
    explicit ScriptedOracle(std::unordered_map<std::string, bool> verdicts) : m_verdicts(std::move(verdicts)) {}

    OracleVerdict validate(const std::string&, const std::string& candidateId) override {
        const bool match = m_verdicts.at(candidateId);
        return {match, match ? 0.9 : 0.1};
    }

private:
    std::unordered_map<std::string, bool> m_verdicts;
};

// Throws a non-Helix exception for one payload.
class FailingEmbedder : public LookupEmbedder {
public:
    FailingEmbedder() : LookupEmbedder(HelixTest::kClusterDim, HelixTest::clusterTable()) {}

    Tensor embed(const std::string& payload) const override {
        if (payload == "BOOM") throw std::runtime_error("embedder failure");
        return LookupEmbedder::embed(payload);
    }
};
} // namespace

// ===== Construction =====

TEST(ContinualTrainerTest, RejectsMismatchedDimensions) {
    TrainerConfig config = HelixTest::smallTrainerConfig();
    EXPECT_THROW(ContinualTrainer(config, std::make_unique<LookupEmbedder>(4, HelixTest::clusterTable())),
                 Helix::ConfigurationException);

    config.network.outputDim = 4;
    EXPECT_THROW(ContinualTrainer(config, HelixTest::clusterEmbedder()), Helix::ConfigurationException);
}

TEST(ContinualTrainerTest, DefaultsToKmerEmbedderOfInputWidth) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig());
    EXPECT_EQ(trainer.generator().dimension(), HelixTest::kClusterDim);
    EXPECT_EQ(trainer.state(), TrainerState::IDLE);
    EXPECT_FALSE(trainer.network().isTrained());
}

// ===== Training =====

TEST(ContinualTrainerTest, TrainingRecordsOneMetricPerEpoch) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig(), HelixTest::clusterEmbedder());
    const auto corpus = HelixTest::clusterCorpus();

    const TrainingMetrics run = trainer.train(corpus, corpus, 6);
    EXPECT_EQ(run.loss.size(), 6u);
    EXPECT_EQ(run.accuracy.size(), 6u);
    EXPECT_EQ(run.distributionShift.size(), 6u);
    EXPECT_EQ(run.learningRate.size(), 6u);
    for (size_t e = 0; e < run.loss.size(); ++e) {
        EXPECT_TRUE(std::isfinite(run.loss[e]));
        EXPECT_GE(run.accuracy[e], 0.0);
        EXPECT_LE(run.accuracy[e], 1.0);
        EXPECT_GE(run.learningRate[e], trainer.config().minLearningRate);
    }
    for (size_t epoch : run.consolidationEpochs) {
        EXPECT_GT(epoch, 0u);
        EXPECT_EQ(epoch % trainer.config().consolidationInterval, 0u);
    }
    EXPECT_EQ(trainer.ewc().taskCount(), run.consolidationEpochs.size());

    EXPECT_EQ(trainer.state(), TrainerState::TRAINED);
    EXPECT_TRUE(trainer.network().isTrained());
    EXPECT_FALSE(trainer.replayBuffer().empty());

    // A second invocation appends to the cumulative history.
    trainer.train(corpus, corpus, 2);
    EXPECT_EQ(trainer.metrics().loss.size(), 8u);
}

TEST(ContinualTrainerTest, TrainingNeedsTwoEntities) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig(), HelixTest::clusterEmbedder());
    const std::vector<Entity> lonely = {{"a1", "A1", {}}};
    EXPECT_THROW(trainer.train(lonely, lonely, 3), Helix::HelixException);
    EXPECT_EQ(trainer.state(), TrainerState::IDLE);
    EXPECT_FALSE(trainer.network().isTrained());
}

TEST(ContinualTrainerTest, ForeignExceptionRestoresState) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig(), std::make_unique<FailingEmbedder>());
    std::vector<Entity> corpus = HelixTest::clusterCorpus();
    corpus.push_back({"bad", "BOOM", {}});
    EXPECT_THROW(trainer.train(corpus, corpus, 2), std::runtime_error);
    EXPECT_EQ(trainer.state(), TrainerState::IDLE);

    trainer.train(HelixTest::clusterCorpus(), HelixTest::clusterCorpus(), 2);
    EXPECT_THROW(trainer.train(corpus, corpus, 2), std::runtime_error);
    EXPECT_EQ(trainer.state(), TrainerState::TRAINED);
}

// ===== Evaluation =====

TEST(ContinualTrainerTest, EvaluationExcludesUnresolvableSamples) {
    TrainerConfig config = HelixTest::smallTrainerConfig();
    config.searchRawWeight = 1.0;
    ContinualTrainer trainer(config, HelixTest::clusterEmbedder());
    const auto embedder = HelixTest::clusterEmbedder();
    const SimilarityGraph graph = SimilarityGraph::build(HelixTest::clusterCorpus(), *embedder);

    const std::vector<Entity> validation = {
        {"a1", "A1", {"a2", "a3"}},
        {"q", "QA", {"a1", "a3"}},
        {"b1", "B1", {}},
        {"x", "B2", {"missing"}},
    };
    const EvaluationResult result = trainer.evaluate(validation, graph);
    EXPECT_EQ(result.evaluated, 2u);
    EXPECT_EQ(result.correct, 2u);
    EXPECT_EQ(result.excluded, 2u);
    EXPECT_DOUBLE_EQ(result.accuracy, 1.0);

    EXPECT_DOUBLE_EQ(trainer.evaluate({}, graph).accuracy, 0.0);
}

// ===== Search =====

TEST(ContinualTrainerTest, UntrainedSearchUsesRawCosine) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig(), HelixTest::clusterEmbedder());
    const auto results = trainer.search("QA", HelixTest::clusterCorpus(), 3);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        EXPECT_EQ(r.id[0], 'a');
        EXPECT_DOUBLE_EQ(r.similarity, r.rawSimilarity);
        EXPECT_DOUBLE_EQ(r.similarity, r.refinedSimilarity);
    }
    EXPECT_TRUE(trainer.search("QA", {}, 3).empty());
    EXPECT_TRUE(trainer.search("QA", HelixTest::clusterCorpus(), 0).empty());
}

TEST(ContinualTrainerTest, TrainedSearchBlendsRawAndRefinedScores) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig(), HelixTest::clusterEmbedder());
    const auto corpus = HelixTest::clusterCorpus();
    trainer.train(corpus, corpus, 3);

    const auto results = trainer.search("QA", corpus, 10);
    ASSERT_EQ(results.size(), corpus.size());
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        EXPECT_NEAR(r.similarity, 0.5 * r.rawSimilarity + 0.5 * r.refinedSimilarity, 1e-12);
        if (i > 0) EXPECT_GE(results[i - 1].similarity, r.similarity);
    }
}

TEST(ContinualTrainerTest, RawWeightOneRanksNearestClusterFirst) {
    TrainerConfig config = HelixTest::smallTrainerConfig();
    config.searchRawWeight = 1.0;
    ContinualTrainer trainer(config, HelixTest::clusterEmbedder());
    const auto corpus = HelixTest::clusterCorpus();
    trainer.train(corpus, corpus, 2);

    const auto results = trainer.search("QA", corpus, 3);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) EXPECT_EQ(r.id[0], 'a');
}

TEST(ContinualTrainerTest, TrainedBlendedSearchKeepsClustersApart) {
    const auto corpus = HelixTest::clusterCorpus();
    for (unsigned seed : {7u, 1u, 1337u}) {
        TrainerConfig config = HelixTest::smallTrainerConfig();
        config.seed = seed;
        ContinualTrainer trainer(config, HelixTest::clusterEmbedder());
        trainer.train(corpus, corpus, 20);
        ASSERT_TRUE(trainer.network().isTrained());

        const auto results = trainer.search("A1", corpus, corpus.size());
        ASSERT_EQ(results.size(), corpus.size());
        std::unordered_map<std::string, size_t> rank;
        for (size_t i = 0; i < results.size(); ++i) rank[results[i].id] = i;
        for (const char* near : {"a2", "a3"}) {
            for (const char* far : {"b1", "b2"}) {
                EXPECT_LT(rank.at(near), rank.at(far)) << near << " vs " << far << " (seed " << seed << ")";
            }
        }
    }
}

TEST(ContinualTrainerTest, SavedParametersReproduceSearch) {
    const auto corpus = HelixTest::clusterCorpus();
    ContinualTrainer source(HelixTest::smallTrainerConfig(), HelixTest::clusterEmbedder());
    source.train(corpus, corpus, 3);

    TrainerConfig other = HelixTest::smallTrainerConfig();
    other.seed = 99;
    ContinualTrainer target(other, HelixTest::clusterEmbedder());
    target.loadParameters(source.saveParameters());
    EXPECT_TRUE(target.network().isTrained());

    const auto expected = source.search("QA", corpus, 5);
    const auto actual = target.search("QA", corpus, 5);
    ASSERT_EQ(expected.size(), actual.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(expected[i].id, actual[i].id);
        EXPECT_DOUBLE_EQ(expected[i].similarity, actual[i].similarity);
    }
}

// ===== Feedback =====

TEST(ContinualTrainerTest, FeedbackAdjustsMotifsForMissesAndFalsePositives) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig(), sequenceEmbedder());
    const std::vector<Entity> retrieved = {
        {"fp", "ACGTACGTTT", {}},
        {"miss", "TTTTGGGG", {}},
        {"unlabeled", "GGGGCCCC", {}},
    };
    const std::unordered_map<std::string, FeedbackLabel> labels = {
        {"fp", {false, 0.9}},
        {"miss", {true, 0.8}},
    };

    const FeedbackSummary summary = trainer.learnFromFeedback("ACGTACGTAC", retrieved, labels);
    EXPECT_EQ(summary.processed, 2u);
    EXPECT_EQ(summary.downweighted, 1u);
    EXPECT_EQ(summary.upweighted, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    // Only the false positive shares motifs with the query.
    EXPECT_EQ(summary.motifsAdjusted, 11u);
    EXPECT_DOUBLE_EQ(trainer.motifWeights().weight("ACGT"), 0.9);
    EXPECT_EQ(trainer.replayBuffer().size(), 2u);
}

TEST(ContinualTrainerTest, ConfidentCorrectJudgementsLeaveMotifsAlone) {
    ContinualTrainer trainer(HelixTest::smallTrainerConfig(), sequenceEmbedder());
    const std::vector<Entity> retrieved = {{"hit", "ACGTACGTTT", {}}, {"reject", "TTTTGGGG", {}}};
    ScriptedOracle oracle({{"hit", true}, {"reject", false}});

    const FeedbackSummary summary = trainer.learnFromFeedback(Entity{"q", "ACGTACGTAC", {}}, retrieved, oracle);
    EXPECT_EQ(summary.processed, 2u);
    EXPECT_EQ(summary.upweighted, 0u);
    EXPECT_EQ(summary.downweighted, 0u);
    EXPECT_EQ(summary.motifsAdjusted, 0u);
    EXPECT_FALSE(trainer.motifWeights().contains("ACGT"));
}

TEST(ContinualTrainerTest, StateNames) {
    EXPECT_EQ(ContinualTrainer::stateName(TrainerState::IDLE), "idle");
    EXPECT_EQ(ContinualTrainer::stateName(TrainerState::CONSOLIDATING), "consolidating");
    EXPECT_EQ(ContinualTrainer::stateName(TrainerState::TRAINED), "trained");
}
