#include "ContrastiveLoss.h"
#include "GraphAttentionLayer.h"
#include "GraphNetwork.h"
#include "HelixExceptions.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

namespace {
Tensor randomVector(size_t n, std::mt19937& rng) {
    return Tensor::uniformRandom({n}, 1.0, rng);
}

NetworkConfig smallNetwork(size_t layers, double dropout) {
    NetworkConfig config;
    config.inputDim = 4;
    config.hiddenDim = 5;
    config.outputDim = 4;
    config.numLayers = layers;
    config.dropout = dropout;
    config.temperature = 0.5;
    config.seed = 42;
    return config;
}

double sampleLoss(GraphNetwork& network, const TrainingSample& sample, double temperature) {
    const std::vector<double>* weights = sample.neighborWeights.empty() ? nullptr : &sample.neighborWeights;
    const NetworkOutput out = network.forward(sample.anchor, sample.neighbors, weights, false);
    return ContrastiveLoss::infoNCE(out.embedding, sample.positives, sample.negatives, temperature);
}

bool sameParameters(GraphNetwork& a, GraphNetwork& b) {
    auto pa = a.parameters();
    auto pb = b.parameters();
    if (pa.size() != pb.size()) return false;
    for (size_t i = 0; i < pa.size(); ++i) {
        if (pa[i].tensor->data() != pb[i].tensor->data()) return false;
    }
    return true;
}
} // namespace

// ===== Network =====

TEST(GraphNetworkTest, EmptyNeighborhoodSubstitutesSelf) {
    GraphNetwork network(smallNetwork(2, 0.0));
    std::mt19937 rng(5);
    const Tensor node = randomVector(4, rng);

    const NetworkOutput lonely = network.forward(node, {}, nullptr, false);
    const NetworkOutput self = network.forward(node, {node}, nullptr, false);
    ASSERT_EQ(lonely.embedding.size(), 4u);
    ASSERT_EQ(lonely.attention.size(), 2u);
    for (size_t i = 0; i < 4; ++i) EXPECT_NEAR(lonely.embedding[i], self.embedding[i], 1e-12);
}

TEST(GraphNetworkTest, ParametersFollowLayerOrder) {
    GraphNetwork network(smallNetwork(2, 0.0));
    const auto params = network.parameters();
    ASSERT_EQ(params.size(), 2 * GraphAttentionLayer::kParameterCount);
    EXPECT_EQ(params[0].name, "layer0.Wq");
    EXPECT_EQ(params[GraphAttentionLayer::kParameterCount].name, "layer1.Wq");

    // Shallow aggregation: every layer attends over raw input-width neighbors.
    EXPECT_EQ(params[GraphAttentionLayer::WK].tensor->shape(), std::vector<size_t>({4, 5}));
    EXPECT_EQ(params[GraphAttentionLayer::kParameterCount + GraphAttentionLayer::WK].tensor->shape(),
              std::vector<size_t>({4, 4}));
    EXPECT_EQ(params[GraphAttentionLayer::WZ].tensor->shape(), std::vector<size_t>({10, 5}));
}

TEST(GraphNetworkTest, RejectsInvalidConfiguration) {
    NetworkConfig config = smallNetwork(0, 0.0);
    EXPECT_THROW(GraphNetwork{config}, Helix::ConfigurationException);
    config = smallNetwork(1, 1.0);
    EXPECT_THROW(GraphNetwork{config}, Helix::ConfigurationException);
}

// ===== Gradients =====

TEST(GraphNetworkTest, AnalyticGradientsMatchFiniteDifferences) {
    const double temperature = 0.5;
    GraphNetwork network(smallNetwork(2, 0.0));
    std::mt19937 rng(11);

    TrainingSample sample;
    sample.anchor = randomVector(4, rng);
    sample.positives = {randomVector(4, rng)};
    sample.negatives = {randomVector(4, rng), randomVector(4, rng)};
    sample.neighbors = {randomVector(4, rng), randomVector(4, rng)};
    sample.neighborWeights = {0.8, 0.4};

    std::vector<Tensor> grads = network.zeroGradients();
    network.accumulateSampleGradients(sample, temperature, grads);

    const double h = 1e-6;
    auto params = network.parameters();
    size_t checked = 0;
    for (size_t p = 0; p < params.size(); ++p) {
        Tensor& tensor = *params[p].tensor;
        // A few entries per tensor keep the check fast.
        const size_t stride = std::max<size_t>(1, tensor.size() / 4);
        for (size_t i = 0; i < tensor.size(); i += stride) {
            const double original = tensor[i];
            tensor[i] = original + h;
            const double plus = sampleLoss(network, sample, temperature);
            tensor[i] = original - h;
            const double minus = sampleLoss(network, sample, temperature);
            tensor[i] = original;

            const double numeric = (plus - minus) / (2.0 * h);
            const double analytic = grads[p][i];
            EXPECT_NEAR(analytic, numeric, 1e-5 + 1e-3 * std::fabs(numeric))
                << params[p].name << "[" << i << "]";
            ++checked;
        }
    }
    EXPECT_GT(checked, 50u);
}

TEST(GraphNetworkTest, OutputProjectionReceivesNoGradient) {
    GraphNetwork network(smallNetwork(1, 0.0));
    std::mt19937 rng(12);

    TrainingSample sample;
    sample.anchor = randomVector(4, rng);
    sample.positives = {randomVector(4, rng)};
    sample.negatives = {randomVector(4, rng)};

    std::vector<Tensor> grads = network.zeroGradients();
    network.accumulateSampleGradients(sample, 0.5, grads);
    EXPECT_DOUBLE_EQ(grads[GraphAttentionLayer::WO].norm(), 0.0);
    EXPECT_GT(grads[GraphAttentionLayer::WQ].norm(), 0.0);
}

TEST(GraphNetworkTest, ComputeGradientsAveragesOverBatch) {
    GraphNetwork network(smallNetwork(1, 0.0));
    std::mt19937 rng(13);

    TrainingSample sample;
    sample.anchor = randomVector(4, rng);
    sample.positives = {randomVector(4, rng)};
    sample.negatives = {randomVector(4, rng)};

    const GradientResult single = network.computeGradients({sample}, 0.5);
    const GradientResult doubled = network.computeGradients({sample, sample}, 0.5);
    EXPECT_NEAR(single.loss, doubled.loss, 1e-12);
    for (size_t p = 0; p < single.gradients.size(); ++p) {
        for (size_t i = 0; i < single.gradients[p].size(); ++i) {
            EXPECT_NEAR(single.gradients[p][i], doubled.gradients[p][i], 1e-12);
        }
    }
}

// ===== Persistence =====

TEST(GraphNetworkTest, ParametersRoundTripThroughBlob) {
    GraphNetwork source(smallNetwork(2, 0.1));
    source.setTrained(true);
    NetworkConfig otherSeed = smallNetwork(2, 0.1);
    otherSeed.seed = 7;
    GraphNetwork target(otherSeed);
    ASSERT_FALSE(sameParameters(source, target));

    target.loadParameters(source.saveParameters());
    EXPECT_TRUE(sameParameters(source, target));
    EXPECT_TRUE(target.isTrained());

    std::mt19937 rng(21);
    const Tensor node = randomVector(4, rng);
    const std::vector<Tensor> neighbors = {randomVector(4, rng)};
    const Tensor a = source.forward(node, neighbors, nullptr, false).embedding;
    const Tensor b = target.forward(node, neighbors, nullptr, false).embedding;
    EXPECT_EQ(a.data(), b.data());
}

TEST(GraphNetworkTest, CorruptBlobsLeaveNetworkUntouched) {
    GraphNetwork source(smallNetwork(2, 0.0));
    const std::vector<uint8_t> blob = source.saveParameters();

    NetworkConfig otherSeed = smallNetwork(2, 0.0);
    otherSeed.seed = 9;
    GraphNetwork target(otherSeed);
    GraphNetwork pristine(otherSeed);

    std::vector<uint8_t> flipped = blob;
    flipped[flipped.size() / 2] ^= 0x40;
    EXPECT_THROW(target.loadParameters(flipped), Helix::ModelFormatException);
    EXPECT_TRUE(sameParameters(target, pristine));

    std::vector<uint8_t> truncated(blob.begin(), blob.begin() + static_cast<long>(blob.size() - 20));
    EXPECT_THROW(target.loadParameters(truncated), Helix::ModelFormatException);
    EXPECT_TRUE(sameParameters(target, pristine));

    std::vector<uint8_t> badSignature = blob;
    badSignature[0] = 'X';
    EXPECT_THROW(target.loadParameters(badSignature), Helix::ModelFormatException);
    EXPECT_THROW(target.loadParameters({}), Helix::ModelFormatException);
    EXPECT_TRUE(sameParameters(target, pristine));
    EXPECT_FALSE(target.isTrained());
}

TEST(GraphNetworkTest, ArchitectureMismatchIsRejected) {
    GraphNetwork twoLayers(smallNetwork(2, 0.0));
    GraphNetwork oneLayer(smallNetwork(1, 0.0));
    EXPECT_THROW(oneLayer.loadParameters(twoLayers.saveParameters()), Helix::ModelFormatException);

    NetworkConfig wider = smallNetwork(2, 0.0);
    wider.hiddenDim = 6;
    GraphNetwork widerNet(wider);
    EXPECT_THROW(widerNet.loadParameters(twoLayers.saveParameters()), Helix::ModelFormatException);
}

TEST(GraphNetworkTest, ModelFileRoundTripAndMissingFile) {
    const std::string path = "helix_graph_network_test.bin";
    GraphNetwork source(smallNetwork(1, 0.0));
    source.saveModelBinary(path);

    NetworkConfig otherSeed = smallNetwork(1, 0.0);
    otherSeed.seed = 3;
    GraphNetwork target(otherSeed);
    target.loadModelBinary(path);
    EXPECT_TRUE(sameParameters(source, target));
    std::remove(path.c_str());

    EXPECT_THROW(target.loadModelBinary("no/such/dir/model.bin"), Helix::IOException);
    EXPECT_THROW(source.saveModelBinary("no/such/dir/model.bin"), Helix::IOException);
}
