#include "HelixExceptions.h"
#include "RefinerConfig.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace {
RefinerConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "helix");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return RefinerConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

std::string writeTempFile(const std::string& name, const std::string& content) {
    std::ofstream out(name);
    out << content;
    return name;
}
} // namespace

// ===== Command line =====

TEST(RefinerConfigTest, DefaultsFollowCorpusArgument) {
    const RefinerConfig config = parseArgs({"corpus.fasta"});
    EXPECT_EQ(config.corpusPath, "corpus.fasta");
    EXPECT_EQ(config.mode, RunMode::TRAIN);
    EXPECT_EQ(config.topK, 10u);
    EXPECT_EQ(config.trainer.network.inputDim, 256u);
    EXPECT_EQ(config.trainer.network.numLayers, 3u);
    EXPECT_DOUBLE_EQ(config.trainer.learningRate, 0.001);
    EXPECT_EQ(config.trainer.scheduler, SchedulePolicy::COSINE);
    EXPECT_EQ(config.service.port, 8080);
}

TEST(RefinerConfigTest, KebabOptionsMapToFields) {
    const RefinerConfig config =
        parseArgs({"corpus.fasta", "--mode", "search", "--query", "ACGT", "--top-k", "3", "--lr", "0.01",
                   "--scheduler", "plateau", "--kmer-sizes", "3,4", "--seed", "9", "--verbose", "--dropout", "0.2"});
    EXPECT_EQ(config.mode, RunMode::SEARCH);
    EXPECT_EQ(config.query, "ACGT");
    EXPECT_EQ(config.topK, 3u);
    EXPECT_DOUBLE_EQ(config.trainer.learningRate, 0.01);
    EXPECT_EQ(config.trainer.scheduler, SchedulePolicy::PLATEAU);
    EXPECT_EQ(config.trainer.kmerSizes, std::vector<size_t>({3, 4}));
    EXPECT_EQ(config.trainer.seed, 9u);
    EXPECT_EQ(config.trainer.network.seed, 9u);
    EXPECT_TRUE(config.trainer.verbose);
    EXPECT_DOUBLE_EQ(config.trainer.network.dropout, 0.2);
}

TEST(RefinerConfigTest, RejectsBadArguments) {
    EXPECT_THROW(parseArgs({}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "stray"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--no-such-option", "1"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--epochs", "ten"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--epochs", "0"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--mode", "search"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--mode", "refine", "--query", "ACGT"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--output-dim", "128"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--dropout", "1.0"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--kmer-sizes", "3,12"}), Helix::ConfigurationException);
    EXPECT_THROW(parseArgs({"corpus.fasta", "--port", "70000"}), Helix::ConfigurationException);
}

// ===== Set and validate =====

TEST(RefinerConfigTest, SetNormalizesKeys) {
    RefinerConfig config;
    config.set("Edge-Threshold", "0.5");
    config.set("reservoir_policy", "classic");
    config.set("MOTIF_WEIGHTING", "off");
    EXPECT_DOUBLE_EQ(config.trainer.edgeThreshold, 0.5);
    EXPECT_EQ(config.trainer.reservoirPolicy, ReservoirPolicy::CLASSIC);
    EXPECT_FALSE(config.trainer.motifWeighting);
    EXPECT_THROW(config.set("motif_weighting", "maybe"), Helix::ConfigurationException);
}

TEST(RefinerConfigTest, ValidateChecksCrossFieldInvariants) {
    RefinerConfig config;
    config.corpusPath = "corpus.fasta";
    EXPECT_NO_THROW(config.validate());

    RefinerConfig lowLr = config;
    lowLr.trainer.minLearningRate = 0.1;
    EXPECT_THROW(lowLr.validate(), Helix::ConfigurationException);

    RefinerConfig badWeight = config;
    badWeight.trainer.searchRawWeight = 1.5;
    EXPECT_THROW(badWeight.validate(), Helix::ConfigurationException);

    RefinerConfig noCorpus;
    EXPECT_THROW(noCorpus.validate(), Helix::ConfigurationException);
}

// ===== Config file =====

TEST(RefinerConfigTest, ConfigFileAcceptsYamlAndJsonStyles) {
    const std::string path = writeTempFile("helix_config_test.yaml",
                                           "# comment\n"
                                           "epochs: 7\n"
                                           "\"batch_size\": \"4\",\n"
                                           "{ \"scheduler\": \"warmup_linear\" }\n"
                                           "kmer_sizes: [3, 5]\n");
    const RefinerConfig config = parseArgs({"corpus.fasta", "--epochs", "3", "--config", path});
    EXPECT_EQ(config.trainer.epochs, 7u);
    EXPECT_EQ(config.trainer.batchSize, 4u);
    EXPECT_EQ(config.trainer.scheduler, SchedulePolicy::WARMUP_LINEAR);
    EXPECT_EQ(config.trainer.kmerSizes, std::vector<size_t>({3, 5}));
    EXPECT_EQ(config.configPath, path);
    std::remove(path.c_str());
}

TEST(RefinerConfigTest, ConfigFileErrorsNameTheLine) {
    const std::string path = writeTempFile("helix_config_bad.yaml", "epochs: 5\nlearning_rate: fast\n");
    RefinerConfig base;
    base.corpusPath = "corpus.fasta";
    try {
        RefinerConfig::fromFile(path, base);
        FAIL() << "expected a configuration error";
    } catch (const Helix::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
    std::remove(path.c_str());

    EXPECT_THROW(RefinerConfig::fromFile("no/such/config.yaml", base), Helix::ConfigurationException);
}

TEST(RefinerConfigTest, ModeNamesRoundTrip) {
    EXPECT_EQ(RefinerConfig::parseMode(" Refine "), RunMode::REFINE);
    EXPECT_EQ(RefinerConfig::modeName(RunMode::SEARCH), "search");
    EXPECT_THROW(RefinerConfig::parseMode("serve"), Helix::ConfigurationException);
}
