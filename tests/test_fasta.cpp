#include "FastaUtils.h"
#include "HelixExceptions.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>

#include <sstream>

// ===== FASTA =====

TEST(FastaUtilsTest, ParsesMultiLineRecords) {
    std::istringstream in(">seq1 human promoter\n"
                          "acgt\n"
                          "NNAC GT\n"
                          "; comment\n"
                          "\n"
                          ">seq2\n"
                          "TTTT\n");
    const auto entities = FastaUtils::parseFasta(in);
    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[0].id, "seq1");
    EXPECT_EQ(entities[0].payload, "ACGTACGT");
    EXPECT_EQ(entities[1].id, "seq2");
    EXPECT_EQ(entities[1].payload, "TTTT");
    EXPECT_TRUE(entities[0].expectedSimilar.empty());
}

TEST(FastaUtilsTest, SkipsByteOrderMark) {
    std::istringstream in("\xEF\xBB\xBF>only\nGATTACA\n");
    const auto entities = FastaUtils::parseFasta(in);
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].id, "only");
    EXPECT_EQ(entities[0].payload, "GATTACA");
}

TEST(FastaUtilsTest, RejectsMalformedInput) {
    std::istringstream orphan("ACGT\n>seq\nACGT\n");
    EXPECT_THROW(FastaUtils::parseFasta(orphan), Helix::IOException);

    std::istringstream noId(">\nACGT\n");
    EXPECT_THROW(FastaUtils::parseFasta(noId), Helix::IOException);

    FastaUtils::ParseLimits limits;
    limits.maxRecords = 1;
    std::istringstream tooMany(">a\nA\n>b\nC\n");
    EXPECT_THROW(FastaUtils::parseFasta(tooMany, limits), Helix::IOException);

    EXPECT_THROW(FastaUtils::readFasta("no/such/file.fasta"), Helix::IOException);
}

// ===== Label files =====

TEST(FastaUtilsTest, ParsesExpectedSimilarLines) {
    std::istringstream in("# truth\n"
                          "a1: a2, a3\n"
                          "\n"
                          "b1 : b2\n");
    const auto expected = FastaUtils::parseExpectedSimilar(in);
    ASSERT_EQ(expected.size(), 2u);
    EXPECT_EQ(expected.at("a1"), std::vector<std::string>({"a2", "a3"}));
    EXPECT_EQ(expected.at("b1"), std::vector<std::string>({"b2"}));

    std::istringstream bad("a1 a2\n");
    EXPECT_THROW(FastaUtils::parseExpectedSimilar(bad), Helix::IOException);
}

TEST(FastaUtilsTest, ParsesFeedbackLabels) {
    std::istringstream in("x: true\n"
                          "y: false, 0.25\n"
                          "z: Match\n");
    const auto labels = FastaUtils::parseFeedbackLabels(in);
    ASSERT_EQ(labels.size(), 3u);
    EXPECT_TRUE(labels.at("x").isMatch);
    EXPECT_DOUBLE_EQ(labels.at("x").confidence, 1.0);
    EXPECT_FALSE(labels.at("y").isMatch);
    EXPECT_DOUBLE_EQ(labels.at("y").confidence, 0.25);
    EXPECT_TRUE(labels.at("z").isMatch);

    std::istringstream verdict("x: perhaps\n");
    EXPECT_THROW(FastaUtils::parseFeedbackLabels(verdict), Helix::IOException);
    std::istringstream confidence("x: true, high\n");
    EXPECT_THROW(FastaUtils::parseFeedbackLabels(confidence), Helix::IOException);
}

// ===== Attaching labels =====

TEST(FastaUtilsTest, AttachExpectedSimilarOverwritesListedEntitiesOnly) {
    std::vector<Entity> entities = {{"a", "A", {"old"}}, {"b", "B", {"keep"}}};
    FastaUtils::attachExpectedSimilar(entities, {{"a", {"x", "y"}}});
    EXPECT_EQ(entities[0].expectedSimilar, std::vector<std::string>({"x", "y"}));
    EXPECT_EQ(entities[1].expectedSimilar, std::vector<std::string>({"keep"}));
}

TEST(FastaUtilsTest, AttachGraphNeighborsFillsOnlyUnlabeledEntities) {
    const auto embedder = HelixTest::clusterEmbedder();
    const SimilarityGraph graph = SimilarityGraph::build(HelixTest::clusterCorpus(), *embedder);

    std::vector<Entity> entities = {{"a1", "A1", {}}, {"b1", "B1", {}}, {"a2", "A2", {"b2"}}, {"zz", "", {}}};
    FastaUtils::attachGraphNeighbors(entities, graph);

    // A1 is closer to A3 (0.998) than to A2 (0.9966).
    EXPECT_EQ(entities[0].expectedSimilar, std::vector<std::string>({"a3", "a2"}));
    EXPECT_EQ(entities[1].expectedSimilar, std::vector<std::string>({"b2"}));
    EXPECT_EQ(entities[2].expectedSimilar, std::vector<std::string>({"b2"}));
    EXPECT_TRUE(entities[3].expectedSimilar.empty());

    std::vector<Entity> single = {{"a1", "A1", {}}};
    FastaUtils::attachGraphNeighbors(single, graph, 1);
    EXPECT_EQ(single[0].expectedSimilar, std::vector<std::string>({"a3"}));
}
