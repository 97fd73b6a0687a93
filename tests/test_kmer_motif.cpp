#include "HelixExceptions.h"
#include "KmerEmbedder.h"
#include "MotifWeights.h"

#include <gtest/gtest.h>

#include <vector>

// ===== Motif weights =====

TEST(MotifWeightTableTest, SeedsPriorsAndDefaultsUnknownToOne) {
    MotifWeightTable table;
    EXPECT_TRUE(table.contains("TATAAA"));
    EXPECT_DOUBLE_EQ(table.weight("TATAAA"), 2.0);
    EXPECT_DOUBLE_EQ(table.weight("ATG"), 1.5);
    EXPECT_FALSE(table.contains("GGGG"));
    EXPECT_DOUBLE_EQ(table.weight("GGGG"), 1.0);
}

TEST(MotifWeightTableTest, WeightsAreClamped) {
    MotifWeightTable table;
    table.setWeight("GGGG", 100.0);
    EXPECT_DOUBLE_EQ(table.weight("GGGG"), MotifWeightTable::kMaxWeight);
    table.setWeight("GGGG", 0.0);
    EXPECT_DOUBLE_EQ(table.weight("GGGG"), MotifWeightTable::kMinWeight);

    table.setWeight("ACGT", 4.9);
    table.adjustShared("ACGTA", "ACGTT", 2.0, {4});
    EXPECT_DOUBLE_EQ(table.weight("ACGT"), MotifWeightTable::kMaxWeight);
}

TEST(MotifWeightTableTest, AdjustSharedTouchesEachDistinctSharedMotifOnce) {
    MotifWeightTable table;
    // Shared 4-mers: ACGT CGTA GTAC TACG. 5-mers: ACGTA CGTAC GTACG TACGT. 6-mers: ACGTAC CGTACG GTACGT.
    const size_t adjusted = table.adjustShared("ACGTACGTAC", "ACGTACGTTT", 0.9);
    EXPECT_EQ(adjusted, 11u);
    EXPECT_DOUBLE_EQ(table.weight("ACGT"), 0.9);
    EXPECT_DOUBLE_EQ(table.weight("CGTACG"), 0.9);
    EXPECT_FALSE(table.contains("CGTT"));

    EXPECT_EQ(table.adjustShared("AAAA", "CCCC", 0.9), 0u);
    EXPECT_EQ(table.adjustShared("ACG", "ACG", 0.9, {4}), 0u);
}

TEST(MotifWeightTableTest, ResetRestoresPriors) {
    MotifWeightTable table;
    const size_t priors = table.size();
    table.setWeight("TATAAA", 0.5);
    table.setWeight("GGGG", 3.0);
    table.reset();
    EXPECT_EQ(table.size(), priors);
    EXPECT_DOUBLE_EQ(table.weight("TATAAA"), 2.0);
    EXPECT_FALSE(table.contains("GGGG"));
}

// ===== K-mer embedding =====

TEST(KmerEmbedderTest, VocabularyFollowsNucleotideOrder) {
    const auto mono = KmerEmbedder::vocabulary(1);
    EXPECT_EQ(mono, std::vector<std::string>({"A", "T", "G", "C"}));
    const auto di = KmerEmbedder::vocabulary(2);
    ASSERT_EQ(di.size(), 16u);
    EXPECT_EQ(di[1], "AT");
    EXPECT_EQ(di[15], "CC");
}

TEST(KmerEmbedderTest, ProjectionAveragesOrRepeatsBuckets) {
    EXPECT_EQ(KmerEmbedder::projectToDimension({1.0, 2.0, 3.0, 4.0}, 2), std::vector<double>({1.5, 3.5}));
    EXPECT_EQ(KmerEmbedder::projectToDimension({1.0, 2.0}, 4), std::vector<double>({1.0, 1.0, 2.0, 2.0}));
    EXPECT_EQ(KmerEmbedder::projectToDimension({}, 3), std::vector<double>({0.0, 0.0, 0.0}));
}

TEST(KmerEmbedderTest, CountsAreNormalizedFrequencies) {
    MotifWeightTable motifs;
    KmerEmbedder embedder(motifs, 4, {1}, false, false);
    const Tensor e = embedder.embed("aa-t g\n");
    ASSERT_EQ(e.size(), 4u);
    EXPECT_DOUBLE_EQ(e[0], 0.5);
    EXPECT_DOUBLE_EQ(e[1], 0.25);
    EXPECT_DOUBLE_EQ(e[2], 0.25);
    EXPECT_DOUBLE_EQ(e[3], 0.0);

    EXPECT_DOUBLE_EQ(embedder.embed("").sum(), 0.0);
}

TEST(KmerEmbedderTest, MotifWeightsScaleOccurrences) {
    MotifWeightTable motifs;
    KmerEmbedder embedder(motifs, 64, {3}, true, false);
    const Tensor e = embedder.embed("ATGA");
    const size_t atg = 0 * 16 + 1 * 4 + 2;
    const size_t tga = 1 * 16 + 2 * 4 + 0;
    EXPECT_NEAR(e[atg] / e[tga], 1.5 / 1.4, 1e-12);
    EXPECT_NEAR(e.sum(), 1.0, 1e-12);

    // The embedder reads the live table.
    motifs.setWeight("ATG", 2.8);
    EXPECT_NEAR(embedder.embed("ATGA")[atg], 2.0 / 3.0, 1e-12);
}

TEST(KmerEmbedderTest, CodonPositionWeightsApplyToTrinucleotides) {
    MotifWeightTable motifs;
    KmerEmbedder embedder(motifs, 64, {3}, false, true);
    // ATG at offsets 0 and 3, TGA at 1, GAT at 2 (third codon position, weight 0.7).
    const Tensor e = embedder.embed("ATGATG");
    const size_t atg = 0 * 16 + 1 * 4 + 2;
    const size_t gat = 2 * 16 + 0 * 4 + 1;
    EXPECT_NEAR(e[atg], 2.0 / 3.7, 1e-12);
    EXPECT_NEAR(e[gat], 0.7 / 3.7, 1e-12);
}

TEST(KmerEmbedderTest, MultiScaleOutputHasRequestedDimension) {
    MotifWeightTable motifs;
    KmerEmbedder embedder(motifs);
    EXPECT_EQ(embedder.rawWidth(), 64u + 256u + 1024u + 4096u);
    EXPECT_EQ(embedder.embed("ATGCGTACGTTAGCATGCAAATAAACCGT").size(), 256u);
}

TEST(KmerEmbedderTest, RejectsInvalidConfiguration) {
    MotifWeightTable motifs;
    EXPECT_THROW(KmerEmbedder(motifs, 0), Helix::ConfigurationException);
    EXPECT_THROW(KmerEmbedder(motifs, 16, {}), Helix::ConfigurationException);
    EXPECT_THROW(KmerEmbedder(motifs, 16, {0}), Helix::ConfigurationException);
    EXPECT_THROW(KmerEmbedder(motifs, 16, {11}), Helix::ConfigurationException);
}
