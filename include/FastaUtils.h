#pragma once

#include "ContinualTrainer.h"
#include "EmbeddingGenerator.h"
#include "SimilarityGraph.h"

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace FastaUtils {
// FASTA corpus reading plus the two label formats used by the CLI:
//   expected-similar:  "<id>: <id>, <id>, ..."
//   feedback labels:   "<id>: true|false[, <confidence>]"
// Blank lines and lines starting with '#' are ignored in label files.

struct ParseLimits {
    size_t maxRecords = 1000000;
    size_t maxSequenceBytes = 256 * 1024 * 1024; // 256 MiB
};

void skipBOM(std::istream& is);

/// Record id is the first whitespace-delimited token of the header. Sequences keep only A/T/G/C, uppercased.
std::vector<Entity> parseFasta(std::istream& is, const ParseLimits& limits = ParseLimits{});
std::vector<Entity> readFasta(const std::string& path, const ParseLimits& limits = ParseLimits{});

std::unordered_map<std::string, std::vector<std::string>> parseExpectedSimilar(std::istream& is);
std::unordered_map<std::string, std::vector<std::string>> readExpectedSimilar(const std::string& path);

std::unordered_map<std::string, FeedbackLabel> parseFeedbackLabels(std::istream& is);
std::unordered_map<std::string, FeedbackLabel> readFeedbackLabels(const std::string& path);

/// Fills expectedSimilar from the map; entities without an entry keep their current list.
void attachExpectedSimilar(std::vector<Entity>& entities,
                           const std::unordered_map<std::string, std::vector<std::string>>& expected);

/// Entities with no expected-similar ids get the ids of their `count` strongest neighbors in `graph`.
void attachGraphNeighbors(std::vector<Entity>& entities, const SimilarityGraph& graph, size_t count = 2);
}
