#pragma once
#include "ContinualTrainer.h"
#include "EmbeddingGenerator.h"
#include "SimilarityGraph.h"
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printCorpusSummary(const std::vector<Entity>& corpus, const SimilarityGraph& graph);
    static void printNetworkInit(const NetworkConfig& network, size_t parameterCount);

    // Training display
    static void printTrainingSummary(const TrainingMetrics& metrics);
    static void printEvaluation(const EvaluationResult& result);

    // Retrieval display
    static void printSearchResults(const std::vector<SearchResult>& results);
    static void printFeedbackSummary(const FeedbackSummary& summary);
};
