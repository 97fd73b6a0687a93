#include "TerminalUI.h"
#include <algorithm>
#include <iostream>
#include <iomanip>

void TerminalUI::printCorpusSummary(const std::vector<Entity>& corpus, const SimilarityGraph& graph) {
    size_t totalBases = 0;
    size_t labeled = 0;
    for (const auto& entity : corpus) {
        totalBases += entity.payload.size();
        if (!entity.expectedSimilar.empty()) ++labeled;
    }
    const double meanLength = corpus.empty() ? 0.0 : static_cast<double>(totalBases) / static_cast<double>(corpus.size());
    const double meanDegree = graph.nodeCount() == 0
        ? 0.0
        : 2.0 * static_cast<double>(graph.edgeCount()) / static_cast<double>(graph.nodeCount());

    std::cout << "\n=============================== CORPUS SUMMARY ===============================\n";
    std::cout << std::left
              << std::setw(28) << "Sequences" << corpus.size() << "\n"
              << std::setw(28) << "Labeled (expected similar)" << labeled << "\n"
              << std::setw(28) << "Mean length (bp)" << std::fixed << std::setprecision(1) << meanLength << "\n"
              << std::setw(28) << "Graph edges" << graph.edgeCount() << "\n"
              << std::setw(28) << "Mean degree" << std::setprecision(2) << meanDegree << "\n";
    std::cout << "==============================================================================\n";
}

void TerminalUI::printNetworkInit(const NetworkConfig& network, size_t parameterCount) {
    std::cout << "        -> Attention stack: [" << network.inputDim << " Input] -> "
              << network.numLayers << " x [" << network.hiddenDim << " Hidden] -> ["
              << network.outputDim << " Output] (" << parameterCount << " parameters)\n";
}

void TerminalUI::printTrainingSummary(const TrainingMetrics& metrics) {
    std::cout << "\n============================== TRAINING SUMMARY ==============================\n";
    if (metrics.loss.empty()) {
        std::cout << "[Helix] No epochs recorded.\n";
        std::cout << "==============================================================================\n";
        return;
    }

    const auto bestIt = std::max_element(metrics.accuracy.begin(), metrics.accuracy.end());
    const size_t bestEpoch = bestIt == metrics.accuracy.end()
        ? 0
        : static_cast<size_t>(std::distance(metrics.accuracy.begin(), bestIt));

    std::cout << std::left << std::setw(8) << "Epoch"
              << std::right << std::setw(12) << "Loss"
              << std::setw(12) << "Accuracy"
              << std::setw(12) << "Shift"
              << std::setw(14) << "LR" << "\n";
    std::cout << std::string(58, '-') << "\n";

    // Long runs print every tenth epoch plus the last one.
    const size_t stride = metrics.loss.size() > 20 ? 10 : 1;
    for (size_t e = 0; e < metrics.loss.size(); ++e) {
        if (e % stride != 0 && e + 1 != metrics.loss.size()) continue;
        std::cout << std::left << std::setw(8) << (e + 1)
                  << std::right << std::fixed << std::setprecision(4)
                  << std::setw(12) << metrics.loss[e]
                  << std::setw(12) << (e < metrics.accuracy.size() ? metrics.accuracy[e] : 0.0)
                  << std::setw(12) << (e < metrics.distributionShift.size() ? metrics.distributionShift[e] : 0.0)
                  << std::setw(14) << std::scientific << std::setprecision(3)
                  << (e < metrics.learningRate.size() ? metrics.learningRate[e] : 0.0) << "\n";
    }
    std::cout << std::fixed << std::setprecision(4);
    if (bestIt != metrics.accuracy.end()) {
        std::cout << "\n[Helix] Best validation accuracy " << *bestIt << " at epoch " << (bestEpoch + 1) << "\n";
    }
    if (!metrics.consolidationEpochs.empty()) {
        std::cout << "[Helix] EWC consolidated at epoch(s):";
        for (size_t epoch : metrics.consolidationEpochs) std::cout << " " << epoch;
        std::cout << "\n";
    }
    std::cout << "==============================================================================\n";
}

void TerminalUI::printEvaluation(const EvaluationResult& result) {
    std::cout << "[Helix] Validation: " << result.correct << "/" << result.evaluated << " correct (accuracy "
              << std::fixed << std::setprecision(4) << result.accuracy << ")";
    if (result.excluded > 0) std::cout << ", " << result.excluded << " excluded";
    std::cout << "\n";
}

void TerminalUI::printSearchResults(const std::vector<SearchResult>& results) {
    std::cout << "\n=============================== SEARCH RESULTS ===============================\n";
    if (results.empty()) {
        std::cout << "        -> Corpus is empty; nothing to rank.\n";
        std::cout << "==============================================================================\n";
        return;
    }

    size_t idWidth = 12;
    for (const auto& r : results) idWidth = std::max(idWidth, r.id.size());
    const int w = static_cast<int>(idWidth) + 2;

    std::cout << std::left << std::setw(6) << "Rank" << std::setw(w) << "Id"
              << std::right << std::setw(12) << "Score"
              << std::setw(12) << "Raw"
              << std::setw(12) << "Refined" << "\n";
    std::cout << std::string(6 + w + 36, '-') << "\n";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        std::cout << std::left << std::setw(6) << (i + 1) << std::setw(w) << r.id
                  << std::right << std::fixed << std::setprecision(4)
                  << std::setw(12) << r.similarity
                  << std::setw(12) << r.rawSimilarity
                  << std::setw(12) << r.refinedSimilarity << "\n";
    }
    std::cout << "==============================================================================\n";
}

void TerminalUI::printFeedbackSummary(const FeedbackSummary& summary) {
    std::cout << "\n[Helix] Feedback processed for " << summary.processed << " candidate(s).\n"
              << "        -> Missed matches upweighted:   " << summary.upweighted << "\n"
              << "        -> False positives downweighted: " << summary.downweighted << "\n"
              << "        -> Unlabeled (skipped):          " << summary.skipped << "\n"
              << "        -> Motif weights adjusted:       " << summary.motifsAdjusted << "\n";
}
