#include "ContinualTrainer.h"
#include "FastaUtils.h"
#include "HelixExceptions.h"
#include "RefinerConfig.h"
#include "SimilarityGraph.h"
#include "TerminalUI.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace {
std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    escaped += "?";
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

double finiteOrZero(double value) {
    return std::isfinite(value) ? value : 0.0;
}

template <typename T>
void writeJsonArray(std::ofstream& out, const std::vector<T>& values) {
    out << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out << ", ";
        out << finiteOrZero(static_cast<double>(values[i]));
    }
    out << "]";
}

void exportMetrics(const std::string& filename,
                   const RefinerConfig& config,
                   const TrainingMetrics& metrics,
                   const EvaluationResult& finalEval) {
    std::ofstream out(filename);
    if (!out) {
        std::cerr << "[Helix Warning] Failed to open metrics file: " << filename << "\n";
        return;
    }

    out << "{\n  \"corpus\": \"" << escapeJsonString(config.corpusPath) << "\",\n";
    out << "  \"mode\": \"" << RefinerConfig::modeName(config.mode) << "\",\n";
    out << "  \"epochs\": " << metrics.loss.size() << ",\n";
    out << "  \"loss\": ";
    writeJsonArray(out, metrics.loss);
    out << ",\n  \"accuracy\": ";
    writeJsonArray(out, metrics.accuracy);
    out << ",\n  \"distribution_shift\": ";
    writeJsonArray(out, metrics.distributionShift);
    out << ",\n  \"learning_rate\": ";
    writeJsonArray(out, metrics.learningRate);
    out << ",\n  \"consolidation_epochs\": ";
    writeJsonArray(out, metrics.consolidationEpochs);
    out << ",\n  \"final_evaluation\": { \"accuracy\": " << finiteOrZero(finalEval.accuracy)
        << ", \"evaluated\": " << finalEval.evaluated
        << ", \"correct\": " << finalEval.correct
        << ", \"excluded\": " << finalEval.excluded << " }\n}\n";
    if (!out.good()) {
        std::cerr << "[Helix Warning] Failed while writing metrics file: " << filename << "\n";
        return;
    }
    std::cout << "[Helix] Metrics exported to: " << filename << "\n";
}

std::vector<Entity> loadValidationSet(const RefinerConfig& config, const std::vector<Entity>& corpus) {
    if (config.validationPath.empty()) return corpus;
    std::vector<Entity> validation = FastaUtils::readFasta(config.validationPath);
    if (!config.expectedPath.empty()) {
        FastaUtils::attachExpectedSimilar(validation, FastaUtils::readExpectedSimilar(config.expectedPath));
    }
    return validation;
}

std::vector<Entity> entitiesFor(const std::vector<SearchResult>& results, const std::vector<Entity>& corpus) {
    std::unordered_map<std::string, const Entity*> byId;
    for (const auto& entity : corpus) byId.emplace(entity.id, &entity);

    std::vector<Entity> out;
    out.reserve(results.size());
    for (const auto& r : results) {
        auto it = byId.find(r.id);
        if (it != byId.end()) out.push_back(*it->second);
    }
    return out;
}

void runTraining(ContinualTrainer& trainer,
                 const RefinerConfig& config,
                 const std::vector<Entity>& corpus,
                 const std::vector<Entity>& validation,
                 size_t epochs) {
    std::cout << "[Helix] Training for " << (epochs ? epochs : config.trainer.epochs) << " epoch(s)...\n";
    const TrainingMetrics metrics = trainer.train(corpus, validation, epochs);
    TerminalUI::printTrainingSummary(metrics);

    const SimilarityGraph graph =
        SimilarityGraph::build(corpus, trainer.generator(), config.trainer.edgeThreshold);
    const EvaluationResult finalEval = trainer.evaluate(validation, graph);
    TerminalUI::printEvaluation(finalEval);

    if (!config.metricsPath.empty()) exportMetrics(config.metricsPath, config, trainer.metrics(), finalEval);
}
} // namespace

int main(int argc, char* argv[]) {
    try {
        const RefinerConfig config = RefinerConfig::fromArgs(argc, argv);

        std::cout << "[Helix] Loading corpus: " << config.corpusPath << "\n";
        std::vector<Entity> corpus = FastaUtils::readFasta(config.corpusPath);
        if (corpus.empty()) throw Helix::IOException("Corpus contains no FASTA records: " + config.corpusPath);
        if (!config.expectedPath.empty() && config.validationPath.empty()) {
            FastaUtils::attachExpectedSimilar(corpus, FastaUtils::readExpectedSimilar(config.expectedPath));
        }

        ContinualTrainer trainer(config.trainer);
        if (!config.loadModelPath.empty()) {
            trainer.loadModelBinary(config.loadModelPath);
            std::cout << "[Helix] Loaded model parameters from '" << config.loadModelPath << "'"
                      << (trainer.network().isTrained() ? " (trained)" : "") << ".\n";
        }

        const SimilarityGraph rawGraph =
            SimilarityGraph::build(corpus, trainer.generator(), config.trainer.edgeThreshold);
        FastaUtils::attachGraphNeighbors(corpus, rawGraph);
        TerminalUI::printCorpusSummary(corpus, rawGraph);
        TerminalUI::printNetworkInit(config.trainer.network, trainer.network().parameterElementCount());

        std::vector<Entity> validation = loadValidationSet(config, corpus);
        FastaUtils::attachGraphNeighbors(validation, rawGraph);

        switch (config.mode) {
            case RunMode::TRAIN:
                runTraining(trainer, config, corpus, validation, 0);
                break;
            case RunMode::SEARCH:
                if (!trainer.network().isTrained()) {
                    std::cout << "[Helix] Network is untrained; ranking by raw embedding similarity.\n";
                }
                TerminalUI::printSearchResults(trainer.search(config.query, corpus, config.topK));
                break;
            case RunMode::REFINE: {
                const std::vector<SearchResult> before = trainer.search(config.query, corpus, config.topK);
                TerminalUI::printSearchResults(before);

                const auto labels = FastaUtils::readFeedbackLabels(config.feedbackPath);
                const FeedbackSummary summary =
                    trainer.learnFromFeedback(config.query, entitiesFor(before, corpus), labels);
                TerminalUI::printFeedbackSummary(summary);

                runTraining(trainer, config, corpus, validation, config.refineEpochs);

                std::cout << "\n[Helix] Re-ranking with refined weights...\n";
                TerminalUI::printSearchResults(trainer.search(config.query, corpus, config.topK));
                break;
            }
        }

        if (!config.saveModelPath.empty()) {
            std::cout << "[Helix] Saving model parameters to binary file...\n";
            trainer.saveModelBinary(config.saveModelPath);
            std::cout << "[Helix] Model preserved at '" << config.saveModelPath << "'.\n";
        }
    } catch (const Helix::HelixException& e) {
        std::cerr << "[Helix Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Helix Exception] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
