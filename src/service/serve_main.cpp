#include "ContinualTrainer.h"
#include "FastaUtils.h"
#include "HelixExceptions.h"
#include "RefinerConfig.h"
#include "RefinerService.h"
#include "SimilarityGraph.h"

#include <iostream>
#include <utility>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        const RefinerConfig config = RefinerConfig::fromArgs(argc, argv);

        std::vector<Entity> corpus = FastaUtils::readFasta(config.corpusPath);
        if (corpus.empty()) throw Helix::IOException("Corpus contains no FASTA records: " + config.corpusPath);
        if (!config.expectedPath.empty() && config.validationPath.empty()) {
            FastaUtils::attachExpectedSimilar(corpus, FastaUtils::readExpectedSimilar(config.expectedPath));
        }
        std::vector<Entity> validation = corpus;
        if (!config.validationPath.empty()) {
            validation = FastaUtils::readFasta(config.validationPath);
            if (!config.expectedPath.empty()) {
                FastaUtils::attachExpectedSimilar(validation, FastaUtils::readExpectedSimilar(config.expectedPath));
            }
        }

        ContinualTrainer trainer(config.trainer);
        if (!config.loadModelPath.empty()) trainer.loadModelBinary(config.loadModelPath);

        const SimilarityGraph rawGraph =
            SimilarityGraph::build(corpus, trainer.generator(), config.trainer.edgeThreshold);
        FastaUtils::attachGraphNeighbors(corpus, rawGraph);
        FastaUtils::attachGraphNeighbors(validation, rawGraph);

        RequestMonitor monitor;
        RefinerService service(trainer, std::move(corpus), std::move(validation), monitor);
        return service.start(config.service);
    } catch (const Helix::HelixException& e) {
        std::cerr << "[Helix Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Helix Exception] " << e.what() << "\n";
        return 1;
    }
}
