#pragma once

#include "ContinualTrainer.h"

#include <cstddef>
#include <string>

enum class RunMode { TRAIN, SEARCH, REFINE };

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t threadCount = 8;
};

struct RefinerConfig {
    std::string corpusPath;
    std::string configPath;
    RunMode mode = RunMode::TRAIN;

    // Optional inputs
    std::string validationPath;  // FASTA; defaults to the training corpus
    std::string expectedPath;    // "id: id1,id2" lines
    std::string feedbackPath;    // "id: true|false[,confidence]" lines
    std::string query;           // raw sequence for search/refine

    size_t topK = 10;
    size_t refineEpochs = 0;     // 0 => trainer.epochs

    std::string loadModelPath;
    std::string saveModelPath;
    std::string metricsPath;     // JSON written after training

    TrainerConfig trainer;
    ServiceConfig service;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the FASTA corpus path.
     * @post Returns a validated config object.
     * @throws Helix::ConfigurationException on invalid arguments or values.
     */
    static RefinerConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Helix::ConfigurationException on parse/validation failures.
     */
    static RefinerConfig fromFile(const std::string& configPath, const RefinerConfig& base);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws Helix::ConfigurationException on invalid values.
     */
    void validate() const;

    /// Applies one normalized `key: value` pair (snake_case keys).
    void set(const std::string& key, const std::string& value);

    static RunMode parseMode(const std::string& name);
    static std::string modeName(RunMode mode);
};
