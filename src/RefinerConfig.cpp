#include "RefinerConfig.h"
#include "CommonUtils.h"
#include "HelixExceptions.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Helix::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Helix::HelixException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Helix::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Helix::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value[0] == '-') {
        throw Helix::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Helix::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Helix::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Helix::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::vector<size_t> parseSizeList(const std::string& value, const std::string& key, int minValue) {
    std::vector<size_t> out;
    for (const std::string& token : CommonUtils::splitTrimmed(maybeUnquote(value), ',')) {
        std::string cleaned = token;
        cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '['), cleaned.end());
        cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ']'), cleaned.end());
        cleaned = CommonUtils::trim(cleaned);
        if (cleaned.empty()) continue;
        out.push_back(static_cast<size_t>(parseIntStrict(cleaned, key, minValue)));
    }
    if (out.empty()) {
        throw Helix::ConfigurationException(key + " expects a comma-separated list of integers");
    }
    return out;
}

bool isInUnit(double value) {
    return value >= 0.0 && value <= 1.0;
}

void assignKeyValue(RefinerConfig& config, const std::string& key, const std::string& value) {
    struct SizeRule {
        size_t RefinerConfig::*member;
        int minValue;
    };
    struct TrainerSizeRule {
        size_t TrainerConfig::*member;
        int minValue;
    };
    struct TrainerDoubleRule {
        double TrainerConfig::*member;
        double minValue;
    };
    struct NetworkSizeRule {
        size_t NetworkConfig::*member;
        int minValue;
    };
    struct NetworkDoubleRule {
        double NetworkConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string RefinerConfig::*> stringFields = {
        {"corpus", &RefinerConfig::corpusPath},
        {"validation", &RefinerConfig::validationPath},
        {"expected", &RefinerConfig::expectedPath},
        {"feedback", &RefinerConfig::feedbackPath},
        {"query", &RefinerConfig::query},
        {"load_model", &RefinerConfig::loadModelPath},
        {"save_model", &RefinerConfig::saveModelPath},
        {"metrics_output", &RefinerConfig::metricsPath},
        {"output", &RefinerConfig::metricsPath}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"top_k", {&RefinerConfig::topK, 1}},
        {"refine_epochs", {&RefinerConfig::refineEpochs, 0}}
    };
    static const std::unordered_map<std::string, bool TrainerConfig::*> trainerBoolFields = {
        {"motif_weighting", &TrainerConfig::motifWeighting},
        {"codon_aware", &TrainerConfig::codonAware},
        {"verbose", &TrainerConfig::verbose}
    };
    static const std::unordered_map<std::string, TrainerSizeRule> trainerSizeFields = {
        {"batch_size", {&TrainerConfig::batchSize, 1}},
        {"epochs", {&TrainerConfig::epochs, 1}},
        {"warmup_steps", {&TrainerConfig::warmupSteps, 0}},
        {"plateau_patience", {&TrainerConfig::plateauPatience, 1}},
        {"replay_buffer_size", {&TrainerConfig::replayBufferSize, 1}},
        {"shift_window", {&TrainerConfig::shiftWindow, 1}},
        {"consolidation_interval", {&TrainerConfig::consolidationInterval, 1}},
        {"positives_per_sample", {&TrainerConfig::positivesPerSample, 1}},
        {"negatives_per_sample", {&TrainerConfig::negativesPerSample, 1}}
    };
    static const std::unordered_map<std::string, TrainerDoubleRule> trainerDoubleFields = {
        {"learning_rate", {&TrainerConfig::learningRate, 1e-12}},
        {"lr", {&TrainerConfig::learningRate, 1e-12}},
        {"min_learning_rate", {&TrainerConfig::minLearningRate, 0.0}},
        {"plateau_factor", {&TrainerConfig::plateauFactor, 0.0}},
        {"gradient_clip_norm", {&TrainerConfig::gradientClipNorm, 0.0}},
        {"ewc_lambda", {&TrainerConfig::ewcLambda, 0.0}},
        {"replay_probability", {&TrainerConfig::replayProbability, 0.0}},
        {"shift_threshold", {&TrainerConfig::shiftThreshold, 0.0}},
        {"edge_threshold", {&TrainerConfig::edgeThreshold, -1.0}},
        {"search_raw_weight", {&TrainerConfig::searchRawWeight, 0.0}},
        {"missed_match_threshold", {&TrainerConfig::missedMatchThreshold, 0.0}},
        {"false_positive_threshold", {&TrainerConfig::falsePositiveThreshold, 0.0}},
        {"upweight_factor", {&TrainerConfig::upweightFactor, 0.0}},
        {"downweight_factor", {&TrainerConfig::downweightFactor, 0.0}}
    };
    static const std::unordered_map<std::string, NetworkSizeRule> networkSizeFields = {
        {"input_dim", {&NetworkConfig::inputDim, 1}},
        {"hidden_dim", {&NetworkConfig::hiddenDim, 1}},
        {"output_dim", {&NetworkConfig::outputDim, 1}},
        {"num_layers", {&NetworkConfig::numLayers, 1}}
    };
    static const std::unordered_map<std::string, NetworkDoubleRule> networkDoubleFields = {
        {"dropout", {&NetworkConfig::dropout, 0.0}},
        {"temperature", {&NetworkConfig::temperature, 1e-12}}
    };

    if (key == "mode") {
        config.mode = RefinerConfig::parseMode(value);
        return;
    }
    if (key == "scheduler") {
        config.trainer.scheduler = LearningRateScheduler::parsePolicy(value);
        return;
    }
    if (key == "reservoir_policy") {
        config.trainer.reservoirPolicy = ReplayBuffer::parsePolicy(value);
        return;
    }
    if (key == "seed") {
        const uint32_t seed = parseUIntStrict(value, key);
        config.trainer.seed = seed;
        config.trainer.network.seed = seed;
        return;
    }
    if (key == "kmer_sizes") {
        config.trainer.kmerSizes = parseSizeList(value, key, 1);
        return;
    }
    if (key == "feedback_motif_sizes") {
        config.trainer.feedbackMotifSizes = parseSizeList(value, key, 1);
        return;
    }
    if (key == "host") {
        config.service.host = value;
        return;
    }
    if (key == "port") {
        config.service.port = parseIntStrict(value, key, 1);
        return;
    }
    if (key == "threads") {
        config.service.threadCount = static_cast<size_t>(parseIntStrict(value, key, 1));
        return;
    }

    if (const auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = trainerBoolFields.find(key); it != trainerBoolFields.end()) {
        config.trainer.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = trainerSizeFields.find(key); it != trainerSizeFields.end()) {
        config.trainer.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = trainerDoubleFields.find(key); it != trainerDoubleFields.end()) {
        config.trainer.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = networkSizeFields.find(key); it != networkSizeFields.end()) {
        config.trainer.network.*(it->second.member) =
            static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = networkDoubleFields.find(key); it != networkDoubleFields.end()) {
        config.trainer.network.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }

    throw Helix::ConfigurationException("Unknown option: " + key);
}
}

RunMode RefinerConfig::parseMode(const std::string& name) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(name));
    if (lowered == "train") return RunMode::TRAIN;
    if (lowered == "search") return RunMode::SEARCH;
    if (lowered == "refine") return RunMode::REFINE;
    throw Helix::ConfigurationException("mode must be one of: train, search, refine (got '" + name + "')");
}

std::string RefinerConfig::modeName(RunMode mode) {
    switch (mode) {
        case RunMode::TRAIN: return "train";
        case RunMode::SEARCH: return "search";
        case RunMode::REFINE: return "refine";
    }
    return "unknown";
}

void RefinerConfig::set(const std::string& key, const std::string& value) {
    assignKeyValue(*this, normalizeConfigKey(key), value);
}

RefinerConfig RefinerConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Helix::ConfigurationException(
            "Usage: helix <corpus.fasta> [--config path] [--mode train|search|refine] [--query SEQ] "
            "[--top-k N] [--validation path.fasta] [--expected path] [--feedback path] [--refine-epochs N] "
            "[--load-model path] [--save-model path] [--metrics-output path.json] [--verbose true|false] "
            "[--epochs N] [--batch-size N] [--learning-rate >0] [--min-learning-rate >=0] [--warmup-steps N] "
            "[--scheduler cosine|warmup_linear|plateau|constant] [--plateau-patience N] [--plateau-factor 0..1] "
            "[--gradient-clip-norm >=0] [--ewc-lambda >=0] [--replay-buffer-size N] "
            "[--reservoir-policy compatible|classic] [--replay-probability 0..1] [--shift-threshold >=0] "
            "[--shift-window N] [--consolidation-interval N] [--edge-threshold -1..1] "
            "[--positives-per-sample N] [--negatives-per-sample N] [--search-raw-weight 0..1] "
            "[--input-dim N] [--hidden-dim N] [--output-dim N] [--num-layers N] [--dropout 0..1) "
            "[--temperature >0] [--seed N] [--kmer-sizes 3,4,5,6] [--motif-weighting true|false] "
            "[--codon-aware true|false] [--host addr] [--port N] [--threads N]");
    }

    RefinerConfig config;
    config.corpusPath = argv[1];

    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--verbose" && (i + 1 >= argc || std::string(argv[i + 1]).rfind("--", 0) == 0)) {
            config.trainer.verbose = true;
        } else if (arg.rfind("--", 0) == 0 && arg.size() > 2 && i + 1 < argc) {
            const std::string key = normalizeConfigKey(arg.substr(2));
            assignKeyValue(config, key, argv[++i]);
        } else {
            throw Helix::ConfigurationException("Unrecognized argument: " + arg);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        config.configPath = configPath;
        if (config.corpusPath.empty()) config.corpusPath = argv[1];
    }

    config.validate();

    return config;
}

RefinerConfig RefinerConfig::fromFile(const std::string& configPath, const RefinerConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Helix::ConfigurationException("Could not open config file: " + configPath);

    RefinerConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Helix::HelixException& ex) {
            throw Helix::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void RefinerConfig::validate() const {
    if (corpusPath.empty()) {
        throw Helix::ConfigurationException("corpus path is required");
    }

    const NetworkConfig& net = trainer.network;
    if (net.outputDim != net.inputDim) {
        throw Helix::ConfigurationException("output_dim must equal input_dim (refined and raw embeddings are blended)");
    }
    if (net.dropout < 0.0 || net.dropout >= 1.0) {
        throw Helix::ConfigurationException("dropout must be within [0,1)");
    }
    if (net.temperature <= 0.0) {
        throw Helix::ConfigurationException("temperature must be > 0");
    }

    if (trainer.minLearningRate > trainer.learningRate) {
        throw Helix::ConfigurationException("min_learning_rate must be <= learning_rate");
    }
    if (trainer.plateauFactor <= 0.0 || trainer.plateauFactor >= 1.0) {
        throw Helix::ConfigurationException("plateau_factor must be within (0,1)");
    }
    if (!isInUnit(trainer.replayProbability)) {
        throw Helix::ConfigurationException("replay_probability must be within [0,1]");
    }
    if (!isInUnit(trainer.searchRawWeight)) {
        throw Helix::ConfigurationException("search_raw_weight must be within [0,1]");
    }
    if (trainer.edgeThreshold < -1.0 || trainer.edgeThreshold > 1.0) {
        throw Helix::ConfigurationException("edge_threshold must be within [-1,1]");
    }
    if (!isInUnit(trainer.missedMatchThreshold) || !isInUnit(trainer.falsePositiveThreshold)) {
        throw Helix::ConfigurationException("missed_match_threshold and false_positive_threshold must be within [0,1]");
    }
    if (trainer.upweightFactor <= 0.0 || trainer.downweightFactor <= 0.0) {
        throw Helix::ConfigurationException("upweight_factor and downweight_factor must be > 0");
    }
    for (size_t k : trainer.kmerSizes) {
        if (k < 1 || k > 10) throw Helix::ConfigurationException("kmer_sizes entries must be within [1,10]");
    }

    if ((mode == RunMode::SEARCH || mode == RunMode::REFINE) && query.empty()) {
        throw Helix::ConfigurationException("mode " + modeName(mode) + " requires --query");
    }
    if (mode == RunMode::REFINE && feedbackPath.empty()) {
        throw Helix::ConfigurationException("mode refine requires --feedback");
    }

    if (service.port < 1 || service.port > 65535) {
        throw Helix::ConfigurationException("port must be within [1,65535]");
    }
    if (service.threadCount == 0) {
        throw Helix::ConfigurationException("threads must be >= 1");
    }
}
