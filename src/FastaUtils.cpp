#include "FastaUtils.h"

#include "CommonUtils.h"
#include "HelixExceptions.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace {
std::ifstream openOrThrow(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw Helix::IOException("Could not open " + path);
    return in;
}

bool isCommentOrBlank(const std::string& line) {
    return line.empty() || line[0] == '#';
}

// Splits "key: value" on the first colon. Returns false when there is none.
bool splitKeyValue(const std::string& line, std::string& key, std::string& value) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos) return false;
    key = CommonUtils::trim(line.substr(0, colon));
    value = CommonUtils::trim(line.substr(colon + 1));
    return !key.empty();
}
} // namespace

namespace FastaUtils {
void skipBOM(std::istream& is) {
    if (!is.good()) return;
    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) return;

    char bom[3] = {0, 0, 0};
    is.read(bom, 3);
    if (is.gcount() == 3 && static_cast<unsigned char>(bom[1]) == 0xBB && static_cast<unsigned char>(bom[2]) == 0xBF) {
        return;
    }
    throw Helix::IOException("Malformed byte order mark");
}

std::vector<Entity> parseFasta(std::istream& is, const ParseLimits& limits) {
    skipBOM(is);
    std::vector<Entity> entities;
    std::string line;
    bool inRecord = false;
    size_t lineNo = 0;

    while (std::getline(is, line)) {
        ++lineNo;
        const std::string trimmed = CommonUtils::trim(line);
        if (trimmed.empty() || trimmed[0] == ';') continue;

        if (trimmed[0] == '>') {
            if (entities.size() >= limits.maxRecords) {
                throw Helix::IOException("FASTA record limit exceeded (" + std::to_string(limits.maxRecords) + ")");
            }
            const std::string header = CommonUtils::trim(trimmed.substr(1));
            const size_t space = header.find_first_of(" \t");
            Entity entity;
            entity.id = header.substr(0, space);
            if (entity.id.empty()) {
                throw Helix::IOException("FASTA header without an id at line " + std::to_string(lineNo));
            }
            entities.push_back(std::move(entity));
            inRecord = true;
            continue;
        }

        if (!inRecord) {
            throw Helix::IOException("FASTA sequence data before the first header at line " + std::to_string(lineNo));
        }
        std::string& payload = entities.back().payload;
        payload += CommonUtils::normalizeNucleotides(trimmed);
        if (payload.size() > limits.maxSequenceBytes) {
            throw Helix::IOException("FASTA sequence '" + entities.back().id + "' exceeds the size limit");
        }
    }
    return entities;
}

std::vector<Entity> readFasta(const std::string& path, const ParseLimits& limits) {
    std::ifstream in = openOrThrow(path);
    return parseFasta(in, limits);
}

std::unordered_map<std::string, std::vector<std::string>> parseExpectedSimilar(std::istream& is) {
    std::unordered_map<std::string, std::vector<std::string>> out;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(is, line)) {
        ++lineNo;
        const std::string trimmed = CommonUtils::trim(line);
        if (isCommentOrBlank(trimmed)) continue;

        std::string key;
        std::string value;
        if (!splitKeyValue(trimmed, key, value)) {
            throw Helix::IOException("Expected 'id: id1,id2' at line " + std::to_string(lineNo));
        }
        auto& ids = out[key];
        for (auto& id : CommonUtils::splitTrimmed(value, ',')) ids.push_back(std::move(id));
    }
    return out;
}

std::unordered_map<std::string, std::vector<std::string>> readExpectedSimilar(const std::string& path) {
    std::ifstream in = openOrThrow(path);
    return parseExpectedSimilar(in);
}

std::unordered_map<std::string, FeedbackLabel> parseFeedbackLabels(std::istream& is) {
    std::unordered_map<std::string, FeedbackLabel> out;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(is, line)) {
        ++lineNo;
        const std::string trimmed = CommonUtils::trim(line);
        if (isCommentOrBlank(trimmed)) continue;

        std::string key;
        std::string value;
        if (!splitKeyValue(trimmed, key, value)) {
            throw Helix::IOException("Expected 'id: true|false[,confidence]' at line " + std::to_string(lineNo));
        }
        const std::vector<std::string> parts = CommonUtils::splitTrimmed(value, ',');
        if (parts.empty() || parts.size() > 2) {
            throw Helix::IOException("Malformed feedback label at line " + std::to_string(lineNo));
        }

        FeedbackLabel label;
        const std::string verdict = CommonUtils::toLower(parts[0]);
        if (verdict == "true" || verdict == "1" || verdict == "yes" || verdict == "match") {
            label.isMatch = true;
        } else if (verdict == "false" || verdict == "0" || verdict == "no" || verdict == "mismatch") {
            label.isMatch = false;
        } else {
            throw Helix::IOException("Unrecognized feedback verdict '" + parts[0] + "' at line " +
                                     std::to_string(lineNo));
        }
        label.confidence = label.isMatch ? 1.0 : 0.0;
        if (parts.size() == 2) {
            char* end = nullptr;
            const double confidence = std::strtod(parts[1].c_str(), &end);
            if (end == parts[1].c_str() || *end != '\0') {
                throw Helix::IOException("Invalid confidence '" + parts[1] + "' at line " + std::to_string(lineNo));
            }
            label.confidence = confidence;
        }
        out[key] = label;
    }
    return out;
}

std::unordered_map<std::string, FeedbackLabel> readFeedbackLabels(const std::string& path) {
    std::ifstream in = openOrThrow(path);
    return parseFeedbackLabels(in);
}

void attachExpectedSimilar(std::vector<Entity>& entities,
                           const std::unordered_map<std::string, std::vector<std::string>>& expected) {
    for (auto& entity : entities) {
        auto it = expected.find(entity.id);
        if (it != expected.end()) entity.expectedSimilar = it->second;
    }
}

void attachGraphNeighbors(std::vector<Entity>& entities, const SimilarityGraph& graph, size_t count) {
    for (auto& entity : entities) {
        if (!entity.expectedSimilar.empty()) continue;
        const std::optional<size_t> index = graph.indexOf(entity.id);
        if (!index) continue;

        const Neighborhood hood = graph.neighborsOf(*index);
        std::vector<size_t> order(hood.indices.size());
        for (size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::stable_sort(order.begin(), order.end(),
                         [&](size_t a, size_t b) { return hood.weights[a] > hood.weights[b]; });

        const size_t take = std::min(count, order.size());
        for (size_t i = 0; i < take; ++i) {
            entity.expectedSimilar.push_back(graph.nodes()[hood.indices[order[i]]].id);
        }
    }
}
}
