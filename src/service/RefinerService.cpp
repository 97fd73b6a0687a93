#include "RefinerService.h"

#include "HelixExceptions.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace {
using Clock = std::chrono::steady_clock;

// Upper bound for top_k and epochs in a single request.
constexpr size_t kMaxRequestCount = 1000000;

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::unordered_map<std::string, JsonValue> objectValue;

    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }
    bool isBool() const noexcept { return type == Type::Bool; }

    const JsonValue* find(const std::string& key) const {
        if (!isObject()) return nullptr;
        auto it = objectValue.find(key);
        if (it == objectValue.end()) return nullptr;
        return &it->second;
    }
};

class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue();
        skipWhitespace();
        if (position != text.size()) {
            throw Helix::ConfigurationException("Unexpected trailing JSON content");
        }
        return value;
    }

private:
    const std::string& text;
    size_t position = 0;

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) {
            throw Helix::ConfigurationException("Unexpected end of JSON input");
        }
        return text[position];
    }

    char take() {
        if (position >= text.size()) {
            throw Helix::ConfigurationException("Unexpected end of JSON input");
        }
        return text[position++];
    }

    void expect(char expected) {
        const char value = take();
        if (value != expected) {
            throw Helix::ConfigurationException(std::string("Expected JSON character '") + expected + "'");
        }
    }

    JsonValue parseValue() {
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        throw Helix::ConfigurationException("Invalid JSON token");
    }

    JsonValue parseObject() {
        JsonValue object;
        object.type = JsonValue::Type::Object;

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            skipWhitespace();
            JsonValue value = parseValue();
            object.objectValue.emplace(key.stringValue, std::move(value));

            skipWhitespace();
            const char next = take();
            if (next == '}') {
                break;
            }
            if (next != ',') {
                throw Helix::ConfigurationException("Expected ',' or '}' in JSON object");
            }
            skipWhitespace();
        }

        return object;
    }

    JsonValue parseArray() {
        JsonValue array;
        array.type = JsonValue::Type::Array;

        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue());
            skipWhitespace();
            const char next = take();
            if (next == ']') {
                break;
            }
            if (next != ',') {
                throw Helix::ConfigurationException("Expected ',' or ']' in JSON array");
            }
            skipWhitespace();
        }

        return array;
    }

    JsonValue parseString() {
        JsonValue str;
        str.type = JsonValue::Type::String;

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (c == '\\') {
                const char escaped = take();
                switch (escaped) {
                    case '"': str.stringValue.push_back('"'); break;
                    case '\\': str.stringValue.push_back('\\'); break;
                    case '/': str.stringValue.push_back('/'); break;
                    case 'b': str.stringValue.push_back('\b'); break;
                    case 'f': str.stringValue.push_back('\f'); break;
                    case 'n': str.stringValue.push_back('\n'); break;
                    case 'r': str.stringValue.push_back('\r'); break;
                    case 't': str.stringValue.push_back('\t'); break;
                    default:
                        throw Helix::ConfigurationException("Unsupported escaped character in JSON string");
                }
                continue;
            }
            str.stringValue.push_back(c);
        }

        return str;
    }

    JsonValue parseBoolean() {
        JsonValue value;
        value.type = JsonValue::Type::Bool;
        if (text.compare(position, 4, "true") == 0) {
            value.booleanValue = true;
            position += 4;
            return value;
        }
        if (text.compare(position, 5, "false") == 0) {
            value.booleanValue = false;
            position += 5;
            return value;
        }
        throw Helix::ConfigurationException("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) {
            throw Helix::ConfigurationException("Invalid JSON null value");
        }
        position += 4;
        return JsonValue{};
    }

    JsonValue parseNumber() {
        const size_t start = position;
        if (peek() == '-') take();

        if (peek() == '0') {
            take();
        } else {
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        if (position < text.size() && text[position] == '.') {
            ++position;
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) {
                ++position;
            }
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        const std::string token = text.substr(start, position - start);
        if (token.empty() || token == "-") {
            throw Helix::ConfigurationException("Invalid JSON number");
        }

        JsonValue number;
        number.type = JsonValue::Type::Number;
        try {
            number.numberValue = std::stod(token);
        } catch (const std::exception&) {
            throw Helix::ConfigurationException("Failed to parse JSON number");
        }
        return number;
    }
};

JsonValue parseRequestObject(const std::string& body) {
    JsonParser parser(body);
    JsonValue payload = parser.parse();
    if (!payload.isObject()) {
        throw Helix::ConfigurationException("Request body must be a JSON object");
    }
    return payload;
}

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default: out << c; break;
        }
    }
    return out.str();
}

std::string formatDouble(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

std::string serializeVector(const std::vector<double>& values) {
    std::ostringstream out;
    out << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ',';
        out << formatDouble(values[i]);
    }
    out << ']';
    return out.str();
}

const JsonValue& requireField(const JsonValue& payload, const std::string& key, const std::string& description) {
    const JsonValue* node = payload.find(key);
    if (node == nullptr) {
        throw Helix::ConfigurationException("Request requires " + description);
    }
    return *node;
}

std::string requireString(const JsonValue& payload, const std::string& key) {
    const JsonValue& node = requireField(payload, key, "string field '" + key + "'");
    if (!node.isString()) throw Helix::ConfigurationException("'" + key + "' must be a string");
    return node.stringValue;
}

size_t optionalCount(const JsonValue& payload, const std::string& key, size_t fallback) {
    const JsonValue* node = payload.find(key);
    if (node == nullptr) return fallback;
    if (!node->isNumber() || node->numberValue < 0.0 || std::floor(node->numberValue) != node->numberValue) {
        throw Helix::ConfigurationException("'" + key + "' must be a non-negative integer");
    }
    if (node->numberValue > static_cast<double>(kMaxRequestCount)) {
        throw Helix::ConfigurationException("'" + key + "' must not exceed " + std::to_string(kMaxRequestCount));
    }
    return static_cast<size_t>(node->numberValue);
}

std::vector<double> parseNumberArray(const JsonValue& value, const std::string& label) {
    if (!value.isArray()) {
        throw Helix::ConfigurationException(label + " must be a numeric array");
    }

    std::vector<double> out;
    out.reserve(value.arrayValue.size());
    for (const auto& item : value.arrayValue) {
        if (!item.isNumber() || !std::isfinite(item.numberValue)) {
            throw Helix::ConfigurationException(label + " must contain finite numbers only");
        }
        out.push_back(item.numberValue);
    }
    return out;
}

double latencySince(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

void logMonitoringLine(const std::string& endpoint, int status, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[HelixService][Monitor] endpoint=" << endpoint
         << " status=" << status
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs;
    std::cout << line.str() << "\n";
}

std::string makeErrorResponse(const std::string& error, double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"error\":\"" << escapeJsonString(error) << "\","
        << "\"latency_ms\":" << formatDouble(latencyMs)
        << "}";
    return out.str();
}
} // namespace

void RequestMonitor::countEndpoint(const std::string& endpoint) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/search") {
        searchRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (endpoint == "/forward") {
        forwardRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (endpoint == "/feedback") {
        feedbackRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (endpoint == "/train") {
        trainRequests.fetch_add(1, std::memory_order_relaxed);
    }
}

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs) {
    countEndpoint(endpoint);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    countEndpoint(endpoint);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.searchRequests = searchRequests.load(std::memory_order_relaxed);
    out.forwardRequests = forwardRequests.load(std::memory_order_relaxed);
    out.feedbackRequests = feedbackRequests.load(std::memory_order_relaxed);
    out.trainRequests = trainRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }
    return out;
}

RefinerService::RefinerService(ContinualTrainer& trainerRef,
                               std::vector<Entity> corpusValue,
                               std::vector<Entity> validationValue,
                               RequestMonitor& monitorRef)
    : trainer(trainerRef),
      corpus(std::move(corpusValue)),
      validation(std::move(validationValue)),
      monitor(monitorRef) {}

ServiceResponse RefinerService::handle(const std::string& method, const std::string& endpoint, const std::string& body) {
    const auto started = Clock::now();
    ServiceResponse response;
    try {
        if (method == "GET" && endpoint == "/health") {
            response.body = handleHealth();
        } else if (method == "GET" && endpoint == "/metrics") {
            response.body = handleMetrics();
        } else if (method == "POST" && endpoint == "/search") {
            response.body = handleSearch(body);
        } else if (method == "POST" && endpoint == "/forward") {
            response.body = handleForward(body);
        } else if (method == "POST" && endpoint == "/feedback") {
            response.body = handleFeedback(body);
        } else if (method == "POST" && endpoint == "/train") {
            response.body = handleTrain(body);
        } else {
            throw Helix::ConfigurationException("Unknown endpoint: " + method + " " + endpoint);
        }
        response.status = 200;
        monitor.recordSuccess(endpoint, latencySince(started));
    } catch (const std::exception& e) {
        const double latencyMs = latencySince(started);
        monitor.recordError(endpoint, latencyMs);
        response.status = 400;
        response.body = makeErrorResponse(e.what(), latencyMs);
    }

    if (endpoint != "/health") {
        logMonitoringLine(endpoint, response.status, latencySince(started), monitor.snapshot());
    }
    return response;
}

std::string RefinerService::handleSearch(const std::string& body) {
    const JsonValue payload = parseRequestObject(body);
    const std::string query = requireString(payload, "query");
    const size_t topK = optionalCount(payload, "top_k", 10);

    std::vector<SearchResult> results;
    {
        std::lock_guard<std::mutex> guard(trainerMutex);
        results = trainer.search(query, corpus, topK);
    }

    std::ostringstream out;
    out << "{\"count\":" << results.size() << ",\"results\":[";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) out << ',';
        const auto& r = results[i];
        out << "{\"id\":\"" << escapeJsonString(r.id) << "\","
            << "\"similarity\":" << formatDouble(r.similarity) << ","
            << "\"raw_similarity\":" << formatDouble(r.rawSimilarity) << ","
            << "\"refined_similarity\":" << formatDouble(r.refinedSimilarity) << "}";
    }
    out << "]}";
    return out.str();
}

std::string RefinerService::handleForward(const std::string& body) {
    const JsonValue payload = parseRequestObject(body);
    const Tensor node = Tensor::fromVector(parseNumberArray(requireField(payload, "node", "'node' array"), "node"));

    std::vector<Tensor> neighbors;
    if (const JsonValue* neighborsNode = payload.find("neighbors"); neighborsNode != nullptr) {
        if (!neighborsNode->isArray()) throw Helix::ConfigurationException("neighbors must be a 2D numeric array");
        for (size_t i = 0; i < neighborsNode->arrayValue.size(); ++i) {
            neighbors.push_back(Tensor::fromVector(
                parseNumberArray(neighborsNode->arrayValue[i], "neighbors[" + std::to_string(i) + "]")));
        }
    }

    std::vector<double> edgeWeights;
    const JsonValue* weightsNode = payload.find("edge_weights");
    if (weightsNode != nullptr) edgeWeights = parseNumberArray(*weightsNode, "edge_weights");

    NetworkOutput output;
    {
        std::lock_guard<std::mutex> guard(trainerMutex);
        output = trainer.forward(node, neighbors, weightsNode != nullptr ? &edgeWeights : nullptr);
    }

    std::ostringstream out;
    out << "{\"embedding\":" << serializeVector(output.embedding.data()) << ",\"attention\":[";
    for (size_t i = 0; i < output.attention.size(); ++i) {
        if (i > 0) out << ',';
        out << serializeVector(output.attention[i].data());
    }
    out << "]}";
    return out.str();
}

std::string RefinerService::handleFeedback(const std::string& body) {
    const JsonValue payload = parseRequestObject(body);
    const std::string query = requireString(payload, "query");

    const JsonValue& retrievedNode = requireField(payload, "retrieved", "'retrieved' array");
    if (!retrievedNode.isArray()) throw Helix::ConfigurationException("retrieved must be an array of objects");
    std::vector<Entity> retrieved;
    retrieved.reserve(retrievedNode.arrayValue.size());
    for (const auto& item : retrievedNode.arrayValue) {
        if (!item.isObject()) throw Helix::ConfigurationException("each retrieved entry must be an object");
        Entity entity;
        entity.id = requireString(item, "id");
        entity.payload = requireString(item, "sequence");
        retrieved.push_back(std::move(entity));
    }

    const JsonValue& labelsNode = requireField(payload, "labels", "'labels' object");
    if (!labelsNode.isObject()) throw Helix::ConfigurationException("labels must be an object keyed by id");
    std::unordered_map<std::string, FeedbackLabel> labels;
    for (const auto& kv : labelsNode.objectValue) {
        FeedbackLabel label;
        if (kv.second.isBool()) {
            label.isMatch = kv.second.booleanValue;
            label.confidence = label.isMatch ? 1.0 : 0.0;
        } else if (kv.second.isObject()) {
            const JsonValue& match = requireField(kv.second, "is_match", "'is_match' in label '" + kv.first + "'");
            if (!match.isBool()) throw Helix::ConfigurationException("is_match must be a boolean");
            label.isMatch = match.booleanValue;
            label.confidence = label.isMatch ? 1.0 : 0.0;
            if (const JsonValue* confidence = kv.second.find("confidence"); confidence != nullptr) {
                if (!confidence->isNumber()) throw Helix::ConfigurationException("confidence must be a number");
                label.confidence = confidence->numberValue;
            }
        } else {
            throw Helix::ConfigurationException("label '" + kv.first + "' must be a boolean or an object");
        }
        labels.emplace(kv.first, label);
    }

    FeedbackSummary summary;
    {
        std::lock_guard<std::mutex> guard(trainerMutex);
        summary = trainer.learnFromFeedback(query, retrieved, labels);
    }

    std::ostringstream out;
    out << "{\"processed\":" << summary.processed
        << ",\"upweighted\":" << summary.upweighted
        << ",\"downweighted\":" << summary.downweighted
        << ",\"skipped\":" << summary.skipped
        << ",\"motifs_adjusted\":" << summary.motifsAdjusted << "}";
    return out.str();
}

std::string RefinerService::handleTrain(const std::string& body) {
    const JsonValue payload = body.empty() ? parseRequestObject("{}") : parseRequestObject(body);
    const size_t epochs = optionalCount(payload, "epochs", 0);

    TrainingMetrics run;
    std::string state;
    {
        std::lock_guard<std::mutex> guard(trainerMutex);
        run = trainer.train(corpus, validation, epochs);
        state = ContinualTrainer::stateName(trainer.state());
    }

    std::ostringstream out;
    out << "{\"epochs\":" << run.loss.size()
        << ",\"final_loss\":" << (run.loss.empty() ? "null" : formatDouble(run.loss.back()))
        << ",\"final_accuracy\":" << (run.accuracy.empty() ? "null" : formatDouble(run.accuracy.back()))
        << ",\"consolidations\":" << run.consolidationEpochs.size()
        << ",\"state\":\"" << state << "\"}";
    return out.str();
}

std::string RefinerService::handleHealth() {
    std::lock_guard<std::mutex> guard(trainerMutex);
    std::ostringstream out;
    out << "{\"status\":\"ok\""
        << ",\"state\":\"" << ContinualTrainer::stateName(trainer.state()) << "\""
        << ",\"trained\":" << (trainer.network().isTrained() ? "true" : "false")
        << ",\"corpus_size\":" << corpus.size() << "}";
    return out.str();
}

std::string RefinerService::handleMetrics() {
    const MonitoringSnapshot snapshot = monitor.snapshot();
    std::lock_guard<std::mutex> guard(trainerMutex);
    const TrainingMetrics& metrics = trainer.metrics();

    std::ostringstream out;
    out << "{\"requests\":{"
        << "\"total\":" << snapshot.totalRequests
        << ",\"search\":" << snapshot.searchRequests
        << ",\"forward\":" << snapshot.forwardRequests
        << ",\"feedback\":" << snapshot.feedbackRequests
        << ",\"train\":" << snapshot.trainRequests
        << ",\"errors\":" << snapshot.errorRequests
        << ",\"avg_latency_ms\":" << formatDouble(snapshot.averageLatencyMs) << "}"
        << ",\"training\":{"
        << "\"epochs\":" << metrics.loss.size()
        << ",\"last_loss\":" << (metrics.loss.empty() ? "null" : formatDouble(metrics.loss.back()))
        << ",\"last_accuracy\":" << (metrics.accuracy.empty() ? "null" : formatDouble(metrics.accuracy.back()))
        << ",\"learning_rate\":" << formatDouble(trainer.learningRate())
        << ",\"replay_size\":" << trainer.replayBuffer().size()
        << ",\"ewc_tasks\":" << trainer.ewc().taskCount()
        << ",\"state\":\"" << ContinualTrainer::stateName(trainer.state()) << "\"}}";
    return out.str();
}
