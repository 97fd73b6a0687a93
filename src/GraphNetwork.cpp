#include "GraphNetwork.h"

#include "ContrastiveLoss.h"
#include "HelixExceptions.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace {
constexpr char kSignature[] = "HELIX_GAT_V1";
constexpr uint32_t kModelFormatVersion = 1;
constexpr uint64_t kChecksumOffsetBasis = 1469598103934665603ULL;
constexpr uint64_t kChecksumPrime = 1099511628211ULL;
constexpr uint64_t kMaxDimension = 1000000ULL;
constexpr uint64_t kMaxRank = 8;

bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void swapEndian(T& val) {
    auto* first = reinterpret_cast<unsigned char*>(&val);
    std::reverse(first, first + sizeof(T));
}

template <typename T>
void updateChecksum(uint64_t& checksum, const T& value) {
    T copy = value;
    if (!isLittleEndian()) swapEndian(copy);
    const auto* bytes = reinterpret_cast<const unsigned char*>(&copy);
    for (size_t i = 0; i < sizeof(T); ++i) {
        checksum ^= static_cast<uint64_t>(bytes[i]);
        checksum *= kChecksumPrime;
    }
}

template <typename T>
void writeLE(std::ostream& out, T value) {
    if (!isLittleEndian()) swapEndian(value);
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    if (!out) throw Helix::IOException("Binary write failed");
}

template <typename T>
void readLE(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) throw Helix::ModelFormatException("Binary read failed or parameter data is truncated");
    if (!isLittleEndian()) swapEndian(value);
}

template <typename T>
void writeChecked(std::ostream& out, uint64_t& checksum, T value) {
    writeLE(out, value);
    updateChecksum(checksum, value);
}

template <typename T>
void readChecked(std::istream& in, uint64_t& checksum, T& value) {
    readLE(in, value);
    updateChecksum(checksum, value);
}
} // namespace

GraphNetwork::GraphNetwork(const NetworkConfig& config) : m_config(config) {
    if (config.numLayers == 0) throw Helix::ConfigurationException("network needs at least one layer");
    if (config.inputDim == 0 || config.hiddenDim == 0 || config.outputDim == 0) {
        throw Helix::ConfigurationException("network dimensions must be positive");
    }
    if (config.dropout < 0.0 || config.dropout >= 1.0) {
        throw Helix::ConfigurationException("dropout must be in [0, 1)");
    }
    if (!(config.temperature > 0.0)) throw Helix::ConfigurationException("temperature must be positive");

    std::mt19937 rng(config.seed);
    m_layers.reserve(config.numLayers);
    for (size_t l = 0; l < config.numLayers; ++l) {
        const size_t in = (l == 0) ? config.inputDim : config.hiddenDim;
        const size_t out = (l + 1 == config.numLayers) ? config.outputDim : config.hiddenDim;
        m_layers.emplace_back(in, config.inputDim, out, config.dropout, config.temperature, rng);
    }
}

NetworkOutput GraphNetwork::forward(const Tensor& node,
                                    const std::vector<Tensor>& neighbors,
                                    const std::vector<double>* edgeWeights,
                                    bool isTraining) {
    if (m_layers.empty()) throw Helix::HelixException("network has no layers");

    std::vector<Tensor> selfOnly;
    const std::vector<Tensor>* effective = &neighbors;
    if (neighbors.empty()) {
        selfOnly.push_back(node);
        effective = &selfOnly;
        edgeWeights = nullptr;
    }

    ++m_forwardCounter;
    NetworkOutput result;
    result.attention.reserve(m_layers.size());
    Tensor current = node;
    for (size_t l = 0; l < m_layers.size(); ++l) {
        const uint64_t counter = m_forwardCounter * static_cast<uint64_t>(m_layers.size()) + l;
        LayerOutput out = m_layers[l].forward(current, *effective, edgeWeights, isTraining, m_config.seed, counter);
        current = std::move(out.output);
        result.attention.push_back(std::move(out.attention));
    }
    result.embedding = std::move(current);
    return result;
}

std::vector<ParameterRef> GraphNetwork::parameters() {
    std::vector<ParameterRef> refs;
    refs.reserve(m_layers.size() * GraphAttentionLayer::kParameterCount);
    for (size_t l = 0; l < m_layers.size(); ++l) {
        const auto params = m_layers[l].parameters();
        for (size_t p = 0; p < params.size(); ++p) {
            refs.push_back({"layer" + std::to_string(l) + "." + GraphAttentionLayer::kParameterNames[p], params[p]});
        }
    }
    return refs;
}

std::vector<Tensor> GraphNetwork::zeroGradients() const {
    std::vector<Tensor> grads;
    grads.reserve(m_layers.size() * GraphAttentionLayer::kParameterCount);
    for (const auto& layer : m_layers) {
        for (const Tensor* p : layer.parameters()) grads.push_back(Tensor::zeros(p->shape()));
    }
    return grads;
}

std::vector<Tensor> GraphNetwork::snapshotParameters() const {
    std::vector<Tensor> snapshot;
    snapshot.reserve(m_layers.size() * GraphAttentionLayer::kParameterCount);
    for (const auto& layer : m_layers) {
        for (const Tensor* p : layer.parameters()) snapshot.push_back(p->clone());
    }
    return snapshot;
}

size_t GraphNetwork::parameterElementCount() const {
    size_t total = 0;
    for (const auto& layer : m_layers) {
        for (const Tensor* p : layer.parameters()) total += p->size();
    }
    return total;
}

double GraphNetwork::accumulateSampleGradients(const TrainingSample& sample,
                                               double temperature,
                                               std::vector<Tensor>& grads) {
    const std::vector<double>* weights = sample.neighborWeights.empty() ? nullptr : &sample.neighborWeights;
    NetworkOutput out = forward(sample.anchor, sample.neighbors, weights, true);
    LossWithGradient lg = ContrastiveLoss::infoNCEWithGradient(out.embedding, sample.positives, sample.negatives,
                                                               temperature);

    Tensor grad = std::move(lg.anchorGradient);
    for (size_t l = m_layers.size(); l-- > 0;) {
        grad = m_layers[l].backward(grad, grads, l * GraphAttentionLayer::kParameterCount);
    }
    return lg.loss;
}

GradientResult GraphNetwork::computeGradients(const std::vector<TrainingSample>& batch, double temperature) {
    GradientResult result;
    result.gradients = zeroGradients();
    if (batch.empty()) return result;

    for (const auto& sample : batch) {
        result.loss += accumulateSampleGradients(sample, temperature, result.gradients);
    }
    const double inv = 1.0 / static_cast<double>(batch.size());
    result.loss *= inv;
    for (auto& g : result.gradients) {
        for (double& v : g.data()) v *= inv;
    }
    return result;
}

void GraphNetwork::writeParameters(std::ostream& out) const {
    out.write(kSignature, sizeof(kSignature));
    if (!out) throw Helix::IOException("Binary write failed");

    writeLE(out, kModelFormatVersion);
    uint64_t checksum = kChecksumOffsetBasis;
    updateChecksum(checksum, kModelFormatVersion);

    writeChecked(out, checksum, static_cast<uint64_t>(m_layers.size()));
    writeChecked(out, checksum, static_cast<uint8_t>(m_trained ? 1 : 0));

    for (const auto& layer : m_layers) {
        writeChecked(out, checksum, static_cast<uint64_t>(layer.inputDim()));
        writeChecked(out, checksum, static_cast<uint64_t>(layer.neighborDim()));
        writeChecked(out, checksum, static_cast<uint64_t>(layer.outputDim()));
    }

    for (const auto& layer : m_layers) {
        for (const Tensor* p : layer.parameters()) {
            writeChecked(out, checksum, static_cast<uint64_t>(p->rank()));
            for (size_t d : p->shape()) writeChecked(out, checksum, static_cast<uint64_t>(d));
            for (double v : p->data()) writeChecked(out, checksum, v);
        }
    }

    writeLE(out, checksum);
}

void GraphNetwork::readParameters(std::istream& in) {
    char signature[sizeof(kSignature)];
    in.read(signature, sizeof(signature));
    if (!in) throw Helix::ModelFormatException("Failed to read parameter signature");
    if (std::memcmp(signature, kSignature, sizeof(kSignature)) != 0) {
        throw Helix::ModelFormatException("Unsupported or invalid parameter signature");
    }

    uint32_t version = 0;
    readLE(in, version);
    if (version != kModelFormatVersion) {
        throw Helix::ModelFormatException("Unsupported parameter format version " + std::to_string(version));
    }
    uint64_t checksum = kChecksumOffsetBasis;
    updateChecksum(checksum, version);

    uint64_t layerCount = 0;
    readChecked(in, checksum, layerCount);
    if (layerCount != m_layers.size()) {
        throw Helix::ModelFormatException("Stored network has " + std::to_string(layerCount) +
                                          " layers, this network has " + std::to_string(m_layers.size()));
    }

    uint8_t trained = 0;
    readChecked(in, checksum, trained);

    for (size_t l = 0; l < m_layers.size(); ++l) {
        uint64_t dims[3] = {0, 0, 0};
        for (uint64_t& d : dims) readChecked(in, checksum, d);
        const auto& layer = m_layers[l];
        if (dims[0] != layer.inputDim() || dims[1] != layer.neighborDim() || dims[2] != layer.outputDim()) {
            throw Helix::ModelFormatException("Layer " + std::to_string(l) + " dimensions do not match this network");
        }
    }

    // Parse into staging tensors so a corrupt blob leaves the network untouched.
    std::vector<Tensor> staged = zeroGradients();
    size_t index = 0;
    for (Tensor& target : staged) {
        uint64_t rank = 0;
        readChecked(in, checksum, rank);
        if (rank != target.rank() || rank > kMaxRank) {
            throw Helix::ModelFormatException("Parameter " + std::to_string(index) + " has unexpected rank");
        }
        for (size_t d = 0; d < target.rank(); ++d) {
            uint64_t dim = 0;
            readChecked(in, checksum, dim);
            if (dim > kMaxDimension || dim != target.shape()[d]) {
                throw Helix::ModelFormatException("Parameter " + std::to_string(index) + " has unexpected shape");
            }
        }
        for (double& v : target.data()) readChecked(in, checksum, v);
        ++index;
    }

    uint64_t stored = 0;
    readLE(in, stored);
    if (stored != checksum) throw Helix::ModelFormatException("Parameter checksum mismatch");

    index = 0;
    for (auto& layer : m_layers) {
        for (Tensor* p : layer.parameters()) *p = std::move(staged[index++]);
    }
    m_trained = trained != 0;
}

std::vector<uint8_t> GraphNetwork::saveParameters() const {
    std::ostringstream out(std::ios::binary);
    writeParameters(out);
    const std::string bytes = out.str();
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

void GraphNetwork::loadParameters(const std::vector<uint8_t>& blob) {
    std::istringstream in(std::string(blob.begin(), blob.end()), std::ios::binary);
    readParameters(in);
}

void GraphNetwork::saveModelBinary(const std::string& filename) const {
    std::ofstream out(filename, std::ios::binary);
    if (!out) throw Helix::IOException("Could not open " + filename + " for writing");
    writeParameters(out);
}

void GraphNetwork::loadModelBinary(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Helix::IOException("Could not open " + filename + " for reading");
    readParameters(in);
}
