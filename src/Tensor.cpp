#include "Tensor.h"

#include "HelixExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kCosineEps = 1e-8;
}

Tensor::Tensor(std::vector<size_t> shape)
    : m_data(elementCount(shape), 0.0), m_shape(std::move(shape)) {}

Tensor::Tensor(std::vector<double> data, std::vector<size_t> shape)
    : m_data(std::move(data)), m_shape(std::move(shape)) {
    if (m_data.size() != elementCount(m_shape)) {
        throw Helix::ShapeMismatchException("data holds " + std::to_string(m_data.size()) +
                                            " values but shape " + shapeString() + " requires " +
                                            std::to_string(elementCount(m_shape)));
    }
}

// An empty shape describes an empty tensor; scalars are not modelled.
size_t Tensor::elementCount(const std::vector<size_t>& shape) noexcept {
    if (shape.empty()) return 0;
    size_t n = 1;
    for (size_t d : shape) n *= d;
    return n;
}

Tensor Tensor::zeros(const std::vector<size_t>& shape) {
    return Tensor(shape);
}

Tensor Tensor::filled(const std::vector<size_t>& shape, double value) {
    Tensor t(shape);
    t.fill(value);
    return t;
}

Tensor Tensor::fromVector(std::vector<double> values) {
    const size_t n = values.size();
    return Tensor(std::move(values), {n});
}

Tensor Tensor::uniformRandom(const std::vector<size_t>& shape, double scale, std::mt19937& rng) {
    Tensor t(shape);
    std::uniform_real_distribution<double> dist(-scale, scale);
    for (double& v : t.m_data) v = dist(rng);
    return t;
}

Tensor Tensor::xavier(const std::vector<size_t>& shape, std::mt19937& rng) {
    const double fanIn = shape.empty() ? 1.0 : static_cast<double>(shape[0]);
    const double fanOut = shape.size() > 1 ? static_cast<double>(shape[1]) : 1.0;
    const double scale = std::sqrt(2.0 / (fanIn + fanOut));
    return uniformRandom(shape, scale, rng);
}

void Tensor::requireSameShape(const Tensor& other, const char* op) const {
    if (m_shape != other.m_shape) {
        throw Helix::ShapeMismatchException(std::string(op) + " of " + shapeString() + " and " + other.shapeString());
    }
}

Tensor Tensor::add(const Tensor& other) const {
    requireSameShape(other, "add");
    Tensor out(m_shape);
    for (size_t i = 0; i < m_data.size(); ++i) out.m_data[i] = m_data[i] + other.m_data[i];
    return out;
}

Tensor Tensor::subtract(const Tensor& other) const {
    requireSameShape(other, "subtract");
    Tensor out(m_shape);
    for (size_t i = 0; i < m_data.size(); ++i) out.m_data[i] = m_data[i] - other.m_data[i];
    return out;
}

Tensor Tensor::multiply(const Tensor& other) const {
    requireSameShape(other, "multiply");
    Tensor out(m_shape);
    for (size_t i = 0; i < m_data.size(); ++i) out.m_data[i] = m_data[i] * other.m_data[i];
    return out;
}

Tensor Tensor::multiply(double scalar) const {
    Tensor out(m_shape);
    for (size_t i = 0; i < m_data.size(); ++i) out.m_data[i] = m_data[i] * scalar;
    return out;
}

Tensor Tensor::matmul(const Tensor& other) const {
    if (other.rank() != 2 || (rank() != 1 && rank() != 2)) {
        throw Helix::ShapeMismatchException("matmul of " + shapeString() + " and " + other.shapeString());
    }
    const bool rowVector = rank() == 1;
    const size_t m = rowVector ? 1 : m_shape[0];
    const size_t k = rowVector ? m_shape[0] : m_shape[1];
    const size_t n = other.m_shape[1];
    if (k != other.m_shape[0]) {
        throw Helix::ShapeMismatchException("matmul inner dimensions differ: " + shapeString() + " x " +
                                            other.shapeString());
    }

    Tensor out(rowVector ? std::vector<size_t>{n} : std::vector<size_t>{m, n});
    const double* a = m_data.data();
    const double* b = other.m_data.data();
    double* c = out.m_data.data();

#ifdef USE_OPENMP
    #pragma omp parallel for if(m * n * k > 65536)
#endif
    for (long long row = 0; row < static_cast<long long>(m); ++row) {
        const size_t r = static_cast<size_t>(row);
        double* outRow = c + r * n;
        for (size_t p = 0; p < k; ++p) {
            const double av = a[r * k + p];
            if (av == 0.0) continue;
            const double* bRow = b + p * n;
            for (size_t j = 0; j < n; ++j) outRow[j] += av * bRow[j];
        }
    }
    return out;
}

Tensor Tensor::relu() const {
    Tensor out(m_shape);
    for (size_t i = 0; i < m_data.size(); ++i) out.m_data[i] = std::max(0.0, m_data[i]);
    return out;
}

Tensor Tensor::sigmoid() const {
    Tensor out(m_shape);
    for (size_t i = 0; i < m_data.size(); ++i) {
        const double clipped = std::clamp(m_data[i], -60.0, 60.0);
        out.m_data[i] = 1.0 / (1.0 + std::exp(-clipped));
    }
    return out;
}

Tensor Tensor::tanh() const {
    Tensor out(m_shape);
    for (size_t i = 0; i < m_data.size(); ++i) out.m_data[i] = std::tanh(m_data[i]);
    return out;
}

Tensor Tensor::softmax(double temperature) const {
    if (!(temperature > 0.0)) {
        throw Helix::HelixException("softmax temperature must be positive");
    }
    Tensor out(m_shape);
    if (m_data.empty()) return out;

    const double maxVal = *std::max_element(m_data.begin(), m_data.end());
    double total = 0.0;
    for (size_t i = 0; i < m_data.size(); ++i) {
        out.m_data[i] = std::exp((m_data[i] - maxVal) / temperature);
        total += out.m_data[i];
    }
    for (double& v : out.m_data) v /= total;
    return out;
}

Tensor Tensor::layerNorm(const Tensor& gamma, const Tensor& beta, double eps) const {
    if (gamma.size() != m_data.size() || beta.size() != m_data.size()) {
        throw Helix::ShapeMismatchException("layerNorm of " + shapeString() + " with gamma " + gamma.shapeString() +
                                            " and beta " + beta.shapeString());
    }
    Tensor out(m_shape);
    if (m_data.empty()) return out;

    const double n = static_cast<double>(m_data.size());
    const double mean = std::accumulate(m_data.begin(), m_data.end(), 0.0) / n;
    double var = 0.0;
    for (double v : m_data) var += (v - mean) * (v - mean);
    var /= n;
    const double invStd = 1.0 / std::sqrt(var + eps);
    for (size_t i = 0; i < m_data.size(); ++i) {
        out.m_data[i] = gamma.m_data[i] * (m_data[i] - mean) * invStd + beta.m_data[i];
    }
    return out;
}

double Tensor::dot(const Tensor& other) const {
    if (other.size() != size()) {
        throw Helix::ShapeMismatchException("dot of " + shapeString() + " and " + other.shapeString());
    }
    double acc = 0.0;
    for (size_t i = 0; i < m_data.size(); ++i) acc += m_data[i] * other.m_data[i];
    return acc;
}

double Tensor::cosine(const Tensor& other) const {
    if (other.size() != size()) {
        throw Helix::ShapeMismatchException("cosine of " + shapeString() + " and " + other.shapeString());
    }
    return dot(other) / (norm() * other.norm() + kCosineEps);
}

double Tensor::sum() const noexcept {
    return std::accumulate(m_data.begin(), m_data.end(), 0.0);
}

double Tensor::norm() const noexcept {
    double acc = 0.0;
    for (double v : m_data) acc += v * v;
    return std::sqrt(acc);
}

Tensor Tensor::clone() const {
    return Tensor(m_data, m_shape);
}

void Tensor::fill(double value) noexcept {
    std::fill(m_data.begin(), m_data.end(), value);
}

void Tensor::addScaledInPlace(const Tensor& other, double scale) {
    requireSameShape(other, "accumulate");
    for (size_t i = 0; i < m_data.size(); ++i) m_data[i] += scale * other.m_data[i];
}

std::string Tensor::shapeString() const {
    std::ostringstream os;
    os << '[';
    for (size_t i = 0; i < m_shape.size(); ++i) {
        if (i) os << ", ";
        os << m_shape[i];
    }
    os << ']';
    return os.str();
}
