#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Dense row-major tensor of doubles.
 *
 * Invariant: data().size() equals the product of shape(). Every operation
 * returns a new tensor; the in-place helpers are used only on buffers the
 * caller already owns (gradient accumulators, parameter updates).
 */
class Tensor {
public:
    Tensor() = default;
    explicit Tensor(std::vector<size_t> shape);
    Tensor(std::vector<double> data, std::vector<size_t> shape);

    static Tensor zeros(const std::vector<size_t>& shape);
    static Tensor filled(const std::vector<size_t>& shape, double value);
    static Tensor fromVector(std::vector<double> values);
    static Tensor uniformRandom(const std::vector<size_t>& shape, double scale, std::mt19937& rng);
    /// Uniform in [-s, s] with s = sqrt(2 / (fan_in + fan_out)).
    static Tensor xavier(const std::vector<size_t>& shape, std::mt19937& rng);
    static size_t elementCount(const std::vector<size_t>& shape) noexcept;

    size_t size() const noexcept { return m_data.size(); }
    size_t rank() const noexcept { return m_shape.size(); }
    bool empty() const noexcept { return m_data.empty(); }
    const std::vector<size_t>& shape() const noexcept { return m_shape; }
    std::vector<double>& data() noexcept { return m_data; }
    const std::vector<double>& data() const noexcept { return m_data; }

    double& operator[](size_t i) { return m_data[i]; }
    double operator[](size_t i) const { return m_data[i]; }

    Tensor add(const Tensor& other) const;
    Tensor subtract(const Tensor& other) const;
    Tensor multiply(const Tensor& other) const;
    Tensor multiply(double scalar) const;

    /// [m,k] x [k,n] -> [m,n]. A rank-1 left operand [k] is a row vector and yields [n].
    Tensor matmul(const Tensor& other) const;

    Tensor relu() const;
    Tensor sigmoid() const;
    Tensor tanh() const;
    Tensor softmax(double temperature = 1.0) const;
    /// Normalizes over all elements, not per row.
    Tensor layerNorm(const Tensor& gamma, const Tensor& beta, double eps = 1e-5) const;

    double dot(const Tensor& other) const;
    double cosine(const Tensor& other) const;
    double sum() const noexcept;
    double norm() const noexcept;

    Tensor clone() const;

    void fill(double value) noexcept;
    void addScaledInPlace(const Tensor& other, double scale);

    std::string shapeString() const;

private:
    void requireSameShape(const Tensor& other, const char* op) const;

    std::vector<double> m_data;
    std::vector<size_t> m_shape;
};
