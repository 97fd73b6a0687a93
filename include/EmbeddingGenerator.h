#pragma once

#include "Tensor.h"

#include <cstddef>
#include <string>
#include <vector>

struct Entity {
    std::string id;
    std::string payload;
    // Only consulted by evaluation.
    std::vector<std::string> expectedSimilar;
};

/**
 * @brief Source of raw, fixed-width embeddings for entity payloads.
 */
class EmbeddingGenerator {
public:
    virtual ~EmbeddingGenerator() = default;

    virtual Tensor embed(const std::string& payload) const = 0;
    virtual size_t dimension() const noexcept = 0;
};
