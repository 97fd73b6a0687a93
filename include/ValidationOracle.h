#pragma once

#include <string>

struct OracleVerdict {
    bool isMatch = false;
    double confidence = 0.0;
};

/// External judge of whether a retrieved candidate really matches a query (e.g. an aligner).
class ValidationOracle {
public:
    virtual ~ValidationOracle() = default;
    virtual OracleVerdict validate(const std::string& queryId, const std::string& candidateId) = 0;
};
