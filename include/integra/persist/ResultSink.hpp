// =============================================================================
// ResultSink.hpp - Destination for finished evaluations
// =============================================================================
// Receives every assessment, blocked or not. Blocking stops the caller from
// proceeding; it never stops the record from being written.
// =============================================================================
#pragma once

#include "integra/core/Records.hpp"
#include "integra/risk/RiskAssessment.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace Integra {

struct EvaluationRecord {
    std::chrono::system_clock::time_point timestamp;
    UserRecord     user;
    ProductRecord  product;
    RiskAssessment assessment;
};

class ResultWriteError : public std::runtime_error {
public:
    explicit ResultWriteError(const std::string& what) : std::runtime_error(what) {}
};

class ResultSink {
public:
    virtual ~ResultSink() = default;

    // Returns where the record went (file path, key, ...).
    // Throws ResultWriteError on failure.
    virtual std::string save(const EvaluationRecord& record) = 0;
};

} // namespace Integra
