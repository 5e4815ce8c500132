// =============================================================================
// ValidationObserver.hpp - Structured pipeline events
// =============================================================================
// Published by IntegrationValidator only. Fetcher and RiskEngine stay silent
// so they can be exercised without a console.
// =============================================================================
#pragma once

#include "integra/core/Records.hpp"
#include "integra/risk/RiskAssessment.hpp"

#include <cstdint>
#include <string>

namespace Integra {

enum class RecordKind : uint8_t {
    USER    = 0,
    PRODUCT = 1
};

inline const char* recordKindToString(RecordKind k) {
    switch (k) {
        case RecordKind::USER:    return "User";
        case RecordKind::PRODUCT: return "Product";
        default:                  return "Record";
    }
}

class ValidationObserver {
public:
    virtual ~ValidationObserver() = default;

    virtual void onFetchStarted(RecordKind kind, int64_t id, const std::string& url) = 0;
    virtual void onFetchTimeout(RecordKind kind, int attempt, int total) = 0;
    virtual void onFetchFailed(RecordKind kind, const std::string& detail) = 0;
    virtual void onRecordMissing(RecordKind kind, int64_t id) = 0;
    virtual void onRecordsLoaded(const UserRecord& user, const ProductRecord& product) = 0;
    virtual void onAssessment(const RiskAssessment& assessment) = 0;
    virtual void onDecision(bool blocked, int threshold) = 0;
    virtual void onResultSaved(const std::string& path) = 0;
};

class NullObserver final : public ValidationObserver {
public:
    void onFetchStarted(RecordKind, int64_t, const std::string&) override {}
    void onFetchTimeout(RecordKind, int, int) override {}
    void onFetchFailed(RecordKind, const std::string&) override {}
    void onRecordMissing(RecordKind, int64_t) override {}
    void onRecordsLoaded(const UserRecord&, const ProductRecord&) override {}
    void onAssessment(const RiskAssessment&) override {}
    void onDecision(bool, int) override {}
    void onResultSaved(const std::string&) override {}
};

} // namespace Integra
