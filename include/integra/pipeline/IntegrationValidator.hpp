// =============================================================================
// IntegrationValidator.hpp - Fetch, score, decide, persist
// =============================================================================
// FLOW (one evaluation, single-threaded, runs to completion):
//   1. fetch user        -> absent? warn + stop
//   2. fetch product     -> absent? warn + stop
//   3. RiskEngine::score
//   4. blocked = score >= config.risk_threshold; audit the decision
//   5. sink.save()       -> always, blocked or not
//
// Nothing is persisted when either record is missing. The decision threshold
// is always the one in the AppConfig handed to the constructor.
//
// USAGE:
//   CurlTransport transport;
//   Fetcher fetcher(transport, cfg.fetch);
//   IntegrationValidator v(cfg, fetcher, engine, writer, audit, reporter);
//   ValidationOutcome o = v.validate(3, 7);
// =============================================================================
#pragma once

#include "integra/config/AppConfig.hpp"
#include "integra/core/Records.hpp"
#include "integra/logging/AuditLog.hpp"
#include "integra/net/Fetcher.hpp"
#include "integra/persist/ResultSink.hpp"
#include "integra/report/ValidationObserver.hpp"
#include "integra/risk/RiskEngine.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace Integra {

enum class ValidationStatus : uint8_t {
    AUTHORIZED      = 0,
    BLOCKED         = 1,
    USER_MISSING    = 2,
    PRODUCT_MISSING = 3
};

inline const char* validationStatusToString(ValidationStatus s) {
    switch (s) {
        case ValidationStatus::AUTHORIZED:      return "AUTHORIZED";
        case ValidationStatus::BLOCKED:         return "BLOCKED";
        case ValidationStatus::USER_MISSING:    return "USER_MISSING";
        case ValidationStatus::PRODUCT_MISSING: return "PRODUCT_MISSING";
        default:                                return "UNKNOWN";
    }
}

struct ValidationOutcome {
    ValidationStatus status = ValidationStatus::USER_MISSING;

    std::optional<UserRecord>     user;
    std::optional<ProductRecord>  product;
    std::optional<RiskAssessment> assessment;
    std::string result_path;    // empty when nothing was saved

    bool evaluated() const { return assessment.has_value(); }
    bool blocked() const { return status == ValidationStatus::BLOCKED; }
};

class IntegrationValidator {
public:
    IntegrationValidator(const AppConfig& config,
                         Fetcher& fetcher,
                         const RiskEngine& engine,
                         ResultSink& sink,
                         AuditLog& audit,
                         ValidationObserver& observer);

    // Throws ResultWriteError if the sink cannot persist the assessment.
    ValidationOutcome validate(int64_t user_id, int64_t product_id);

    std::string userUrl(int64_t id) const;
    std::string productUrl(int64_t id) const;

private:
    std::optional<nlohmann::json> load(RecordKind kind, int64_t id, const std::string& url);

    AppConfig           config_;
    Fetcher&            fetcher_;
    const RiskEngine&   engine_;
    ResultSink&         sink_;
    AuditLog&           audit_;
    ValidationObserver& observer_;
};

} // namespace Integra
