#include "integra/pipeline/IntegrationValidator.hpp"

#include <chrono>

namespace Integra {

IntegrationValidator::IntegrationValidator(const AppConfig& config,
                                           Fetcher& fetcher,
                                           const RiskEngine& engine,
                                           ResultSink& sink,
                                           AuditLog& audit,
                                           ValidationObserver& observer)
    : config_(config),
      fetcher_(fetcher),
      engine_(engine),
      sink_(sink),
      audit_(audit),
      observer_(observer) {}

std::string IntegrationValidator::userUrl(int64_t id) const {
    return config_.users_base + "/" + std::to_string(id);
}

std::string IntegrationValidator::productUrl(int64_t id) const {
    return config_.products_base + "/" + std::to_string(id);
}

std::optional<nlohmann::json> IntegrationValidator::load(RecordKind kind, int64_t id,
                                                         const std::string& url) {
    observer_.onFetchStarted(kind, id, url);

    const int total = fetcher_.policy().retries;
    FetchReport report = fetcher_.fetch(url, [&](const FetchAttempt& attempt) {
        if (attempt.status == TransportStatus::TIMEOUT) {
            observer_.onFetchTimeout(kind, attempt.number, total);
        }
    });

    switch (report.status) {
        case FetchStatus::OK:
            return report.body;
        case FetchStatus::TIMED_OUT:
            audit_.warning("Timed out accessing " + url + " after " +
                           std::to_string(report.attempts.size()) + " attempts");
            break;
        case FetchStatus::FAILED:
        case FetchStatus::BAD_BODY:
            observer_.onFetchFailed(kind, report.detail);
            audit_.error("Error accessing " + url + ": " + report.detail);
            break;
        case FetchStatus::NOT_FOUND:
            break;
    }

    observer_.onRecordMissing(kind, id);
    audit_.warning(std::string(recordKindToString(kind)) + " " +
                   std::to_string(id) + " not found.");
    return std::nullopt;
}

ValidationOutcome IntegrationValidator::validate(int64_t user_id, int64_t product_id) {
    ValidationOutcome out;

    auto user_json = load(RecordKind::USER, user_id, userUrl(user_id));
    if (!user_json) {
        out.status = ValidationStatus::USER_MISSING;
        return out;
    }
    out.user = decodeUser(*user_json);

    auto product_json = load(RecordKind::PRODUCT, product_id, productUrl(product_id));
    if (!product_json) {
        out.status = ValidationStatus::PRODUCT_MISSING;
        return out;
    }
    out.product = decodeProduct(*product_json);

    observer_.onRecordsLoaded(*out.user, *out.product);

    RiskAssessment assessment = engine_.score(*out.user, *out.product);
    assessment.blocked = assessment.score >= config_.risk_threshold;
    observer_.onAssessment(assessment);
    observer_.onDecision(assessment.blocked, config_.risk_threshold);

    const std::string pair = "user=" + std::to_string(user_id) +
                             " product=" + std::to_string(product_id) +
                             " risk=" + std::to_string(assessment.score);
    if (assessment.blocked) {
        out.status = ValidationStatus::BLOCKED;
        audit_.warning("Integration blocked - " + pair);
    } else {
        out.status = ValidationStatus::AUTHORIZED;
        audit_.info("Integration authorized - " + pair);
    }

    out.assessment = assessment;

    EvaluationRecord record{std::chrono::system_clock::now(), *out.user, *out.product, assessment};
    out.result_path = sink_.save(record);

    observer_.onResultSaved(out.result_path);
    audit_.info("Result saved: " + out.result_path +
                " | risk=" + std::to_string(assessment.score) +
                " | blocked=" + (assessment.blocked ? "true" : "false"));

    return out;
}

} // namespace Integra
