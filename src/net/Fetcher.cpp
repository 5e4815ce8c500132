#include "integra/net/Fetcher.hpp"
#include "integra/core/Records.hpp"

#include <thread>
#include <utility>

using json = nlohmann::json;

namespace Integra {

Fetcher::Fetcher(HttpTransport& transport, const FetchPolicy& policy)
    : Fetcher(transport, policy,
              [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

Fetcher::Fetcher(HttpTransport& transport, const FetchPolicy& policy, Sleeper sleeper)
    : transport_(transport), policy_(policy), sleep_(std::move(sleeper)) {
    if (policy_.retries < 1) policy_.retries = 1;
}

FetchReport Fetcher::fetch(const std::string& url, const AttemptListener& onAttempt) {
    FetchReport report;
    report.url = url;

    for (int attempt = 1; attempt <= policy_.retries; ++attempt) {
        TransportResponse resp =
            transport_.get(url, policy_.timeout, policy_.connect_timeout);

        report.attempts.push_back({attempt, resp.status, resp.detail});
        if (onAttempt) onAttempt(report.attempts.back());

        if (resp.status == TransportStatus::TIMEOUT) {
            report.status = FetchStatus::TIMED_OUT;
            report.detail = resp.detail.empty() ? "timeout" : resp.detail;
            if (attempt < policy_.retries && policy_.retry_delay.count() > 0) {
                sleep_(policy_.retry_delay);
            }
            continue;
        }

        if (resp.status != TransportStatus::OK) {
            report.status = FetchStatus::FAILED;
            report.detail = resp.detail;
            return report;
        }

        // Decode failures are not transient; retrying would fetch the same bytes.
        json parsed = json::parse(resp.body, nullptr, false);
        if (parsed.is_discarded()) {
            report.status = FetchStatus::BAD_BODY;
            report.detail = "response body is not valid JSON";
            return report;
        }
        if (isAbsentBody(parsed)) {
            report.status = FetchStatus::NOT_FOUND;
            report.detail = "empty record";
            return report;
        }
        if (!parsed.is_object()) {
            report.status = FetchStatus::BAD_BODY;
            report.detail = std::string("response body is a JSON ") + parsed.type_name() +
                            ", not an object";
            return report;
        }

        report.status = FetchStatus::OK;
        report.detail.clear();
        report.body = std::move(parsed);
        return report;
    }

    return report;
}

} // namespace Integra
