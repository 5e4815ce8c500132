// =============================================================================
// Fetcher.hpp - Bounded-retry JSON resource reader
// =============================================================================
// POLICY:
//   - Up to `retries` attempts, each guarded by `timeout`.
//   - Timeout        -> wait `retry_delay`, try again.
//   - Anything else  -> stop immediately (no retry): connection errors,
//                       non-2xx status, a body that is not a JSON object.
//   - All attempts timed out -> TIMED_OUT (absence).
//
// The Fetcher never logs or prints. Every attempt is recorded in the returned
// FetchReport and, when a listener is given, handed to it as soon as the
// attempt completes (before any retry delay). The caller decides what to
// publish.
// =============================================================================
#pragma once

#include "integra/config/AppConfig.hpp"
#include "integra/net/HttpTransport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Integra {

enum class FetchStatus : uint8_t {
    OK           = 0,
    TIMED_OUT    = 1,   // every attempt timed out
    FAILED       = 2,   // non-retryable transport / HTTP failure
    BAD_BODY     = 3,   // 2xx but not a decodable JSON object
    NOT_FOUND    = 4    // 2xx with an empty / null body
};

inline const char* fetchStatusToString(FetchStatus s) {
    switch (s) {
        case FetchStatus::OK:        return "OK";
        case FetchStatus::TIMED_OUT: return "TIMED_OUT";
        case FetchStatus::FAILED:    return "FAILED";
        case FetchStatus::BAD_BODY:  return "BAD_BODY";
        case FetchStatus::NOT_FOUND: return "NOT_FOUND";
        default:                     return "UNKNOWN";
    }
}

struct FetchAttempt {
    int             number = 0;     // 1-based
    TransportStatus status = TransportStatus::NETWORK_ERROR;
    std::string     detail;
};

struct FetchReport {
    FetchStatus status = FetchStatus::FAILED;
    std::string url;
    std::string detail;                      // last failure description
    std::vector<FetchAttempt> attempts;
    std::optional<nlohmann::json> body;      // set only when status == OK

    bool ok() const { return status == FetchStatus::OK; }
};

class Fetcher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using AttemptListener = std::function<void(const FetchAttempt&)>;

    Fetcher(HttpTransport& transport, const FetchPolicy& policy);
    Fetcher(HttpTransport& transport, const FetchPolicy& policy, Sleeper sleeper);

    FetchReport fetch(const std::string& url, const AttemptListener& onAttempt = {});

    const FetchPolicy& policy() const { return policy_; }

private:
    HttpTransport& transport_;
    FetchPolicy    policy_;
    Sleeper        sleep_;
};

} // namespace Integra
