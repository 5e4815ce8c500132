// =============================================================================
// HttpTransport.hpp - Single blocking GET
// =============================================================================
// The transport performs exactly one request and classifies the result.
// Retry policy lives in Fetcher, not here.
// =============================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace Integra {

enum class TransportStatus : uint8_t {
    OK        = 0,   // 2xx, body filled
    TIMEOUT   = 1,   // attempt exceeded its timeout (retryable)
    HTTP_ERROR = 2,  // non-2xx status
    NETWORK_ERROR = 3 // connect refused, DNS, TLS, ...
};

inline const char* transportStatusToString(TransportStatus s) {
    switch (s) {
        case TransportStatus::OK:            return "OK";
        case TransportStatus::TIMEOUT:       return "TIMEOUT";
        case TransportStatus::HTTP_ERROR:    return "HTTP_ERROR";
        case TransportStatus::NETWORK_ERROR: return "NETWORK_ERROR";
        default:                             return "UNKNOWN";
    }
}

struct TransportResponse {
    TransportStatus status = TransportStatus::NETWORK_ERROR;
    long        http_code = 0;
    std::string body;
    std::string detail;     // human-readable failure description
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual TransportResponse get(const std::string& url,
                                  std::chrono::milliseconds timeout,
                                  std::chrono::milliseconds connect_timeout) = 0;
};

} // namespace Integra
