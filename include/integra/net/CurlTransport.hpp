#pragma once

#include "integra/net/HttpTransport.hpp"

#include <curl/curl.h>

namespace Integra {

// libcurl easy-handle transport. The handle is reused across calls so
// keep-alive connections to the same host survive between fetches.
// Not thread-safe: one instance per evaluating thread.
class CurlTransport final : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    TransportResponse get(const std::string& url,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds connect_timeout) override;

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    CURL* curl_{nullptr};
};

} // namespace Integra
