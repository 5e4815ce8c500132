// =============================================================================
// FakeTransport.hpp - Scripted HttpTransport for tests
// =============================================================================
// Responses are queued per URL. An exhausted queue repeats its last entry;
// an unknown URL answers NETWORK_ERROR.
// =============================================================================
#pragma once

#include "integra/net/HttpTransport.hpp"

#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Integra {

class FakeTransport final : public HttpTransport {
public:
    void script(const std::string& url, TransportResponse r) {
        routes_[url].push_back(std::move(r));
    }

    static TransportResponse ok(const std::string& body) {
        TransportResponse r;
        r.status = TransportStatus::OK;
        r.http_code = 200;
        r.body = body;
        return r;
    }

    static TransportResponse timeout() {
        TransportResponse r;
        r.status = TransportStatus::TIMEOUT;
        r.detail = "Timeout was reached";
        return r;
    }

    static TransportResponse httpError(long code) {
        TransportResponse r;
        r.status = TransportStatus::HTTP_ERROR;
        r.http_code = code;
        r.detail = "HTTP " + std::to_string(code);
        return r;
    }

    static TransportResponse refused() {
        TransportResponse r;
        r.status = TransportStatus::NETWORK_ERROR;
        r.detail = "Couldn't connect to server";
        return r;
    }

    TransportResponse get(const std::string& url,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds) override {
        calls.push_back(url);
        last_timeout = timeout;

        auto it = routes_.find(url);
        if (it == routes_.end() || it->second.empty()) return refused();

        TransportResponse r = it->second.front();
        if (it->second.size() > 1) it->second.pop_front();
        return r;
    }

    int callsTo(const std::string& url) const {
        int n = 0;
        for (const auto& c : calls) if (c == url) ++n;
        return n;
    }

    std::vector<std::string> calls;
    std::chrono::milliseconds last_timeout{0};

private:
    std::map<std::string, std::deque<TransportResponse>> routes_;
};

} // namespace Integra
