#include "integra/net/CurlTransport.hpp"

#include <stdexcept>

namespace Integra {

CurlTransport::CurlTransport() {
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("[HTTP] curl_easy_init failed");
}

CurlTransport::~CurlTransport() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    // curl_global_cleanup() belongs to main(), after every handle is gone.
}

size_t CurlTransport::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

TransportResponse CurlTransport::get(const std::string& url,
                                     std::chrono::milliseconds timeout,
                                     std::chrono::milliseconds connect_timeout) {
    TransportResponse resp;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl_, CURLOPT_URL,               url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPGET,           1L);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER,        headers);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,     write_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA,         &resp.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS,        static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION,    1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL,          1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT,         "integra/1.0");

    CURLcode res = curl_easy_perform(curl_);

    // The handle outlives this call; don't leave it pointing at freed headers.
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        resp.status = TransportStatus::TIMEOUT;
        resp.detail = curl_easy_strerror(res);
        resp.body.clear();
        return resp;
    }
    if (res != CURLE_OK) {
        resp.status = TransportStatus::NETWORK_ERROR;
        resp.detail = curl_easy_strerror(res);
        resp.body.clear();
        return resp;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.http_code);
    if (resp.http_code < 200 || resp.http_code > 299) {
        resp.status = TransportStatus::HTTP_ERROR;
        resp.detail = "HTTP " + std::to_string(resp.http_code) + " for url: " + url;
        return resp;
    }

    resp.status = TransportStatus::OK;
    return resp;
}

} // namespace Integra
