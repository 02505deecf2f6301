// src/transport.hpp
// HTTPS transport over libcurl, one easy handle per request.

#pragma once

#include "telemetrydeck/http.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace telemetrydeck {

class CurlHttpClient : public HttpClient {
public:
    // timeout bounds the whole exchange (connect + TLS + transfer).
    explicit CurlHttpClient(std::chrono::milliseconds timeout);
    ~CurlHttpClient() override = default;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    // Throws TelemetryDeckError (ErrorKind::Network) when libcurl fails.
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<Header>& headers) override;

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace telemetrydeck
