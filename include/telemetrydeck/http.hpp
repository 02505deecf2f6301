// include/telemetrydeck/http.hpp
// HTTP POST capability consumed by the client.

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace telemetrydeck {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool success() const noexcept { return status >= 200 && status < 300; }
};

// Minimal POST-capable HTTP client.
//
// post() returns whatever status the server answered with; it throws
// TelemetryDeckError (ErrorKind::Network) only when no response was received.
// Implementations must be safe to call from several executor threads at once.
class HttpClient {
public:
    using Header = std::pair<std::string, std::string>;

    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const std::vector<Header>& headers) = 0;
};

} // namespace telemetrydeck
