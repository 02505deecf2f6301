// src/transport.cpp
// HTTPS transport over libcurl.

#include "transport.hpp"
#include "telemetrydeck/error.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace telemetrydeck {
namespace {

// curl_global_init is not thread-safe; run it once per process. It is never
// paired with curl_global_cleanup because detached sends may still be running
// at exit.
void ensure_curl_initialized() {
    static std::once_flag once;
    static CURLcode init_result = CURLE_OK;
    std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (init_result != CURLE_OK) {
        throw TelemetryDeckError::network(
            std::string("curl_global_init failed: ") + curl_easy_strerror(init_result));
    }
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    ensure_curl_initialized();
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                  const std::vector<Header>& headers) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TelemetryDeckError::network("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [name, value] : headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw TelemetryDeckError::network("failed to allocate request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    char error_buf[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buf);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string detail = error_buf[0] != '\0' ? error_buf : curl_easy_strerror(res);
        throw TelemetryDeckError::network("POST " + url + " failed: " + detail);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace telemetrydeck
