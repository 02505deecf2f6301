// src/client.cpp
// TelemetryDeck client implementation.

#include "telemetrydeck/client.hpp"
#include "telemetrydeck/executor.hpp"
#include "telemetrydeck/parameters.hpp"
#include "telemetrydeck/version.hpp"
#include "encoding.hpp"
#include "endpoint.hpp"
#include "hasher.hpp"
#include "logging.hpp"
#include "payload.hpp"
#include "signal_builder.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <random>
#include <vector>

namespace telemetrydeck {

// Generate a v4 UUID as 16 bytes.
static void generate_uuid(uint8_t out[16]) {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t a = dist(gen);
    uint64_t b = dist(gen);
    std::memcpy(out, &a, 8);
    std::memcpy(out + 8, &b, 8);

    // Set version 4 and variant bits
    out[6] = (out[6] & 0x0F) | 0x40; // version 4
    out[8] = (out[8] & 0x3F) | 0x80; // variant 1
}

// Canonical 8-4-4-4-12 lowercase form.
static std::string generate_session_id() {
    uint8_t bytes[16];
    generate_uuid(bytes);
    std::string hex = hasher::to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// Serialize signals and POST them. Shared by both delivery modes.
// Throws TelemetryDeckError on serialization, transport or status failure.
static void deliver(HttpClient& http, const std::string& url,
                    const std::vector<Signal>& signals) {
    auto body = encoding::encode_signals(signals);
    auto response = http.post(url, body, {{"Content-Type", "application/json"}});
    if (!response.success()) {
        throw TelemetryDeckError::http(response.status, std::move(response.body));
    }
}

// deliver() with the outcome discarded. Failures only reach the debug log.
static void deliver_detached(HttpClient& http, const std::string& url,
                             const std::vector<Signal>& signals) noexcept {
    try {
        deliver(http, url, signals);
    } catch (const std::exception& e) {
        TELEMETRYDECK_LOG_DEBUG("fire-and-forget send dropped",
            {logging::string_field("url", url), logging::string_field("error", e.what())});
    }
}

// ---

struct TelemetryDeck::Inner {
    TelemetryDeckConfig config;
    Params default_params;
    std::string session_id;
    std::string url;
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<Executor> executor;
};

TelemetryDeck::TelemetryDeck(TelemetryDeckConfig config) : inner_(std::make_unique<Inner>()) {
    // The version marker is applied last so a caller-supplied value cannot mask it.
    inner_->default_params = payload::merge(config.params(),
                                            Params().add(CLIENT_VERSION_KEY, VERSION));
    inner_->session_id = generate_session_id();
    inner_->url = endpoint::resolve_url(BASE_URL, config.namespace_name());
    if (config.http_client()) {
        inner_->http = config.http_client();
    } else {
        inner_->http = std::make_shared<CurlHttpClient>(config.network_timeout());
    }
    inner_->executor = config.executor() ? config.executor() : default_executor();
    inner_->config = std::move(config);

    TELEMETRYDECK_LOG_DEBUG("client created",
        {logging::string_field("app_id", inner_->config.app_id()),
         logging::string_field("url", inner_->url)});
}

TelemetryDeck::~TelemetryDeck() = default;
TelemetryDeck::TelemetryDeck(TelemetryDeck&&) noexcept = default;
TelemetryDeck& TelemetryDeck::operator=(TelemetryDeck&&) noexcept = default;

std::unique_ptr<TelemetryDeck> TelemetryDeck::create(const std::string& app_id) {
    return create(TelemetryDeckConfig::create(app_id));
}

std::unique_ptr<TelemetryDeck> TelemetryDeck::create(TelemetryDeckConfig config) {
    return std::unique_ptr<TelemetryDeck>(new TelemetryDeck(std::move(config)));
}

// --- Delivery ---

void TelemetryDeck::send(const std::string& signal_type,
                         const std::optional<std::string>& client_user,
                         const Params& payload,
                         std::optional<bool> is_test_mode,
                         std::optional<double> float_value) noexcept {
    try {
        std::vector<Signal> signals;
        signals.push_back(create_signal(signal_type, client_user, payload,
                                        is_test_mode, float_value));

        inner_->executor->spawn(
            [http = inner_->http, url = inner_->url, signals = std::move(signals)]() {
                deliver_detached(*http, url, signals);
            });
    } catch (const std::exception& e) {
        TELEMETRYDECK_LOG_DEBUG("fire-and-forget send dropped before dispatch",
            {logging::string_field("type", signal_type), logging::string_field("error", e.what())});
    }
}

void TelemetryDeck::send_sync(const std::string& signal_type,
                              const std::optional<std::string>& client_user,
                              const Params& payload,
                              std::optional<bool> is_test_mode,
                              std::optional<double> float_value) {
    std::vector<Signal> signals;
    signals.push_back(create_signal(signal_type, client_user, payload,
                                    is_test_mode, float_value));
    deliver(*inner_->http, inner_->url, signals);
}

Signal TelemetryDeck::create_signal(const std::string& signal_type,
                                    const std::optional<std::string>& client_user,
                                    const Params& payload,
                                    std::optional<bool> is_test_mode,
                                    std::optional<double> float_value) const {
    SignalContext ctx{inner_->config.app_id(), inner_->config.salt(),
                      inner_->default_params, inner_->session_id};
    return build_signal(ctx, signal_type, client_user, payload, is_test_mode,
                        float_value, std::chrono::system_clock::now());
}

// --- Session ---

void TelemetryDeck::reset_session(const std::optional<std::string>& new_session_id) {
    inner_->session_id = new_session_id ? *new_session_id : generate_session_id();
}

const std::string& TelemetryDeck::session_id() const noexcept {
    return inner_->session_id;
}

// --- Configuration ---

std::string TelemetryDeck::url() const {
    return inner_->url;
}

const std::string& TelemetryDeck::app_id() const noexcept {
    return inner_->config.app_id();
}

const std::optional<std::string>& TelemetryDeck::namespace_name() const noexcept {
    return inner_->config.namespace_name();
}

const std::optional<std::string>& TelemetryDeck::salt() const noexcept {
    return inner_->config.salt();
}

const Params& TelemetryDeck::default_params() const noexcept {
    return inner_->default_params;
}

} // namespace telemetrydeck
