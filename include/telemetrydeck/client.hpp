// include/telemetrydeck/client.hpp
// TelemetryDeck client: signal construction, session and delivery.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "params.hpp"
#include "signal.hpp"
#include <memory>
#include <optional>
#include <string>

namespace telemetrydeck {

// Ingestion service every client talks to.
static constexpr const char* BASE_URL = "https://nom.telemetrydeck.com";

// Placeholder sent as clientUser when the caller gives no user identifier.
static constexpr const char* DEFAULT_CLIENT_USER = "cpp";

// The TelemetryDeck client.
//
// Created via TelemetryDeck::create(). Holds the default parameters (always
// including the library version) and the current session id. Each send call
// builds one Signal and posts it as a single-element JSON array.
//
// Example:
//   auto client = TelemetryDeck::create("YOUR-APP-ID");
//   client->send("appOpened", "user@example.com",
//                Params().add("screen", "home"));
class TelemetryDeck {
public:
    // Equivalent to create(TelemetryDeckConfig::create(app_id)).
    static std::unique_ptr<TelemetryDeck> create(const std::string& app_id);

    static std::unique_ptr<TelemetryDeck> create(TelemetryDeckConfig config);

    ~TelemetryDeck();

    TelemetryDeck(const TelemetryDeck&) = delete;
    TelemetryDeck& operator=(const TelemetryDeck&) = delete;
    TelemetryDeck(TelemetryDeck&&) noexcept;
    TelemetryDeck& operator=(TelemetryDeck&&) noexcept;

    // --- Delivery ---

    // Fire-and-forget. The signal is built now and posted on the executor.
    // Never blocks on the network, never throws, reports nothing.
    void send(const std::string& signal_type,
              const std::optional<std::string>& client_user = std::nullopt,
              const Params& payload = Params(),
              std::optional<bool> is_test_mode = std::nullopt,
              std::optional<double> float_value = std::nullopt) noexcept;

    // Awaited. Builds, serializes and posts on the calling thread.
    // Returns on a 2xx response; throws TelemetryDeckError otherwise.
    void send_sync(const std::string& signal_type,
                   const std::optional<std::string>& client_user = std::nullopt,
                   const Params& payload = Params(),
                   std::optional<bool> is_test_mode = std::nullopt,
                   std::optional<double> float_value = std::nullopt);

    // Build the signal a send call would transmit, without sending it.
    Signal create_signal(const std::string& signal_type,
                         const std::optional<std::string>& client_user = std::nullopt,
                         const Params& payload = Params(),
                         std::optional<bool> is_test_mode = std::nullopt,
                         std::optional<double> float_value = std::nullopt) const;

    // --- Session ---

    // Replace the session id with new_session_id, or a fresh random one.
    // Not synchronized with concurrent sends on this client.
    void reset_session(const std::optional<std::string>& new_session_id = std::nullopt);

    const std::string& session_id() const noexcept;

    // --- Configuration ---

    // Ingestion URL, namespaced when a namespace is configured.
    std::string url() const;

    const std::string& app_id() const noexcept;
    const std::optional<std::string>& namespace_name() const noexcept;
    const std::optional<std::string>& salt() const noexcept;
    const Params& default_params() const noexcept;

private:
    explicit TelemetryDeck(TelemetryDeckConfig config);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace telemetrydeck
