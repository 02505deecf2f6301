// include/telemetrydeck/signal.hpp
// One telemetry event record, ready for transmission.

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace telemetrydeck {

// A single signal as sent to the ingestion service.
//
// Built by TelemetryDeck::create_signal() and treated as immutable afterwards.
// Wire names are noted per field; float_value is omitted from the JSON body
// when unset.
struct Signal {
    std::chrono::system_clock::time_point received_at;  // receivedAt
    std::string app_id;                                  // appID
    std::string client_user;                             // clientUser (hashed)
    std::string session_id;                              // sessionID
    std::string signal_type;                             // type
    std::vector<std::string> payload;                    // payload, "key:value"
    std::string is_test_mode = "false";                  // isTestMode, textual
    std::optional<double> float_value;                   // floatValue
};

} // namespace telemetrydeck
