// src/signal_builder.hpp
// Pure construction of a Signal from client state and call arguments.

#pragma once

#include "telemetrydeck/params.hpp"
#include "telemetrydeck/signal.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace telemetrydeck {

// Client state a signal is built from. Borrowed for the duration of the call.
struct SignalContext {
    const std::string& app_id;
    const std::optional<std::string>& salt;
    const Params& default_params;
    const std::string& session_id;
};

// Build one signal. Call payload entries override default_params; the user
// identifier is hashed with the salt, or replaced by DEFAULT_CLIENT_USER when
// absent. float_value is carried as given, finite or not.
// Throws TelemetryDeckError (ErrorKind::Hashing) if hashing fails.
Signal build_signal(const SignalContext& ctx,
                    const std::string& signal_type,
                    const std::optional<std::string>& client_user,
                    const Params& payload,
                    std::optional<bool> is_test_mode,
                    std::optional<double> float_value,
                    std::chrono::system_clock::time_point now);

} // namespace telemetrydeck
