// src/signal_builder.cpp
// Signal construction.

#include "signal_builder.hpp"
#include "hasher.hpp"
#include "payload.hpp"
#include "telemetrydeck/client.hpp"

namespace telemetrydeck {

Signal build_signal(const SignalContext& ctx,
                    const std::string& signal_type,
                    const std::optional<std::string>& client_user,
                    const Params& payload,
                    std::optional<bool> is_test_mode,
                    std::optional<double> float_value,
                    std::chrono::system_clock::time_point now) {
    Signal signal;
    signal.received_at = now;
    signal.app_id = ctx.app_id;
    signal.client_user = client_user
        ? hasher::hash_user(*client_user, ctx.salt)
        : std::string(DEFAULT_CLIENT_USER);
    signal.session_id = ctx.session_id;
    signal.signal_type = signal_type;
    signal.payload = payload::encode(payload::merge(ctx.default_params, payload));
    signal.is_test_mode = is_test_mode.value_or(false) ? "true" : "false";
    signal.float_value = float_value;
    return signal;
}

} // namespace telemetrydeck
