// include/telemetrydeck/signals.hpp
// Reserved signal type names recognised by TelemetryDeck dashboards.

#pragma once

namespace telemetrydeck {

// Standard signal types. Pass as the signal_type argument of send().
//
// Example:
//   client->send(Signals::Session::STARTED);
struct Signals {
    struct Session {
        static constexpr const char* STARTED = "TelemetryDeck.Session.started";
    };

    struct Navigation {
        static constexpr const char* PATH_CHANGED = "TelemetryDeck.Navigation.pathChanged";
    };

    struct Purchase {
        static constexpr const char* COMPLETED            = "TelemetryDeck.Purchase.completed";
        static constexpr const char* FREE_TRIAL_STARTED   = "TelemetryDeck.Purchase.freeTrialStarted";
        static constexpr const char* CONVERTED_FROM_TRIAL = "TelemetryDeck.Purchase.convertedFromTrial";
    };

    struct Acquisition {
        static constexpr const char* NEW_INSTALL_DETECTED = "TelemetryDeck.Acquisition.newInstallDetected";
        static constexpr const char* LEAD_STARTED         = "TelemetryDeck.Acquisition.leadStarted";
        static constexpr const char* USER_ACQUIRED        = "TelemetryDeck.Acquisition.userAcquired";
        static constexpr const char* LEAD_CONVERTED       = "TelemetryDeck.Acquisition.leadConverted";
    };

    struct Signal {
        static constexpr const char* DURATION_IN_SECONDS = "TelemetryDeck.Signal.durationInSeconds";
    };
};

} // namespace telemetrydeck
