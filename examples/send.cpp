// TelemetryDeck client: fire-and-forget and awaited signals.
//
//   cmake -B build -DTELEMETRYDECK_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_send <APP-ID>

#include "telemetrydeck/telemetrydeck.hpp"

#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, char** argv) {
    using namespace telemetrydeck;

    const char* app_id = argc > 1 ? argv[1] : "00000000-0000-0000-0000-000000000000";

    auto client = TelemetryDeck::create(
        TelemetryDeckConfig::builder(app_id)
            .salt("example-salt")
            .param("platform", "linux")
            .build());

    // Fire-and-forget: returns immediately, failures are dropped.
    client->send(Signals::Session::STARTED, std::string("user@example.com"));
    client->send("Settings.opened", std::string("user@example.com"),
                 Params().add(Parameters::Navigation::SOURCE_PATH, "/home"),
                 true);

    // Awaited: reports the outcome.
    try {
        client->send_sync(Signals::Purchase::COMPLETED, std::string("user@example.com"),
                          Params().add("sku", "annual_plan"), true, 49.99);
        std::cout << "purchase signal accepted\n";
    } catch (const TelemetryDeckError& e) {
        std::cerr << "purchase signal failed: " << e.what() << "\n";
    }

    // New session, e.g. after the user logs out.
    client->reset_session();
    std::cout << "session " << client->session_id() << "\n";

    // Give the detached sends a moment before the process exits.
    std::this_thread::sleep_for(std::chrono::seconds(2));
}
