// TelemetryDeck client on a single-threaded host that drives its own loop.
//
//   cmake -B build -DTELEMETRYDECK_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_event_loop <APP-ID>

#include "telemetrydeck/telemetrydeck.hpp"

#include <iostream>

int main(int argc, char** argv) {
    using namespace telemetrydeck;

    const char* app_id = argc > 1 ? argv[1] : "00000000-0000-0000-0000-000000000000";

    auto loop = std::make_shared<EventLoop>();
    auto client = TelemetryDeck::create(
        TelemetryDeckConfig::builder(app_id)
            .namespace_name("example")
            .executor(loop)
            .build());

    for (int frame = 0; frame < 3; frame++) {
        client->send("Frame.rendered", std::nullopt, Params().add("frame", frame), true);

        // Host turn: deliveries queued since the last turn run here.
        size_t ran = loop->run_until_idle();
        std::cout << "frame " << frame << ": ran " << ran << " delivery task(s)\n";
    }
}
