// bench/bench_common.hpp
// Shared benchmark scenarios and helpers.

#pragma once

#include "telemetrydeck/http.hpp"
#include "telemetrydeck/params.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace telemetrydeck_bench {

struct BenchScenario {
    const char* name;
    size_t param_count;
    size_t value_size;

    size_t total_bytes() const { return param_count * value_size; }
};

constexpr BenchScenario SCENARIOS[] = {
    {"bare", 0, 0},
    {"typical", 5, 16},
    {"wide", 40, 16},
    {"long_values", 5, 512},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// param_0..param_{n-1}, each with a value of value_size characters.
inline telemetrydeck::Params generate_params(const BenchScenario& scenario) {
    telemetrydeck::Params params;
    std::string value(scenario.value_size, 'x');
    for (size_t i = 0; i < scenario.param_count; i++) {
        params.add("param_" + std::to_string(i), value);
    }
    return params;
}

// Accepts every request without touching the network.
class NullHttpClient : public telemetrydeck::HttpClient {
public:
    telemetrydeck::HttpResponse post(const std::string&, const std::string& body,
                                     const std::vector<Header>&) override {
        bytes_ += body.size();
        return telemetrydeck::HttpResponse{200, std::string()};
    }

    size_t bytes() const { return bytes_; }

private:
    size_t bytes_ = 0;
};

} // namespace telemetrydeck_bench
