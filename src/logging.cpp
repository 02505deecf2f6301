// src/logging.cpp
// spdlog-backed logger setup and structured field formatting.

#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>

namespace telemetrydeck {
namespace logging {
namespace {

constexpr const char* kLoggerName = "telemetrydeck";

spdlog::level::level_enum resolve_level() {
    if (const char* level = std::getenv("TELEMETRYDECK_LOG_LEVEL")) {
        return spdlog::level::from_str(level);
    }
    return spdlog::level::warn;
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) out << ' ';
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, int64_t value) {
    return {std::string(key), std::to_string(value)};
}

std::shared_ptr<spdlog::logger> logger() {
    // Never destroyed: workers of the leaked default pool may still log
    // during static destruction.
    static auto* instance = [] {
        // The host application may already have registered a logger by this name.
        auto l = spdlog::get(kLoggerName);
        if (!l) {
            l = spdlog::stderr_color_mt(kLoggerName);
            l->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v");
            l->set_level(resolve_level());
        }
        return new std::shared_ptr<spdlog::logger>(std::move(l));
    }();
    return *instance;
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
    auto l = logger();
    if (!l->should_log(level)) return;

    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        l->log(level, "{}", message);
    } else {
        l->log(level, "{} {}", message, serialized);
    }
}

} // namespace logging
} // namespace telemetrydeck
