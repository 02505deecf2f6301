// src/logging.hpp
// Internal diagnostics on a dedicated spdlog logger.

#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace telemetrydeck {
namespace logging {

struct LogField {
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, int64_t value);

// The "telemetrydeck" logger, created on first use. Writes to stderr at the
// level named by TELEMETRYDECK_LOG_LEVEL (default "warn").
std::shared_ptr<spdlog::logger> logger();

// Emit message followed by space-separated key=value fields.
void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

} // namespace logging
} // namespace telemetrydeck

#define TELEMETRYDECK_LOG_DEBUG(...) ::telemetrydeck::logging::log_debug(__VA_ARGS__)
#define TELEMETRYDECK_LOG_WARN(...) ::telemetrydeck::logging::log_warn(__VA_ARGS__)
