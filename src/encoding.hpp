// src/encoding.hpp
// Hand-written JSON encoding of signals. No DOM; appends into one buffer.

#pragma once

#include "telemetrydeck/error.hpp"
#include "telemetrydeck/signal.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <system_error>
#include <vector>

namespace telemetrydeck {
namespace encoding {

// --- Helper functions ---

inline bool needs_escape(char c) {
    return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
}

// Append s with JSON string escaping, bulk-copying runs of safe characters.
inline void append_escaped(std::string& buf, const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t run_start = i;
        while (i < s.size() && !needs_escape(s[i])) ++i;
        if (i > run_start) {
            buf.append(s, run_start, i - run_start);
        }
        if (i < s.size()) {
            char c = s[i];
            switch (c) {
                case '"':  buf += "\\\""; break;
                case '\\': buf += "\\\\"; break;
                case '\b': buf += "\\b"; break;
                case '\f': buf += "\\f"; break;
                case '\n': buf += "\\n"; break;
                case '\r': buf += "\\r"; break;
                case '\t': buf += "\\t"; break;
                default: {
                    char hex[7];
                    std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                    buf.append(hex, 6);
                    break;
                }
            }
            ++i;
        }
    }
}

// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF.
inline bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; k++) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

// Append "\"name\":\"value\"" after checking value is UTF-8.
inline void write_string_field(std::string& buf, const char* name, const std::string& value) {
    if (!is_valid_utf8(value)) {
        throw TelemetryDeckError::serialization(std::string(name) + " is not valid UTF-8");
    }
    buf.push_back('"');
    buf += name;
    buf += "\":\"";
    append_escaped(buf, value);
    buf.push_back('"');
}

// ISO-8601 UTC with millisecond precision: 2026-10-19T08:30:00.123Z
inline std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) {
        throw TelemetryDeckError::serialization("receivedAt is out of range");
    }

    char out[32];
    int n = std::snprintf(out, sizeof(out), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                          tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                          tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
    if (n <= 0 || static_cast<size_t>(n) >= sizeof(out)) {
        throw TelemetryDeckError::serialization("receivedAt is out of range");
    }
    return std::string(out, static_cast<size_t>(n));
}

// Shortest representation that parses back to the same double.
inline void write_number(std::string& buf, double value) {
    if (!std::isfinite(value)) {
        throw TelemetryDeckError::serialization("floatValue must be finite");
    }
    char tmp[32];
    auto res = std::to_chars(tmp, tmp + sizeof(tmp), value);
    if (res.ec != std::errc()) {
        throw TelemetryDeckError::serialization("floatValue cannot be formatted");
    }
    buf.append(tmp, res.ptr);
}

// --- Signal encoding ---

inline void encode_signal_into(std::string& buf, const Signal& s) {
    buf.push_back('{');

    buf += "\"receivedAt\":\"";
    buf += format_timestamp(s.received_at);
    buf += "\",";

    write_string_field(buf, "appID", s.app_id);
    buf.push_back(',');
    write_string_field(buf, "clientUser", s.client_user);
    buf.push_back(',');
    write_string_field(buf, "sessionID", s.session_id);
    buf.push_back(',');
    write_string_field(buf, "type", s.signal_type);

    buf += ",\"payload\":[";
    for (size_t i = 0; i < s.payload.size(); i++) {
        if (!is_valid_utf8(s.payload[i])) {
            throw TelemetryDeckError::serialization("payload entry is not valid UTF-8");
        }
        if (i > 0) buf.push_back(',');
        buf.push_back('"');
        append_escaped(buf, s.payload[i]);
        buf.push_back('"');
    }
    buf += "],";

    write_string_field(buf, "isTestMode", s.is_test_mode);

    // Absent means absent: no "floatValue":null.
    if (s.float_value) {
        buf += ",\"floatValue\":";
        write_number(buf, *s.float_value);
    }

    buf.push_back('}');
}

// Encode signals as a JSON array. The ingestion endpoint always takes an
// array, even for a single signal.
// Throws TelemetryDeckError (ErrorKind::Serialization) on unencodable input.
inline std::string encode_signals(const std::vector<Signal>& signals) {
    std::string buf;
    buf.reserve(256 * signals.size() + 2);
    buf.push_back('[');
    for (size_t i = 0; i < signals.size(); i++) {
        if (i > 0) buf.push_back(',');
        encode_signal_into(buf, signals[i]);
    }
    buf.push_back(']');
    return buf;
}

} // namespace encoding
} // namespace telemetrydeck
