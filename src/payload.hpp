// src/payload.hpp
// Parameter merging and "key:value" payload encoding.

#pragma once

#include "telemetrydeck/params.hpp"
#include <string>
#include <vector>

namespace telemetrydeck {
namespace payload {

static constexpr char DELIMITER = ':';
static constexpr char DELIMITER_REPLACEMENT = '_';

// Right-biased merge: entries of override replace same-named entries of base.
inline Params merge(const Params& base, const Params& override) {
    Params::Map result = base.map();
    for (const auto& [key, value] : override) {
        result[key] = value;
    }
    return Params(std::move(result));
}

// Replace every delimiter in a key so the entry splits unambiguously.
inline std::string sanitize_key(std::string key) {
    for (auto& c : key) {
        if (c == DELIMITER) c = DELIMITER_REPLACEMENT;
    }
    return key;
}

// One "key:value" string per entry. Values are kept verbatim.
// Order follows the map's iteration order and is not stable.
inline std::vector<std::string> encode(const Params& params) {
    std::vector<std::string> out;
    out.reserve(params.size());
    for (const auto& [key, value] : params) {
        std::string entry = sanitize_key(key);
        entry.push_back(DELIMITER);
        entry += value;
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace payload
} // namespace telemetrydeck
