// include/telemetrydeck/params.hpp
// Signal parameters: a typed key/value map with a fluent builder.

#pragma once

#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <string>
#include <unordered_map>

namespace telemetrydeck {

// Flat string-to-string parameters attached to a signal.
//
// Values are kept as strings; numeric and boolean overloads of add() render
// them the way the ingestion service expects them in "key:value" entries.
// Adding a key twice keeps the last value.
//
// Example:
//   auto params = Params().add("screen", "settings").add("count", 3);
class Params {
public:
    using Map = std::unordered_map<std::string, std::string>;
    using const_iterator = Map::const_iterator;

    Params() = default;
    Params(std::initializer_list<Map::value_type> entries) : map_(entries) {}
    explicit Params(Map map) : map_(std::move(map)) {}

    Params& add(const std::string& key, const std::string& value) {
        map_[key] = value;
        return *this;
    }

    Params& add(const std::string& key, const char* value) {
        map_[key] = value ? value : "";
        return *this;
    }

    Params& add(const std::string& key, int64_t value) {
        map_[key] = std::to_string(value);
        return *this;
    }

    Params& add(const std::string& key, int value) {
        map_[key] = std::to_string(value);
        return *this;
    }

    Params& add(const std::string& key, double value) {
        char tmp[64];
        int n = std::snprintf(tmp, sizeof(tmp), "%g", value);
        map_[key] = n > 0 ? std::string(tmp, static_cast<size_t>(n)) : std::string();
        return *this;
    }

    Params& add(const std::string& key, bool value) {
        map_[key] = value ? "true" : "false";
        return *this;
    }

    bool contains(const std::string& key) const { return map_.count(key) != 0; }

    // Value for key, or an empty string when absent.
    std::string get(const std::string& key) const {
        auto it = map_.find(key);
        return it == map_.end() ? std::string() : it->second;
    }

    bool empty() const noexcept { return map_.empty(); }
    size_t size() const noexcept { return map_.size(); }

    const_iterator begin() const noexcept { return map_.begin(); }
    const_iterator end() const noexcept { return map_.end(); }

    const Map& map() const noexcept { return map_; }

    bool operator==(const Params& other) const { return map_ == other.map_; }
    bool operator!=(const Params& other) const { return map_ != other.map_; }

private:
    Map map_;
};

} // namespace telemetrydeck
