// src/endpoint.hpp
// Ingestion URL resolution.

#pragma once

#include <optional>
#include <string>

namespace telemetrydeck {
namespace endpoint {

// {base}/v2/namespace/{ns}/ when a namespace is set, {base}/v2/ otherwise.
// The namespace is inserted as given.
inline std::string resolve_url(const std::string& base_url,
                               const std::optional<std::string>& namespace_name) {
    if (namespace_name) {
        return base_url + "/v2/namespace/" + *namespace_name + "/";
    }
    return base_url + "/v2/";
}

} // namespace endpoint
} // namespace telemetrydeck
