// src/hasher.hpp
// One-way hashing of user identifiers.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace telemetrydeck {
namespace hasher {

// Lowercase hex SHA-256 of identifier followed by salt.
// An absent or empty salt hashes the identifier alone.
// Throws TelemetryDeckError (ErrorKind::Hashing) if the digest fails.
std::string hash_user(const std::string& identifier,
                      const std::optional<std::string>& salt = std::nullopt);

// Hex-encode raw bytes, lowercase.
std::string to_hex(const unsigned char* data, size_t len);

} // namespace hasher
} // namespace telemetrydeck
