// src/hasher.cpp
// SHA-256 user hashing via OpenSSL EVP.

#include "hasher.hpp"
#include "telemetrydeck/error.hpp"

#include <openssl/evp.h>

namespace telemetrydeck {
namespace hasher {

std::string to_hex(const unsigned char* data, size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out.push_back(kHex[data[i] >> 4]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

std::string hash_user(const std::string& identifier,
                      const std::optional<std::string>& salt) {
    std::string input = identifier;
    if (salt) input += *salt;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw TelemetryDeckError::hashing("SHA-256 digest failed");
    }
    return to_hex(digest, digest_len);
}

} // namespace hasher
} // namespace telemetrydeck
