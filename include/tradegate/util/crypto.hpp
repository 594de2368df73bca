#pragma once

/**
 * Hashing and identifier helpers (OpenSSL)
 */

#include <string>
#include <string_view>

namespace tradegate {
namespace util {

// Lowercase hex SHA-256 of the bytes of data
std::string sha256_hex(std::string_view data);

// Lowercase hex HMAC-SHA256, used for exchange request signing
std::string hmac_sha256_hex(std::string_view key, std::string_view data);

// Random RFC 4122 version 4 UUID, e.g. "3f2b...-4...-a..."
std::string uuid4();

}  // namespace util
}  // namespace tradegate
