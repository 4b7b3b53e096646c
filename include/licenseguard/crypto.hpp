#pragma once

/**
 * @file crypto.hpp
 * @brief Cryptographic utilities for LicenseGuard
 *
 * Base64, SHA-256 and HMAC-SHA256 on top of OpenSSL libcrypto.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace licenseguard {
namespace crypto {

// ==================== Base64 Encoding/Decoding ====================

/// Encode bytes to standard Base64
[[nodiscard]] std::string base64_encode(const std::vector<uint8_t>& data);

/// Encode a string's bytes to standard Base64
[[nodiscard]] std::string base64_encode(const std::string& data);

/// Decode standard Base64 to bytes; whitespace is ignored, empty on malformed input
[[nodiscard]] std::vector<uint8_t> base64_decode(const std::string& encoded);

// ==================== Digests ====================

/// Lowercase hex encoding of raw bytes
[[nodiscard]] std::string hex_encode(const unsigned char* data, size_t length);

/// SHA-256 of input as lowercase hex (64 chars)
[[nodiscard]] std::string sha256_hex(const std::string& input);

/**
 * @brief HMAC-SHA256 of message under key, as lowercase hex
 *
 * @return 64 hex chars, or empty string if OpenSSL fails
 */
[[nodiscard]] std::string hmac_sha256_hex(const std::string& key, const std::string& message);

/**
 * @brief Compare two hex digests in constant time
 *
 * Case-insensitive. Returns false when lengths differ or either side is empty.
 */
[[nodiscard]] bool digest_equals(const std::string& expected_hex, const std::string& actual_hex);

}  // namespace crypto
}  // namespace licenseguard
