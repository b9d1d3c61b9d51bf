#pragma once

/**
 * @file crypto.hpp
 * @brief Deterministic token hashing for mqttident
 *
 * Tokens are derived with SHAKE256 (OpenSSL EVP) and encoded as RFC 4648
 * base-32 or base64url text.
 */

#include "mqttident/mqttident.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mqttident {
namespace crypto {

// ==================== Encoding ====================

/// Encode bytes to RFC 4648 base-32 (uppercase, '=' padded)
[[nodiscard]] std::string base32_encode(const std::vector<uint8_t>& data);

/// Encode bytes to standard Base64
[[nodiscard]] std::string base64_encode(const std::vector<uint8_t>& data);

/// Encode bytes to Base64URL without padding (RFC 4648 section 5)
[[nodiscard]] std::string base64url_encode(const std::vector<uint8_t>& data);

// ==================== Digest ====================

/**
 * @brief SHAKE256 extendable-output digest
 *
 * @param data Bytes to hash
 * @param output_size Number of output bytes (must be > 0)
 * @return The digest, or DigestError if OpenSSL fails
 */
[[nodiscard]] Result<std::vector<uint8_t>> shake256(const std::string& data, size_t output_size);

// ==================== Tokens ====================

/**
 * @brief Build a lowercase base-32 token of exactly `length` characters
 *
 * The hashed content is `namespace 0x1F seed` (both trimmed), or the trimmed
 * seed alone when no namespace is given. Same inputs give the same token on
 * every platform.
 *
 * @param seed Non-blank seed
 * @param length Token length (>= 1)
 * @param ns Optional namespace; must not be blank when present
 * @return Token over [a-z2-7], or InvalidInput / DigestError
 */
[[nodiscard]] Result<std::string> build_compact_token(const std::string& seed, int length = 16,
                                                      const std::optional<std::string>& ns = std::nullopt);

/**
 * @brief Build a base64url token of exactly `length` characters
 *
 * Same input rules as build_compact_token. The alphabet is [A-Za-z0-9_-].
 */
[[nodiscard]] Result<std::string> build_urlsafe_token(const std::string& seed, int length = 32,
                                                      const std::optional<std::string>& ns = std::nullopt);

}  // namespace crypto
}  // namespace mqttident
