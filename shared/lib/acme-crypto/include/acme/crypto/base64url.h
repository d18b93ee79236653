/**
 * @file base64url.h
 * @brief Base64url (RFC 4648 Section 5) without padding, as used by JOSE
 */

#pragma once

#include <optional>
#include <string>

namespace acme::crypto {

/**
 * @brief Encode bytes as base64url without '=' padding
 */
std::string base64UrlEncode(const unsigned char* data, size_t length);
std::string base64UrlEncode(const std::string& data);

/**
 * @brief Strict base64url decode
 *
 * Rejects padding, whitespace and characters outside the URL-safe alphabet.
 *
 * @return Decoded bytes, std::nullopt if the input is not valid base64url
 */
std::optional<std::string> base64UrlDecode(const std::string& input);

/**
 * @brief Random bytes from the OpenSSL CSPRNG, base64url encoded
 * @throws std::runtime_error if RAND_bytes fails
 */
std::string randomBase64Url(size_t numBytes);

/**
 * @brief SHA-256 digest of data (raw bytes)
 */
std::string sha256(const std::string& data);

/**
 * @brief Lower-case hex encoding of raw bytes
 */
std::string toHex(const std::string& bytes);

} // namespace acme::crypto
