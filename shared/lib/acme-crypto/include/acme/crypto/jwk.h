/**
 * @file jwk.h
 * @brief JSON Web Key (RFC 7517) conversion and RFC 7638 thumbprints
 *
 * Supported key types: RSA, EC (P-256, P-384, P-521) and OKP (Ed25519).
 * Only public members are read; private members in the input are ignored.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <json/json.h>
#include "types.h"

namespace acme::crypto {

/**
 * @brief Raised when a JWK is structurally invalid or uses an unsupported key type
 */
class JwkException : public std::runtime_error {
public:
    explicit JwkException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Build an OpenSSL public key from a JWK object
 * @throws JwkException on missing members, bad encoding or unsupported kty/crv
 */
UniqueKey jwkToPublicKey(const Json::Value& jwk);

/**
 * @brief Export the public half of a key as a JWK object
 * @throws JwkException for unsupported key types
 */
Json::Value publicKeyToJwk(EVP_PKEY* key);

/**
 * @brief Canonical JSON of the required JWK members (RFC 7638 Section 3.2)
 *
 * Members in lexicographic order, no whitespace:
 *   RSA: {"e","kty","n"}  EC: {"crv","kty","x","y"}  OKP: {"crv","kty","x"}
 *
 * @throws JwkException if a required member is missing
 */
std::string canonicalJwk(const Json::Value& jwk);

/**
 * @brief RFC 7638 thumbprint: base64url(SHA-256(canonicalJwk(jwk)))
 * @throws JwkException if a required member is missing
 */
std::string jwkThumbprint(const Json::Value& jwk);

/**
 * @brief ACME key authorization: token || '.' || thumbprint (RFC 8555 Section 8.1)
 */
std::string keyAuthorization(const std::string& token, const Json::Value& jwk);

} // namespace acme::crypto
