/**
 * @file jws.h
 * @brief Flattened JWS (RFC 7515 Section 7.2.2) parsing and signature verification
 *
 * Pure functions, no I/O. Nonce, URL and account checks belong to the caller.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <json/json.h>
#include "types.h"

namespace acme::crypto {

/**
 * @brief The JWS is not well formed (bad JSON, bad base64url, multiple signatures)
 */
class JwsFormatException : public std::runtime_error {
public:
    explicit JwsFormatException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The "alg" header is missing, not allowed, or does not fit the key
 */
class JwsAlgorithmException : public std::runtime_error {
public:
    explicit JwsAlgorithmException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Parsed flattened JWS
 */
struct JwsMessage {
    std::string protectedB64;   ///< As received, used for the signing input
    std::string payloadB64;     ///< As received, empty for POST-as-GET
    Json::Value header;         ///< Decoded protected header
    std::string payload;        ///< Decoded payload bytes
    std::string signature;      ///< Decoded signature bytes

    std::string algorithm() const;
    bool hasJwk() const { return header.isMember("jwk"); }
    bool hasKid() const { return header.isMember("kid"); }

    /// @brief Payload parsed as a JSON object (null for POST-as-GET)
    Json::Value payloadJson() const;
};

/**
 * @brief Parse a flattened JWS JSON body
 *
 * The general serialization ("signatures" array) is rejected.
 * Unprotected "header" members are rejected (RFC 8555 Section 6.2).
 *
 * @throws JwsFormatException
 */
JwsMessage parseFlattenedJws(const std::string& body);

/**
 * @brief Whether alg is on the server allow-list
 *
 * RS256/RS384/RS512, PS256/PS384/PS512, ES256/ES384/ES512, EdDSA.
 * "none" and every MAC algorithm are never allowed.
 */
bool isAllowedAlgorithm(const std::string& alg);

/**
 * @brief Verify the JWS signature with the given public key
 *
 * @throws JwsAlgorithmException if alg is not allowed or does not match the key type
 * @return true if the signature is valid
 */
bool verifyJwsSignature(const JwsMessage& jws, EVP_PKEY* key);

/**
 * @brief Create a flattened JWS (used by tooling and tests acting as an ACME client)
 *
 * @param header Protected header, must contain "alg"
 * @param payload Raw payload (empty string for POST-as-GET)
 * @throws JwsAlgorithmException on unsupported alg
 * @throws std::runtime_error if signing fails
 */
std::string signFlattenedJws(const Json::Value& header, const std::string& payload, EVP_PKEY* key);

} // namespace acme::crypto
