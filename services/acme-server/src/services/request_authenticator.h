/**
 * @file request_authenticator.h
 * @brief JWS request authentication (RFC 8555 Section 6.2)
 */

#pragma once

#include <optional>
#include <string>
#include <json/json.h>
#include <acme/crypto/jws.h>
#include "nonce_service.h"
#include "../repositories/repository_interfaces.h"

namespace services {

/**
 * @brief Which key reference an endpoint accepts
 */
enum class KeyMode {
    KID,        // Existing account (most endpoints)
    JWK,        // Embedded key (new-account)
    EITHER      // revoke-cert: account key or certificate key
};

/**
 * @brief A request whose signature, nonce and URL were verified
 */
struct AuthenticatedRequest {
    acme::crypto::JwsMessage jws;
    Json::Value jwk;                                    // Key that verified the signature
    std::string thumbprint;
    std::optional<domain::models::Account> account;    // Set for kid requests
    Json::Value payload;                                // null for POST-as-GET

    bool isPostAsGet() const { return jws.payloadB64.empty(); }
};

/**
 * @brief Inner JWS of a key rollover request
 */
struct KeyChangeRequest {
    Json::Value newJwk;
    std::string newThumbprint;
    Json::Value payload;                                // {account, oldKey}
};

/**
 * @brief Request Authenticator
 *
 * Check order:
 *   1. Content-Type is application/jose+json            (malformed, 415)
 *   2. Flattened JWS with one signature                 (malformed)
 *   3. alg on the allow-list                            (badSignatureAlgorithm)
 *   4. exactly one of jwk / kid, matching the endpoint  (malformed)
 *   5. kid resolves to a valid account                  (accountDoesNotExist / unauthorized)
 *   6. signature verifies                               (malformed)
 *   7. nonce is consumed                                (badNonce)
 *   8. url equals the request URL                       (unauthorized)
 *
 * The nonce is consumed only after the signature verified, so forged
 * requests cannot burn nonces.
 */
class RequestAuthenticator {
public:
    /**
     * @param nonceService Nonce consumption (non-owning)
     * @param accountRepository Account lookup for kid (non-owning)
     * @param accountUrlPrefix Absolute URL prefix of account resources
     *        ("https://host/acme/acct/"); kid values must start with it
     * @throws std::invalid_argument if a dependency is nullptr
     */
    RequestAuthenticator(
        NonceService* nonceService,
        repositories::IAccountRepository* accountRepository,
        std::string accountUrlPrefix);

    /**
     * @brief Authenticate a JWS POST
     * @throws common::AcmeServiceException subclasses on any failure
     */
    AuthenticatedRequest authenticate(
        const std::string& contentType,
        const std::string& body,
        const std::string& requestUrl,
        KeyMode mode);

    /**
     * @brief Verify the inner JWS of a key-change request
     *
     * The inner JWS must carry the new key as jwk, use the same url as the
     * outer request and be signed by that key. No nonce is required.
     */
    KeyChangeRequest verifyKeyChange(const Json::Value& outerPayload, const std::string& requestUrl);

    static bool isJoseContentType(const std::string& contentType);

private:
    NonceService* nonceService_;
    repositories::IAccountRepository* accountRepository_;
    std::string accountUrlPrefix_;

    domain::models::Account resolveAccount(const std::string& kid);
};

} // namespace services
