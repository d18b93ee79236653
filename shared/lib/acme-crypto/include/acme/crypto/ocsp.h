/**
 * @file ocsp.h
 * @brief OCSP (RFC 6960) response construction for a delegated responder
 */

#pragma once

#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include "types.h"

namespace acme::crypto {

/// @brief Revocation state reported for one serial
struct OcspCertStatus {
    enum class Status { GOOD, REVOKED, UNKNOWN };
    Status status = Status::UNKNOWN;
    std::time_t revokedAt = 0;
    int reason = 0;
};

/// @brief Looks up a serial (upper-case hex) issued by the responder's CA
using OcspStatusLookup = std::function<OcspCertStatus(const std::string& serialHex)>;

/**
 * @brief Signing material for a delegated responder
 */
struct OcspSigner {
    X509* caCert = nullptr;         ///< Issuer of the queried certificates
    X509* responderCert = nullptr;  ///< Delegated responder certificate
    EVP_PKEY* responderKey = nullptr;
};

/**
 * @brief Answer a DER encoded OCSP request
 *
 * Requests for certificates issued by another CA are answered "unknown".
 * The request nonce extension is copied into the response when present.
 *
 * @param requestDer DER OCSPRequest
 * @param signer Responder material; if responderCert is null the response is "tryLater"
 * @param lookup Status source
 * @param now Production time
 * @param validitySeconds nextUpdate offset from now
 * @return DER OCSPResponse (malformedRequest status for unparsable input)
 */
std::string buildOcspResponse(
    const std::string& requestDer,
    const OcspSigner& signer,
    const OcspStatusLookup& lookup,
    std::time_t now,
    long validitySeconds);

} // namespace acme::crypto
