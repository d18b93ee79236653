/**
 * @file crl_builder.h
 * @brief Deterministic X.509 v2 CRL generation (RFC 5280 Section 5)
 *
 * Output depends only on the arguments: entries are sorted by serial before
 * encoding, so the same revoked set, timestamps and CRL number always give
 * the same TBSCertList.
 */

#pragma once

#include <ctime>
#include <string>
#include <vector>
#include "types.h"

namespace acme::crypto {

/**
 * @brief Build and sign a CRL
 *
 * Reason codes other than UNSPECIFIED are written as a CRLReason entry
 * extension; UNSPECIFIED is omitted as RFC 5280 recommends.
 *
 * @return Signed CRL, nullptr on failure
 */
UniqueCrl buildCrl(
    X509* caCert,
    EVP_PKEY* caKey,
    std::vector<RevokedEntry> entries,
    std::time_t thisUpdate,
    std::time_t nextUpdate,
    long crlNumber);

/**
 * @brief DER encoding of a CRL
 */
std::string crlToDer(X509_CRL* crl);

/**
 * @brief Parse a DER CRL
 */
UniqueCrl crlFromDer(const std::string& der);

/**
 * @brief SHA-256 (hex) over the canonical, serial-sorted list of entries
 *
 * Two revoked sets produce the same fingerprint iff they contain the same
 * serials with the same revocation times and reasons.
 */
std::string revokedSetFingerprint(std::vector<RevokedEntry> entries);

/**
 * @brief RFC 5280 CRLReason name for a reason code ("keyCompromise", ...)
 */
std::string crlReasonToString(int reasonCode);

/**
 * @brief Whether a client may request this reason code for revocation
 *
 * ACME revocation accepts 0, 1, 3, 4, 5 and 9. certificateHold (6),
 * removeFromCRL (8), cACompromise (2) and aACompromise (10) are not client reasons.
 */
bool isClientRevocationReason(int reasonCode);

} // namespace acme::crypto
