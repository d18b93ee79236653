/**
 * @file certificate.h
 * @brief Issued certificate and revocation material models
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace domain {
namespace models {

/**
 * @brief Certificate issued through ACME
 *
 * Immutable after insert except for the revocation fields, which are
 * written at most once.
 */
struct Certificate {
    std::string serial;               // Upper-case hex, globally unique
    std::string accountId;
    std::string orderId;
    std::string commonName;
    std::vector<std::string> sans;
    std::string issuerSerial;         // Serial of the signing CA
    std::time_t notBefore = 0;
    std::time_t notAfter = 0;
    std::string pem;                  // Leaf only; the chain is appended on download
    bool revoked = false;
    std::optional<int> revocationReason;
    std::optional<std::time_t> revokedAt;
    std::time_t createdAt = 0;
};

/**
 * @brief Cached CRL of one issuer
 */
struct CrlRecord {
    std::string issuerSerial;
    long long crlNumber = 0;
    std::time_t thisUpdate = 0;
    std::time_t nextUpdate = 0;
    std::string fingerprint;          // Of the revoked-entry set
    std::string der;
};

/**
 * @brief Delegated OCSP responder key and certificate
 *
 * Generations are numbered per issuer. The unique (issuer, generation) pair
 * keeps concurrent rotations from inserting twice.
 */
struct OcspResponderKey {
    std::string issuerSerial;
    long long generation = 0;
    std::string serial;
    std::string keyPem;
    std::string certPem;
    std::time_t notBefore = 0;
    std::time_t notAfter = 0;
};

} // namespace models
} // namespace domain
