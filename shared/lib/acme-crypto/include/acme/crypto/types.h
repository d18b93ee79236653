/**
 * @file types.h
 * @brief Common types for the ACME crypto library
 *
 * RAII handles for OpenSSL objects and shared result structs used across
 * the JWK/JWS, CSR, certificate and CRL modules.
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/ocsp.h>

namespace acme::crypto {

/// @name RAII wrappers
/// @{

struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

struct CrlDeleter { void operator()(X509_CRL* p) const { X509_CRL_free(p); } };
using UniqueCrl = std::unique_ptr<X509_CRL, CrlDeleter>;

struct ReqDeleter { void operator()(X509_REQ* p) const { X509_REQ_free(p); } };
using UniqueReq = std::unique_ptr<X509_REQ, ReqDeleter>;

struct OcspResponseDeleter { void operator()(OCSP_RESPONSE* p) const { OCSP_RESPONSE_free(p); } };
using UniqueOcspResponse = std::unique_ptr<OCSP_RESPONSE, OcspResponseDeleter>;

/// @}

/// @brief RFC 5280 Section 5.3.1 CRLReason codes
enum class CrlReason : int {
    UNSPECIFIED = 0,
    KEY_COMPROMISE = 1,
    CA_COMPROMISE = 2,
    AFFILIATION_CHANGED = 3,
    SUPERSEDED = 4,
    CESSATION_OF_OPERATION = 5,
    CERTIFICATE_HOLD = 6,
    REMOVE_FROM_CRL = 8,
    PRIVILEGE_WITHDRAWN = 9,
    AA_COMPROMISE = 10
};

/// @brief One revoked certificate as it appears in a CRL
struct RevokedEntry {
    std::string serialHex;   ///< Upper-case hex serial
    std::time_t revokedAt = 0;
    int reason = 0;          ///< CrlReason value
};

/// @brief Names and key information extracted from a CSR
struct CsrInfo {
    std::string commonName;            ///< Empty if the subject has no CN
    std::vector<std::string> dnsNames; ///< subjectAltName dNSName entries, in CSR order
};

/// @brief Public key policy check result
struct KeyStrengthResult {
    bool acceptable = false;
    std::string keyType;   ///< "RSA", "EC", "Ed25519", ...
    int bits = 0;
    std::string message;   ///< Reason when not acceptable
};

} // namespace acme::crypto
