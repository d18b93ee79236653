/**
 * @file cert_ops.h
 * @brief X.509 certificate operations for issuance: serials, signing, encodings
 *
 * No I/O, no logging. Loading key files is the caller's concern; these
 * functions only take PEM/DER bytes.
 */

#pragma once

#include <ctime>
#include <string>
#include <vector>
#include "types.h"

namespace acme::crypto {

/// @name Serial numbers
/// @{

/**
 * @brief Random positive serial of numBytes octets, upper-case hex
 *
 * The top bit is cleared so the DER INTEGER stays positive without padding;
 * with the default 16 octets this leaves 127 random bits.
 *
 * @throws std::runtime_error if the CSPRNG fails
 */
std::string generateSerialHex(size_t numBytes = 16);

/**
 * @brief Serial of a certificate as upper-case hex (no leading zeros)
 */
std::string serialHex(X509* cert);

/// @}

/// @name Signing
/// @{

/**
 * @brief Leaf certificate parameters
 */
struct LeafCertificateRequest {
    EVP_PKEY* subjectKey = nullptr;        ///< Public key from the CSR (non-owning)
    std::string commonName;
    std::vector<std::string> dnsNames;     ///< subjectAltName entries
    std::string serialHex;
    std::time_t notBefore = 0;
    std::time_t notAfter = 0;
    std::string ocspResponderUrl;          ///< Authority Information Access, optional
};

/**
 * @brief Sign a TLS server/client leaf certificate with the CA key
 * @return Signed certificate, nullptr on failure
 */
UniqueCert signLeafCertificate(const LeafCertificateRequest& request, X509* caCert, EVP_PKEY* caKey);

/**
 * @brief Sign a delegated OCSP responder certificate (EKU OCSPSigning + ocsp-nocheck)
 * @return Signed certificate, nullptr on failure
 */
UniqueCert signOcspResponderCertificate(
    EVP_PKEY* responderKey,
    const std::string& serialHex,
    std::time_t notBefore,
    std::time_t notAfter,
    X509* caCert,
    EVP_PKEY* caKey);

/**
 * @brief Digest to use with a signing key (nullptr for Ed25519, which signs the message itself)
 */
const EVP_MD* digestForKey(EVP_PKEY* key);

/**
 * @brief Fresh EC P-256 key pair for short-lived signing roles
 * @return Key, nullptr on failure
 */
UniqueKey generateEcP256Key();

/// @}

/// @name Encodings
/// @{

std::string certificateToPem(X509* cert);
std::string certificateToDer(X509* cert);
UniqueCert certificateFromPem(const std::string& pem);
UniqueCert certificateFromDer(const std::string& der);

/**
 * @brief Read all certificates of a PEM bundle, in order
 */
std::vector<UniqueCert> certificatesFromPemBundle(const std::string& pem);

std::string privateKeyToPem(EVP_PKEY* key);
UniqueKey privateKeyFromPem(const std::string& pem);

/// @}

/**
 * @brief SHA-256 fingerprint, lower-case hex
 */
std::string certificateFingerprint(X509* cert);

/**
 * @brief Certificate notAfter as Unix time
 */
std::time_t certificateNotAfter(X509* cert);

/**
 * @brief Whether two certificates carry the same public key
 */
bool samePublicKey(X509* cert, EVP_PKEY* key);

/**
 * @brief Unix time -> RFC 3339 UTC string ("2026-10-19T12:00:00Z")
 */
std::string formatRfc3339(std::time_t t);

/**
 * @brief RFC 3339 UTC string -> Unix time
 * @return false if the string is not a valid timestamp
 */
bool parseRfc3339(const std::string& text, std::time_t& out);

} // namespace acme::crypto
