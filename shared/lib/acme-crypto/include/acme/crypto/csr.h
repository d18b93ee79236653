/**
 * @file csr.h
 * @brief PKCS#10 certificate signing request checks for ACME finalize
 *
 * Pure functions over X509_REQ, no I/O.
 */

#pragma once

#include <string>
#include <vector>
#include "types.h"

namespace acme::crypto {

/**
 * @brief Parse a DER encoded CSR
 * @return CSR handle, nullptr if the DER is not a CSR
 */
UniqueReq parseCsrDer(const std::string& der);

/**
 * @brief Verify the CSR self-signature (proof of possession)
 */
bool verifyCsrSignature(X509_REQ* req);

/**
 * @brief Check the CSR public key against issuance policy
 *
 * Accepted:
 *   - RSA: at least 2048 bits
 *   - EC: P-256, P-384, P-521
 *   - Ed25519
 */
KeyStrengthResult checkPublicKeyStrength(EVP_PKEY* key);

/**
 * @brief Extract subject CN and subjectAltName dNSName entries
 */
CsrInfo extractCsrNames(X509_REQ* req);

/**
 * @brief Distinct lower-cased names requested by the CSR (CN plus SANs)
 */
std::vector<std::string> csrNameSet(const CsrInfo& info);

/**
 * @brief Case-insensitive set equality of two name lists
 */
bool sameNameSet(const std::vector<std::string>& a, const std::vector<std::string>& b);

} // namespace acme::crypto
