/**
 * @file certificate_authority.h
 * @brief Issuing CA key material
 */

#pragma once

#include <string>
#include <acme/crypto/types.h>

namespace services {

/**
 * @brief Signing CA: private key, certificate and the chain served to clients
 *
 * Loaded once at startup and read-only afterwards.
 */
class CertificateAuthority {
public:
    /**
     * @param keyPem CA private key (PEM)
     * @param certPem CA certificate (PEM)
     * @param chainPem Chain appended to issued certificates; the CA certificate when empty
     * @throws std::runtime_error if the key or certificate cannot be parsed, or they do not match
     */
    CertificateAuthority(const std::string& keyPem, const std::string& certPem, const std::string& chainPem = "");

    /**
     * @brief Load from files (CA_KEY_PATH, CA_CERT_PATH, CA_CHAIN_PATH)
     * @throws std::runtime_error if a file cannot be read
     */
    static CertificateAuthority fromFiles(
        const std::string& keyPath,
        const std::string& certPath,
        const std::string& chainPath);

    X509* cert() const { return cert_.get(); }
    EVP_PKEY* key() const { return key_.get(); }

    /// @brief CA serial, upper-case hex; identifies the issuer in stored material
    const std::string& serial() const { return serial_; }

    const std::string& chainPem() const { return chainPem_; }

private:
    acme::crypto::UniqueKey key_;
    acme::crypto::UniqueCert cert_;
    std::string serial_;
    std::string chainPem_;
};

} // namespace services
