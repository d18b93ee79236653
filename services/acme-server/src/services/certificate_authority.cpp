/**
 * @file certificate_authority.cpp
 * @brief CertificateAuthority implementation
 */

#include "certificate_authority.h"
#include <acme/crypto/cert_ops.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace services {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // anonymous namespace

CertificateAuthority::CertificateAuthority(
    const std::string& keyPem,
    const std::string& certPem,
    const std::string& chainPem)
    : key_(acme::crypto::privateKeyFromPem(keyPem))
    , cert_(acme::crypto::certificateFromPem(certPem))
{
    if (!key_) {
        throw std::runtime_error("CertificateAuthority: invalid CA private key");
    }
    if (!cert_) {
        throw std::runtime_error("CertificateAuthority: invalid CA certificate");
    }
    if (!acme::crypto::samePublicKey(cert_.get(), key_.get())) {
        throw std::runtime_error("CertificateAuthority: CA key does not match CA certificate");
    }

    serial_ = acme::crypto::serialHex(cert_.get());
    chainPem_ = chainPem.empty() ? acme::crypto::certificateToPem(cert_.get()) : chainPem;
}

CertificateAuthority CertificateAuthority::fromFiles(
    const std::string& keyPath,
    const std::string& certPath,
    const std::string& chainPath)
{
    std::string chain = chainPath.empty() ? std::string() : readFile(chainPath);
    CertificateAuthority ca(readFile(keyPath), readFile(certPath), chain);
    spdlog::info("[CertificateAuthority] Loaded CA {} (serial {})", certPath, ca.serial());
    return ca;
}

} // namespace services
