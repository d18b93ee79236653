/**
 * @file test_helpers.h
 * @brief Shared test helpers for acme::crypto unit tests
 *
 * Key, CA, CSR and OCSP request generation for self-contained tests
 * without a database or network.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <ctime>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/ec.h>
#include <openssl/objects.h>
#include <openssl/bn.h>
#include <openssl/asn1.h>
#include <openssl/ocsp.h>
#include <acme/crypto/types.h>

namespace test_helpers {

using acme::crypto::UniqueKey;
using acme::crypto::UniqueCert;
using acme::crypto::UniqueCrl;
using acme::crypto::UniqueReq;

// --- Key Generation ---

inline UniqueKey generateRsaKey(unsigned int bits = 2048) {
    return UniqueKey(EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", static_cast<size_t>(bits)));
}

inline UniqueKey generateEcKey(int nid = NID_X9_62_prime256v1) {
    return UniqueKey(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", OBJ_nid2sn(nid)));
}

/**
 * @brief EC key held in a legacy EC_KEY, as produced by pre-3.0 code paths
 */
inline UniqueKey generateLegacyEcKey(int nid = NID_X9_62_prime256v1) {
    EVP_PKEY* pkey = EVP_PKEY_new();
    EC_KEY* ec = EC_KEY_new_by_curve_name(nid);
    EC_KEY_generate_key(ec);
    EVP_PKEY_assign_EC_KEY(pkey, ec);
    return UniqueKey(pkey);
}

inline UniqueKey generateEd25519Key() {
    return UniqueKey(EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519"));
}

// --- Certificate Creation ---

/**
 * @brief Create a self-signed root CA certificate
 */
inline UniqueCert createRootCa(
    EVP_PKEY* key,
    const std::string& cn,
    int validDays = 3650,
    const EVP_MD* md = EVP_sha256())
{
    X509* cert = X509_new();
    X509_set_version(cert, 2);  // v3

    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);

    X509_NAME* name = X509_NAME_new();
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>("Test ACME CA"), -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    X509_set_subject_name(cert, name);
    X509_set_issuer_name(cert, name);
    X509_NAME_free(name);

    ASN1_TIME_set(X509_getm_notBefore(cert), time(nullptr) - 86400);
    ASN1_TIME_set(X509_getm_notAfter(cert), time(nullptr) + validDays * 86400L);

    X509_set_pubkey(cert, key);

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_basic_constraints, const_cast<char*>("critical,CA:TRUE"));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);

    ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_key_usage, const_cast<char*>("critical,keyCertSign,cRLSign"));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);

    ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_key_identifier, const_cast<char*>("hash"));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);

    X509_sign(cert, key, md);
    return UniqueCert(cert);
}

// --- CSR Creation ---

/**
 * @brief Create a signed CSR with an optional CN and subjectAltName dNSNames
 */
inline UniqueReq createCsr(
    EVP_PKEY* key,
    const std::string& cn,
    const std::vector<std::string>& dnsNames,
    const EVP_MD* md = EVP_sha256())
{
    X509_REQ* req = X509_REQ_new();
    X509_REQ_set_version(req, 0);

    X509_NAME* name = X509_NAME_new();
    if (!cn.empty()) {
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    }
    X509_REQ_set_subject_name(req, name);
    X509_NAME_free(name);

    X509_REQ_set_pubkey(req, key);

    if (!dnsNames.empty()) {
        std::string san;
        for (const auto& dns : dnsNames) {
            if (!san.empty()) san += ",";
            san += "DNS:" + dns;
        }
        STACK_OF(X509_EXTENSION)* exts = sk_X509_EXTENSION_new_null();
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, nullptr, NID_subject_alt_name,
                                                  const_cast<char*>(san.c_str()));
        sk_X509_EXTENSION_push(exts, ext);
        X509_REQ_add_extensions(req, exts);
        sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
    }

    X509_REQ_sign(req, key, md);
    return UniqueReq(req);
}

inline std::string csrToDer(X509_REQ* req) {
    unsigned char* der = nullptr;
    int len = i2d_X509_REQ(req, &der);
    std::string out(reinterpret_cast<char*>(der), static_cast<size_t>(len));
    OPENSSL_free(der);
    return out;
}

// --- OCSP ---

/**
 * @brief DER OCSP request for one certificate, optionally with a nonce
 */
inline std::string createOcspRequest(X509* cert, X509* issuer, bool withNonce = true) {
    OCSP_REQUEST* req = OCSP_REQUEST_new();
    OCSP_CERTID* id = OCSP_cert_to_id(EVP_sha1(), cert, issuer);
    OCSP_request_add0_id(req, id);
    if (withNonce) {
        OCSP_request_add1_nonce(req, nullptr, -1);
    }
    unsigned char* der = nullptr;
    int len = i2d_OCSP_REQUEST(req, &der);
    std::string out(reinterpret_cast<char*>(der), static_cast<size_t>(len));
    OPENSSL_free(der);
    OCSP_REQUEST_free(req);
    return out;
}

} // namespace test_helpers
