/**
 * @file cert_ops.cpp
 * @brief Certificate issuance operations implementation
 *
 * All functions are free of I/O and logging side effects.
 */

#include <acme/crypto/cert_ops.h>

#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509v3.h>

namespace acme::crypto {

namespace {

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return (len > 0 && data) ? std::string(data, static_cast<size_t>(len)) : std::string();
}

bool addExtension(X509* cert, X509V3_CTX* ctx, int nid, const std::string& value) {
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, const_cast<char*>(value.c_str()));
    if (!ext) {
        return false;
    }
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return ok == 1;
}

bool setSerial(X509* cert, const std::string& hex) {
    BIGNUM* bn = nullptr;
    if (BN_hex2bn(&bn, hex.c_str()) == 0 || !bn) {
        return false;
    }
    bool ok = BN_to_ASN1_INTEGER(bn, X509_get_serialNumber(cert)) != nullptr;
    BN_free(bn);
    return ok;
}

bool setSubjectCn(X509* cert, const std::string& cn) {
    X509_NAME* name = X509_NAME_new();
    if (!name) return false;
    bool ok = X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                  reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0) == 1 &&
              X509_set_subject_name(cert, name) == 1;
    X509_NAME_free(name);
    return ok;
}

/// Common skeleton for CA-signed certificates
UniqueCert newCertificate(EVP_PKEY* subjectKey, const std::string& cn, const std::string& serial,
                          std::time_t notBefore, std::time_t notAfter, X509* caCert) {
    UniqueCert cert(X509_new());
    if (!cert) return nullptr;

    if (X509_set_version(cert.get(), 2) != 1 ||
        !setSerial(cert.get(), serial) ||
        !setSubjectCn(cert.get(), cn) ||
        X509_set_issuer_name(cert.get(), X509_get_subject_name(caCert)) != 1 ||
        !ASN1_TIME_set(X509_getm_notBefore(cert.get()), notBefore) ||
        !ASN1_TIME_set(X509_getm_notAfter(cert.get()), notAfter) ||
        X509_set_pubkey(cert.get(), subjectKey) != 1) {
        return nullptr;
    }
    return cert;
}

bool signWith(X509* cert, EVP_PKEY* caKey) {
    if (X509_sign(cert, caKey, digestForKey(caKey)) <= 0) {
        ERR_clear_error();
        return false;
    }
    return true;
}

} // anonymous namespace

// --- Serial numbers ---

std::string generateSerialHex(size_t numBytes) {
    std::vector<unsigned char> buf(numBytes);
    BIGNUM* bn = nullptr;
    do {
        if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
            BN_free(bn);
            throw std::runtime_error("RAND_bytes failed");
        }
        buf[0] &= 0x7F;
        bn = BN_bin2bn(buf.data(), static_cast<int>(buf.size()), bn);
        if (!bn) {
            throw std::runtime_error("BN_bin2bn failed");
        }
    } while (BN_is_zero(bn));

    char* hex = BN_bn2hex(bn);
    std::string out(hex);
    OPENSSL_free(hex);
    BN_free(bn);
    return out;
}

std::string serialHex(X509* cert) {
    if (!cert) return "";
    BIGNUM* bn = ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert), nullptr);
    if (!bn) return "";
    char* hex = BN_bn2hex(bn);
    std::string out(hex ? hex : "");
    OPENSSL_free(hex);
    BN_free(bn);
    return out;
}

// --- Signing ---

const EVP_MD* digestForKey(EVP_PKEY* key) {
    int type = EVP_PKEY_get_base_id(key);
    if (type == EVP_PKEY_ED25519 || type == EVP_PKEY_ED448) {
        return nullptr;
    }
    return EVP_sha256();
}

UniqueCert signLeafCertificate(const LeafCertificateRequest& request, X509* caCert, EVP_PKEY* caKey) {
    if (!request.subjectKey || !caCert || !caKey || request.dnsNames.empty()) {
        return nullptr;
    }

    UniqueCert cert = newCertificate(request.subjectKey, request.commonName, request.serialHex,
                                     request.notBefore, request.notAfter, caCert);
    if (!cert) return nullptr;

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, caCert, cert.get(), nullptr, nullptr, 0);

    std::string keyUsage = EVP_PKEY_get_base_id(request.subjectKey) == EVP_PKEY_RSA
        ? "critical,digitalSignature,keyEncipherment"
        : "critical,digitalSignature";

    std::string san;
    for (const auto& name : request.dnsNames) {
        if (!san.empty()) san += ",";
        san += "DNS:" + name;
    }

    bool ok = addExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:FALSE") &&
              addExtension(cert.get(), &ctx, NID_key_usage, keyUsage) &&
              addExtension(cert.get(), &ctx, NID_ext_key_usage, "serverAuth,clientAuth") &&
              addExtension(cert.get(), &ctx, NID_subject_key_identifier, "hash") &&
              addExtension(cert.get(), &ctx, NID_authority_key_identifier, "keyid:always") &&
              addExtension(cert.get(), &ctx, NID_subject_alt_name, san);

    if (ok && !request.ocspResponderUrl.empty()) {
        ok = addExtension(cert.get(), &ctx, NID_info_access, "OCSP;URI:" + request.ocspResponderUrl);
    }

    if (!ok || !signWith(cert.get(), caKey)) {
        return nullptr;
    }
    return cert;
}

UniqueCert signOcspResponderCertificate(
    EVP_PKEY* responderKey,
    const std::string& serial,
    std::time_t notBefore,
    std::time_t notAfter,
    X509* caCert,
    EVP_PKEY* caKey)
{
    if (!responderKey || !caCert || !caKey) {
        return nullptr;
    }

    UniqueCert cert = newCertificate(responderKey, "OCSP Responder", serial, notBefore, notAfter, caCert);
    if (!cert) return nullptr;

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, caCert, cert.get(), nullptr, nullptr, 0);

    bool ok = addExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:FALSE") &&
              addExtension(cert.get(), &ctx, NID_key_usage, "critical,digitalSignature") &&
              addExtension(cert.get(), &ctx, NID_ext_key_usage, "OCSPSigning") &&
              addExtension(cert.get(), &ctx, NID_id_pkix_OCSP_noCheck, "yes") &&
              addExtension(cert.get(), &ctx, NID_authority_key_identifier, "keyid:always");

    if (!ok || !signWith(cert.get(), caKey)) {
        return nullptr;
    }
    return cert;
}

UniqueKey generateEcP256Key() {
    return UniqueKey(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256"));
}

// --- Encodings ---

std::string certificateToPem(X509* cert) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || !cert || PEM_write_bio_X509(bio.get(), cert) != 1) {
        return "";
    }
    return bioToString(bio.get());
}

std::string certificateToDer(X509* cert) {
    if (!cert) return "";
    unsigned char* der = nullptr;
    int len = i2d_X509(cert, &der);
    if (len <= 0) return "";
    std::string out(reinterpret_cast<char*>(der), static_cast<size_t>(len));
    OPENSSL_free(der);
    return out;
}

UniqueCert certificateFromPem(const std::string& pem) {
    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return nullptr;
    return UniqueCert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
}

UniqueCert certificateFromDer(const std::string& der) {
    if (der.empty()) return nullptr;
    const auto* p = reinterpret_cast<const unsigned char*>(der.data());
    return UniqueCert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
}

std::vector<UniqueCert> certificatesFromPemBundle(const std::string& pem) {
    std::vector<UniqueCert> certs;
    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return certs;

    while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
        certs.emplace_back(cert);
    }
    // End of bundle leaves PEM_R_NO_START_LINE on the error queue
    ERR_clear_error();
    return certs;
}

std::string privateKeyToPem(EVP_PKEY* key) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || !key ||
        PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return "";
    }
    return bioToString(bio.get());
}

UniqueKey privateKeyFromPem(const std::string& pem) {
    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return nullptr;
    return UniqueKey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

// --- Inspection ---

std::string certificateFingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < mdLen; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return oss.str();
}

std::time_t certificateNotAfter(X509* cert) {
    struct tm tmVal;
    if (!cert || ASN1_TIME_to_tm(X509_get0_notAfter(cert), &tmVal) != 1) {
        return 0;
    }
    return timegm(&tmVal);
}

bool samePublicKey(X509* cert, EVP_PKEY* key) {
    if (!cert || !key) return false;
    EVP_PKEY* certKey = X509_get0_pubkey(cert);
    return certKey && EVP_PKEY_eq(certKey, key) == 1;
}

// --- Time ---

std::string formatRfc3339(std::time_t t) {
    struct tm tmVal;
    gmtime_r(&t, &tmVal);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmVal);
    return std::string(buf);
}

bool parseRfc3339(const std::string& text, std::time_t& out) {
    struct tm tmVal;
    std::memset(&tmVal, 0, sizeof(tmVal));
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tmVal.tm_year, &tmVal.tm_mon, &tmVal.tm_mday,
                    &tmVal.tm_hour, &tmVal.tm_min, &tmVal.tm_sec, &consumed) != 6) {
        return false;
    }
    tmVal.tm_year -= 1900;
    tmVal.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    // Fractional seconds are accepted and truncated
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    }

    long offset = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int hh = 0;
        int mm = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hh, &mm) != 2) {
            return false;
        }
        offset = (hh * 3600L + mm * 60L) * (text[pos] == '+' ? 1 : -1);
        pos += 6;
    } else {
        return false;
    }

    if (pos != text.size()) {
        return false;
    }

    out = timegm(&tmVal) - offset;
    return true;
}

} // namespace acme::crypto
