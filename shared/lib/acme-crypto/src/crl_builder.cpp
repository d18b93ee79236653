/**
 * @file crl_builder.cpp
 * @brief CRL generation implementation
 */

#include <acme/crypto/crl_builder.h>
#include <acme/crypto/base64url.h>
#include <acme/crypto/cert_ops.h>

#include <algorithm>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace acme::crypto {

namespace {

/// Numeric order on hex serials (shorter hex == smaller value, no leading zeros)
bool serialLess(const RevokedEntry& a, const RevokedEntry& b) {
    if (a.serialHex.size() != b.serialHex.size()) {
        return a.serialHex.size() < b.serialHex.size();
    }
    return a.serialHex < b.serialHex;
}

bool addRevokedEntry(X509_CRL* crl, const RevokedEntry& entry) {
    X509_REVOKED* revoked = X509_REVOKED_new();
    if (!revoked) return false;

    BIGNUM* bn = nullptr;
    ASN1_INTEGER* serial = nullptr;
    ASN1_TIME* when = ASN1_TIME_set(nullptr, entry.revokedAt);
    bool ok = BN_hex2bn(&bn, entry.serialHex.c_str()) != 0 &&
              (serial = BN_to_ASN1_INTEGER(bn, nullptr)) != nullptr &&
              when != nullptr &&
              X509_REVOKED_set_serialNumber(revoked, serial) == 1 &&
              X509_REVOKED_set_revocationDate(revoked, when) == 1;

    if (ok && entry.reason != static_cast<int>(CrlReason::UNSPECIFIED)) {
        ASN1_ENUMERATED* reason = ASN1_ENUMERATED_new();
        ok = reason != nullptr &&
             ASN1_ENUMERATED_set(reason, entry.reason) == 1 &&
             X509_REVOKED_add1_ext_i2d(revoked, NID_crl_reason, reason, 0, 0) == 1;
        ASN1_ENUMERATED_free(reason);
    }

    BN_free(bn);
    ASN1_INTEGER_free(serial);
    ASN1_TIME_free(when);

    if (!ok || X509_CRL_add0_revoked(crl, revoked) != 1) {
        X509_REVOKED_free(revoked);
        return false;
    }
    return true;
}

} // anonymous namespace

UniqueCrl buildCrl(
    X509* caCert,
    EVP_PKEY* caKey,
    std::vector<RevokedEntry> entries,
    std::time_t thisUpdate,
    std::time_t nextUpdate,
    long crlNumber)
{
    if (!caCert || !caKey) {
        return nullptr;
    }

    std::sort(entries.begin(), entries.end(), serialLess);

    UniqueCrl crl(X509_CRL_new());
    if (!crl) return nullptr;

    ASN1_TIME* last = ASN1_TIME_set(nullptr, thisUpdate);
    ASN1_TIME* next = ASN1_TIME_set(nullptr, nextUpdate);
    bool ok = last && next &&
              X509_CRL_set_version(crl.get(), 1) == 1 &&  // v2
              X509_CRL_set_issuer_name(crl.get(), X509_get_subject_name(caCert)) == 1 &&
              X509_CRL_set1_lastUpdate(crl.get(), last) == 1 &&
              X509_CRL_set1_nextUpdate(crl.get(), next) == 1;
    ASN1_TIME_free(last);
    ASN1_TIME_free(next);
    if (!ok) return nullptr;

    for (const auto& entry : entries) {
        if (!addRevokedEntry(crl.get(), entry)) {
            return nullptr;
        }
    }

    // CRL number
    ASN1_INTEGER* number = ASN1_INTEGER_new();
    ok = number && ASN1_INTEGER_set(number, crlNumber) == 1 &&
         X509_CRL_add1_ext_i2d(crl.get(), NID_crl_number, number, 0, 0) == 1;
    ASN1_INTEGER_free(number);
    if (!ok) return nullptr;

    // Authority key identifier
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, caCert, nullptr, nullptr, crl.get(), 0);
    X509_EXTENSION* aki = X509V3_EXT_conf_nid(nullptr, &ctx, NID_authority_key_identifier,
                                              const_cast<char*>("keyid:always"));
    if (aki) {
        X509_CRL_add_ext(crl.get(), aki, -1);
        X509_EXTENSION_free(aki);
    } else {
        ERR_clear_error();
    }

    if (X509_CRL_sign(crl.get(), caKey, digestForKey(caKey)) <= 0) {
        ERR_clear_error();
        return nullptr;
    }
    return crl;
}

std::string crlToDer(X509_CRL* crl) {
    if (!crl) return "";
    unsigned char* der = nullptr;
    int len = i2d_X509_CRL(crl, &der);
    if (len <= 0) return "";
    std::string out(reinterpret_cast<char*>(der), static_cast<size_t>(len));
    OPENSSL_free(der);
    return out;
}

UniqueCrl crlFromDer(const std::string& der) {
    if (der.empty()) return nullptr;
    const auto* p = reinterpret_cast<const unsigned char*>(der.data());
    return UniqueCrl(d2i_X509_CRL(nullptr, &p, static_cast<long>(der.size())));
}

std::string revokedSetFingerprint(std::vector<RevokedEntry> entries) {
    std::sort(entries.begin(), entries.end(), serialLess);
    std::string canonical;
    for (const auto& e : entries) {
        canonical += e.serialHex + ":" + std::to_string(static_cast<long long>(e.revokedAt)) +
                     ":" + std::to_string(e.reason) + "\n";
    }
    return toHex(sha256(canonical));
}

std::string crlReasonToString(int reasonCode) {
    switch (reasonCode) {
        case 0: return "unspecified";
        case 1: return "keyCompromise";
        case 2: return "cACompromise";
        case 3: return "affiliationChanged";
        case 4: return "superseded";
        case 5: return "cessationOfOperation";
        case 6: return "certificateHold";
        case 8: return "removeFromCRL";
        case 9: return "privilegeWithdrawn";
        case 10: return "aACompromise";
        default: return "unknown(" + std::to_string(reasonCode) + ")";
    }
}

bool isClientRevocationReason(int reasonCode) {
    switch (static_cast<CrlReason>(reasonCode)) {
        case CrlReason::UNSPECIFIED:
        case CrlReason::KEY_COMPROMISE:
        case CrlReason::AFFILIATION_CHANGED:
        case CrlReason::SUPERSEDED:
        case CrlReason::CESSATION_OF_OPERATION:
        case CrlReason::PRIVILEGE_WITHDRAWN:
            return true;
        default:
            return false;
    }
}

} // namespace acme::crypto
