/**
 * @file csr.cpp
 * @brief CSR parsing, proof-of-possession and key policy checks
 */

#include <acme/crypto/csr.h>

#include <openssl/core_names.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace acme::crypto {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::set<std::string> lowerSet(const std::vector<std::string>& names) {
    std::set<std::string> out;
    for (const auto& n : names) {
        out.insert(toLower(n));
    }
    return out;
}

} // anonymous namespace

UniqueReq parseCsrDer(const std::string& der) {
    if (der.empty()) {
        return nullptr;
    }
    const auto* p = reinterpret_cast<const unsigned char*>(der.data());
    X509_REQ* req = d2i_X509_REQ(nullptr, &p, static_cast<long>(der.size()));
    return UniqueReq(req);
}

bool verifyCsrSignature(X509_REQ* req) {
    if (!req) {
        return false;
    }
    EVP_PKEY* key = X509_REQ_get0_pubkey(req);
    if (!key) {
        return false;
    }
    return X509_REQ_verify(req, key) == 1;
}

KeyStrengthResult checkPublicKeyStrength(EVP_PKEY* key) {
    KeyStrengthResult result;

    if (!key) {
        result.message = "CSR has no public key";
        return result;
    }

    result.bits = EVP_PKEY_get_bits(key);

    switch (EVP_PKEY_get_base_id(key)) {
        case EVP_PKEY_RSA:
            result.keyType = "RSA";
            result.acceptable = result.bits >= 2048;
            if (!result.acceptable) {
                result.message = "RSA key size " + std::to_string(result.bits) +
                                 " bits is below the minimum of 2048 bits";
            }
            break;

        case EVP_PKEY_EC: {
            result.keyType = "EC";
            char group[64] = {0};
            size_t groupLen = 0;
            if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME,
                                               group, sizeof(group), &groupLen) == 1) {
                std::string name(group, groupLen);
                result.acceptable = name == "prime256v1" || name == "P-256" ||
                                    name == "secp384r1" || name == "P-384" ||
                                    name == "secp521r1" || name == "P-521";
            }
            if (!result.acceptable) {
                result.message = std::string("EC curve ") + group + " is not supported";
            }
            break;
        }

        case EVP_PKEY_ED25519:
            result.keyType = "Ed25519";
            result.acceptable = true;
            break;

        default:
            result.keyType = OBJ_nid2sn(EVP_PKEY_get_base_id(key));
            result.message = "Unsupported public key type: " + result.keyType;
            break;
    }

    return result;
}

CsrInfo extractCsrNames(X509_REQ* req) {
    CsrInfo info;
    if (!req) {
        return info;
    }

    X509_NAME* subject = X509_REQ_get_subject_name(req);
    int idx = subject ? X509_NAME_get_index_by_NID(subject, NID_commonName, -1) : -1;
    if (idx >= 0) {
        ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, idx));
        unsigned char* utf8 = nullptr;
        int len = ASN1_STRING_to_UTF8(&utf8, data);
        if (len > 0) {
            info.commonName.assign(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
        }
        OPENSSL_free(utf8);
    }

    STACK_OF(X509_EXTENSION)* exts = X509_REQ_get_extensions(req);
    if (exts) {
        auto* sans = static_cast<GENERAL_NAMES*>(
            X509V3_get_d2i(exts, NID_subject_alt_name, nullptr, nullptr));
        if (sans) {
            for (int i = 0; i < sk_GENERAL_NAME_num(sans); ++i) {
                GENERAL_NAME* gn = sk_GENERAL_NAME_value(sans, i);
                if (gn->type == GEN_DNS) {
                    const ASN1_IA5STRING* dns = gn->d.dNSName;
                    info.dnsNames.emplace_back(
                        reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)),
                        static_cast<size_t>(ASN1_STRING_length(dns)));
                }
            }
            GENERAL_NAMES_free(sans);
        }
        sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
    }

    return info;
}

std::vector<std::string> csrNameSet(const CsrInfo& info) {
    std::vector<std::string> names = info.dnsNames;
    if (!info.commonName.empty()) {
        names.push_back(info.commonName);
    }
    std::set<std::string> unique = lowerSet(names);
    return std::vector<std::string>(unique.begin(), unique.end());
}

bool sameNameSet(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return lowerSet(a) == lowerSet(b);
}

} // namespace acme::crypto
