/**
 * @file jwk.cpp
 * @brief JWK <-> EVP_PKEY conversion and RFC 7638 thumbprints (OpenSSL 3 provider API)
 */

#include <acme/crypto/jwk.h>
#include <acme/crypto/base64url.h>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/param_build.h>

#include <openssl/crypto.h>
#include <utility>
#include <vector>

namespace acme::crypto {

namespace {

struct CurveInfo {
    const char* crv;        ///< JOSE name
    const char* groupName;  ///< OpenSSL group name
    size_t coordSize;       ///< Field element size in bytes
};

const CurveInfo kCurves[] = {
    {"P-256", "prime256v1", 32},
    {"P-384", "secp384r1", 48},
    {"P-521", "secp521r1", 66},
};

const CurveInfo* curveByCrv(const std::string& crv) {
    for (const auto& c : kCurves) {
        if (crv == c.crv) return &c;
    }
    return nullptr;
}

const CurveInfo* curveByGroup(const std::string& group) {
    for (const auto& c : kCurves) {
        if (group == c.groupName || group == c.crv) return &c;
    }
    return nullptr;
}

std::string requireMember(const Json::Value& jwk, const char* name) {
    if (!jwk.isMember(name) || !jwk[name].isString()) {
        throw JwkException(std::string("JWK member '") + name + "' is missing or not a string");
    }
    return jwk[name].asString();
}

std::string requireB64Member(const Json::Value& jwk, const char* name) {
    auto decoded = base64UrlDecode(requireMember(jwk, name));
    if (!decoded || decoded->empty()) {
        throw JwkException(std::string("JWK member '") + name + "' is not valid base64url");
    }
    return *decoded;
}

/// Owns the temporary objects of an OSSL_PARAM build and the resulting key
class KeyFromData {
public:
    KeyFromData() : bld_(OSSL_PARAM_BLD_new()) {
        if (!bld_) throw JwkException("OSSL_PARAM_BLD_new failed");
    }
    ~KeyFromData() {
        OSSL_PARAM_free(params_);
        OSSL_PARAM_BLD_free(bld_);
        for (BIGNUM* bn : bignums_) BN_free(bn);
    }

    KeyFromData(const KeyFromData&) = delete;
    KeyFromData& operator=(const KeyFromData&) = delete;

    OSSL_PARAM_BLD* builder() { return bld_; }

    BIGNUM* bignum(const std::string& bytes) {
        BIGNUM* bn = BN_bin2bn(reinterpret_cast<const unsigned char*>(bytes.data()),
                               static_cast<int>(bytes.size()), nullptr);
        if (!bn) throw JwkException("BN_bin2bn failed");
        bignums_.push_back(bn);
        return bn;
    }

    UniqueKey build(const char* keyType) {
        params_ = OSSL_PARAM_BLD_to_param(bld_);
        if (!params_) throw JwkException("OSSL_PARAM_BLD_to_param failed");

        EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, keyType, nullptr);
        if (!ctx) throw JwkException(std::string("No provider for key type ") + keyType);

        EVP_PKEY* pkey = nullptr;
        int ok = EVP_PKEY_fromdata_init(ctx) == 1 &&
                 EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params_) == 1;
        EVP_PKEY_CTX_free(ctx);

        if (!ok || !pkey) {
            throw JwkException(std::string("Invalid ") + keyType + " public key");
        }
        return UniqueKey(pkey);
    }

private:
    OSSL_PARAM_BLD* bld_ = nullptr;
    OSSL_PARAM* params_ = nullptr;
    std::vector<BIGNUM*> bignums_;
};

std::string bnParam(EVP_PKEY* key, const char* name, size_t padTo = 0) {
    BIGNUM* bn = nullptr;
    if (EVP_PKEY_get_bn_param(key, name, &bn) != 1 || !bn) {
        throw JwkException(std::string("Cannot read key parameter ") + name);
    }
    size_t len = padTo > 0 ? padTo : static_cast<size_t>(BN_num_bytes(bn));
    std::string out(len, '\0');
    int written = padTo > 0
        ? BN_bn2binpad(bn, reinterpret_cast<unsigned char*>(&out[0]), static_cast<int>(len))
        : BN_bn2bin(bn, reinterpret_cast<unsigned char*>(&out[0]));
    BN_free(bn);
    if (written < 0) {
        throw JwkException(std::string("Cannot encode key parameter ") + name);
    }
    return out;
}

// Uncompressed point 0x04 || X || Y; also served for legacy EC_KEY-backed keys
std::pair<std::string, std::string> ecPublicPoint(EVP_PKEY* key, size_t coordSize) {
    unsigned char* encoded = nullptr;
    size_t len = EVP_PKEY_get1_encoded_public_key(key, &encoded);
    std::string point(reinterpret_cast<const char*>(encoded), encoded ? len : 0);
    OPENSSL_free(encoded);
    if (point.size() != 1 + 2 * coordSize || point[0] != 0x04) {
        throw JwkException("Cannot read EC public point");
    }
    return {point.substr(1, coordSize), point.substr(1 + coordSize, coordSize)};
}

} // anonymous namespace

UniqueKey jwkToPublicKey(const Json::Value& jwk) {
    if (!jwk.isObject()) {
        throw JwkException("JWK must be a JSON object");
    }

    std::string kty = requireMember(jwk, "kty");

    if (kty == "RSA") {
        std::string n = requireB64Member(jwk, "n");
        std::string e = requireB64Member(jwk, "e");

        KeyFromData data;
        if (OSSL_PARAM_BLD_push_BN(data.builder(), OSSL_PKEY_PARAM_RSA_N, data.bignum(n)) != 1 ||
            OSSL_PARAM_BLD_push_BN(data.builder(), OSSL_PKEY_PARAM_RSA_E, data.bignum(e)) != 1) {
            throw JwkException("Cannot build RSA key parameters");
        }
        return data.build("RSA");
    }

    if (kty == "EC") {
        const CurveInfo* curve = curveByCrv(requireMember(jwk, "crv"));
        if (!curve) {
            throw JwkException("Unsupported EC curve: " + jwk["crv"].asString());
        }
        std::string x = requireB64Member(jwk, "x");
        std::string y = requireB64Member(jwk, "y");
        if (x.size() != curve->coordSize || y.size() != curve->coordSize) {
            throw JwkException("EC coordinate length does not match curve");
        }

        std::string point = std::string(1, '\x04') + x + y;

        KeyFromData data;
        if (OSSL_PARAM_BLD_push_utf8_string(data.builder(), OSSL_PKEY_PARAM_GROUP_NAME,
                                            curve->groupName, 0) != 1 ||
            OSSL_PARAM_BLD_push_octet_string(data.builder(), OSSL_PKEY_PARAM_PUB_KEY,
                                             point.data(), point.size()) != 1) {
            throw JwkException("Cannot build EC key parameters");
        }
        return data.build("EC");
    }

    if (kty == "OKP") {
        std::string crv = requireMember(jwk, "crv");
        if (crv != "Ed25519") {
            throw JwkException("Unsupported OKP curve: " + crv);
        }
        std::string x = requireB64Member(jwk, "x");
        EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(
            EVP_PKEY_ED25519, nullptr,
            reinterpret_cast<const unsigned char*>(x.data()), x.size());
        if (!pkey) {
            throw JwkException("Invalid Ed25519 public key");
        }
        return UniqueKey(pkey);
    }

    throw JwkException("Unsupported JWK key type: " + kty);
}

Json::Value publicKeyToJwk(EVP_PKEY* key) {
    if (!key) {
        throw JwkException("Key is null");
    }

    Json::Value jwk(Json::objectValue);

    switch (EVP_PKEY_get_base_id(key)) {
    case EVP_PKEY_RSA:
        jwk["kty"] = "RSA";
        jwk["n"] = base64UrlEncode(bnParam(key, OSSL_PKEY_PARAM_RSA_N));
        jwk["e"] = base64UrlEncode(bnParam(key, OSSL_PKEY_PARAM_RSA_E));
        return jwk;

    case EVP_PKEY_EC: {
        char group[64] = {0};
        size_t groupLen = 0;
        if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME,
                                           group, sizeof(group), &groupLen) != 1) {
            throw JwkException("Cannot read EC group name");
        }
        const CurveInfo* curve = curveByGroup(group);
        if (!curve) {
            throw JwkException(std::string("Unsupported EC group: ") + group);
        }
        jwk["kty"] = "EC";
        jwk["crv"] = curve->crv;
        auto xy = ecPublicPoint(key, curve->coordSize);
        jwk["x"] = base64UrlEncode(xy.first);
        jwk["y"] = base64UrlEncode(xy.second);
        return jwk;
    }

    case EVP_PKEY_ED25519: {
        unsigned char raw[32];
        size_t len = sizeof(raw);
        if (EVP_PKEY_get_raw_public_key(key, raw, &len) != 1) {
            throw JwkException("Cannot read Ed25519 public key");
        }
        jwk["kty"] = "OKP";
        jwk["crv"] = "Ed25519";
        jwk["x"] = base64UrlEncode(raw, len);
        return jwk;
    }

    default:
        throw JwkException("Unsupported key type for JWK export");
    }
}

std::string canonicalJwk(const Json::Value& jwk) {
    if (!jwk.isObject()) {
        throw JwkException("JWK must be a JSON object");
    }

    std::string kty = requireMember(jwk, "kty");
    std::vector<const char*> members;
    if (kty == "RSA") {
        members = {"e", "kty", "n"};
    } else if (kty == "EC") {
        members = {"crv", "kty", "x", "y"};
    } else if (kty == "OKP") {
        members = {"crv", "kty", "x"};
    } else {
        throw JwkException("Unsupported JWK key type: " + kty);
    }

    std::string out = "{";
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) out += ",";
        out += "\"";
        out += members[i];
        out += "\":";
        out += Json::valueToQuotedString(requireMember(jwk, members[i]).c_str());
    }
    out += "}";
    return out;
}

std::string jwkThumbprint(const Json::Value& jwk) {
    return base64UrlEncode(sha256(canonicalJwk(jwk)));
}

std::string keyAuthorization(const std::string& token, const Json::Value& jwk) {
    return token + "." + jwkThumbprint(jwk);
}

} // namespace acme::crypto
