/**
 * @file jws.cpp
 * @brief Flattened JWS parsing, verification and signing
 */

#include <acme/crypto/jws.h>
#include <acme/crypto/base64url.h>

#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/rsa.h>

#include <memory>
#include <vector>

namespace acme::crypto {

namespace {

struct AlgorithmSpec {
    const char* name;
    int keyType;              ///< EVP_PKEY_RSA, EVP_PKEY_EC, EVP_PKEY_ED25519
    const EVP_MD* (*md)();    ///< nullptr for EdDSA
    bool pss;
    int ecBits;               ///< Curve size for ES*, 0 otherwise
    size_t ecCoordSize;
};

const AlgorithmSpec kAllowedAlgorithms[] = {
    {"RS256", EVP_PKEY_RSA, EVP_sha256, false, 0, 0},
    {"RS384", EVP_PKEY_RSA, EVP_sha384, false, 0, 0},
    {"RS512", EVP_PKEY_RSA, EVP_sha512, false, 0, 0},
    {"PS256", EVP_PKEY_RSA, EVP_sha256, true, 0, 0},
    {"PS384", EVP_PKEY_RSA, EVP_sha384, true, 0, 0},
    {"PS512", EVP_PKEY_RSA, EVP_sha512, true, 0, 0},
    {"ES256", EVP_PKEY_EC, EVP_sha256, false, 256, 32},
    {"ES384", EVP_PKEY_EC, EVP_sha384, false, 384, 48},
    {"ES512", EVP_PKEY_EC, EVP_sha512, false, 521, 66},
    {"EdDSA", EVP_PKEY_ED25519, nullptr, false, 0, 0},
};

const AlgorithmSpec* findAlgorithm(const std::string& alg) {
    for (const auto& spec : kAllowedAlgorithms) {
        if (alg == spec.name) return &spec;
    }
    return nullptr;
}

struct MdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

bool parseJsonObject(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &out, &errors)) {
        return false;
    }
    return out.isObject();
}

std::string toCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

/// JOSE ECDSA signatures are r||s; OpenSSL wants DER
std::string rawEcdsaToDer(const std::string& raw, size_t coordSize) {
    if (raw.size() != coordSize * 2) {
        return {};
    }
    const auto* bytes = reinterpret_cast<const unsigned char*>(raw.data());
    BIGNUM* r = BN_bin2bn(bytes, static_cast<int>(coordSize), nullptr);
    BIGNUM* s = BN_bin2bn(bytes + coordSize, static_cast<int>(coordSize), nullptr);
    ECDSA_SIG* sig = ECDSA_SIG_new();
    if (!r || !s || !sig || ECDSA_SIG_set0(sig, r, s) != 1) {
        BN_free(r);
        BN_free(s);
        ECDSA_SIG_free(sig);
        return {};
    }

    unsigned char* der = nullptr;
    int len = i2d_ECDSA_SIG(sig, &der);
    ECDSA_SIG_free(sig);
    if (len <= 0) {
        return {};
    }
    std::string out(reinterpret_cast<char*>(der), static_cast<size_t>(len));
    OPENSSL_free(der);
    return out;
}

std::string derEcdsaToRaw(const std::string& der, size_t coordSize) {
    const auto* p = reinterpret_cast<const unsigned char*>(der.data());
    ECDSA_SIG* sig = d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size()));
    if (!sig) {
        throw std::runtime_error("Cannot decode ECDSA signature");
    }
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig, &r, &s);

    std::string raw(coordSize * 2, '\0');
    auto* out = reinterpret_cast<unsigned char*>(&raw[0]);
    BN_bn2binpad(r, out, static_cast<int>(coordSize));
    BN_bn2binpad(s, out + coordSize, static_cast<int>(coordSize));
    ECDSA_SIG_free(sig);
    return raw;
}

const AlgorithmSpec& requireCompatible(const std::string& alg, EVP_PKEY* key) {
    const AlgorithmSpec* spec = findAlgorithm(alg);
    if (!spec) {
        throw JwsAlgorithmException("Algorithm not allowed: " + (alg.empty() ? "(none)" : alg));
    }
    if (!key || EVP_PKEY_get_base_id(key) != spec->keyType) {
        throw JwsAlgorithmException("Algorithm " + alg + " does not match the key type");
    }
    if (spec->ecBits > 0 && EVP_PKEY_get_bits(key) != spec->ecBits) {
        throw JwsAlgorithmException("Algorithm " + alg + " does not match the EC curve");
    }
    return *spec;
}

/// Sets up ctx for sign or verify according to spec
bool initDigestContext(EVP_MD_CTX* ctx, const AlgorithmSpec& spec, EVP_PKEY* key, bool sign) {
    EVP_PKEY_CTX* pctx = nullptr;
    const EVP_MD* md = spec.md ? spec.md() : nullptr;
    int rc = sign ? EVP_DigestSignInit(ctx, &pctx, md, nullptr, key)
                  : EVP_DigestVerifyInit(ctx, &pctx, md, nullptr, key);
    if (rc != 1) {
        return false;
    }
    if (spec.pss) {
        if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
            EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) != 1) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string JwsMessage::algorithm() const {
    if (!header.isMember("alg") || !header["alg"].isString()) {
        return "";
    }
    return header["alg"].asString();
}

Json::Value JwsMessage::payloadJson() const {
    if (payload.empty()) {
        return Json::Value::null;
    }
    Json::Value out;
    if (!parseJsonObject(payload, out)) {
        throw JwsFormatException("JWS payload is not a JSON object");
    }
    return out;
}

JwsMessage parseFlattenedJws(const std::string& body) {
    Json::Value root;
    if (!parseJsonObject(body, root)) {
        throw JwsFormatException("Request body is not a JSON object");
    }
    if (root.isMember("signatures")) {
        throw JwsFormatException("Multiple signatures are not supported");
    }
    if (root.isMember("header")) {
        throw JwsFormatException("Unprotected JWS header is not allowed");
    }
    for (const char* member : {"protected", "payload", "signature"}) {
        if (!root.isMember(member) || !root[member].isString()) {
            throw JwsFormatException(std::string("JWS member '") + member + "' is missing");
        }
    }

    JwsMessage jws;
    jws.protectedB64 = root["protected"].asString();
    jws.payloadB64 = root["payload"].asString();

    auto protectedJson = base64UrlDecode(jws.protectedB64);
    if (!protectedJson || !parseJsonObject(*protectedJson, jws.header)) {
        throw JwsFormatException("JWS protected header is not valid");
    }

    auto payload = base64UrlDecode(jws.payloadB64);
    if (!payload) {
        throw JwsFormatException("JWS payload is not valid base64url");
    }
    jws.payload = *payload;

    auto signature = base64UrlDecode(root["signature"].asString());
    if (!signature || signature->empty()) {
        throw JwsFormatException("JWS signature is not valid base64url");
    }
    jws.signature = *signature;

    return jws;
}

bool isAllowedAlgorithm(const std::string& alg) {
    return findAlgorithm(alg) != nullptr;
}

bool verifyJwsSignature(const JwsMessage& jws, EVP_PKEY* key) {
    const AlgorithmSpec& spec = requireCompatible(jws.algorithm(), key);

    std::string signature = jws.signature;
    if (spec.keyType == EVP_PKEY_EC) {
        signature = rawEcdsaToDer(jws.signature, spec.ecCoordSize);
        if (signature.empty()) {
            return false;
        }
    }

    std::string signingInput = jws.protectedB64 + "." + jws.payloadB64;

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || !initDigestContext(ctx.get(), spec, key, false)) {
        return false;
    }

    int rc = EVP_DigestVerify(
        ctx.get(),
        reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
        reinterpret_cast<const unsigned char*>(signingInput.data()), signingInput.size());
    return rc == 1;
}

std::string signFlattenedJws(const Json::Value& header, const std::string& payload, EVP_PKEY* key) {
    const AlgorithmSpec& spec = requireCompatible(
        header.isMember("alg") ? header["alg"].asString() : "", key);

    std::string protectedB64 = base64UrlEncode(toCompactJson(header));
    std::string payloadB64 = payload.empty() ? "" : base64UrlEncode(payload);
    std::string signingInput = protectedB64 + "." + payloadB64;

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || !initDigestContext(ctx.get(), spec, key, true)) {
        throw std::runtime_error("Cannot initialize JWS signing context");
    }

    size_t sigLen = 0;
    const auto* tbs = reinterpret_cast<const unsigned char*>(signingInput.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, tbs, signingInput.size()) != 1) {
        throw std::runtime_error("JWS signing failed");
    }
    std::string signature(sigLen, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(&signature[0]), &sigLen,
                       tbs, signingInput.size()) != 1) {
        throw std::runtime_error("JWS signing failed");
    }
    signature.resize(sigLen);

    if (spec.keyType == EVP_PKEY_EC) {
        signature = derEcdsaToRaw(signature, spec.ecCoordSize);
    }

    Json::Value root(Json::objectValue);
    root["protected"] = protectedB64;
    root["payload"] = payloadB64;
    root["signature"] = base64UrlEncode(signature);
    return toCompactJson(root);
}

} // namespace acme::crypto
