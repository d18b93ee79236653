/**
 * @file request_authenticator.cpp
 * @brief RequestAuthenticator implementation
 */

#include "request_authenticator.h"
#include "../common/exceptions.h"
#include <acme/crypto/jwk.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace services {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

acme::crypto::JwsMessage parseOrThrow(const std::string& body) {
    try {
        return acme::crypto::parseFlattenedJws(body);
    } catch (const acme::crypto::JwsFormatException& e) {
        throw common::MalformedException(e.what());
    }
}

void requireAllowedAlgorithm(const acme::crypto::JwsMessage& jws) {
    std::string alg = jws.algorithm();
    if (!acme::crypto::isAllowedAlgorithm(alg)) {
        throw common::BadSignatureAlgorithmException(
            "Algorithm " + (alg.empty() ? std::string("(none)") : alg) + " is not allowed");
    }
}

acme::crypto::UniqueKey keyFromJwk(const Json::Value& jwk) {
    try {
        return acme::crypto::jwkToPublicKey(jwk);
    } catch (const acme::crypto::JwkException& e) {
        throw common::MalformedException(std::string("Invalid JWK: ") + e.what());
    }
}

void verifySignature(const acme::crypto::JwsMessage& jws, EVP_PKEY* key) {
    bool valid = false;
    try {
        valid = acme::crypto::verifyJwsSignature(jws, key);
    } catch (const acme::crypto::JwsAlgorithmException& e) {
        throw common::BadSignatureAlgorithmException(e.what());
    }
    if (!valid) {
        throw common::MalformedException("JWS signature invalid.");
    }
}

Json::Value payloadOrThrow(const acme::crypto::JwsMessage& jws) {
    try {
        return jws.payloadJson();
    } catch (const acme::crypto::JwsFormatException& e) {
        throw common::MalformedException(e.what());
    }
}

} // anonymous namespace

RequestAuthenticator::RequestAuthenticator(
    NonceService* nonceService,
    repositories::IAccountRepository* accountRepository,
    std::string accountUrlPrefix)
    : nonceService_(nonceService)
    , accountRepository_(accountRepository)
    , accountUrlPrefix_(std::move(accountUrlPrefix))
{
    if (!nonceService_) {
        throw std::invalid_argument("RequestAuthenticator: nonceService cannot be nullptr");
    }
    if (!accountRepository_) {
        throw std::invalid_argument("RequestAuthenticator: accountRepository cannot be nullptr");
    }
}

bool RequestAuthenticator::isJoseContentType(const std::string& contentType) {
    std::string mediaType = contentType.substr(0, contentType.find(';'));
    mediaType.erase(std::remove_if(mediaType.begin(), mediaType.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; }),
                    mediaType.end());
    return toLower(mediaType) == "application/jose+json";
}

AuthenticatedRequest RequestAuthenticator::authenticate(
    const std::string& contentType,
    const std::string& body,
    const std::string& requestUrl,
    KeyMode mode)
{
    if (!isJoseContentType(contentType)) {
        throw common::UnsupportedMediaTypeException(contentType);
    }

    AuthenticatedRequest request;
    request.jws = parseOrThrow(body);
    const auto& header = request.jws.header;

    requireAllowedAlgorithm(request.jws);

    bool hasJwk = request.jws.hasJwk();
    bool hasKid = request.jws.hasKid();
    if (hasJwk && hasKid) {
        throw common::MalformedException("jwk and kid header fields are mutually exclusive.");
    }
    if (!hasJwk && !hasKid) {
        throw common::MalformedException("Request requires a JWK key ID or an embedded JWK.");
    }
    if (mode == KeyMode::KID && hasJwk) {
        throw common::MalformedException("Request requires a JWK key ID.");
    }
    if (mode == KeyMode::JWK && hasKid) {
        throw common::MalformedException("Request requires a full JWK key.");
    }

    if (hasKid) {
        if (!header["kid"].isString()) {
            throw common::MalformedException("kid must be a string.");
        }
        request.account = resolveAccount(header["kid"].asString());
        request.jwk = request.account->jwk;
        request.thumbprint = request.account->thumbprint;
    } else {
        if (!header["jwk"].isObject()) {
            throw common::MalformedException("jwk must be a JSON object.");
        }
        request.jwk = header["jwk"];
    }

    auto key = keyFromJwk(request.jwk);
    verifySignature(request.jws, key.get());

    if (!hasKid) {
        request.thumbprint = acme::crypto::jwkThumbprint(request.jwk);
    }

    if (!header["nonce"].isString() || !nonceService_->consume(header["nonce"].asString())) {
        throw common::BadNonceException();
    }

    if (!header["url"].isString() || header["url"].asString() != requestUrl) {
        throw common::UnauthorizedException("URL does not match.",
            "expected " + requestUrl);
    }

    request.payload = payloadOrThrow(request.jws);
    return request;
}

KeyChangeRequest RequestAuthenticator::verifyKeyChange(
    const Json::Value& outerPayload,
    const std::string& requestUrl)
{
    if (!outerPayload.isObject()) {
        throw common::MalformedException("Key change requires a JWS payload.");
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    auto inner = parseOrThrow(Json::writeString(writer, outerPayload));

    requireAllowedAlgorithm(inner);
    if (!inner.hasJwk() || inner.hasKid() || !inner.header["jwk"].isObject()) {
        throw common::MalformedException("Inner JWS must contain the new key as jwk.");
    }
    if (!inner.header["url"].isString() || inner.header["url"].asString() != requestUrl) {
        throw common::MalformedException("Inner JWS url does not match the outer url.");
    }

    KeyChangeRequest result;
    result.newJwk = inner.header["jwk"];

    auto key = keyFromJwk(result.newJwk);
    verifySignature(inner, key.get());

    result.newThumbprint = acme::crypto::jwkThumbprint(result.newJwk);
    result.payload = payloadOrThrow(inner);
    if (!result.payload.isObject()) {
        throw common::MalformedException("Inner JWS requires a payload.");
    }
    return result;
}

domain::models::Account RequestAuthenticator::resolveAccount(const std::string& kid) {
    if (kid.compare(0, accountUrlPrefix_.size(), accountUrlPrefix_) != 0) {
        throw common::AccountDoesNotExistException("Account does not exist.");
    }

    std::string accountId = kid.substr(accountUrlPrefix_.size());
    auto account = accountRepository_->findById(accountId);
    if (!account) {
        throw common::AccountDoesNotExistException("Account does not exist.");
    }
    if (!account->isValid()) {
        throw common::UnauthorizedException("Account is not valid.",
            "account " + accountId + " is " + domain::models::accountStatusToString(account->status));
    }
    return *account;
}

} // namespace services
