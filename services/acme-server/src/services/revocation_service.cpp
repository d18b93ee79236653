/**
 * @file revocation_service.cpp
 * @brief RevocationService implementation
 */

#include "revocation_service.h"
#include "../common/exceptions.h"
#include <acme/crypto/base64url.h>
#include <acme/crypto/cert_ops.h>
#include <acme/crypto/crl_builder.h>
#include <acme/crypto/jwk.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using namespace domain::models;

RevocationService::RevocationService(
    repositories::ICertificateRepository* certificateRepository,
    const CertificateAuthority* ca,
    common::Clock clock)
    : certificateRepository_(certificateRepository)
    , ca_(ca)
    , clock_(std::move(clock))
{
    if (!certificateRepository_) {
        throw std::invalid_argument("RevocationService: certificateRepository cannot be nullptr");
    }
    if (!ca_) {
        throw std::invalid_argument("RevocationService: ca cannot be nullptr");
    }
}

Certificate RevocationService::revoke(const AuthenticatedRequest& request) {
    const Json::Value& payload = request.payload;
    if (!payload.isObject() || !payload["certificate"].isString()) {
        throw common::MalformedException("revoke-cert requires a certificate.");
    }

    int reason = 0;
    if (payload.isMember("reason")) {
        if (!payload["reason"].isInt()) {
            throw common::MalformedException("reason must be an integer.");
        }
        reason = payload["reason"].asInt();
    }
    if (!acme::crypto::isClientRevocationReason(reason)) {
        throw common::BadRevocationReasonException(reason);
    }

    auto der = acme::crypto::base64UrlDecode(payload["certificate"].asString());
    acme::crypto::UniqueCert submitted = der ? acme::crypto::certificateFromDer(*der) : nullptr;
    if (!submitted) {
        throw common::MalformedException("Unable to parse the certificate.");
    }

    const std::string serial = acme::crypto::serialHex(submitted.get());
    auto stored = certificateRepository_->findBySerial(serial);
    if (!stored || stored->issuerSerial != ca_->serial()) {
        throw common::UnauthorizedException("Certificate was not issued by this CA.",
            "unknown serial " + serial);
    }

    // A forged certificate reusing the serial must not pass the key check below
    auto storedCert = acme::crypto::certificateFromPem(stored->pem);
    if (!storedCert || acme::crypto::certificateToDer(storedCert.get()) != *der) {
        throw common::UnauthorizedException("Certificate was not issued by this CA.",
            "certificate bytes differ for serial " + serial);
    }

    if (request.account) {
        if (request.account->id != stored->accountId) {
            throw common::UnauthorizedException("Account did not issue this certificate.",
                "account " + request.account->id + " is not the owner of " + serial);
        }
    } else {
        auto key = acme::crypto::jwkToPublicKey(request.jwk);
        if (!acme::crypto::samePublicKey(storedCert.get(), key.get())) {
            throw common::UnauthorizedException("Request is not signed by the certificate key.");
        }
    }

    if (stored->revoked) {
        throw common::AlreadyRevokedException();
    }

    const std::time_t now = clock_();
    if (!certificateRepository_->revoke(serial, reason, now)) {
        throw common::AlreadyRevokedException();
    }

    spdlog::info("[RevocationService] Certificate {} revoked ({})",
        serial, acme::crypto::crlReasonToString(reason));

    stored->revoked = true;
    stored->revocationReason = reason;
    stored->revokedAt = now;
    return *stored;
}

} // namespace services
