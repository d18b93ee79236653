/**
 * @file ocsp_responder_service.cpp
 * @brief OcspResponderService implementation
 */

#include "ocsp_responder_service.h"
#include <acme/crypto/cert_ops.h>
#include <acme/crypto/ocsp.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

OcspResponderService::OcspResponderService(
    repositories::ICertificateRepository* certificateRepository,
    repositories::IOcspKeyRepository* ocspKeyRepository,
    const CertificateAuthority* ca,
    long responseValiditySeconds,
    common::Clock clock)
    : certificateRepository_(certificateRepository)
    , ocspKeyRepository_(ocspKeyRepository)
    , ca_(ca)
    , responseValiditySeconds_(responseValiditySeconds)
    , clock_(std::move(clock))
{
    if (!certificateRepository_ || !ocspKeyRepository_ || !ca_) {
        throw std::invalid_argument("OcspResponderService: dependencies cannot be nullptr");
    }
}

std::string OcspResponderService::respond(const std::string& requestDer) {
    const std::time_t now = clock_();

    acme::crypto::UniqueCert responderCert;
    acme::crypto::UniqueKey responderKey;
    auto current = ocspKeyRepository_->findCurrent(ca_->serial(), now);
    if (current) {
        responderCert = acme::crypto::certificateFromPem(current->certPem);
        responderKey = acme::crypto::privateKeyFromPem(current->keyPem);
        if (!responderCert || !responderKey) {
            spdlog::error("[OcspResponderService] Stored responder key generation {} is unreadable",
                current->generation);
            responderCert.reset();
        }
    } else {
        spdlog::warn("[OcspResponderService] No current responder key, answering tryLater");
    }

    acme::crypto::OcspSigner signer;
    signer.caCert = ca_->cert();
    signer.responderCert = responderCert.get();
    signer.responderKey = responderKey.get();

    auto lookup = [this](const std::string& serial) {
        acme::crypto::OcspCertStatus status;
        auto cert = certificateRepository_->findBySerial(serial);
        if (!cert) {
            return status;
        }
        if (cert->revoked) {
            status.status = acme::crypto::OcspCertStatus::Status::REVOKED;
            status.revokedAt = cert->revokedAt.value_or(0);
            status.reason = cert->revocationReason.value_or(0);
        } else {
            status.status = acme::crypto::OcspCertStatus::Status::GOOD;
        }
        return status;
    };

    return acme::crypto::buildOcspResponse(requestDer, signer, lookup, now, responseValiditySeconds_);
}

} // namespace services
