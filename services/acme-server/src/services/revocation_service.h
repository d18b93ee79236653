/**
 * @file revocation_service.h
 * @brief Certificate revocation (RFC 8555 Section 7.6)
 */

#pragma once

#include "certificate_authority.h"
#include "request_authenticator.h"
#include "../common/clock.h"
#include "../repositories/repository_interfaces.h"

namespace services {

/**
 * @brief Revocation Service
 *
 * A revoke-cert request is authorized either by the account that ordered
 * the certificate (kid) or by the certificate's own key (jwk). Revocation
 * is a write-once conditional update.
 */
class RevocationService {
public:
    /**
     * @throws std::invalid_argument if a dependency is nullptr
     */
    RevocationService(
        repositories::ICertificateRepository* certificateRepository,
        const CertificateAuthority* ca,
        common::Clock clock = common::systemClock());

    /**
     * @brief Revoke the certificate named in the payload
     *
     * @throws common::MalformedException missing or unparsable certificate
     * @throws common::BadRevocationReasonException reason not allowed
     * @throws common::UnauthorizedException unknown certificate or wrong signer
     * @throws common::AlreadyRevokedException certificate already revoked
     */
    domain::models::Certificate revoke(const AuthenticatedRequest& request);

private:
    repositories::ICertificateRepository* certificateRepository_;
    const CertificateAuthority* ca_;
    common::Clock clock_;
};

} // namespace services
