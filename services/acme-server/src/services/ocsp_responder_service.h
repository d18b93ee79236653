/**
 * @file ocsp_responder_service.h
 * @brief OCSP responder over the certificate table (RFC 6960)
 */

#pragma once

#include <string>
#include "certificate_authority.h"
#include "../common/clock.h"
#include "../repositories/repository_interfaces.h"

namespace services {

/**
 * @brief Answers OCSP requests with the current delegated responder key
 *
 * Without a current key (generate-ocsp-keys has not run) every answer is
 * tryLater.
 */
class OcspResponderService {
public:
    OcspResponderService(
        repositories::ICertificateRepository* certificateRepository,
        repositories::IOcspKeyRepository* ocspKeyRepository,
        const CertificateAuthority* ca,
        long responseValiditySeconds = 3600,
        common::Clock clock = common::systemClock());

    /**
     * @param requestDer DER OCSPRequest
     * @return DER OCSPResponse
     */
    std::string respond(const std::string& requestDer);

private:
    repositories::ICertificateRepository* certificateRepository_;
    repositories::IOcspKeyRepository* ocspKeyRepository_;
    const CertificateAuthority* ca_;
    long responseValiditySeconds_;
    common::Clock clock_;
};

} // namespace services
