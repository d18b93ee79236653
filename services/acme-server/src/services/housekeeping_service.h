/**
 * @file housekeeping_service.h
 * @brief Revocation material and cleanup jobs
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>
#include "certificate_authority.h"
#include "nonce_service.h"
#include "../common/clock.h"
#include "../middleware/rate_limiter.h"
#include "../repositories/repository_interfaces.h"

namespace services {

struct HousekeepingPolicy {
    bool acmeEnabled = true;
    long crlValiditySeconds = 24 * 3600;
    long crlRefreshMarginSeconds = 3600;
    long ocspKeyValiditySeconds = 3 * 86400;
    long ocspKeyOverlapSeconds = 86400;
};

/**
 * @brief Result of one job run, returned by POST /jobs/{name}
 */
struct JobResult {
    std::string job;
    bool changed = false;
    Json::Value details{Json::objectValue};

    Json::Value toJson() const;
};

/**
 * @brief Housekeeping Service
 *
 * The three jobs are functions of (clock, datastore). Each write is
 * conditional, so overlapping runs of the same job are harmless:
 *
 *   cache-crls          CRL of revoked, unexpired certificates
 *   generate-ocsp-keys  responder key rotation
 *   acme-cleanup        expired orders and nonces
 */
class HousekeepingService {
public:
    static constexpr const char* kCacheCrls = "cache-crls";
    static constexpr const char* kGenerateOcspKeys = "generate-ocsp-keys";
    static constexpr const char* kAcmeCleanup = "acme-cleanup";

    /**
     * @param rateLimiter Optional, idle keys are dropped by acme-cleanup
     * @throws std::invalid_argument if a required dependency is nullptr
     */
    HousekeepingService(
        repositories::ICertificateRepository* certificateRepository,
        repositories::ICrlRepository* crlRepository,
        repositories::IOcspKeyRepository* ocspKeyRepository,
        repositories::IOrderRepository* orderRepository,
        NonceService* nonceService,
        middleware::RateLimiter* rateLimiter,
        const CertificateAuthority* ca,
        HousekeepingPolicy policy,
        common::Clock clock = common::systemClock());

    JobResult cacheCrls();
    JobResult generateOcspKeys();
    JobResult acmeCleanup();

    /**
     * @brief Run a job by name
     * @throws common::NotFoundException unknown job
     */
    JobResult runJob(const std::string& name);

    static const std::vector<std::string>& jobNames();

    /**
     * @brief Freshness of the published revocation material
     *
     * "DEGRADED" when no CRL exists, the latest CRL is past nextUpdate, or
     * no responder key is currently valid. Read only.
     */
    Json::Value revocationHealth() const;

private:
    repositories::ICertificateRepository* certificateRepository_;
    repositories::ICrlRepository* crlRepository_;
    repositories::IOcspKeyRepository* ocspKeyRepository_;
    repositories::IOrderRepository* orderRepository_;
    NonceService* nonceService_;
    middleware::RateLimiter* rateLimiter_;
    const CertificateAuthority* ca_;
    HousekeepingPolicy policy_;
    common::Clock clock_;
};

} // namespace services
