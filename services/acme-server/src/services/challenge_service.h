/**
 * @file challenge_service.h
 * @brief Challenge triggering and asynchronous validation (RFC 8555 Section 8)
 */

#pragma once

#include <string>
#include <json/json.h>
#include "challenge_probe.h"
#include "order_service.h"
#include "../common/clock.h"
#include "../common/error_codes.h"
#include "../common/task_executor.h"
#include "../repositories/repository_interfaces.h"

namespace services {

struct ValidationPolicy {
    int maxAttempts = 3;
    int retryBaseMs = 1000;     // Backoff doubles per attempt: 1 s, 2 s
    int probeTimeoutSeconds = 5;
};

/**
 * @brief Outcome of a single probe
 */
struct ProbeOutcome {
    bool valid = false;
    bool retryable = false;     // Network failures are retried, wrong content is not
    common::ErrorCode error = common::ErrorCode::SUCCESS;
    std::string detail;
};

/**
 * @brief Challenge Service
 *
 * POST to a pending challenge moves it to processing and queues the probe;
 * the response returns immediately. The background task retries network
 * failures with exponential backoff, then writes the result through
 * conditional updates:
 *
 *   valid:   challenge -> valid, authorization -> valid, order -> ready (if all valid)
 *   invalid: challenge -> invalid, authorization -> invalid, order -> invalid
 */
class ChallengeService {
public:
    /**
     * @param publisher Optional http-01 response host (may be nullptr)
     * @throws std::invalid_argument if a required dependency is nullptr
     */
    ChallengeService(
        repositories::IAccountRepository* accountRepository,
        repositories::IAuthorizationRepository* authorizationRepository,
        repositories::IChallengeRepository* challengeRepository,
        OrderService* orderService,
        common::ITaskExecutor* executor,
        IHttpFetcher* httpFetcher,
        IDnsTxtResolver* dnsResolver,
        IChallengeResponsePublisher* publisher,
        ValidationPolicy policy,
        common::Clock clock = common::systemClock());

    /**
     * @brief Load a challenge owned by account
     * @throws common::UnauthorizedException unknown or foreign challenge
     */
    domain::models::Challenge getChallenge(const domain::models::Account& account, const std::string& challengeId);

    /**
     * @brief Client response to a challenge
     *
     * Starting a challenge that is not pending, or whose authorization is
     * not pending, returns it unchanged.
     */
    domain::models::Challenge respond(const domain::models::Account& account, const std::string& challengeId);

    /**
     * @brief Run validation of a processing challenge to completion
     *
     * This is the background task body; it is public so it can be driven
     * synchronously.
     */
    void validate(const std::string& challengeId, const std::string& accountId);

    /**
     * @brief Probe once
     */
    ProbeOutcome probe(
        const domain::models::Challenge& challenge,
        const std::string& identifier,
        const std::string& keyAuthorization);

    /// @brief Authorization that owns a challenge
    std::string authorizationIdOf(const std::string& challengeId);

private:
    repositories::IAccountRepository* accountRepository_;
    repositories::IAuthorizationRepository* authorizationRepository_;
    repositories::IChallengeRepository* challengeRepository_;
    OrderService* orderService_;
    common::ITaskExecutor* executor_;
    IHttpFetcher* httpFetcher_;
    IDnsTxtResolver* dnsResolver_;
    IChallengeResponsePublisher* publisher_;
    ValidationPolicy policy_;
    common::Clock clock_;

    void fail(const domain::models::Challenge& challenge,
              const domain::models::Authorization& authz,
              const Json::Value& error);
};

} // namespace services
