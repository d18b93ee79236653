/**
 * @file acme_api_service.h
 * @brief ACME resource endpoints, independent of the HTTP framework
 *
 * Handlers translate framework requests into AcmeHttpRequest, call one
 * method per endpoint and copy the AcmeHttpResponse back. Every method
 * returns a response; failures are rendered as problem documents.
 */

#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>
#include "account_service.h"
#include "challenge_service.h"
#include "issuance_service.h"
#include "nonce_service.h"
#include "ocsp_responder_service.h"
#include "order_service.h"
#include "request_authenticator.h"
#include "revocation_service.h"
#include "../common/acme_urls.h"
#include "../common/error_codes.h"
#include "../middleware/rate_limiter.h"

namespace services {

struct AcmeHttpRequest {
    std::string method;         // "GET", "HEAD", "POST"
    std::string contentType;
    std::string body;
    std::string clientIp;
};

struct AcmeHttpResponse {
    int status = 200;
    std::string contentType;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    void addHeader(const std::string& name, const std::string& value) {
        headers.emplace_back(name, value);
    }

    /// @brief First value of a header, empty when absent
    std::string header(const std::string& name) const;

    static AcmeHttpResponse json(int status, const Json::Value& body);
    static AcmeHttpResponse problem(const common::AcmeProblem& problem);
};

struct DirectoryMeta {
    std::string website;
    std::string termsOfService;
    std::vector<std::string> caaIdentities;
};

struct ApiSettings {
    bool enabled = true;
    DirectoryMeta meta;
    middleware::RateLimits newAccountLimits;   // Per client IP
    middleware::RateLimits newOrderLimits;     // Per account
};

/**
 * @brief Non-owning service references used by the API
 */
struct ApiDependencies {
    NonceService* nonceService = nullptr;
    RequestAuthenticator* authenticator = nullptr;
    AccountService* accountService = nullptr;
    OrderService* orderService = nullptr;
    ChallengeService* challengeService = nullptr;
    IssuanceService* issuanceService = nullptr;
    RevocationService* revocationService = nullptr;
    OcspResponderService* ocspResponder = nullptr;
    repositories::ICrlRepository* crlRepository = nullptr;
    const CertificateAuthority* ca = nullptr;
    middleware::RateLimiter* rateLimiter = nullptr;   // Optional
};

/**
 * @brief ACME API Service
 */
class AcmeApiService {
public:
    static constexpr const char* kJsonContentType = "application/json";
    static constexpr const char* kPemChainContentType = "application/pem-certificate-chain";
    static constexpr const char* kCrlContentType = "application/pkix-crl";
    static constexpr const char* kOcspResponseContentType = "application/ocsp-response";

    /**
     * @throws std::invalid_argument if a required dependency is nullptr
     */
    AcmeApiService(ApiDependencies deps, common::AcmeUrls urls, ApiSettings settings);

    AcmeApiService(const AcmeApiService&) = delete;
    AcmeApiService& operator=(const AcmeApiService&) = delete;

    AcmeHttpResponse directory();
    AcmeHttpResponse newNonce(const AcmeHttpRequest& request);
    AcmeHttpResponse newAccount(const AcmeHttpRequest& request);
    AcmeHttpResponse account(const AcmeHttpRequest& request, const std::string& accountId);
    AcmeHttpResponse accountOrders(const AcmeHttpRequest& request, const std::string& accountId);
    AcmeHttpResponse keyChange(const AcmeHttpRequest& request);
    AcmeHttpResponse newOrder(const AcmeHttpRequest& request);
    AcmeHttpResponse order(const AcmeHttpRequest& request, const std::string& orderId);
    AcmeHttpResponse finalize(const AcmeHttpRequest& request, const std::string& orderId);
    AcmeHttpResponse authorization(const AcmeHttpRequest& request, const std::string& authorizationId);
    AcmeHttpResponse challenge(const AcmeHttpRequest& request, const std::string& challengeId);

    /// @brief GET, or the RFC 8555 POST-as-GET form
    AcmeHttpResponse certificate(const AcmeHttpRequest& request, const std::string& serial);

    AcmeHttpResponse revokeCert(const AcmeHttpRequest& request);
    AcmeHttpResponse crl();
    AcmeHttpResponse ocsp(const AcmeHttpRequest& request);

    /// @name Resource rendering
    /// @{
    Json::Value renderAccount(const domain::models::Account& account) const;
    Json::Value renderOrder(const OrderView& view) const;
    Json::Value renderAuthorization(const AuthorizationView& view) const;
    Json::Value renderChallenge(const domain::models::Challenge& challenge) const;
    /// @}

    const common::AcmeUrls& urls() const { return urls_; }

private:
    ApiDependencies deps_;
    common::AcmeUrls urls_;
    ApiSettings settings_;
    std::string directoryRandomKey_;

    /**
     * @brief Run an endpoint, mapping exceptions to problems
     * @param acmeHeaders ACME resource: requires ACME to be enabled, adds
     *        Replay-Nonce and the index Link
     */
    AcmeHttpResponse guarded(const std::function<AcmeHttpResponse()>& handler, bool acmeHeaders = true);

    void enforceRateLimit(const std::string& key, const middleware::RateLimits& limits);
};

} // namespace services
