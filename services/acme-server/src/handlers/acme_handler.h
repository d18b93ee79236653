#pragma once

#include <drogon/HttpAppFramework.h>
#include <functional>
#include <string>

namespace services {
    class AcmeApiService;
    struct AcmeHttpRequest;
    struct AcmeHttpResponse;
}

namespace handlers {

/**
 * @brief ACME protocol endpoints handler
 *
 * Routes, relative to the path of ACME_BASE_URL:
 * - GET /directory
 * - HEAD, GET /new-nonce
 * - POST /new-account, /acct/{id}, /acct/{id}/orders, /key-change
 * - POST /new-order, /order/{id}, /order/{id}/finalize
 * - POST /authz/{id}, /challenge/{id}
 * - GET, POST /cert/{serial}
 * - POST /revoke-cert
 * - GET /crl, POST /ocsp
 *
 * All protocol logic lives in AcmeApiService; this class only converts
 * between Drogon and framework-neutral requests.
 */
class AcmeHandler {
public:
    /**
     * @param api ACME API (non-owning pointer)
     * @throws std::invalid_argument if api is nullptr
     */
    explicit AcmeHandler(services::AcmeApiService* api);

    /**
     * @brief Register ACME routes under the base URL path
     */
    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief Client address, honoring the first X-Forwarded-For hop set by the proxy
     */
    static std::string clientIp(const drogon::HttpRequestPtr& req);

private:
    services::AcmeApiService* api_;

    static services::AcmeHttpRequest toAcmeRequest(const drogon::HttpRequestPtr& req);
    static drogon::HttpResponsePtr toDrogonResponse(const services::AcmeHttpResponse& response);
};

} // namespace handlers
