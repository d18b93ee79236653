#pragma once

/**
 * @file health_handler.h
 * @brief Liveness, datastore and revocation-freshness endpoints
 */

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>

namespace handlers {

/**
 * @brief Probes the handler reports on
 */
struct HealthProbes {
    std::string storageBackend;                    // "postgres" or "memory"
    std::function<bool()> pingDatabase;
    std::function<Json::Value()> revocation;       // HousekeepingService::revocationHealth
    std::function<std::string()> timestamp;
};

/**
 * @brief Health endpoints for the proxy and the orchestrator
 *
 * - GET /api/health             always 200 while the process serves requests
 * - GET /api/health/database    503 when the datastore does not answer
 * - GET /api/health/revocation  503 when the CRL is stale or no OCSP key is valid
 */
class HealthHandler {
public:
    /**
     * @throws std::invalid_argument if a probe is missing
     */
    explicit HealthHandler(HealthProbes probes);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    HealthProbes probes_;

    Json::Value databaseStatus() const;
    static drogon::HttpResponsePtr respond(const Json::Value& body, bool healthy);
};

} // namespace handlers
