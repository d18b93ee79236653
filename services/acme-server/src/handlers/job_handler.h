#pragma once

#include <drogon/HttpAppFramework.h>
#include <functional>

namespace services {
    class HousekeepingService;
}

namespace handlers {

/**
 * @brief Housekeeping job trigger endpoints
 *
 * - GET /jobs - Names of the available jobs
 * - POST /jobs/{name} - Run cache-crls, generate-ocsp-keys or acme-cleanup now
 *
 * Jobs run synchronously; the response carries the JobResult. These routes
 * are meant for the external scheduler and must not be exposed by the proxy.
 */
class JobHandler {
public:
    /**
     * @param housekeeping Job implementations (non-owning pointer)
     * @throws std::invalid_argument if housekeeping is nullptr
     */
    explicit JobHandler(services::HousekeepingService* housekeeping);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::HousekeepingService* housekeeping_;

    void handleList(std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleRun(
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& name);
};

} // namespace handlers
