#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for ACME server dependency management
 *
 * Owns the storage backend, repositories, CA material, worker pool and
 * services. Provides non-owning pointer accessors for handler construction.
 */

#include <memory>

namespace infrastructure {
struct AppConfig;
class JobScheduler;
}

// Forward declarations - Infrastructure
namespace common {
    class DbConnectionPool;
    class IQueryExecutor;
    class WorkerPool;
}

namespace middleware {
    class RateLimiter;
}

// Forward declarations - Services
namespace services {
    class CertificateAuthority;
    class NonceService;
    class AccountService;
    class OrderService;
    class ChallengeService;
    class IssuanceService;
    class RevocationService;
    class HousekeepingService;
    class OcspResponderService;
    class AcmeApiService;
}

namespace infrastructure {

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    /// @brief "postgres" or "memory"
    const char* storageBackend() const;

    /**
     * @brief Round trip to the datastore
     * @return false if the database cannot be reached (always true for memory)
     */
    bool checkDatabase() const;

    // --- Infrastructure Accessors ---
    common::DbConnectionPool* dbPool() const;
    common::IQueryExecutor* queryExecutor() const;
    middleware::RateLimiter* rateLimiter() const;
    JobScheduler* jobScheduler() const;

    // --- Service Accessors ---
    services::CertificateAuthority* certificateAuthority() const;
    services::NonceService* nonceService() const;
    services::HousekeepingService* housekeepingService() const;
    services::AcmeApiService* acmeApiService() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
