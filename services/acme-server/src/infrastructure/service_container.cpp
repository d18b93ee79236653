/**
 * @file service_container.cpp
 * @brief ACME server ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"
#include "job_scheduler.h"
#include "file_challenge_publisher.h"
#include "dns/cares_txt_resolver.h"
#include "http/drogon_http_fetcher.h"

#include <spdlog/spdlog.h>

// Infrastructure
#include "db_connection_pool.h"
#include "postgresql_query_executor.h"
#include "../common/acme_urls.h"
#include "../common/task_executor.h"
#include "../middleware/rate_limiter.h"

// Repositories
#include "../repositories/account_repository.h"
#include "../repositories/authorization_repository.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/nonce_repository.h"
#include "../repositories/order_repository.h"
#include "../repositories/revocation_repository.h"
#include "../repositories/memory/memory_repositories.h"

// Services
#include "../services/acme_api_service.h"
#include "../services/housekeeping_service.h"

namespace infrastructure {

struct ServiceContainer::Impl {
    bool memoryBackend = false;

    // Storage
    std::unique_ptr<common::DbConnectionPool> dbPool;
    std::unique_ptr<common::IQueryExecutor> queryExecutor;
    std::shared_ptr<repositories::MemoryState> memoryState;

    // Repositories
    std::unique_ptr<repositories::INonceRepository> nonceRepo;
    std::unique_ptr<repositories::IAccountRepository> accountRepo;
    std::unique_ptr<repositories::IOrderRepository> orderRepo;
    std::unique_ptr<repositories::IAuthorizationRepository> authorizationRepo;
    std::unique_ptr<repositories::IChallengeRepository> challengeRepo;
    std::unique_ptr<repositories::ICertificateRepository> certificateRepo;
    std::unique_ptr<repositories::ICrlRepository> crlRepo;
    std::unique_ptr<repositories::IOcspKeyRepository> ocspKeyRepo;

    // Infrastructure
    std::unique_ptr<services::CertificateAuthority> ca;
    std::unique_ptr<common::WorkerPool> workerPool;
    std::unique_ptr<middleware::RateLimiter> rateLimiter;
    std::unique_ptr<http::DrogonHttpFetcher> httpFetcher;
    std::unique_ptr<dns::CaresTxtResolver> dnsResolver;
    std::unique_ptr<FileChallengePublisher> publisher;
    std::unique_ptr<JobScheduler> jobScheduler;

    // Services
    std::unique_ptr<services::NonceService> nonceService;
    std::unique_ptr<services::RequestAuthenticator> authenticator;
    std::unique_ptr<services::AccountService> accountService;
    std::unique_ptr<services::OrderService> orderService;
    std::unique_ptr<services::ChallengeService> challengeService;
    std::unique_ptr<services::IssuanceService> issuanceService;
    std::unique_ptr<services::RevocationService> revocationService;
    std::unique_ptr<services::OcspResponderService> ocspResponder;
    std::unique_ptr<services::HousekeepingService> housekeepingService;
    std::unique_ptr<services::AcmeApiService> acmeApiService;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

namespace {

middleware::RateLimits limits(int perMinute, int perHour, int perDay) {
    middleware::RateLimits l;
    l.perMinute = perMinute;
    l.perHour = perHour;
    l.perDay = perDay;
    return l;
}

} // anonymous namespace

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing ACME server dependencies...");

    try {
        // Step 1: Storage backend and repositories
        impl_->memoryBackend = config.usesMemoryStorage();
        if (impl_->memoryBackend) {
            spdlog::warn("Using in-memory storage; state is lost on restart");
            auto state = std::make_shared<repositories::MemoryState>();
            impl_->memoryState = state;
            impl_->nonceRepo = std::make_unique<repositories::MemoryNonceRepository>(state);
            impl_->accountRepo = std::make_unique<repositories::MemoryAccountRepository>(state);
            impl_->orderRepo = std::make_unique<repositories::MemoryOrderRepository>(state);
            impl_->authorizationRepo = std::make_unique<repositories::MemoryAuthorizationRepository>(state);
            impl_->challengeRepo = std::make_unique<repositories::MemoryChallengeRepository>(state);
            impl_->certificateRepo = std::make_unique<repositories::MemoryCertificateRepository>(state);
            impl_->crlRepo = std::make_unique<repositories::MemoryCrlRepository>(state);
            impl_->ocspKeyRepo = std::make_unique<repositories::MemoryOcspKeyRepository>(state);
        } else {
            common::DbPoolConfig poolConfig;
            poolConfig.host = config.dbHost;
            poolConfig.port = config.dbPort;
            poolConfig.dbName = config.dbName;
            poolConfig.user = config.dbUser;
            poolConfig.password = config.dbPassword;
            poolConfig.minSize = static_cast<size_t>(config.dbPoolMin);
            poolConfig.maxSize = static_cast<size_t>(config.dbPoolMax);
            poolConfig.acquireTimeoutSec = config.dbPoolTimeout;
            poolConfig.statementTimeoutMs = config.dbStatementTimeoutMs;
            impl_->dbPool = std::make_unique<common::DbConnectionPool>(std::move(poolConfig));
            if (!impl_->dbPool->initialize()) {
                spdlog::critical("Failed to initialize database connection pool");
                return false;
            }
            spdlog::info("Database connection pool initialized ({}:{}/{})",
                config.dbHost, config.dbPort, config.dbName);

            impl_->queryExecutor = std::make_unique<common::PostgreSQLQueryExecutor>(impl_->dbPool.get());
            auto* executor = impl_->queryExecutor.get();
            impl_->nonceRepo = std::make_unique<repositories::NonceRepository>(executor);
            impl_->accountRepo = std::make_unique<repositories::AccountRepository>(executor);
            impl_->orderRepo = std::make_unique<repositories::OrderRepository>(executor);
            impl_->authorizationRepo = std::make_unique<repositories::AuthorizationRepository>(executor);
            impl_->challengeRepo = std::make_unique<repositories::ChallengeRepository>(executor);
            impl_->certificateRepo = std::make_unique<repositories::CertificateRepository>(executor);
            impl_->crlRepo = std::make_unique<repositories::CrlRepository>(executor);
            impl_->ocspKeyRepo = std::make_unique<repositories::OcspKeyRepository>(executor);
        }

        // Step 2: CA material
        impl_->ca = std::make_unique<services::CertificateAuthority>(
            services::CertificateAuthority::fromFiles(config.caKeyPath, config.caCertPath, config.caChainPath));

        // Step 3: Workers and network probes
        impl_->workerPool = std::make_unique<common::WorkerPool>(
            static_cast<size_t>(config.validationWorkers), static_cast<size_t>(config.validationQueueSize));
        impl_->rateLimiter = std::make_unique<middleware::RateLimiter>();
        impl_->httpFetcher = std::make_unique<http::DrogonHttpFetcher>();
        impl_->dnsResolver = std::make_unique<dns::CaresTxtResolver>(config.dnsServers);
        if (!config.challengePublishDir.empty()) {
            impl_->publisher = std::make_unique<FileChallengePublisher>(config.challengePublishDir);
        }

        // Step 4: Services
        common::AcmeUrls urls(config.acmeBaseUrl);

        impl_->nonceService = std::make_unique<services::NonceService>(
            impl_->nonceRepo.get(), config.acmeNonceLifetime);

        impl_->authenticator = std::make_unique<services::RequestAuthenticator>(
            impl_->nonceService.get(), impl_->accountRepo.get(), urls.accountPrefix());

        impl_->accountService = std::make_unique<services::AccountService>(
            impl_->accountRepo.get(), config.acmeRequireContact);

        services::OrderPolicy orderPolicy;
        orderPolicy.orderValiditySeconds = config.acmeOrderValidity;
        orderPolicy.maxCertValiditySeconds = config.acmeMaxCertValidity;
        impl_->orderService = std::make_unique<services::OrderService>(
            impl_->orderRepo.get(), impl_->authorizationRepo.get(), impl_->challengeRepo.get(), orderPolicy);

        services::ValidationPolicy validationPolicy;
        validationPolicy.maxAttempts = config.challengeMaxAttempts;
        validationPolicy.retryBaseMs = config.challengeRetryBaseMs;
        validationPolicy.probeTimeoutSeconds = config.challengeTimeoutSec;
        impl_->challengeService = std::make_unique<services::ChallengeService>(
            impl_->accountRepo.get(),
            impl_->authorizationRepo.get(),
            impl_->challengeRepo.get(),
            impl_->orderService.get(),
            impl_->workerPool.get(),
            impl_->httpFetcher.get(),
            impl_->dnsResolver.get(),
            impl_->publisher.get(),
            validationPolicy);

        services::IssuancePolicy issuancePolicy;
        issuancePolicy.defaultCertValiditySeconds = config.acmeDefaultCertValidity;
        issuancePolicy.ocspResponderUrl = config.ocspResponderUrl;
        impl_->issuanceService = std::make_unique<services::IssuanceService>(
            impl_->orderRepo.get(),
            impl_->certificateRepo.get(),
            impl_->orderService.get(),
            impl_->ca.get(),
            impl_->workerPool.get(),
            issuancePolicy);

        impl_->revocationService = std::make_unique<services::RevocationService>(
            impl_->certificateRepo.get(), impl_->ca.get());

        impl_->ocspResponder = std::make_unique<services::OcspResponderService>(
            impl_->certificateRepo.get(), impl_->ocspKeyRepo.get(), impl_->ca.get());

        services::HousekeepingPolicy housekeepingPolicy;
        housekeepingPolicy.acmeEnabled = config.acmeEnabled;
        housekeepingPolicy.crlValiditySeconds = config.crlValidityHours * 3600;
        housekeepingPolicy.crlRefreshMarginSeconds = config.crlRefreshMarginHours * 3600;
        housekeepingPolicy.ocspKeyValiditySeconds = config.ocspKeyValidityHours * 3600;
        housekeepingPolicy.ocspKeyOverlapSeconds = config.ocspKeyOverlapHours * 3600;
        impl_->housekeepingService = std::make_unique<services::HousekeepingService>(
            impl_->certificateRepo.get(),
            impl_->crlRepo.get(),
            impl_->ocspKeyRepo.get(),
            impl_->orderRepo.get(),
            impl_->nonceService.get(),
            impl_->rateLimiter.get(),
            impl_->ca.get(),
            housekeepingPolicy);

        services::ApiDependencies deps;
        deps.nonceService = impl_->nonceService.get();
        deps.authenticator = impl_->authenticator.get();
        deps.accountService = impl_->accountService.get();
        deps.orderService = impl_->orderService.get();
        deps.challengeService = impl_->challengeService.get();
        deps.issuanceService = impl_->issuanceService.get();
        deps.revocationService = impl_->revocationService.get();
        deps.ocspResponder = impl_->ocspResponder.get();
        deps.crlRepository = impl_->crlRepo.get();
        deps.ca = impl_->ca.get();
        deps.rateLimiter = impl_->rateLimiter.get();

        services::ApiSettings settings;
        settings.enabled = config.acmeEnabled;
        settings.meta.website = config.acmeWebsite;
        settings.meta.termsOfService = config.acmeTermsOfService;
        settings.meta.caaIdentities = config.acmeCaaIdentities;
        settings.newAccountLimits = limits(config.rateLimitNewAccountPerMinute,
            config.rateLimitNewAccountPerHour, config.rateLimitNewAccountPerDay);
        settings.newOrderLimits = limits(config.rateLimitNewOrderPerMinute,
            config.rateLimitNewOrderPerHour, config.rateLimitNewOrderPerDay);

        impl_->acmeApiService = std::make_unique<services::AcmeApiService>(deps, urls, settings);

        // Step 5: Optional in-process scheduler
        if (config.jobSchedulerEnabled) {
            auto* housekeeping = impl_->housekeepingService.get();
            impl_->jobScheduler = std::make_unique<JobScheduler>();
            impl_->jobScheduler->addJob(services::HousekeepingService::kCacheCrls,
                config.cacheCrlsIntervalSec, [housekeeping]() { housekeeping->cacheCrls(); });
            impl_->jobScheduler->addJob(services::HousekeepingService::kGenerateOcspKeys,
                config.generateOcspKeysIntervalSec, [housekeeping]() { housekeeping->generateOcspKeys(); });
            impl_->jobScheduler->addJob(services::HousekeepingService::kAcmeCleanup,
                config.acmeCleanupIntervalSec, [housekeeping]() { housekeeping->acmeCleanup(); });
        }

        spdlog::info("All ACME server dependencies initialized successfully (storage={}, base={})",
            storageBackend(), urls.base());
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize ACME server: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    spdlog::info("Shutting down ACME server dependencies...");

    if (impl_->jobScheduler) {
        impl_->jobScheduler->stop();
        impl_->jobScheduler.reset();
    }

    // Queued validations and issuances finish before their services go away
    if (impl_->workerPool) {
        impl_->workerPool->shutdown();
    }

    // Delete in reverse order of initialization
    impl_->acmeApiService.reset();
    impl_->housekeepingService.reset();
    impl_->ocspResponder.reset();
    impl_->revocationService.reset();
    impl_->issuanceService.reset();
    impl_->challengeService.reset();
    impl_->orderService.reset();
    impl_->accountService.reset();
    impl_->authenticator.reset();
    impl_->nonceService.reset();

    impl_->publisher.reset();
    impl_->dnsResolver.reset();
    impl_->httpFetcher.reset();
    impl_->rateLimiter.reset();
    impl_->workerPool.reset();
    impl_->ca.reset();

    impl_->ocspKeyRepo.reset();
    impl_->crlRepo.reset();
    impl_->certificateRepo.reset();
    impl_->challengeRepo.reset();
    impl_->authorizationRepo.reset();
    impl_->orderRepo.reset();
    impl_->accountRepo.reset();
    impl_->nonceRepo.reset();
    impl_->memoryState.reset();

    impl_->queryExecutor.reset();

    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }

    spdlog::info("ACME server dependencies shut down");
}

const char* ServiceContainer::storageBackend() const {
    return impl_->memoryBackend ? "memory" : "postgres";
}

bool ServiceContainer::checkDatabase() const {
    if (impl_->memoryBackend) {
        return true;
    }
    if (!impl_->queryExecutor) {
        return false;
    }
    try {
        impl_->queryExecutor->executeScalar("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[ServiceContainer] Database check failed: {}", e.what());
        return false;
    }
}

// --- Accessors ---
common::DbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }
middleware::RateLimiter* ServiceContainer::rateLimiter() const { return impl_->rateLimiter.get(); }
JobScheduler* ServiceContainer::jobScheduler() const { return impl_->jobScheduler.get(); }
services::CertificateAuthority* ServiceContainer::certificateAuthority() const { return impl_->ca.get(); }
services::NonceService* ServiceContainer::nonceService() const { return impl_->nonceService.get(); }
services::HousekeepingService* ServiceContainer::housekeepingService() const { return impl_->housekeepingService.get(); }
services::AcmeApiService* ServiceContainer::acmeApiService() const { return impl_->acmeApiService.get(); }

} // namespace infrastructure
