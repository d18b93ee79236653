#pragma once

/**
 * @file app_config.h
 * @brief ACME server configuration
 *
 * Loaded from environment variables at startup.
 */

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace infrastructure {

namespace env {

inline bool toBool(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes" || value == "on";
}

inline std::vector<std::string> toList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            items.push_back(item.substr(begin, end - begin + 1));
        }
    }
    return items;
}

} // namespace env

struct AppConfig {
    // Server
    int serverPort = 8080;
    int threadNum = 4;

    // Database
    std::string storageBackend = "postgres";   // "postgres" or "memory"
    std::string dbHost = "postgres";
    int dbPort = 5432;
    std::string dbName = "acme";
    std::string dbUser = "acme";
    std::string dbPassword;
    int dbPoolMin = 2;
    int dbPoolMax = 10;
    int dbPoolTimeout = 5;
    int dbStatementTimeoutMs = 10000;

    // ACME
    std::string acmeBaseUrl = "http://localhost:8080/acme";
    bool acmeEnabled = true;
    bool acmeRequireContact = false;
    std::string acmeTermsOfService;
    std::string acmeWebsite;
    std::vector<std::string> acmeCaaIdentities;
    long acmeOrderValidity = 3600;
    long acmeDefaultCertValidity = 90L * 86400;
    long acmeMaxCertValidity = 90L * 86400;
    long acmeNonceLifetime = 3600;

    // CA
    std::string caKeyPath = "/etc/acme/ca.key";
    std::string caCertPath = "/etc/acme/ca.pem";
    std::string caChainPath;

    // Challenge validation
    int challengeMaxAttempts = 3;
    int challengeRetryBaseMs = 1000;
    int challengeTimeoutSec = 5;
    int validationWorkers = 4;
    int validationQueueSize = 1000;
    std::string dnsServers;                    // Comma separated, system resolver when empty
    std::string challengePublishDir;           // http-01 responses served by the proxy

    // Revocation
    long crlValidityHours = 24;
    long crlRefreshMarginHours = 1;
    long ocspKeyValidityHours = 72;
    long ocspKeyOverlapHours = 24;
    std::string ocspResponderUrl;

    // Rate limits (0 disables a window)
    int rateLimitNewAccountPerMinute = 10;
    int rateLimitNewAccountPerHour = 50;
    int rateLimitNewAccountPerDay = 300;
    int rateLimitNewOrderPerMinute = 30;
    int rateLimitNewOrderPerHour = 300;
    int rateLimitNewOrderPerDay = 3000;

    // In-process job scheduler
    bool jobSchedulerEnabled = false;
    int cacheCrlsIntervalSec = 86100;
    int generateOcspKeysIntervalSec = 258900;
    int acmeCleanupIntervalSec = 86400;

    // Logging
    std::string logLevel = "info";
    std::string logFile = "logs/acme-server.log";

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("SERVER_PORT")) config.serverPort = std::stoi(val);
        if (auto val = std::getenv("THREAD_NUM")) config.threadNum = std::stoi(val);

        if (auto val = std::getenv("STORAGE_BACKEND")) config.storageBackend = val;
        if (auto val = std::getenv("DB_HOST")) config.dbHost = val;
        if (auto val = std::getenv("DB_PORT")) config.dbPort = std::stoi(val);
        if (auto val = std::getenv("DB_NAME")) config.dbName = val;
        if (auto val = std::getenv("DB_USER")) config.dbUser = val;
        if (auto val = std::getenv("DB_PASSWORD")) config.dbPassword = val;
        if (auto val = std::getenv("DB_POOL_MIN")) config.dbPoolMin = std::stoi(val);
        if (auto val = std::getenv("DB_POOL_MAX")) config.dbPoolMax = std::stoi(val);
        if (auto val = std::getenv("DB_POOL_TIMEOUT")) config.dbPoolTimeout = std::stoi(val);
        if (auto val = std::getenv("DB_STATEMENT_TIMEOUT_MS")) config.dbStatementTimeoutMs = std::stoi(val);

        if (auto val = std::getenv("ACME_BASE_URL")) config.acmeBaseUrl = val;
        if (auto val = std::getenv("ACME_ENABLED")) config.acmeEnabled = env::toBool(val);
        if (auto val = std::getenv("ACME_REQUIRE_CONTACT")) config.acmeRequireContact = env::toBool(val);
        if (auto val = std::getenv("ACME_TERMS_OF_SERVICE")) config.acmeTermsOfService = val;
        if (auto val = std::getenv("ACME_WEBSITE")) config.acmeWebsite = val;
        if (auto val = std::getenv("ACME_CAA_IDENTITIES")) config.acmeCaaIdentities = env::toList(val);
        if (auto val = std::getenv("ACME_ORDER_VALIDITY")) config.acmeOrderValidity = std::stol(val);
        if (auto val = std::getenv("ACME_DEFAULT_CERT_VALIDITY")) config.acmeDefaultCertValidity = std::stol(val);
        if (auto val = std::getenv("ACME_MAX_CERT_VALIDITY")) config.acmeMaxCertValidity = std::stol(val);
        if (auto val = std::getenv("ACME_NONCE_LIFETIME")) config.acmeNonceLifetime = std::stol(val);

        if (auto val = std::getenv("CA_KEY_PATH")) config.caKeyPath = val;
        if (auto val = std::getenv("CA_CERT_PATH")) config.caCertPath = val;
        if (auto val = std::getenv("CA_CHAIN_PATH")) config.caChainPath = val;

        if (auto val = std::getenv("CHALLENGE_MAX_ATTEMPTS")) config.challengeMaxAttempts = std::stoi(val);
        if (auto val = std::getenv("CHALLENGE_RETRY_BASE_MS")) config.challengeRetryBaseMs = std::stoi(val);
        if (auto val = std::getenv("CHALLENGE_TIMEOUT_SEC")) config.challengeTimeoutSec = std::stoi(val);
        if (auto val = std::getenv("VALIDATION_WORKERS")) config.validationWorkers = std::stoi(val);
        if (auto val = std::getenv("VALIDATION_QUEUE_SIZE")) config.validationQueueSize = std::stoi(val);
        if (auto val = std::getenv("DNS_SERVERS")) config.dnsServers = val;
        if (auto val = std::getenv("CHALLENGE_PUBLISH_DIR")) config.challengePublishDir = val;

        if (auto val = std::getenv("CRL_VALIDITY_HOURS")) config.crlValidityHours = std::stol(val);
        if (auto val = std::getenv("CRL_REFRESH_MARGIN_HOURS")) config.crlRefreshMarginHours = std::stol(val);
        if (auto val = std::getenv("OCSP_KEY_VALIDITY_HOURS")) config.ocspKeyValidityHours = std::stol(val);
        if (auto val = std::getenv("OCSP_KEY_OVERLAP_HOURS")) config.ocspKeyOverlapHours = std::stol(val);
        if (auto val = std::getenv("OCSP_RESPONDER_URL")) config.ocspResponderUrl = val;

        if (auto val = std::getenv("RATE_LIMIT_NEW_ACCOUNT_PER_MINUTE")) config.rateLimitNewAccountPerMinute = std::stoi(val);
        if (auto val = std::getenv("RATE_LIMIT_NEW_ACCOUNT_PER_HOUR")) config.rateLimitNewAccountPerHour = std::stoi(val);
        if (auto val = std::getenv("RATE_LIMIT_NEW_ACCOUNT_PER_DAY")) config.rateLimitNewAccountPerDay = std::stoi(val);
        if (auto val = std::getenv("RATE_LIMIT_NEW_ORDER_PER_MINUTE")) config.rateLimitNewOrderPerMinute = std::stoi(val);
        if (auto val = std::getenv("RATE_LIMIT_NEW_ORDER_PER_HOUR")) config.rateLimitNewOrderPerHour = std::stoi(val);
        if (auto val = std::getenv("RATE_LIMIT_NEW_ORDER_PER_DAY")) config.rateLimitNewOrderPerDay = std::stoi(val);

        if (auto val = std::getenv("JOB_SCHEDULER_ENABLED")) config.jobSchedulerEnabled = env::toBool(val);
        if (auto val = std::getenv("JOB_CACHE_CRLS_INTERVAL_SEC")) config.cacheCrlsIntervalSec = std::stoi(val);
        if (auto val = std::getenv("JOB_GENERATE_OCSP_KEYS_INTERVAL_SEC")) config.generateOcspKeysIntervalSec = std::stoi(val);
        if (auto val = std::getenv("JOB_ACME_CLEANUP_INTERVAL_SEC")) config.acmeCleanupIntervalSec = std::stoi(val);

        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;

        return config;
    }

    bool usesMemoryStorage() const { return storageBackend == "memory"; }

    void validateRequiredCredentials() const {
        if (storageBackend != "postgres" && storageBackend != "memory") {
            throw std::runtime_error("FATAL: STORAGE_BACKEND must be 'postgres' or 'memory', got '" + storageBackend + "'");
        }
        if (!usesMemoryStorage() && dbPassword.empty()) {
            throw std::runtime_error("FATAL: DB_PASSWORD environment variable not set");
        }
        if (acmeBaseUrl.find("://") == std::string::npos) {
            throw std::runtime_error("FATAL: ACME_BASE_URL must be an absolute URL");
        }
        spdlog::info("All required credentials loaded from environment");
    }
};

} // namespace infrastructure
