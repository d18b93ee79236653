/**
 * @file main.cpp
 * @brief ACME Server - RFC 8555 certificate issuance and lifecycle
 *
 * Drogon REST front end over the ACME services: account registration,
 * orders, http-01/dns-01 validation, issuance, revocation, CRL and OCSP,
 * plus the housekeeping jobs that keep revocation data fresh.
 */

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <iostream>
#include <memory>

#include "logger.h"
#include <acme/crypto/cert_ops.h>

#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "infrastructure/job_scheduler.h"
#include "handlers/acme_handler.h"
#include "handlers/health_handler.h"
#include "handlers/job_handler.h"

namespace {

void printBanner() {
    std::cout << R"(
     _    ____ __  __ _____   ____
    / \  / ___|  \/  | ____| / ___|  ___ _ ____   _____ _ __
   / _ \| |   | |\/| |  _|   \___ \ / _ \ '__\ \ / / _ \ '__|
  / ___ \ |___| |  | | |___   ___) |  __/ |   \ V /  __/ |
 /_/   \_\____|_|  |_|_____| |____/ \___|_|    \_/ \___|_|

)" << std::endl;
    std::cout << "  ACME Server - Automated Certificate Management" << std::endl;
    std::cout << "  Version: 1.0.0" << std::endl;
    std::cout << std::endl;
}

std::string currentTimestamp() {
    return acme::crypto::formatRfc3339(std::time(nullptr));
}

// Service container (owns all components)
std::unique_ptr<infrastructure::ServiceContainer> g_services;

} // anonymous namespace

int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    infrastructure::AppConfig config;
    try {
        config = infrastructure::AppConfig::fromEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    common::Logger::initialize("acme-server", config.logLevel, config.logFile);

    try {
        config.validateRequiredCredentials();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::info("Starting ACME Server...");
    spdlog::info("Base URL: {} (ACME {})", config.acmeBaseUrl, config.acmeEnabled ? "enabled" : "disabled");
    if (config.usesMemoryStorage()) {
        spdlog::warn("Storage: in-memory, all state is lost on restart");
    } else {
        spdlog::info("Database: {}:{}/{}", config.dbHost, config.dbPort, config.dbName);
    }

    g_services = std::make_unique<infrastructure::ServiceContainer>();
    if (!g_services->initialize(config)) {
        spdlog::critical("Service initialization failed");
        return 1;
    }

    try {
        auto& app = drogon::app();

        app.setLogPath("logs")
           .setLogLevel(trantor::Logger::kInfo)
           .addListener("0.0.0.0", config.serverPort)
           .setThreadNum(config.threadNum)
           .setClientMaxBodySize(1024 * 1024);

        handlers::AcmeHandler acmeHandler(g_services->acmeApiService());
        acmeHandler.registerRoutes(app);

        handlers::JobHandler jobHandler(g_services->housekeepingService());
        jobHandler.registerRoutes(app);

        auto* services = g_services.get();
        handlers::HealthProbes probes;
        probes.storageBackend = services->storageBackend();
        probes.pingDatabase = [services]() { return services->checkDatabase(); };
        probes.revocation = [services]() { return services->housekeepingService()->revocationHealth(); };
        probes.timestamp = currentTimestamp;
        handlers::HealthHandler healthHandler(std::move(probes));
        healthHandler.registerRoutes(app);

        if (auto* scheduler = g_services->jobScheduler()) {
            scheduler->start();
        }

        spdlog::info("Server starting on http://0.0.0.0:{}", config.serverPort);
        spdlog::info("Press Ctrl+C to stop the server");

        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        g_services->shutdown();
        return 1;
    }

    g_services->shutdown();
    g_services.reset();
    spdlog::info("Server stopped");
    return 0;
}
