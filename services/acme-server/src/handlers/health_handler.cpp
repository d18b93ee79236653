/**
 * @file health_handler.cpp
 * @brief HealthHandler implementation
 */

#include "health_handler.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace handlers {

namespace {
using Callback = std::function<void(const drogon::HttpResponsePtr&)>;
}

HealthHandler::HealthHandler(HealthProbes probes)
    : probes_(std::move(probes))
{
    if (!probes_.pingDatabase || !probes_.revocation || !probes_.timestamp) {
        throw std::invalid_argument("HealthHandler: health probes cannot be empty");
    }
}

Json::Value HealthHandler::databaseStatus() const {
    Json::Value result(Json::objectValue);
    result["backend"] = probes_.storageBackend;

    auto start = std::chrono::steady_clock::now();
    bool up = probes_.pingDatabase();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    result["status"] = up ? "UP" : "DOWN";
    result["responseTimeMs"] = static_cast<Json::Int64>(elapsed.count());
    return result;
}

drogon::HttpResponsePtr HealthHandler::respond(const Json::Value& body, bool healthy) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->addHeader("Cache-Control", "no-store");
    if (!healthy) {
        resp->setStatusCode(drogon::k503ServiceUnavailable);
    }
    return resp;
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    app.registerHandler(
        "/api/health",
        [this](const drogon::HttpRequestPtr&, Callback&& callback) {
            Json::Value body(Json::objectValue);
            body["service"] = "acme-server";
            body["status"] = "UP";
            body["timestamp"] = probes_.timestamp();
            callback(respond(body, true));
        },
        {drogon::Get});

    app.registerHandler(
        "/api/health/database",
        [this](const drogon::HttpRequestPtr&, Callback&& callback) {
            Json::Value body = databaseStatus();
            body["timestamp"] = probes_.timestamp();
            bool up = body["status"].asString() == "UP";
            if (!up) {
                spdlog::warn("[HealthHandler] {} datastore is not answering", probes_.storageBackend);
            }
            callback(respond(body, up));
        },
        {drogon::Get});

    app.registerHandler(
        "/api/health/revocation",
        [this](const drogon::HttpRequestPtr&, Callback&& callback) {
            Json::Value body(Json::objectValue);
            try {
                body = probes_.revocation();
            } catch (const std::exception& e) {
                spdlog::error("[HealthHandler] Revocation status unavailable: {}", e.what());
                body["status"] = "DOWN";
                body["error"] = e.what();
            }
            body["timestamp"] = probes_.timestamp();
            callback(respond(body, body["status"].asString() == "UP"));
        },
        {drogon::Get});

    spdlog::info("[HealthHandler] Routes registered");
}

} // namespace handlers
