/** @file job_handler.cpp
 *  @brief JobHandler implementation
 */

#include "job_handler.h"
#include "../common/exceptions.h"
#include "../services/housekeeping_service.h"
#include <spdlog/spdlog.h>
#include <chrono>

namespace handlers {

JobHandler::JobHandler(services::HousekeepingService* housekeeping)
    : housekeeping_(housekeeping) {
    if (!housekeeping_) {
        throw std::invalid_argument("JobHandler: housekeeping cannot be nullptr");
    }
}

void JobHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /jobs
    app.registerHandler(
        "/jobs",
        [this](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleList(std::move(callback));
        },
        {drogon::Get}
    );

    // POST /jobs/{name}
    app.registerHandler(
        "/jobs/{name}",
        [this](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& name) {
            handleRun(std::move(callback), name);
        },
        {drogon::Post}
    );

    spdlog::info("[JobHandler] Routes registered");
}

void JobHandler::handleList(std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    Json::Value result(Json::objectValue);
    result["jobs"] = Json::Value(Json::arrayValue);
    for (const auto& name : services::HousekeepingService::jobNames()) {
        result["jobs"].append(name);
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(result));
}

void JobHandler::handleRun(
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& name) {

    spdlog::info("POST /jobs/{}", name);
    auto start = std::chrono::steady_clock::now();

    try {
        auto jobResult = housekeeping_->runJob(name);
        Json::Value result = jobResult.toJson();
        result["success"] = true;
        result["durationMs"] = static_cast<Json::Int64>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
        callback(drogon::HttpResponse::newHttpJsonResponse(result));

    } catch (const common::NotFoundException& e) {
        Json::Value error;
        error["success"] = false;
        error["error"] = e.what();
        auto resp = drogon::HttpResponse::newHttpJsonResponse(error);
        resp->setStatusCode(drogon::k404NotFound);
        callback(resp);

    } catch (const std::exception& e) {
        spdlog::error("[JobHandler] Job {} failed: {}", name, e.what());
        Json::Value error;
        error["success"] = false;
        error["job"] = name;
        error["error"] = e.what();
        auto resp = drogon::HttpResponse::newHttpJsonResponse(error);
        resp->setStatusCode(drogon::k500InternalServerError);
        callback(resp);
    }
}

} // namespace handlers
