/** @file acme_handler.cpp
 *  @brief AcmeHandler implementation
 */

#include "acme_handler.h"
#include "../services/acme_api_service.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace handlers {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

AcmeHandler::AcmeHandler(services::AcmeApiService* api)
    : api_(api) {
    if (!api_) {
        throw std::invalid_argument("AcmeHandler: api cannot be nullptr");
    }
    spdlog::info("[AcmeHandler] Initialized");
}

std::string AcmeHandler::clientIp(const drogon::HttpRequestPtr& req) {
    std::string forwarded = req->getHeader("X-Forwarded-For");
    if (!forwarded.empty()) {
        auto comma = forwarded.find(',');
        std::string first = forwarded.substr(0, comma);
        auto begin = first.find_first_not_of(' ');
        auto end = first.find_last_not_of(' ');
        if (begin != std::string::npos) {
            return first.substr(begin, end - begin + 1);
        }
    }
    return req->getPeerAddr().toIp();
}

services::AcmeHttpRequest AcmeHandler::toAcmeRequest(const drogon::HttpRequestPtr& req) {
    services::AcmeHttpRequest request;
    switch (req->method()) {
        case drogon::Get: request.method = "GET"; break;
        case drogon::Head: request.method = "HEAD"; break;
        case drogon::Post: request.method = "POST"; break;
        default: request.method = req->methodString(); break;
    }
    request.contentType = req->getHeader("Content-Type");
    request.body = std::string(req->body());
    request.clientIp = clientIp(req);
    return request;
}

drogon::HttpResponsePtr AcmeHandler::toDrogonResponse(const services::AcmeHttpResponse& response) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));
    if (!response.contentType.empty()) {
        resp->setContentTypeString(response.contentType);
    }
    resp->setBody(response.body);
    for (const auto& header : response.headers) {
        resp->addHeader(header.first, header.second);
    }
    return resp;
}

void AcmeHandler::registerRoutes(drogon::HttpAppFramework& app) {
    const std::string prefix = api_->urls().pathPrefix();
    auto* api = api_;

    // GET /directory
    app.registerHandler(
        prefix + "/directory",
        [api](const drogon::HttpRequestPtr& /* req */, Callback&& callback) {
            callback(toDrogonResponse(api->directory()));
        },
        {drogon::Get}
    );

    // HEAD, GET /new-nonce
    app.registerHandler(
        prefix + "/new-nonce",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback) {
            callback(toDrogonResponse(api->newNonce(toAcmeRequest(req))));
        },
        {drogon::Get, drogon::Head}
    );

    // POST /new-account
    app.registerHandler(
        prefix + "/new-account",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback) {
            callback(toDrogonResponse(api->newAccount(toAcmeRequest(req))));
        },
        {drogon::Post}
    );

    // POST /acct/{id}
    app.registerHandler(
        prefix + "/acct/{id}",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            callback(toDrogonResponse(api->account(toAcmeRequest(req), id)));
        },
        {drogon::Post}
    );

    // POST /acct/{id}/orders
    app.registerHandler(
        prefix + "/acct/{id}/orders",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            callback(toDrogonResponse(api->accountOrders(toAcmeRequest(req), id)));
        },
        {drogon::Post}
    );

    // POST /key-change
    app.registerHandler(
        prefix + "/key-change",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback) {
            callback(toDrogonResponse(api->keyChange(toAcmeRequest(req))));
        },
        {drogon::Post}
    );

    // POST /new-order
    app.registerHandler(
        prefix + "/new-order",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback) {
            callback(toDrogonResponse(api->newOrder(toAcmeRequest(req))));
        },
        {drogon::Post}
    );

    // POST /order/{id}
    app.registerHandler(
        prefix + "/order/{id}",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            callback(toDrogonResponse(api->order(toAcmeRequest(req), id)));
        },
        {drogon::Post}
    );

    // POST /order/{id}/finalize
    app.registerHandler(
        prefix + "/order/{id}/finalize",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            callback(toDrogonResponse(api->finalize(toAcmeRequest(req), id)));
        },
        {drogon::Post}
    );

    // POST /authz/{id}
    app.registerHandler(
        prefix + "/authz/{id}",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            callback(toDrogonResponse(api->authorization(toAcmeRequest(req), id)));
        },
        {drogon::Post}
    );

    // POST /challenge/{id}
    app.registerHandler(
        prefix + "/challenge/{id}",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            callback(toDrogonResponse(api->challenge(toAcmeRequest(req), id)));
        },
        {drogon::Post}
    );

    // GET, POST /cert/{serial}
    app.registerHandler(
        prefix + "/cert/{serial}",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& serial) {
            callback(toDrogonResponse(api->certificate(toAcmeRequest(req), serial)));
        },
        {drogon::Get, drogon::Post}
    );

    // POST /revoke-cert
    app.registerHandler(
        prefix + "/revoke-cert",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback) {
            callback(toDrogonResponse(api->revokeCert(toAcmeRequest(req))));
        },
        {drogon::Post}
    );

    // GET /crl
    app.registerHandler(
        prefix + "/crl",
        [api](const drogon::HttpRequestPtr& /* req */, Callback&& callback) {
            callback(toDrogonResponse(api->crl()));
        },
        {drogon::Get}
    );

    // POST /ocsp
    app.registerHandler(
        prefix + "/ocsp",
        [api](const drogon::HttpRequestPtr& req, Callback&& callback) {
            callback(toDrogonResponse(api->ocsp(toAcmeRequest(req))));
        },
        {drogon::Post}
    );

    spdlog::info("[AcmeHandler] Routes registered under '{}'", prefix.empty() ? "/" : prefix);
}

} // namespace handlers
