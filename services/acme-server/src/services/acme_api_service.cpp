/**
 * @file acme_api_service.cpp
 * @brief AcmeApiService implementation
 */

#include "acme_api_service.h"
#include "../common/exceptions.h"
#include <acme/crypto/base64url.h>
#include <acme/crypto/cert_ops.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using namespace domain::models;

namespace {

std::string toJsonBody(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, value);
}

Json::Value identifierJson(const std::string& value) {
    Json::Value identifier(Json::objectValue);
    identifier["type"] = "dns";
    identifier["value"] = value;
    return identifier;
}

} // anonymous namespace

// =============================================================================
// AcmeHttpResponse
// =============================================================================

std::string AcmeHttpResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

AcmeHttpResponse AcmeHttpResponse::json(int status, const Json::Value& body) {
    AcmeHttpResponse response;
    response.status = status;
    response.contentType = AcmeApiService::kJsonContentType;
    response.body = toJsonBody(body);
    return response;
}

AcmeHttpResponse AcmeHttpResponse::problem(const common::AcmeProblem& problem) {
    AcmeHttpResponse response;
    response.status = problem.status();
    response.contentType = common::AcmeProblem::kContentType;
    response.body = toJsonBody(problem.toJson());
    return response;
}

// =============================================================================
// AcmeApiService
// =============================================================================

AcmeApiService::AcmeApiService(ApiDependencies deps, common::AcmeUrls urls, ApiSettings settings)
    : deps_(deps)
    , urls_(std::move(urls))
    , settings_(std::move(settings))
    , directoryRandomKey_(acme::crypto::randomBase64Url(16))
{
    if (!deps_.nonceService || !deps_.authenticator || !deps_.accountService || !deps_.orderService) {
        throw std::invalid_argument("AcmeApiService: request services cannot be nullptr");
    }
    if (!deps_.challengeService || !deps_.issuanceService || !deps_.revocationService ||
        !deps_.ocspResponder || !deps_.crlRepository || !deps_.ca) {
        throw std::invalid_argument("AcmeApiService: lifecycle services cannot be nullptr");
    }
}

AcmeHttpResponse AcmeApiService::guarded(const std::function<AcmeHttpResponse()>& handler, bool acmeHeaders) {
    AcmeHttpResponse response;
    try {
        if (acmeHeaders && !settings_.enabled) {
            throw common::NotFoundException("ACME is not enabled.");
        }
        response = handler();
    } catch (const common::RateLimitedException& e) {
        spdlog::warn("[AcmeApiService] Rate limited: {}", e.what());
        response = AcmeHttpResponse::problem(e.toProblem());
        response.addHeader("Retry-After", std::to_string(e.getRetryAfterSeconds()));
    } catch (const common::ConflictException& e) {
        response = AcmeHttpResponse::problem(e.toProblem());
        if (!e.getLocation().empty()) {
            response.addHeader("Location", e.getLocation());
        }
    } catch (const common::AcmeServiceException& e) {
        if (e.getDetails().empty()) {
            spdlog::info("[AcmeApiService] {} ({})", e.what(), common::errorCodeToString(e.getCode()));
        } else {
            spdlog::info("[AcmeApiService] {} ({}): {}", e.what(), common::errorCodeToString(e.getCode()), e.getDetails());
        }
        response = AcmeHttpResponse::problem(e.toProblem());
    } catch (const std::exception& e) {
        spdlog::error("[AcmeApiService] Unhandled error: {}", e.what());
        response = AcmeHttpResponse::problem(
            common::AcmeProblem(common::ErrorCode::SERVER_INTERNAL, "An internal error occurred."));
    }

    if (acmeHeaders && settings_.enabled) {
        try {
            response.addHeader("Replay-Nonce", deps_.nonceService->issue());
        } catch (const std::exception& e) {
            spdlog::error("[AcmeApiService] Nonce issuance failed: {}", e.what());
        }
        response.addHeader("Link", "<" + urls_.directory() + ">;rel=\"index\"");
    }
    return response;
}

void AcmeApiService::enforceRateLimit(const std::string& key, const middleware::RateLimits& limits) {
    if (!deps_.rateLimiter || !limits.enabled()) {
        return;
    }
    auto decision = deps_.rateLimiter->checkAndIncrement(key, limits);
    if (!decision.allowed) {
        throw common::RateLimitedException(
            "Rate limit of " + std::to_string(decision.limit) + " " + decision.window + " exceeded.",
            static_cast<long>(decision.retryAfterSeconds));
    }
}

// =============================================================================
// Rendering
// =============================================================================

Json::Value AcmeApiService::renderAccount(const Account& account) const {
    Json::Value json(Json::objectValue);
    json["status"] = accountStatusToString(account.status);
    json["contact"] = Json::Value(Json::arrayValue);
    for (const auto& contact : account.contacts) {
        json["contact"].append(contact);
    }
    json["termsOfServiceAgreed"] = account.termsOfServiceAgreed;
    json["orders"] = urls_.accountOrders(account.id);
    json["key"] = account.jwk;
    json["createdAt"] = acme::crypto::formatRfc3339(account.createdAt);
    return json;
}

Json::Value AcmeApiService::renderOrder(const OrderView& view) const {
    const Order& order = view.order;
    Json::Value json(Json::objectValue);
    json["status"] = orderStatusToString(order.status);
    json["expires"] = acme::crypto::formatRfc3339(order.expiresAt);

    json["identifiers"] = Json::Value(Json::arrayValue);
    for (const auto& identifier : order.identifiers) {
        json["identifiers"].append(identifierJson(identifier));
    }
    if (order.notBefore) json["notBefore"] = acme::crypto::formatRfc3339(*order.notBefore);
    if (order.notAfter) json["notAfter"] = acme::crypto::formatRfc3339(*order.notAfter);

    json["authorizations"] = Json::Value(Json::arrayValue);
    for (const auto& authz : view.authorizations) {
        json["authorizations"].append(urls_.authorization(authz.id));
    }
    json["finalize"] = urls_.finalize(order.id);

    if (order.status == OrderStatus::VALID && order.hasCertificate()) {
        json["certificate"] = urls_.certificate(order.certificateSerial);
    }
    if (!order.error.isNull()) {
        json["error"] = order.error;
    }
    return json;
}

Json::Value AcmeApiService::renderChallenge(const Challenge& challenge) const {
    Json::Value json(Json::objectValue);
    json["type"] = challengeTypeToString(challenge.type);
    json["url"] = urls_.challenge(challenge.id);
    json["status"] = challengeStatusToString(challenge.status);
    json["token"] = challenge.token;
    if (challenge.validatedAt) {
        json["validated"] = acme::crypto::formatRfc3339(*challenge.validatedAt);
    }
    if (!challenge.error.isNull()) {
        json["error"] = challenge.error;
    }
    return json;
}

Json::Value AcmeApiService::renderAuthorization(const AuthorizationView& view) const {
    const Authorization& authz = view.authorization;
    Json::Value json(Json::objectValue);
    json["identifier"] = identifierJson(authz.identifier);
    json["status"] = authorizationStatusToString(authz.status);
    json["expires"] = acme::crypto::formatRfc3339(authz.expiresAt);
    json["challenges"] = Json::Value(Json::arrayValue);
    for (const auto& challenge : view.challenges) {
        json["challenges"].append(renderChallenge(challenge));
    }
    return json;
}

// =============================================================================
// Directory and nonces
// =============================================================================

AcmeHttpResponse AcmeApiService::directory() {
    try {
        if (!settings_.enabled) {
            throw common::NotFoundException("ACME is not enabled.");
        }
        Json::Value json(Json::objectValue);
        json["newNonce"] = urls_.newNonce();
        json["newAccount"] = urls_.newAccount();
        json["newOrder"] = urls_.newOrder();
        json["revokeCert"] = urls_.revokeCert();
        json["keyChange"] = urls_.keyChange();

        Json::Value meta(Json::objectValue);
        if (!settings_.meta.website.empty()) meta["website"] = settings_.meta.website;
        if (!settings_.meta.termsOfService.empty()) meta["termsOfService"] = settings_.meta.termsOfService;
        if (!settings_.meta.caaIdentities.empty()) {
            meta["caaIdentities"] = Json::Value(Json::arrayValue);
            for (const auto& caa : settings_.meta.caaIdentities) {
                meta["caaIdentities"].append(caa);
            }
        }
        if (!meta.empty()) {
            json["meta"] = meta;
        }

        // Random entry so clients do not hard-code the directory layout
        json[directoryRandomKey_] = "https://community.letsencrypt.org/t/adding-random-entries-to-the-directory/33417";
        return AcmeHttpResponse::json(200, json);
    } catch (const common::AcmeServiceException& e) {
        return AcmeHttpResponse::problem(e.toProblem());
    }
}

AcmeHttpResponse AcmeApiService::newNonce(const AcmeHttpRequest& request) {
    return guarded([&] {
        AcmeHttpResponse response;
        response.status = request.method == "HEAD" ? 200 : 204;
        response.addHeader("Cache-Control", "no-store");
        return response;
    });
}

// =============================================================================
// Accounts
// =============================================================================

AcmeHttpResponse AcmeApiService::newAccount(const AcmeHttpRequest& request) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.newAccount(), KeyMode::JWK);
        enforceRateLimit("ip:" + request.clientIp, settings_.newAccountLimits);

        auto registration = deps_.accountService->registerAccount(auth.jwk, auth.thumbprint, auth.payload);
        auto response = AcmeHttpResponse::json(registration.created ? 201 : 200,
            renderAccount(registration.account));
        response.addHeader("Location", urls_.account(registration.account.id));
        return response;
    });
}

AcmeHttpResponse AcmeApiService::account(const AcmeHttpRequest& request, const std::string& accountId) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.account(accountId), KeyMode::KID);

        Account updated = deps_.accountService->update(*auth.account, accountId, auth.payload);
        auto response = AcmeHttpResponse::json(200, renderAccount(updated));
        response.addHeader("Location", urls_.account(updated.id));
        return response;
    });
}

AcmeHttpResponse AcmeApiService::accountOrders(const AcmeHttpRequest& request, const std::string& accountId) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.accountOrders(accountId), KeyMode::KID);
        if (auth.account->id != accountId) {
            throw common::UnauthorizedException("You are not authorized to access this resource.");
        }

        Json::Value json(Json::objectValue);
        json["orders"] = Json::Value(Json::arrayValue);
        for (const auto& id : deps_.orderService->listOrderIds(*auth.account)) {
            json["orders"].append(urls_.order(id));
        }
        return AcmeHttpResponse::json(200, json);
    });
}

AcmeHttpResponse AcmeApiService::keyChange(const AcmeHttpRequest& request) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.keyChange(), KeyMode::KID);
        auto keyChange = deps_.authenticator->verifyKeyChange(auth.payload, urls_.keyChange());

        Account updated = deps_.accountService->changeKey(
            *auth.account, urls_.account(auth.account->id), keyChange, urls_.accountPrefix());
        auto response = AcmeHttpResponse::json(200, renderAccount(updated));
        response.addHeader("Location", urls_.account(updated.id));
        return response;
    });
}

// =============================================================================
// Orders, authorizations, challenges
// =============================================================================

AcmeHttpResponse AcmeApiService::newOrder(const AcmeHttpRequest& request) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.newOrder(), KeyMode::KID);
        enforceRateLimit("acct:" + auth.account->id, settings_.newOrderLimits);

        auto view = deps_.orderService->createOrder(*auth.account, auth.payload);
        auto response = AcmeHttpResponse::json(201, renderOrder(view));
        response.addHeader("Location", urls_.order(view.order.id));
        return response;
    });
}

AcmeHttpResponse AcmeApiService::order(const AcmeHttpRequest& request, const std::string& orderId) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.order(orderId), KeyMode::KID);
        auto view = deps_.orderService->getOrder(*auth.account, orderId);
        return AcmeHttpResponse::json(200, renderOrder(view));
    });
}

AcmeHttpResponse AcmeApiService::finalize(const AcmeHttpRequest& request, const std::string& orderId) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.finalize(orderId), KeyMode::KID);
        auto view = deps_.issuanceService->finalize(*auth.account, orderId, auth.payload);

        auto response = AcmeHttpResponse::json(200, renderOrder(view));
        response.addHeader("Location", urls_.order(orderId));
        if (view.order.status == OrderStatus::PROCESSING) {
            response.addHeader("Retry-After", "1");
        }
        return response;
    });
}

AcmeHttpResponse AcmeApiService::authorization(const AcmeHttpRequest& request, const std::string& authorizationId) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.authorization(authorizationId), KeyMode::KID);

        const Json::Value& payload = auth.payload;
        if (payload.isObject() && payload.isMember("status")) {
            if (!payload["status"].isString() || payload["status"].asString() != "deactivated") {
                throw common::MalformedException("Only status \"deactivated\" can be requested.");
            }
            auto view = deps_.orderService->deactivateAuthorization(*auth.account, authorizationId);
            return AcmeHttpResponse::json(200, renderAuthorization(view));
        }

        auto view = deps_.orderService->getAuthorization(*auth.account, authorizationId);
        return AcmeHttpResponse::json(200, renderAuthorization(view));
    });
}

AcmeHttpResponse AcmeApiService::challenge(const AcmeHttpRequest& request, const std::string& challengeId) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.challenge(challengeId), KeyMode::KID);

        Challenge challenge = auth.isPostAsGet()
            ? deps_.challengeService->getChallenge(*auth.account, challengeId)
            : deps_.challengeService->respond(*auth.account, challengeId);

        auto response = AcmeHttpResponse::json(200, renderChallenge(challenge));
        response.addHeader("Link", "<" + urls_.authorization(challenge.authorizationId) + ">;rel=\"up\"");
        return response;
    });
}

// =============================================================================
// Certificates and revocation
// =============================================================================

AcmeHttpResponse AcmeApiService::certificate(const AcmeHttpRequest& request, const std::string& serial) {
    return guarded([&] {
        if (request.method == "POST") {
            deps_.authenticator->authenticate(
                request.contentType, request.body, urls_.certificate(serial), KeyMode::KID);
        }

        AcmeHttpResponse response;
        response.contentType = kPemChainContentType;
        response.body = deps_.issuanceService->certificateChainPem(serial);
        return response;
    });
}

AcmeHttpResponse AcmeApiService::revokeCert(const AcmeHttpRequest& request) {
    return guarded([&] {
        auto auth = deps_.authenticator->authenticate(
            request.contentType, request.body, urls_.revokeCert(), KeyMode::EITHER);
        deps_.revocationService->revoke(auth);

        AcmeHttpResponse response;
        response.status = 200;
        return response;
    });
}

AcmeHttpResponse AcmeApiService::crl() {
    return guarded([&] {
        auto record = deps_.crlRepository->findLatest(deps_.ca->serial());
        if (!record) {
            throw common::NotFoundException("No CRL has been generated yet.");
        }
        AcmeHttpResponse response;
        response.contentType = kCrlContentType;
        response.body = record->der;
        return response;
    }, false);
}

AcmeHttpResponse AcmeApiService::ocsp(const AcmeHttpRequest& request) {
    return guarded([&] {
        if (request.contentType.find("application/ocsp-request") == std::string::npos) {
            throw common::UnsupportedMediaTypeException(request.contentType);
        }
        AcmeHttpResponse response;
        response.contentType = kOcspResponseContentType;
        response.body = deps_.ocspResponder->respond(request.body);
        return response;
    }, false);
}

} // namespace services
