/**
 * @file order_service.cpp
 * @brief OrderService implementation
 */

#include "order_service.h"
#include "../common/dns_name.h"
#include "../common/exceptions.h"
#include "../common/id_generator.h"
#include <acme/crypto/base64url.h>
#include <acme/crypto/cert_ops.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace services {

using namespace domain::models;

namespace {

constexpr size_t kTokenBytes = 16;

bool isTerminalFailure(AuthorizationStatus status) {
    return status == AuthorizationStatus::INVALID ||
           status == AuthorizationStatus::EXPIRED ||
           status == AuthorizationStatus::DEACTIVATED ||
           status == AuthorizationStatus::REVOKED;
}

std::optional<std::time_t> parseTimestamp(const Json::Value& payload, const char* field) {
    if (!payload.isMember(field) || payload[field].isNull()) {
        return std::nullopt;
    }
    std::time_t t = 0;
    if (!payload[field].isString() || !acme::crypto::parseRfc3339(payload[field].asString(), t)) {
        throw common::MalformedException(std::string(field) + " is not an RFC 3339 timestamp.");
    }
    return t;
}

Json::Value problemJson(common::ErrorCode code, const std::string& detail) {
    return common::AcmeProblem(code, detail).toJson();
}

} // anonymous namespace

OrderService::OrderService(
    repositories::IOrderRepository* orderRepository,
    repositories::IAuthorizationRepository* authorizationRepository,
    repositories::IChallengeRepository* challengeRepository,
    OrderPolicy policy,
    common::Clock clock)
    : orderRepository_(orderRepository)
    , authorizationRepository_(authorizationRepository)
    , challengeRepository_(challengeRepository)
    , policy_(policy)
    , clock_(std::move(clock))
{
    if (!orderRepository_ || !authorizationRepository_ || !challengeRepository_) {
        throw std::invalid_argument("OrderService: repositories cannot be nullptr");
    }
}

// =============================================================================
// Creation
// =============================================================================

std::vector<std::string> OrderService::parseIdentifiers(const Json::Value& identifiers) {
    if (!identifiers.isArray() || identifiers.empty()) {
        throw common::MalformedException("The order must contain at least one identifier.");
    }

    std::vector<std::string> names;
    for (const auto& identifier : identifiers) {
        if (!identifier.isObject() || !identifier["type"].isString() || !identifier["value"].isString()) {
            throw common::MalformedException("Identifiers must have a type and a value.");
        }
        if (identifier["type"].asString() != "dns") {
            throw common::UnsupportedIdentifierException(
                identifier["type"].asString() + ": Unsupported identifier type.");
        }

        std::string name = common::normalizeDnsName(identifier["value"].asString());
        if (name.compare(0, 2, "*.") == 0) {
            throw common::RejectedIdentifierException(name + ": Wildcard identifiers are not supported.");
        }
        if (!common::isValidDnsName(name)) {
            throw common::RejectedIdentifierException(name + ": Not a valid domain name.");
        }
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

OrderView OrderService::createOrder(const Account& account, const Json::Value& payload) {
    if (!payload.isObject()) {
        throw common::MalformedException("new-order requires a JSON payload.");
    }

    const std::time_t now = clock_();
    auto notBefore = parseTimestamp(payload, "notBefore");
    auto notAfter = parseTimestamp(payload, "notAfter");

    if (notBefore && *notBefore < now) {
        throw common::MalformedException("Certificate cannot be valid before now.");
    }
    if (notAfter && *notAfter > now + policy_.maxCertValiditySeconds) {
        throw common::MalformedException("Certificate cannot be valid that long.");
    }
    if (notBefore && notAfter && *notBefore > *notAfter) {
        throw common::MalformedException("notBefore must be before notAfter.");
    }

    auto names = parseIdentifiers(payload["identifiers"]);

    OrderView view;
    Order& order = view.order;
    order.id = common::generateUuid();
    order.accountId = account.id;
    order.identifiers = names;
    order.status = OrderStatus::PENDING;
    order.expiresAt = now + policy_.orderValiditySeconds;
    order.notBefore = notBefore;
    order.notAfter = notAfter;
    order.createdAt = now;

    std::vector<Challenge> challenges;
    for (const auto& name : names) {
        Authorization authz;
        authz.id = common::generateUuid();
        authz.orderId = order.id;
        authz.identifier = name;
        authz.status = AuthorizationStatus::PENDING;
        authz.expiresAt = order.expiresAt;
        view.authorizations.push_back(authz);

        for (auto type : {ChallengeType::HTTP_01, ChallengeType::DNS_01}) {
            Challenge challenge;
            challenge.id = common::generateUuid();
            challenge.authorizationId = authz.id;
            challenge.type = type;
            challenge.token = acme::crypto::randomBase64Url(kTokenBytes);
            challenge.status = ChallengeStatus::PENDING;
            challenges.push_back(challenge);
        }
    }

    orderRepository_->createWithAuthorizations(order, view.authorizations, challenges);
    spdlog::info("[OrderService] Order {} created for account {} ({} identifiers)",
        order.id, account.id, names.size());
    return view;
}

// =============================================================================
// Reads with lazy expiry
// =============================================================================

Order OrderService::requireOwnedOrder(const Account& account, const std::string& orderId) {
    auto order = orderRepository_->findById(orderId);
    if (!order || order->accountId != account.id) {
        throw common::UnauthorizedException("You are not authorized to access this resource.",
            "order " + orderId + " not owned by " + account.id);
    }
    return *order;
}

void OrderService::applyOrderExpiry(Order& order, std::vector<Authorization>& authorizations) {
    const std::time_t now = clock_();
    bool changed = false;

    for (auto& authz : authorizations) {
        if (authz.status == AuthorizationStatus::PENDING && authz.expiresAt <= now) {
            authorizationRepository_->transition(authz.id, AuthorizationStatus::PENDING, AuthorizationStatus::EXPIRED);
            changed = true;
        }
    }
    if (changed) {
        authorizations = authorizationRepository_->findByOrder(order.id);
    }

    bool orderChanged = false;
    if ((order.status == OrderStatus::PENDING || order.status == OrderStatus::READY) && order.expiresAt <= now) {
        orderChanged = orderRepository_->markInvalid(order.id, order.status,
            problemJson(common::ErrorCode::UNAUTHORIZED, "Order expired."));
    } else if (order.status == OrderStatus::PENDING || order.status == OrderStatus::READY) {
        for (const auto& authz : authorizations) {
            if (isTerminalFailure(authz.status)) {
                orderChanged = orderRepository_->markInvalid(order.id, order.status,
                    problemJson(common::ErrorCode::UNAUTHORIZED,
                        "Authorization for " + authz.identifier + " is " +
                        authorizationStatusToString(authz.status) + "."));
                break;
            }
        }
    }

    if (orderChanged || changed) {
        if (auto reloaded = orderRepository_->findById(order.id)) {
            order = *reloaded;
        }
    }
}

OrderView OrderService::getOrder(const Account& account, const std::string& orderId) {
    OrderView view;
    view.order = requireOwnedOrder(account, orderId);
    view.authorizations = authorizationRepository_->findByOrder(orderId);
    applyOrderExpiry(view.order, view.authorizations);
    return view;
}

std::vector<std::string> OrderService::listOrderIds(const Account& account) {
    return orderRepository_->findIdsByAccount(account.id);
}

AuthorizationView OrderService::getAuthorization(const Account& account, const std::string& authorizationId) {
    auto authz = authorizationRepository_->findById(authorizationId);
    if (!authz) {
        throw common::UnauthorizedException("You are not authorized to access this resource.",
            "authorization " + authorizationId + " not found");
    }
    Order order = requireOwnedOrder(account, authz->orderId);

    if (authz->status == AuthorizationStatus::PENDING && authz->expiresAt <= clock_()) {
        if (authorizationRepository_->transition(authz->id, AuthorizationStatus::PENDING,
                                                 AuthorizationStatus::EXPIRED)) {
            spdlog::info("[OrderService] Authorization {} expired", authz->id);
        }
        authz = authorizationRepository_->findById(authorizationId);
        if (!authz) {
            throw common::UnauthorizedException("You are not authorized to access this resource.");
        }
        if (isTerminalFailure(authz->status)) {
            onAuthorizationInvalid(order.id, problemJson(common::ErrorCode::UNAUTHORIZED,
                "Authorization for " + authz->identifier + " expired."));
        }
    }

    AuthorizationView view;
    view.authorization = *authz;
    auto challenges = challengeRepository_->findByAuthorization(authz->id);
    if (authz->status == AuthorizationStatus::VALID) {
        for (const auto& ch : challenges) {
            if (ch.status == ChallengeStatus::VALID) view.challenges.push_back(ch);
        }
    } else {
        view.challenges = std::move(challenges);
    }
    return view;
}

AuthorizationView OrderService::deactivateAuthorization(const Account& account, const std::string& authorizationId) {
    auto view = getAuthorization(account, authorizationId);
    auto current = view.authorization.status;
    if (current == AuthorizationStatus::PENDING || current == AuthorizationStatus::VALID) {
        if (authorizationRepository_->transition(authorizationId, current, AuthorizationStatus::DEACTIVATED)) {
            spdlog::info("[OrderService] Authorization {} deactivated", authorizationId);
            onAuthorizationInvalid(view.authorization.orderId, problemJson(common::ErrorCode::UNAUTHORIZED,
                "Authorization for " + view.authorization.identifier + " was deactivated."));
        }
        view = getAuthorization(account, authorizationId);
    }
    return view;
}

// =============================================================================
// Propagation
// =============================================================================

bool OrderService::onAuthorizationValid(const std::string& orderId) {
    return orderRepository_->markReadyIfAllAuthorizationsValid(orderId);
}

void OrderService::onAuthorizationInvalid(const std::string& orderId, const Json::Value& error) {
    // A ready order has not been finalized yet and loses its readiness too
    for (auto from : {OrderStatus::PENDING, OrderStatus::READY}) {
        if (orderRepository_->markInvalid(orderId, from, error)) {
            spdlog::info("[OrderService] Order {} invalid: {}", orderId, error.get("detail", "").asString());
            return;
        }
    }
}

} // namespace services
