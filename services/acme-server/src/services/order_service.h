/**
 * @file order_service.h
 * @brief Order and authorization state machine (RFC 8555 Section 7.4, 7.5)
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>
#include "../common/clock.h"
#include "../repositories/repository_interfaces.h"

namespace services {

/**
 * @brief Order with its authorizations, as rendered to clients
 */
struct OrderView {
    domain::models::Order order;
    std::vector<domain::models::Authorization> authorizations;
};

/**
 * @brief Authorization with its challenges
 */
struct AuthorizationView {
    domain::models::Authorization authorization;
    std::vector<domain::models::Challenge> challenges;
};

struct OrderPolicy {
    long orderValiditySeconds = 3600;
    long maxCertValiditySeconds = 90L * 86400;
};

/**
 * @brief Order Service
 *
 * Owns the order and authorization transitions that do not involve a
 * challenge probe or certificate signing:
 *   - creation with one http-01 and one dns-01 challenge per identifier
 *   - lazy expiry on read (order -> invalid, authorization -> expired)
 *   - propagation of an invalid authorization to its order
 *   - pending -> ready once every authorization is valid
 *
 * Resources of other accounts are reported as unauthorized, the same as
 * unknown ids.
 */
class OrderService {
public:
    /**
     * @throws std::invalid_argument if a repository is nullptr
     */
    OrderService(
        repositories::IOrderRepository* orderRepository,
        repositories::IAuthorizationRepository* authorizationRepository,
        repositories::IChallengeRepository* challengeRepository,
        OrderPolicy policy,
        common::Clock clock = common::systemClock());

    /**
     * @brief new-order
     *
     * @throws common::MalformedException no identifiers or bad validity window
     * @throws common::UnsupportedIdentifierException non-dns identifier
     * @throws common::RejectedIdentifierException invalid or wildcard name
     */
    OrderView createOrder(const domain::models::Account& account, const Json::Value& payload);

    /**
     * @brief Load an order owned by account, applying lazy expiry
     * @throws common::UnauthorizedException unknown or foreign order
     */
    OrderView getOrder(const domain::models::Account& account, const std::string& orderId);

    std::vector<std::string> listOrderIds(const domain::models::Account& account);

    /**
     * @brief Load an authorization owned by account, applying lazy expiry
     * @throws common::UnauthorizedException unknown or foreign authorization
     */
    AuthorizationView getAuthorization(const domain::models::Account& account, const std::string& authorizationId);

    /**
     * @brief Authorization deactivation by the client (RFC 8555 Section 7.5.2)
     */
    AuthorizationView deactivateAuthorization(const domain::models::Account& account, const std::string& authorizationId);

    /**
     * @brief Called when an authorization became valid
     * @return true if the order moved to ready
     */
    bool onAuthorizationValid(const std::string& orderId);

    /**
     * @brief Called when an authorization became invalid; invalidates the order
     */
    void onAuthorizationInvalid(const std::string& orderId, const Json::Value& error);

    /**
     * @brief Load the parent order of an authorization for ownership checks
     */
    domain::models::Order requireOwnedOrder(const domain::models::Account& account, const std::string& orderId);

private:
    repositories::IOrderRepository* orderRepository_;
    repositories::IAuthorizationRepository* authorizationRepository_;
    repositories::IChallengeRepository* challengeRepository_;
    OrderPolicy policy_;
    common::Clock clock_;

    std::vector<std::string> parseIdentifiers(const Json::Value& identifiers);
    void applyOrderExpiry(domain::models::Order& order, std::vector<domain::models::Authorization>& authorizations);
};

} // namespace services
