/**
 * @file authorization.h
 * @brief ACME authorization and challenge domain models
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <json/json.h>

namespace domain {
namespace models {

enum class AuthorizationStatus {
    PENDING,
    VALID,
    INVALID,
    DEACTIVATED,
    EXPIRED,
    REVOKED
};

std::string authorizationStatusToString(AuthorizationStatus status);
AuthorizationStatus authorizationStatusFromString(const std::string& status);

/**
 * @brief Authorization of one identifier within one order
 */
struct Authorization {
    std::string id;
    std::string orderId;
    std::string identifier;           // DNS name
    AuthorizationStatus status = AuthorizationStatus::PENDING;
    std::time_t expiresAt = 0;
};

enum class ChallengeType {
    HTTP_01,
    DNS_01
};

std::string challengeTypeToString(ChallengeType type);
ChallengeType challengeTypeFromString(const std::string& type);

enum class ChallengeStatus {
    PENDING,
    PROCESSING,
    VALID,
    INVALID
};

std::string challengeStatusToString(ChallengeStatus status);
ChallengeStatus challengeStatusFromString(const std::string& status);

/**
 * @brief Challenge offered for an authorization
 *
 * The challenge the client triggers first moves to processing; that makes it
 * the selected challenge of its authorization.
 */
struct Challenge {
    std::string id;
    std::string authorizationId;
    ChallengeType type = ChallengeType::HTTP_01;
    std::string token;
    ChallengeStatus status = ChallengeStatus::PENDING;
    std::optional<std::time_t> validatedAt;
    int attempts = 0;
    Json::Value error;                // Problem document, null when none
};

} // namespace models
} // namespace domain
