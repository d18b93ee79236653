/**
 * @file authorization.cpp
 * @brief Authorization and challenge enum conversions
 */

#include "authorization.h"
#include <stdexcept>

namespace domain {
namespace models {

std::string authorizationStatusToString(AuthorizationStatus status) {
    switch (status) {
        case AuthorizationStatus::PENDING: return "pending";
        case AuthorizationStatus::VALID: return "valid";
        case AuthorizationStatus::INVALID: return "invalid";
        case AuthorizationStatus::DEACTIVATED: return "deactivated";
        case AuthorizationStatus::EXPIRED: return "expired";
        case AuthorizationStatus::REVOKED: return "revoked";
    }
    return "invalid";
}

AuthorizationStatus authorizationStatusFromString(const std::string& status) {
    if (status == "pending") return AuthorizationStatus::PENDING;
    if (status == "valid") return AuthorizationStatus::VALID;
    if (status == "invalid") return AuthorizationStatus::INVALID;
    if (status == "deactivated") return AuthorizationStatus::DEACTIVATED;
    if (status == "expired") return AuthorizationStatus::EXPIRED;
    if (status == "revoked") return AuthorizationStatus::REVOKED;
    throw std::invalid_argument("Unknown authorization status: " + status);
}

std::string challengeTypeToString(ChallengeType type) {
    switch (type) {
        case ChallengeType::HTTP_01: return "http-01";
        case ChallengeType::DNS_01: return "dns-01";
    }
    return "http-01";
}

ChallengeType challengeTypeFromString(const std::string& type) {
    if (type == "http-01") return ChallengeType::HTTP_01;
    if (type == "dns-01") return ChallengeType::DNS_01;
    throw std::invalid_argument("Unknown challenge type: " + type);
}

std::string challengeStatusToString(ChallengeStatus status) {
    switch (status) {
        case ChallengeStatus::PENDING: return "pending";
        case ChallengeStatus::PROCESSING: return "processing";
        case ChallengeStatus::VALID: return "valid";
        case ChallengeStatus::INVALID: return "invalid";
    }
    return "invalid";
}

ChallengeStatus challengeStatusFromString(const std::string& status) {
    if (status == "pending") return ChallengeStatus::PENDING;
    if (status == "processing") return ChallengeStatus::PROCESSING;
    if (status == "valid") return ChallengeStatus::VALID;
    if (status == "invalid") return ChallengeStatus::INVALID;
    throw std::invalid_argument("Unknown challenge status: " + status);
}

} // namespace models
} // namespace domain
