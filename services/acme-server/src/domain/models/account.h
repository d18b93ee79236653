/**
 * @file account.h
 * @brief ACME account domain model
 */

#pragma once

#include <ctime>
#include <string>
#include <vector>
#include <json/json.h>

namespace domain {
namespace models {

/**
 * @brief Account status (RFC 8555 Section 7.1.6)
 *
 * Transitions only move forward: valid -> deactivated | revoked.
 */
enum class AccountStatus {
    VALID,
    DEACTIVATED,
    REVOKED
};

std::string accountStatusToString(AccountStatus status);

/**
 * @throws std::invalid_argument for an unknown status string
 */
AccountStatus accountStatusFromString(const std::string& status);

/**
 * @brief ACME account
 *
 * Identified by the thumbprint of its key; the thumbprint only changes
 * through key rollover.
 */
struct Account {
    std::string id;
    Json::Value jwk;                  // Public key as submitted (JWK object)
    std::string thumbprint;           // RFC 7638, base64url
    AccountStatus status = AccountStatus::VALID;
    std::vector<std::string> contacts;
    bool termsOfServiceAgreed = false;
    std::time_t createdAt = 0;

    bool isValid() const { return status == AccountStatus::VALID; }
};

} // namespace models
} // namespace domain
