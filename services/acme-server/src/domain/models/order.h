/**
 * @file order.h
 * @brief ACME order domain model
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace domain {
namespace models {

/**
 * @brief Order status (RFC 8555 Section 7.1.6)
 *
 *   pending -> ready -> processing -> valid
 *      |         |          |
 *      +---------+----------+-----> invalid
 */
enum class OrderStatus {
    PENDING,
    READY,
    PROCESSING,
    VALID,
    INVALID
};

std::string orderStatusToString(OrderStatus status);

/**
 * @throws std::invalid_argument for an unknown status string
 */
OrderStatus orderStatusFromString(const std::string& status);

/**
 * @brief Certificate order
 *
 * Identifiers are DNS names, lower-cased and de-duplicated at creation.
 */
struct Order {
    std::string id;
    std::string accountId;
    std::vector<std::string> identifiers;
    OrderStatus status = OrderStatus::PENDING;
    std::time_t expiresAt = 0;
    std::optional<std::time_t> notBefore;
    std::optional<std::time_t> notAfter;
    std::string certificateSerial;    // Empty until issued
    Json::Value error;                // Problem document, null when none
    std::time_t createdAt = 0;

    bool hasCertificate() const { return !certificateSerial.empty(); }
};

} // namespace models
} // namespace domain
