/**
 * @file account.cpp
 * @brief Account status conversions
 */

#include "account.h"
#include <stdexcept>

namespace domain {
namespace models {

std::string accountStatusToString(AccountStatus status) {
    switch (status) {
        case AccountStatus::VALID: return "valid";
        case AccountStatus::DEACTIVATED: return "deactivated";
        case AccountStatus::REVOKED: return "revoked";
    }
    return "valid";
}

AccountStatus accountStatusFromString(const std::string& status) {
    if (status == "valid") return AccountStatus::VALID;
    if (status == "deactivated") return AccountStatus::DEACTIVATED;
    if (status == "revoked") return AccountStatus::REVOKED;
    throw std::invalid_argument("Unknown account status: " + status);
}

} // namespace models
} // namespace domain
