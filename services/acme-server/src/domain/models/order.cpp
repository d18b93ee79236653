/**
 * @file order.cpp
 * @brief Order status conversions
 */

#include "order.h"
#include <stdexcept>

namespace domain {
namespace models {

std::string orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::READY: return "ready";
        case OrderStatus::PROCESSING: return "processing";
        case OrderStatus::VALID: return "valid";
        case OrderStatus::INVALID: return "invalid";
    }
    return "invalid";
}

OrderStatus orderStatusFromString(const std::string& status) {
    if (status == "pending") return OrderStatus::PENDING;
    if (status == "ready") return OrderStatus::READY;
    if (status == "processing") return OrderStatus::PROCESSING;
    if (status == "valid") return OrderStatus::VALID;
    if (status == "invalid") return OrderStatus::INVALID;
    throw std::invalid_argument("Unknown order status: " + status);
}

} // namespace models
} // namespace domain
