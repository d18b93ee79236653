/**
 * @file dns_name.h
 * @brief DNS identifier normalization and syntax checks
 */

#pragma once

#include <string>

namespace common {

/**
 * @brief Lower-case and strip one trailing dot
 */
std::string normalizeDnsName(const std::string& name);

/**
 * @brief Check a normalized name for LDH syntax
 *
 * At least two labels, each 1-63 characters of [a-z0-9-] not starting or
 * ending with '-', 253 characters total. The top-level label must not be
 * all digits, which rules out IPv4 literals.
 */
bool isValidDnsName(const std::string& name);

} // namespace common
