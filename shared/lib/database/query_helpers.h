#pragma once

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief Row value extraction for repository code
 *
 * Usage:
 *   auto rows = queryExecutor_->executeQuery(sql, params);
 *   order.expiresAt = common::db::getInt64(rows[0], "expires_at");
 */

namespace common::db {

// ============================================================================
// JSON Value Extraction
// ============================================================================

/**
 * @brief Extract a 64-bit integer column
 *
 * Accepts native integers as well as numeric strings (NUMERIC columns and
 * aggregates arrive as text).
 *
 * @return defaultValue if the field is missing, null or unparseable
 */
long long getInt64(const Json::Value& row, const std::string& field, long long defaultValue = 0);

/**
 * @brief Extract an int column (see getInt64)
 */
int getInt(const Json::Value& row, const std::string& field, int defaultValue = 0);

/**
 * @brief Extract a boolean column
 *
 * Handles native booleans and "t"/"true"/"1" strings.
 */
bool getBool(const Json::Value& row, const std::string& field, bool defaultValue = false);

/**
 * @brief Extract a text column, empty if missing or null
 */
std::string getString(const Json::Value& row, const std::string& field);

/**
 * @brief Convert a scalar result (executeScalar) to a 64-bit integer
 */
long long scalarToInt64(const Json::Value& value, long long defaultValue = 0);

/**
 * @brief Nullable integer column
 */
std::optional<long long> getOptionalInt64(const Json::Value& row, const std::string& field);

// ============================================================================
// Parameter Formatting
// ============================================================================

/**
 * @brief Format a boolean as a text parameter ("true"/"false")
 */
inline std::string boolParam(bool value) { return value ? "true" : "false"; }

/**
 * @brief Format a nullable integer; empty (sent as NULL) when absent
 */
template <typename T>
std::string optionalParam(const std::optional<T>& value) {
    return value ? std::to_string(*value) : std::string();
}

// ============================================================================
// JSON Text Columns
// ============================================================================

/**
 * @brief Compact JSON text for a TEXT column; empty (NULL) for a null value
 */
std::string toJsonText(const Json::Value& value);

/**
 * @brief Parse a JSON TEXT column
 * @return null value if the column is missing, empty or not valid JSON
 */
Json::Value parseJsonText(const Json::Value& row, const std::string& field);

/**
 * @brief JSON array text from a string list
 */
std::string stringListToJsonText(const std::vector<std::string>& values);

/**
 * @brief String list from a JSON array TEXT column
 */
std::vector<std::string> getStringList(const Json::Value& row, const std::string& field);

} // namespace common::db
