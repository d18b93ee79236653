#pragma once

#include <functional>
#include <string>
#include <vector>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query executor interface used by all PostgreSQL repositories
 *
 * Repositories never touch libpq directly; they go through this interface and
 * receive rows as JSON objects. Tests substitute a mock executor.
 */

namespace common {

/**
 * @brief Query executor interface
 *
 * Parameters are bound positionally ($1, $2, ...). An empty string parameter
 * is sent as SQL NULL.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a query and return all rows
     *
     * @return JSON array; each row is an object keyed by column name.
     *         INT2/INT4/INT8 columns become JSON integers (64-bit),
     *         BOOL becomes a JSON boolean, NULL becomes null,
     *         everything else is a string.
     *
     * Example:
     * [
     *   {"id": "3f1c...", "status": "pending", "expires_at": 1760000000}
     * ]
     *
     * @throws std::runtime_error on execution failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE
     * @return Number of affected rows
     * @throws std::runtime_error on execution failure
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;

    /**
     * @brief Execute a query returning a single value
     * @throws std::runtime_error if no row or more than one column is returned
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Run several statements atomically
     *
     * The executor passed to work is bound to one connection inside
     * BEGIN/COMMIT. If work throws, the transaction is rolled back and the
     * exception propagates.
     */
    virtual void runInTransaction(const std::function<void(IQueryExecutor&)>& work) = 0;

    /**
     * @brief Database type (for diagnostics)
     */
    virtual std::string getDatabaseType() const = 0;
};

} // namespace common
