#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"
#include <libpq-fe.h>

/**
 * @file postgresql_query_executor.h
 * @brief libpq implementation of IQueryExecutor
 */

namespace common {

/**
 * @brief PostgreSQL query executor
 *
 * Each call acquires a pooled connection for the duration of one statement.
 * runInTransaction() holds a single connection for the whole unit of work.
 */
class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    void runInTransaction(const std::function<void(IQueryExecutor&)>& work) override;

    std::string getDatabaseType() const override { return "postgres"; }

private:
    DbConnectionPool* pool_;
};

namespace pg {

/**
 * @brief Execute a parameterized statement on a connection
 * @return Result owned by the caller (PQclear)
 * @throws std::runtime_error when the statement fails
 */
PGresult* execParams(PGconn* conn, const std::string& query, const std::vector<std::string>& params);

/**
 * @brief Convert a result set to a JSON array of row objects
 *
 * Type mapping by OID:
 * - INT2, INT4, INT8 → JSON Int64
 * - FLOAT4, FLOAT8 → JSON double
 * - BOOL → JSON boolean
 * - NULL → JSON null
 * - others → JSON string
 */
Json::Value resultToJson(PGresult* res);

/**
 * @brief Single value of a one-row, one-column result
 * @throws std::runtime_error otherwise
 */
Json::Value resultToScalar(PGresult* res);

/**
 * @brief Affected row count (PQcmdTuples)
 */
int affectedRows(PGresult* res);

} // namespace pg

} // namespace common
