#include "postgresql_query_executor.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>

namespace common {

// ============================================================================
// libpq helpers
// ============================================================================

namespace pg {

namespace {

constexpr Oid kBoolOid = 16;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

Json::Value convertValue(PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) {
        return Json::nullValue;
    }

    const char* value = PQgetvalue(res, row, col);
    switch (PQftype(res, col)) {
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
            return Json::Value(static_cast<Json::Int64>(std::stoll(value)));
        case kFloat4Oid:
        case kFloat8Oid:
            return Json::Value(std::stod(value));
        case kBoolOid:
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

} // anonymous namespace

PGresult* execParams(PGconn* conn, const std::string& query, const std::vector<std::string>& params) {
    spdlog::debug("[PostgreSQLQueryExecutor] Query: {} (params: {})", query, params.size());

    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    PGresult* res = PQexecParams(
        conn,
        query.c_str(),
        static_cast<int>(params.size()),
        nullptr,                       // Parameter types (inferred)
        paramValues.data(),
        nullptr,                       // Text parameters
        nullptr,
        0                              // Text results
    );

    if (!res) {
        throw std::runtime_error("[PostgreSQLQueryExecutor] Query execution failed: null result");
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string error = PQerrorMessage(conn);
        PQclear(res);
        throw std::runtime_error("[PostgreSQLQueryExecutor] Query failed: " + error);
    }

    return res;
}

Json::Value resultToJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);
    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            row[PQfname(res, j)] = convertValue(res, i, j);
        }
        array.append(row);
    }
    return array;
}

Json::Value resultToScalar(PGresult* res) {
    if (PQntuples(res) == 0) {
        throw std::runtime_error("Scalar query returned no rows");
    }
    if (PQnfields(res) != 1) {
        throw std::runtime_error("Scalar query must return exactly one column");
    }
    return convertValue(res, 0, 0);
}

int affectedRows(PGresult* res) {
    const char* count = PQcmdTuples(res);
    if (!count || count[0] == '\0') {
        return 0;
    }
    return std::atoi(count);
}

} // namespace pg

namespace {

struct PgResultDeleter { void operator()(PGresult* r) const { PQclear(r); } };
using UniquePgResult = std::unique_ptr<PGresult, PgResultDeleter>;

/**
 * @brief Executor bound to one connection inside an open transaction
 */
class TransactionExecutor : public IQueryExecutor {
public:
    explicit TransactionExecutor(PGconn* conn) : conn_(conn) {}

    Json::Value executeQuery(const std::string& query, const std::vector<std::string>& params) override {
        UniquePgResult res(pg::execParams(conn_, query, params));
        return pg::resultToJson(res.get());
    }

    int executeCommand(const std::string& query, const std::vector<std::string>& params) override {
        UniquePgResult res(pg::execParams(conn_, query, params));
        return pg::affectedRows(res.get());
    }

    Json::Value executeScalar(const std::string& query, const std::vector<std::string>& params) override {
        UniquePgResult res(pg::execParams(conn_, query, params));
        return pg::resultToScalar(res.get());
    }

    void runInTransaction(const std::function<void(IQueryExecutor&)>& work) override {
        // Already inside a transaction; nested units join it
        work(*this);
    }

    std::string getDatabaseType() const override { return "postgres"; }

private:
    PGconn* conn_;
};

} // anonymous namespace

// ============================================================================
// PostgreSQLQueryExecutor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
}

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    UniquePgResult res(pg::execParams(conn.get(), query, params));
    return pg::resultToJson(res.get());
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    UniquePgResult res(pg::execParams(conn.get(), query, params));
    int rows = pg::affectedRows(res.get());
    spdlog::debug("[PostgreSQLQueryExecutor] Command executed, affected rows: {}", rows);
    return rows;
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    UniquePgResult res(pg::execParams(conn.get(), query, params));
    return pg::resultToScalar(res.get());
}

void PostgreSQLQueryExecutor::runInTransaction(const std::function<void(IQueryExecutor&)>& work) {
    auto conn = pool_->acquire();
    if (!conn.execute("BEGIN")) {
        throw std::runtime_error("[PostgreSQLQueryExecutor] BEGIN failed: " +
                                 std::string(PQerrorMessage(conn.get())));
    }

    TransactionExecutor tx(conn.get());
    try {
        work(tx);
    } catch (...) {
        if (!conn.execute("ROLLBACK")) {
            spdlog::error("[PostgreSQLQueryExecutor] ROLLBACK failed: {}", PQerrorMessage(conn.get()));
        }
        throw;
    }

    if (!conn.execute("COMMIT")) {
        throw std::runtime_error("[PostgreSQLQueryExecutor] COMMIT failed: " +
                                 std::string(PQerrorMessage(conn.get())));
    }
}

} // namespace common
