/**
 * @file db_connection_pool.cpp
 * @brief PostgreSQL connection pool implementation
 */

#include "db_connection_pool.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

namespace {

// conninfo values are single-quoted with \ and ' escaped
std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

void clearResult(PGresult* res) {
    if (res) PQclear(res);
}

} // anonymous namespace

std::string DbPoolConfig::connectionString() const {
    std::string conn = "host=" + quoteConnValue(host) +
                       " port=" + std::to_string(port) +
                       " dbname=" + quoteConnValue(dbName) +
                       " user=" + quoteConnValue(user) +
                       " application_name=" + quoteConnValue(applicationName) +
                       " connect_timeout=" + std::to_string(connectTimeoutSec);
    if (!password.empty()) {
        conn += " password=" + quoteConnValue(password);
    }
    if (statementTimeoutMs > 0) {
        conn += " options=" + quoteConnValue("-c statement_timeout=" + std::to_string(statementTimeoutMs));
    }
    return conn;
}

// =============================================================================
// DbConnection
// =============================================================================

bool DbConnection::execute(const std::string& sql) {
    if (!conn_) {
        return false;
    }
    PGresult* res = PQexec(conn_, sql.c_str());
    ExecStatusType status = res ? PQresultStatus(res) : PGRES_FATAL_ERROR;
    clearResult(res);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

void DbConnection::release() {
    if (!conn_) {
        return;
    }
    if (pool_) {
        pool_->giveBack(conn_);
    } else {
        PQfinish(conn_);
    }
    conn_ = nullptr;
}

// =============================================================================
// DbConnectionPool
// =============================================================================

DbConnectionPool::DbConnectionPool(DbPoolConfig config)
    : config_(std::move(config))
    , connString_(config_.connectionString())
{
    if (config_.maxSize == 0 || config_.minSize > config_.maxSize) {
        throw std::invalid_argument("DbConnectionPool: require 0 < minSize <= maxSize");
    }
    spdlog::info("[DbConnectionPool] {}:{}/{} pool {}..{}, acquire timeout {}s, statement timeout {}ms",
                 config_.host, config_.port, config_.dbName, config_.minSize, config_.maxSize,
                 config_.acquireTimeoutSec, config_.statementTimeoutMs);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (open_ < config_.minSize) {
        PGconn* conn = connect();
        if (!conn) {
            return false;
        }
        idle_.push_back({conn, Clock::now()});
        ++open_;
    }
    spdlog::info("[DbConnectionPool] {} connections open", open_);
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = Clock::now() + std::chrono::seconds(config_.acquireTimeoutSec);
    const auto staleAfter = std::chrono::seconds(config_.idleCheckAfterSec);

    for (;;) {
        if (shutdown_) {
            throw std::runtime_error("Connection pool is shut down");
        }

        if (!idle_.empty()) {
            IdleConnection candidate = idle_.back();
            idle_.pop_back();
            bool stale = Clock::now() - candidate.since > staleAfter;
            if (PQstatus(candidate.conn) == CONNECTION_OK && (!stale || ping(candidate.conn))) {
                return DbConnection(candidate.conn, this);
            }
            spdlog::warn("[DbConnectionPool] Dropping dead connection");
            PQfinish(candidate.conn);
            --open_;
            continue;
        }

        if (open_ < config_.maxSize) {
            ++open_;               // Slot reserved while connecting unlocked
            lock.unlock();
            PGconn* conn = connect();
            lock.lock();
            if (conn) {
                return DbConnection(conn, this);
            }
            --open_;
            cv_.notify_one();
            throw std::runtime_error("Failed to create database connection");
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty()) {
            ++acquireTimeouts_;
            spdlog::warn("[DbConnectionPool] No connection within {}s ({} open)", config_.acquireTimeoutSec, open_);
            throw std::runtime_error("Timeout acquiring database connection");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.idle = idle_.size();
    stats.open = open_;
    stats.maxSize = config_.maxSize;
    stats.acquireTimeouts = acquireTimeouts_;
    return stats;
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    for (auto& entry : idle_) {
        PQfinish(entry.conn);
        --open_;
    }
    idle_.clear();
    cv_.notify_all();
    spdlog::info("[DbConnectionPool] Closed ({} connections still leased)", open_);
}

PGconn* DbConnectionPool::connect() {
    PGconn* conn = PQconnectdb(connString_.c_str());
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("[DbConnectionPool] Connect to {}:{} failed: {}", config_.host, config_.port, PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }
    return conn;
}

bool DbConnectionPool::ping(PGconn* conn) {
    PGresult* res = PQexec(conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    clearResult(res);
    return ok;
}

void DbConnectionPool::giveBack(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool reusable = !shutdown_ && PQstatus(conn) == CONNECTION_OK;
    if (reusable && PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::warn("[DbConnectionPool] Connection returned inside a transaction, rolling back");
        PGresult* res = PQexec(conn, "ROLLBACK");
        reusable = res && PQresultStatus(res) == PGRES_COMMAND_OK;
        clearResult(res);
    }

    if (reusable) {
        idle_.push_back({conn, Clock::now()});
    } else {
        PQfinish(conn);
        --open_;
    }
    cv_.notify_one();
}

} // namespace common
