/**
 * @file db_connection_pool.h
 * @brief PostgreSQL connection pool for the ACME store
 *
 * Connections are opened lazily up to maxSize. Every connection carries a
 * server-side statement_timeout so no repository call can hang on a lock.
 */

#pragma once

#include <libpq-fe.h>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace common {

/**
 * @brief Connection and sizing settings
 */
struct DbPoolConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string dbName;
    std::string user;
    std::string password;
    std::string applicationName = "acme-server";

    size_t minSize = 2;
    size_t maxSize = 10;
    int acquireTimeoutSec = 5;
    int connectTimeoutSec = 5;
    int statementTimeoutMs = 10000;        // 0 leaves the server default
    int idleCheckAfterSec = 30;            // Idle connections older than this are pinged before reuse

    /**
     * @brief libpq keyword/value string with quoted values
     */
    std::string connectionString() const;
};

class DbConnectionPool;

/**
 * @brief Lease on a pooled connection, returned on destruction
 */
class DbConnection {
public:
    DbConnection(PGconn* conn, DbConnectionPool* pool) : conn_(conn), pool_(pool) {}
    ~DbConnection() { release(); }

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept : conn_(other.conn_), pool_(other.pool_) {
        other.conn_ = nullptr;
    }

    DbConnection& operator=(DbConnection&& other) noexcept {
        if (this != &other) {
            release();
            conn_ = other.conn_;
            pool_ = other.pool_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    PGconn* get() const { return conn_; }
    bool isValid() const { return conn_ != nullptr; }

    /**
     * @brief Run a parameterless statement (BEGIN, COMMIT, ROLLBACK)
     * @return true if the server accepted it
     */
    bool execute(const std::string& sql);

    /// @brief Hand the connection back before the lease goes out of scope
    void release();

private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning
};

/**
 * @brief Bounded PostgreSQL connection pool
 */
class DbConnectionPool {
public:
    struct Stats {
        size_t idle = 0;
        size_t open = 0;
        size_t maxSize = 0;
        size_t acquireTimeouts = 0;
    };

    /**
     * @throws std::invalid_argument if minSize > maxSize or maxSize is 0
     */
    explicit DbConnectionPool(DbPoolConfig config);
    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Open minSize connections
     * @return false if the database is unreachable
     */
    bool initialize();

    /**
     * @brief Lease a connection, waiting up to acquireTimeoutSec
     * @throws std::runtime_error on timeout, shutdown or connect failure
     */
    DbConnection acquire();

    Stats getStats() const;

    /** @brief Close idle connections; later acquires fail */
    void shutdown();

private:
    friend class DbConnection;
    using Clock = std::chrono::steady_clock;

    struct IdleConnection {
        PGconn* conn;
        Clock::time_point since;
    };

    DbPoolConfig config_;
    std::string connString_;

    std::vector<IdleConnection> idle_;     // LIFO: most recently used first
    size_t open_ = 0;
    size_t acquireTimeouts_ = 0;
    bool shutdown_ = false;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    PGconn* connect();
    static bool ping(PGconn* conn);
    void giveBack(PGconn* conn);
};

} // namespace common
