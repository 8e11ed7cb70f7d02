#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <libpq-fe.h>

#include "skopje/config.hpp"

namespace skopje::db {

// libpq connection parameters (host, port, dbname, user, password, connect_timeout)
using ConnectionConfig = skopje::DatabaseConfig;

// RAII wrapper for PGconn. Throws StoreError when the connection cannot be established.
class Connection {
public:
    explicit Connection(const std::string& conninfo);
    explicit Connection(const ConnectionConfig& config);
    ~Connection();

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    // Usable for another borrower: connected and not inside a transaction or COPY.
    bool idle() const {
        return ok() && PQtransactionStatus(conn_) == PQTRANS_IDLE;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

/**
 * Thread-safe connection pool.
 *
 * Connections are created lazily up to max_size; acquire() blocks while all of
 * them are borrowed. Connections that come back broken are discarded rather
 * than pooled, which frees a slot for a fresh one.
 *
 * Usage:
 *   ConnectionPool pool(config, 4);
 *   {
 *       auto conn = pool.acquire();
 *       exec(conn.get(), "SELECT ...");
 *   }  // returned to the pool here
 */
class ConnectionPool {
public:
    /**
     * RAII handle for a borrowed connection.
     */
    class Handle {
    public:
        Handle() : pool_(nullptr) {}
        Handle(ConnectionPool* pool, std::unique_ptr<Connection> conn)
            : pool_(pool), conn_(std::move(conn)) {}

        ~Handle() {
            if (pool_ && conn_) {
                pool_->release(std::move(conn_));
            }
        }

        // Move only
        Handle(Handle&& other) noexcept
            : pool_(other.pool_), conn_(std::move(other.conn_)) {
            other.pool_ = nullptr;
        }

        Handle& operator=(Handle&& other) noexcept {
            if (this != &other) {
                if (pool_ && conn_) pool_->release(std::move(conn_));
                pool_ = other.pool_;
                conn_ = std::move(other.conn_);
                other.pool_ = nullptr;
            }
            return *this;
        }

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        PGconn* get() const { return conn_ ? conn_->get() : nullptr; }
        operator PGconn*() const { return get(); }
        Connection& connection() const { return *conn_; }
        bool ok() const { return conn_ && conn_->ok(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<Connection> conn_;
    };

    ConnectionPool(const ConnectionConfig& config, size_t max_size);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * Borrow a connection, blocking until one is free.
     * Throws StoreError when a new connection cannot be established.
     */
    Handle acquire();

    // Idle connections currently held by the pool.
    size_t available() const;

    // Connections alive (idle or borrowed).
    size_t open_connections() const { return open_.load(); }

    size_t max_size() const { return max_size_; }

private:
    void release(std::unique_ptr<Connection> conn);

    const std::string conninfo_;
    const size_t max_size_;
    std::queue<std::unique_ptr<Connection>> idle_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<size_t> open_{0};
};

} // namespace skopje::db
