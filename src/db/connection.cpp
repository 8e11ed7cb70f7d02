#include "skopje/db/connection.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

namespace skopje::db {

namespace {

std::string trim_message(const char* msg) {
    std::string s = msg ? msg : "";
    while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

} // namespace

Connection::Connection(const std::string& conninfo)
    : conn_(PQconnectdb(conninfo.c_str())) {
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string message = trim_message(conn_ ? PQerrorMessage(conn_) : "out of memory");
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        throw StoreError("Failed to connect: " + message, "", "", ErrorCode::CONNECTION_FAILED);
    }
}

Connection::Connection(const ConnectionConfig& config)
    : Connection(config.to_conninfo()) {}

Connection::~Connection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

ConnectionPool::ConnectionPool(const ConnectionConfig& config, size_t max_size)
    : conninfo_(config.to_conninfo()), max_size_(max_size) {
    SKOPJE_CHECK_ARGUMENT(max_size_ > 0, "connection pool size must be greater than zero");
}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!idle_.empty()) {
        idle_.pop();
    }
}

ConnectionPool::Handle ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait for an idle connection or a free slot
    cv_.wait(lock, [this] { return !idle_.empty() || open_.load() < max_size_; });

    if (!idle_.empty()) {
        auto conn = std::move(idle_.front());
        idle_.pop();
        return Handle(this, std::move(conn));
    }

    open_.fetch_add(1);
    lock.unlock();

    try {
        auto conn = std::make_unique<Connection>(conninfo_);
        LOG_DEBUG("Opened database connection " + std::to_string(open_.load()) + "/" +
                  std::to_string(max_size_));
        return Handle(this, std::move(conn));
    } catch (const StoreError& e) {
        {
            std::lock_guard<std::mutex> relock(mutex_);
            open_.fetch_sub(1);
        }
        cv_.notify_one();
        LOG_ERROR(e.message());
        throw;
    }
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
    if (!conn->idle()) {
        // Broken or left mid-transaction: don't reuse
        LOG_WARNING("Discarding database connection: " + trim_message(conn->error()));
        conn.reset();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_.fetch_sub(1);
        }
        cv_.notify_one();
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push(std::move(conn));
    cv_.notify_one();
}

} // namespace skopje::db
