#include "metricstore/storage/connection_pool.h"
#include "metricstore/common/logger.h"

#include <sqlite3.h>
#include <sstream>

namespace metricstore {
namespace storage {

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), db_(other.db_) {
    other.pool_ = nullptr;
    other.db_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        db_ = other.db_;
        other.pool_ = nullptr;
        other.db_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() {
    if (pool_ && db_) {
        pool_->release(db_);
    }
    pool_ = nullptr;
    db_ = nullptr;
}

ConnectionPool::ConnectionPool(const core::StorageConfig& config) : config_(config) {}

ConnectionPool::~ConnectionPool() {
    close();
}

core::Result<void> ConnectionPool::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        return core::Result<void>();
    }

    std::vector<sqlite3*> opened;
    for (size_t i = 0; i < config_.pool_size; ++i) {
        auto db = openConnection();
        if (!db.ok()) {
            for (auto* conn : opened) {
                sqlite3_close(conn);
            }
            return core::PropagateError<void>(db);
        }
        opened.push_back(db.value());
    }

    idle_ = std::move(opened);
    open_count_ = idle_.size();
    closed_ = false;
    METRICSTORE_DEBUG("Opened {} connections to {}", open_count_, config_.db_path);
    return core::Result<void>();
}

core::Result<sqlite3*> ConnectionPool::openConnection() {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(config_.db_path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close(db);
        }
        METRICSTORE_ERROR("Failed to open metrics database {}: {}", config_.db_path, message);
        return core::Result<sqlite3*>::error("Failed to open metrics database: " + message,
                                             core::Error::Code::STORAGE_UNAVAILABLE);
    }

    sqlite3_busy_timeout(db, static_cast<int>(config_.busy_timeout.count()));

    std::string pragmas;
    if (config_.wal_mode) {
        pragmas += "PRAGMA journal_mode=WAL;";
    }
    pragmas += "PRAGMA synchronous=NORMAL;";
    pragmas += "PRAGMA cache_size=-" + std::to_string(config_.cache_size_kib) + ";";
    pragmas += "PRAGMA foreign_keys=ON;";

    char* err = nullptr;
    rc = sqlite3_exec(db, pragmas.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        sqlite3_close(db);
        return core::Result<sqlite3*>::error("Failed to configure connection: " + message,
                                             core::Error::Code::STORAGE_UNAVAILABLE);
    }
    return core::Result<sqlite3*>(db);
}

core::Result<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return core::Result<PooledConnection>::error("Connection pool is closed",
                                                     core::Error::Code::STORAGE_UNAVAILABLE);
    }

    bool ready = available_cond_.wait_for(lock, timeout, [this] { return closed_ || !idle_.empty(); });
    if (closed_) {
        return core::Result<PooledConnection>::error("Connection pool is closed",
                                                     core::Error::Code::STORAGE_UNAVAILABLE);
    }
    if (!ready) {
        acquire_timeouts_.fetch_add(1);
        return core::Result<PooledConnection>::error(
            "Timed out after " + std::to_string(timeout.count()) + " ms waiting for a database connection",
            core::Error::Code::TIMEOUT);
    }

    sqlite3* db = idle_.back();
    idle_.pop_back();
    total_acquired_.fetch_add(1);
    return core::Result<PooledConnection>(PooledConnection(this, db));
}

void ConnectionPool::release(sqlite3* db) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            sqlite3_close(db);
            --open_count_;
            return;
        }
        idle_.push_back(db);
    }
    available_cond_.notify_one();
}

void ConnectionPool::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        for (auto* db : idle_) {
            int rc = sqlite3_close(db);
            if (rc != SQLITE_OK) {
                METRICSTORE_WARN("Closing database connection returned {}", sqlite3_errstr(rc));
            }
            --open_count_;
        }
        idle_.clear();
    }
    available_cond_.notify_all();
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_count_;
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::string ConnectionPool::stats() const {
    std::ostringstream ss;
    std::lock_guard<std::mutex> lock(mutex_);
    ss << "ConnectionPool Stats:\n"
       << "  Open connections: " << open_count_ << "\n"
       << "  Idle connections: " << idle_.size() << "\n"
       << "  Total acquired: " << total_acquired_.load() << "\n"
       << "  Acquire timeouts: " << acquire_timeouts_.load() << "\n";
    return ss.str();
}

} // namespace storage
} // namespace metricstore
