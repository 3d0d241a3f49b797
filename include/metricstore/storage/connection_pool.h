#ifndef METRICSTORE_STORAGE_CONNECTION_POOL_H_
#define METRICSTORE_STORAGE_CONNECTION_POOL_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "metricstore/core/config.h"
#include "metricstore/core/result.h"

struct sqlite3;

namespace metricstore {
namespace storage {

class ConnectionPool;

/**
 * @brief Connection borrowed from a pool, returned on destruction
 */
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool* pool, sqlite3* db) : pool_(pool), db_(db) {}
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    sqlite3* get() const { return db_; }
    explicit operator bool() const { return db_ != nullptr; }

    /**
     * @brief Return the connection to the pool before destruction
     */
    void release();

private:
    ConnectionPool* pool_ = nullptr;
    sqlite3* db_ = nullptr;
};

/**
 * @brief Fixed set of SQLite connections to one database file
 *
 * Every connection is opened with the same pragmas (journal mode, synchronous,
 * cache size, busy timeout). Readers and the single writer each borrow their
 * own connection for the duration of one logical operation.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const core::StorageConfig& config);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Open pool_size connections
     */
    core::Result<void> open();

    /**
     * @brief Borrow a connection, waiting at most timeout for one to become free
     */
    core::Result<PooledConnection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Close idle connections; borrowed ones are closed when returned
     */
    void close();

    size_t size() const;
    size_t available() const;
    std::string stats() const;

private:
    friend class PooledConnection;

    core::Result<sqlite3*> openConnection();
    void release(sqlite3* db);

    core::StorageConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable available_cond_;
    std::vector<sqlite3*> idle_;
    size_t open_count_ = 0;
    bool closed_ = true;

    std::atomic<uint64_t> total_acquired_{0};
    std::atomic<uint64_t> acquire_timeouts_{0};
};

} // namespace storage
} // namespace metricstore

#endif // METRICSTORE_STORAGE_CONNECTION_POOL_H_
