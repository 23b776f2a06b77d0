#ifndef HOSTWATCH_STORAGE_SQLITE_POOL_HPP
#define HOSTWATCH_STORAGE_SQLITE_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

struct sqlite3;

namespace hostwatch::storage {

/*
    fixed set of sqlite connections to one database file. a connection is borrowed by exactly
    one thread at a time, so connections are opened in no-mutex mode and sqlite's own locking
    (WAL journal + busy timeout) arbitrates between them.
*/
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool& pool, sqlite3* db) : pool_(&pool), db_(db) {}
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept : pool_(other.pool_), db_(other.db_) {
            other.db_ = nullptr;
        }
        Lease& operator=(Lease&&) = delete;

        [[nodiscard]] sqlite3* get() const noexcept {
            return db_;
        }

    private:
        ConnectionPool* pool_;
        sqlite3* db_;
    };

    ConnectionPool(const std::filesystem::path& path, std::size_t size);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // blocks until a connection is free
    [[nodiscard]] Lease acquire();

    [[nodiscard]] std::size_t capacity() const noexcept {
        return all_.size();
    }

private:
    void release(sqlite3* db);

    std::vector<sqlite3*> all_;
    std::vector<sqlite3*> idle_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace hostwatch::storage

#endif
