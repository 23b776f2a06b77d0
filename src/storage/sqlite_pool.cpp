#include "hostwatch/storage/sqlite_pool.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "hostwatch/util/logger.hpp"

namespace hostwatch::storage {

namespace {

constexpr int kBusyTimeoutMs = 5000;

sqlite3* open_connection(const std::filesystem::path& path) {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        // sqlite hands back a handle even on failure so the message can be read
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        throw std::runtime_error("failed to open database " + path.string() + ": " + msg);
    }
    sqlite3_busy_timeout(db, kBusyTimeoutMs);
    return db;
}

}  // namespace

ConnectionPool::Lease::~Lease() {
    if (db_ != nullptr) {
        pool_->release(db_);
    }
}

ConnectionPool::ConnectionPool(const std::filesystem::path& path, std::size_t size) {
    if (size == 0) {
        size = 1;
    }
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    try {
        for (std::size_t i = 0; i < size; ++i) {
            all_.push_back(open_connection(path));
        }
    } catch (...) {
        for (sqlite3* db : all_) {
            sqlite3_close(db);
        }
        throw;
    }

    // WAL lets readers and the writer proceed concurrently; the setting is persistent per file
    char* err = nullptr;
    if (sqlite3_exec(all_.front(), "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) !=
        SQLITE_OK) {
        LOG_WARN("could not enable WAL journal: " + std::string(err ? err : "unknown error"));
        sqlite3_free(err);
    }

    idle_ = all_;
    LOG_DEBUG("opened " + std::to_string(size) + " database connections to " + path.string());
}

ConnectionPool::~ConnectionPool() {
    for (sqlite3* db : all_) {
        sqlite3_close(db);
    }
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !idle_.empty(); });
    sqlite3* db = idle_.back();
    idle_.pop_back();
    return Lease(*this, db);
}

void ConnectionPool::release(sqlite3* db) {
    {
        std::lock_guard lock(mutex_);
        idle_.push_back(db);
    }
    cv_.notify_one();
}

}  // namespace hostwatch::storage
