#include "hostwatch/storage/sqlite_store.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "hostwatch/storage/sqlite_pool.hpp"
#include "hostwatch/util/logger.hpp"

namespace hostwatch::storage {

namespace {

constexpr const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS timeseries ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " collector_id VARCHAR(255),"
    " received INTEGER,"
    " total_memory UNSIGNED BIG INT,"
    " used_memory UNSIGNED BIG INT,"
    " average_cpu FLOAT)";

constexpr const char* kInsert =
    "INSERT INTO timeseries (collector_id, received, total_memory, used_memory, average_cpu) "
    "VALUES (?, ?, ?, ?, ?)";

constexpr const char* kSelectAll =
    "SELECT id, collector_id, received, total_memory, used_memory, average_cpu "
    "FROM timeseries ORDER BY id";

constexpr const char* kSelectCollector =
    "SELECT id, collector_id, received, total_memory, used_memory, average_cpu "
    "FROM timeseries WHERE collector_id = ? ORDER BY received, id";

constexpr const char* kSelectCollectors =
    "SELECT collector_id, MAX(received) FROM timeseries GROUP BY collector_id "
    "ORDER BY collector_id";

constexpr const char* kCount = "SELECT COUNT(*) FROM timeseries";

// finalizes on scope exit, including when a bind or step throws
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error("failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }
    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }
    void bind_int64(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }
    void bind_double(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
    }

    // true while rows are available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw std::runtime_error("sqlite step failed: " + std::string(sqlite3_errmsg(db_)));
    }

    [[nodiscard]] int64_t column_int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }
    [[nodiscard]] double column_double(int col) const {
        return sqlite3_column_double(stmt_, col);
    }
    [[nodiscard]] std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error("sqlite bind failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

proto::CollectorId parse_stored_id(const std::string& text) {
    auto id = proto::CollectorId::parse(text);
    if (!id) {
        throw std::runtime_error("invalid collector id in database: " + text);
    }
    return *id;
}

MetricRecord read_record(const Statement& stmt) {
    MetricRecord record;
    record.id = stmt.column_int64(0);
    record.collector_id = parse_stored_id(stmt.column_text(1));
    record.received = stmt.column_int64(2);
    // sqlite integers are signed 64-bit; memory sizes round-trip through the same bits
    record.total_memory = static_cast<uint64_t>(stmt.column_int64(3));
    record.used_memory = static_cast<uint64_t>(stmt.column_int64(4));
    record.average_cpu = static_cast<float>(stmt.column_double(5));
    return record;
}

}  // namespace

class SqliteMetricsStore::Impl {
public:
    explicit Impl(const SqliteStoreOptions& options) : pool_(options.path, options.pool_size) {
        auto lease = pool_.acquire();
        char* err = nullptr;
        if (sqlite3_exec(lease.get(), kCreateTable, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw std::runtime_error("failed to create timeseries table: " + msg);
        }
        LOG_INFO("metrics database ready at " + options.path.string());
    }

    void insert(const MetricRecord& record) {
        auto lease = pool_.acquire();
        Statement stmt(lease.get(), kInsert);
        stmt.bind_text(1, record.collector_id.to_string());
        stmt.bind_int64(2, record.received);
        stmt.bind_int64(3, static_cast<int64_t>(record.total_memory));
        stmt.bind_int64(4, static_cast<int64_t>(record.used_memory));
        stmt.bind_double(5, record.average_cpu);
        stmt.step();
    }

    std::vector<MetricRecord> all() {
        auto lease = pool_.acquire();
        Statement stmt(lease.get(), kSelectAll);
        std::vector<MetricRecord> out;
        while (stmt.step()) {
            out.push_back(read_record(stmt));
        }
        return out;
    }

    std::vector<MetricRecord> for_collector(const proto::CollectorId& id) {
        auto lease = pool_.acquire();
        Statement stmt(lease.get(), kSelectCollector);
        stmt.bind_text(1, id.to_string());
        std::vector<MetricRecord> out;
        while (stmt.step()) {
            out.push_back(read_record(stmt));
        }
        return out;
    }

    std::vector<CollectorSummary> collectors() {
        auto lease = pool_.acquire();
        Statement stmt(lease.get(), kSelectCollectors);
        std::vector<CollectorSummary> out;
        while (stmt.step()) {
            out.push_back({parse_stored_id(stmt.column_text(0)), stmt.column_int64(1)});
        }
        return out;
    }

    std::size_t size() {
        auto lease = pool_.acquire();
        Statement stmt(lease.get(), kCount);
        stmt.step();
        return static_cast<std::size_t>(stmt.column_int64(0));
    }

private:
    ConnectionPool pool_;
};

SqliteMetricsStore::SqliteMetricsStore(const SqliteStoreOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}
SqliteMetricsStore::~SqliteMetricsStore() = default;

void SqliteMetricsStore::insert(const MetricRecord& record) {
    impl_->insert(record);
}
std::vector<MetricRecord> SqliteMetricsStore::all() {
    return impl_->all();
}
std::vector<MetricRecord> SqliteMetricsStore::for_collector(const proto::CollectorId& id) {
    return impl_->for_collector(id);
}
std::vector<CollectorSummary> SqliteMetricsStore::collectors() {
    return impl_->collectors();
}
std::size_t SqliteMetricsStore::size() {
    return impl_->size();
}

}  // namespace hostwatch::storage
