#ifndef HOSTWATCH_STORAGE_SQLITE_STORE_HPP
#define HOSTWATCH_STORAGE_SQLITE_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <memory>

#include "hostwatch/storage/metrics_store.hpp"

namespace hostwatch::storage {

struct SqliteStoreOptions {
    std::filesystem::path path = "./data/telemetry.db";
    std::size_t pool_size = 4;
};

class SqliteMetricsStore : public IMetricsStore {
public:
    // opens the pool and creates the timeseries table if missing
    explicit SqliteMetricsStore(const SqliteStoreOptions& options);
    ~SqliteMetricsStore() override;

    SqliteMetricsStore(const SqliteMetricsStore&) = delete;
    SqliteMetricsStore& operator=(const SqliteMetricsStore&) = delete;

    void insert(const MetricRecord& record) override;

    [[nodiscard]] std::vector<MetricRecord> all() override;
    [[nodiscard]] std::vector<MetricRecord> for_collector(const proto::CollectorId& id) override;
    [[nodiscard]] std::vector<CollectorSummary> collectors() override;
    [[nodiscard]] std::size_t size() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace hostwatch::storage

#endif
