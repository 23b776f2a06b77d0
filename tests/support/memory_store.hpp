#ifndef HOSTWATCH_TESTS_SUPPORT_MEMORY_STORE_HPP
#define HOSTWATCH_TESTS_SUPPORT_MEMORY_STORE_HPP

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "hostwatch/storage/metrics_store.hpp"

namespace hostwatch::test {

// in-process IMetricsStore for handler tests; fail_inserts makes insert() throw
class MemoryMetricsStore : public storage::IMetricsStore {
public:
    void insert(const storage::MetricRecord& record) override {
        if (fail_inserts) {
            throw std::runtime_error("database is locked");
        }
        std::lock_guard lock(mutex_);
        storage::MetricRecord copy = record;
        copy.id = static_cast<int64_t>(rows_.size()) + 1;
        rows_.push_back(copy);
    }

    std::vector<storage::MetricRecord> all() override {
        std::lock_guard lock(mutex_);
        return rows_;
    }

    std::vector<storage::MetricRecord> for_collector(const proto::CollectorId& id) override {
        std::lock_guard lock(mutex_);
        std::vector<storage::MetricRecord> out;
        for (const auto& r : rows_) {
            if (r.collector_id == id) {
                out.push_back(r);
            }
        }
        std::stable_sort(out.begin(), out.end(),
                         [](const auto& a, const auto& b) { return a.received < b.received; });
        return out;
    }

    std::vector<storage::CollectorSummary> collectors() override {
        std::lock_guard lock(mutex_);
        std::map<std::string, storage::CollectorSummary> latest;
        for (const auto& r : rows_) {
            auto& entry = latest[r.collector_id.to_string()];
            entry.collector_id = r.collector_id;
            entry.last_seen = std::max(entry.last_seen, r.received);
        }
        std::vector<storage::CollectorSummary> out;
        for (const auto& [key, summary] : latest) {
            out.push_back(summary);
        }
        return out;
    }

    std::size_t size() override {
        std::lock_guard lock(mutex_);
        return rows_.size();
    }

    std::atomic<bool> fail_inserts{false};

private:
    std::mutex mutex_;
    std::vector<storage::MetricRecord> rows_;
};

}  // namespace hostwatch::test

#endif
