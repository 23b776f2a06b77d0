#ifndef HOSTWATCH_STORAGE_METRICS_STORE_HPP
#define HOSTWATCH_STORAGE_METRICS_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hostwatch/proto/collector_id.hpp"

namespace hostwatch::storage {

// one persisted SubmitData
struct MetricRecord {
    int64_t id = 0;  // assigned by the store
    proto::CollectorId collector_id;
    int64_t received = 0;  // unix seconds, taken from the frame timestamp
    uint64_t total_memory = 0;
    uint64_t used_memory = 0;
    float average_cpu = 0.0f;
};

struct CollectorSummary {
    proto::CollectorId collector_id;
    int64_t last_seen = 0;
};

/*
    implementations must be safe to call from every connection thread at once.
    write failures throw std::runtime_error.
*/
class IMetricsStore {
public:
    virtual ~IMetricsStore() = default;

    virtual void insert(const MetricRecord& record) = 0;

    [[nodiscard]] virtual std::vector<MetricRecord> all() = 0;
    // ordered by received
    [[nodiscard]] virtual std::vector<MetricRecord> for_collector(const proto::CollectorId& id) = 0;
    // one entry per collector with its most recent received time
    [[nodiscard]] virtual std::vector<CollectorSummary> collectors() = 0;
    [[nodiscard]] virtual std::size_t size() = 0;
};

}  // namespace hostwatch::storage

#endif
