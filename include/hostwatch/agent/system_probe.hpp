#ifndef HOSTWATCH_AGENT_SYSTEM_PROBE_HPP
#define HOSTWATCH_AGENT_SYSTEM_PROBE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

namespace hostwatch::agent {

struct MemorySnapshot {
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
};

// source of host readings; swapped for a fake in tests
class ISystemProbe {
public:
    virtual ~ISystemProbe() = default;

    [[nodiscard]] virtual std::optional<MemorySnapshot> memory() = 0;

    // busy percentage (0-100) per core since the previous call. empty if unavailable
    [[nodiscard]] virtual std::vector<float> cpu_usage() = 0;
};

/*
    linux /proc reader.
    memory: MemTotal and MemAvailable from meminfo, used = total - available.
    cpu: the per-core "cpuN" lines of stat. busy = 1 - (idle + iowait) / all, over the interval
    since the last call. the very first call measures since boot.
*/
class ProcSystemProbe : public ISystemProbe {
public:
    explicit ProcSystemProbe(std::filesystem::path proc_root = "/proc")
        : proc_root_(std::move(proc_root)) {}

    [[nodiscard]] std::optional<MemorySnapshot> memory() override;
    [[nodiscard]] std::vector<float> cpu_usage() override;

private:
    struct CpuTimes {
        uint64_t idle = 0;
        uint64_t total = 0;
    };

    std::filesystem::path proc_root_;
    std::vector<CpuTimes> previous_;
};

}  // namespace hostwatch::agent

#endif
