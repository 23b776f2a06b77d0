#include "hostwatch/agent/system_probe.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace hostwatch::agent {

namespace {

// "cpu0 user nice system idle iowait irq softirq steal guest guest_nice"
bool parse_cpu_line(const std::string& line, uint64_t& idle, uint64_t& total) {
    std::istringstream iss(line);
    std::string label;
    iss >> label;

    uint64_t user = 0, nice = 0, system = 0, idle_val = 0, iowait = 0;
    uint64_t irq = 0, softirq = 0, steal = 0;
    if (!(iss >> user >> nice >> system >> idle_val)) {
        return false;
    }
    // older kernels stop after idle; missing fields stay 0
    iss >> iowait >> irq >> softirq >> steal;

    // guest time is already counted in user/nice
    idle = idle_val + iowait;
    total = user + nice + system + idle_val + iowait + irq + softirq + steal;
    return true;
}

}  // namespace

std::optional<MemorySnapshot> ProcSystemProbe::memory() {
    std::ifstream mem_file(proc_root_ / "meminfo");
    if (!mem_file.is_open()) {
        return std::nullopt;
    }

    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    bool have_total = false;
    bool have_available = false;

    std::string line;
    while (std::getline(mem_file, line)) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }
        if (key == "MemTotal:") {
            total_kb = value;
            have_total = true;
        } else if (key == "MemAvailable:") {
            available_kb = value;
            have_available = true;
        }
        if (have_total && have_available) {
            break;
        }
    }

    if (!have_total || !have_available) {
        return std::nullopt;
    }

    MemorySnapshot snapshot;
    snapshot.total_bytes = total_kb * 1024;
    snapshot.used_bytes = total_kb > available_kb ? (total_kb - available_kb) * 1024 : 0;
    return snapshot;
}

std::vector<float> ProcSystemProbe::cpu_usage() {
    std::ifstream stat_file(proc_root_ / "stat");
    if (!stat_file.is_open()) {
        return {};
    }

    std::vector<CpuTimes> current;
    std::string line;
    while (std::getline(stat_file, line)) {
        // per-core lines only: "cpu0", "cpu1"... not the aggregate "cpu " line
        if (line.size() < 4 || line.compare(0, 3, "cpu") != 0 ||
            !std::isdigit(static_cast<unsigned char>(line[3]))) {
            continue;
        }
        CpuTimes times;
        if (parse_cpu_line(line, times.idle, times.total)) {
            current.push_back(times);
        }
    }

    // core count changed (hotplug) or first call: measure against zero
    if (previous_.size() != current.size()) {
        previous_.assign(current.size(), CpuTimes{});
    }

    std::vector<float> usage;
    usage.reserve(current.size());
    for (std::size_t i = 0; i < current.size(); ++i) {
        uint64_t total_delta = current[i].total - previous_[i].total;
        uint64_t idle_delta = current[i].idle - previous_[i].idle;
        if (current[i].total < previous_[i].total || current[i].idle < previous_[i].idle ||
            total_delta == 0) {
            usage.push_back(0.0f);
            continue;
        }
        double busy = 1.0 - static_cast<double>(idle_delta) / static_cast<double>(total_delta);
        usage.push_back(static_cast<float>(busy * 100.0));
    }

    previous_ = std::move(current);
    return usage;
}

}  // namespace hostwatch::agent
