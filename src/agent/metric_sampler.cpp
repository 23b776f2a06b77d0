#include "hostwatch/agent/metric_sampler.hpp"

#include <stdexcept>
#include <string>

#include "hostwatch/util/logger.hpp"

namespace hostwatch::agent {

MetricSampler::MetricSampler(ISystemProbe& probe, util::Channel<proto::Command>& out,
                             const proto::CollectorId& collector_id,
                             const SamplerOptions& options)
    : probe_(probe), out_(out), collector_id_(collector_id), options_(options) {
    if (options_.period <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("sample period must be positive, got " +
                                    std::to_string(options_.period.count()) + "ms");
    }
}

MetricSampler::~MetricSampler() {
    stop();
}

void MetricSampler::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&MetricSampler::run, this);
}

void MetricSampler::stop() {
    {
        // flip under the lock so the sampler can't miss the wakeup between check and wait
        std::lock_guard lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

proto::SubmitData MetricSampler::sample() {
    proto::SubmitData data;
    data.collector_id = collector_id_;

    if (auto mem = probe_.memory()) {
        data.total_memory = mem->total_bytes;
        data.used_memory = mem->used_bytes;
    }

    auto cores = probe_.cpu_usage();
    if (!cores.empty()) {
        float sum = 0.0f;
        for (float c : cores) {
            sum += c;
        }
        data.average_cpu_usage = sum / static_cast<float>(cores.size());
    }
    return data;
}

std::chrono::milliseconds MetricSampler::next_delay(std::chrono::milliseconds elapsed,
                                                    std::chrono::milliseconds period) {
    if (elapsed < period) {
        return period - elapsed;
    }
    // running behind: a full period, never a busy loop
    return period;
}

bool MetricSampler::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock lock(wake_mutex_);
    return !wake_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

void MetricSampler::run() {
    LOG_DEBUG("sampler started, period " + std::to_string(options_.period.count()) + "ms");

    // prime the cpu counters so the first reported sample covers one full period
    (void)probe_.cpu_usage();
    if (!wait_for(options_.period)) {
        return;
    }

    while (running_) {
        auto started = std::chrono::steady_clock::now();

        proto::SubmitData data = sample();
        if (!out_.send(data)) {
            LOG_WARN("Error sending data: channel closed");
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (elapsed >= options_.period) {
            LOG_WARN("sampling took " + std::to_string(elapsed.count()) +
                     "ms, longer than the period");
        }
        if (!wait_for(next_delay(elapsed, options_.period))) {
            break;
        }
    }

    LOG_DEBUG("sampler stopped");
}

}  // namespace hostwatch::agent
