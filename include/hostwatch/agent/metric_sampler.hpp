#ifndef HOSTWATCH_AGENT_METRIC_SAMPLER_HPP
#define HOSTWATCH_AGENT_METRIC_SAMPLER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "hostwatch/agent/system_probe.hpp"
#include "hostwatch/proto/collector_id.hpp"
#include "hostwatch/proto/types.hpp"
#include "hostwatch/util/channel.hpp"

namespace hostwatch::agent {

struct SamplerOptions {
    std::chrono::milliseconds period{1000};
};

/*
    samples the host once per period on its own thread and sends a SubmitData into the channel.
    the channel is unbounded so a stalled network never delays the next sample.

    pacing: sleep for whatever is left of the period after sampling. if sampling took longer
    than the period, sleep a full period instead of firing back-to-back. this avoids drift
    without promising real-time ticks.
*/
class MetricSampler {
public:
    MetricSampler(ISystemProbe& probe, util::Channel<proto::Command>& out,
                  const proto::CollectorId& collector_id, const SamplerOptions& options = {});
    ~MetricSampler();

    MetricSampler(const MetricSampler&) = delete;
    MetricSampler& operator=(const MetricSampler&) = delete;

    void start();
    // wakes the thread out of its sleep and joins it
    void stop();

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    // one reading, averaged over all cores
    [[nodiscard]] proto::SubmitData sample();

    [[nodiscard]] static std::chrono::milliseconds next_delay(std::chrono::milliseconds elapsed,
                                                              std::chrono::milliseconds period);

private:
    void run();
    // false when stop() interrupted the wait
    bool wait_for(std::chrono::milliseconds delay);

    ISystemProbe& probe_;
    util::Channel<proto::Command>& out_;
    proto::CollectorId collector_id_;
    SamplerOptions options_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

}  // namespace hostwatch::agent

#endif
