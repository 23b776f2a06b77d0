#ifndef HOSTWATCH_AGENT_AGENT_HPP
#define HOSTWATCH_AGENT_AGENT_HPP

#include <atomic>
#include <cstddef>

#include "hostwatch/agent/delivery_queue.hpp"
#include "hostwatch/agent/metric_sampler.hpp"
#include "hostwatch/agent/system_probe.hpp"
#include "hostwatch/agent/transport.hpp"
#include "hostwatch/proto/collector_id.hpp"
#include "hostwatch/proto/types.hpp"
#include "hostwatch/util/channel.hpp"

namespace hostwatch::agent {

struct AgentOptions {
    TransportOptions transport;
    SamplerOptions sampler;
    std::size_t max_queued_frames = 0;  // 0 = unbounded
};

enum class StopReason {
    ShutdownTask,   // the server sent Task(Shutdown)
    StopRequested,  // request_stop() or SIGINT/SIGTERM
};

/*
    sampler thread -> channel -> this thread: encode, queue, run one delivery cycle per sample.
*/
class Agent {
public:
    Agent(const AgentOptions& options, const proto::CollectorId& collector_id,
          ISystemProbe& probe);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // blocks until shut down. frames still queued at that point are discarded
    StopReason run();

    // safe from any thread
    void request_stop() noexcept {
        stop_requested_ = true;
    }

    [[nodiscard]] std::size_t frames_pending() const noexcept {
        return pending_;
    }

private:
    [[nodiscard]] bool should_stop() const;

    proto::CollectorId collector_id_;
    util::Channel<proto::Command> channel_;
    DeliveryQueue queue_;
    Transport transport_;
    MetricSampler sampler_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> pending_{0};
};

}  // namespace hostwatch::agent

#endif
