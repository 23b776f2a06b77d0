#include "hostwatch/agent/agent.hpp"

#include <chrono>
#include <string>

#include "hostwatch/proto/wire_codec.hpp"
#include "hostwatch/util/logger.hpp"
#include "hostwatch/util/signal_handler.hpp"

namespace hostwatch::agent {

namespace {
// how often the delivery loop looks at the stop flags while the channel is quiet
constexpr auto kPollInterval = std::chrono::milliseconds(200);
}  // namespace

Agent::Agent(const AgentOptions& options, const proto::CollectorId& collector_id,
             ISystemProbe& probe)
    : collector_id_(collector_id),
      queue_(options.max_queued_frames),
      transport_(options.transport, collector_id),
      sampler_(probe, channel_, collector_id, options.sampler) {}

Agent::~Agent() {
    sampler_.stop();
    channel_.close();
}

bool Agent::should_stop() const {
    return stop_requested_ || util::SignalHandler::should_shutdown();
}

StopReason Agent::run() {
    LOG_INFO("agent " + collector_id_.to_string() + " starting");
    sampler_.start();

    StopReason reason = StopReason::StopRequested;
    while (!should_stop()) {
        auto command = channel_.receive_for(kPollInterval);
        if (!command) {
            continue;
        }

        queue_.push(proto::WireCodec::encode(*command));

        DeliveryReport report = transport_.deliver(queue_);
        pending_ = queue_.size();
        if (!report.ok()) {
            LOG_WARN(std::string(to_string(report.error)) + ", " +
                     std::to_string(queue_.size()) + " frames pending");
        }

        if (report.task == proto::TaskType::Shutdown) {
            LOG_INFO("shutdown requested by server");
            reason = StopReason::ShutdownTask;
            break;
        }
    }

    sampler_.stop();
    channel_.close();

    if (!queue_.empty()) {
        LOG_WARN("discarding " + std::to_string(queue_.size()) + " undelivered frames");
    }
    LOG_INFO("agent stopped");
    return reason;
}

}  // namespace hostwatch::agent
