#ifndef HOSTWATCH_AGENT_TRANSPORT_HPP
#define HOSTWATCH_AGENT_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "hostwatch/agent/delivery_queue.hpp"
#include "hostwatch/proto/collector_id.hpp"
#include "hostwatch/proto/types.hpp"

namespace hostwatch::agent {

struct TransportOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 9004;
    // how long to wait for each response; 0 waits forever
    int response_timeout_seconds = 30;
};

// all recoverable: the frame in flight is requeued and the next cycle retries it
enum class DeliveryError {
    None,
    UnableToConnect,
    UnableToSendData,
    UnableToReceiveData,
};

[[nodiscard]] const char* to_string(DeliveryError error);

struct DeliveryReport {
    DeliveryError error = DeliveryError::None;
    std::size_t delivered = 0;  // frames acknowledged this cycle
    std::optional<proto::TaskType> task;  // set when the RequestWork round-trip returned one

    [[nodiscard]] bool ok() const noexcept {
        return error == DeliveryError::None;
    }
};

/*
    one delivery cycle = one connection:
        for each queued frame: send it, wait for Ack. anything else requeues it and ends the cycle
        queue drained: send RequestWork(collector_id) and report any Task that comes back

    delivery is at-least-once and in queue order. an Ack lost after the server persisted the row
    means the frame is sent again and the row is stored twice; frames carry no idempotency key.
*/
class Transport {
public:
    Transport(const TransportOptions& options, const proto::CollectorId& collector_id)
        : options_(options), collector_id_(collector_id) {}

    [[nodiscard]] DeliveryReport deliver(DeliveryQueue& queue);

private:
    TransportOptions options_;
    proto::CollectorId collector_id_;
};

}  // namespace hostwatch::agent

#endif
