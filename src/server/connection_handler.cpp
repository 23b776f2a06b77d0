#include "hostwatch/server/connection_handler.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "hostwatch/util/logger.hpp"
#include "hostwatch/util/socket_io.hpp"

namespace hostwatch::server {

std::optional<proto::Response> ConnectionHandler::dispatch(const proto::DecodedFrame& frame) {
    if (const auto* submit = std::get_if<proto::SubmitData>(&frame.command)) {
        storage::MetricRecord record;
        record.collector_id = submit->collector_id;
        record.received = frame.timestamp;
        record.total_memory = submit->total_memory;
        record.used_memory = submit->used_memory;
        record.average_cpu = submit->average_cpu_usage;

        // no Ack on failure: the agent keeps the frame queued and resends it next cycle
        try {
            store_.insert(record);
        } catch (const std::exception& e) {
            LOG_ERROR("failed to persist data from " + submit->collector_id.to_string() + ": " +
                      e.what());
            return std::nullopt;
        }
        return proto::Response::ack();
    }

    const auto& request = std::get<proto::RequestWork>(frame.command);
    if (auto task = commands_.take(request.collector_id)) {
        LOG_INFO("sending " + proto::to_string(*task) + " to " +
                 request.collector_id.to_string());
        return proto::Response::make_task(*task);
    }
    return proto::Response::no_work();
}

void ConnectionHandler::serve(int fd, const std::atomic<bool>& running) {
    std::vector<uint8_t> buffer;
    uint8_t chunk[1024];

    while (running) {
        // process every whole frame already buffered before reading again
        std::optional<std::size_t> frame_len;
        try {
            frame_len = proto::WireCodec::frame_size(buffer);
            if (frame_len && buffer.size() >= *frame_len) {
                proto::DecodedFrame frame = proto::WireCodec::decode(buffer.data(), *frame_len);
                buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*frame_len));

                auto response = dispatch(frame);
                if (response) {
                    auto bytes = proto::WireCodec::encode_response(*response);
                    if (!util::send_all(fd, bytes.data(), bytes.size())) {
                        LOG_DEBUG("send failed, fd=" + std::to_string(fd));
                        return;
                    }
                }
                continue;
            }
        } catch (const proto::FrameError& e) {
            // framing is lost once a frame is bad, so the rest of the stream is unusable
            LOG_WARN("dropping connection fd=" + std::to_string(fd) + ": " +
                     proto::to_string(e.kind()) + " frame (" + e.what() + ")");
            return;
        }

        ssize_t n = util::recv_some(fd, chunk, sizeof(chunk));
        if (n < 0) {
            LOG_DEBUG("read failed or timed out, fd=" + std::to_string(fd));
            return;
        }
        if (n == 0) {
            return;  // peer closed
        }
        buffer.insert(buffer.end(), chunk, chunk + n);
    }
}

}  // namespace hostwatch::server
