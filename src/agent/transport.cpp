#include "hostwatch/agent/transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include "hostwatch/proto/wire_codec.hpp"
#include "hostwatch/util/logger.hpp"
#include "hostwatch/util/socket_io.hpp"

namespace hostwatch::agent {

namespace {

// owns the socket for one delivery cycle
class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // false on any failure; the reason is logged at debug level
    bool open(const TransportOptions& options) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            LOG_DEBUG("socket() failed: " + std::string(strerror(errno)));
            return false;
        }

        util::set_socket_timeout(fd_, options.response_timeout_seconds);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options.port);
        if (inet_pton(AF_INET, options.host.c_str(), &addr.sin_addr) <= 0) {
            LOG_ERROR("Invalid address: " + options.host);
            return false;
        }

        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            LOG_DEBUG("connect to " + options.host + ":" + std::to_string(options.port) +
                      " failed: " + std::string(strerror(errno)));
            return false;
        }
        return true;
    }

    bool send(const std::vector<uint8_t>& bytes) {
        return util::send_all(fd_, bytes.data(), bytes.size());
    }

    // nullopt on close, error, timeout or an undecodable response
    std::optional<proto::Response> read_response() {
        uint8_t chunk[64];
        while (true) {
            std::size_t consumed = 0;
            try {
                auto response = proto::WireCodec::decode_response(buffer_, consumed);
                if (response) {
                    buffer_.erase(buffer_.begin(),
                                  buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
                    return response;
                }
            } catch (const proto::FrameError& e) {
                LOG_WARN("bad response from server: " + std::string(e.what()));
                return std::nullopt;
            }

            ssize_t n = util::recv_some(fd_, chunk, sizeof(chunk));
            if (n <= 0) {
                return std::nullopt;
            }
            buffer_.insert(buffer_.end(), chunk, chunk + n);
        }
    }

private:
    int fd_ = -1;
    std::vector<uint8_t> buffer_;
};

}  // namespace

const char* to_string(DeliveryError error) {
    switch (error) {
        case DeliveryError::None:
            return "none";
        case DeliveryError::UnableToConnect:
            return "unable to connect to the server";
        case DeliveryError::UnableToSendData:
            return "unable to send data to the server";
        case DeliveryError::UnableToReceiveData:
            return "unable to receive data from the server";
    }
    return "unknown";
}

DeliveryReport Transport::deliver(DeliveryQueue& queue) {
    DeliveryReport report;

    Connection conn;
    if (!conn.open(options_)) {
        report.error = DeliveryError::UnableToConnect;
        return report;
    }

    while (auto frame = queue.pop()) {
        if (!conn.send(*frame)) {
            queue.requeue_front(std::move(*frame));
            report.error = DeliveryError::UnableToSendData;
            return report;
        }

        auto response = conn.read_response();
        if (!response || *response != proto::Response::ack()) {
            if (response) {
                LOG_WARN("expected Ack, got " + proto::to_string(*response));
            }
            queue.requeue_front(std::move(*frame));
            report.error = DeliveryError::UnableToReceiveData;
            return report;
        }
        ++report.delivered;
    }

    LOG_DEBUG("delivered " + std::to_string(report.delivered) + " frames");

    // everything acknowledged, ask whether the server has work for us
    auto request = proto::WireCodec::encode(proto::RequestWork{collector_id_});
    if (!conn.send(request)) {
        report.error = DeliveryError::UnableToSendData;
        return report;
    }

    auto work = conn.read_response();
    if (!work) {
        report.error = DeliveryError::UnableToReceiveData;
        return report;
    }
    if (work->kind == proto::ResponseKind::Task) {
        LOG_INFO("Task received: " + proto::to_string(work->task));
        report.task = work->task;
    }
    return report;
}

}  // namespace hostwatch::agent
