#ifndef HOSTWATCH_TESTS_SUPPORT_SCRIPTED_COLLECTOR_HPP
#define HOSTWATCH_TESTS_SUPPORT_SCRIPTED_COLLECTOR_HPP

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "hostwatch/proto/wire_codec.hpp"

namespace hostwatch::test {

/*
    single-connection-at-a-time fake collector. every decoded frame is recorded and handed to
    the script, which decides what goes back.
*/
class ScriptedCollector {
public:
    enum class Action {
        Respond,  // send reply.response
        Ignore,   // keep the connection, send nothing
        HangUp,   // close the connection without answering
    };

    struct Reply {
        Action action = Action::Respond;
        proto::Response response = proto::Response::ack();
    };

    using Script = std::function<Reply(const proto::DecodedFrame&, std::size_t index)>;

    explicit ScriptedCollector(Script script) : script_(std::move(script)) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            listen(listen_fd_, 8) < 0) {
            close(listen_fd_);
            throw std::runtime_error("scripted collector failed to listen");
        }

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { accept_loop(); });
    }

    ~ScriptedCollector() {
        stop();
    }

    ScriptedCollector(const ScriptedCollector&) = delete;
    ScriptedCollector& operator=(const ScriptedCollector&) = delete;

    [[nodiscard]] uint16_t port() const {
        return port_;
    }

    void stop() {
        if (stopped_.exchange(true)) {
            return;
        }
        shutdown(listen_fd_, SHUT_RDWR);
        close(listen_fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // every frame received, in arrival order, including ones that were not acknowledged
    [[nodiscard]] std::vector<proto::DecodedFrame> frames() const {
        std::lock_guard lock(mutex_);
        return frames_;
    }

    [[nodiscard]] std::size_t connections() const {
        return connections_;
    }

private:
    void accept_loop() {
        while (!stopped_) {
            int fd = accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                return;
            }
            ++connections_;

            struct timeval tv;
            tv.tv_sec = 5;
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            serve(fd);
            close(fd);
        }
    }

    void serve(int fd) {
        std::vector<uint8_t> buffer;
        uint8_t chunk[512];
        while (true) {
            auto size = proto::WireCodec::frame_size(buffer);
            if (size && buffer.size() >= *size) {
                auto frame = proto::WireCodec::decode(buffer.data(), *size);
                buffer.erase(buffer.begin(), buffer.begin() + static_cast<long>(*size));

                std::size_t index;
                {
                    std::lock_guard lock(mutex_);
                    index = frames_.size();
                    frames_.push_back(frame);
                }

                Reply reply = script_(frame, index);
                if (reply.action == Action::HangUp) {
                    return;
                }
                if (reply.action == Action::Respond) {
                    auto bytes = proto::WireCodec::encode_response(reply.response);
                    if (send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL) < 0) {
                        return;
                    }
                }
                continue;
            }

            ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return;
            }
            buffer.insert(buffer.end(), chunk, chunk + n);
        }
    }

    Script script_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> connections_{0};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<proto::DecodedFrame> frames_;
};

}  // namespace hostwatch::test

#endif
