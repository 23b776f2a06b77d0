#include "hostwatch/server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "hostwatch/server/admin_session.hpp"
#include "hostwatch/server/connection_handler.hpp"
#include "hostwatch/util/logger.hpp"
#include "hostwatch/util/socket_io.hpp"

namespace hostwatch::server {

namespace {

// install once at startup to ignore SIGPIPE
/*
    when you write to socket that the other end has closed, OS sends your process a SIGPIPE signal
    -> default behavior: terminate the process. sends also pass MSG_NOSIGNAL, this covers any
    write that doesn't.
*/
struct SigpipeIgnorer {
    SigpipeIgnorer() {
        signal(SIGPIPE, SIG_IGN);
    }
};

static SigpipeIgnorer sigpipe_ignorer;

}  // namespace

class Server::Impl {
   public:
    Impl(storage::IMetricsStore& store, CommandStore& commands, const ServerOptions& options)
        : store_(store), commands_(commands), options_(options) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }

        // AF_INET = IPv4, SOCK_STREAM = TCP
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw std::runtime_error("failed to create socket: " + std::string(strerror(errno)));
        }

        // SO_REUSEADDR lets us rebind to port immediately after restart
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            close(fd);
            throw std::runtime_error("failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw std::runtime_error("Invalid address: " + options_.host);
        }

        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw std::runtime_error("failed to bind to port " + std::to_string(options_.port) +
                                     ": " + std::string(strerror(errno)));
        }

        // query actual bound port (for options_.port is 0)
        sockaddr_in bound_addr{};
        socklen_t bound_len = sizeof(bound_addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_len) == 0) {
            actual_port_ = ntohs(bound_addr.sin_port);
        } else {
            actual_port_ = options_.port;
        }

        if (listen(fd, SOMAXCONN) < 0) {
            close(fd);
            throw std::runtime_error("failed to listen: " + std::string(strerror(errno)));
        }

        server_fd_.store(fd);
        running_ = true;
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        LOG_INFO("Collector listening on " + options_.host + ":" + std::to_string(actual_port_));
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }

        LOG_INFO("Server stopping...");

        // shutdown unblocks the accept() call, close releases the fd
        int fd = server_fd_.exchange(-1);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        // handlers may be parked in recv(); shutting their sockets down wakes them up.
        // handlers close their fd under the same lock, so a finished fd is never touched
        std::vector<std::unique_ptr<ClientInfo>> clients;
        {
            std::lock_guard lock(clients_mutex_);
            for (auto& info : clients_) {
                if (!info->finished.load()) {
                    shutdown(info->fd, SHUT_RDWR);
                }
            }
            clients.swap(clients_);
        }
        for (auto& info : clients) {
            if (info->thread.joinable()) {
                info->thread.join();
            }
        }

        LOG_INFO("Server stopped");
    }

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return actual_port_;
    }

   private:
    struct ClientInfo {
        std::thread thread;
        int fd = -1;
        std::atomic<bool> finished{false};
    };

    void accept_loop() {
        while (running_) {
            cleanup_finished_clients();

            {
                std::lock_guard lock(clients_mutex_);
                if (clients_.size() >= options_.max_connections) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    continue;
                }
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);

            int fd = server_fd_.load();
            if (fd < 0) {
                break;
            }

            int client_fd = accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);

            if (client_fd < 0) {
                if (running_ && errno != EINTR) {
                    LOG_ERROR("Accept failed: " + std::string(strerror(errno)));
                }
                continue;
            }

            util::set_socket_timeout(client_fd, options_.client_timeout_seconds);

            LOG_DEBUG("Client connected, fd=" + std::to_string(client_fd));

            {
                std::lock_guard lock(clients_mutex_);
                auto info = std::make_unique<ClientInfo>();
                auto* info_ptr = info.get();
                info->fd = client_fd;
                // pass by pointer: ClientInfo holds a std::thread and can't be copied into the
                // thread's argument list. the unique_ptr keeps its address stable
                info->thread = std::thread(&Impl::handle_client, this, client_fd, info_ptr);
                clients_.push_back(std::move(info));
            }
        }
    }

    void cleanup_finished_clients() {
        std::lock_guard lock(clients_mutex_);
        auto it = clients_.begin();
        while (it != clients_.end()) {
            if ((*it)->finished.load()) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // peek without consuming so the chosen session still sees the whole stream
    bool is_admin_session(int client_fd) {
        if (!options_.admin_enabled) {
            return false;
        }
        uint8_t first_byte = 0;
        ssize_t n = recv(client_fd, &first_byte, 1, MSG_PEEK);
        return n == 1 && std::isalpha(first_byte);
    }

    void handle_client(int client_fd, ClientInfo* info) {
        try {
            if (is_admin_session(client_fd)) {
                LOG_DEBUG("admin session, fd=" + std::to_string(client_fd));
                AdminSession session(store_, commands_);
                session.serve(client_fd, running_);
            } else {
                ConnectionHandler handler(store_, commands_);
                handler.serve(client_fd, running_);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Client handle error: " + std::string(e.what()));
        }

        LOG_DEBUG("Client disconnected, fd=" + std::to_string(client_fd));
        std::lock_guard lock(clients_mutex_);
        close(client_fd);
        info->finished.store(true);
    }

    storage::IMetricsStore& store_;
    CommandStore& commands_;
    ServerOptions options_;

    uint16_t actual_port_{0};

    // written by stop() on the caller's thread while accept_loop() reads it
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    // unique_ptr so vector reallocation doesn't move ClientInfo out from under its thread
    std::vector<std::unique_ptr<ClientInfo>> clients_;
    std::mutex clients_mutex_;
};

// PIMPL INTERFACE -------------------------------------------------------------------------------
Server::Server(storage::IMetricsStore& store, CommandStore& commands, const ServerOptions& options)
    : impl_(std::make_unique<Impl>(store, commands, options)) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;
void Server::start() {
    impl_->start();
}
void Server::stop() {
    impl_->stop();
}
bool Server::running() const noexcept {
    return impl_->running();
}
uint16_t Server::port() const noexcept {
    return impl_->port();
}

}  // namespace hostwatch::server
