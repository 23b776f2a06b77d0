#ifndef HOSTWATCH_SERVER_SERVER_HPP
#define HOSTWATCH_SERVER_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "hostwatch/server/command_store.hpp"
#include "hostwatch/storage/metrics_store.hpp"

namespace hostwatch::server {

struct ServerOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 9004;  // 0 picks a free port, see port()
    std::size_t max_connections = 1000;
    int client_timeout_seconds = 300;  // idle agents are dropped after this
    bool admin_enabled = true;
};

/*
    collector listener. one thread accepts, one thread per connection serves it.
    the first byte of a connection picks the session type: agent frames start with the magic
    number (0x04), an ASCII letter starts an admin text session.
*/
class Server {
   public:
    Server(storage::IMetricsStore& store, CommandStore& commands,
           const ServerOptions& options = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // throws std::runtime_error if the socket cannot be bound
    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept;
    // the bound port, valid after start()
    [[nodiscard]] uint16_t port() const noexcept;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace hostwatch::server

#endif
