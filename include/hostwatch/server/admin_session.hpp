#ifndef HOSTWATCH_SERVER_ADMIN_SESSION_HPP
#define HOSTWATCH_SERVER_ADMIN_SESSION_HPP

#include <atomic>
#include <string>

#include "hostwatch/server/command_store.hpp"
#include "hostwatch/storage/metrics_store.hpp"

namespace hostwatch::server {

struct AdminReply {
    std::string text;  // one or more '\n'-terminated lines
    bool close_connection = false;
};

/*
    line-based operator session, reachable with telnet/nc on the collector port:
        SHUTDOWN <uuid>   queue a Shutdown for that collector       -> OK
        COLLECTORS        last time each collector reported         -> OK <n>, then n lines
        DATA <uuid>       rows for one collector, oldest first      -> OK <n>, then n lines
        ALL               every stored row in insertion order       -> OK <n>, then n lines
        PING                                                        -> OK PONG
        QUIT                                                        -> BYE
    anything else gets ERROR <message>.
*/
class AdminSession {
public:
    AdminSession(storage::IMetricsStore& store, CommandStore& commands)
        : store_(store), commands_(commands) {}

    [[nodiscard]] AdminReply execute(const std::string& line);

    // the caller owns and closes fd
    void serve(int fd, const std::atomic<bool>& running);

private:
    storage::IMetricsStore& store_;
    CommandStore& commands_;
};

}  // namespace hostwatch::server

#endif
