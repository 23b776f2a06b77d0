#ifndef HOSTWATCH_SERVER_CONNECTION_HANDLER_HPP
#define HOSTWATCH_SERVER_CONNECTION_HANDLER_HPP

#include <atomic>
#include <optional>

#include "hostwatch/proto/wire_codec.hpp"
#include "hostwatch/server/command_store.hpp"
#include "hostwatch/storage/metrics_store.hpp"

namespace hostwatch::server {

/*
    serves one agent connection: read frame -> dispatch -> respond, until the peer closes.
    holds no per-connection state beyond its read buffer; every message carries its own
    collector id.
*/
class ConnectionHandler {
public:
    ConnectionHandler(storage::IMetricsStore& store, CommandStore& commands)
        : store_(store), commands_(commands) {}

    // the response to write back, or nullopt when nothing should be sent (persist failed)
    [[nodiscard]] std::optional<proto::Response> dispatch(const proto::DecodedFrame& frame);

    // returns when the peer closes, the socket errors or times out, a frame fails to decode,
    // or running turns false. the caller owns and closes fd
    void serve(int fd, const std::atomic<bool>& running);

private:
    storage::IMetricsStore& store_;
    CommandStore& commands_;
};

}  // namespace hostwatch::server

#endif
