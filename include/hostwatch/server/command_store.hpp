#ifndef HOSTWATCH_SERVER_COMMAND_STORE_HPP
#define HOSTWATCH_SERVER_COMMAND_STORE_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "hostwatch/proto/collector_id.hpp"
#include "hostwatch/proto/types.hpp"

namespace hostwatch::server {

/*
    pending control commands, at most one per collector. written by the admin surface, consumed
    by the RequestWork handler. a command is handed out at most once per set().
*/
class CommandStore {
public:
    CommandStore() = default;

    CommandStore(const CommandStore&) = delete;
    CommandStore& operator=(const CommandStore&) = delete;

    // replaces any command already pending for id
    void set(const proto::CollectorId& id, proto::TaskType task);

    // removes and returns the pending command
    [[nodiscard]] std::optional<proto::TaskType> take(const proto::CollectorId& id);

    [[nodiscard]] std::size_t size() const;

private:
    std::unordered_map<proto::CollectorId, proto::TaskType, proto::CollectorIdHash> pending_;
    mutable std::mutex mutex_;
};

}  // namespace hostwatch::server

#endif
