#include "hostwatch/server/command_store.hpp"

namespace hostwatch::server {

void CommandStore::set(const proto::CollectorId& id, proto::TaskType task) {
    std::lock_guard lock(mutex_);
    pending_[id] = task;
}

std::optional<proto::TaskType> CommandStore::take(const proto::CollectorId& id) {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    proto::TaskType task = it->second;
    pending_.erase(it);
    return task;
}

std::size_t CommandStore::size() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

}  // namespace hostwatch::server
