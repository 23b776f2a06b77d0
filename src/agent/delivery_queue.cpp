#include "hostwatch/agent/delivery_queue.hpp"

#include <string>
#include <utility>

#include "hostwatch/util/logger.hpp"

namespace hostwatch::agent {

void DeliveryQueue::push(Frame frame) {
    if (capacity_ > 0 && frames_.size() >= capacity_) {
        frames_.pop_front();
        ++dropped_;
        LOG_WARN("delivery queue full (" + std::to_string(capacity_) +
                 " frames), dropped oldest; total dropped " + std::to_string(dropped_));
    }
    frames_.push_back(std::move(frame));
}

std::optional<Frame> DeliveryQueue::pop() {
    if (frames_.empty()) {
        return std::nullopt;
    }
    Frame frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void DeliveryQueue::requeue_front(Frame frame) {
    // no capacity check: a requeue only restores a frame pop() just removed
    frames_.push_front(std::move(frame));
}

}  // namespace hostwatch::agent
