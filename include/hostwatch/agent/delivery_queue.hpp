#ifndef HOSTWATCH_AGENT_DELIVERY_QUEUE_HPP
#define HOSTWATCH_AGENT_DELIVERY_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace hostwatch::agent {

using Frame = std::vector<uint8_t>;

/*
    encoded frames waiting for an Ack, oldest first. a frame leaves the queue only once the server
    acknowledged it; on failure the transport puts it back with requeue_front() so the next cycle
    starts from the same frame.

    capacity 0 means unbounded. with a capacity, push() onto a full queue evicts the oldest frame.
    owned by the delivery thread; not synchronized.
*/
class DeliveryQueue {
public:
    explicit DeliveryQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    void push(Frame frame);

    [[nodiscard]] std::optional<Frame> pop();

    // undo a pop(): the frame goes back ahead of everything else
    void requeue_front(Frame frame);

    [[nodiscard]] const Frame& front() const {
        return frames_.front();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return frames_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return frames_.empty();
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    // frames evicted because the queue was full
    [[nodiscard]] std::size_t dropped() const noexcept {
        return dropped_;
    }

private:
    std::deque<Frame> frames_;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
};

}  // namespace hostwatch::agent

#endif
