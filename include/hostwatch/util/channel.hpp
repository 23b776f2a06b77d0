#ifndef HOSTWATCH_UTIL_CHANNEL_HPP
#define HOSTWATCH_UTIL_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace hostwatch::util {

/*
    unbounded FIFO hand-off between threads. producers never block, so a slow consumer can't
    stall them; the price is that the backlog grows without limit if the consumer stops.

    once closed, send() fails and receive() drains what is left, then returns nullopt.
*/
template <typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // false if the channel was closed
    [[nodiscard]] bool send(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // blocks until an item arrives or the channel is closed and empty
    [[nodiscard]] std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return pop_locked();
    }

    // nullopt on timeout as well as on closed-and-empty; check closed() to tell them apart
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace hostwatch::util

#endif
