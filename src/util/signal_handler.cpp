#include "hostwatch/util/signal_handler.hpp"

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>

namespace hostwatch::util {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

namespace {

std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// only async-signal-safe work here: a lock-free atomic store
void signal_handler(int signal) {
    (void)signal;
    SignalHandler::request_shutdown();
}

} //namespace

void SignalHandler::install() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

bool SignalHandler::should_shutdown() {
    return shutdown_requested_.load();
}

void SignalHandler::wait_for_shutdown() {
    // notify_all is not async-signal-safe, so a signal only flips the flag. poll it.
    std::unique_lock lock(shutdown_mutex);
    while (!shutdown_requested_.load()) {
        shutdown_cv.wait_for(lock, std::chrono::milliseconds(100));
    }
}

void SignalHandler::request_shutdown() {
    shutdown_requested_.store(true);
}

void SignalHandler::reset() {
    shutdown_requested_.store(false);
}

} //namespace hostwatch::util
