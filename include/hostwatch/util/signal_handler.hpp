#ifndef HOSTWATCH_UTIL_SIGNAL_HANDLER_HPP
#define HOSTWATCH_UTIL_SIGNAL_HANDLER_HPP

#include <atomic>

namespace hostwatch::util {

class SignalHandler {
public:
    static void install();
    static bool should_shutdown();
    static void wait_for_shutdown();
    static void request_shutdown();
    static void reset();

private:
    static std::atomic<bool> shutdown_requested_;
};

} //namespace hostwatch::util

#endif
