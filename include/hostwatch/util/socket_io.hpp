#ifndef HOSTWATCH_UTIL_SOCKET_IO_HPP
#define HOSTWATCH_UTIL_SOCKET_IO_HPP

#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace hostwatch::util {

/*
    MSG_NOSIGNAL: writing to a socket the peer already closed would otherwise raise SIGPIPE and
    kill the process. with the flag, send() just fails with EPIPE.
*/
inline bool send_all(int fd, const void* data, std::size_t len) {
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    std::size_t total_sent = 0;
    while (total_sent < len) {
        ssize_t sent = send(fd, ptr + total_sent, len - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;  // retry
            }
            return false;
        }
        if (sent == 0) {
            return false;
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    return true;
}

// recv() that retries on EINTR. <0 error (including SO_RCVTIMEO timeout), 0 peer closed
inline ssize_t recv_some(int fd, void* buf, std::size_t len) {
    while (true) {
        ssize_t n = recv(fd, buf, len, 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return n;
    }
}

// 0 or less leaves the socket fully blocking
inline void set_socket_timeout(int fd, int seconds) {
    if (seconds <= 0) {
        return;
    }
    struct timeval tv;
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

}  // namespace hostwatch::util

#endif
