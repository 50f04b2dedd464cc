/**
 * @file platform.hpp
 * @brief POSIX socket type definitions, includes and readiness helpers.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>

namespace netmap {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

/**
 * @brief Switch a descriptor to non-blocking mode.
 */
inline bool setNonBlocking(SocketHandle s, bool enable) {
    int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(s, F_SETFL, flags) == 0;
}

/**
 * @brief Wait for a descriptor to become readable or writable.
 * @param events POLLIN or POLLOUT.
 * @param timeoutMs Timeout in milliseconds (-1 = infinite).
 * @return 1 when ready, 0 on timeout, -1 on error.
 */
inline int waitFor(SocketHandle s, short events, int timeoutMs) {
    struct pollfd pfd{};
    pfd.fd = s;
    pfd.events = events;
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeoutMs);
    } while (rc < 0 && errno == EINTR);
    if (rc > 0 && (pfd.revents & (POLLERR | POLLNVAL)) && !(pfd.revents & events)) {
        return -1;
    }
    return rc;
}

/**
 * @brief Fill a sockaddr_in from a dotted IPv4 string and port.
 * @return False if the address does not parse.
 */
inline bool makeSockaddr(const std::string& ip, uint16_t port, struct sockaddr_in& out) {
    out = {};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        out.sin_addr.s_addr = INADDR_ANY;
        return true;
    }
    return ::inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

}  // namespace net
}  // namespace netmap
