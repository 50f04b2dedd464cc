/**
 * @file udp_socket.cpp
 * @brief UDP socket implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/net/udp_socket.hpp"
#include "netmap/utils/logger.hpp"

#include <cstring>

namespace netmap {
namespace net {

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to create socket: {}", std::strerror(lastError_));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    if (!makeSockaddr(address, port, addr)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to bind to {}:{} - {}",
                  address, port, std::strerror(lastError_));
        return false;
    }

    LOG_TRACE("UdpSocket", "Bound to {}:{}", address, port);
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);

    if (::getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }

    return ntohs(addr.sin_port);
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    if (!makeSockaddr(dest.ip, dest.port, addr)) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

    ssize_t result = ::sendto(socket_,
                              data,
                              length,
                              0,
                              reinterpret_cast<struct sockaddr*>(&addr),
                              sizeof(addr));

    if (result < 0) {
        setLastError();
        return -1;
    }

    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    int ready = waitFor(socket_, POLLIN, timeoutMs);
    if (ready < 0) {
        setLastError();
        return -1;
    }
    if (ready == 0) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);

    ssize_t result = ::recvfrom(socket_,
                                buffer,
                                bufferSize,
                                0,
                                reinterpret_cast<struct sockaddr*>(&addr),
                                &addrLen);

    if (result < 0) {
        setLastError();
        return -1;
    }

    char ipStr[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
    sender.ip = ipStr;
    sender.port = ntohs(addr.sin_port);

    return static_cast<int>(result);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace netmap
