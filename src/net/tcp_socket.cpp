/**
 * @file tcp_socket.cpp
 * @brief TCP client socket implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/net/tcp_socket.hpp"
#include "netmap/utils/logger.hpp"

#include <chrono>
#include <cstring>

namespace netmap {
namespace net {

TcpSocket::TcpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , connected_(false)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("TcpSocket", "Failed to create socket: {}", std::strerror(lastError_));
        return;
    }
    setNonBlocking(socket_, true);
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(other.socket_)
    , connected_(other.connected_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
    other.connected_ = false;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        connected_ = other.connected_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
        other.connected_ = false;
    }
    return *this;
}

ConnectResult TcpSocket::connect(const std::string& ip, uint16_t port, int timeoutMs) {
    if (!isValid()) {
        return ConnectResult::FAILED;
    }

    struct sockaddr_in addr{};
    if (!makeSockaddr(ip, port, addr)) {
        LOG_ERROR("TcpSocket", "Invalid address: {}", ip);
        return ConnectResult::FAILED;
    }

    int rc = ::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        connected_ = true;
        return ConnectResult::CONNECTED;
    }

    setLastError();
    if (lastError_ == ECONNREFUSED) {
        return ConnectResult::REFUSED;
    }
    if (lastError_ != EINPROGRESS) {
        return ConnectResult::FAILED;
    }

    int ready = waitFor(socket_, POLLOUT, timeoutMs);
    if (ready == 0) {
        return ConnectResult::TIMED_OUT;
    }

    int soError = 0;
    socklen_t len = sizeof(soError);
    if (::getsockopt(socket_, SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
        setLastError();
        return ConnectResult::FAILED;
    }
    if (soError == 0 && ready > 0) {
        connected_ = true;
        LOG_TRACE("TcpSocket", "Connected to {}:{}", ip, port);
        return ConnectResult::CONNECTED;
    }

    lastError_ = soError;
    if (soError == ECONNREFUSED) {
        return ConnectResult::REFUSED;
    }
    return ConnectResult::FAILED;
}

bool TcpSocket::sendAll(const void* data, size_t length, int timeoutMs) {
    if (!connected_) {
        return false;
    }

    const char* cursor = static_cast<const char*>(data);
    size_t remaining = length;

    while (remaining > 0) {
        ssize_t sent = ::send(socket_, cursor, remaining, MSG_NOSIGNAL);
        if (sent > 0) {
            cursor += sent;
            remaining -= static_cast<size_t>(sent);
            continue;
        }
        setLastError();
        if (sent < 0 && (lastError_ == EAGAIN || lastError_ == EWOULDBLOCK)) {
            if (waitFor(socket_, POLLOUT, timeoutMs) <= 0) {
                return false;
            }
            continue;
        }
        return false;
    }
    return true;
}

int TcpSocket::receive(void* buffer, size_t bufferSize, int timeoutMs) {
    if (!connected_) {
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

    ssize_t received = ::recv(socket_, buffer, bufferSize, 0);
    if (received < 0) {
        setLastError();
        if (lastError_ == EAGAIN || lastError_ == EWOULDBLOCK) {
            return 0;
        }
        return -1;
    }
    if (received == 0) {
        connected_ = false;
        return -1;
    }
    return static_cast<int>(received);
}

void TcpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
    connected_ = false;
}

void TcpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace netmap
