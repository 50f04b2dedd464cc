/**
 * @file tcp_socket.hpp
 * @brief RAII TCP client socket with bounded connect and receive.
 *
 * Used by the Telnet session and the TCP reachability fallback.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/net/export.hpp"
#include "netmap/net/platform.hpp"

#include <cstdint>
#include <string>

namespace netmap {
namespace net {

/**
 * @enum ConnectResult
 * @brief Outcome of a bounded connect attempt.
 */
enum class ConnectResult {
    CONNECTED,
    REFUSED,      ///< Peer answered with RST (host is up, port closed)
    TIMED_OUT,
    FAILED
};

/**
 * @class TcpSocket
 * @brief Blocking-style TCP client built on non-blocking I/O and poll().
 *
 * Usage:
 * @code
 * TcpSocket sock;
 * if (sock.connect("10.0.0.1", 23, 5000) == ConnectResult::CONNECTED) {
 *     sock.sendAll("show version\r\n");
 *     char buf[4096];
 *     int n = sock.receive(buf, sizeof(buf), 2000);
 * }
 * @endcode
 */
class NETMAP_NET_API TcpSocket {
public:
    TcpSocket();
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    bool isConnected() const { return connected_; }

    /**
     * @brief Connect to ip:port within timeoutMs.
     */
    ConnectResult connect(const std::string& ip, uint16_t port, int timeoutMs);

    /**
     * @brief Send the whole buffer.
     * @return True if every byte was written.
     */
    bool sendAll(const void* data, size_t length, int timeoutMs = 5000);
    bool sendAll(const std::string& data, int timeoutMs = 5000) {
        return sendAll(data.data(), data.size(), timeoutMs);
    }

    /**
     * @brief Receive available bytes, waiting up to timeoutMs.
     * @return Bytes received, 0 on timeout, -1 on error or orderly close.
     */
    int receive(void* buffer, size_t bufferSize, int timeoutMs);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    bool connected_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace netmap
