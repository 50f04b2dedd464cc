/**
 * @file udp_socket.hpp
 * @brief RAII UDP socket used by the SNMP transport.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/net/export.hpp"
#include "netmap/net/platform.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace netmap {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct NETMAP_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper with timeout-based receive.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.bind(0);
 * sock.sendTo(SocketAddress("10.0.0.1", 161), request.data(), request.size());
 *
 * std::vector<uint8_t> buffer(65535);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 2000, sender);
 * @endcode
 */
class NETMAP_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     */
    UdpSocket();

    /**
     * @brief Destructor - closes the socket.
     */
    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Check if the socket is valid/open.
     */
    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Get the underlying socket handle.
     */
    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to.
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Send data to an address.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive data with timeout.
     * @param buffer Buffer to receive into.
     * @param bufferSize Size of the buffer.
     * @param timeoutMs Timeout in milliseconds (0 = non-blocking, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    /**
     * @brief Close the socket.
     */
    void close();

    /**
     * @brief Get the last socket error code.
     */
    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace netmap
