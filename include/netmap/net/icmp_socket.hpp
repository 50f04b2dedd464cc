/**
 * @file icmp_socket.hpp
 * @brief ICMP echo socket for reachability probes.
 *
 * Prefers the unprivileged datagram ICMP socket (Linux ping_group_range)
 * and falls back to a raw socket when that is unavailable.
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
 * @struct EchoReply
 * @brief Result of a single echo exchange.
 */
struct NETMAP_NET_API EchoReply {
    bool replied = false;
    double rttMs = 0.0;
    std::string error;   ///< Set when the request could not be sent
};

/**
 * @brief RFC 1071 internet checksum.
 */
NETMAP_NET_API uint16_t internetChecksum(const uint8_t* data, size_t length);

/**
 * @brief Build an ICMP echo request (type 8) with a valid checksum.
 */
NETMAP_NET_API std::vector<uint8_t> buildEchoRequest(uint16_t identifier,
                                                     uint16_t sequence,
                                                     const std::vector<uint8_t>& payload);

/**
 * @class IcmpSocket
 * @brief RAII ICMP socket that sends one echo and waits for the matching reply.
 */
class NETMAP_NET_API IcmpSocket {
public:
    IcmpSocket();
    ~IcmpSocket();

    IcmpSocket(const IcmpSocket&) = delete;
    IcmpSocket& operator=(const IcmpSocket&) = delete;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    bool isRaw() const { return raw_; }

    /**
     * @brief Send one echo request and wait for its reply.
     * @param ip Destination IPv4 address.
     * @param sequence Sequence number to match.
     * @param timeoutMs Maximum wait for the reply.
     */
    EchoReply echo(const std::string& ip, uint16_t sequence, int timeoutMs);

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    bool raw_;
    uint16_t identifier_;
    int lastError_;
};

}  // namespace net
}  // namespace netmap
