/**
 * @file icmp_socket.cpp
 * @brief ICMP echo socket implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/net/icmp_socket.hpp"
#include "netmap/utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>

namespace netmap {
namespace net {

namespace {

constexpr uint8_t kEchoRequest = 8;
constexpr uint8_t kEchoReply = 0;
constexpr size_t kIcmpHeaderSize = 8;

}  // namespace

uint16_t internetChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;
    size_t i = 0;
    for (; i + 1 < length; i += 2) {
        sum += static_cast<uint32_t>(data[i] << 8 | data[i + 1]);
    }
    if (i < length) {
        sum += static_cast<uint32_t>(data[i] << 8);
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> buildEchoRequest(uint16_t identifier,
                                      uint16_t sequence,
                                      const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> packet(kIcmpHeaderSize + payload.size(), 0);
    packet[0] = kEchoRequest;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);
    std::copy(payload.begin(), payload.end(), packet.begin() + kIcmpHeaderSize);

    uint16_t checksum = internetChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);
    return packet;
}

IcmpSocket::IcmpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , raw_(false)
    , identifier_(static_cast<uint16_t>(::getpid() & 0xFFFF))
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        socket_ = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        raw_ = socket_ != INVALID_SOCKET_HANDLE;
    }
    if (socket_ == INVALID_SOCKET_HANDLE) {
        lastError_ = getLastSocketError();
        LOG_DEBUG("IcmpSocket", "No ICMP socket available: {}", std::strerror(lastError_));
    }
}

IcmpSocket::~IcmpSocket() {
    if (isValid()) {
        closeSocket(socket_);
    }
}

EchoReply IcmpSocket::echo(const std::string& ip, uint16_t sequence, int timeoutMs) {
    EchoReply reply;
    if (!isValid()) {
        reply.error = "icmp socket unavailable";
        return reply;
    }

    struct sockaddr_in dest{};
    if (!makeSockaddr(ip, 0, dest)) {
        reply.error = "invalid address " + ip;
        return reply;
    }

    std::vector<uint8_t> payload(32);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>('a' + i % 26);
    }
    auto packet = buildEchoRequest(identifier_, sequence, payload);

    auto start = std::chrono::steady_clock::now();
    if (::sendto(socket_, packet.data(), packet.size(), 0,
                 reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) < 0) {
        lastError_ = getLastSocketError();
        reply.error = std::strerror(lastError_);
        return reply;
    }

    auto deadline = start + std::chrono::milliseconds(timeoutMs);
    uint8_t buffer[1500];

    // Other echo traffic can arrive on the same socket; keep reading until the
    // matching reply or the deadline.
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return reply;
        }
        int remaining = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
        if (waitFor(socket_, POLLIN, remaining) <= 0) {
            return reply;
        }

        struct sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        ssize_t n = ::recvfrom(socket_, buffer, sizeof(buffer), 0,
                               reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        if (n <= 0) {
            continue;
        }
        if (from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        size_t offset = 0;
        if (raw_) {
            offset = static_cast<size_t>(buffer[0] & 0x0F) * 4;
        }
        if (static_cast<size_t>(n) < offset + kIcmpHeaderSize) {
            continue;
        }

        const uint8_t* icmp = buffer + offset;
        uint16_t replySeq = static_cast<uint16_t>(icmp[6] << 8 | icmp[7]);
        uint16_t replyId = static_cast<uint16_t>(icmp[4] << 8 | icmp[5]);
        if (icmp[0] != kEchoReply || replySeq != sequence) {
            continue;
        }
        // Datagram sockets get their identifier rewritten by the kernel.
        if (raw_ && replyId != identifier_) {
            continue;
        }

        reply.replied = true;
        reply.rttMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        return reply;
    }
}

}  // namespace net
}  // namespace netmap
