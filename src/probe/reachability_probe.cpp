/**
 * @file reachability_probe.cpp
 * @brief ReachabilityProbe implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/reachability_probe.hpp"
#include "netmap/net/icmp_socket.hpp"
#include "netmap/net/tcp_socket.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

namespace netmap {
namespace probe {

ReachabilityProbe::ReachabilityProbe(std::vector<uint16_t> fallbackPorts)
    : fallbackPorts_(std::move(fallbackPorts))
    , sequence_(1)
{
}

core::ReachabilityResult ReachabilityProbe::check(const std::string& ip,
                                                  std::chrono::milliseconds timeout) {
    core::ReachabilityResult result;
    if (!utils::is_ipv4(ip)) {
        result.error = "invalid address " + ip;
        return result;
    }

    net::IcmpSocket socket;
    if (!socket.isValid()) {
        LOG_TRACE("Reachability", "{}: no ICMP socket, using TCP fallback", ip);
        return checkTcp(ip, timeout);
    }

    auto reply = socket.echo(ip, sequence_.fetch_add(1), static_cast<int>(timeout.count()));
    result.alive = reply.replied;
    result.rttMs = reply.rttMs;
    if (!reply.error.empty()) {
        result.error = reply.error;
    } else if (!reply.replied) {
        result.error = "no echo reply within " + std::to_string(timeout.count()) + " ms";
    }
    return result;
}

core::ReachabilityResult ReachabilityProbe::checkTcp(const std::string& ip,
                                                     std::chrono::milliseconds timeout) {
    core::ReachabilityResult result;
    auto start = std::chrono::steady_clock::now();

    for (uint16_t port : fallbackPorts_) {
        net::TcpSocket socket;
        auto outcome = socket.connect(ip, port, static_cast<int>(timeout.count()));
        if (outcome == net::ConnectResult::CONNECTED || outcome == net::ConnectResult::REFUSED) {
            result.alive = true;
            result.rttMs = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start).count();
            return result;
        }
    }

    result.error = "no response on fallback ports";
    return result;
}

}  // namespace probe
}  // namespace netmap
