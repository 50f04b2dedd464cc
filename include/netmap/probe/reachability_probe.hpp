/**
 * @file reachability_probe.hpp
 * @brief Single-echo liveness check with a TCP fallback.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/core/protocol_probe.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace netmap {
namespace probe {

/**
 * @class ReachabilityProbe
 * @brief Sends one ICMP echo per call.
 *
 * When the process cannot open any ICMP socket (no ping_group_range and no
 * CAP_NET_RAW), a TCP connect to the management ports is used instead. A
 * refused connection counts as alive since only a live host sends the RST.
 */
class NETMAP_PROBE_API ReachabilityProbe {
public:
    explicit ReachabilityProbe(std::vector<uint16_t> fallbackPorts = {22, 23});

    core::ReachabilityResult check(const std::string& ip, std::chrono::milliseconds timeout);

    /// TCP-only variant, exposed for hosts where ICMP is filtered.
    core::ReachabilityResult checkTcp(const std::string& ip, std::chrono::milliseconds timeout);

private:
    std::vector<uint16_t> fallbackPorts_;
    std::atomic<uint16_t> sequence_;
};

}  // namespace probe
}  // namespace netmap
