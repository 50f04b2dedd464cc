/**
 * @file network_protocol_probe.hpp
 * @brief ProtocolProbe over the real network: ICMP, SNMP, SSH and Telnet.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/probe/cli_probe.hpp"
#include "netmap/probe/reachability_probe.hpp"
#include "netmap/core/protocol_probe.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace netmap {
namespace probe {

struct NETMAP_PROBE_API NetworkProbeOptions {
    /// Upper bound for a single SNMP request; the probe timeout caps it further.
    std::chrono::milliseconds snmpRequestTimeout{2000};
    int32_t maxRepetitions = 25;     ///< GETBULK max-repetitions
    size_t maxRowsPerWalk = 0;       ///< 0 = unlimited
};

/**
 * @class NetworkProtocolProbe
 * @brief Production ProtocolProbe.
 *
 * Stateless between calls apart from the ICMP sequence counter, so one
 * instance serves every worker thread.
 */
class NETMAP_PROBE_API NetworkProtocolProbe : public core::ProtocolProbe {
public:
    explicit NetworkProtocolProbe(NetworkProbeOptions options = NetworkProbeOptions(),
                                  CliSessionFactory factory = defaultSessionFactory(),
                                  PlatformDecoderRegistry registry = PlatformDecoderRegistry::withBuiltins());

    core::ReachabilityResult checkReachability(const std::string& ip,
                                               std::chrono::milliseconds timeout) override;

    core::ProbeResult probe(const std::string& ip,
                            core::Protocol protocol,
                            const core::Credential& credential,
                            std::chrono::milliseconds timeout) override;

    core::Result<std::vector<core::NeighborEdge>> probeNeighbors(
        const std::string& ip,
        const core::SnmpCredential& credential,
        std::chrono::milliseconds timeout) override;

private:
    NetworkProbeOptions options_;
    ReachabilityProbe reachability_;
    CliProbe cli_;

    std::chrono::milliseconds snmpTimeout(std::chrono::milliseconds probeTimeout) const;
};

}  // namespace probe
}  // namespace netmap
