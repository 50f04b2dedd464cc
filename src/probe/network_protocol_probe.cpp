/**
 * @file network_protocol_probe.cpp
 * @brief NetworkProtocolProbe implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/network_protocol_probe.hpp"
#include "netmap/probe/snmp_client.hpp"
#include "netmap/probe/snmp_probe.hpp"
#include "netmap/utils/logger.hpp"

#include <algorithm>
#include <variant>

namespace netmap {
namespace probe {

NetworkProtocolProbe::NetworkProtocolProbe(NetworkProbeOptions options,
                                           CliSessionFactory factory,
                                           PlatformDecoderRegistry registry)
    : options_(options)
    , cli_(std::move(factory), std::move(registry))
{
}

core::ReachabilityResult NetworkProtocolProbe::checkReachability(const std::string& ip,
                                                                 std::chrono::milliseconds timeout) {
    return reachability_.check(ip, timeout);
}

core::ProbeResult NetworkProtocolProbe::probe(const std::string& ip,
                                              core::Protocol protocol,
                                              const core::Credential& credential,
                                              std::chrono::milliseconds timeout) {
    if (protocol == core::Protocol::SNMP) {
        const auto* snmp = std::get_if<core::SnmpCredential>(&credential);
        if (snmp == nullptr) {
            return core::ProbeResult::failure("snmp probe requires an snmp credential");
        }
        UdpSnmpClient client(ip, *snmp, snmpTimeout(timeout), options_.maxRepetitions);
        SnmpProbe battery(ip, client, options_.maxRowsPerWalk);
        auto result = battery.collect();
        if (!result.accessible) {
            LOG_DEBUG("NetworkProbe", "{}: snmp set '{}' failed: {}", ip, snmp->setId, result.error);
        }
        return result;
    }

    const auto* login = std::get_if<core::LoginCredential>(&credential);
    if (login == nullptr) {
        return core::ProbeResult::failure(std::string(core::toString(protocol)) +
                                          " probe requires a login credential");
    }
    return cli_.probe(ip, protocol, *login, timeout);
}

core::Result<std::vector<core::NeighborEdge>> NetworkProtocolProbe::probeNeighbors(
    const std::string& ip,
    const core::SnmpCredential& credential,
    std::chrono::milliseconds timeout) {
    UdpSnmpClient client(ip, credential, snmpTimeout(timeout), options_.maxRepetitions);
    SnmpProbe battery(ip, client, options_.maxRowsPerWalk);
    return battery.collectNeighbors();
}

std::chrono::milliseconds NetworkProtocolProbe::snmpTimeout(std::chrono::milliseconds probeTimeout) const {
    if (probeTimeout.count() <= 0) {
        return options_.snmpRequestTimeout;
    }
    return std::min(options_.snmpRequestTimeout, probeTimeout);
}

}  // namespace probe
}  // namespace netmap
