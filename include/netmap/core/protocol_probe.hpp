/**
 * @file protocol_probe.hpp
 * @brief Abstract single-device, single-protocol discovery attempt.
 *
 * The discovery core only talks to the network through this interface. The
 * probe library supplies the real implementation; tests substitute scripted
 * fakes.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/credentials.hpp"
#include "netmap/core/device.hpp"
#include "netmap/core/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace netmap {
namespace core {

struct NETMAP_CORE_API ReachabilityResult {
    bool alive = false;
    double rttMs = 0.0;
    std::string error;
};

/**
 * @struct ProbeResult
 * @brief Outcome of one protocol attempt with one credential.
 *
 * accessible is false on connect, authentication or negotiation failure and
 * error carries the reason. facts may be partial when some fact groups were
 * unavailable.
 */
struct NETMAP_CORE_API ProbeResult {
    bool accessible = false;
    DeviceFacts facts;
    std::string error;

    static ProbeResult failure(std::string reason) {
        ProbeResult r;
        r.error = std::move(reason);
        return r;
    }
};

/**
 * @class ProtocolProbe
 * @brief Network access used by the device prober and neighbor extractor.
 *
 * Implementations must be safe to call from several worker threads at once
 * for different IPs. Failures are reported in the return value; exceptions
 * escaping a call are treated by callers as a failed attempt.
 */
class NETMAP_CORE_API ProtocolProbe {
public:
    virtual ~ProtocolProbe() = default;

    /**
     * @brief Single bounded echo exchange.
     */
    virtual ReachabilityResult checkReachability(const std::string& ip,
                                                 std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Structured probe over one protocol with one credential.
     * @param credential SnmpCredential for Protocol::SNMP, LoginCredential otherwise.
     */
    virtual ProbeResult probe(const std::string& ip,
                              Protocol protocol,
                              const Credential& credential,
                              std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Query only the neighbor-protocol tables (CDP, LLDP) over SNMP.
     */
    virtual Result<std::vector<NeighborEdge>> probeNeighbors(
        const std::string& ip,
        const SnmpCredential& credential,
        std::chrono::milliseconds timeout) = 0;
};

}  // namespace core
}  // namespace netmap
