/**
 * @file snmp_probe.hpp
 * @brief SNMP fact battery for one device.
 *
 * The system group decides accessibility. Every other group (interfaces,
 * addresses, ARP, forwarding table, VLANs, CDP, LLDP) is fetched on its own
 * and contributes an empty list when the agent does not implement it or the
 * walk fails.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/probe/snmp_client.hpp"
#include "netmap/core/device.hpp"
#include "netmap/core/protocol_probe.hpp"
#include "netmap/core/result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace netmap {
namespace probe {

/// Rows of one conceptual table: index suffix -> column number -> value.
using TableRows = std::map<std::string, std::map<int, SnmpValue>>;

/**
 * @class SnmpProbe
 * @brief Collects DeviceFacts from one agent through an SnmpClient.
 *
 * Usage:
 * @code
 * UdpSnmpClient client(ip, credential, timeout);
 * SnmpProbe probe(ip, client);
 * core::ProbeResult result = probe.collect();
 * @endcode
 */
class NETMAP_PROBE_API SnmpProbe {
public:
    /**
     * @param ip Address of the agent, used as fromIp on neighbor edges.
     * @param client Transport; must outlive the probe.
     * @param maxRows Per-walk row cap (0 = unlimited).
     */
    SnmpProbe(std::string ip, SnmpClient& client, size_t maxRows = 0);

    /**
     * @brief Run the whole battery.
     * @return accessible=false with the transport error when the system
     *         group cannot be read.
     */
    core::ProbeResult collect();

    /**
     * @brief CDP and LLDP tables only.
     * @return Failure only when neither table could be walked.
     */
    core::Result<std::vector<core::NeighborEdge>> collectNeighbors();

    /**
     * @brief Walk several columns of one table and join them by index.
     *
     * The first column is the key column: its failure fails the call and
     * only indexes it returns appear in the result. Other columns that fail
     * are left out of every row.
     */
    core::Result<TableRows> walkColumns(const std::vector<std::pair<int, std::string>>& columns);

private:
    std::string ip_;
    SnmpClient& client_;
    size_t maxRows_;

    std::map<int32_t, std::string> ifNames_;   ///< ifIndex -> interface name

    core::Result<bool> collectSystem(core::DeviceFacts& facts);
    void collectInterfaces(core::DeviceFacts& facts);
    void collectInterfaceNames();
    void collectIpAddresses(core::DeviceFacts& facts);
    void collectArpTable(core::DeviceFacts& facts);
    void collectMacTable(core::DeviceFacts& facts);
    void collectVlans(core::DeviceFacts& facts);
    core::Result<std::vector<core::NeighborEdge>> collectCdp();
    core::Result<std::vector<core::NeighborEdge>> collectLldp();

    std::map<int32_t, int32_t> bridgePortMap();
    std::string interfaceName(int32_t ifIndex) const;
};

/**
 * @brief Extract "12.2(55)SE" from a banner like "... Version 12.2(55)SE, ...".
 * @return Empty string if no version token is present.
 */
NETMAP_PROBE_API std::string versionFromDescription(const std::string& description);

/// IANAifType name for the common types, "type-N" otherwise.
NETMAP_PROBE_API std::string ifTypeName(int64_t type);

}  // namespace probe
}  // namespace netmap
