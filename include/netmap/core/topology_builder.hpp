/**
 * @file topology_builder.hpp
 * @brief Assembles nodes, links and summary from a discovery run.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/device.hpp"
#include "netmap/core/mac_table_analyzer.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace netmap {
namespace core {

/**
 * @struct Link
 * @brief One undirected connection between two known devices.
 */
struct NETMAP_CORE_API Link {
    std::string id;                 ///< "sourceIp:ifA-targetIp:ifB"
    std::string source;
    std::string target;
    std::string sourceHostname;
    std::string targetHostname;
    std::string sourceInterface;
    std::string targetInterface;
    std::string type;               ///< cdp, lldp or learned_from_mac
    Confidence confidence = Confidence::HIGH;
    std::string protocol;           ///< CDP/LLDP, empty for inferred links
    int vlan = 0;                   ///< 0 when not applicable
    std::string evidenceMac;
    bool trunk = false;
};

struct NETMAP_CORE_API TopologyNode {
    std::string id;                 ///< ip
    std::string label;              ///< hostname, or ip
    std::string ip;
    std::string vendor;
    std::string model;
    std::string type;               ///< router, switch, firewall or host
    std::vector<std::string> capabilities;
    AccessMethods methods;
    DiscoveryMethod discoveryMethod = DiscoveryMethod::UNKNOWN;
    DeviceStatus status = DeviceStatus::UNKNOWN;
    std::vector<InterfaceInfo> interfaces;
    std::vector<VlanInfo> vlans;
};

struct NETMAP_CORE_API TopologySummary {
    size_t totalDevices = 0;
    size_t totalConnections = 0;
    std::map<std::string, size_t> deviceTypes;
    std::map<std::string, size_t> vendors;
    std::map<std::string, size_t> discoveryMethods;
    std::map<std::string, size_t> confidence;
};

struct NETMAP_CORE_API Topology {
    std::vector<TopologyNode> nodes;
    std::vector<Link> links;
    TopologySummary summary;
};

/**
 * @class TopologyBuilder
 * @brief Reconciles neighbor edges and inferred links into one link table.
 *
 * CDP/LLDP edges become high-confidence links when both ends resolve to a
 * known device. The remote end resolves by management IP, then by any
 * interface address of a device, then by hostname (case-insensitive, domain
 * suffix and serial suffix ignored). Mirror observations of the same cable
 * collapse into one link. ARP edges never produce links. An inferred link is
 * dropped when its device pair already has a high-confidence link.
 *
 * Usage:
 * @code
 * TopologyBuilder builder;
 * auto connections = builder.mapConnections(devices, neighbors, analysis.links);
 * Topology topology = builder.build(devices, connections);
 * @endcode
 */
class NETMAP_CORE_API TopologyBuilder {
public:
    using NeighborMap = std::map<std::string, std::vector<NeighborEdge>>;
    using ConnectionMap = std::map<std::string, Link>;

    /**
     * @brief Build the keyed link table.
     */
    ConnectionMap mapConnections(const std::vector<Device>& devices,
                                 const NeighborMap& neighbors,
                                 const std::vector<InferredLink>& inferred) const;

    /**
     * @brief Nodes, links and summary for an already-mapped link table.
     */
    Topology build(const std::vector<Device>& devices,
                   const ConnectionMap& connections) const;

    /**
     * @brief mapConnections() followed by build().
     */
    Topology build(const std::vector<Device>& devices,
                   const NeighborMap& neighbors,
                   const std::vector<InferredLink>& inferred) const;

    /**
     * @brief Reduce a hostname or device id to its comparable short form.
     *
     * "SW-Core-1.example.com" and "sw-core-1(FOC1234X)" both become "sw-core-1".
     */
    static std::string normalizeHostname(const std::string& name);
};

}  // namespace core
}  // namespace netmap
