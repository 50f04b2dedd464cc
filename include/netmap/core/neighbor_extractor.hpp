/**
 * @file neighbor_extractor.hpp
 * @brief Collects adjacency observations for an already-probed device.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/credentials.hpp"
#include "netmap/core/device.hpp"
#include "netmap/core/protocol_probe.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netmap {
namespace core {

/**
 * @class NeighborExtractor
 * @brief Merges neighbor-protocol data, a supplementary SNMP neighbor query
 *        and dynamic ARP entries into one edge list per device.
 *
 * Edges are accumulated as observed. Duplicates across sources and mirror
 * observations are left for the topology builder.
 */
class NETMAP_CORE_API NeighborExtractor {
public:
    NeighborExtractor(std::shared_ptr<ProtocolProbe> probe,
                      std::chrono::milliseconds timeout);

    /**
     * @brief Extract edges observed from device.
     * @param snmpCredential Credential that first succeeded for the device, if any.
     * @param errors Receives a message when the supplementary query raises.
     */
    std::vector<NeighborEdge> extractNeighbors(
        const Device& device,
        const std::optional<SnmpCredential>& snmpCredential,
        std::vector<std::string>& errors) const;

    /**
     * @brief Turn dynamic ARP entries into low-confidence ARP edges.
     */
    static std::vector<NeighborEdge> arpEdges(const Device& device);

private:
    std::shared_ptr<ProtocolProbe> probe_;
    std::chrono::milliseconds timeout_;
};

}  // namespace core
}  // namespace netmap
