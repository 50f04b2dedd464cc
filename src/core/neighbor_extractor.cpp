/**
 * @file neighbor_extractor.cpp
 * @brief NeighborExtractor implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/neighbor_extractor.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

namespace netmap {
namespace core {

NeighborExtractor::NeighborExtractor(std::shared_ptr<ProtocolProbe> probe,
                                     std::chrono::milliseconds timeout)
    : probe_(std::move(probe))
    , timeout_(timeout)
{
}

std::vector<NeighborEdge> NeighborExtractor::arpEdges(const Device& device) {
    std::vector<NeighborEdge> edges;
    for (const auto& entry : device.arpTable) {
        if (entry.type != ArpType::DYNAMIC) {
            continue;
        }
        if (entry.ip == device.ip || !utils::is_ipv4(entry.ip)) {
            continue;
        }
        NeighborEdge edge;
        edge.fromIp = device.ip;
        edge.localInterface = entry.interfaceName;
        edge.toIp = entry.ip;
        edge.remoteMac = entry.macAddress;
        edge.protocol = NeighborProtocol::ARP;
        edge.confidence = Confidence::LOW;
        edges.push_back(edge);
    }
    return edges;
}

std::vector<NeighborEdge> NeighborExtractor::extractNeighbors(
    const Device& device,
    const std::optional<SnmpCredential>& snmpCredential,
    std::vector<std::string>& errors) const {

    std::vector<NeighborEdge> edges(device.neighbors.begin(), device.neighbors.end());
    size_t fromProbe = edges.size();

    size_t fromQuery = 0;
    if (snmpCredential && probe_) {
        try {
            auto extra = probe_->probeNeighbors(device.ip, *snmpCredential, timeout_);
            if (extra) {
                for (auto edge : *extra) {
                    edge.fromIp = device.ip;
                    edges.push_back(std::move(edge));
                    ++fromQuery;
                }
            } else {
                LOG_DEBUG("NeighborExtractor", "{} neighbor query failed: {}",
                          device.ip, extra.error());
            }
        } catch (const std::exception& e) {
            std::string message = device.ip + ": neighbor query raised: " + e.what();
            LOG_WARN("NeighborExtractor", "{}", message);
            errors.push_back(message);
        }
    }

    auto arp = arpEdges(device);
    edges.insert(edges.end(), arp.begin(), arp.end());

    LOG_DEBUG("NeighborExtractor", "{}: {} probed, {} queried, {} arp edge(s)",
              device.ip, fromProbe, fromQuery, arp.size());
    return edges;
}

}  // namespace core
}  // namespace netmap
