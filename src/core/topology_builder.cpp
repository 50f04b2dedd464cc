/**
 * @file topology_builder.cpp
 * @brief TopologyBuilder implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/topology_builder.hpp"
#include "netmap/core/classification.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

#include <utility>

namespace netmap {
namespace core {

namespace {

using DevicePair = std::pair<std::string, std::string>;

DevicePair unorderedPair(const std::string& a, const std::string& b) {
    return a < b ? DevicePair{a, b} : DevicePair{b, a};
}

bool compatibleInterface(const std::string& a, const std::string& b) {
    return a.empty() || b.empty() || utils::to_lower(a) == utils::to_lower(b);
}

void fillEmpty(std::string& target, const std::string& source) {
    if (target.empty()) {
        target = source;
    }
}

/**
 * Lookup tables for resolving the remote end of a neighbor edge.
 */
class DeviceIndex {
public:
    explicit DeviceIndex(const std::vector<Device>& devices) {
        for (const auto& device : devices) {
            byIp_.emplace(device.ip, &device);
        }
        for (const auto& device : devices) {
            for (const auto& addr : device.ipAddresses) {
                if (!addr.address.empty() && !byIp_.count(addr.address)) {
                    byAddress_.emplace(addr.address, device.ip);
                }
            }
            for (const auto& [name, info] : device.interfaces) {
                if (!info.ipAddress.empty() && !byIp_.count(info.ipAddress)) {
                    byAddress_.emplace(info.ipAddress, device.ip);
                }
            }
            std::string host = TopologyBuilder::normalizeHostname(device.hostname);
            if (!host.empty()) {
                byHostname_.emplace(host, device.ip);
            }
        }
    }

    const Device* find(const std::string& ip) const {
        auto it = byIp_.find(ip);
        return it == byIp_.end() ? nullptr : it->second;
    }

    std::string resolve(const NeighborEdge& edge) const {
        if (!edge.toIp.empty()) {
            if (byIp_.count(edge.toIp)) {
                return edge.toIp;
            }
            auto it = byAddress_.find(edge.toIp);
            if (it != byAddress_.end()) {
                return it->second;
            }
        }
        std::string host = TopologyBuilder::normalizeHostname(edge.toDeviceId);
        if (!host.empty()) {
            auto it = byHostname_.find(host);
            if (it != byHostname_.end()) {
                return it->second;
            }
        }
        return "";
    }

    std::string label(const std::string& ip) const {
        const Device* device = find(ip);
        if (device && !device->hostname.empty()) {
            return device->hostname;
        }
        return ip;
    }

private:
    std::map<std::string, const Device*> byIp_;
    std::map<std::string, std::string> byAddress_;
    std::map<std::string, std::string> byHostname_;
};

}  // namespace

std::string TopologyBuilder::normalizeHostname(const std::string& name) {
    std::string host = utils::to_lower(utils::trim(name));
    size_t paren = host.find('(');
    if (paren != std::string::npos) {
        host = host.substr(0, paren);
    }
    size_t dot = host.find('.');
    if (dot != std::string::npos && !utils::is_ipv4(host)) {
        host = host.substr(0, dot);
    }
    return utils::trim(host);
}

TopologyBuilder::ConnectionMap TopologyBuilder::mapConnections(
    const std::vector<Device>& devices,
    const NeighborMap& neighbors,
    const std::vector<InferredLink>& inferred) const {

    DeviceIndex index(devices);
    ConnectionMap connections;
    std::map<DevicePair, std::vector<std::string>> highLinks;
    size_t unresolved = 0;

    for (const auto& [deviceIp, edges] : neighbors) {
        for (const auto& edge : edges) {
            if (edge.protocol == NeighborProtocol::ARP || edge.confidence < Confidence::HIGH) {
                continue;
            }
            const std::string& from = edge.fromIp.empty() ? deviceIp : edge.fromIp;
            if (!index.find(from)) {
                continue;
            }
            std::string remote = index.resolve(edge);
            if (remote.empty()) {
                ++unresolved;
                continue;
            }
            if (remote == from) {
                continue;
            }

            auto& existing = highLinks[unorderedPair(from, remote)];
            bool merged = false;
            for (const auto& id : existing) {
                Link& link = connections[id];
                bool forward = link.source == from;
                const std::string& localSide = forward ? link.sourceInterface : link.targetInterface;
                const std::string& remoteSide = forward ? link.targetInterface : link.sourceInterface;
                if (compatibleInterface(localSide, edge.localInterface) &&
                    compatibleInterface(remoteSide, edge.remoteInterface)) {
                    if (forward) {
                        fillEmpty(link.sourceInterface, edge.localInterface);
                        fillEmpty(link.targetInterface, edge.remoteInterface);
                    } else {
                        fillEmpty(link.targetInterface, edge.localInterface);
                        fillEmpty(link.sourceInterface, edge.remoteInterface);
                    }
                    merged = true;
                    break;
                }
            }
            if (merged) {
                continue;
            }

            Link link;
            link.id = from + ":" + edge.localInterface + "-" + remote + ":" + edge.remoteInterface;
            link.source = from;
            link.target = remote;
            link.sourceHostname = index.label(from);
            link.targetHostname = index.label(remote);
            link.sourceInterface = edge.localInterface;
            link.targetInterface = edge.remoteInterface;
            link.protocol = toString(edge.protocol);
            link.type = utils::to_lower(link.protocol);
            link.confidence = Confidence::HIGH;

            if (connections.emplace(link.id, link).second) {
                existing.push_back(link.id);
            }
        }
    }

    size_t suppressed = 0;
    for (const auto& candidate : inferred) {
        if (!index.find(candidate.device1.ip) || !index.find(candidate.device2.ip)) {
            continue;
        }
        auto pair = unorderedPair(candidate.device1.ip, candidate.device2.ip);
        auto it = highLinks.find(pair);
        if (it != highLinks.end() && !it->second.empty()) {
            ++suppressed;
            continue;
        }

        Link link;
        link.id = candidate.key;
        link.source = candidate.device1.ip;
        link.target = candidate.device2.ip;
        link.sourceHostname = index.label(candidate.device1.ip);
        link.targetHostname = index.label(candidate.device2.ip);
        link.sourceInterface = candidate.device1.port;
        link.targetInterface = candidate.device2.port;
        link.type = InferredLink::type();
        link.confidence = candidate.confidence;
        link.vlan = candidate.vlan;
        link.evidenceMac = candidate.evidenceMac;
        link.trunk = candidate.trunk;
        connections.emplace(link.id, link);
    }

    LOG_INFO("TopologyBuilder", "Mapped {} connection(s) ({} unresolved edge(s), {} inferred link(s) superseded)",
             connections.size(), unresolved, suppressed);
    return connections;
}

Topology TopologyBuilder::build(const std::vector<Device>& devices,
                                const ConnectionMap& connections) const {
    Topology topology;

    std::map<std::string, const Device*> byIp;
    for (const auto& device : devices) {
        byIp.emplace(device.ip, &device);
    }

    for (const auto& [ip, device] : byIp) {
        TopologyNode node;
        node.id = ip;
        node.ip = ip;
        node.label = device->hostname.empty() ? ip : device->hostname;
        node.vendor = device->vendor.empty() ? "unknown" : device->vendor;
        node.model = device->model;
        node.type = deviceTypeOf(*device);
        node.capabilities = device->capabilities;
        node.methods = device->methods;
        node.discoveryMethod = device->discoveryMethod;
        node.status = device->status;
        for (const auto& [name, info] : device->interfaces) {
            node.interfaces.push_back(info);
        }
        node.vlans = device->vlans;

        ++topology.summary.deviceTypes[node.type];
        ++topology.summary.vendors[node.vendor];
        ++topology.summary.discoveryMethods[toString(node.discoveryMethod)];
        topology.nodes.push_back(std::move(node));
    }

    for (const auto& [id, link] : connections) {
        ++topology.summary.confidence[toString(link.confidence)];
        topology.links.push_back(link);
    }

    topology.summary.totalDevices = topology.nodes.size();
    topology.summary.totalConnections = topology.links.size();
    return topology;
}

Topology TopologyBuilder::build(const std::vector<Device>& devices,
                                const NeighborMap& neighbors,
                                const std::vector<InferredLink>& inferred) const {
    return build(devices, mapConnections(devices, neighbors, inferred));
}

}  // namespace core
}  // namespace netmap
