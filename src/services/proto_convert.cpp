/**
 * @file proto_convert.cpp
 * @brief Core model to protobuf conversion.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/services/proto_convert.hpp"
#include "netmap/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

namespace netmap {
namespace services {

namespace {

void toProto(const core::AccessMethods& in, v1::AccessMethods* out) {
    out->set_ping(in.ping);
    out->set_snmp(in.snmp);
    out->set_ssh(in.ssh);
    out->set_telnet(in.telnet);
}

void toProto(const core::VlanInfo& in, v1::Vlan* out) {
    out->set_id(in.id);
    out->set_name(in.name);
    out->set_state(in.state);
}

void toProto(const core::LinkEndpoint& in, v1::LinkEndpoint* out) {
    out->set_ip(in.ip);
    out->set_hostname(in.hostname);
    out->set_port(in.port);
}

template<typename Map>
void copyCounts(const std::map<std::string, size_t>& in, Map* out) {
    for (const auto& [key, count] : in) {
        (*out)[key] = static_cast<uint32_t>(count);
    }
}

}  // namespace

void toProto(const core::InterfaceInfo& in, v1::Interface* out) {
    out->set_name(in.name);
    out->set_index(in.index);
    out->set_description(in.description);
    out->set_type(in.type);
    out->set_mtu(in.mtu);
    out->set_speed(in.speed);
    out->set_mac_address(in.macAddress);
    out->set_ip_address(in.ipAddress);
    out->set_admin_status(core::toString(in.adminStatus));
    out->set_oper_status(core::toString(in.operStatus));

    auto* counters = out->mutable_counters();
    counters->set_in_octets(in.counters.inOctets);
    counters->set_out_octets(in.counters.outOctets);
    counters->set_in_errors(in.counters.inErrors);
    counters->set_out_errors(in.counters.outErrors);
}

void toProto(const core::NeighborEdge& in, v1::NeighborEdge* out) {
    out->set_from_ip(in.fromIp);
    out->set_local_interface(in.localInterface);
    out->set_to_ip(in.toIp);
    out->set_to_device_id(in.toDeviceId);
    out->set_remote_interface(in.remoteInterface);
    out->set_platform(in.platform);
    out->set_remote_mac(in.remoteMac);
    out->set_protocol(core::toString(in.protocol));
    out->set_confidence(core::toString(in.confidence));
}

void toProto(const core::Device& in, v1::Device* out) {
    out->set_ip(in.ip);
    out->set_hostname(in.hostname);
    out->set_vendor(in.vendor);
    out->set_model(in.model);
    out->set_os_version(in.osVersion);

    auto* system = out->mutable_system();
    system->set_description(in.system.description);
    system->set_object_id(in.system.objectId);
    system->set_contact(in.system.contact);
    system->set_location(in.system.location);
    system->set_uptime_seconds(in.system.uptimeSeconds);
    system->set_services(in.system.services);

    for (const auto& [name, iface] : in.interfaces) {
        toProto(iface, out->add_interfaces());
    }
    for (const auto& addr : in.ipAddresses) {
        auto* entry = out->add_ip_addresses();
        entry->set_address(addr.address);
        entry->set_netmask(addr.netmask);
        entry->set_interface_name(addr.interfaceName);
    }
    for (const auto& mac : in.macTable) {
        auto* entry = out->add_mac_table();
        entry->set_mac_address(mac.macAddress);
        entry->set_port(mac.port);
        entry->set_vlan(mac.vlan);
        entry->set_status(core::toString(mac.status));
    }
    for (const auto& arp : in.arpTable) {
        auto* entry = out->add_arp_table();
        entry->set_ip(arp.ip);
        entry->set_mac_address(arp.macAddress);
        entry->set_interface_name(arp.interfaceName);
        entry->set_type(core::toString(arp.type));
    }
    for (const auto& route : in.routingTable) {
        auto* entry = out->add_routing_table();
        entry->set_network(route.network);
        entry->set_next_hop(route.nextHop);
        entry->set_interface_name(route.interfaceName);
        entry->set_protocol(route.protocol);
        entry->set_admin_distance(route.adminDistance);
        entry->set_metric(route.metric);
    }
    for (const auto& vlan : in.vlans) {
        toProto(vlan, out->add_vlans());
    }
    for (const auto& edge : in.neighbors) {
        toProto(edge, out->add_neighbors());
    }

    toProto(in.methods, out->mutable_methods());
    out->set_discovery_method(core::toString(in.discoveryMethod));
    out->set_ping_rtt_ms(in.pingRttMs);
    for (const auto& capability : in.capabilities) {
        out->add_capabilities(capability);
    }
    if (in.lastDiscovered.time_since_epoch().count() != 0) {
        out->set_last_discovered(core::formatTimestamp(in.lastDiscovered));
    }
    out->set_status(core::toString(in.status));
    out->set_error(in.error);
}

void toProto(const core::Link& in, v1::Link* out) {
    out->set_id(in.id);
    out->set_source(in.source);
    out->set_target(in.target);
    out->set_source_hostname(in.sourceHostname);
    out->set_target_hostname(in.targetHostname);
    out->set_source_interface(in.sourceInterface);
    out->set_target_interface(in.targetInterface);
    out->set_type(in.type);
    out->set_confidence(core::toString(in.confidence));
    out->set_protocol(in.protocol);
    out->set_vlan(in.vlan);
    out->set_evidence_mac(in.evidenceMac);
    out->set_trunk(in.trunk);
}

void toProto(const core::InferredLink& in, v1::InferredLink* out) {
    out->set_key(in.key);
    toProto(in.device1, out->mutable_device1());
    toProto(in.device2, out->mutable_device2());
    out->set_confidence(core::toString(in.confidence));
    out->set_vlan(in.vlan);
    out->set_evidence_mac(in.evidenceMac);
    out->set_primary_fanout(static_cast<uint32_t>(in.primaryFanout));
    out->set_trunk(in.trunk);
}

void toProto(const core::Topology& in, v1::Topology* out) {
    for (const auto& node : in.nodes) {
        auto* n = out->add_nodes();
        n->set_id(node.id);
        n->set_label(node.label);
        n->set_ip(node.ip);
        n->set_vendor(node.vendor);
        n->set_model(node.model);
        n->set_type(node.type);
        for (const auto& capability : node.capabilities) {
            n->add_capabilities(capability);
        }
        toProto(node.methods, n->mutable_methods());
        n->set_discovery_method(core::toString(node.discoveryMethod));
        n->set_status(core::toString(node.status));
        for (const auto& iface : node.interfaces) {
            toProto(iface, n->add_interfaces());
        }
        for (const auto& vlan : node.vlans) {
            toProto(vlan, n->add_vlans());
        }
    }
    for (const auto& link : in.links) {
        toProto(link, out->add_links());
    }

    auto* summary = out->mutable_summary();
    summary->set_total_devices(static_cast<uint32_t>(in.summary.totalDevices));
    summary->set_total_connections(static_cast<uint32_t>(in.summary.totalConnections));
    copyCounts(in.summary.deviceTypes, summary->mutable_device_types());
    copyCounts(in.summary.vendors, summary->mutable_vendors());
    copyCounts(in.summary.discoveryMethods, summary->mutable_discovery_methods());
    copyCounts(in.summary.confidence, summary->mutable_confidence());
}

void toProto(const core::DiscoveryProgress& in, const std::string& runId,
             v1::DiscoveryProgress* out) {
    out->set_run_id(runId);
    out->set_phase(core::toString(in.phase));
    out->set_total(static_cast<uint32_t>(in.total));
    out->set_completed(static_cast<uint32_t>(in.completed));
    out->set_current_device(in.currentDevice);
    out->set_iteration(in.iteration);
    out->set_iteration_cap_reached(in.iterationCapReached);

    for (const auto& entry : in.devices) {
        auto* device = out->add_devices();
        device->set_ip(entry.ip);
        device->set_hostname(entry.hostname);
        device->set_vendor(entry.vendor);
        device->set_method(core::toString(entry.method));
        device->set_status(core::toString(entry.status));
        device->set_timestamp(core::formatTimestamp(entry.timestamp));
    }
    for (const auto& error : in.errors) {
        out->add_errors(error);
    }
    if (in.startedAt.time_since_epoch().count() != 0) {
        out->set_started_at(core::formatTimestamp(in.startedAt));
    }
    if (in.updatedAt.time_since_epoch().count() != 0) {
        out->set_updated_at(core::formatTimestamp(in.updatedAt));
    }
}

void toProto(const core::DiscoveryResult& in, const std::string& runId,
             v1::DiscoveryResult* out) {
    out->set_run_id(runId);
    for (const auto& device : in.devices) {
        toProto(device, out->add_devices());
    }

    auto* neighbors = out->mutable_neighbor_relationships();
    for (const auto& [ip, edges] : in.neighborRelationships) {
        v1::NeighborList& list = (*neighbors)[ip];
        for (const auto& edge : edges) {
            toProto(edge, list.add_edges());
        }
    }

    for (const auto& [mac, locations] : in.macAddressMappings) {
        auto* mapping = out->add_mac_address_mappings();
        mapping->set_mac_address(mac);
        for (const auto& location : locations) {
            auto* loc = mapping->add_locations();
            loc->set_device_ip(location.deviceIp);
            loc->set_device_name(location.deviceName);
            loc->set_port(location.port);
            loc->set_vlan(location.vlan);
        }
    }

    for (const auto& link : in.inferredLinks) {
        toProto(link, out->add_inferred_links());
    }

    auto* connections = out->mutable_interface_connections();
    for (const auto& [key, link] : in.interfaceConnections) {
        toProto(link, &(*connections)[key]);
    }

    toProto(in.topology, out->mutable_topology());
    toProto(in.progress, runId, out->mutable_progress());
}

std::string toJson(const v1::DiscoveryResult& result, bool pretty) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = pretty;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(result, &json, options);
    if (!status.ok()) {
        LOG_ERROR("ProtoConvert", "JSON conversion failed: {}", status.ToString());
        return "";
    }
    return json;
}

}  // namespace services
}  // namespace netmap
