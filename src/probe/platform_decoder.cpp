/**
 * @file platform_decoder.cpp
 * @brief Built-in platform decoders and the registry.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/platform_decoder.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

#include <algorithm>
#include <regex>

namespace netmap {
namespace probe {

namespace {

std::string firstMatch(const std::string& text, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(text, match, pattern) && match.size() > 1) {
        return utils::trim(match[1].str());
    }
    return "";
}

std::string firstNonEmptyLine(const std::string& text) {
    for (const auto& line : utils::split_lines(text)) {
        std::string trimmed = utils::trim(line);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return "";
}

std::string routeProtocol(const std::string& code) {
    switch (code.empty() ? ' ' : code[0]) {
        case 'C': return "connected";
        case 'L': return "local";
        case 'S': return "static";
        case 'O': return "ospf";
        case 'B': return "bgp";
        case 'D': return "eigrp";
        case 'R': return "rip";
        case 'i': return "isis";
        case 'E': return "egp";
        default: return "other";
    }
}

void addInterfaceAddress(core::DeviceFacts& facts, const std::string& name, const std::string& address) {
    core::IpAddressEntry entry;
    entry.address = address;
    entry.interfaceName = name;
    if (std::find(facts.ipAddresses.begin(), facts.ipAddresses.end(), entry) == facts.ipAddresses.end()) {
        facts.ipAddresses.push_back(entry);
    }
}

}  // namespace

uint64_t parseUptimeText(const std::string& text) {
    static const std::regex unit(R"((\d+)\s+(year|week|day|hour|minute|second)s?)", std::regex::icase);
    uint64_t seconds = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), unit); it != std::sregex_iterator(); ++it) {
        uint64_t count = std::stoull((*it)[1].str());
        std::string name = utils::to_lower((*it)[2].str());
        if (name == "year") seconds += count * 365 * 86400;
        else if (name == "week") seconds += count * 7 * 86400;
        else if (name == "day") seconds += count * 86400;
        else if (name == "hour") seconds += count * 3600;
        else if (name == "minute") seconds += count * 60;
        else seconds += count;
    }
    return seconds;
}

std::string interfaceTypeFromName(const std::string& name) {
    std::string lower = utils::to_lower(name);
    if (utils::starts_with(lower, "lo")) return "softwareLoopback";
    if (utils::starts_with(lower, "tu")) return "tunnel";
    if (utils::starts_with(lower, "po") || utils::starts_with(lower, "port-channel")) return "ieee8023adLag";
    if (utils::starts_with(lower, "vl")) return "l3ipvlan";
    if (lower.find("ethernet") != std::string::npos || utils::starts_with(lower, "gi") ||
        utils::starts_with(lower, "fa") || utils::starts_with(lower, "te") ||
        utils::starts_with(lower, "eth") || utils::starts_with(lower, "et")) {
        return "ethernetCsmacd";
    }
    return "other";
}

// =============================================================================
// GenericDecoder
// =============================================================================

void GenericDecoder::decodeVersion(const std::string& output, core::DeviceFacts& facts) const {
    static const std::regex version(R"(Version\s+([^\s,]+))", std::regex::icase);
    static const std::regex uptime(R"(uptime\s*(?::|is)?\s*([^\n]+))", std::regex::icase);

    if (facts.system.description.empty()) {
        facts.system.description = firstNonEmptyLine(output);
    }
    if (facts.osVersion.empty()) {
        facts.osVersion = firstMatch(output, version);
    }
    if (facts.system.uptimeSeconds == 0) {
        facts.system.uptimeSeconds = parseUptimeText(firstMatch(output, uptime));
    }
}

void GenericDecoder::decode(const std::string& command,
                            const std::string&,
                            const std::string&,
                            core::DeviceFacts&) const {
    LOG_TRACE("PlatformDecoder", "No generic decoding for '{}'", command);
}

// =============================================================================
// CiscoIosDecoder
// =============================================================================

std::vector<std::string> CiscoIosDecoder::commands() const {
    return {
        SHOW_IP_INTERFACE_BRIEF,
        SHOW_MAC_ADDRESS_TABLE,
        SHOW_IP_ARP,
        SHOW_IP_ROUTE,
        SHOW_CDP_NEIGHBORS,
        SHOW_LLDP_NEIGHBORS,
        SHOW_VLAN_BRIEF,
    };
}

void CiscoIosDecoder::decodeVersion(const std::string& output, core::DeviceFacts& facts) const {
    static const std::regex hostname(R"((?:^|\n)\s*(\S+)\s+uptime is)");
    static const std::regex uptime(R"(uptime is ([^\n]+))");
    static const std::regex model(R"((?:^|\n)\s*[Cc]isco\s+(\S+)\s+\([^)]*\)\s+processor)");
    static const std::regex modelNumber(R"(Model [Nn]umber\s*:\s*(\S+))");
    static const std::regex version(R"(Version\s+([^\s,]+))", std::regex::icase);

    if (facts.system.description.empty()) {
        facts.system.description = firstNonEmptyLine(output);
    }
    if (facts.hostname.empty()) {
        facts.hostname = firstMatch(output, hostname);
    }
    if (facts.model.empty()) {
        facts.model = firstMatch(output, model);
        if (facts.model.empty()) {
            facts.model = firstMatch(output, modelNumber);
        }
    }
    if (facts.osVersion.empty()) {
        facts.osVersion = firstMatch(output, version);
    }
    if (facts.system.uptimeSeconds == 0) {
        facts.system.uptimeSeconds = parseUptimeText(firstMatch(output, uptime));
    }
}

void CiscoIosDecoder::decode(const std::string& command,
                             const std::string& output,
                             const std::string& deviceIp,
                             core::DeviceFacts& facts) const {
    if (command == SHOW_IP_INTERFACE_BRIEF) {
        parseIpInterfaceBrief(output, facts);
    } else if (command == SHOW_MAC_ADDRESS_TABLE) {
        parseMacAddressTable(output, facts);
    } else if (command == SHOW_IP_ARP) {
        parseIpArp(output, facts);
    } else if (command == SHOW_IP_ROUTE) {
        parseIpRoute(output, facts);
    } else if (command == SHOW_VLAN_BRIEF) {
        parseVlanBrief(output, facts);
    } else if (command == SHOW_CDP_NEIGHBORS) {
        auto edges = parseCdpNeighbors(output, deviceIp);
        facts.neighbors.insert(facts.neighbors.end(), edges.begin(), edges.end());
    } else if (command == SHOW_LLDP_NEIGHBORS) {
        auto edges = parseLldpNeighbors(output, deviceIp);
        facts.neighbors.insert(facts.neighbors.end(), edges.begin(), edges.end());
    } else {
        LOG_DEBUG("PlatformDecoder", "cisco: no parser for '{}'", command);
    }
}

void CiscoIosDecoder::parseIpInterfaceBrief(const std::string& output, core::DeviceFacts& facts) const {
    // Interface  IP-Address  OK?  Method  Status  Protocol
    static const std::regex row(
        R"(^(\S+)\s+(\S+)\s+(?:YES|NO)\s+\S+\s+(up|down|administratively down|deleted)\s+(up|down)\s*$)");

    for (const auto& line : utils::split_lines(output)) {
        std::smatch match;
        if (!std::regex_match(line, match, row)) {
            continue;
        }
        core::InterfaceInfo info;
        info.name = match[1].str();
        info.type = interfaceTypeFromName(info.name);
        std::string address = match[2].str();
        if (utils::is_ipv4(address)) {
            info.ipAddress = address;
            addInterfaceAddress(facts, info.name, address);
        }
        std::string status = match[3].str();
        info.adminStatus = status == "administratively down" || status == "deleted"
                               ? core::InterfaceStatus::DOWN
                               : core::InterfaceStatus::UP;
        info.operStatus = core::parseInterfaceStatus(match[4].str());

        auto it = facts.interfaces.find(info.name);
        if (it == facts.interfaces.end()) {
            facts.interfaces.emplace(info.name, info);
        } else if (it->second.ipAddress.empty()) {
            it->second.ipAddress = info.ipAddress;
        }
    }
}

void CiscoIosDecoder::parseMacAddressTable(const std::string& output, core::DeviceFacts& facts) const {
    //  Vlan    Mac Address       Type        Ports
    static const std::regex row(
        R"(^\s*\*?\s*(\d+)\s+([0-9a-fA-F]{4}\.[0-9a-fA-F]{4}\.[0-9a-fA-F]{4})\s+(\S+)\s+(?:\S+\s+)*?(\S+)\s*$)");

    for (const auto& line : utils::split_lines(output)) {
        std::smatch match;
        if (!std::regex_match(line, match, row)) {
            continue;
        }
        core::MacEntry entry;
        entry.vlan = std::stoi(match[1].str());
        entry.macAddress = core::normalizeMacAddress(match[2].str());
        std::string type = utils::to_lower(match[3].str());
        if (type == "dynamic") {
            entry.status = core::MacEntryStatus::LEARNED;
        } else if (type == "static") {
            entry.status = core::MacEntryStatus::STATIC;
        } else {
            entry.status = core::MacEntryStatus::OTHER;
        }
        entry.port = match[4].str();
        if (!entry.macAddress.empty() &&
            std::find(facts.macTable.begin(), facts.macTable.end(), entry) == facts.macTable.end()) {
            facts.macTable.push_back(entry);
        }
    }
}

void CiscoIosDecoder::parseIpArp(const std::string& output, core::DeviceFacts& facts) const {
    // Protocol  Address  Age (min)  Hardware Addr  Type  Interface
    static const std::regex row(
        R"(^Internet\s+(\d+\.\d+\.\d+\.\d+)\s+(\S+)\s+([0-9a-fA-F]{4}\.[0-9a-fA-F]{4}\.[0-9a-fA-F]{4})\s+\S+\s*(\S*)\s*$)");

    for (const auto& line : utils::split_lines(output)) {
        std::smatch match;
        if (!std::regex_match(line, match, row)) {
            continue;
        }
        core::ArpEntry entry;
        entry.ip = match[1].str();
        entry.macAddress = core::normalizeMacAddress(match[3].str());
        entry.interfaceName = match[4].str();
        // Age "-" marks the router's own address
        entry.type = match[2].str() == "-" ? core::ArpType::STATIC : core::ArpType::DYNAMIC;
        if (std::find(facts.arpTable.begin(), facts.arpTable.end(), entry) == facts.arpTable.end()) {
            facts.arpTable.push_back(entry);
        }
    }
}

void CiscoIosDecoder::parseIpRoute(const std::string& output, core::DeviceFacts& facts) const {
    static const std::regex via(
        R"(^([A-Za-z*]+\*?(?:\s+(?:IA|E1|E2|N1|N2|L1|L2|ia|EX))?)\s+(\d+\.\d+\.\d+\.\d+(?:/\d+)?)\s+\[(\d+)/(\d+)\]\s+via\s+(\d+\.\d+\.\d+\.\d+)(?:,.*?,\s*(\S+))?\s*$)");
    static const std::regex connected(
        R"(^([CL])\s+(\d+\.\d+\.\d+\.\d+(?:/\d+)?)\s+is directly connected,\s*(\S+)\s*$)");

    for (const auto& line : utils::split_lines(output)) {
        std::smatch match;
        core::RouteEntry route;
        if (std::regex_match(line, match, via)) {
            route.protocol = routeProtocol(match[1].str());
            route.network = match[2].str();
            route.adminDistance = std::stoi(match[3].str());
            route.metric = std::stoi(match[4].str());
            route.nextHop = match[5].str();
            route.interfaceName = match[6].matched ? match[6].str() : "";
        } else if (std::regex_match(line, match, connected)) {
            route.protocol = routeProtocol(match[1].str());
            route.network = match[2].str();
            route.interfaceName = match[3].str();
        } else {
            continue;
        }
        if (std::find(facts.routingTable.begin(), facts.routingTable.end(), route) ==
            facts.routingTable.end()) {
            facts.routingTable.push_back(route);
        }
    }
}

void CiscoIosDecoder::parseVlanBrief(const std::string& output, core::DeviceFacts& facts) const {
    // VLAN Name  Status  Ports
    static const std::regex row(R"(^(\d+)\s+(\S+)\s+(active|act/unsup|act/lshut|sus/lshut|suspended|\S+)\b.*$)");

    for (const auto& line : utils::split_lines(output)) {
        std::smatch match;
        if (!std::regex_match(line, match, row)) {
            continue;
        }
        core::VlanInfo vlan;
        vlan.id = std::stoi(match[1].str());
        vlan.name = match[2].str();
        vlan.state = match[3].str();
        if (std::find(facts.vlans.begin(), facts.vlans.end(), vlan) == facts.vlans.end()) {
            facts.vlans.push_back(vlan);
        }
    }
}

std::vector<core::NeighborEdge> CiscoIosDecoder::parseCdpNeighbors(const std::string& output,
                                                                   const std::string& deviceIp) const {
    static const std::regex deviceId(R"(^Device ID:\s*(.+)$)");
    static const std::regex address(R"(^\s*IP(?:v4)? [Aa]ddress:\s*(\d+\.\d+\.\d+\.\d+))");
    static const std::regex platform(R"(^Platform:\s*([^,]+),)");
    static const std::regex ports(R"(^Interface:\s*([^,]+),\s*Port ID \(outgoing port\):\s*(.+)$)");

    std::vector<core::NeighborEdge> edges;
    core::NeighborEdge current;
    bool open = false;

    auto flush = [&]() {
        if (open && !current.toDeviceId.empty()) {
            edges.push_back(current);
        }
        current = core::NeighborEdge();
        open = false;
    };

    for (const auto& line : utils::split_lines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, deviceId)) {
            flush();
            open = true;
            current.fromIp = deviceIp;
            current.protocol = core::NeighborProtocol::CDP;
            current.confidence = core::Confidence::HIGH;
            current.toDeviceId = utils::trim(match[1].str());
            continue;
        }
        if (!open) {
            continue;
        }
        // Entry address comes before the management address; keep the first
        if (current.toIp.empty() && std::regex_search(line, match, address)) {
            current.toIp = match[1].str();
        } else if (std::regex_search(line, match, platform)) {
            current.platform = utils::trim(match[1].str());
        } else if (std::regex_search(line, match, ports)) {
            current.localInterface = utils::trim(match[1].str());
            current.remoteInterface = utils::trim(match[2].str());
        }
    }
    flush();
    return edges;
}

std::vector<core::NeighborEdge> CiscoIosDecoder::parseLldpNeighbors(const std::string& output,
                                                                    const std::string& deviceIp) const {
    static const std::regex localIntf(R"(^Local Intf:\s*(\S+))");
    static const std::regex chassis(R"(^Chassis id:\s*(.+)$)");
    static const std::regex portId(R"(^Port id:\s*(.+)$)");
    static const std::regex portDesc(R"(^Port Description:\s*(.+)$)");
    static const std::regex sysName(R"(^System Name:\s*(.+)$)");
    static const std::regex sysDesc(R"(^System Description:\s*(.*)$)");
    static const std::regex mgmtIp(R"(^\s*IP:\s*(\d+\.\d+\.\d+\.\d+))");

    std::vector<core::NeighborEdge> edges;
    core::NeighborEdge current;
    std::string chassisId;
    std::string description;
    bool open = false;
    bool wantDescription = false;

    auto flush = [&]() {
        if (open) {
            if (current.toDeviceId.empty()) {
                std::string mac = core::normalizeMacAddress(chassisId);
                current.toDeviceId = mac.empty() ? chassisId : mac;
            }
            // A MAC port id says nothing useful; prefer the port description
            if (!description.empty() && !core::normalizeMacAddress(current.remoteInterface).empty()) {
                current.remoteInterface = description;
            }
            if (!current.toDeviceId.empty() || !current.toIp.empty()) {
                edges.push_back(current);
            }
        }
        current = core::NeighborEdge();
        chassisId.clear();
        description.clear();
        open = false;
        wantDescription = false;
    };

    for (const auto& line : utils::split_lines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, localIntf)) {
            flush();
            open = true;
            current.fromIp = deviceIp;
            current.protocol = core::NeighborProtocol::LLDP;
            current.confidence = core::Confidence::HIGH;
            current.localInterface = match[1].str();
            continue;
        }
        if (!open) {
            continue;
        }
        if (wantDescription) {
            std::string text = utils::trim(line);
            if (!text.empty()) {
                current.platform = text;
                wantDescription = false;
            }
            continue;
        }
        if (std::regex_search(line, match, chassis)) {
            chassisId = utils::trim(match[1].str());
        } else if (std::regex_search(line, match, portId)) {
            current.remoteInterface = utils::trim(match[1].str());
        } else if (std::regex_search(line, match, portDesc)) {
            description = utils::trim(match[1].str());
        } else if (std::regex_search(line, match, sysName)) {
            current.toDeviceId = utils::trim(match[1].str());
        } else if (std::regex_search(line, match, sysDesc)) {
            current.platform = utils::trim(match[1].str());
            wantDescription = current.platform.empty();
        } else if (current.toIp.empty() && std::regex_search(line, match, mgmtIp)) {
            current.toIp = match[1].str();
        }
    }
    flush();
    return edges;
}

// =============================================================================
// PlatformDecoderRegistry
// =============================================================================

PlatformDecoderRegistry::PlatformDecoderRegistry()
    : fallback_(std::make_shared<GenericDecoder>())
{
}

PlatformDecoderRegistry PlatformDecoderRegistry::withBuiltins() {
    PlatformDecoderRegistry registry;
    registry.registerDecoder(std::make_shared<CiscoIosDecoder>());
    return registry;
}

void PlatformDecoderRegistry::registerDecoder(std::shared_ptr<const PlatformDecoder> decoder) {
    if (!decoder) {
        return;
    }
    decoders_[utils::to_lower(decoder->vendor())] = std::move(decoder);
}

const PlatformDecoder& PlatformDecoderRegistry::find(const std::string& vendor) const {
    auto it = decoders_.find(utils::to_lower(vendor));
    if (it != decoders_.end()) {
        return *it->second;
    }
    return *fallback_;
}

}  // namespace probe
}  // namespace netmap
