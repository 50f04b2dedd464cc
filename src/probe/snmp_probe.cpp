/**
 * @file snmp_probe.cpp
 * @brief SNMP fact battery implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/snmp_probe.hpp"
#include "netmap/probe/oid_catalogue.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace netmap {
namespace probe {

namespace {

// LLDP-MIB LldpChassisIdSubtype / LldpPortIdSubtype values carrying a MAC
constexpr int64_t LLDP_CHASSIS_MAC = 4;
constexpr int64_t LLDP_PORT_MAC = 3;

std::string column(const char* entry, int col) {
    return std::string(entry) + "." + std::to_string(col);
}

std::vector<uint32_t> indexArcs(const std::string& index) {
    std::vector<uint32_t> arcs;
    if (!parseIndexArcs(index, arcs)) {
        return {};
    }
    return arcs;
}

const SnmpValue* cell(const std::map<int, SnmpValue>& row, int col) {
    auto it = row.find(col);
    return it == row.end() ? nullptr : &it->second;
}

std::string cellString(const std::map<int, SnmpValue>& row, int col) {
    const SnmpValue* v = cell(row, col);
    return v ? utils::trim(v->asString()) : std::string();
}

int64_t cellInteger(const std::map<int, SnmpValue>& row, int col) {
    const SnmpValue* v = cell(row, col);
    return v ? v->asInteger() : 0;
}

bool isPrintable(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isprint(c) || c == '\t';
    });
}

/// Render an octet string that may hold raw address bytes.
std::string addressString(const SnmpValue& value) {
    if (value.type == SnmpValueType::IP_ADDRESS) {
        return value.asString();
    }
    const std::string& raw = value.bytes;
    if (raw.size() == 4 && !isPrintable(raw)) {
        std::ostringstream oss;
        for (size_t i = 0; i < 4; ++i) {
            if (i > 0) oss << '.';
            oss << static_cast<int>(static_cast<unsigned char>(raw[i]));
        }
        return oss.str();
    }
    std::string text = utils::trim(value.asString());
    return utils::is_ipv4(text) ? text : std::string();
}

/// LLDP ids are either text or a raw MAC depending on the subtype.
std::string lldpId(const SnmpValue* value, int64_t subtype, int64_t macSubtype) {
    if (!value) {
        return "";
    }
    if (subtype == macSubtype || (value->bytes.size() == 6 && !isPrintable(value->bytes))) {
        std::string mac = core::macFromBytes(value->bytes);
        if (!mac.empty()) {
            return mac;
        }
    }
    return utils::trim(value->asString());
}

std::string firstLine(const std::string& text) {
    auto pos = text.find_first_of("\r\n");
    return utils::trim(pos == std::string::npos ? text : text.substr(0, pos));
}

std::string vlanStateName(int64_t state) {
    switch (state) {
        case 1: return "operational";
        case 2: return "suspended";
        case 3: return "mtuTooBigForDevice";
        case 4: return "mtuTooBigForTrunk";
        default: return "unknown";
    }
}

}  // namespace

std::string versionFromDescription(const std::string& description) {
    static const std::regex pattern(R"(Version\s+([^\s,]+))", std::regex::icase);
    std::smatch match;
    if (std::regex_search(description, match, pattern)) {
        return match[1].str();
    }
    return "";
}

std::string ifTypeName(int64_t type) {
    switch (type) {
        case 6: return "ethernetCsmacd";
        case 24: return "softwareLoopback";
        case 53: return "propVirtual";
        case 131: return "tunnel";
        case 135: return "l2vlan";
        case 136: return "l3ipvlan";
        case 161: return "ieee8023adLag";
        default: return "type-" + std::to_string(type);
    }
}

SnmpProbe::SnmpProbe(std::string ip, SnmpClient& client, size_t maxRows)
    : ip_(std::move(ip))
    , client_(client)
    , maxRows_(maxRows)
{
}

// =============================================================================
// Entry points
// =============================================================================

core::ProbeResult SnmpProbe::collect() {
    core::ProbeResult result;

    auto system = collectSystem(result.facts);
    if (!system) {
        result.error = system.error();
        return result;
    }
    result.accessible = true;

    collectInterfaces(result.facts);
    collectIpAddresses(result.facts);
    collectArpTable(result.facts);
    collectMacTable(result.facts);
    collectVlans(result.facts);

    auto cdp = collectCdp();
    if (cdp) {
        result.facts.neighbors = *cdp;
    }
    auto lldp = collectLldp();
    if (lldp) {
        result.facts.neighbors.insert(result.facts.neighbors.end(), lldp->begin(), lldp->end());
    }

    LOG_DEBUG("SnmpProbe", "{}: {} interface(s), {} MAC entr(ies), {} ARP entr(ies), {} neighbor(s)",
              ip_, result.facts.interfaces.size(), result.facts.macTable.size(),
              result.facts.arpTable.size(), result.facts.neighbors.size());
    return result;
}

core::Result<std::vector<core::NeighborEdge>> SnmpProbe::collectNeighbors() {
    using R = core::Result<std::vector<core::NeighborEdge>>;

    if (ifNames_.empty()) {
        collectInterfaceNames();
    }

    auto cdp = collectCdp();
    auto lldp = collectLldp();
    if (!cdp && !lldp) {
        return R::failure("cdp: " + cdp.error() + "; lldp: " + lldp.error());
    }

    std::vector<core::NeighborEdge> edges;
    if (cdp) {
        edges = *cdp;
    }
    if (lldp) {
        edges.insert(edges.end(), lldp->begin(), lldp->end());
    }
    return R::success(std::move(edges));
}

core::Result<TableRows> SnmpProbe::walkColumns(const std::vector<std::pair<int, std::string>>& columns) {
    using R = core::Result<TableRows>;
    TableRows rows;
    if (columns.empty()) {
        return R::success(std::move(rows));
    }

    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& [col, columnOid] = columns[i];
        auto walked = client_.walk(columnOid, maxRows_);
        if (!walked) {
            if (i == 0) {
                return R::failure(walked.error());
            }
            LOG_DEBUG("SnmpProbe", "{}: column {} unavailable: {}", ip_, columnOid, walked.error());
            continue;
        }
        for (const auto& vb : *walked) {
            std::string index = oidSuffix(vb.oid, columnOid);
            if (index.empty()) {
                continue;
            }
            if (i == 0) {
                rows[index][col] = vb.value;
            } else {
                auto it = rows.find(index);
                if (it != rows.end()) {
                    it->second[col] = vb.value;
                }
            }
        }
    }
    return R::success(std::move(rows));
}

// =============================================================================
// Fact groups
// =============================================================================

core::Result<bool> SnmpProbe::collectSystem(core::DeviceFacts& facts) {
    using R = core::Result<bool>;
    auto response = client_.get({oid::SYS_DESCR, oid::SYS_OBJECT_ID, oid::SYS_UPTIME,
                                 oid::SYS_CONTACT, oid::SYS_NAME, oid::SYS_LOCATION,
                                 oid::SYS_SERVICES});
    if (!response) {
        return R::failure(response.error());
    }

    bool any = false;
    for (const auto& vb : *response) {
        if (vb.value.isException()) {
            continue;
        }
        any = true;
        if (vb.oid == oid::SYS_DESCR) {
            facts.system.description = utils::trim(vb.value.asString());
        } else if (vb.oid == oid::SYS_OBJECT_ID) {
            facts.system.objectId = vb.value.asString();
        } else if (vb.oid == oid::SYS_UPTIME) {
            facts.system.uptimeSeconds = static_cast<uint64_t>(vb.value.asInteger()) / 100;
        } else if (vb.oid == oid::SYS_CONTACT) {
            facts.system.contact = utils::trim(vb.value.asString());
        } else if (vb.oid == oid::SYS_NAME) {
            facts.hostname = utils::trim(vb.value.asString());
        } else if (vb.oid == oid::SYS_LOCATION) {
            facts.system.location = utils::trim(vb.value.asString());
        } else if (vb.oid == oid::SYS_SERVICES) {
            facts.system.services = static_cast<int>(vb.value.asInteger());
        }
    }
    if (!any) {
        return R::failure("agent returned no system group");
    }

    facts.osVersion = versionFromDescription(facts.system.description);
    return R::success(true);
}

void SnmpProbe::collectInterfaceNames() {
    std::string table = oid::IF_NAME;
    auto names = client_.walk(table, maxRows_);
    if (!names || names->empty()) {
        table = column(oid::IF_ENTRY, oid::IF_DESCR);
        names = client_.walk(table, maxRows_);
    }
    if (!names) {
        return;
    }
    for (const auto& vb : *names) {
        auto arcs = indexArcs(oidSuffix(vb.oid, table));
        if (arcs.size() != 1) {
            continue;
        }
        std::string name = utils::trim(vb.value.asString());
        if (!name.empty()) {
            ifNames_[static_cast<int32_t>(arcs[0])] = name;
        }
    }
}

void SnmpProbe::collectInterfaces(core::DeviceFacts& facts) {
    auto rows = walkColumns({
        {oid::IF_DESCR, column(oid::IF_ENTRY, oid::IF_DESCR)},
        {oid::IF_TYPE, column(oid::IF_ENTRY, oid::IF_TYPE)},
        {oid::IF_MTU, column(oid::IF_ENTRY, oid::IF_MTU)},
        {oid::IF_SPEED, column(oid::IF_ENTRY, oid::IF_SPEED)},
        {oid::IF_PHYS_ADDRESS, column(oid::IF_ENTRY, oid::IF_PHYS_ADDRESS)},
        {oid::IF_ADMIN_STATUS, column(oid::IF_ENTRY, oid::IF_ADMIN_STATUS)},
        {oid::IF_OPER_STATUS, column(oid::IF_ENTRY, oid::IF_OPER_STATUS)},
        {oid::IF_IN_OCTETS, column(oid::IF_ENTRY, oid::IF_IN_OCTETS)},
        {oid::IF_IN_ERRORS, column(oid::IF_ENTRY, oid::IF_IN_ERRORS)},
        {oid::IF_OUT_OCTETS, column(oid::IF_ENTRY, oid::IF_OUT_OCTETS)},
        {oid::IF_OUT_ERRORS, column(oid::IF_ENTRY, oid::IF_OUT_ERRORS)},
    });
    if (!rows) {
        LOG_DEBUG("SnmpProbe", "{}: ifTable unavailable: {}", ip_, rows.error());
        return;
    }

    // ifName is shorter and matches CLI and CDP port naming; ifDescr is the fallback
    std::map<int32_t, std::string> shortNames;
    auto names = client_.walk(oid::IF_NAME, maxRows_);
    if (names) {
        for (const auto& vb : *names) {
            std::string index = oidSuffix(vb.oid, oid::IF_NAME);
            auto arcs = indexArcs(index);
            std::string name = utils::trim(vb.value.asString());
            if (arcs.size() == 1 && !name.empty()) {
                shortNames[static_cast<int32_t>(arcs[0])] = name;
            }
        }
    }

    for (const auto& [index, row] : *rows) {
        auto arcs = indexArcs(index);
        if (arcs.size() != 1) {
            continue;
        }
        core::InterfaceInfo info;
        info.index = static_cast<int32_t>(arcs[0]);
        info.description = cellString(row, oid::IF_DESCR);
        auto shortName = shortNames.find(info.index);
        info.name = shortName != shortNames.end() ? shortName->second : info.description;
        if (info.name.empty()) {
            info.name = "ifIndex" + std::to_string(info.index);
        }
        if (cell(row, oid::IF_TYPE)) {
            info.type = ifTypeName(cellInteger(row, oid::IF_TYPE));
        }
        info.mtu = static_cast<uint32_t>(cellInteger(row, oid::IF_MTU));
        info.speed = static_cast<uint64_t>(cellInteger(row, oid::IF_SPEED));
        if (const SnmpValue* phys = cell(row, oid::IF_PHYS_ADDRESS)) {
            info.macAddress = core::macFromBytes(phys->bytes);
        }
        info.adminStatus = core::interfaceStatusFromCode(cellInteger(row, oid::IF_ADMIN_STATUS));
        info.operStatus = core::interfaceStatusFromCode(cellInteger(row, oid::IF_OPER_STATUS));
        info.counters.inOctets = static_cast<uint64_t>(cellInteger(row, oid::IF_IN_OCTETS));
        info.counters.outOctets = static_cast<uint64_t>(cellInteger(row, oid::IF_OUT_OCTETS));
        info.counters.inErrors = static_cast<uint64_t>(cellInteger(row, oid::IF_IN_ERRORS));
        info.counters.outErrors = static_cast<uint64_t>(cellInteger(row, oid::IF_OUT_ERRORS));

        ifNames_[info.index] = info.name;
        facts.interfaces[info.name] = info;
    }
}

void SnmpProbe::collectIpAddresses(core::DeviceFacts& facts) {
    auto rows = walkColumns({
        {1, oid::IP_AD_ENT_ADDR},
        {2, oid::IP_AD_ENT_IF_INDEX},
        {3, oid::IP_AD_ENT_NETMASK},
    });
    if (!rows) {
        LOG_DEBUG("SnmpProbe", "{}: ipAddrTable unavailable: {}", ip_, rows.error());
        return;
    }

    for (const auto& [index, row] : *rows) {
        core::IpAddressEntry entry;
        entry.address = cellString(row, 1);
        if (entry.address.empty()) {
            entry.address = index;
        }
        entry.netmask = cellString(row, 3);
        entry.interfaceName = interfaceName(static_cast<int32_t>(cellInteger(row, 2)));
        facts.ipAddresses.push_back(entry);

        auto it = facts.interfaces.find(entry.interfaceName);
        if (it != facts.interfaces.end() && it->second.ipAddress.empty()) {
            it->second.ipAddress = entry.address;
        }
    }
}

void SnmpProbe::collectArpTable(core::DeviceFacts& facts) {
    auto rows = walkColumns({
        {3, oid::IP_NET_TO_MEDIA_NET_ADDR},
        {1, oid::IP_NET_TO_MEDIA_IF_INDEX},
        {2, oid::IP_NET_TO_MEDIA_PHYS},
        {4, oid::IP_NET_TO_MEDIA_TYPE},
    });
    if (!rows) {
        LOG_DEBUG("SnmpProbe", "{}: ipNetToMediaTable unavailable: {}", ip_, rows.error());
        return;
    }

    for (const auto& [index, row] : *rows) {
        core::ArpEntry entry;
        entry.ip = cellString(row, 3);
        if (const SnmpValue* phys = cell(row, 2)) {
            entry.macAddress = core::macFromBytes(phys->bytes);
        }
        if (entry.ip.empty() || entry.macAddress.empty()) {
            continue;
        }
        auto arcs = indexArcs(index);
        int32_t ifIndex = cell(row, 1) ? static_cast<int32_t>(cellInteger(row, 1))
                                       : (arcs.empty() ? 0 : static_cast<int32_t>(arcs[0]));
        entry.interfaceName = interfaceName(ifIndex);
        entry.type = core::arpTypeFromCode(cellInteger(row, 4));
        facts.arpTable.push_back(entry);
    }
}

std::map<int32_t, int32_t> SnmpProbe::bridgePortMap() {
    std::map<int32_t, int32_t> ports;
    auto rows = client_.walk(oid::DOT1D_BASE_PORT_IF_INDEX, maxRows_);
    if (!rows) {
        return ports;
    }
    for (const auto& vb : *rows) {
        auto arcs = indexArcs(oidSuffix(vb.oid, oid::DOT1D_BASE_PORT_IF_INDEX));
        if (arcs.size() == 1) {
            ports[static_cast<int32_t>(arcs[0])] = static_cast<int32_t>(vb.value.asInteger());
        }
    }
    return ports;
}

void SnmpProbe::collectMacTable(core::DeviceFacts& facts) {
    auto ports = bridgePortMap();
    auto portName = [&](int32_t bridgePort) {
        auto it = ports.find(bridgePort);
        if (it != ports.end()) {
            std::string name = interfaceName(it->second);
            if (!name.empty()) {
                return name;
            }
        }
        return std::to_string(bridgePort);
    };

    auto macFromIndex = [](const std::vector<uint32_t>& arcs, size_t offset) {
        std::string raw;
        for (size_t i = offset; i < arcs.size(); ++i) {
            raw.push_back(static_cast<char>(arcs[i] & 0xFF));
        }
        return core::macFromBytes(raw);
    };

    // Q-BRIDGE carries the VLAN (fdbId) in the index
    auto qbridge = walkColumns({
        {2, oid::DOT1Q_TP_FDB_PORT},
        {3, oid::DOT1Q_TP_FDB_STATUS},
    });
    if (qbridge && !qbridge->empty()) {
        for (const auto& [index, row] : *qbridge) {
            auto arcs = indexArcs(index);
            if (arcs.size() != 7) {
                continue;
            }
            core::MacEntry entry;
            entry.macAddress = macFromIndex(arcs, 1);
            entry.vlan = arcs[0] > 0 ? static_cast<int>(arcs[0]) : 1;
            entry.port = portName(static_cast<int32_t>(cellInteger(row, 2)));
            entry.status = core::macEntryStatusFromCode(cellInteger(row, 3));
            if (!entry.macAddress.empty()) {
                facts.macTable.push_back(entry);
            }
        }
        return;
    }

    auto dot1d = walkColumns({
        {1, oid::DOT1D_TP_FDB_ADDRESS},
        {2, oid::DOT1D_TP_FDB_PORT},
        {3, oid::DOT1D_TP_FDB_STATUS},
    });
    if (!dot1d) {
        LOG_DEBUG("SnmpProbe", "{}: forwarding table unavailable: {}", ip_, dot1d.error());
        return;
    }
    for (const auto& [index, row] : *dot1d) {
        core::MacEntry entry;
        if (const SnmpValue* addr = cell(row, 1)) {
            entry.macAddress = core::macFromBytes(addr->bytes);
        }
        if (entry.macAddress.empty()) {
            entry.macAddress = macFromIndex(indexArcs(index), 0);
        }
        if (entry.macAddress.empty()) {
            continue;
        }
        entry.port = portName(static_cast<int32_t>(cellInteger(row, 2)));
        entry.status = core::macEntryStatusFromCode(cellInteger(row, 3));
        facts.macTable.push_back(entry);
    }
}

void SnmpProbe::collectVlans(core::DeviceFacts& facts) {
    auto rows = walkColumns({
        {4, oid::VTP_VLAN_NAME},
        {2, oid::VTP_VLAN_STATE},
    });
    if (!rows) {
        LOG_DEBUG("SnmpProbe", "{}: VTP VLAN table unavailable: {}", ip_, rows.error());
        return;
    }
    for (const auto& [index, row] : *rows) {
        auto arcs = indexArcs(index);
        if (arcs.empty()) {
            continue;
        }
        core::VlanInfo vlan;
        vlan.id = static_cast<int>(arcs.back());
        vlan.name = cellString(row, 4);
        vlan.state = vlanStateName(cellInteger(row, 2));
        if (std::find(facts.vlans.begin(), facts.vlans.end(), vlan) == facts.vlans.end()) {
            facts.vlans.push_back(vlan);
        }
    }
}

// =============================================================================
// Neighbor tables
// =============================================================================

core::Result<std::vector<core::NeighborEdge>> SnmpProbe::collectCdp() {
    using R = core::Result<std::vector<core::NeighborEdge>>;
    auto rows = walkColumns({
        {6, oid::CDP_CACHE_DEVICE_ID},
        {4, oid::CDP_CACHE_ADDRESS},
        {7, oid::CDP_CACHE_DEVICE_PORT},
        {8, oid::CDP_CACHE_PLATFORM},
    });
    if (!rows) {
        LOG_DEBUG("SnmpProbe", "{}: CDP cache unavailable: {}", ip_, rows.error());
        return R::failure(rows.error());
    }

    std::vector<core::NeighborEdge> edges;
    for (const auto& [index, row] : *rows) {
        auto arcs = indexArcs(index);
        if (arcs.size() < 2) {
            continue;
        }
        core::NeighborEdge edge;
        edge.fromIp = ip_;
        edge.protocol = core::NeighborProtocol::CDP;
        edge.confidence = core::Confidence::HIGH;
        edge.localInterface = interfaceName(static_cast<int32_t>(arcs[arcs.size() - 2]));
        edge.toDeviceId = cellString(row, 6);
        edge.remoteInterface = cellString(row, 7);
        edge.platform = cellString(row, 8);
        if (const SnmpValue* address = cell(row, 4)) {
            edge.toIp = addressString(*address);
        }
        if (edge.toIp.empty() && edge.toDeviceId.empty()) {
            continue;
        }
        edges.push_back(edge);
    }
    return R::success(std::move(edges));
}

core::Result<std::vector<core::NeighborEdge>> SnmpProbe::collectLldp() {
    using R = core::Result<std::vector<core::NeighborEdge>>;
    auto rows = walkColumns({
        {7, oid::LLDP_REM_PORT_ID},
        {4, oid::LLDP_REM_CHASSIS_ID_SUBTYPE},
        {5, oid::LLDP_REM_CHASSIS_ID},
        {6, oid::LLDP_REM_PORT_ID_SUBTYPE},
        {8, oid::LLDP_REM_PORT_DESC},
        {9, oid::LLDP_REM_SYS_NAME},
        {10, oid::LLDP_REM_SYS_DESC},
    });
    if (!rows) {
        LOG_DEBUG("SnmpProbe", "{}: LLDP remote table unavailable: {}", ip_, rows.error());
        return R::failure(rows.error());
    }

    std::vector<core::NeighborEdge> edges;
    if (rows->empty()) {
        return R::success(std::move(edges));
    }

    // lldpRemManAddrTable index: timeMark.localPort.remIndex.addrSubtype.addrLen.addr...
    std::map<std::string, std::string> managementAddresses;
    auto manAddrs = client_.walk(oid::LLDP_REM_MAN_ADDR_IF_SUBTYPE, maxRows_);
    if (manAddrs) {
        for (const auto& vb : *manAddrs) {
            auto arcs = indexArcs(oidSuffix(vb.oid, oid::LLDP_REM_MAN_ADDR_IF_SUBTYPE));
            if (arcs.size() != 9 || arcs[3] != 1 || arcs[4] != 4) {
                continue;
            }
            std::string key = std::to_string(arcs[0]) + "." + std::to_string(arcs[1]) + "." +
                              std::to_string(arcs[2]);
            std::string address = std::to_string(arcs[5]) + "." + std::to_string(arcs[6]) + "." +
                                  std::to_string(arcs[7]) + "." + std::to_string(arcs[8]);
            managementAddresses.emplace(key, address);
        }
    }

    std::map<uint32_t, std::string> localPorts;
    auto locRows = walkColumns({
        {3, oid::LLDP_LOC_PORT_ID},
        {4, oid::LLDP_LOC_PORT_DESC},
    });
    if (locRows) {
        for (const auto& [index, row] : *locRows) {
            auto arcs = indexArcs(index);
            if (arcs.size() != 1) {
                continue;
            }
            const SnmpValue* portId = cell(row, 3);
            std::string name = portId && isPrintable(portId->bytes) ? cellString(row, 3) : "";
            if (name.empty()) {
                name = cellString(row, 4);
            }
            localPorts[arcs[0]] = name;
        }
    }

    for (const auto& [index, row] : *rows) {
        auto arcs = indexArcs(index);
        if (arcs.size() != 3) {
            continue;
        }
        core::NeighborEdge edge;
        edge.fromIp = ip_;
        edge.protocol = core::NeighborProtocol::LLDP;
        edge.confidence = core::Confidence::HIGH;

        auto local = localPorts.find(arcs[1]);
        edge.localInterface = local != localPorts.end() && !local->second.empty()
                                  ? local->second
                                  : interfaceName(static_cast<int32_t>(arcs[1]));

        edge.toDeviceId = cellString(row, 9);
        if (edge.toDeviceId.empty()) {
            edge.toDeviceId = lldpId(cell(row, 5), cellInteger(row, 4), LLDP_CHASSIS_MAC);
        }

        int64_t portSubtype = cellInteger(row, 6);
        edge.remoteInterface = lldpId(cell(row, 7), portSubtype, LLDP_PORT_MAC);
        std::string portDesc = cellString(row, 8);
        if (!portDesc.empty() && core::normalizeMacAddress(edge.remoteInterface) == edge.remoteInterface &&
            !edge.remoteInterface.empty()) {
            edge.remoteInterface = portDesc;
        }

        edge.platform = firstLine(cellString(row, 10));

        auto address = managementAddresses.find(index);
        if (address != managementAddresses.end()) {
            edge.toIp = address->second;
        }
        edges.push_back(edge);
    }
    return R::success(std::move(edges));
}

std::string SnmpProbe::interfaceName(int32_t ifIndex) const {
    auto it = ifNames_.find(ifIndex);
    if (it != ifNames_.end()) {
        return it->second;
    }
    return ifIndex > 0 ? std::to_string(ifIndex) : std::string();
}

}  // namespace probe
}  // namespace netmap
