/**
 * @file device.cpp
 * @brief Data model helpers and the fill-if-empty merge.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/device.hpp"
#include "netmap/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace netmap {
namespace core {

// =============================================================================
// String conversions
// =============================================================================

const char* toString(InterfaceStatus status) {
    switch (status) {
        case InterfaceStatus::UP: return "up";
        case InterfaceStatus::DOWN: return "down";
        case InterfaceStatus::TESTING: return "testing";
        default: return "unknown";
    }
}

const char* toString(MacEntryStatus status) {
    switch (status) {
        case MacEntryStatus::OTHER: return "other";
        case MacEntryStatus::INVALID: return "invalid";
        case MacEntryStatus::LEARNED: return "learned";
        case MacEntryStatus::SELF: return "self";
        case MacEntryStatus::MGMT: return "mgmt";
        case MacEntryStatus::STATIC: return "static";
        default: return "unknown";
    }
}

const char* toString(ArpType type) {
    switch (type) {
        case ArpType::OTHER: return "other";
        case ArpType::INVALID: return "invalid";
        case ArpType::DYNAMIC: return "dynamic";
        case ArpType::STATIC: return "static";
        default: return "unknown";
    }
}

const char* toString(NeighborProtocol protocol) {
    switch (protocol) {
        case NeighborProtocol::CDP: return "CDP";
        case NeighborProtocol::LLDP: return "LLDP";
        case NeighborProtocol::ARP: return "ARP";
        default: return "unknown";
    }
}

const char* toString(Confidence confidence) {
    switch (confidence) {
        case Confidence::HIGH: return "high";
        case Confidence::MEDIUM: return "medium";
        case Confidence::LOW: return "low";
        default: return "unknown";
    }
}

const char* toString(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::CONNECTED: return "connected";
        case DeviceStatus::UNREACHABLE: return "unreachable";
        case DeviceStatus::ERROR: return "error";
        default: return "unknown";
    }
}

const char* toString(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::SNMP: return "snmp";
        case DiscoveryMethod::SSH: return "ssh";
        case DiscoveryMethod::TELNET: return "telnet";
        default: return "unknown";
    }
}

InterfaceStatus interfaceStatusFromCode(int64_t code) {
    switch (code) {
        case 1: return InterfaceStatus::UP;
        case 2: return InterfaceStatus::DOWN;
        case 3: return InterfaceStatus::TESTING;
        default: return InterfaceStatus::UNKNOWN;
    }
}

InterfaceStatus parseInterfaceStatus(const std::string& text) {
    std::string lower = utils::to_lower(utils::trim(text));
    if (lower == "up") return InterfaceStatus::UP;
    if (lower == "down" || lower == "administratively down" || lower == "disabled") {
        return InterfaceStatus::DOWN;
    }
    if (lower == "testing") return InterfaceStatus::TESTING;
    return InterfaceStatus::UNKNOWN;
}

MacEntryStatus macEntryStatusFromCode(int64_t code) {
    switch (code) {
        case 1: return MacEntryStatus::OTHER;
        case 2: return MacEntryStatus::INVALID;
        case 3: return MacEntryStatus::LEARNED;
        case 4: return MacEntryStatus::SELF;
        case 5: return MacEntryStatus::MGMT;
        default: return MacEntryStatus::UNKNOWN;
    }
}

ArpType arpTypeFromCode(int64_t code) {
    switch (code) {
        case 1: return ArpType::OTHER;
        case 2: return ArpType::INVALID;
        case 3: return ArpType::DYNAMIC;
        case 4: return ArpType::STATIC;
        default: return ArpType::UNKNOWN;
    }
}

std::string normalizeMacAddress(const std::string& text) {
    std::string hex;
    for (char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (c != ':' && c != '-' && c != '.') {
            return "";
        }
    }
    if (hex.size() != 12) {
        return "";
    }

    std::string out;
    out.reserve(17);
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (i > 0) out.push_back(':');
        out.push_back(hex[i]);
        out.push_back(hex[i + 1]);
    }
    return out;
}

std::string macFromBytes(const std::string& bytes) {
    if (bytes.size() != 6) {
        return "";
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) oss << ':';
        oss << std::setw(2) << static_cast<int>(static_cast<unsigned char>(bytes[i]));
    }
    return oss.str();
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// =============================================================================
// DeviceFacts / Device
// =============================================================================

bool DeviceFacts::empty() const {
    return hostname.empty() && vendor.empty() && model.empty() && osVersion.empty() &&
           system.description.empty() && interfaces.empty() && ipAddresses.empty() &&
           macTable.empty() && arpTable.empty() && routingTable.empty() &&
           vlans.empty() && neighbors.empty();
}

bool Device::hasCapability(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

namespace {

void fillString(std::string& target, const std::string& source) {
    if (target.empty() && !source.empty()) {
        target = source;
    }
}

template<typename T>
void fillNumber(T& target, const T& source) {
    if (target == T{} && source != T{}) {
        target = source;
    }
}

template<typename T>
void appendMissing(std::vector<T>& target, const std::vector<T>& source) {
    for (const auto& entry : source) {
        if (std::find(target.begin(), target.end(), entry) == target.end()) {
            target.push_back(entry);
        }
    }
}

void fillInterface(InterfaceInfo& target, const InterfaceInfo& source) {
    fillString(target.name, source.name);
    fillNumber(target.index, source.index);
    fillString(target.description, source.description);
    fillString(target.type, source.type);
    fillNumber(target.mtu, source.mtu);
    fillNumber(target.speed, source.speed);
    fillString(target.macAddress, source.macAddress);
    fillString(target.ipAddress, source.ipAddress);
    if (target.adminStatus == InterfaceStatus::UNKNOWN) {
        target.adminStatus = source.adminStatus;
    }
    if (target.operStatus == InterfaceStatus::UNKNOWN) {
        target.operStatus = source.operStatus;
    }
    fillNumber(target.counters.inOctets, source.counters.inOctets);
    fillNumber(target.counters.outOctets, source.counters.outOctets);
    fillNumber(target.counters.inErrors, source.counters.inErrors);
    fillNumber(target.counters.outErrors, source.counters.outErrors);
}

}  // namespace

void mergeFacts(DeviceFacts& target, const DeviceFacts& source) {
    fillString(target.hostname, source.hostname);
    fillString(target.vendor, source.vendor);
    fillString(target.model, source.model);
    fillString(target.osVersion, source.osVersion);

    fillString(target.system.description, source.system.description);
    fillString(target.system.objectId, source.system.objectId);
    fillString(target.system.contact, source.system.contact);
    fillString(target.system.location, source.system.location);
    fillNumber(target.system.uptimeSeconds, source.system.uptimeSeconds);
    fillNumber(target.system.services, source.system.services);

    for (const auto& [name, info] : source.interfaces) {
        auto it = target.interfaces.find(name);
        if (it == target.interfaces.end()) {
            target.interfaces.emplace(name, info);
        } else {
            fillInterface(it->second, info);
        }
    }

    appendMissing(target.ipAddresses, source.ipAddresses);
    appendMissing(target.macTable, source.macTable);
    appendMissing(target.arpTable, source.arpTable);
    appendMissing(target.routingTable, source.routingTable);
    appendMissing(target.vlans, source.vlans);
    appendMissing(target.neighbors, source.neighbors);
}

void mergeDevice(Device& target, const Device& source) {
    mergeFacts(target, source);

    target.methods.ping = target.methods.ping || source.methods.ping;
    target.methods.snmp = target.methods.snmp || source.methods.snmp;
    target.methods.ssh = target.methods.ssh || source.methods.ssh;
    target.methods.telnet = target.methods.telnet || source.methods.telnet;

    if (target.discoveryMethod == DiscoveryMethod::UNKNOWN) {
        target.discoveryMethod = source.discoveryMethod;
    }
    if (source.pingRttMs > 0.0) {
        target.pingRttMs = source.pingRttMs;
    }

    appendMissing(target.capabilities, source.capabilities);

    if (source.status != DeviceStatus::UNKNOWN) {
        target.status = source.status;
        target.error = source.error;
    }
    if (source.lastDiscovered > target.lastDiscovered) {
        target.lastDiscovered = source.lastDiscovered;
    }
}

void markAccessible(Device& device, DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::SNMP: device.methods.snmp = true; break;
        case DiscoveryMethod::SSH: device.methods.ssh = true; break;
        case DiscoveryMethod::TELNET: device.methods.telnet = true; break;
        default: return;
    }
    if (device.discoveryMethod == DiscoveryMethod::UNKNOWN) {
        device.discoveryMethod = method;
    }
}

}  // namespace core
}  // namespace netmap
