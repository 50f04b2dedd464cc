/**
 * @file device.hpp
 * @brief Discovery data model: devices, structural facts and neighbor edges.
 *
 * A Device is keyed by its IP for the lifetime of a run. Facts gathered by
 * the different probes are combined with mergeFacts(), which only fills
 * empty fields and unions list-valued facts, so a weaker method can never
 * overwrite what a stronger one already reported.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace netmap {
namespace core {

// =============================================================================
// Enumerations
// =============================================================================

enum class InterfaceStatus { UP, DOWN, TESTING, UNKNOWN };

enum class MacEntryStatus { OTHER, INVALID, LEARNED, SELF, MGMT, STATIC, UNKNOWN };

enum class ArpType { OTHER, INVALID, DYNAMIC, STATIC, UNKNOWN };

enum class NeighborProtocol { CDP, LLDP, ARP };

/// Total order: HIGH (neighbor protocol) > MEDIUM (MAC heuristic) > LOW (ARP).
enum class Confidence : int { LOW = 0, MEDIUM = 1, HIGH = 2 };

enum class DeviceStatus { UNKNOWN, CONNECTED, UNREACHABLE, ERROR };

enum class DiscoveryMethod { UNKNOWN, SNMP, SSH, TELNET };

NETMAP_CORE_API const char* toString(InterfaceStatus status);
NETMAP_CORE_API const char* toString(MacEntryStatus status);
NETMAP_CORE_API const char* toString(ArpType type);
NETMAP_CORE_API const char* toString(NeighborProtocol protocol);
NETMAP_CORE_API const char* toString(Confidence confidence);
NETMAP_CORE_API const char* toString(DeviceStatus status);
NETMAP_CORE_API const char* toString(DiscoveryMethod method);

/// IF-MIB ifAdminStatus/ifOperStatus code: 1 up, 2 down, 3 testing.
NETMAP_CORE_API InterfaceStatus interfaceStatusFromCode(int64_t code);

/// CLI wording such as "up", "down", "administratively down".
NETMAP_CORE_API InterfaceStatus parseInterfaceStatus(const std::string& text);

/// BRIDGE-MIB dot1dTpFdbStatus code: 1 other, 2 invalid, 3 learned, 4 self, 5 mgmt.
NETMAP_CORE_API MacEntryStatus macEntryStatusFromCode(int64_t code);

/// IP-MIB ipNetToMediaType code: 1 other, 2 invalid, 3 dynamic, 4 static.
NETMAP_CORE_API ArpType arpTypeFromCode(int64_t code);

/**
 * @brief Normalize a MAC address to lowercase colon-separated hex.
 *
 * Accepts "AA:BB:CC:DD:EE:FF", "aa-bb-cc-dd-ee-ff" and Cisco "aabb.ccdd.eeff".
 * @return Normalized address, or empty string if the input is not a MAC.
 */
NETMAP_CORE_API std::string normalizeMacAddress(const std::string& text);

/**
 * @brief Format six raw bytes as a normalized MAC address.
 * @return Empty string unless exactly six bytes are given.
 */
NETMAP_CORE_API std::string macFromBytes(const std::string& bytes);

/// ISO-8601 UTC rendering used in progress records and exports.
NETMAP_CORE_API std::string formatTimestamp(std::chrono::system_clock::time_point tp);

// =============================================================================
// Structural facts
// =============================================================================

struct NETMAP_CORE_API IoCounters {
    uint64_t inOctets = 0;
    uint64_t outOctets = 0;
    uint64_t inErrors = 0;
    uint64_t outErrors = 0;
};

struct NETMAP_CORE_API InterfaceInfo {
    std::string name;
    int32_t index = 0;              ///< ifIndex, 0 when learned from CLI
    std::string description;
    std::string type;               ///< e.g. "ethernetCsmacd"
    uint32_t mtu = 0;
    uint64_t speed = 0;             ///< bits per second
    std::string macAddress;
    std::string ipAddress;
    InterfaceStatus adminStatus = InterfaceStatus::UNKNOWN;
    InterfaceStatus operStatus = InterfaceStatus::UNKNOWN;
    IoCounters counters;
};

struct NETMAP_CORE_API IpAddressEntry {
    std::string address;
    std::string netmask;
    std::string interfaceName;

    bool operator==(const IpAddressEntry& other) const { return address == other.address; }
};

struct NETMAP_CORE_API MacEntry {
    std::string macAddress;
    std::string port;
    int vlan = 1;
    MacEntryStatus status = MacEntryStatus::UNKNOWN;

    /// Learned (SNMP) or dynamic (CLI) entries are evidence of topology.
    bool isLearned() const { return status == MacEntryStatus::LEARNED; }

    bool operator==(const MacEntry& other) const {
        return macAddress == other.macAddress && port == other.port && vlan == other.vlan;
    }
};

struct NETMAP_CORE_API ArpEntry {
    std::string ip;
    std::string macAddress;
    std::string interfaceName;
    ArpType type = ArpType::UNKNOWN;

    bool operator==(const ArpEntry& other) const {
        return ip == other.ip && macAddress == other.macAddress &&
               interfaceName == other.interfaceName;
    }
};

struct NETMAP_CORE_API RouteEntry {
    std::string network;            ///< "10.1.0.0/16"
    std::string nextHop;
    std::string interfaceName;
    std::string protocol;           ///< connected, static, ospf, bgp, ...
    int adminDistance = 0;
    int metric = 0;

    bool operator==(const RouteEntry& other) const {
        return network == other.network && nextHop == other.nextHop &&
               interfaceName == other.interfaceName;
    }
};

struct NETMAP_CORE_API VlanInfo {
    int id = 0;
    std::string name;
    std::string state;

    bool operator==(const VlanInfo& other) const { return id == other.id; }
};

struct NETMAP_CORE_API SystemInfo {
    std::string description;        ///< sysDescr or "show version" banner
    std::string objectId;
    std::string contact;
    std::string location;
    uint64_t uptimeSeconds = 0;
    int services = 0;               ///< sysServices layer bitmask
};

/**
 * @struct NeighborEdge
 * @brief One directed adjacency observation made from fromIp.
 *
 * Mirror observations (A sees B, B sees A) are kept as two edges here and
 * collapsed by the topology builder.
 */
struct NETMAP_CORE_API NeighborEdge {
    std::string fromIp;
    std::string localInterface;
    std::string toIp;               ///< Management address when advertised
    std::string toDeviceId;         ///< CDP device id / LLDP system name
    std::string remoteInterface;
    std::string platform;
    std::string remoteMac;          ///< ARP edges only
    NeighborProtocol protocol = NeighborProtocol::CDP;
    Confidence confidence = Confidence::HIGH;

    bool operator==(const NeighborEdge& other) const {
        return fromIp == other.fromIp && localInterface == other.localInterface &&
               toIp == other.toIp && toDeviceId == other.toDeviceId &&
               remoteInterface == other.remoteInterface && protocol == other.protocol;
    }
};

/**
 * @struct DeviceFacts
 * @brief Everything a probe or platform decoder can learn about a device.
 */
struct NETMAP_CORE_API DeviceFacts {
    std::string hostname;
    std::string vendor;
    std::string model;
    std::string osVersion;
    SystemInfo system;

    std::map<std::string, InterfaceInfo> interfaces;   ///< keyed by name
    std::vector<IpAddressEntry> ipAddresses;
    std::vector<MacEntry> macTable;
    std::vector<ArpEntry> arpTable;
    std::vector<RouteEntry> routingTable;
    std::vector<VlanInfo> vlans;
    std::vector<NeighborEdge> neighbors;

    /// True when no field carries information.
    bool empty() const;
};

struct NETMAP_CORE_API AccessMethods {
    bool ping = false;
    bool snmp = false;
    bool ssh = false;
    bool telnet = false;
};

/**
 * @struct Device
 * @brief One network endpoint, keyed by ip.
 */
struct NETMAP_CORE_API Device : DeviceFacts {
    std::string ip;
    AccessMethods methods;
    DiscoveryMethod discoveryMethod = DiscoveryMethod::UNKNOWN;
    double pingRttMs = 0.0;
    std::vector<std::string> capabilities;
    std::chrono::system_clock::time_point lastDiscovered{};
    DeviceStatus status = DeviceStatus::UNKNOWN;
    std::string error;

    Device() = default;
    explicit Device(std::string ip_) : ip(std::move(ip_)) {}

    bool hasCapability(const std::string& capability) const;
};

// =============================================================================
// Merging
// =============================================================================

/**
 * @brief Fill empty fields of target from source and union list-valued facts.
 *
 * Non-empty scalar fields in target are never overwritten. Interfaces present
 * in both keep target's values and only gain fields target lacks. Lists gain
 * the source entries that are not already present, so merging the same facts
 * twice leaves target unchanged.
 */
NETMAP_CORE_API void mergeFacts(DeviceFacts& target, const DeviceFacts& source);

/**
 * @brief Merge a rediscovered device into an existing record for the same ip.
 *
 * Facts follow mergeFacts(). Access methods and capabilities are unioned,
 * discoveryMethod is only set if still unknown, and the run metadata
 * (status, error, lastDiscovered) reflects the newer observation.
 */
NETMAP_CORE_API void mergeDevice(Device& target, const Device& source);

/**
 * @brief Record that a method yielded structured facts.
 *
 * Sets the corresponding access flag and, the first time only, discoveryMethod.
 */
NETMAP_CORE_API void markAccessible(Device& device, DiscoveryMethod method);

}  // namespace core
}  // namespace netmap
