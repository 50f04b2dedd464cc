/**
 * @file platform_decoder.hpp
 * @brief Vendor CLI output decoders.
 *
 * A decoder names the show commands worth running on its platform and turns
 * their text output into DeviceFacts. Unknown vendors get GenericDecoder,
 * which runs nothing beyond "show version" and only reads what is
 * vendor-neutral.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/core/device.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace netmap {
namespace probe {

/**
 * @class PlatformDecoder
 * @brief Command list and output parser for one vendor.
 */
class NETMAP_PROBE_API PlatformDecoder {
public:
    virtual ~PlatformDecoder() = default;

    /// Vendor tag as produced by core::classifyVendor().
    virtual std::string vendor() const = 0;

    /// Commands to run after "show version", in order.
    virtual std::vector<std::string> commands() const = 0;

    /// Identity facts (hostname, model, version, uptime) from "show version".
    virtual void decodeVersion(const std::string& output, core::DeviceFacts& facts) const = 0;

    /**
     * @brief Decode the output of one of commands() into facts.
     * @param deviceIp Address of the device, stamped on neighbor edges.
     */
    virtual void decode(const std::string& command,
                        const std::string& output,
                        const std::string& deviceIp,
                        core::DeviceFacts& facts) const = 0;
};

/**
 * @class GenericDecoder
 * @brief Fallback that reads only the version banner.
 */
class NETMAP_PROBE_API GenericDecoder : public PlatformDecoder {
public:
    std::string vendor() const override { return "unknown"; }
    std::vector<std::string> commands() const override { return {}; }
    void decodeVersion(const std::string& output, core::DeviceFacts& facts) const override;
    void decode(const std::string& command,
                const std::string& output,
                const std::string& deviceIp,
                core::DeviceFacts& facts) const override;
};

/**
 * @class CiscoIosDecoder
 * @brief Cisco IOS / IOS-XE show command parsers.
 */
class NETMAP_PROBE_API CiscoIosDecoder : public PlatformDecoder {
public:
    static constexpr const char* SHOW_IP_INTERFACE_BRIEF = "show ip interface brief";
    static constexpr const char* SHOW_MAC_ADDRESS_TABLE = "show mac address-table";
    static constexpr const char* SHOW_IP_ARP = "show ip arp";
    static constexpr const char* SHOW_IP_ROUTE = "show ip route";
    static constexpr const char* SHOW_CDP_NEIGHBORS = "show cdp neighbors detail";
    static constexpr const char* SHOW_LLDP_NEIGHBORS = "show lldp neighbors detail";
    static constexpr const char* SHOW_VLAN_BRIEF = "show vlan brief";

    std::string vendor() const override { return "cisco"; }
    std::vector<std::string> commands() const override;
    void decodeVersion(const std::string& output, core::DeviceFacts& facts) const override;
    void decode(const std::string& command,
                const std::string& output,
                const std::string& deviceIp,
                core::DeviceFacts& facts) const override;

    void parseIpInterfaceBrief(const std::string& output, core::DeviceFacts& facts) const;
    void parseMacAddressTable(const std::string& output, core::DeviceFacts& facts) const;
    void parseIpArp(const std::string& output, core::DeviceFacts& facts) const;
    void parseIpRoute(const std::string& output, core::DeviceFacts& facts) const;
    void parseVlanBrief(const std::string& output, core::DeviceFacts& facts) const;
    std::vector<core::NeighborEdge> parseCdpNeighbors(const std::string& output,
                                                      const std::string& deviceIp) const;
    std::vector<core::NeighborEdge> parseLldpNeighbors(const std::string& output,
                                                       const std::string& deviceIp) const;
};

/**
 * @class PlatformDecoderRegistry
 * @brief Selects a decoder by vendor tag.
 */
class NETMAP_PROBE_API PlatformDecoderRegistry {
public:
    PlatformDecoderRegistry();

    /// Registry holding the built-in decoders.
    static PlatformDecoderRegistry withBuiltins();

    /// Add or replace the decoder for decoder->vendor().
    void registerDecoder(std::shared_ptr<const PlatformDecoder> decoder);

    /// Decoder for vendor, or the generic decoder.
    const PlatformDecoder& find(const std::string& vendor) const;

private:
    std::map<std::string, std::shared_ptr<const PlatformDecoder>> decoders_;
    std::shared_ptr<const PlatformDecoder> fallback_;
};

/// "uptime is 1 year, 2 weeks, 3 days, 4 hours, 5 minutes" -> seconds.
NETMAP_PROBE_API uint64_t parseUptimeText(const std::string& text);

/// Interface type from a CLI name ("GigabitEthernet0/1" -> "ethernetCsmacd").
NETMAP_PROBE_API std::string interfaceTypeFromName(const std::string& name);

}  // namespace probe
}  // namespace netmap
