/**
 * @file classification.cpp
 * @brief Vendor and capability classification.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/classification.hpp"
#include "netmap/utils/string_utils.hpp"

#include <algorithm>

namespace netmap {
namespace core {

namespace {

struct VendorKeyword {
    const char* keyword;
    const char* vendor;
};

// First match wins.
const VendorKeyword kVendorKeywords[] = {
    {"cisco", "cisco"},
    {"juniper", "juniper"},
    {"arista", "arista"},
    {"fortinet", "fortinet"},
    {"fortigate", "fortinet"},
    {"palo alto", "paloalto"},
    {"checkpoint", "checkpoint"},
    {"check point", "checkpoint"},
    {"ubiquiti", "ubiquiti"},
    {"unifi", "ubiquiti"},
    {"edgeos", "ubiquiti"},
    {"edgemax", "ubiquiti"},
    {"hp ", "hp"},
    {"hewlett", "hp"},
    {"dell", "dell"},
    {"extreme", "extreme"},
};

bool isFirewallVendor(const std::string& vendor) {
    return vendor == "fortinet" || vendor == "paloalto" || vendor == "checkpoint";
}

void addTag(std::vector<std::string>& tags, const std::string& tag) {
    if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
        tags.push_back(tag);
    }
}

}  // namespace

std::string classifyVendor(const std::string& description) {
    if (description.empty()) {
        return "unknown";
    }
    std::string lower = utils::to_lower(description);
    for (const auto& entry : kVendorKeywords) {
        if (lower.find(entry.keyword) != std::string::npos) {
            return entry.vendor;
        }
    }
    return "unknown";
}

std::vector<std::string> deriveCapabilities(const Device& device) {
    std::vector<std::string> tags;

    bool hasLearnedMacs = std::any_of(device.macTable.begin(), device.macTable.end(),
                                      [](const MacEntry& e) { return e.isLearned(); });

    if (device.routingTable.size() > ROUTER_ROUTE_THRESHOLD) {
        addTag(tags, "router");
    }
    if (hasLearnedMacs || !device.vlans.empty()) {
        addTag(tags, "switch");
    }
    if (isFirewallVendor(device.vendor)) {
        addTag(tags, "firewall");
    }

    if (device.vendor == "ubiquiti") {
        if (utils::contains_ci(device.model, "USG") || utils::contains_ci(device.model, "UDM")) {
            addTag(tags, "firewall");
        } else if (utils::starts_with(device.model, "ER-")) {
            addTag(tags, "router");
        } else if (utils::starts_with(device.model, "US-")) {
            addTag(tags, "switch");
        }
    }

    if (std::find(tags.begin(), tags.end(), "router") == tags.end() &&
        std::find(tags.begin(), tags.end(), "switch") == tags.end() &&
        std::find(tags.begin(), tags.end(), "firewall") == tags.end()) {
        addTag(tags, "host");
    }

    for (const auto& edge : device.neighbors) {
        if (edge.protocol == NeighborProtocol::CDP) {
            addTag(tags, "cdp");
        } else if (edge.protocol == NeighborProtocol::LLDP) {
            addTag(tags, "lldp");
        }
    }
    return tags;
}

std::string deviceTypeOf(const Device& device) {
    if (device.hasCapability("router")) return "router";
    if (device.hasCapability("switch")) return "switch";
    if (device.hasCapability("firewall")) return "firewall";
    return "host";
}

}  // namespace core
}  // namespace netmap
