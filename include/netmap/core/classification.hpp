/**
 * @file classification.hpp
 * @brief Vendor keyword matching and capability derivation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/device.hpp"

#include <string>
#include <vector>

namespace netmap {
namespace core {

/// Routing tables larger than this mark a device as a router.
constexpr size_t ROUTER_ROUTE_THRESHOLD = 5;

/**
 * @brief Classify a vendor from a system description or CLI banner.
 *
 * Case-insensitive keyword match in a fixed order: cisco, juniper, arista,
 * fortinet, paloalto ("palo alto"), checkpoint, ubiquiti (also unifi, edgeos,
 * edgemax), hp ("hp " or hewlett), dell, extreme.
 *
 * @return Vendor tag, or "unknown".
 */
NETMAP_CORE_API std::string classifyVendor(const std::string& description);

/**
 * @brief Derive role and protocol tags from the structural facts of a device.
 *
 * Role tags are router (more than ROUTER_ROUTE_THRESHOLD routes, or an
 * EdgeRouter model), switch (learned MAC entries or VLANs) and firewall
 * (firewall vendors and Ubiquiti gateway models). A device with none of them
 * is tagged host. Neighbor protocols seen on the device add cdp/lldp tags.
 */
NETMAP_CORE_API std::vector<std::string> deriveCapabilities(const Device& device);

/**
 * @brief Topology node type with precedence router > switch > firewall > host.
 */
NETMAP_CORE_API std::string deviceTypeOf(const Device& device);

}  // namespace core
}  // namespace netmap
