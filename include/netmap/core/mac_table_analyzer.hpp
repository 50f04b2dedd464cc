/**
 * @file mac_table_analyzer.hpp
 * @brief Infers inter-switch links from learned MAC forwarding tables.
 *
 * A MAC address learned on exactly two switches is taken as evidence that
 * the two ports it was learned on face each other. The port that sees more
 * learned MACs is ranked first (an uplink sees many hosts). The result is a
 * heuristic and always carries Confidence::MEDIUM.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/device.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace netmap {
namespace core {

/**
 * @struct MacLocation
 * @brief Where one MAC address was learned.
 */
struct NETMAP_CORE_API MacLocation {
    std::string deviceIp;
    std::string deviceName;     ///< hostname, or ip when unknown
    std::string port;
    int vlan = 1;
};

struct NETMAP_CORE_API LinkEndpoint {
    std::string ip;
    std::string hostname;
    std::string port;
};

/**
 * @struct InferredLink
 * @brief Link derived from MAC co-location. device1 is the higher fan-out port.
 */
struct NETMAP_CORE_API InferredLink {
    LinkEndpoint device1;
    LinkEndpoint device2;
    Confidence confidence = Confidence::MEDIUM;
    int vlan = 1;
    std::string evidenceMac;
    std::string key;            ///< "ip1:port1-ip2:port2"
    size_t primaryFanout = 0;   ///< learned MACs on device1's port
    bool trunk = false;         ///< primaryFanout reached the trunk threshold

    static const char* type() { return "learned_from_mac"; }
};

struct NETMAP_CORE_API MacAnalysisOptions {
    /// Ports with at least this many learned MACs are flagged as trunks.
    size_t trunkFanoutThreshold = 10;
    /// Primary ports with fewer learned MACs do not produce a link.
    size_t minPrimaryFanout = 1;
};

/**
 * @struct MacAnalysis
 * @brief Analyzer output: every MAC's locations plus the inferred links.
 */
struct NETMAP_CORE_API MacAnalysis {
    std::map<std::string, std::vector<MacLocation>> mappings;
    std::vector<InferredLink> links;
};

/**
 * @class MacTableAnalyzer
 * @brief Pure transform from a device set to MAC mappings and inferred links.
 *
 * Only learned entries are considered. Locations are de-duplicated per
 * (device, port). A MAC with exactly two locations on two different devices
 * yields one candidate link; three or more devices make it ambiguous and it
 * is only reported in the mapping. Candidates are de-duplicated per
 * unordered endpoint pair, so the output does not depend on device order.
 */
class NETMAP_CORE_API MacTableAnalyzer {
public:
    explicit MacTableAnalyzer(MacAnalysisOptions options = MacAnalysisOptions());

    MacAnalysis analyze(const std::vector<Device>& devices) const;

    const MacAnalysisOptions& options() const { return options_; }

private:
    MacAnalysisOptions options_;
};

}  // namespace core
}  // namespace netmap
