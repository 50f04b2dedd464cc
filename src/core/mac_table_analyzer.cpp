/**
 * @file mac_table_analyzer.cpp
 * @brief MacTableAnalyzer implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/mac_table_analyzer.hpp"
#include "netmap/utils/logger.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <utility>

namespace netmap {
namespace core {

namespace {

using PortKey = std::pair<std::string, std::string>;   // (deviceIp, port)

std::string endpointKey(const std::string& ip, const std::string& port) {
    return ip + ":" + port;
}

}  // namespace

MacTableAnalyzer::MacTableAnalyzer(MacAnalysisOptions options)
    : options_(options)
{
}

MacAnalysis MacTableAnalyzer::analyze(const std::vector<Device>& devices) const {
    MacAnalysis analysis;

    // Stable device order regardless of how the caller collected them
    std::map<std::string, const Device*> byIp;
    for (const auto& device : devices) {
        byIp.emplace(device.ip, &device);
    }

    std::map<PortKey, std::set<std::string>> portMacs;

    for (const auto& [ip, device] : byIp) {
        std::string name = device->hostname.empty() ? ip : device->hostname;
        for (const auto& entry : device->macTable) {
            if (!entry.isLearned() || entry.macAddress.empty()) {
                continue;
            }
            portMacs[{ip, entry.port}].insert(entry.macAddress);

            auto& locations = analysis.mappings[entry.macAddress];
            bool seen = std::any_of(locations.begin(), locations.end(),
                                    [&](const MacLocation& l) {
                                        return l.deviceIp == ip && l.port == entry.port;
                                    });
            if (!seen) {
                locations.push_back(MacLocation{ip, name, entry.port, entry.vlan});
            }
        }
    }

    auto fanout = [&](const MacLocation& loc) -> size_t {
        auto it = portMacs.find({loc.deviceIp, loc.port});
        return it == portMacs.end() ? 0 : it->second.size();
    };

    std::map<std::string, InferredLink> byPair;
    size_t ambiguous = 0;

    for (const auto& [mac, locations] : analysis.mappings) {
        if (locations.size() < 2) {
            continue;
        }
        if (locations.size() > 2) {
            ++ambiguous;
            continue;
        }
        if (locations[0].deviceIp == locations[1].deviceIp) {
            continue;
        }

        // More MACs on the port wins; ip then port break ties
        MacLocation primary = locations[0];
        MacLocation secondary = locations[1];
        size_t fanPrimary = fanout(primary);
        size_t fanSecondary = fanout(secondary);
        bool swap = fanSecondary > fanPrimary ||
                    (fanSecondary == fanPrimary &&
                     std::tie(secondary.deviceIp, secondary.port) <
                         std::tie(primary.deviceIp, primary.port));
        if (swap) {
            std::swap(primary, secondary);
            std::swap(fanPrimary, fanSecondary);
        }

        if (fanPrimary < options_.minPrimaryFanout) {
            continue;
        }

        std::string a = endpointKey(primary.deviceIp, primary.port);
        std::string b = endpointKey(secondary.deviceIp, secondary.port);
        std::string pairKey = a < b ? a + "|" + b : b + "|" + a;
        if (byPair.count(pairKey)) {
            continue;
        }

        InferredLink link;
        link.device1 = LinkEndpoint{primary.deviceIp, primary.deviceName, primary.port};
        link.device2 = LinkEndpoint{secondary.deviceIp, secondary.deviceName, secondary.port};
        link.vlan = primary.vlan;
        link.evidenceMac = mac;
        link.key = a + "-" + b;
        link.primaryFanout = fanPrimary;
        link.trunk = fanPrimary >= options_.trunkFanoutThreshold;
        byPair.emplace(pairKey, link);
    }

    analysis.links.reserve(byPair.size());
    for (auto& [pair, link] : byPair) {
        analysis.links.push_back(std::move(link));
    }

    LOG_INFO("MacTableAnalyzer", "Analyzed {} MAC address(es) across {} device(s): {} link(s), {} ambiguous",
             analysis.mappings.size(), byIp.size(), analysis.links.size(), ambiguous);
    return analysis;
}

}  // namespace core
}  // namespace netmap
