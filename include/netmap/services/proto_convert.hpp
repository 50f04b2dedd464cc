/**
 * @file proto_convert.hpp
 * @brief Conversion from the core discovery model to netmap.v1 messages.
 *
 * Enumerations are rendered with their toString() names so the wire format
 * matches the log output.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/services/export.hpp"
#include "netmap/core/discovery_orchestrator.hpp"

#include <string>

#include "netmap/proto/netmap.pb.h"

namespace netmap {
namespace services {

NETMAP_SERVICES_API void toProto(const core::InterfaceInfo& in, v1::Interface* out);
NETMAP_SERVICES_API void toProto(const core::NeighborEdge& in, v1::NeighborEdge* out);
NETMAP_SERVICES_API void toProto(const core::Device& in, v1::Device* out);
NETMAP_SERVICES_API void toProto(const core::Link& in, v1::Link* out);
NETMAP_SERVICES_API void toProto(const core::InferredLink& in, v1::InferredLink* out);
NETMAP_SERVICES_API void toProto(const core::Topology& in, v1::Topology* out);

/**
 * @brief Fill a progress message.
 * @param runId Identifier the service assigned to the run.
 */
NETMAP_SERVICES_API void toProto(const core::DiscoveryProgress& in,
                                 const std::string& runId,
                                 v1::DiscoveryProgress* out);

NETMAP_SERVICES_API void toProto(const core::DiscoveryResult& in,
                                 const std::string& runId,
                                 v1::DiscoveryResult* out);

/**
 * @brief Render a result as JSON for one-shot mode.
 * @return JSON text, or an empty string if protobuf refused the message.
 */
NETMAP_SERVICES_API std::string toJson(const v1::DiscoveryResult& result, bool pretty = true);

}  // namespace services
}  // namespace netmap
