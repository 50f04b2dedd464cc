/**
 * @file snmp_client.hpp
 * @brief SNMP get/walk client interface and its UDP implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/probe/snmp_codec.hpp"
#include "netmap/core/credentials.hpp"
#include "netmap/core/result.hpp"
#include "netmap/net/udp_socket.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace netmap {
namespace probe {

/**
 * @class SnmpClient
 * @brief Read-only SNMP operations against one agent.
 */
class NETMAP_PROBE_API SnmpClient {
public:
    virtual ~SnmpClient() = default;

    /**
     * @brief GET the given scalars in one request.
     *
     * Missing objects come back as exception values (v2c) rather than
     * failing the whole request.
     */
    virtual core::Result<std::vector<VarBind>> get(const std::vector<std::string>& oids) = 0;

    /**
     * @brief Walk every object below rootOid in OID order.
     * @param maxRows Stop after this many rows (0 = unlimited).
     * @return Rows found; an empty list when the subtree is absent.
     */
    virtual core::Result<std::vector<VarBind>> walk(const std::string& rootOid,
                                                    size_t maxRows = 0) = 0;
};

/**
 * @class UdpSnmpClient
 * @brief SNMPv1/v2c over UDP.
 *
 * Walks use GETBULK for v2c and GETNEXT for v1. Each request is retried
 * credential.retries times on timeout.
 *
 * Usage:
 * @code
 * core::SnmpCredential cred;
 * cred.community = "public";
 * UdpSnmpClient client("10.0.0.1", cred, std::chrono::milliseconds(2000));
 * auto rows = client.walk("1.3.6.1.2.1.2.2.1.2");
 * @endcode
 */
class NETMAP_PROBE_API UdpSnmpClient : public SnmpClient {
public:
    UdpSnmpClient(const std::string& ip,
                  const core::SnmpCredential& credential,
                  std::chrono::milliseconds timeout,
                  int32_t maxRepetitions = 25);

    core::Result<std::vector<VarBind>> get(const std::vector<std::string>& oids) override;

    core::Result<std::vector<VarBind>> walk(const std::string& rootOid,
                                            size_t maxRows = 0) override;

private:
    std::string ip_;
    core::SnmpCredential credential_;
    std::chrono::milliseconds timeout_;
    int32_t maxRepetitions_;
    net::UdpSocket socket_;
    bool bound_;

    static std::atomic<int32_t> nextRequestId_;

    core::Result<SnmpResponse> exchange(SnmpPduType type,
                                        const std::vector<std::string>& oids);
};

}  // namespace probe
}  // namespace netmap
