/**
 * @file snmp_client.cpp
 * @brief UdpSnmpClient implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/snmp_client.hpp"
#include "netmap/utils/logger.hpp"

#include <algorithm>
#include <cstring>

namespace netmap {
namespace probe {

std::atomic<int32_t> UdpSnmpClient::nextRequestId_{1};

UdpSnmpClient::UdpSnmpClient(const std::string& ip,
                             const core::SnmpCredential& credential,
                             std::chrono::milliseconds timeout,
                             int32_t maxRepetitions)
    : ip_(ip)
    , credential_(credential)
    , timeout_(timeout)
    , maxRepetitions_(maxRepetitions)
    , bound_(false)
{
    bound_ = socket_.bind(0);
    if (!bound_) {
        LOG_ERROR("SnmpClient", "Failed to bind UDP socket: {}", std::strerror(socket_.getLastError()));
    }
}

core::Result<SnmpResponse> UdpSnmpClient::exchange(SnmpPduType type,
                                                   const std::vector<std::string>& oids) {
    using R = core::Result<SnmpResponse>;
    if (!bound_) {
        return R::failure("snmp socket unavailable");
    }

    SnmpRequest request;
    request.version = credential_.version == core::SnmpVersion::V1 ? SNMP_VERSION_1 : SNMP_VERSION_2C;
    request.community = credential_.community;
    request.pduType = type;
    request.requestId = nextRequestId_.fetch_add(1) & 0x7FFFFFFF;
    request.oids = oids;
    if (type == SnmpPduType::GET_BULK) {
        request.nonRepeaters = 0;
        request.maxRepetitions = maxRepetitions_;
    }

    auto packet = encodeRequest(request);
    if (!packet) {
        return R::failure(packet.error());
    }

    net::SocketAddress agent(ip_, credential_.port);
    std::vector<uint8_t> buffer(65535);
    int attempts = 1 + std::max(0, credential_.retries);

    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (socket_.sendTo(agent, packet->data(), packet->size()) < 0) {
            return R::failure(std::string("send failed: ") + std::strerror(socket_.getLastError()));
        }

        auto deadline = std::chrono::steady_clock::now() + timeout_;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }

            net::SocketAddress sender;
            int received = socket_.receiveFrom(buffer.data(), buffer.size(),
                                               static_cast<int>(remaining.count()), sender);
            if (received < 0) {
                return R::failure(std::string("receive failed: ") +
                                  std::strerror(socket_.getLastError()));
            }
            if (received == 0) {
                break;
            }
            if (sender.ip != ip_) {
                continue;
            }

            auto response = decodeResponse(buffer.data(), static_cast<size_t>(received));
            if (!response) {
                LOG_DEBUG("SnmpClient", "{}: discarding undecodable datagram: {}", ip_, response.error());
                continue;
            }
            if (response->requestId != request.requestId) {
                continue;
            }
            return response;
        }
        LOG_TRACE("SnmpClient", "{}: request {} timed out (attempt {}/{})",
                  ip_, request.requestId, attempt + 1, attempts);
    }

    return R::failure("timeout waiting for " + ip_ + ":" + std::to_string(credential_.port));
}

core::Result<std::vector<VarBind>> UdpSnmpClient::get(const std::vector<std::string>& oids) {
    using R = core::Result<std::vector<VarBind>>;
    auto response = exchange(SnmpPduType::GET, oids);
    if (!response) {
        return R::failure(response.error());
    }
    if (response->errorStatus != 0) {
        return R::failure(std::string("agent returned ") + snmpErrorName(response->errorStatus));
    }
    return R::success(response->varbinds);
}

core::Result<std::vector<VarBind>> UdpSnmpClient::walk(const std::string& rootOid, size_t maxRows) {
    using R = core::Result<std::vector<VarBind>>;
    std::vector<VarBind> rows;
    std::string cursor = rootOid;
    bool bulk = credential_.version == core::SnmpVersion::V2C;

    while (true) {
        auto response = exchange(bulk ? SnmpPduType::GET_BULK : SnmpPduType::GET_NEXT, {cursor});
        if (!response) {
            if (rows.empty()) {
                return R::failure(response.error());
            }
            LOG_DEBUG("SnmpClient", "{}: walk of {} cut short after {} row(s): {}",
                      ip_, rootOid, rows.size(), response.error());
            return R::success(std::move(rows));
        }

        // v1 agents signal the end of the MIB with noSuchName
        if (response->errorStatus != 0) {
            if (!bulk && response->errorStatus == 2) {
                return R::success(std::move(rows));
            }
            return R::failure(std::string("agent returned ") + snmpErrorName(response->errorStatus));
        }
        if (response->varbinds.empty()) {
            return R::success(std::move(rows));
        }

        for (const auto& vb : response->varbinds) {
            if (vb.value.isException() || !oidIsUnder(vb.oid, rootOid)) {
                return R::success(std::move(rows));
            }
            if (compareOids(vb.oid, cursor) <= 0) {
                LOG_WARN("SnmpClient", "{}: agent returned non-increasing OID {} after {}",
                         ip_, vb.oid, cursor);
                return R::success(std::move(rows));
            }
            rows.push_back(vb);
            cursor = vb.oid;
            if (maxRows > 0 && rows.size() >= maxRows) {
                return R::success(std::move(rows));
            }
        }
    }
}

}  // namespace probe
}  // namespace netmap
