/**
 * @file fake_protocol_probe.hpp
 * @brief In-memory ProtocolProbe for discovery tests
 */

#pragma once

#include <netmap/core/protocol_probe.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace netmap {
namespace testing {

/**
 * @brief Scripted behaviour of one simulated host.
 */
struct FakeHost {
    bool alive = true;
    double rttMs = 1.5;
    std::map<std::string, core::DeviceFacts> snmp;     ///< community -> facts
    std::map<std::string, core::DeviceFacts> ssh;      ///< username -> facts
    std::map<std::string, core::DeviceFacts> telnet;   ///< username -> facts
    std::vector<core::NeighborEdge> snmpNeighbors;     ///< Returned by probeNeighbors
    bool throwOnProbe = false;
};

/**
 * @brief ProtocolProbe answering from a table of FakeHost entries.
 *
 * Hosts not in the table never answer. Thread-safe; the orchestrator
 * calls it from several workers at once.
 */
class FakeProtocolProbe : public core::ProtocolProbe {
public:
    void addHost(const std::string& ip, FakeHost host) {
        std::lock_guard<std::mutex> lock(mutex_);
        hosts_[ip] = std::move(host);
    }

    /// Called at the start of every reachability check.
    void setReachabilityHook(std::function<void(const std::string&)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    core::ReachabilityResult checkReachability(const std::string& ip,
                                               std::chrono::milliseconds) override {
        std::function<void(const std::string&)> hook;
        core::ReachabilityResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++reachabilityCalls_[ip];
            hook = hook_;
            auto it = hosts_.find(ip);
            if (it != hosts_.end() && it->second.alive) {
                result.alive = true;
                result.rttMs = it->second.rttMs;
            } else {
                result.error = "host unreachable";
            }
        }
        if (hook) {
            hook(ip);
        }
        return result;
    }

    core::ProbeResult probe(const std::string& ip,
                            core::Protocol protocol,
                            const core::Credential& credential,
                            std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++probeCalls_[ip];

        auto it = hosts_.find(ip);
        if (it == hosts_.end()) {
            return core::ProbeResult::failure("timeout");
        }
        const FakeHost& host = it->second;
        if (host.throwOnProbe) {
            throw std::runtime_error("simulated transport fault");
        }

        const std::map<std::string, core::DeviceFacts>* table = nullptr;
        std::string key;
        if (protocol == core::Protocol::SNMP) {
            table = &host.snmp;
            key = std::get<core::SnmpCredential>(credential).community;
        } else {
            table = protocol == core::Protocol::SSH ? &host.ssh : &host.telnet;
            key = std::get<core::LoginCredential>(credential).username;
        }

        auto facts = table->find(key);
        if (facts == table->end()) {
            return core::ProbeResult::failure("authentication failed");
        }
        core::ProbeResult result;
        result.accessible = true;
        result.facts = facts->second;
        return result;
    }

    core::Result<std::vector<core::NeighborEdge>> probeNeighbors(
        const std::string& ip,
        const core::SnmpCredential& credential,
        std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++neighborCalls_[ip];

        auto it = hosts_.find(ip);
        if (it == hosts_.end() || it->second.snmp.count(credential.community) == 0) {
            return core::Result<std::vector<core::NeighborEdge>>::failure("no snmp response");
        }
        return core::Result<std::vector<core::NeighborEdge>>::success(it->second.snmpNeighbors);
    }

    int reachabilityCalls(const std::string& ip) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reachabilityCalls_.find(ip);
        return it == reachabilityCalls_.end() ? 0 : it->second;
    }

    int probeCalls(const std::string& ip) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = probeCalls_.find(ip);
        return it == probeCalls_.end() ? 0 : it->second;
    }

    int neighborCalls(const std::string& ip) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = neighborCalls_.find(ip);
        return it == neighborCalls_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, FakeHost> hosts_;
    std::function<void(const std::string&)> hook_;
    std::map<std::string, int> reachabilityCalls_;
    std::map<std::string, int> probeCalls_;
    std::map<std::string, int> neighborCalls_;
};

/// CDP edge as advertised by fromIp.
inline core::NeighborEdge cdpEdge(const std::string& fromIp, const std::string& localIf,
                                  const std::string& toIp, const std::string& deviceId,
                                  const std::string& remoteIf) {
    core::NeighborEdge edge;
    edge.fromIp = fromIp;
    edge.localInterface = localIf;
    edge.toIp = toIp;
    edge.toDeviceId = deviceId;
    edge.remoteInterface = remoteIf;
    edge.protocol = core::NeighborProtocol::CDP;
    edge.confidence = core::Confidence::HIGH;
    return edge;
}

/// Facts of a Cisco switch reachable over SNMP.
inline core::DeviceFacts switchFacts(const std::string& hostname) {
    core::DeviceFacts facts;
    facts.hostname = hostname;
    facts.system.description = "Cisco IOS Software, C2960 Software, Version 15.0(2)SE";
    return facts;
}

}  // namespace testing
}  // namespace netmap
