/**
 * @file device_prober.cpp
 * @brief DeviceProber implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/device_prober.hpp"
#include "netmap/core/classification.hpp"
#include "netmap/utils/logger.hpp"

#include <stdexcept>

namespace netmap {
namespace core {

namespace {

DiscoveryMethod methodFor(Protocol protocol) {
    switch (protocol) {
        case Protocol::SNMP: return DiscoveryMethod::SNMP;
        case Protocol::SSH: return DiscoveryMethod::SSH;
        case Protocol::TELNET: return DiscoveryMethod::TELNET;
    }
    return DiscoveryMethod::UNKNOWN;
}

template<typename T>
void recordOutcome(ProbeReport& report, const std::string& ip, Protocol protocol,
                   const AttemptOutcome<T>& outcome) {
    for (const auto& failure : outcome.failures) {
        LOG_DEBUG("DeviceProber", "{} {} attempt failed: {}", ip, toString(protocol), failure);
    }
    for (const auto& fault : outcome.faults) {
        std::string message = ip + ": " + toString(protocol) + " attempt raised: " + fault;
        LOG_WARN("DeviceProber", "{}", message);
        report.errors.push_back(message);
    }
}

}  // namespace

DeviceProber::DeviceProber(std::shared_ptr<ProtocolProbe> probe)
    : probe_(std::move(probe))
{
    if (!probe_) {
        throw std::invalid_argument("DeviceProber requires a protocol probe");
    }
}

Result<DeviceFacts> DeviceProber::attempt(const std::string& ip,
                                          Protocol protocol,
                                          const Credential& credential,
                                          std::chrono::milliseconds timeout) const {
    ProbeResult result = probe_->probe(ip, protocol, credential, timeout);
    if (!result.accessible) {
        return Result<DeviceFacts>::failure(
            result.error.empty() ? std::string("not accessible") : result.error);
    }
    return Result<DeviceFacts>::success(std::move(result.facts));
}

ProbeReport DeviceProber::discoverDevice(const std::string& ip,
                                         const DiscoveryCredentials& credentials,
                                         const ProbeOptions& options) const {
    ProbeReport report;
    Device& device = report.device;
    device.ip = ip;
    device.lastDiscovered = std::chrono::system_clock::now();

    // Step 1: reachability
    ReachabilityResult reach;
    try {
        reach = probe_->checkReachability(ip, options.pingTimeout);
    } catch (const std::exception& e) {
        reach.alive = false;
        reach.error = e.what();
        report.errors.push_back(ip + ": reachability check raised: " + e.what());
    }

    device.methods.ping = reach.alive;
    device.pingRttMs = reach.alive ? reach.rttMs : 0.0;

    if (!reach.alive && !options.includeUnreachable) {
        device.status = DeviceStatus::UNREACHABLE;
        device.error = reach.error.empty() ? "no reply to echo request" : reach.error;
        LOG_DEBUG("DeviceProber", "{} unreachable: {}", ip, device.error);
        return report;
    }

    bool accessible = false;

    // Step 2: SNMP, first credential that answers wins
    auto snmp = firstSuccess(credentials.snmp, [&](const SnmpCredential& cred) {
        return attempt(ip, Protocol::SNMP, cred, options.probeTimeout);
    });
    recordOutcome(report, ip, Protocol::SNMP, snmp);
    if (snmp.succeeded()) {
        mergeFacts(device, *snmp.value);
        markAccessible(device, methodFor(Protocol::SNMP));
        report.snmpCredential = credentials.snmp[snmp.winner];
        accessible = true;
        LOG_DEBUG("DeviceProber", "{} answered SNMP with set '{}'", ip,
                  credentials.snmp[snmp.winner].setId);
    }

    // Step 3: SSH
    auto ssh = firstSuccess(credentials.ssh, [&](const LoginCredential& cred) {
        return attempt(ip, Protocol::SSH, cred, options.probeTimeout);
    });
    recordOutcome(report, ip, Protocol::SSH, ssh);
    if (ssh.succeeded()) {
        mergeFacts(device, *ssh.value);
        markAccessible(device, methodFor(Protocol::SSH));
        accessible = true;
    }

    // Step 4: Telnet only when SSH did not get in
    if (!ssh.succeeded()) {
        auto telnet = firstSuccess(credentials.telnet, [&](const LoginCredential& cred) {
            return attempt(ip, Protocol::TELNET, cred, options.probeTimeout);
        });
        recordOutcome(report, ip, Protocol::TELNET, telnet);
        if (telnet.succeeded()) {
            mergeFacts(device, *telnet.value);
            markAccessible(device, methodFor(Protocol::TELNET));
            accessible = true;
        }
    }

    // Step 5: classification
    if (device.vendor.empty() || device.vendor == "unknown") {
        device.vendor = classifyVendor(device.system.description);
    }
    device.capabilities = deriveCapabilities(device);

    if (reach.alive || accessible) {
        device.status = DeviceStatus::CONNECTED;
    } else if (!report.errors.empty()) {
        device.status = DeviceStatus::ERROR;
        device.error = report.errors.front();
    } else {
        device.status = DeviceStatus::UNREACHABLE;
        device.error = reach.error.empty() ? "no reply to echo request" : reach.error;
    }

    LOG_INFO("DeviceProber", "{} {} via {} (vendor={}, interfaces={}, neighbors={})",
             ip, toString(device.status), toString(device.discoveryMethod),
             device.vendor, device.interfaces.size(), device.neighbors.size());
    return report;
}

}  // namespace core
}  // namespace netmap
