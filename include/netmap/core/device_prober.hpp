/**
 * @file device_prober.hpp
 * @brief Runs every protocol probe for one IP and merges the outcome.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/credentials.hpp"
#include "netmap/core/device.hpp"
#include "netmap/core/protocol_probe.hpp"
#include "netmap/core/result.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace netmap {
namespace core {

/**
 * @struct AttemptOutcome
 * @brief Result of trying an ordered list of candidates until one succeeds.
 */
template<typename T>
struct AttemptOutcome {
    std::optional<T> value;
    size_t winner = 0;                  ///< Index of the successful candidate
    size_t attempts = 0;
    std::vector<std::string> failures;  ///< Reported failures, in order
    std::vector<std::string> faults;    ///< Exceptions raised by attempts, in order

    bool succeeded() const { return value.has_value(); }
};

/**
 * @brief Try candidates in order and stop at the first successful Result.
 *
 * Later candidates are not attempted once one succeeds. An attempt that
 * throws counts as a failure and the next candidate is tried.
 *
 * @code
 * auto outcome = firstSuccess(creds.snmp, [&](const SnmpCredential& c) {
 *     return snmpAttempt(ip, c);
 * });
 * if (outcome.succeeded()) { use(*outcome.value, creds.snmp[outcome.winner]); }
 * @endcode
 */
template<typename Candidate, typename Fn>
auto firstSuccess(const std::vector<Candidate>& candidates, Fn&& attempt)
    -> AttemptOutcome<typename std::invoke_result_t<Fn&, const Candidate&>::value_type> {

    using T = typename std::invoke_result_t<Fn&, const Candidate&>::value_type;
    AttemptOutcome<T> outcome;

    for (size_t i = 0; i < candidates.size(); ++i) {
        ++outcome.attempts;
        try {
            auto result = attempt(candidates[i]);
            if (result) {
                outcome.value = std::move(*result);
                outcome.winner = i;
                return outcome;
            }
            outcome.failures.push_back(result.error());
        } catch (const std::exception& e) {
            outcome.faults.push_back(e.what());
        }
    }
    return outcome;
}

struct NETMAP_CORE_API ProbeOptions {
    bool includeUnreachable = false;
    std::chrono::milliseconds pingTimeout{2000};
    std::chrono::milliseconds probeTimeout{10000};
};

/**
 * @struct ProbeReport
 * @brief Everything one discoverDevice() call produced.
 *
 * Workers return reports; only the orchestrator folds them into shared state.
 */
struct NETMAP_CORE_API ProbeReport {
    Device device;
    std::vector<std::string> errors;
    std::optional<SnmpCredential> snmpCredential;   ///< First SNMP credential that worked
};

/**
 * @class DeviceProber
 * @brief Reachability, then SNMP, then SSH, with Telnet as a fallback.
 *
 * discoverDevice() never throws: every failure ends up in the report.
 */
class NETMAP_CORE_API DeviceProber {
public:
    explicit DeviceProber(std::shared_ptr<ProtocolProbe> probe);

    ProbeReport discoverDevice(const std::string& ip,
                               const DiscoveryCredentials& credentials,
                               const ProbeOptions& options) const;

private:
    std::shared_ptr<ProtocolProbe> probe_;

    Result<DeviceFacts> attempt(const std::string& ip,
                                Protocol protocol,
                                const Credential& credential,
                                std::chrono::milliseconds timeout) const;
};

}  // namespace core
}  // namespace netmap
