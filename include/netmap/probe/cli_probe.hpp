/**
 * @file cli_probe.hpp
 * @brief Fact collection over an interactive SSH or Telnet session.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/probe/cli_session.hpp"
#include "netmap/probe/platform_decoder.hpp"
#include "netmap/core/protocol_probe.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace netmap {
namespace probe {

/// Creates an unopened session for SSH or Telnet; nullptr when unsupported.
using CliSessionFactory = std::function<std::unique_ptr<CliSession>(core::Protocol)>;

/**
 * @brief Factory for the transports compiled into this build.
 *
 * Telnet is always available. SSH requires libssh at build time.
 */
NETMAP_PROBE_API CliSessionFactory defaultSessionFactory();

/**
 * @class CliProbe
 * @brief Logs in, identifies the platform and runs its decoder's commands.
 *
 * Usage:
 * @code
 * CliProbe cli(defaultSessionFactory(), PlatformDecoderRegistry::withBuiltins());
 * auto result = cli.probe("10.0.0.1", core::Protocol::SSH, login, std::chrono::seconds(10));
 * @endcode
 */
class NETMAP_PROBE_API CliProbe {
public:
    CliProbe(CliSessionFactory factory, PlatformDecoderRegistry registry);

    /**
     * @brief One session, one credential.
     * @return accessible=false with the reason on connect, login or
     *         "show version" failure; never throws for device behavior.
     */
    core::ProbeResult probe(const std::string& ip,
                            core::Protocol protocol,
                            const core::LoginCredential& credential,
                            std::chrono::milliseconds timeout) const;

private:
    CliSessionFactory factory_;
    PlatformDecoderRegistry registry_;
};

}  // namespace probe
}  // namespace netmap
