/**
 * @file cli_probe.cpp
 * @brief CliProbe implementation and the default session factory.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/cli_probe.hpp"
#include "netmap/probe/telnet_session.hpp"
#include "netmap/core/classification.hpp"
#include "netmap/utils/logger.hpp"

#ifdef NETMAP_HAVE_LIBSSH
#include "netmap/probe/ssh_session.hpp"
#endif

namespace netmap {
namespace probe {

namespace {

constexpr const char* DISABLE_PAGING = "terminal length 0";
constexpr const char* SHOW_VERSION = "show version";

}  // namespace

CliSessionFactory defaultSessionFactory() {
    return [](core::Protocol protocol) -> std::unique_ptr<CliSession> {
        switch (protocol) {
            case core::Protocol::TELNET:
                return std::make_unique<TelnetSession>();
            case core::Protocol::SSH:
#ifdef NETMAP_HAVE_LIBSSH
                return std::make_unique<SshSession>();
#else
                return nullptr;
#endif
            default:
                return nullptr;
        }
    };
}

CliProbe::CliProbe(CliSessionFactory factory, PlatformDecoderRegistry registry)
    : factory_(std::move(factory))
    , registry_(std::move(registry))
{
}

core::ProbeResult CliProbe::probe(const std::string& ip,
                                  core::Protocol protocol,
                                  const core::LoginCredential& credential,
                                  std::chrono::milliseconds timeout) const {
    std::unique_ptr<CliSession> session = factory_ ? factory_(protocol) : nullptr;
    if (!session) {
        return core::ProbeResult::failure(std::string(core::toString(protocol)) +
                                          " transport not available");
    }

    auto opened = session->open(ip, credential, timeout);
    if (!opened) {
        LOG_DEBUG("CliProbe", "{} {}@{}: {}", core::toString(protocol), credential.username, ip,
                  opened.error());
        return core::ProbeResult::failure(opened.error());
    }

    auto paging = session->execute(DISABLE_PAGING);
    if (!paging) {
        LOG_DEBUG("CliProbe", "{}: '{}' failed: {}", ip, DISABLE_PAGING, paging.error());
    }

    auto version = session->execute(SHOW_VERSION);
    if (!version) {
        session->close();
        return core::ProbeResult::failure("show version failed: " + version.error());
    }

    core::ProbeResult result;
    result.accessible = true;

    std::string vendor = core::classifyVendor(*version);
    if (vendor != "unknown") {
        result.facts.vendor = vendor;
    }
    const PlatformDecoder& decoder = registry_.find(vendor);
    decoder.decodeVersion(*version, result.facts);

    for (const auto& command : decoder.commands()) {
        auto output = session->execute(command);
        if (!output) {
            LOG_DEBUG("CliProbe", "{}: '{}' failed: {}", ip, command, output.error());
            continue;
        }
        decoder.decode(command, *output, ip, result.facts);
    }

    session->close();
    LOG_DEBUG("CliProbe", "{}: {} session decoded as {} ({} interface(s), {} neighbor(s))",
              ip, core::toString(protocol), decoder.vendor(), result.facts.interfaces.size(),
              result.facts.neighbors.size());
    return result;
}

}  // namespace probe
}  // namespace netmap
