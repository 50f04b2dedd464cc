/**
 * @file cli_session.hpp
 * @brief Interactive command-line sessions to network devices.
 *
 * A session is opened once per probe attempt, runs a handful of show
 * commands and is closed. Pagination must be disabled by the caller
 * ("terminal length 0"); a "--More--" marker is still answered with a space
 * so output is never truncated.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/core/credentials.hpp"
#include "netmap/core/result.hpp"

#include <chrono>
#include <string>

namespace netmap {
namespace probe {

/**
 * @class CliSession
 * @brief One authenticated shell on one device.
 */
class NETMAP_PROBE_API CliSession {
public:
    virtual ~CliSession() = default;

    /**
     * @brief Connect, authenticate and wait for the first command prompt.
     * @return Failure with a connect or authentication reason.
     */
    virtual core::Result<bool> open(const std::string& ip,
                                    const core::LoginCredential& credential,
                                    std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Run one command and return its output without echo or prompt.
     */
    virtual core::Result<std::string> execute(const std::string& command) = 0;

    virtual void close() = 0;
};

/**
 * @class StreamCliSession
 * @brief Prompt-driven command execution over a byte stream.
 *
 * Subclasses supply the transport (readChunk/writeAll) and the login.
 */
class NETMAP_PROBE_API StreamCliSession : public CliSession {
public:
    core::Result<std::string> execute(const std::string& command) override;

protected:
    explicit StreamCliSession(const char* newline);

    /**
     * @brief Append received text to out.
     * @return Bytes appended, 0 on timeout, -1 on error or close.
     */
    virtual int readChunk(std::string& out, int timeoutMs) = 0;

    virtual bool writeAll(const std::string& data) = 0;

    /// Predicate over everything received since the last match.
    using Matcher = bool (*)(const std::string& buffer);

    /**
     * @brief Read until match(buffer) holds or the timeout expires.
     * @return The buffer consumed, including the matching tail.
     */
    core::Result<std::string> readUntil(Matcher match, std::chrono::milliseconds timeout);

    std::chrono::milliseconds timeout_{10000};
    std::string newline_;
    std::string buffer_;
};

/// Last line looks like a device command prompt ("sw1#", "fw01 >", "user@host:~$").
NETMAP_PROBE_API bool endsWithPrompt(const std::string& text);

/// Last line asks for a user name.
NETMAP_PROBE_API bool endsWithLoginPrompt(const std::string& text);

/// Last line asks for a password.
NETMAP_PROBE_API bool endsWithPasswordPrompt(const std::string& text);

/// Device rejected the login.
NETMAP_PROBE_API bool looksLikeAuthFailure(const std::string& text);

/**
 * @brief Strip the echoed command, the trailing prompt and carriage returns.
 */
NETMAP_PROBE_API std::string cleanCommandOutput(const std::string& raw, const std::string& command);

}  // namespace probe
}  // namespace netmap
