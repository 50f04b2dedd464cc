/**
 * @file ssh_session.hpp
 * @brief SSH CLI session backed by libssh.
 *
 * Only built when libssh is found at configure time (netmap_ssh target).
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/cli_session.hpp"

#include <string>

// libssh handle types, see <libssh/libssh.h>
struct ssh_session_struct;
struct ssh_channel_struct;

namespace netmap {
namespace probe {

/**
 * @class SshSession
 * @brief Password-authenticated interactive shell on a PTY.
 *
 * Network operating systems expose their CLI through the shell channel
 * rather than exec requests, so commands are written to the shell and
 * delimited by the prompt like Telnet.
 */
class SshSession : public StreamCliSession {
public:
    SshSession();
    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    core::Result<bool> open(const std::string& ip,
                            const core::LoginCredential& credential,
                            std::chrono::milliseconds timeout) override;

    void close() override;

protected:
    int readChunk(std::string& out, int timeoutMs) override;
    bool writeAll(const std::string& data) override;

private:
    ssh_session_struct* session_;
    ssh_channel_struct* channel_;
};

}  // namespace probe
}  // namespace netmap
