/**
 * @file ssh_session.cpp
 * @brief libssh-backed CLI session.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/ssh_session.hpp"
#include "netmap/utils/logger.hpp"

#include <libssh/libssh.h>

#include <algorithm>
#include <cstdint>

namespace netmap {
namespace probe {

namespace {

constexpr unsigned int DEFAULT_SSH_PORT = 22;
constexpr int PTY_COLUMNS = 200;
constexpr int PTY_ROWS = 48;

}  // namespace

SshSession::SshSession()
    : StreamCliSession("\n")
    , session_(nullptr)
    , channel_(nullptr)
{
}

SshSession::~SshSession() {
    close();
}

core::Result<bool> SshSession::open(const std::string& ip,
                                    const core::LoginCredential& credential,
                                    std::chrono::milliseconds timeout) {
    using R = core::Result<bool>;
    timeout_ = timeout;

    session_ = ssh_new();
    if (session_ == nullptr) {
        return R::failure("ssh session allocation failed");
    }

    unsigned int port = credential.port != 0 ? credential.port : DEFAULT_SSH_PORT;
    long timeoutSeconds = std::max<long>(1, static_cast<long>(timeout.count() / 1000));
    if (ssh_options_set(session_, SSH_OPTIONS_HOST, ip.c_str()) < 0 ||
        ssh_options_set(session_, SSH_OPTIONS_PORT, &port) < 0 ||
        ssh_options_set(session_, SSH_OPTIONS_USER, credential.username.c_str()) < 0 ||
        ssh_options_set(session_, SSH_OPTIONS_TIMEOUT, &timeoutSeconds) < 0) {
        std::string reason = std::string("ssh options rejected: ") + ssh_get_error(session_);
        close();
        return R::failure(reason);
    }

    if (ssh_connect(session_) != SSH_OK) {
        std::string reason = std::string("ssh connect failed: ") + ssh_get_error(session_);
        close();
        return R::failure(reason);
    }

    // Discovery targets are unknown hosts; their keys are not pinned.
    if (ssh_userauth_password(session_, nullptr, credential.password.c_str()) != SSH_AUTH_SUCCESS) {
        close();
        return R::failure("authentication failed");
    }

    channel_ = ssh_channel_new(session_);
    if (channel_ == nullptr ||
        ssh_channel_open_session(channel_) != SSH_OK ||
        ssh_channel_request_pty_size(channel_, "vt100", PTY_COLUMNS, PTY_ROWS) != SSH_OK ||
        ssh_channel_request_shell(channel_) != SSH_OK) {
        std::string reason = std::string("ssh shell request failed: ") + ssh_get_error(session_);
        close();
        return R::failure(reason);
    }

    auto prompt = readUntil(&endsWithPrompt, timeout);
    if (!prompt) {
        close();
        return R::failure(prompt.error());
    }
    LOG_DEBUG("SshSession", "{}: shell ready", ip);
    return R::success(true);
}

void SshSession::close() {
    if (channel_ != nullptr) {
        if (ssh_channel_is_open(channel_)) {
            ssh_channel_send_eof(channel_);
            ssh_channel_close(channel_);
        }
        ssh_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_ != nullptr) {
        ssh_disconnect(session_);
        ssh_free(session_);
        session_ = nullptr;
    }
}

int SshSession::readChunk(std::string& out, int timeoutMs) {
    if (channel_ == nullptr) {
        return -1;
    }
    char buffer[4096];
    int n = ssh_channel_read_timeout(channel_, buffer, sizeof(buffer), 0, timeoutMs);
    if (n == SSH_ERROR) {
        return -1;
    }
    if (n == 0 && ssh_channel_is_eof(channel_)) {
        return -1;
    }
    out.append(buffer, static_cast<size_t>(n));
    return n;
}

bool SshSession::writeAll(const std::string& data) {
    if (channel_ == nullptr) {
        return false;
    }
    size_t offset = 0;
    while (offset < data.size()) {
        int n = ssh_channel_write(channel_, data.data() + offset,
                                  static_cast<uint32_t>(data.size() - offset));
        if (n == SSH_ERROR) {
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace probe
}  // namespace netmap
