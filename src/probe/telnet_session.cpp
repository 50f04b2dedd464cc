/**
 * @file telnet_session.cpp
 * @brief Telnet session implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/telnet_session.hpp"
#include "netmap/utils/logger.hpp"

#include <cstring>

namespace netmap {
namespace probe {

namespace {

constexpr uint16_t TELNET_PORT = 23;

bool loginDialogStep(const std::string& buffer) {
    return endsWithLoginPrompt(buffer) || endsWithPasswordPrompt(buffer) ||
           endsWithPrompt(buffer);
}

bool afterPassword(const std::string& buffer) {
    return endsWithPrompt(buffer) || endsWithLoginPrompt(buffer) ||
           endsWithPasswordPrompt(buffer) || looksLikeAuthFailure(buffer);
}

}  // namespace

// =============================================================================
// TelnetFilter
// =============================================================================

std::string TelnetFilter::feed(const std::string& data, std::string& replies) {
    std::string out;
    out.reserve(data.size());

    for (char ch : data) {
        auto byte = static_cast<uint8_t>(ch);
        switch (state_) {
            case State::DATA:
                if (byte == IAC) {
                    state_ = State::COMMAND;
                } else {
                    out.push_back(ch);
                }
                break;

            case State::COMMAND:
                if (byte == IAC) {
                    out.push_back(ch);          // escaped 0xFF
                    state_ = State::DATA;
                } else if (byte == DO || byte == DONT || byte == WILL || byte == WONT) {
                    verb_ = byte;
                    state_ = State::OPTION;
                } else if (byte == SB) {
                    state_ = State::SUBNEGOTIATION;
                } else {
                    state_ = State::DATA;       // NOP, GA and friends carry no option
                }
                break;

            case State::OPTION:
                if (verb_ == DO) {
                    replies.push_back(static_cast<char>(IAC));
                    replies.push_back(static_cast<char>(WONT));
                    replies.push_back(ch);
                } else if (verb_ == WILL) {
                    replies.push_back(static_cast<char>(IAC));
                    replies.push_back(static_cast<char>(DONT));
                    replies.push_back(ch);
                }
                state_ = State::DATA;
                break;

            case State::SUBNEGOTIATION:
                if (byte == IAC) {
                    state_ = State::SUBNEGOTIATION_IAC;
                }
                break;

            case State::SUBNEGOTIATION_IAC:
                state_ = byte == SE ? State::DATA : State::SUBNEGOTIATION;
                break;
        }
    }
    return out;
}

// =============================================================================
// TelnetSession
// =============================================================================

TelnetSession::TelnetSession()
    : StreamCliSession("\r\n")
{
}

TelnetSession::~TelnetSession() {
    close();
}

core::Result<bool> TelnetSession::open(const std::string& ip,
                                       const core::LoginCredential& credential,
                                       std::chrono::milliseconds timeout) {
    using R = core::Result<bool>;
    timeout_ = timeout;
    uint16_t port = credential.port != 0 ? credential.port : TELNET_PORT;

    switch (socket_.connect(ip, port, static_cast<int>(timeout.count()))) {
        case net::ConnectResult::CONNECTED:
            break;
        case net::ConnectResult::REFUSED:
            return R::failure("telnet connection refused");
        case net::ConnectResult::TIMED_OUT:
            return R::failure("telnet connect timed out");
        default:
            return R::failure(std::string("telnet connect failed: ") +
                              std::strerror(socket_.getLastError()));
    }

    auto banner = readUntil(&loginDialogStep, timeout);
    if (!banner) {
        return R::failure(banner.error());
    }

    if (endsWithLoginPrompt(*banner)) {
        if (!writeAll(credential.username + newline_)) {
            return R::failure("write failed");
        }
        auto next = readUntil(&loginDialogStep, timeout);
        if (!next) {
            return R::failure(next.error());
        }
        banner = next;
    }

    if (endsWithPasswordPrompt(*banner)) {
        if (!writeAll(credential.password + newline_)) {
            return R::failure("write failed");
        }
        auto result = readUntil(&afterPassword, timeout);
        if (!result) {
            return R::failure(result.error());
        }
        if (looksLikeAuthFailure(*result) || !endsWithPrompt(*result)) {
            return R::failure("authentication failed");
        }
        return R::success(true);
    }

    if (endsWithPrompt(*banner)) {
        LOG_DEBUG("TelnetSession", "{}: shell opened without password", ip);
        return R::success(true);
    }
    return R::failure("authentication failed");
}

void TelnetSession::close() {
    if (socket_.isConnected() && !socket_.sendAll("exit" + newline_, 500)) {
        LOG_TRACE("TelnetSession", "exit not delivered before close");
    }
    socket_.close();
}

int TelnetSession::readChunk(std::string& out, int timeoutMs) {
    char buffer[4096];
    int n = socket_.receive(buffer, sizeof(buffer), timeoutMs);
    if (n <= 0) {
        return n;
    }

    std::string replies;
    std::string text = filter_.feed(std::string(buffer, static_cast<size_t>(n)), replies);
    if (!replies.empty() && !socket_.sendAll(replies)) {
        return -1;
    }
    out += text;
    return static_cast<int>(text.size());
}

bool TelnetSession::writeAll(const std::string& data) {
    return socket_.sendAll(data);
}

}  // namespace probe
}  // namespace netmap
