/**
 * @file telnet_session.hpp
 * @brief Telnet CLI session over a TcpSocket.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/probe/cli_session.hpp"
#include "netmap/net/tcp_socket.hpp"

#include <cstdint>
#include <string>

namespace netmap {
namespace probe {

/**
 * @class TelnetFilter
 * @brief Removes RFC 854 option negotiation from the data stream.
 *
 * Every option the server offers or requests is refused (DO -> WONT,
 * WILL -> DONT), which leaves a plain NVT that device shells accept.
 * Sequences split across reads are carried over to the next feed().
 */
class NETMAP_PROBE_API TelnetFilter {
public:
    static constexpr uint8_t IAC = 255;
    static constexpr uint8_t DONT = 254;
    static constexpr uint8_t DO = 253;
    static constexpr uint8_t WONT = 252;
    static constexpr uint8_t WILL = 251;
    static constexpr uint8_t SB = 250;
    static constexpr uint8_t SE = 240;

    /**
     * @brief Filter one chunk of received bytes.
     * @param data Raw bytes from the socket.
     * @param replies Negotiation answers to send back, appended.
     * @return Application data with all commands removed.
     */
    std::string feed(const std::string& data, std::string& replies);

private:
    enum class State { DATA, COMMAND, OPTION, SUBNEGOTIATION, SUBNEGOTIATION_IAC };

    State state_ = State::DATA;
    uint8_t verb_ = 0;
};

/**
 * @class TelnetSession
 * @brief Login dialog plus prompt-driven commands on port 23.
 */
class NETMAP_PROBE_API TelnetSession : public StreamCliSession {
public:
    TelnetSession();
    ~TelnetSession() override;

    core::Result<bool> open(const std::string& ip,
                            const core::LoginCredential& credential,
                            std::chrono::milliseconds timeout) override;

    void close() override;

protected:
    int readChunk(std::string& out, int timeoutMs) override;
    bool writeAll(const std::string& data) override;

private:
    net::TcpSocket socket_;
    TelnetFilter filter_;
};

}  // namespace probe
}  // namespace netmap
