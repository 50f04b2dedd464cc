/**
 * @file credentials.cpp
 * @brief Credential file parsing and StaticCredentialProvider.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/credentials.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace netmap {
namespace core {

const char* toString(Protocol protocol) {
    switch (protocol) {
        case Protocol::SNMP: return "snmp";
        case Protocol::SSH: return "ssh";
        case Protocol::TELNET: return "telnet";
        default: return "unknown";
    }
}

const char* toString(SnmpVersion version) {
    return version == SnmpVersion::V1 ? "v1" : "v2c";
}

namespace {

bool parsePort(const std::string& text, uint16_t& port) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

std::string lineError(size_t lineNo, const std::string& message) {
    return "line " + std::to_string(lineNo) + ": " + message;
}

}  // namespace

Result<std::vector<CredentialSet>> StaticCredentialProvider::parse(const std::string& text) {
    std::vector<CredentialSet> sets;
    auto lines = utils::split_lines(text);

    for (size_t i = 0; i < lines.size(); ++i) {
        size_t lineNo = i + 1;
        std::string line = utils::trim(lines[i]);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto tokens = utils::split_whitespace(line);
        if (tokens.size() < 3) {
            return Result<std::vector<CredentialSet>>::failure(
                lineError(lineNo, "expected '<set-id> <protocol> <fields...>'"));
        }

        const std::string& setId = tokens[0];
        std::string protocol = utils::to_lower(tokens[1]);

        auto it = std::find_if(sets.begin(), sets.end(),
                               [&](const CredentialSet& s) { return s.id == setId; });
        if (it == sets.end()) {
            CredentialSet fresh;
            fresh.id = setId;
            sets.push_back(fresh);
            it = sets.end() - 1;
        }

        if (protocol == "snmp") {
            if (tokens.size() > 5) {
                return Result<std::vector<CredentialSet>>::failure(
                    lineError(lineNo, "snmp takes <community> [v1|v2c] [port]"));
            }
            SnmpCredential cred;
            cred.setId = setId;
            cred.community = tokens[2];
            if (tokens.size() > 3) {
                std::string version = utils::to_lower(tokens[3]);
                if (version == "v1" || version == "1") {
                    cred.version = SnmpVersion::V1;
                } else if (version == "v2c" || version == "2c" || version == "2") {
                    cred.version = SnmpVersion::V2C;
                } else {
                    return Result<std::vector<CredentialSet>>::failure(
                        lineError(lineNo, "unsupported snmp version '" + tokens[3] + "'"));
                }
            }
            if (tokens.size() > 4 && !parsePort(tokens[4], cred.port)) {
                return Result<std::vector<CredentialSet>>::failure(
                    lineError(lineNo, "invalid port '" + tokens[4] + "'"));
            }
            if (it->snmp) {
                return Result<std::vector<CredentialSet>>::failure(
                    lineError(lineNo, "duplicate snmp credential for set '" + setId + "'"));
            }
            it->snmp = cred;
        } else if (protocol == "ssh" || protocol == "telnet") {
            if (tokens.size() < 4 || tokens.size() > 5) {
                return Result<std::vector<CredentialSet>>::failure(
                    lineError(lineNo, protocol + " takes <username> <password> [port]"));
            }
            LoginCredential cred;
            cred.setId = setId;
            cred.username = tokens[2];
            cred.password = tokens[3];
            if (tokens.size() > 4 && !parsePort(tokens[4], cred.port)) {
                return Result<std::vector<CredentialSet>>::failure(
                    lineError(lineNo, "invalid port '" + tokens[4] + "'"));
            }
            auto& slot = protocol == "ssh" ? it->ssh : it->telnet;
            if (slot) {
                return Result<std::vector<CredentialSet>>::failure(
                    lineError(lineNo, "duplicate " + protocol + " credential for set '" +
                                      setId + "'"));
            }
            slot = cred;
        } else {
            return Result<std::vector<CredentialSet>>::failure(
                lineError(lineNo, "unknown protocol '" + tokens[1] + "'"));
        }
    }

    return Result<std::vector<CredentialSet>>::success(std::move(sets));
}

Result<std::vector<CredentialSet>> StaticCredentialProvider::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<CredentialSet>>::failure("cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse(buffer.str());
    if (!parsed) {
        return Result<std::vector<CredentialSet>>::failure(path + ": " + parsed.error());
    }
    LOG_INFO("Credentials", "Loaded {} credential set(s) from {}", parsed->size(), path);
    return parsed;
}

void StaticCredentialProvider::addSet(const CredentialSet& set) {
    if (sets_.find(set.id) == sets_.end()) {
        order_.push_back(set.id);
    }
    sets_[set.id] = set;
}

DiscoveryCredentials StaticCredentialProvider::getCredentialsForDiscovery(
    const std::vector<std::string>& credentialSetIds) const {

    const auto& ids = credentialSetIds.empty() ? order_ : credentialSetIds;
    DiscoveryCredentials out;

    for (const auto& id : ids) {
        auto it = sets_.find(id);
        if (it == sets_.end()) {
            LOG_WARN("Credentials", "Unknown credential set '{}'", id);
            continue;
        }
        const auto& set = it->second;
        if (set.snmp) out.snmp.push_back(*set.snmp);
        if (set.ssh) out.ssh.push_back(*set.ssh);
        if (set.telnet) out.telnet.push_back(*set.telnet);
    }

    LOG_DEBUG("Credentials", "Resolved {} snmp, {} ssh, {} telnet credential(s)",
              out.snmp.size(), out.ssh.size(), out.telnet.size());
    return out;
}

}  // namespace core
}  // namespace netmap
