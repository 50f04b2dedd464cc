/**
 * @file credentials.hpp
 * @brief Credential sets and the provider boundary used by discovery.
 *
 * Credentials are resolved once per run from opaque set ids and handed to
 * the probes per attempt. They are never copied onto Device records.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace netmap {
namespace core {

enum class Protocol { SNMP, SSH, TELNET };

NETMAP_CORE_API const char* toString(Protocol protocol);

enum class SnmpVersion { V1, V2C };

NETMAP_CORE_API const char* toString(SnmpVersion version);

struct NETMAP_CORE_API SnmpCredential {
    std::string setId;
    std::string community;
    SnmpVersion version = SnmpVersion::V2C;
    uint16_t port = 161;
    int retries = 1;
};

/// SSH or Telnet login. port 0 selects the protocol default (22 or 23).
struct NETMAP_CORE_API LoginCredential {
    std::string setId;
    std::string username;
    std::string password;
    uint16_t port = 0;
};

using Credential = std::variant<SnmpCredential, LoginCredential>;

/**
 * @struct CredentialSet
 * @brief Named bundle with at most one credential per protocol.
 */
struct NETMAP_CORE_API CredentialSet {
    std::string id;
    std::optional<SnmpCredential> snmp;
    std::optional<LoginCredential> ssh;
    std::optional<LoginCredential> telnet;
};

/**
 * @struct DiscoveryCredentials
 * @brief Per-protocol credential lists in caller priority order.
 */
struct NETMAP_CORE_API DiscoveryCredentials {
    std::vector<SnmpCredential> snmp;
    std::vector<LoginCredential> ssh;
    std::vector<LoginCredential> telnet;

    bool empty() const { return snmp.empty() && ssh.empty() && telnet.empty(); }
};

/**
 * @class CredentialProvider
 * @brief Keyed lookup of decrypted credentials.
 */
class NETMAP_CORE_API CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    /**
     * @brief Resolve credential set ids into ordered per-protocol lists.
     * @param credentialSetIds Set ids in priority order; empty selects every set.
     */
    virtual DiscoveryCredentials getCredentialsForDiscovery(
        const std::vector<std::string>& credentialSetIds) const = 0;
};

/**
 * @class StaticCredentialProvider
 * @brief In-memory provider, optionally loaded from a credentials file.
 *
 * File format, one credential per line:
 * @code
 * # set-id  protocol  fields...
 * core      snmp      public v2c 161
 * core      ssh       admin s3cret
 * legacy    telnet    admin s3cret 2323
 * @endcode
 * SNMP takes community, optional version (v1|v2c, default v2c) and port.
 * SSH and Telnet take username, password and an optional port.
 */
class NETMAP_CORE_API StaticCredentialProvider : public CredentialProvider {
public:
    StaticCredentialProvider() = default;

    /**
     * @brief Parse credential sets from file text.
     * @return Sets in first-seen order, or an error naming the offending line.
     */
    static Result<std::vector<CredentialSet>> parse(const std::string& text);

    /**
     * @brief Read and parse a credentials file.
     */
    static Result<std::vector<CredentialSet>> loadFile(const std::string& path);

    /**
     * @brief Add or replace a credential set.
     */
    void addSet(const CredentialSet& set);

    std::vector<std::string> setIds() const { return order_; }

    DiscoveryCredentials getCredentialsForDiscovery(
        const std::vector<std::string>& credentialSetIds) const override;

private:
    std::map<std::string, CredentialSet> sets_;
    std::vector<std::string> order_;
};

}  // namespace core
}  // namespace netmap
