/**
 * @file config.hpp
 * @brief netmapd configuration and CLI parsing
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/discovery_orchestrator.hpp"
#include "netmap/probe/network_protocol_probe.hpp"
#include "netmap/utils/string_utils.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <iostream>
#include <cstring>
#include <stdexcept>

namespace netmap {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // Server mode
    std::string bind_addr = "0.0.0.0";
    uint16_t port = 50061;
    std::string log_level = "INFO";
    bool help = false;
    bool invalid = false;                       ///< Parsing failed; exit non-zero

    // One-shot mode
    bool once = false;                          ///< Run one discovery, print JSON, exit
    std::string output_path;                    ///< Empty = stdout
    std::vector<std::string> seeds;

    // Credentials
    std::string credentials_file;
    std::vector<std::string> credential_sets;   ///< Empty = every set in the file

    // Discovery
    size_t concurrency = 10;
    int max_iterations = 5;
    bool include_unreachable = false;
    int64_t ping_timeout_ms = 2000;
    int64_t probe_timeout_ms = 10000;
    int64_t neighbor_timeout_ms = 10000;
    int64_t run_timeout_ms = 0;                 ///< 0 = unbounded

    // MAC analysis
    size_t trunk_threshold = 10;                ///< Learned MACs that mark a port as trunk
    size_t min_primary_fanout = 1;

    // SNMP transport
    int64_t snmp_timeout_ms = 2000;
    int32_t max_repetitions = 25;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "netmapd - Network Discovery and Topology Daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Server Options:\n"
              << "  --bind <addr>                gRPC bind address (default: 0.0.0.0)\n"
              << "  --port <port>                gRPC port (default: 50061)\n"
              << "  --log-level <level>          TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\nOne-shot Options:\n"
              << "  --once                       Run a single discovery, print JSON and exit\n"
              << "  --seed <ip>                  Seed address, may be repeated\n"
              << "  --seeds <ip,ip,...>          Comma-separated seed addresses\n"
              << "  --output <file>              Write the JSON result to a file (default: stdout)\n"
              << "\nCredential Options:\n"
              << "  --credentials <file>         Credential sets file\n"
              << "  --credential-sets <id,...>   Sets to use, in priority order (default: all)\n"
              << "\nDiscovery Options:\n"
              << "  --concurrency <n>            Parallel device probes (default: 10)\n"
              << "  --max-iterations <n>         Neighbor expansion rounds (default: 5)\n"
              << "  --include-unreachable        Probe devices that do not answer ping\n"
              << "  --ping-timeout <ms>          Reachability timeout (default: 2000)\n"
              << "  --probe-timeout <ms>         Per-protocol probe timeout (default: 10000)\n"
              << "  --neighbor-timeout <ms>      Neighbor query timeout (default: 10000)\n"
              << "  --run-timeout <ms>           Overall run deadline, 0=none (default: 0)\n"
              << "\nMAC Analysis Options:\n"
              << "  --trunk-threshold <n>        Learned MACs marking a trunk port (default: 10)\n"
              << "  --min-primary-fanout <n>     Minimum learned MACs on the primary port (default: 1)\n"
              << "\nSNMP Options:\n"
              << "  --snmp-timeout <ms>          Per-request timeout (default: 2000)\n"
              << "  --max-repetitions <n>        GETBULK max-repetitions (default: 25)\n"
              << "\n  --help                       Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --credentials creds.txt --port 50061\n"
              << "  " << program_name << " --once --seeds 10.0.0.1,10.0.0.2 --credentials creds.txt\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set when usage should be shown
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto invalid = [&config](const std::string& message) {
        std::cerr << "Error: " << message << "\n";
        config.help = true;
        config.invalid = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags
        if (std::strcmp(arg, "--once") == 0) {
            config.once = true;
            continue;
        }
        if (std::strcmp(arg, "--include-unreachable") == 0) {
            config.include_unreachable = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return invalid(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--port") == 0) {
                config.port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--seed") == 0) {
                config.seeds.push_back(utils::trim(value));
            } else if (std::strcmp(arg, "--seeds") == 0) {
                for (const auto& seed : utils::split(value, ',')) {
                    std::string trimmed = utils::trim(seed);
                    if (!trimmed.empty()) {
                        config.seeds.push_back(trimmed);
                    }
                }
            } else if (std::strcmp(arg, "--output") == 0) {
                config.output_path = value;
            } else if (std::strcmp(arg, "--credentials") == 0) {
                config.credentials_file = value;
            } else if (std::strcmp(arg, "--credential-sets") == 0) {
                for (const auto& id : utils::split(value, ',')) {
                    std::string trimmed = utils::trim(id);
                    if (!trimmed.empty()) {
                        config.credential_sets.push_back(trimmed);
                    }
                }
            } else if (std::strcmp(arg, "--concurrency") == 0) {
                config.concurrency = std::stoul(value);
            } else if (std::strcmp(arg, "--max-iterations") == 0) {
                config.max_iterations = std::stoi(value);
            } else if (std::strcmp(arg, "--ping-timeout") == 0) {
                config.ping_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--probe-timeout") == 0) {
                config.probe_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--neighbor-timeout") == 0) {
                config.neighbor_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--run-timeout") == 0) {
                config.run_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--trunk-threshold") == 0) {
                config.trunk_threshold = std::stoul(value);
            } else if (std::strcmp(arg, "--min-primary-fanout") == 0) {
                config.min_primary_fanout = std::stoul(value);
            } else if (std::strcmp(arg, "--snmp-timeout") == 0) {
                config.snmp_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--max-repetitions") == 0) {
                config.max_repetitions = std::stoi(value);
            } else {
                return invalid(std::string("Unknown option ") + arg);
            }
        } catch (const std::exception&) {
            return invalid(std::string("Invalid value '") + value + "' for " + arg);
        }
    }

    if (config.max_iterations < 0) {
        return invalid("--max-iterations must not be negative");
    }
    if (config.concurrency == 0) {
        return invalid("--concurrency must be at least 1");
    }
    if (config.once && config.seeds.empty()) {
        return invalid("--once requires at least one --seed or --seeds");
    }

    return config;
}

/**
 * @brief Discovery options described by a configuration.
 */
inline core::DiscoveryOptions toDiscoveryOptions(const Config& config) {
    core::DiscoveryOptions options;
    options.credentialSetIds = config.credential_sets;
    options.concurrency = config.concurrency;
    options.maxIterations = config.max_iterations;
    options.probe.includeUnreachable = config.include_unreachable;
    options.probe.pingTimeout = std::chrono::milliseconds(config.ping_timeout_ms);
    options.probe.probeTimeout = std::chrono::milliseconds(config.probe_timeout_ms);
    options.neighborTimeout = std::chrono::milliseconds(config.neighbor_timeout_ms);
    options.runTimeout = std::chrono::milliseconds(config.run_timeout_ms);
    options.mac.trunkFanoutThreshold = config.trunk_threshold;
    options.mac.minPrimaryFanout = config.min_primary_fanout;
    return options;
}

/**
 * @brief SNMP transport options described by a configuration.
 */
inline probe::NetworkProbeOptions toProbeOptions(const Config& config) {
    probe::NetworkProbeOptions options;
    options.snmpRequestTimeout = std::chrono::milliseconds(config.snmp_timeout_ms);
    options.maxRepetitions = config.max_repetitions;
    return options;
}

} // namespace daemon
} // namespace netmap
