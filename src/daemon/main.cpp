/**
 * @file main.cpp
 * @brief netmapd entry point
 *
 * This is the thin executable that wires together the library components:
 * - Network protocol probe (ICMP, SNMP, SSH, Telnet)
 * - Credential provider loaded from a credentials file
 * - Discovery service exposed over gRPC, or a single one-shot run
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include <netmap/daemon/config.hpp>
#include <netmap/utils/logger.hpp>
#include <netmap/core/credentials.hpp>
#include <netmap/core/device_inventory.hpp>
#include <netmap/core/discovery_orchestrator.hpp>
#include <netmap/probe/network_protocol_probe.hpp>
#include <netmap/services/discovery_service.hpp>
#include <netmap/services/proto_convert.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <csignal>
#include <atomic>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <thread>
#include <chrono>

using namespace netmap;
using namespace netmap::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int signal) {
    g_shutdown.store(true);
}

namespace {

std::shared_ptr<core::StaticCredentialProvider> loadCredentials(const Config& config) {
    auto provider = std::make_shared<core::StaticCredentialProvider>();
    if (config.credentials_file.empty()) {
        LOG_WARN("Daemon", "No credentials file given; devices will only be pinged");
        return provider;
    }

    auto sets = core::StaticCredentialProvider::loadFile(config.credentials_file);
    if (!sets) {
        throw std::runtime_error("cannot load credentials: " + sets.error());
    }
    for (const auto& set : *sets) {
        provider->addSet(set);
    }
    LOG_INFO("Daemon", "Loaded {} credential set(s) from {}", sets->size(), config.credentials_file);
    return provider;
}

int runOnce(const Config& config,
            std::shared_ptr<core::ProtocolProbe> probe,
            std::shared_ptr<core::CredentialProvider> credentials) {
    core::DiscoveryOrchestrator orchestrator(std::move(probe), std::move(credentials));
    auto token = std::make_shared<core::CancellationToken>();

    // Signals only set a flag; translate it into cancellation here.
    std::atomic<bool> finished{false};
    std::thread watcher([&finished, token] {
        while (!finished.load()) {
            if (g_shutdown.load()) {
                LOG_WARN("Daemon", "Interrupted, cancelling discovery");
                token->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    core::DiscoveryResult result;
    try {
        result = orchestrator.startGradualDiscovery(
            config.seeds, toDiscoveryOptions(config),
            [](const core::DiscoveryProgress& progress) {
                LOG_DEBUG("Daemon", "{}: {}/{} (iteration {})", core::toString(progress.phase),
                          progress.completed, progress.total, progress.iteration);
            },
            token);
    } catch (const core::DiscoveryError& e) {
        finished.store(true);
        watcher.join();
        LOG_ERROR("Daemon", "Discovery failed: {}", e.what());
        return 1;
    }
    finished.store(true);
    watcher.join();

    v1::DiscoveryResult message;
    services::toProto(result, "once", &message);
    std::string json = services::toJson(message);
    if (json.empty()) {
        return 1;
    }

    if (config.output_path.empty()) {
        std::cout << json << std::endl;
    } else {
        std::ofstream out(config.output_path);
        if (!out || !(out << json << "\n")) {
            LOG_ERROR("Daemon", "Cannot write result to {}", config.output_path);
            return 1;
        }
        LOG_INFO("Daemon", "Result written to {}", config.output_path);
    }

    return result.progress.phase == core::DiscoveryPhase::COMPLETED ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.invalid ? 1 : 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    LOG_INFO("Daemon", "netmapd starting...");

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto credentials = loadCredentials(config);
        auto networkProbe = std::make_shared<probe::NetworkProtocolProbe>(toProbeOptions(config));

        if (config.once) {
            return runOnce(config, networkProbe, credentials);
        }

        auto inventory = std::make_shared<core::DeviceInventory>();
        auto discovery_service = std::make_unique<services::DiscoveryServiceImpl>(
            networkProbe, credentials, toDiscoveryOptions(config), inventory);

        // Build and start gRPC server
        std::string addr = config.bind_addr + ":" + std::to_string(config.port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(addr, grpc::InsecureServerCredentials());
        builder.RegisterService(discovery_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_FATAL("Daemon", "Failed to start discovery server on {}", addr);
            return 1;
        }
        LOG_INFO("Daemon", "Discovery server listening on {}", addr);
        LOG_INFO("Daemon", "netmapd is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);
        discovery_service.reset();

        LOG_INFO("Daemon", "netmapd stopped ({} device(s) in inventory)", inventory->size());
        return 0;

    } catch (const std::exception& e) {
        LOG_FATAL("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
