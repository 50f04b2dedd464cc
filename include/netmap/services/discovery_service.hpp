/**
 * @file discovery_service.hpp
 * @brief Callback gRPC service that runs discoveries in the background.
 *
 * DiscoveryService is the daemon's remote API:
 * - StartDiscovery: launch a run on a background thread
 * - CancelDiscovery: stop the active run, keeping its partial result
 * - GetProgress / WatchProgress: poll or stream progress snapshots
 * - GetResult: fetch the result of a finished run
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/services/export.hpp"
#include "netmap/core/discovery_orchestrator.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Include generated gRPC service base
#include "netmap/proto/netmap.grpc.pb.h"

namespace netmap {
namespace services {

/**
 * @class DiscoveryServiceImpl
 * @brief Implementation of the netmap.v1.DiscoveryService gRPC service.
 *
 * At most one run is active at a time. Finished runs stay queryable by id
 * for the lifetime of the service; an empty run_id addresses the latest run.
 *
 * Usage:
 * @code
 * auto probe = std::make_shared<probe::NetworkProtocolProbe>();
 * auto creds = std::make_shared<core::StaticCredentialProvider>();
 * DiscoveryServiceImpl service(probe, creds, core::DiscoveryOptions());
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:50061", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class NETMAP_SERVICES_API DiscoveryServiceImpl final : public v1::DiscoveryService::CallbackService {
public:
    /**
     * @param probe Network access shared by every run.
     * @param credentials Credential lookup.
     * @param defaults Options used where a request leaves a field unset.
     * @param inventory Optional store updated after each run.
     */
    DiscoveryServiceImpl(std::shared_ptr<core::ProtocolProbe> probe,
                         std::shared_ptr<core::CredentialProvider> credentials,
                         core::DiscoveryOptions defaults,
                         std::shared_ptr<core::DeviceInventory> inventory = nullptr);

    /// Cancels the active run and waits for its thread.
    ~DiscoveryServiceImpl() override;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* StartDiscovery(
        grpc::CallbackServerContext* context,
        const v1::StartDiscoveryRequest* request,
        v1::StartDiscoveryResponse* response) override;

    grpc::ServerUnaryReactor* CancelDiscovery(
        grpc::CallbackServerContext* context,
        const v1::CancelDiscoveryRequest* request,
        v1::CancelDiscoveryResponse* response) override;

    grpc::ServerUnaryReactor* GetProgress(
        grpc::CallbackServerContext* context,
        const v1::GetProgressRequest* request,
        v1::DiscoveryProgress* response) override;

    /**
     * @brief Server-streaming progress.
     * Sends the current snapshot at once, then every change; the stream
     * ends after the terminal snapshot. Bursts are coalesced to the latest.
     */
    grpc::ServerWriteReactor<v1::DiscoveryProgress>* WatchProgress(
        grpc::CallbackServerContext* context,
        const v1::WatchProgressRequest* request) override;

    grpc::ServerUnaryReactor* GetResult(
        grpc::CallbackServerContext* context,
        const v1::GetResultRequest* request,
        v1::DiscoveryResult* response) override;

    // =========================================================================
    // Internal API
    // =========================================================================

    struct Run;
    class ProgressWatcher;

    /**
     * @brief Start a run without going through gRPC.
     * @return Run id, or the grpc::Status explaining the refusal.
     */
    grpc::Status startRun(const v1::StartDiscoveryRequest& request, std::string* runId);

    /**
     * @brief Block until the run finishes.
     * @return false when the run is unknown.
     */
    bool waitForRun(const std::string& runId);

    /// Look up a run; empty id selects the latest. Null when unknown.
    std::shared_ptr<Run> findRun(const std::string& runId) const;

private:
    core::DiscoveryOptions defaults_;
    std::unique_ptr<core::DiscoveryOrchestrator> orchestrator_;

    mutable std::mutex runsMutex_;
    std::map<std::string, std::shared_ptr<Run>> runs_;
    std::string latestRunId_;
    std::shared_ptr<Run> activeRun_;
    std::thread worker_;
    std::atomic<uint64_t> runCounter_{0};

    core::DiscoveryOptions optionsFor(const v1::StartDiscoveryRequest& request) const;

    void execute(std::shared_ptr<Run> run, std::vector<std::string> seeds,
                 core::DiscoveryOptions options);
};

}  // namespace services
}  // namespace netmap
