/**
 * @file discovery_orchestrator.hpp
 * @brief Drives one discovery run: seed probing, bounded neighbor crawl,
 *        MAC analysis and topology assembly.
 *
 * The orchestrator thread is the only writer of run state. Worker threads
 * probe devices and hand back ProbeReports; the orchestrator folds them into
 * the device set, the neighbor map and the progress record. Batches are
 * joined before the next expansion round starts, so iteration n only sees
 * the complete results of iteration n-1.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/credentials.hpp"
#include "netmap/core/device.hpp"
#include "netmap/core/device_inventory.hpp"
#include "netmap/core/device_prober.hpp"
#include "netmap/core/mac_table_analyzer.hpp"
#include "netmap/core/neighbor_extractor.hpp"
#include "netmap/core/protocol_probe.hpp"
#include "netmap/core/topology_builder.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace netmap {
namespace core {

/**
 * @enum DiscoveryPhase
 * @brief Run phases, entered in declaration order and never revisited.
 *
 * CANCELLED replaces COMPLETED when the run was stopped early. ERROR can be
 * entered from any phase.
 */
enum class DiscoveryPhase {
    IDLE,
    INITIALIZING,
    DISCOVERING_DEVICES,
    DISCOVERING_NEIGHBORS,
    ANALYZING_MAC_TABLES,
    MAPPING_CONNECTIONS,
    FINALIZING,
    COMPLETED,
    CANCELLED,
    ERROR
};

NETMAP_CORE_API const char* toString(DiscoveryPhase phase);

struct NETMAP_CORE_API DeviceProgressEntry {
    std::string ip;
    std::string hostname;
    std::string vendor;
    DiscoveryMethod method = DiscoveryMethod::UNKNOWN;
    DeviceStatus status = DeviceStatus::UNKNOWN;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct DiscoveryProgress
 * @brief Snapshot of a run; counters only grow within one run.
 */
struct NETMAP_CORE_API DiscoveryProgress {
    DiscoveryPhase phase = DiscoveryPhase::IDLE;
    size_t total = 0;
    size_t completed = 0;
    std::string currentDevice;
    int iteration = 0;
    bool iterationCapReached = false;
    std::vector<DeviceProgressEntry> devices;
    std::vector<std::string> errors;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point updatedAt;
};

using ProgressCallback = std::function<void(const DiscoveryProgress&)>;

struct NETMAP_CORE_API DiscoveryOptions {
    std::vector<std::string> credentialSetIds;   ///< empty = every known set
    size_t concurrency = 10;
    int maxIterations = 5;
    ProbeOptions probe;
    std::chrono::milliseconds neighborTimeout{10000};
    std::chrono::milliseconds runTimeout{0};     ///< 0 = unbounded
    MacAnalysisOptions mac;
};

/**
 * @class CancellationToken
 * @brief Cooperative stop signal checked between probes.
 *
 * A token is cancelled explicitly with cancel() or implicitly once its
 * deadline passes.
 */
class NETMAP_CORE_API CancellationToken {
public:
    CancellationToken() = default;

    void cancel() { cancelled_.store(true); }

    bool isCancelled() const;

    /**
     * @brief Cancel automatically once timeout has elapsed from now.
     */
    void expireAfter(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> deadlineNs_{0};   ///< steady_clock epoch ns, 0 = none
};

/**
 * @struct DiscoveryResult
 * @brief Terminal output of a run.
 */
struct NETMAP_CORE_API DiscoveryResult {
    std::vector<Device> devices;
    std::map<std::string, std::vector<NeighborEdge>> neighborRelationships;
    std::map<std::string, std::vector<MacLocation>> macAddressMappings;
    std::vector<InferredLink> inferredLinks;
    std::map<std::string, Link> interfaceConnections;
    Topology topology;
    DiscoveryProgress progress;
};

/**
 * @class DiscoveryError
 * @brief Orchestration fault that aborts a run.
 */
class NETMAP_CORE_API DiscoveryError : public std::runtime_error {
public:
    explicit DiscoveryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class DiscoveryOrchestrator
 * @brief Runs one discovery at a time and exposes its progress.
 *
 * Usage:
 * @code
 * auto probe = std::make_shared<probe::NetworkProtocolProbe>();
 * auto creds = std::make_shared<StaticCredentialProvider>();
 * DiscoveryOrchestrator orchestrator(probe, creds);
 *
 * DiscoveryOptions options;
 * options.maxIterations = 3;
 * auto result = orchestrator.startGradualDiscovery({"10.0.0.1"}, options,
 *     [](const DiscoveryProgress& p) { ... });
 * @endcode
 */
class NETMAP_CORE_API DiscoveryOrchestrator {
public:
    /**
     * @param probe Network access for probing and neighbor queries.
     * @param credentials Credential lookup; may be null for ping-only runs.
     * @param inventory Optional run-spanning store updated when a run finishes.
     */
    DiscoveryOrchestrator(std::shared_ptr<ProtocolProbe> probe,
                          std::shared_ptr<CredentialProvider> credentials,
                          std::shared_ptr<DeviceInventory> inventory = nullptr);

    ~DiscoveryOrchestrator() = default;

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    /**
     * @brief Run a complete discovery from the given seeds.
     *
     * Blocks until the run completes, is cancelled or fails. Progress is
     * reset at the start of every call.
     *
     * @throws DiscoveryError on malformed input, when another run is active,
     *         or on any fault outside the per-device boundaries. The progress
     *         phase is ERROR afterwards.
     */
    DiscoveryResult startGradualDiscovery(const std::vector<std::string>& seeds,
                                          const DiscoveryOptions& options,
                                          ProgressCallback callback = nullptr,
                                          std::shared_ptr<CancellationToken> token = nullptr);

    /**
     * @brief Thread-safe snapshot of the current or last run.
     */
    DiscoveryProgress getProgress() const;

    bool isRunning() const { return running_.load(); }

private:
    struct RunState;

    std::shared_ptr<ProtocolProbe> probe_;
    std::shared_ptr<CredentialProvider> credentials_;
    std::shared_ptr<DeviceInventory> inventory_;
    DeviceProber prober_;

    std::atomic<bool> running_{false};
    mutable std::mutex progressMutex_;
    DiscoveryProgress progress_;

    DiscoveryResult run(RunState& state, const std::vector<std::string>& seeds);

    void probeBatch(RunState& state, const std::vector<std::string>& ips);
    void foldReport(RunState& state, ProbeReport report);

    template<typename Fn>
    void updateProgress(RunState& state, Fn&& mutate);

    void setPhase(RunState& state, DiscoveryPhase phase);
};

}  // namespace core
}  // namespace netmap
