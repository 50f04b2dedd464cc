/**
 * @file discovery_orchestrator.cpp
 * @brief DiscoveryOrchestrator implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/discovery_orchestrator.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <set>
#include <thread>

namespace netmap {
namespace core {

const char* toString(DiscoveryPhase phase) {
    switch (phase) {
        case DiscoveryPhase::IDLE: return "idle";
        case DiscoveryPhase::INITIALIZING: return "initializing";
        case DiscoveryPhase::DISCOVERING_DEVICES: return "discovering_devices";
        case DiscoveryPhase::DISCOVERING_NEIGHBORS: return "discovering_neighbors";
        case DiscoveryPhase::ANALYZING_MAC_TABLES: return "analyzing_mac_tables";
        case DiscoveryPhase::MAPPING_CONNECTIONS: return "mapping_connections";
        case DiscoveryPhase::FINALIZING: return "finalizing";
        case DiscoveryPhase::COMPLETED: return "completed";
        case DiscoveryPhase::CANCELLED: return "cancelled";
        case DiscoveryPhase::ERROR: return "error";
        default: return "unknown";
    }
}

// =============================================================================
// CancellationToken
// =============================================================================

namespace {

int64_t steadyNowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

}  // namespace

bool CancellationToken::isCancelled() const {
    if (cancelled_.load()) {
        return true;
    }
    int64_t deadline = deadlineNs_.load();
    return deadline != 0 && steadyNowNs() >= deadline;
}

void CancellationToken::expireAfter(std::chrono::milliseconds timeout) {
    deadlineNs_.store(steadyNowNs() +
                      std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count());
}

// =============================================================================
// Run state
// =============================================================================

struct DiscoveryOrchestrator::RunState {
    DiscoveryOptions options;
    DiscoveryCredentials credentials;
    ProgressCallback callback;
    std::shared_ptr<CancellationToken> token;

    std::map<std::string, Device> devices;
    std::set<std::string> discovered;
    std::set<std::string> expanded;
    std::map<std::string, std::optional<SnmpCredential>> snmpCredentials;
    std::map<std::string, std::vector<NeighborEdge>> neighbors;
    bool cancelled = false;

    bool checkCancelled() {
        if (!cancelled && token->isCancelled()) {
            cancelled = true;
            LOG_WARN("Orchestrator", "Discovery cancelled");
        }
        return cancelled;
    }
};

// =============================================================================
// DiscoveryOrchestrator
// =============================================================================

DiscoveryOrchestrator::DiscoveryOrchestrator(std::shared_ptr<ProtocolProbe> probe,
                                             std::shared_ptr<CredentialProvider> credentials,
                                             std::shared_ptr<DeviceInventory> inventory)
    : probe_(probe)
    , credentials_(std::move(credentials))
    , inventory_(std::move(inventory))
    , prober_(std::move(probe))
{
}

DiscoveryProgress DiscoveryOrchestrator::getProgress() const {
    std::lock_guard<std::mutex> lock(progressMutex_);
    return progress_;
}

template<typename Fn>
void DiscoveryOrchestrator::updateProgress(RunState& state, Fn&& mutate) {
    DiscoveryProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        mutate(progress_);
        progress_.updatedAt = std::chrono::system_clock::now();
        if (state.callback) {
            snapshot = progress_;
        }
    }
    if (state.callback) {
        state.callback(snapshot);
    }
}

void DiscoveryOrchestrator::setPhase(RunState& state, DiscoveryPhase phase) {
    LOG_INFO("Orchestrator", "Phase: {}", toString(phase));
    updateProgress(state, [phase](DiscoveryProgress& p) { p.phase = phase; });
}

DiscoveryResult DiscoveryOrchestrator::startGradualDiscovery(
    const std::vector<std::string>& seeds,
    const DiscoveryOptions& options,
    ProgressCallback callback,
    std::shared_ptr<CancellationToken> token) {

    if (running_.exchange(true)) {
        throw DiscoveryError("a discovery run is already in progress");
    }
    struct RunningGuard {
        std::atomic<bool>& flag;
        ~RunningGuard() { flag.store(false); }
    } guard{running_};

    RunState state;
    state.options = options;
    state.callback = std::move(callback);
    state.token = token ? std::move(token) : std::make_shared<CancellationToken>();

    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        progress_ = DiscoveryProgress();
        progress_.startedAt = std::chrono::system_clock::now();
        progress_.updatedAt = progress_.startedAt;
    }

    if (options.runTimeout.count() > 0) {
        state.token->expireAfter(options.runTimeout);
    }

    auto fail = [&](const std::string& message) {
        LOG_ERROR("Orchestrator", "Discovery failed: {}", message);
        DiscoveryProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(progressMutex_);
            progress_.phase = DiscoveryPhase::ERROR;
            progress_.errors.push_back(message);
            progress_.updatedAt = std::chrono::system_clock::now();
            snapshot = progress_;
        }
        if (state.callback) {
            try {
                state.callback(snapshot);
            } catch (const std::exception& e) {
                LOG_ERROR("Orchestrator", "Progress callback failed after error: {}", e.what());
            }
        }
    };

    try {
        setPhase(state, DiscoveryPhase::INITIALIZING);

        std::vector<std::string> unique;
        for (const auto& raw : seeds) {
            std::string ip = utils::trim(raw);
            if (!utils::is_ipv4(ip)) {
                throw DiscoveryError("invalid seed address '" + raw + "'");
            }
            if (state.discovered.insert(ip).second) {
                unique.push_back(ip);
            }
        }
        if (options.maxIterations < 0) {
            throw DiscoveryError("maxIterations must not be negative");
        }

        if (credentials_) {
            state.credentials = credentials_->getCredentialsForDiscovery(options.credentialSetIds);
        }
        LOG_INFO("Orchestrator", "Starting discovery: {} seed(s), {} snmp / {} ssh / {} telnet credential(s)",
                 unique.size(), state.credentials.snmp.size(), state.credentials.ssh.size(),
                 state.credentials.telnet.size());

        return run(state, unique);
    } catch (const DiscoveryError& e) {
        fail(e.what());
        throw;
    } catch (const std::exception& e) {
        fail(e.what());
        throw DiscoveryError(e.what());
    }
}

DiscoveryResult DiscoveryOrchestrator::run(RunState& state, const std::vector<std::string>& seeds) {
    const auto& options = state.options;

    // Seed probing
    setPhase(state, DiscoveryPhase::DISCOVERING_DEVICES);
    updateProgress(state, [&](DiscoveryProgress& p) { p.total = seeds.size(); });
    probeBatch(state, seeds);

    std::vector<std::string> frontier;
    for (const auto& ip : seeds) {
        if (state.devices.count(ip)) {
            frontier.push_back(ip);
        }
    }

    // Breadth-first neighbor expansion
    setPhase(state, DiscoveryPhase::DISCOVERING_NEIGHBORS);
    NeighborExtractor extractor(probe_, options.neighborTimeout);
    int iteration = 0;

    while (!frontier.empty() && !state.checkCancelled()) {
        if (iteration >= options.maxIterations) {
            LOG_INFO("Orchestrator", "Iteration cap {} reached with {} device(s) unexpanded",
                     options.maxIterations, frontier.size());
            updateProgress(state, [](DiscoveryProgress& p) { p.iterationCapReached = true; });
            break;
        }

        ++iteration;
        updateProgress(state, [iteration](DiscoveryProgress& p) { p.iteration = iteration; });

        std::vector<std::string> current;
        current.swap(frontier);
        std::vector<std::string> next;

        for (const auto& ip : current) {
            if (state.checkCancelled()) {
                break;
            }
            auto it = state.devices.find(ip);
            if (it == state.devices.end()) {
                continue;
            }

            std::vector<std::string> errors;
            auto edges = extractor.extractNeighbors(it->second, state.snmpCredentials[ip], errors);
            state.expanded.insert(ip);

            for (const auto& edge : edges) {
                if (!edge.toIp.empty() && utils::is_ipv4(edge.toIp) &&
                    state.discovered.insert(edge.toIp).second) {
                    next.push_back(edge.toIp);
                }
            }
            auto& bucket = state.neighbors[ip];
            bucket.insert(bucket.end(), edges.begin(), edges.end());

            if (!errors.empty()) {
                updateProgress(state, [&](DiscoveryProgress& p) {
                    p.errors.insert(p.errors.end(), errors.begin(), errors.end());
                });
            }
        }

        LOG_INFO("Orchestrator", "Iteration {}: expanded {} device(s), {} new neighbor(s)",
                 iteration, current.size(), next.size());

        if (!next.empty()) {
            updateProgress(state, [&](DiscoveryProgress& p) { p.total += next.size(); });
            probeBatch(state, next);
        }
        for (const auto& ip : next) {
            if (state.devices.count(ip)) {
                frontier.push_back(ip);
            }
        }
    }

    // Devices left unexpanded still contribute the edges they reported while probing
    for (const auto& [ip, device] : state.devices) {
        if (state.expanded.count(ip)) {
            continue;
        }
        std::vector<NeighborEdge> edges(device.neighbors.begin(), device.neighbors.end());
        auto arp = NeighborExtractor::arpEdges(device);
        edges.insert(edges.end(), arp.begin(), arp.end());
        if (!edges.empty()) {
            state.neighbors[ip] = std::move(edges);
        }
    }

    std::vector<Device> devices;
    devices.reserve(state.devices.size());
    for (const auto& [ip, device] : state.devices) {
        devices.push_back(device);
    }

    DiscoveryResult result;

    setPhase(state, DiscoveryPhase::ANALYZING_MAC_TABLES);
    MacTableAnalyzer analyzer(options.mac);
    MacAnalysis analysis = analyzer.analyze(devices);

    setPhase(state, DiscoveryPhase::MAPPING_CONNECTIONS);
    TopologyBuilder builder;
    result.interfaceConnections = builder.mapConnections(devices, state.neighbors, analysis.links);

    setPhase(state, DiscoveryPhase::FINALIZING);
    result.topology = builder.build(devices, result.interfaceConnections);
    if (inventory_) {
        for (const auto& device : devices) {
            inventory_->upsertDevice(device);
        }
    }

    result.devices = std::move(devices);
    result.neighborRelationships = std::move(state.neighbors);
    result.macAddressMappings = std::move(analysis.mappings);
    result.inferredLinks = std::move(analysis.links);

    setPhase(state, state.cancelled ? DiscoveryPhase::CANCELLED : DiscoveryPhase::COMPLETED);
    result.progress = getProgress();

    LOG_INFO("Orchestrator", "Discovery {}: {} device(s), {} link(s), {} error(s)",
             toString(result.progress.phase), result.topology.summary.totalDevices,
             result.topology.summary.totalConnections, result.progress.errors.size());
    return result;
}

void DiscoveryOrchestrator::probeBatch(RunState& state, const std::vector<std::string>& ips) {
    if (ips.empty() || state.checkCancelled()) {
        return;
    }

    size_t workers = std::min(std::max<size_t>(state.options.concurrency, 1), ips.size());

    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::deque<ProbeReport> ready;
    std::atomic<size_t> nextIndex{0};
    std::atomic<bool> abort{false};
    size_t active = workers;

    auto worker = [&]() {
        while (!abort.load() && !state.token->isCancelled()) {
            size_t i = nextIndex.fetch_add(1);
            if (i >= ips.size()) {
                break;
            }

            ProbeReport report;
            try {
                report = prober_.discoverDevice(ips[i], state.credentials, state.options.probe);
            } catch (const std::exception& e) {
                report.device = Device(ips[i]);
                report.device.status = DeviceStatus::ERROR;
                report.device.error = e.what();
                report.device.lastDiscovered = std::chrono::system_clock::now();
                report.errors.push_back(ips[i] + ": probe raised: " + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex);
                ready.push_back(std::move(report));
            }
            queueCv.notify_one();
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex);
            --active;
        }
        queueCv.notify_one();
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }

    // Fold reports on this thread as they arrive; the batch ends when every worker exited
    std::exception_ptr failure;
    try {
        while (true) {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueCv.wait(lock, [&] { return !ready.empty() || active == 0; });
            if (ready.empty()) {
                break;
            }
            ProbeReport report = std::move(ready.front());
            ready.pop_front();
            lock.unlock();

            foldReport(state, std::move(report));
        }
    } catch (const std::exception&) {
        failure = std::current_exception();
        abort.store(true);
    }

    for (auto& t : threads) {
        t.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    state.checkCancelled();
}

void DiscoveryOrchestrator::foldReport(RunState& state, ProbeReport report) {
    const std::string ip = report.device.ip;

    state.snmpCredentials[ip] = report.snmpCredential;

    auto it = state.devices.find(ip);
    if (it == state.devices.end()) {
        it = state.devices.emplace(ip, std::move(report.device)).first;
    } else {
        mergeDevice(it->second, report.device);
    }
    const Device& device = it->second;

    DeviceProgressEntry entry;
    entry.ip = ip;
    entry.hostname = device.hostname;
    entry.vendor = device.vendor;
    entry.method = device.discoveryMethod;
    entry.status = device.status;
    entry.timestamp = device.lastDiscovered;

    updateProgress(state, [&](DiscoveryProgress& p) {
        ++p.completed;
        p.currentDevice = ip;
        p.devices.push_back(entry);
        p.errors.insert(p.errors.end(), report.errors.begin(), report.errors.end());
    });
}

}  // namespace core
}  // namespace netmap
