/**
 * @file discovery_service.cpp
 * @brief DiscoveryServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/services/discovery_service.hpp"
#include "netmap/services/proto_convert.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <optional>

namespace netmap {
namespace services {

// =============================================================================
// Run - state of one background discovery
// =============================================================================

struct DiscoveryServiceImpl::Run {
    std::string id;
    std::shared_ptr<core::CancellationToken> token = std::make_shared<core::CancellationToken>();

    mutable std::mutex mutex;
    std::condition_variable finishedCv;
    v1::DiscoveryProgress progress;
    std::unique_ptr<v1::DiscoveryResult> result;
    std::string error;
    bool finished = false;
    std::vector<ProgressWatcher*> watchers;

    bool isFinished() const {
        std::lock_guard<std::mutex> lock(mutex);
        return finished;
    }

    void update(const core::DiscoveryProgress& snapshot);

    void complete(const core::DiscoveryProgress& snapshot,
                  std::unique_ptr<v1::DiscoveryResult> message,
                  std::string failure);

    /// Registers the watcher and hands it the current snapshot.
    void addWatcher(ProgressWatcher* watcher);

    void removeWatcher(ProgressWatcher* watcher) {
        std::lock_guard<std::mutex> lock(mutex);
        watchers.erase(std::remove(watchers.begin(), watchers.end(), watcher), watchers.end());
    }
};

// =============================================================================
// ProgressWatcher - WatchProgress stream
// =============================================================================

class DiscoveryServiceImpl::ProgressWatcher
    : public grpc::ServerWriteReactor<v1::DiscoveryProgress> {
public:
    explicit ProgressWatcher(std::shared_ptr<Run> run)
        : run_(std::move(run))
    {
        LOG_DEBUG("DiscoveryService", "WatchProgress: run={}", run_->id);
        run_->addWatcher(this);
    }

    /**
     * @brief Queue a snapshot; replaces one that has not been written yet.
     * @param last The snapshot is terminal and the stream ends after it.
     */
    void publish(const v1::DiscoveryProgress& snapshot, bool last) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        pending_ = snapshot;
        if (last) {
            lastQueued_ = true;
        }
        if (!writing_) {
            writeNextLocked();
        }
    }

    void OnWriteDone(bool ok) override {
        std::lock_guard<std::mutex> lock(mutex_);
        writing_ = false;
        if (!ok || cancelled_) {
            finishLocked(grpc::Status::OK);
            return;
        }
        writeNextLocked();
    }

    void OnCancel() override {
        LOG_DEBUG("DiscoveryService", "WatchProgress cancelled: run={}", run_->id);
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        if (!writing_) {
            finishLocked(grpc::Status::CANCELLED);
        }
    }

    void OnDone() override {
        run_->removeWatcher(this);
        delete this;
    }

private:
    std::shared_ptr<Run> run_;
    std::mutex mutex_;
    std::optional<v1::DiscoveryProgress> pending_;
    v1::DiscoveryProgress current_;
    bool writing_ = false;
    bool lastQueued_ = false;
    bool cancelled_ = false;
    bool finished_ = false;

    void writeNextLocked() {
        if (pending_) {
            current_ = std::move(*pending_);
            pending_.reset();
            writing_ = true;
            StartWrite(&current_);
        } else if (lastQueued_) {
            finishLocked(grpc::Status::OK);
        }
    }

    void finishLocked(grpc::Status status) {
        if (!finished_) {
            finished_ = true;
            Finish(std::move(status));
        }
    }
};

void DiscoveryServiceImpl::Run::update(const core::DiscoveryProgress& snapshot) {
    std::lock_guard<std::mutex> lock(mutex);
    if (finished) {
        return;
    }
    progress.Clear();
    toProto(snapshot, id, &progress);
    for (auto* watcher : watchers) {
        watcher->publish(progress, false);
    }
}

void DiscoveryServiceImpl::Run::complete(const core::DiscoveryProgress& snapshot,
                                         std::unique_ptr<v1::DiscoveryResult> message,
                                         std::string failure) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        progress.Clear();
        toProto(snapshot, id, &progress);
        result = std::move(message);
        error = std::move(failure);
        finished = true;
        for (auto* watcher : watchers) {
            watcher->publish(progress, true);
        }
    }
    finishedCv.notify_all();
}

void DiscoveryServiceImpl::Run::addWatcher(ProgressWatcher* watcher) {
    std::lock_guard<std::mutex> lock(mutex);
    watchers.push_back(watcher);
    watcher->publish(progress, finished);
}

// =============================================================================
// DiscoveryServiceImpl
// =============================================================================

DiscoveryServiceImpl::DiscoveryServiceImpl(
    std::shared_ptr<core::ProtocolProbe> probe,
    std::shared_ptr<core::CredentialProvider> credentials,
    core::DiscoveryOptions defaults,
    std::shared_ptr<core::DeviceInventory> inventory)
    : defaults_(std::move(defaults))
    , orchestrator_(std::make_unique<core::DiscoveryOrchestrator>(
          std::move(probe), std::move(credentials), std::move(inventory)))
{
    LOG_INFO("DiscoveryService", "Created discovery service (concurrency={}, max_iterations={})",
             defaults_.concurrency, defaults_.maxIterations);
}

DiscoveryServiceImpl::~DiscoveryServiceImpl() {
    std::shared_ptr<Run> active;
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        active = activeRun_;
    }
    if (active && !active->isFinished()) {
        LOG_INFO("DiscoveryService", "Cancelling run {} on shutdown", active->id);
        active->token->cancel();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

core::DiscoveryOptions DiscoveryServiceImpl::optionsFor(const v1::StartDiscoveryRequest& request) const {
    core::DiscoveryOptions options = defaults_;

    if (request.credential_set_ids_size() > 0) {
        options.credentialSetIds.assign(request.credential_set_ids().begin(),
                                        request.credential_set_ids().end());
    }
    if (request.concurrency() > 0) {
        options.concurrency = request.concurrency();
    }
    if (request.has_max_iterations()) {
        options.maxIterations = request.max_iterations();
    }
    if (request.include_unreachable()) {
        options.probe.includeUnreachable = true;
    }
    if (request.ping_timeout_ms() > 0) {
        options.probe.pingTimeout = std::chrono::milliseconds(request.ping_timeout_ms());
    }
    if (request.probe_timeout_ms() > 0) {
        options.probe.probeTimeout = std::chrono::milliseconds(request.probe_timeout_ms());
    }
    if (request.run_timeout_ms() > 0) {
        options.runTimeout = std::chrono::milliseconds(request.run_timeout_ms());
    }
    return options;
}

grpc::Status DiscoveryServiceImpl::startRun(const v1::StartDiscoveryRequest& request,
                                            std::string* runId) {
    if (request.seeds_size() == 0) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "at least one seed is required");
    }
    std::vector<std::string> seeds;
    for (const auto& raw : request.seeds()) {
        std::string seed = utils::trim(raw);
        if (!utils::is_ipv4(seed)) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "invalid seed address '" + raw + "'");
        }
        seeds.push_back(seed);
    }
    if (request.has_max_iterations() && request.max_iterations() < 0) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "max_iterations must not be negative");
    }

    std::lock_guard<std::mutex> lock(runsMutex_);
    if (activeRun_ && !activeRun_->isFinished()) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            "run " + activeRun_->id + " is still active");
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    auto run = std::make_shared<Run>();
    run->id = "run-" + std::to_string(runCounter_.fetch_add(1) + 1);
    run->progress.set_run_id(run->id);
    run->progress.set_phase(core::toString(core::DiscoveryPhase::IDLE));

    runs_[run->id] = run;
    latestRunId_ = run->id;
    activeRun_ = run;

    LOG_INFO("DiscoveryService", "StartDiscovery: run={}, seeds={}", run->id, seeds.size());
    worker_ = std::thread(&DiscoveryServiceImpl::execute, this, run, std::move(seeds),
                          optionsFor(request));

    *runId = run->id;
    return grpc::Status::OK;
}

void DiscoveryServiceImpl::execute(std::shared_ptr<Run> run,
                                   std::vector<std::string> seeds,
                                   core::DiscoveryOptions options) {
    try {
        auto result = orchestrator_->startGradualDiscovery(
            seeds, options,
            [run](const core::DiscoveryProgress& progress) { run->update(progress); },
            run->token);

        auto message = std::make_unique<v1::DiscoveryResult>();
        toProto(result, run->id, message.get());
        LOG_INFO("DiscoveryService", "Run {} finished: phase={}, devices={}",
                 run->id, core::toString(result.progress.phase), result.devices.size());
        run->complete(result.progress, std::move(message), "");
    } catch (const std::exception& e) {
        LOG_ERROR("DiscoveryService", "Run {} failed: {}", run->id, e.what());
        run->complete(orchestrator_->getProgress(), nullptr, e.what());
    }
}

bool DiscoveryServiceImpl::waitForRun(const std::string& runId) {
    auto run = findRun(runId);
    if (!run) {
        return false;
    }
    std::unique_lock<std::mutex> lock(run->mutex);
    run->finishedCv.wait(lock, [&run] { return run->finished; });
    return true;
}

std::shared_ptr<DiscoveryServiceImpl::Run> DiscoveryServiceImpl::findRun(const std::string& runId) const {
    std::lock_guard<std::mutex> lock(runsMutex_);
    const std::string& key = runId.empty() ? latestRunId_ : runId;
    auto it = runs_.find(key);
    return it != runs_.end() ? it->second : nullptr;
}

// =============================================================================
// StartDiscovery
// =============================================================================

class StartDiscoveryReactor : public grpc::ServerUnaryReactor {
public:
    StartDiscoveryReactor(DiscoveryServiceImpl* service,
                          const v1::StartDiscoveryRequest* request,
                          v1::StartDiscoveryResponse* response)
    {
        std::string runId;
        grpc::Status status = service->startRun(*request, &runId);
        if (!status.ok()) {
            LOG_WARN("DiscoveryService", "StartDiscovery refused: {}", status.error_message());
            Finish(status);
            return;
        }
        response->set_run_id(runId);
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DiscoveryServiceImpl::StartDiscovery(
    grpc::CallbackServerContext* context,
    const v1::StartDiscoveryRequest* request,
    v1::StartDiscoveryResponse* response) {

    return new StartDiscoveryReactor(this, request, response);
}

// =============================================================================
// CancelDiscovery
// =============================================================================

class CancelDiscoveryReactor : public grpc::ServerUnaryReactor {
public:
    CancelDiscoveryReactor(std::shared_ptr<DiscoveryServiceImpl::Run> run,
                           const v1::CancelDiscoveryRequest* request,
                           v1::CancelDiscoveryResponse* response)
    {
        if (!run) {
            Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "unknown run '" + request->run_id() + "'"));
            return;
        }

        bool cancelled = false;
        if (!run->isFinished()) {
            run->token->cancel();
            cancelled = true;
        }
        LOG_INFO("DiscoveryService", "CancelDiscovery: run={}, cancelled={}", run->id, cancelled);

        response->set_cancelled(cancelled);
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DiscoveryServiceImpl::CancelDiscovery(
    grpc::CallbackServerContext* context,
    const v1::CancelDiscoveryRequest* request,
    v1::CancelDiscoveryResponse* response) {

    return new CancelDiscoveryReactor(findRun(request->run_id()), request, response);
}

// =============================================================================
// GetProgress
// =============================================================================

class GetProgressReactor : public grpc::ServerUnaryReactor {
public:
    GetProgressReactor(std::shared_ptr<DiscoveryServiceImpl::Run> run,
                       const v1::GetProgressRequest* request,
                       v1::DiscoveryProgress* response)
    {
        if (!run) {
            if (request->run_id().empty()) {
                // No run has been started yet.
                response->set_phase(core::toString(core::DiscoveryPhase::IDLE));
                Finish(grpc::Status::OK);
                return;
            }
            Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "unknown run '" + request->run_id() + "'"));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(run->mutex);
            *response = run->progress;
        }
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DiscoveryServiceImpl::GetProgress(
    grpc::CallbackServerContext* context,
    const v1::GetProgressRequest* request,
    v1::DiscoveryProgress* response) {

    return new GetProgressReactor(findRun(request->run_id()), request, response);
}

// =============================================================================
// WatchProgress
// =============================================================================

class UnknownRunReactor : public grpc::ServerWriteReactor<v1::DiscoveryProgress> {
public:
    explicit UnknownRunReactor(const std::string& runId) {
        Finish(grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown run '" + runId + "'"));
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerWriteReactor<v1::DiscoveryProgress>* DiscoveryServiceImpl::WatchProgress(
    grpc::CallbackServerContext* context,
    const v1::WatchProgressRequest* request) {

    auto run = findRun(request->run_id());
    if (!run) {
        return new UnknownRunReactor(request->run_id());
    }
    return new ProgressWatcher(std::move(run));
}

// =============================================================================
// GetResult
// =============================================================================

class GetResultReactor : public grpc::ServerUnaryReactor {
public:
    GetResultReactor(std::shared_ptr<DiscoveryServiceImpl::Run> run,
                     const v1::GetResultRequest* request,
                     v1::DiscoveryResult* response)
    {
        if (!run) {
            Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "unknown run '" + request->run_id() + "'"));
            return;
        }

        grpc::Status status = grpc::Status::OK;
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            if (!run->finished) {
                status = grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                                      "run " + run->id + " is still in progress");
            } else if (!run->result) {
                status = grpc::Status(grpc::StatusCode::ABORTED,
                                      "run " + run->id + " failed: " + run->error);
            } else {
                *response = *run->result;
            }
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DiscoveryServiceImpl::GetResult(
    grpc::CallbackServerContext* context,
    const v1::GetResultRequest* request,
    v1::DiscoveryResult* response) {

    return new GetResultReactor(findRun(request->run_id()), request, response);
}

}  // namespace services
}  // namespace netmap
