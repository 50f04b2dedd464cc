/**
 * @file test_discovery_service.cpp
 * @brief Integration test: discovery runs driven over gRPC against a simulated network
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/utils/logger.hpp>
#include <netmap/core/credentials.hpp>
#include <netmap/core/device_inventory.hpp>
#include <netmap/services/discovery_service.hpp>

#include "common/fake_protocol_probe.hpp"

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace netmap;
using netmap::testing::FakeHost;
using netmap::testing::FakeProtocolProbe;
using netmap::testing::cdpEdge;
using netmap::testing::switchFacts;
using ::testing::HasSubstr;

class DiscoveryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        probe = std::make_shared<FakeProtocolProbe>();
        inventory = std::make_shared<core::DeviceInventory>();

        auto credentials = std::make_shared<core::StaticCredentialProvider>();
        core::CredentialSet lab;
        lab.id = "lab";
        core::SnmpCredential snmp;
        snmp.setId = "lab";
        snmp.community = "public";
        lab.snmp = snmp;
        credentials->addSet(lab);

        // sw1 advertises sw2 over CDP; sw2 advertises nothing
        FakeHost sw1;
        sw1.snmp["public"] = switchFacts("sw1");
        sw1.snmp["public"].neighbors.push_back(cdpEdge("10.0.0.1", "Gi0/1", "10.0.0.2", "sw2", "Gi0/2"));
        probe->addHost("10.0.0.1", sw1);
        FakeHost sw2;
        sw2.snmp["public"] = switchFacts("sw2");
        probe->addHost("10.0.0.2", sw2);

        core::DiscoveryOptions defaults;
        defaults.concurrency = 4;
        defaults.maxIterations = 3;
        service = std::make_unique<services::DiscoveryServiceImpl>(probe, credentials, defaults,
                                                                   inventory);

        int port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
        builder.RegisterService(service.get());
        server = builder.BuildAndStart();
        ASSERT_NE(server, nullptr);
        ASSERT_GT(port, 0);

        stub = v1::DiscoveryService::NewStub(grpc::CreateChannel(
            "127.0.0.1:" + std::to_string(port), grpc::InsecureChannelCredentials()));
    }

    void TearDown() override {
        openGate();
        if (server) {
            server->Shutdown();
        }
        server.reset();
        service.reset();
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    /// Holds every reachability check until openGate(); waitForGate() returns once one is held.
    void closeGate() {
        probe->setReachabilityHook([this](const std::string&) {
            if (!gateEntered_.exchange(true)) {
                entered_.set_value();
            }
            released_.wait();
        });
    }

    void waitForGate() {
        entered_.get_future().wait();
    }

    void openGate() {
        if (!gateOpened_.exchange(true)) {
            release_.set_value();
        }
    }

    grpc::Status start(const std::vector<std::string>& seeds, std::string* runId) {
        v1::StartDiscoveryRequest request;
        for (const auto& seed : seeds) {
            request.add_seeds(seed);
        }
        request.add_credential_set_ids("lab");
        v1::StartDiscoveryResponse response;
        grpc::ClientContext context;
        grpc::Status status = stub->StartDiscovery(&context, request, &response);
        if (runId) {
            *runId = response.run_id();
        }
        return status;
    }

    grpc::Status getResult(const std::string& runId, v1::DiscoveryResult* result) {
        v1::GetResultRequest request;
        request.set_run_id(runId);
        grpc::ClientContext context;
        return stub->GetResult(&context, request, result);
    }

    grpc::Status getProgress(const std::string& runId, v1::DiscoveryProgress* progress) {
        v1::GetProgressRequest request;
        request.set_run_id(runId);
        grpc::ClientContext context;
        return stub->GetProgress(&context, request, progress);
    }

    std::shared_ptr<FakeProtocolProbe> probe;
    std::shared_ptr<core::DeviceInventory> inventory;
    std::unique_ptr<services::DiscoveryServiceImpl> service;
    std::unique_ptr<grpc::Server> server;
    std::unique_ptr<v1::DiscoveryService::Stub> stub;

private:
    std::promise<void> entered_;
    std::promise<void> release_;
    std::shared_future<void> released_ = release_.get_future().share();
    std::atomic<bool> gateEntered_{false};
    std::atomic<bool> gateOpened_{false};
};

TEST_F(DiscoveryServiceTest, IdleBeforeFirstRun) {
    v1::DiscoveryProgress progress;
    ASSERT_TRUE(getProgress("", &progress).ok());
    EXPECT_EQ(progress.phase(), "idle");

    v1::DiscoveryResult result;
    EXPECT_EQ(getResult("", &result).error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(DiscoveryServiceTest, FullRunOverGrpc) {
    std::string runId;
    ASSERT_TRUE(start({"10.0.0.1"}, &runId).ok());
    EXPECT_EQ(runId, "run-1");
    ASSERT_TRUE(service->waitForRun(runId));

    v1::DiscoveryResult result;
    grpc::Status status = getResult(runId, &result);
    ASSERT_TRUE(status.ok()) << status.error_message();

    EXPECT_EQ(result.run_id(), "run-1");
    EXPECT_EQ(result.devices_size(), 2);
    EXPECT_EQ(result.interface_connections().count("10.0.0.1:Gi0/1-10.0.0.2:Gi0/2"), 1u);
    EXPECT_EQ(result.topology().summary().total_devices(), 2u);
    EXPECT_EQ(result.topology().summary().total_connections(), 1u);
    EXPECT_EQ(result.progress().phase(), "completed");
    EXPECT_EQ(result.progress().completed(), 2u);

    v1::DiscoveryProgress progress;
    ASSERT_TRUE(getProgress("", &progress).ok());
    EXPECT_EQ(progress.run_id(), "run-1");
    EXPECT_EQ(progress.phase(), "completed");

    EXPECT_EQ(inventory->size(), 2u);
}

TEST_F(DiscoveryServiceTest, InvalidRequestsAreRejected) {
    grpc::Status noSeeds = start({}, nullptr);
    EXPECT_EQ(noSeeds.error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    grpc::Status badSeed = start({"10.0.0.1", "switch-1"}, nullptr);
    EXPECT_EQ(badSeed.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_THAT(badSeed.error_message(), HasSubstr("switch-1"));

    v1::StartDiscoveryRequest request;
    request.add_seeds("10.0.0.1");
    request.set_max_iterations(-1);
    v1::StartDiscoveryResponse response;
    grpc::ClientContext context;
    EXPECT_EQ(stub->StartDiscovery(&context, request, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);

    EXPECT_EQ(service->findRun(""), nullptr);
}

TEST_F(DiscoveryServiceTest, UnknownRunIsNotFound) {
    v1::DiscoveryResult result;
    EXPECT_EQ(getResult("run-99", &result).error_code(), grpc::StatusCode::NOT_FOUND);

    v1::DiscoveryProgress progress;
    EXPECT_EQ(getProgress("run-99", &progress).error_code(), grpc::StatusCode::NOT_FOUND);

    v1::CancelDiscoveryRequest cancel;
    cancel.set_run_id("run-99");
    v1::CancelDiscoveryResponse cancelResponse;
    grpc::ClientContext cancelContext;
    EXPECT_EQ(stub->CancelDiscovery(&cancelContext, cancel, &cancelResponse).error_code(),
              grpc::StatusCode::NOT_FOUND);

    v1::WatchProgressRequest watch;
    watch.set_run_id("run-99");
    grpc::ClientContext watchContext;
    auto reader = stub->WatchProgress(&watchContext, watch);
    v1::DiscoveryProgress snapshot;
    EXPECT_FALSE(reader->Read(&snapshot));
    EXPECT_EQ(reader->Finish().error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(DiscoveryServiceTest, OneRunAtATimeAndCancellation) {
    closeGate();

    std::string runId;
    ASSERT_TRUE(start({"10.0.0.1"}, &runId).ok());
    waitForGate();

    grpc::Status second = start({"10.0.0.2"}, nullptr);
    EXPECT_EQ(second.error_code(), grpc::StatusCode::FAILED_PRECONDITION);

    v1::DiscoveryResult pending;
    EXPECT_EQ(getResult(runId, &pending).error_code(), grpc::StatusCode::FAILED_PRECONDITION);

    v1::CancelDiscoveryRequest cancel;
    cancel.set_run_id(runId);
    v1::CancelDiscoveryResponse cancelResponse;
    grpc::ClientContext cancelContext;
    ASSERT_TRUE(stub->CancelDiscovery(&cancelContext, cancel, &cancelResponse).ok());
    EXPECT_TRUE(cancelResponse.cancelled());

    openGate();
    ASSERT_TRUE(service->waitForRun(runId));

    v1::DiscoveryResult result;
    ASSERT_TRUE(getResult(runId, &result).ok());
    EXPECT_EQ(result.progress().phase(), "cancelled");

    // Cancelling a finished run is a no-op
    grpc::ClientContext againContext;
    ASSERT_TRUE(stub->CancelDiscovery(&againContext, cancel, &cancelResponse).ok());
    EXPECT_FALSE(cancelResponse.cancelled());

    // A new run may start once the previous one finished
    std::string nextId;
    ASSERT_TRUE(start({"10.0.0.2"}, &nextId).ok());
    EXPECT_EQ(nextId, "run-2");
    ASSERT_TRUE(service->waitForRun(nextId));
    EXPECT_NE(service->findRun(runId), nullptr);
}

TEST_F(DiscoveryServiceTest, WatchProgressStreamsUntilCompletion) {
    closeGate();

    std::string runId;
    ASSERT_TRUE(start({"10.0.0.1"}, &runId).ok());
    waitForGate();

    v1::WatchProgressRequest request;
    request.set_run_id(runId);
    grpc::ClientContext context;
    auto reader = stub->WatchProgress(&context, request);

    v1::DiscoveryProgress snapshot;
    ASSERT_TRUE(reader->Read(&snapshot));
    EXPECT_EQ(snapshot.run_id(), runId);
    EXPECT_NE(snapshot.phase(), "completed");

    openGate();

    std::string lastPhase = snapshot.phase();
    int snapshots = 1;
    while (reader->Read(&snapshot)) {
        lastPhase = snapshot.phase();
        ++snapshots;
    }
    grpc::Status status = reader->Finish();

    EXPECT_TRUE(status.ok()) << status.error_message();
    EXPECT_GE(snapshots, 2);
    EXPECT_EQ(lastPhase, "completed");
    EXPECT_EQ(snapshot.completed(), 2u);
}

TEST_F(DiscoveryServiceTest, WatchFinishedRunSendsFinalSnapshot) {
    std::string runId;
    ASSERT_TRUE(start({"10.0.0.1"}, &runId).ok());
    ASSERT_TRUE(service->waitForRun(runId));

    v1::WatchProgressRequest request;
    grpc::ClientContext context;
    auto reader = stub->WatchProgress(&context, request);

    std::vector<std::string> phases;
    v1::DiscoveryProgress snapshot;
    while (reader->Read(&snapshot)) {
        phases.push_back(snapshot.phase());
    }

    EXPECT_TRUE(reader->Finish().ok());
    ASSERT_EQ(phases.size(), 1u);
    EXPECT_EQ(phases[0], "completed");
}
