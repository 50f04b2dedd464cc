/**
 * @file test_neighbor_extractor.cpp
 * @brief Unit tests for neighbor edge extraction
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/core/neighbor_extractor.hpp>

#include "common/fake_protocol_probe.hpp"

using namespace netmap::core;
using netmap::testing::FakeHost;
using netmap::testing::FakeProtocolProbe;
using netmap::testing::cdpEdge;
using netmap::testing::switchFacts;
using ::testing::IsEmpty;

namespace {

ArpEntry arp(const std::string& ip, ArpType type) {
    ArpEntry entry;
    entry.ip = ip;
    entry.macAddress = "00:aa:bb:cc:dd:01";
    entry.interfaceName = "Vlan10";
    entry.type = type;
    return entry;
}

}  // namespace

class NeighborExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe = std::make_shared<FakeProtocolProbe>();
        device.ip = "10.0.0.1";
    }

    std::shared_ptr<FakeProtocolProbe> probe;
    Device device;
    std::vector<std::string> errors;
};

TEST_F(NeighborExtractorTest, ArpEdgesUseDynamicEntriesOnly) {
    device.arpTable = {arp("10.0.0.20", ArpType::DYNAMIC),
                       arp("10.0.0.21", ArpType::STATIC),
                       arp("10.0.0.1", ArpType::DYNAMIC),
                       arp("fe80::1", ArpType::DYNAMIC)};

    auto edges = NeighborExtractor::arpEdges(device);

    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].fromIp, "10.0.0.1");
    EXPECT_EQ(edges[0].toIp, "10.0.0.20");
    EXPECT_EQ(edges[0].localInterface, "Vlan10");
    EXPECT_EQ(edges[0].remoteMac, "00:aa:bb:cc:dd:01");
    EXPECT_EQ(edges[0].protocol, NeighborProtocol::ARP);
    EXPECT_EQ(edges[0].confidence, Confidence::LOW);
}

TEST_F(NeighborExtractorTest, WithoutCredentialOnlyProbedEdges) {
    device.neighbors.push_back(cdpEdge("10.0.0.1", "Gi0/1", "10.0.0.2", "sw2", "Gi0/2"));

    NeighborExtractor extractor(probe, std::chrono::milliseconds(100));
    auto edges = extractor.extractNeighbors(device, std::nullopt, errors);

    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].toIp, "10.0.0.2");
    EXPECT_EQ(probe->neighborCalls("10.0.0.1"), 0);
    EXPECT_THAT(errors, IsEmpty());
}

TEST_F(NeighborExtractorTest, QueriedEdgesAreStampedWithDevice) {
    FakeHost host = FakeHost();
    host.snmp["public"] = switchFacts("sw1");
    host.snmpNeighbors.push_back(cdpEdge("", "Gi0/3", "10.0.0.3", "sw3", "Gi0/1"));
    probe->addHost("10.0.0.1", host);
    device.arpTable.push_back(arp("10.0.0.50", ArpType::DYNAMIC));

    SnmpCredential cred;
    cred.community = "public";

    NeighborExtractor extractor(probe, std::chrono::milliseconds(100));
    auto edges = extractor.extractNeighbors(device, cred, errors);

    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(edges[0].fromIp, "10.0.0.1");
    EXPECT_EQ(edges[0].toIp, "10.0.0.3");
    EXPECT_EQ(edges[1].protocol, NeighborProtocol::ARP);
    EXPECT_EQ(probe->neighborCalls("10.0.0.1"), 1);
}

TEST_F(NeighborExtractorTest, FailedQueryIsNotAnError) {
    SnmpCredential cred;
    cred.community = "wrong";

    NeighborExtractor extractor(probe, std::chrono::milliseconds(100));
    auto edges = extractor.extractNeighbors(device, cred, errors);

    EXPECT_THAT(edges, IsEmpty());
    EXPECT_THAT(errors, IsEmpty());
}
