/**
 * @file test_topology_builder.cpp
 * @brief Unit tests for connection mapping and topology assembly
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/core/topology_builder.hpp>
#include <netmap/core/classification.hpp>

#include "common/fake_protocol_probe.hpp"

using namespace netmap::core;
using netmap::testing::cdpEdge;
using ::testing::IsEmpty;

namespace {

Device device(const std::string& ip, const std::string& hostname) {
    Device d(ip);
    d.hostname = hostname;
    return d;
}

InferredLink inferred(const std::string& ip1, const std::string& port1,
                      const std::string& ip2, const std::string& port2) {
    InferredLink link;
    link.device1 = LinkEndpoint{ip1, ip1, port1};
    link.device2 = LinkEndpoint{ip2, ip2, port2};
    link.key = ip1 + ":" + port1 + "-" + ip2 + ":" + port2;
    link.evidenceMac = "aa:bb:cc:dd:ee:ff";
    link.vlan = 20;
    return link;
}

}  // namespace

class TopologyBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        devices = {device("10.0.0.1", "sw1"), device("10.0.0.2", "sw2.corp.example.com"),
                   device("10.0.0.3", "")};
    }

    std::vector<Device> devices;
    TopologyBuilder::NeighborMap neighbors;
    TopologyBuilder builder;
};

TEST_F(TopologyBuilderTest, NormalizeHostname) {
    EXPECT_EQ(TopologyBuilder::normalizeHostname("SW2.corp.example.com"), "sw2");
    EXPECT_EQ(TopologyBuilder::normalizeHostname("core-sw(FOC1234X0YZ)"), "core-sw");
    EXPECT_EQ(TopologyBuilder::normalizeHostname("  Edge1 "), "edge1");
    EXPECT_EQ(TopologyBuilder::normalizeHostname("10.0.0.7"), "10.0.0.7");
}

TEST_F(TopologyBuilderTest, MirrorEdgesCollapse) {
    neighbors["10.0.0.1"] = {cdpEdge("10.0.0.1", "Gi0/1", "10.0.0.2", "sw2", "Gi0/2")};
    neighbors["10.0.0.2"] = {cdpEdge("10.0.0.2", "Gi0/2", "10.0.0.1", "sw1", "Gi0/1")};

    auto connections = builder.mapConnections(devices, neighbors, {});

    ASSERT_EQ(connections.size(), 1u);
    const Link& link = connections.at("10.0.0.1:Gi0/1-10.0.0.2:Gi0/2");
    EXPECT_EQ(link.source, "10.0.0.1");
    EXPECT_EQ(link.target, "10.0.0.2");
    EXPECT_EQ(link.sourceHostname, "sw1");
    EXPECT_EQ(link.targetHostname, "sw2.corp.example.com");
    EXPECT_EQ(link.protocol, "CDP");
    EXPECT_EQ(link.type, "cdp");
}

TEST_F(TopologyBuilderTest, ParallelLinksStayDistinct) {
    neighbors["10.0.0.1"] = {cdpEdge("10.0.0.1", "Gi0/1", "10.0.0.2", "sw2", "Gi0/1"),
                             cdpEdge("10.0.0.1", "Gi0/2", "10.0.0.2", "sw2", "Gi0/2")};

    auto connections = builder.mapConnections(devices, neighbors, {});
    EXPECT_EQ(connections.size(), 2u);
}

TEST_F(TopologyBuilderTest, RemoteResolvedByHostnameAndAddress) {
    devices[2].ipAddresses.push_back(IpAddressEntry{"192.168.5.1", "255.255.255.0", "Vlan5"});

    NeighborEdge byName = cdpEdge("10.0.0.1", "Gi0/1", "", "SW2.corp.example.com", "Gi0/9");
    NeighborEdge byAddress = cdpEdge("10.0.0.1", "Gi0/3", "192.168.5.1", "unknown-id", "Gi0/4");
    NeighborEdge stranger = cdpEdge("10.0.0.1", "Gi0/5", "172.16.0.1", "far-away", "Gi0/1");
    neighbors["10.0.0.1"] = {byName, byAddress, stranger};

    auto connections = builder.mapConnections(devices, neighbors, {});

    ASSERT_EQ(connections.size(), 2u);
    EXPECT_EQ(connections.count("10.0.0.1:Gi0/1-10.0.0.2:Gi0/9"), 1u);
    EXPECT_EQ(connections.count("10.0.0.1:Gi0/3-10.0.0.3:Gi0/4"), 1u);
}

TEST_F(TopologyBuilderTest, ArpEdgesNeverBecomeLinks) {
    NeighborEdge edge;
    edge.fromIp = "10.0.0.1";
    edge.toIp = "10.0.0.2";
    edge.protocol = NeighborProtocol::ARP;
    edge.confidence = Confidence::LOW;
    neighbors["10.0.0.1"] = {edge};

    EXPECT_THAT(builder.mapConnections(devices, neighbors, {}), IsEmpty());
}

TEST_F(TopologyBuilderTest, InferredLinkSupersededByNeighborLink) {
    neighbors["10.0.0.1"] = {cdpEdge("10.0.0.1", "Gi0/1", "10.0.0.2", "sw2", "Gi0/2")};
    std::vector<InferredLink> candidates = {inferred("10.0.0.2", "Gi0/2", "10.0.0.1", "Gi0/1"),
                                            inferred("10.0.0.1", "Gi0/7", "10.0.0.3", "Gi0/1"),
                                            inferred("10.0.0.1", "Gi0/8", "10.0.0.99", "Gi0/1")};

    auto connections = builder.mapConnections(devices, neighbors, candidates);

    ASSERT_EQ(connections.size(), 2u);
    const Link& link = connections.at("10.0.0.1:Gi0/7-10.0.0.3:Gi0/1");
    EXPECT_EQ(link.type, "learned_from_mac");
    EXPECT_EQ(link.confidence, Confidence::MEDIUM);
    EXPECT_EQ(link.vlan, 20);
    EXPECT_EQ(link.evidenceMac, "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(link.targetHostname, "10.0.0.3");
}

TEST_F(TopologyBuilderTest, BuildProducesSortedNodesAndSummary) {
    devices[0].vendor = "cisco";
    devices[0].discoveryMethod = DiscoveryMethod::SNMP;
    RouteEntry route;
    for (int i = 0; i < 6; ++i) {
        route.network = "10." + std::to_string(i) + ".0.0/16";
        devices[0].routingTable.push_back(route);
    }
    devices[0].capabilities = deriveCapabilities(devices[0]);

    neighbors["10.0.0.1"] = {cdpEdge("10.0.0.1", "Gi0/1", "10.0.0.2", "sw2", "Gi0/2")};
    std::vector<Device> reversed(devices.rbegin(), devices.rend());

    auto topology = builder.build(reversed, neighbors, {inferred("10.0.0.1", "Gi0/7", "10.0.0.3", "Gi0/1")});

    ASSERT_EQ(topology.nodes.size(), 3u);
    EXPECT_EQ(topology.nodes[0].id, "10.0.0.1");
    EXPECT_EQ(topology.nodes[0].type, "router");
    EXPECT_EQ(topology.nodes[2].label, "10.0.0.3");
    EXPECT_EQ(topology.nodes[2].vendor, "unknown");

    EXPECT_EQ(topology.summary.totalDevices, 3u);
    EXPECT_EQ(topology.summary.totalConnections, 2u);
    EXPECT_EQ(topology.summary.vendors.at("unknown"), 2u);
    EXPECT_EQ(topology.summary.deviceTypes.at("router"), 1u);
    EXPECT_EQ(topology.summary.deviceTypes.at("host"), 2u);
    EXPECT_EQ(topology.summary.discoveryMethods.at("snmp"), 1u);
    EXPECT_EQ(topology.summary.confidence.at("high"), 1u);
    EXPECT_EQ(topology.summary.confidence.at("medium"), 1u);
}
