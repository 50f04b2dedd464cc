/**
 * @file test_icmp_socket.cpp
 * @brief Unit tests for ICMP echo packet construction
 */

#include <gtest/gtest.h>
#include <netmap/net/icmp_socket.hpp>

#include <vector>

using namespace netmap::net;

TEST(IcmpSocketTest, ChecksumMatchesRfc1071Example) {
    const uint8_t data[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
    EXPECT_EQ(internetChecksum(data, sizeof(data)), 0x220d);
}

TEST(IcmpSocketTest, ChecksumPadsOddLength) {
    const uint8_t odd[] = {0x12, 0x34, 0x56};
    const uint8_t padded[] = {0x12, 0x34, 0x56, 0x00};
    EXPECT_EQ(internetChecksum(odd, sizeof(odd)), internetChecksum(padded, sizeof(padded)));
}

TEST(IcmpSocketTest, EchoRequestLayout) {
    std::vector<uint8_t> payload = {'a', 'b', 'c', 'd'};
    auto packet = buildEchoRequest(0x1234, 0x0102, payload);

    ASSERT_EQ(packet.size(), 12u);
    EXPECT_EQ(packet[0], 8);     // echo request
    EXPECT_EQ(packet[1], 0);
    EXPECT_EQ(packet[4], 0x12);
    EXPECT_EQ(packet[5], 0x34);
    EXPECT_EQ(packet[6], 0x01);
    EXPECT_EQ(packet[7], 0x02);
    EXPECT_EQ(packet[8], 'a');
    EXPECT_EQ(packet[11], 'd');

    // A packet carrying its own checksum sums to zero.
    EXPECT_EQ(internetChecksum(packet.data(), packet.size()), 0);
}

TEST(IcmpSocketTest, EchoToInvalidAddressReportsError) {
    IcmpSocket socket;
    auto reply = socket.echo("999.0.0.1", 1, 100);

    EXPECT_FALSE(reply.replied);
    EXPECT_FALSE(reply.error.empty());
}
