/**
 * @file test_snmp_codec.cpp
 * @brief Unit tests for the SNMP BER codec and OID helpers
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/probe/snmp_codec.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace netmap::probe;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

using Bytes = std::vector<uint8_t>;

Bytes tlv(uint8_t tag, const Bytes& value) {
    Bytes out{tag};
    if (value.size() < 0x80) {
        out.push_back(static_cast<uint8_t>(value.size()));
    } else {
        out.push_back(0x82);
        out.push_back(static_cast<uint8_t>(value.size() >> 8));
        out.push_back(static_cast<uint8_t>(value.size() & 0xFF));
    }
    out.insert(out.end(), value.begin(), value.end());
    return out;
}

Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

Bytes text(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

Bytes varbind(const Bytes& oid, uint8_t tag, const Bytes& value) {
    return tlv(0x30, concat({tlv(0x06, oid), tlv(tag, value)}));
}

Bytes response(int32_t errorStatus, const Bytes& varbinds) {
    Bytes pdu = concat({tlv(0x02, {0x04, 0xD2}),
                        tlv(0x02, {static_cast<uint8_t>(errorStatus)}),
                        tlv(0x02, {static_cast<uint8_t>(errorStatus ? 1 : 0)}),
                        tlv(0x30, varbinds)});
    return tlv(0x30, concat({tlv(0x02, {0x01}), tlv(0x04, text("public")), tlv(0xA2, pdu)}));
}

// 1.3.6.1.2.1.1.5.0 (sysName.0)
const Bytes SYS_NAME = {0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x05, 0x00};
// 1.3.6.1.2.1.1.3.0 (sysUpTime.0)
const Bytes SYS_UPTIME = {0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x03, 0x00};
// 1.3.6.1.2.1.4.20.1.1.10.0.0.1
const Bytes IP_AD_ENT = {0x2B, 0x06, 0x01, 0x02, 0x01, 0x04, 0x14, 0x01, 0x01, 0x0A, 0x00, 0x00, 0x01};

}  // namespace

// =============================================================================
// OID helpers
// =============================================================================

TEST(SnmpCodecTest, ParseOid) {
    std::vector<uint32_t> arcs;
    ASSERT_TRUE(parseOid("1.3.6.1.2.1.1.1.0", arcs));
    EXPECT_THAT(arcs, ElementsAre(1, 3, 6, 1, 2, 1, 1, 1, 0));

    ASSERT_TRUE(parseOid(".1.3.6.1.4.1.9", arcs));
    EXPECT_EQ(oidToString(arcs), "1.3.6.1.4.1.9");

    EXPECT_FALSE(parseOid("", arcs));
    EXPECT_FALSE(parseOid("1", arcs));
    EXPECT_FALSE(parseOid("1..3", arcs));
    EXPECT_FALSE(parseOid("1.3.x", arcs));
    EXPECT_FALSE(parseOid("3.1", arcs));
    EXPECT_FALSE(parseOid("1.40", arcs));
    EXPECT_FALSE(parseOid("1.3.4294967296", arcs));
}

TEST(SnmpCodecTest, ParseIndexArcsHasNoRootRules) {
    std::vector<uint32_t> arcs;
    ASSERT_TRUE(parseIndexArcs("5", arcs));
    EXPECT_THAT(arcs, ElementsAre(5));

    ASSERT_TRUE(parseIndexArcs("100.0.17.34.51.68.85", arcs));
    EXPECT_THAT(arcs, ElementsAre(100, 0, 17, 34, 51, 68, 85));

    ASSERT_TRUE(parseIndexArcs("12.1", arcs));
    EXPECT_THAT(arcs, ElementsAre(12, 1));

    ASSERT_TRUE(parseIndexArcs("1.4094", arcs));
    EXPECT_THAT(arcs, ElementsAre(1, 4094));

    EXPECT_FALSE(parseIndexArcs("", arcs));
    EXPECT_TRUE(arcs.empty());
    EXPECT_FALSE(parseIndexArcs("10..1", arcs));
    EXPECT_FALSE(parseIndexArcs("10.a", arcs));
    EXPECT_FALSE(parseIndexArcs("4294967296", arcs));
    EXPECT_TRUE(arcs.empty());

    // Full OIDs still enforce the root arcs
    EXPECT_FALSE(parseOid("5", arcs));
    EXPECT_FALSE(parseOid("12.1", arcs));
}

TEST(SnmpCodecTest, CompareOidsByArcValue) {
    EXPECT_LT(compareOids("1.3.6.1.2.1.2.2.1.2.9", "1.3.6.1.2.1.2.2.1.2.10"), 0);
    EXPECT_GT(compareOids("1.3.6.1.2.1.2.2.1.3.1", "1.3.6.1.2.1.2.2.1.2.100"), 0);
    EXPECT_EQ(compareOids("1.3.6.1", ".1.3.6.1"), 0);
    EXPECT_LT(compareOids("1.3.6.1", "1.3.6.1.0"), 0);
}

TEST(SnmpCodecTest, OidIsUnderAndSuffix) {
    EXPECT_TRUE(oidIsUnder("1.3.6.1.2.1.2.2.1.2.5", "1.3.6.1.2.1.2.2.1.2"));
    EXPECT_FALSE(oidIsUnder("1.3.6.1.2.1.2.2.1.2", "1.3.6.1.2.1.2.2.1.2"));
    EXPECT_FALSE(oidIsUnder("1.3.6.1.2.1.2.2.1.20.5", "1.3.6.1.2.1.2.2.1.2"));

    EXPECT_EQ(oidSuffix("1.3.6.1.2.1.4.22.1.2.7.10.0.0.5", "1.3.6.1.2.1.4.22.1.2"), "7.10.0.0.5");
    EXPECT_EQ(oidSuffix("1.3.6.1.2.1.1.1.0", "1.3.6.1.2.1.2"), "");
}

// =============================================================================
// Encoding
// =============================================================================

TEST(SnmpCodecTest, EncodeGetRequest) {
    SnmpRequest request;
    request.community = "public";
    request.requestId = 1;
    request.oids = {"1.3.6.1.2.1.1.1.0"};

    auto packet = encodeRequest(request);
    ASSERT_TRUE(packet.ok()) << packet.error();

    const Bytes expected = {
        0x30, 0x26,
        0x02, 0x01, 0x01,
        0x04, 0x06, 'p', 'u', 'b', 'l', 'i', 'c',
        0xA0, 0x19,
        0x02, 0x01, 0x01,
        0x02, 0x01, 0x00,
        0x02, 0x01, 0x00,
        0x30, 0x0E,
        0x30, 0x0C,
        0x06, 0x08, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00,
        0x05, 0x00};
    EXPECT_EQ(*packet, expected);
}

TEST(SnmpCodecTest, EncodeGetBulkCarriesRepetitions) {
    SnmpRequest request;
    request.pduType = SnmpPduType::GET_BULK;
    request.requestId = 300;
    request.maxRepetitions = 25;
    request.oids = {"1.3.6.1.2.1.2.2.1.2.200"};

    auto packet = encodeRequest(request);
    ASSERT_TRUE(packet.ok()) << packet.error();

    const Bytes& p = *packet;
    // Header up to the PDU: 30 LL 02 01 01 04 06 public
    ASSERT_GT(p.size(), 15u);
    EXPECT_EQ(p[13], 0xA5);
    // request-id 300 = 0x012C, non-repeaters 0, max-repetitions 25
    const Bytes pduHead = {0x02, 0x02, 0x01, 0x2C, 0x02, 0x01, 0x00, 0x02, 0x01, 0x19};
    EXPECT_TRUE(std::equal(pduHead.begin(), pduHead.end(), p.begin() + 15));
    // Arc 200 takes two base-128 bytes
    const Bytes tail = {0x01, 0x02, 0x81, 0x48, 0x05, 0x00};
    EXPECT_TRUE(std::equal(tail.begin(), tail.end(), p.end() - 6));
}

TEST(SnmpCodecTest, EncodeNegativeRequestId) {
    SnmpRequest request;
    request.requestId = -1;
    request.oids = {"1.3.6.1.2.1.1.1.0"};

    auto packet = encodeRequest(request);
    ASSERT_TRUE(packet.ok());
    EXPECT_EQ((*packet)[15], 0x02);
    EXPECT_EQ((*packet)[16], 0x01);
    EXPECT_EQ((*packet)[17], 0xFF);
}

TEST(SnmpCodecTest, EncodeRejectsBadInput) {
    SnmpRequest request;
    request.oids = {"not.an.oid"};
    auto malformed = encodeRequest(request);
    ASSERT_FALSE(malformed.ok());
    EXPECT_THAT(malformed.error(), HasSubstr("malformed OID"));

    SnmpRequest bulkV1;
    bulkV1.version = SNMP_VERSION_1;
    bulkV1.pduType = SnmpPduType::GET_BULK;
    bulkV1.oids = {"1.3.6.1.2.1.1"};
    EXPECT_FALSE(encodeRequest(bulkV1).ok());
}

// =============================================================================
// Decoding
// =============================================================================

TEST(SnmpCodecTest, DecodeResponseValues) {
    Bytes packet = response(0, concat({
        varbind(SYS_NAME, 0x04, text("core-sw1")),
        varbind(SYS_UPTIME, 0x43, {0x01, 0xE2, 0x40}),
        varbind(IP_AD_ENT, 0x40, {0x0A, 0x00, 0x00, 0x01}),
        varbind(SYS_NAME, 0x82, {})}));

    auto decoded = decodeResponse(packet.data(), packet.size());
    ASSERT_TRUE(decoded.ok()) << decoded.error();

    EXPECT_EQ(decoded->version, SNMP_VERSION_2C);
    EXPECT_EQ(decoded->community, "public");
    EXPECT_EQ(decoded->requestId, 1234);
    EXPECT_EQ(decoded->errorStatus, 0);
    ASSERT_EQ(decoded->varbinds.size(), 4u);

    EXPECT_EQ(decoded->varbinds[0].oid, "1.3.6.1.2.1.1.5.0");
    EXPECT_EQ(decoded->varbinds[0].value.asString(), "core-sw1");

    EXPECT_EQ(decoded->varbinds[1].value.type, SnmpValueType::TIMETICKS);
    EXPECT_EQ(decoded->varbinds[1].value.asInteger(), 123456);

    EXPECT_EQ(decoded->varbinds[2].oid, "1.3.6.1.2.1.4.20.1.1.10.0.0.1");
    EXPECT_EQ(decoded->varbinds[2].value.asString(), "10.0.0.1");

    EXPECT_EQ(decoded->varbinds[3].value.type, SnmpValueType::END_OF_MIB_VIEW);
    EXPECT_TRUE(decoded->varbinds[3].value.isException());
}

TEST(SnmpCodecTest, DecodeLongFormLengthAndPaddedString) {
    std::string description(300, 'x');
    Bytes value = text(description);
    value.push_back('\0');

    Bytes packet = response(0, varbind(SYS_NAME, 0x04, value));
    auto decoded = decodeResponse(packet.data(), packet.size());

    ASSERT_TRUE(decoded.ok()) << decoded.error();
    ASSERT_EQ(decoded->varbinds.size(), 1u);
    EXPECT_EQ(decoded->varbinds[0].value.bytes.size(), 301u);
    EXPECT_EQ(decoded->varbinds[0].value.asString(), description);
}

TEST(SnmpCodecTest, DecodeErrorStatus) {
    Bytes packet = response(2, varbind(SYS_NAME, 0x05, {}));
    auto decoded = decodeResponse(packet.data(), packet.size());

    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->errorStatus, 2);
    EXPECT_EQ(decoded->errorIndex, 1);
    EXPECT_STREQ(snmpErrorName(decoded->errorStatus), "noSuchName");
}

TEST(SnmpCodecTest, DecodeRejectsMalformedInput) {
    Bytes packet = response(0, varbind(SYS_NAME, 0x04, text("sw")));

    auto truncated = decodeResponse(packet.data(), packet.size() - 3);
    EXPECT_FALSE(truncated.ok());

    const Bytes garbage = {0x04, 0x02, 'h', 'i'};
    auto notSequence = decodeResponse(garbage.data(), garbage.size());
    ASSERT_FALSE(notSequence.ok());
    EXPECT_EQ(notSequence.error(), "not a BER sequence");

    Bytes request = concat({tlv(0x30, concat({tlv(0x02, {0x01}), tlv(0x04, text("public")),
                                              tlv(0xA0, {})}))});
    auto wrongPdu = decodeResponse(request.data(), request.size());
    ASSERT_FALSE(wrongPdu.ok());
    EXPECT_EQ(wrongPdu.error(), "not a GetResponse PDU");

    Bytes badIp = response(0, varbind(IP_AD_ENT, 0x40, {0x0A, 0x00}));
    EXPECT_FALSE(decodeResponse(badIp.data(), badIp.size()).ok());
}

TEST(SnmpCodecTest, ErrorNames) {
    EXPECT_STREQ(snmpErrorName(0), "noError");
    EXPECT_STREQ(snmpErrorName(1), "tooBig");
    EXPECT_STREQ(snmpErrorName(16), "authorizationError");
    EXPECT_STREQ(snmpErrorName(99), "error");
}
