/**
 * @file test_credentials.cpp
 * @brief Unit tests for credential file parsing and lookup
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/core/credentials.hpp>

#include <cstdio>
#include <fstream>

using namespace netmap::core;
using ::testing::HasSubstr;

TEST(CredentialsTest, ParseSets) {
    auto sets = StaticCredentialProvider::parse(
        "# lab credentials\n"
        "\n"
        "lab  snmp    public\n"
        "lab  ssh     admin  s3cret\n"
        "legacy snmp  old-ro v1 1161\n"
        "legacy telnet ops  pass 2323\n");

    ASSERT_TRUE(sets.ok()) << sets.error();
    ASSERT_EQ(sets->size(), 2u);

    const CredentialSet& lab = (*sets)[0];
    EXPECT_EQ(lab.id, "lab");
    ASSERT_TRUE(lab.snmp.has_value());
    EXPECT_EQ(lab.snmp->community, "public");
    EXPECT_EQ(lab.snmp->version, SnmpVersion::V2C);
    EXPECT_EQ(lab.snmp->port, 161);
    ASSERT_TRUE(lab.ssh.has_value());
    EXPECT_EQ(lab.ssh->username, "admin");
    EXPECT_EQ(lab.ssh->port, 0);
    EXPECT_FALSE(lab.telnet.has_value());

    const CredentialSet& legacy = (*sets)[1];
    EXPECT_EQ(legacy.snmp->version, SnmpVersion::V1);
    EXPECT_EQ(legacy.snmp->port, 1161);
    EXPECT_EQ(legacy.telnet->port, 2323);
    EXPECT_EQ(legacy.telnet->setId, "legacy");
}

TEST(CredentialsTest, ParseErrorsNameTheLine) {
    auto unknown = StaticCredentialProvider::parse("lab snmp public\nlab ftp user pass\n");
    ASSERT_FALSE(unknown.ok());
    EXPECT_THAT(unknown.error(), HasSubstr("line 2"));
    EXPECT_THAT(unknown.error(), HasSubstr("unknown protocol"));

    auto badPort = StaticCredentialProvider::parse("lab ssh admin pass 70000\n");
    EXPECT_FALSE(badPort.ok());

    auto badVersion = StaticCredentialProvider::parse("lab snmp public v3\n");
    EXPECT_FALSE(badVersion.ok());

    auto duplicate = StaticCredentialProvider::parse("lab snmp a\nlab snmp b\n");
    ASSERT_FALSE(duplicate.ok());
    EXPECT_THAT(duplicate.error(), HasSubstr("duplicate"));

    auto shortLine = StaticCredentialProvider::parse("lab ssh\n");
    EXPECT_FALSE(shortLine.ok());
}

TEST(CredentialsTest, LoadMissingFile) {
    auto sets = StaticCredentialProvider::loadFile("/nonexistent/netmap-credentials.txt");
    ASSERT_FALSE(sets.ok());
    EXPECT_THAT(sets.error(), HasSubstr("cannot open"));
}

TEST(CredentialsTest, LoadFile) {
    std::string path = ::testing::TempDir() + "netmap_credentials_test.txt";
    {
        std::ofstream out(path);
        out << "core snmp c0re\n";
    }

    auto sets = StaticCredentialProvider::loadFile(path);
    std::remove(path.c_str());

    ASSERT_TRUE(sets.ok()) << sets.error();
    ASSERT_EQ(sets->size(), 1u);
    EXPECT_EQ((*sets)[0].snmp->community, "c0re");
}

class CredentialProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sets = StaticCredentialProvider::parse(
            "a snmp comm-a\n"
            "a ssh user-a pass\n"
            "b snmp comm-b\n"
            "c telnet user-c pass\n");
        ASSERT_TRUE(sets.ok());
        for (const auto& set : *sets) {
            provider.addSet(set);
        }
    }

    StaticCredentialProvider provider;
};

TEST_F(CredentialProviderTest, AllSetsInInsertionOrder) {
    auto creds = provider.getCredentialsForDiscovery({});

    ASSERT_EQ(creds.snmp.size(), 2u);
    EXPECT_EQ(creds.snmp[0].community, "comm-a");
    EXPECT_EQ(creds.snmp[1].community, "comm-b");
    EXPECT_EQ(creds.ssh.size(), 1u);
    EXPECT_EQ(creds.telnet.size(), 1u);
}

TEST_F(CredentialProviderTest, RequestedOrderWinsAndUnknownIdsAreSkipped) {
    auto creds = provider.getCredentialsForDiscovery({"b", "missing", "a"});

    ASSERT_EQ(creds.snmp.size(), 2u);
    EXPECT_EQ(creds.snmp[0].setId, "b");
    EXPECT_EQ(creds.snmp[1].setId, "a");
    EXPECT_TRUE(creds.telnet.empty());
}

TEST_F(CredentialProviderTest, UnknownOnlyIsEmpty) {
    EXPECT_TRUE(provider.getCredentialsForDiscovery({"zzz"}).empty());
}
