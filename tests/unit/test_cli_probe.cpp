/**
 * @file test_cli_probe.cpp
 * @brief Unit tests for CLI login and platform decoding
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/probe/cli_probe.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace netmap::probe;
using namespace netmap::core;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

/// What a scripted device answers and what it was asked.
struct DeviceScript {
    std::string password = "s3cret";
    std::map<std::string, std::string> outputs;
    std::vector<std::string> executed;
    int opened = 0;
    int closed = 0;
};

class ScriptedCliSession : public CliSession {
public:
    explicit ScriptedCliSession(std::shared_ptr<DeviceScript> script) : script_(std::move(script)) {}

    Result<bool> open(const std::string&, const LoginCredential& credential,
                      std::chrono::milliseconds) override {
        ++script_->opened;
        if (credential.password != script_->password) {
            return Result<bool>::failure("authentication failed");
        }
        return Result<bool>::success(true);
    }

    Result<std::string> execute(const std::string& command) override {
        script_->executed.push_back(command);
        auto it = script_->outputs.find(command);
        if (it == script_->outputs.end()) {
            return Result<std::string>::failure("% Invalid input detected");
        }
        return Result<std::string>::success(it->second);
    }

    void close() override { ++script_->closed; }

private:
    std::shared_ptr<DeviceScript> script_;
};

const char* CISCO_VERSION =
    "Cisco IOS Software, C2960X Software (C2960X-UNIVERSALK9-M), Version 15.2(2)E7, RELEASE SOFTWARE (fc3)\n"
    "edge-sw3 uptime is 4 hours, 1 minute\n"
    "cisco WS-C2960X-24TS-L (APM86XXX) processor (revision D0) with 524288K bytes of memory.\n";

}  // namespace

class CliProbeTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = std::make_shared<DeviceScript>();
        script->outputs["terminal length 0"] = "";
        login.username = "admin";
        login.password = "s3cret";
    }

    CliProbe makeProbe() {
        auto shared = script;
        return CliProbe([shared](Protocol protocol) -> std::unique_ptr<CliSession> {
                            if (protocol == Protocol::SNMP) {
                                return nullptr;
                            }
                            return std::make_unique<ScriptedCliSession>(shared);
                        },
                        PlatformDecoderRegistry::withBuiltins());
    }

    std::shared_ptr<DeviceScript> script;
    LoginCredential login;
    const std::chrono::milliseconds timeout{1000};
};

TEST_F(CliProbeTest, CiscoDeviceIsDecoded) {
    script->outputs["show version"] = CISCO_VERSION;
    script->outputs[CiscoIosDecoder::SHOW_VLAN_BRIEF] = "10   users   active\n";
    script->outputs[CiscoIosDecoder::SHOW_CDP_NEIGHBORS] =
        "Device ID: core-sw1\n"
        "  IP address: 10.0.0.1\n"
        "Interface: GigabitEthernet0/24,  Port ID (outgoing port): GigabitEthernet1/0/3\n";

    auto result = makeProbe().probe("10.0.0.3", Protocol::SSH, login, timeout);

    ASSERT_TRUE(result.accessible) << result.error;
    EXPECT_EQ(result.facts.vendor, "cisco");
    EXPECT_EQ(result.facts.hostname, "edge-sw3");
    EXPECT_EQ(result.facts.model, "WS-C2960X-24TS-L");
    EXPECT_EQ(result.facts.osVersion, "15.2(2)E7");
    EXPECT_EQ(result.facts.system.uptimeSeconds, 4u * 3600 + 60);

    ASSERT_EQ(result.facts.vlans.size(), 1u);
    ASSERT_EQ(result.facts.neighbors.size(), 1u);
    EXPECT_EQ(result.facts.neighbors[0].fromIp, "10.0.0.3");
    EXPECT_EQ(result.facts.neighbors[0].toIp, "10.0.0.1");

    // Paging first, then the banner, then every decoder command
    ASSERT_EQ(script->executed.size(), 9u);
    EXPECT_EQ(script->executed[0], "terminal length 0");
    EXPECT_EQ(script->executed[1], "show version");
    EXPECT_EQ(script->closed, 1);
}

TEST_F(CliProbeTest, UnknownPlatformReadsBannerOnly) {
    script->outputs["show version"] = "Linux gw 5.15.0 Version 5.15.0\n";

    auto result = makeProbe().probe("10.0.0.9", Protocol::TELNET, login, timeout);

    ASSERT_TRUE(result.accessible);
    EXPECT_TRUE(result.facts.vendor.empty());
    EXPECT_EQ(result.facts.osVersion, "5.15.0");
    EXPECT_THAT(script->executed, ElementsAre("terminal length 0", "show version"));
}

TEST_F(CliProbeTest, LoginFailureIsNotAccessible) {
    login.password = "wrong";

    auto result = makeProbe().probe("10.0.0.3", Protocol::SSH, login, timeout);

    EXPECT_FALSE(result.accessible);
    EXPECT_EQ(result.error, "authentication failed");
    EXPECT_TRUE(script->executed.empty());
}

TEST_F(CliProbeTest, ShowVersionFailureIsNotAccessible) {
    auto result = makeProbe().probe("10.0.0.3", Protocol::SSH, login, timeout);

    EXPECT_FALSE(result.accessible);
    EXPECT_THAT(result.error, HasSubstr("show version failed"));
    EXPECT_EQ(script->closed, 1);
}

TEST_F(CliProbeTest, FailedCommandsAreSkipped) {
    script->outputs["show version"] = CISCO_VERSION;
    script->outputs.erase("terminal length 0");

    auto result = makeProbe().probe("10.0.0.3", Protocol::SSH, login, timeout);

    ASSERT_TRUE(result.accessible);
    EXPECT_TRUE(result.facts.interfaces.empty());
    EXPECT_THAT(script->executed, Contains(std::string(CiscoIosDecoder::SHOW_IP_ROUTE)));
}

TEST_F(CliProbeTest, MissingTransport) {
    auto result = makeProbe().probe("10.0.0.3", Protocol::SNMP, login, timeout);

    EXPECT_FALSE(result.accessible);
    EXPECT_EQ(result.error, "snmp transport not available");
    EXPECT_EQ(script->opened, 0);
}

TEST(CliProbeFactoryTest, DefaultFactoryProvidesTelnet) {
    auto factory = defaultSessionFactory();

    EXPECT_NE(factory(Protocol::TELNET), nullptr);
    EXPECT_EQ(factory(Protocol::SNMP), nullptr);
}
