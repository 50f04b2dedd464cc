/**
 * @file test_cli_session.cpp
 * @brief Unit tests for prompt handling and Telnet negotiation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/probe/cli_session.hpp>
#include <netmap/probe/telnet_session.hpp>

#include <deque>
#include <string>
#include <vector>

using namespace netmap::probe;
using netmap::core::LoginCredential;
using netmap::core::Result;
using ::testing::ElementsAre;

namespace {

/// Replays canned device output and records what was written.
class ScriptedSession : public StreamCliSession {
public:
    explicit ScriptedSession(std::vector<std::string> chunks)
        : StreamCliSession("\n")
        , chunks_(chunks.begin(), chunks.end())
    {
        timeout_ = std::chrono::milliseconds(500);
    }

    Result<bool> open(const std::string&, const LoginCredential&,
                      std::chrono::milliseconds) override {
        return Result<bool>::success(true);
    }

    void close() override {}

    std::vector<std::string> written;

protected:
    int readChunk(std::string& out, int) override {
        if (chunks_.empty()) {
            return -1;
        }
        std::string chunk = chunks_.front();
        chunks_.pop_front();
        out += chunk;
        return static_cast<int>(chunk.size());
    }

    bool writeAll(const std::string& data) override {
        written.push_back(data);
        return true;
    }

private:
    std::deque<std::string> chunks_;
};

std::string bytes(std::initializer_list<int> values) {
    std::string out;
    for (int v : values) {
        out.push_back(static_cast<char>(v));
    }
    return out;
}

}  // namespace

// =============================================================================
// Prompt matching
// =============================================================================

TEST(CliSessionTest, CommandPrompts) {
    EXPECT_TRUE(endsWithPrompt("banner\r\nsw1#"));
    EXPECT_TRUE(endsWithPrompt("Router>"));
    EXPECT_TRUE(endsWithPrompt("fw01 > "));
    EXPECT_TRUE(endsWithPrompt("admin@gw:~$"));
    EXPECT_FALSE(endsWithPrompt("Password:"));
    EXPECT_FALSE(endsWithPrompt("line one\nstill running"));
    EXPECT_FALSE(endsWithPrompt(""));
    EXPECT_FALSE(endsWithPrompt(std::string(100, 'x') + "#"));
}

TEST(CliSessionTest, LoginAndPasswordPrompts) {
    EXPECT_TRUE(endsWithLoginPrompt("\r\nUser Access Verification\r\n\r\nUsername: "));
    EXPECT_TRUE(endsWithLoginPrompt("core-sw login:"));
    EXPECT_FALSE(endsWithLoginPrompt("Password:"));

    EXPECT_TRUE(endsWithPasswordPrompt("Password: "));
    EXPECT_TRUE(endsWithPasswordPrompt("admin's PASSWORD:"));
    EXPECT_FALSE(endsWithPasswordPrompt("sw1#"));
}

TEST(CliSessionTest, AuthFailureBanners) {
    EXPECT_TRUE(looksLikeAuthFailure("% Login invalid\r\n\r\nUsername:"));
    EXPECT_TRUE(looksLikeAuthFailure("Login incorrect"));
    EXPECT_TRUE(looksLikeAuthFailure("% Authentication failed"));
    EXPECT_TRUE(looksLikeAuthFailure("% Bad passwords"));
    EXPECT_FALSE(looksLikeAuthFailure("sw1#"));
}

TEST(CliSessionTest, CleanCommandOutput) {
    std::string raw =
        "show vlan brief\r\n"
        "VLAN Name     Status\r\n"
        "1    default  active\r\n"
        " --More-- \b\b\b\b\b\b\b\b\b\b"
        "10   users    active\r\n"
        "sw1#";

    EXPECT_EQ(cleanCommandOutput(raw, "show vlan brief"),
              "VLAN Name     Status\n"
              "1    default  active\n"
              "10   users    active\n");
}

TEST(CliSessionTest, CleanCommandOutputWithoutEcho) {
    EXPECT_EQ(cleanCommandOutput("data\nsw1#", "show clock"), "data\n");
    EXPECT_EQ(cleanCommandOutput("", "show clock"), "");
}

// =============================================================================
// StreamCliSession
// =============================================================================

TEST(StreamCliSessionTest, ExecuteReadsUntilPrompt) {
    ScriptedSession session({"show clock\r\n*10:00:01.123 UTC", " Mon Mar 4 2024\r\n", "sw1#"});

    auto output = session.execute("show clock");

    ASSERT_TRUE(output.ok()) << output.error();
    EXPECT_EQ(*output, "*10:00:01.123 UTC Mon Mar 4 2024\n");
    EXPECT_THAT(session.written, ElementsAre("show clock\n"));
}

TEST(StreamCliSessionTest, PagerIsAnswered) {
    ScriptedSession session({"show run\r\nline1\r\n --More-- ", "\r\nline2\r\nsw1#"});

    auto output = session.execute("show run");

    ASSERT_TRUE(output.ok()) << output.error();
    EXPECT_EQ(*output, "line1\nline2\n");
    EXPECT_THAT(session.written, ElementsAre("show run\n", " "));
}

TEST(StreamCliSessionTest, ClosedConnectionFails) {
    ScriptedSession session({"show version\r\npartial"});

    auto output = session.execute("show version");

    ASSERT_FALSE(output.ok());
    EXPECT_EQ(output.error(), "connection closed by device");
}

// =============================================================================
// TelnetFilter
// =============================================================================

TEST(TelnetFilterTest, PlainDataPassesThrough) {
    TelnetFilter filter;
    std::string replies;
    EXPECT_EQ(filter.feed("Username: ", replies), "Username: ");
    EXPECT_TRUE(replies.empty());
}

TEST(TelnetFilterTest, RefusesEveryOption) {
    TelnetFilter filter;
    std::string replies;

    // IAC DO ECHO, IAC WILL SGA, IAC DONT NAWS, IAC WONT LINEMODE
    std::string data = bytes({255, 253, 1, 255, 251, 3, 255, 254, 31, 255, 252, 34}) + "login:";
    EXPECT_EQ(filter.feed(data, replies), "login:");
    EXPECT_EQ(replies, bytes({255, 252, 1, 255, 254, 3}));
}

TEST(TelnetFilterTest, SubnegotiationIsDropped) {
    TelnetFilter filter;
    std::string replies;

    std::string data = "a" + bytes({255, 250, 24, 1, 255, 240}) + "b";
    EXPECT_EQ(filter.feed(data, replies), "ab");
    EXPECT_TRUE(replies.empty());
}

TEST(TelnetFilterTest, EscapedIacIsData) {
    TelnetFilter filter;
    std::string replies;
    EXPECT_EQ(filter.feed(bytes({'x', 255, 255, 'y'}), replies), bytes({'x', 255, 'y'}));
}

TEST(TelnetFilterTest, SequenceSplitAcrossReads) {
    TelnetFilter filter;
    std::string replies;

    EXPECT_EQ(filter.feed("ab" + bytes({255}), replies), "ab");
    EXPECT_EQ(filter.feed(bytes({253}), replies), "");
    EXPECT_EQ(filter.feed(bytes({24}) + "cd", replies), "cd");
    EXPECT_EQ(replies, bytes({255, 252, 24}));
}
