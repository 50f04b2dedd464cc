/**
 * @file cli_session.cpp
 * @brief Prompt handling shared by the Telnet and SSH sessions.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/cli_session.hpp"
#include "netmap/utils/logger.hpp"
#include "netmap/utils/string_utils.hpp"

#include <regex>

namespace netmap {
namespace probe {

namespace {

constexpr size_t MAX_PROMPT_LENGTH = 80;

std::string lastLine(const std::string& text) {
    auto pos = text.find_last_of('\n');
    std::string line = pos == std::string::npos ? text : text.substr(pos + 1);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

bool hasMorePrompt(const std::string& text) {
    return lastLine(text).find("--More--") != std::string::npos;
}

}  // namespace

bool endsWithPrompt(const std::string& text) {
    std::string line = utils::trim(lastLine(text));
    if (line.empty() || line.size() > MAX_PROMPT_LENGTH) {
        return false;
    }
    static const std::regex pattern(R"([>#$%]$)");
    return std::regex_search(line, pattern) && !endsWithPasswordPrompt(text);
}

bool endsWithLoginPrompt(const std::string& text) {
    static const std::regex pattern(R"((login|username|user name)\s*:?$)", std::regex::icase);
    return std::regex_search(lastLine(text), pattern);
}

bool endsWithPasswordPrompt(const std::string& text) {
    static const std::regex pattern(R"(password\s*:?$)", std::regex::icase);
    return std::regex_search(lastLine(text), pattern);
}

bool looksLikeAuthFailure(const std::string& text) {
    static const std::regex pattern(
        R"(login invalid|login incorrect|authentication failed|access denied|bad passwords?)",
        std::regex::icase);
    return std::regex_search(text, pattern);
}

std::string cleanCommandOutput(const std::string& raw, const std::string& command) {
    std::string text;
    text.reserve(raw.size());
    for (char c : raw) {
        if (c == '\b') {
            if (!text.empty()) text.pop_back();
        } else if (c != '\r' && c != '\0') {
            text.push_back(c);
        }
    }

    auto lines = utils::split_lines(text);
    size_t begin = 0;
    size_t end = lines.size();
    if (begin < end && !command.empty() && lines[begin].find(command) != std::string::npos) {
        ++begin;
    }
    if (end > begin && endsWithPrompt(lines[end - 1])) {
        --end;
    }

    std::string out;
    for (size_t i = begin; i < end; ++i) {
        if (lines[i].find("--More--") != std::string::npos) {
            continue;
        }
        out += lines[i];
        out += '\n';
    }
    return out;
}

StreamCliSession::StreamCliSession(const char* newline)
    : newline_(newline)
{
}

core::Result<std::string> StreamCliSession::readUntil(Matcher match,
                                                      std::chrono::milliseconds timeout) {
    using R = core::Result<std::string>;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!match(buffer_)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return R::failure("timed out waiting for device prompt");
        }
        int remaining = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

        int n = readChunk(buffer_, remaining);
        if (n < 0) {
            return R::failure("connection closed by device");
        }
        if (n > 0 && hasMorePrompt(buffer_)) {
            if (!writeAll(" ")) {
                return R::failure("write failed");
            }
        }
    }

    std::string consumed;
    consumed.swap(buffer_);
    return R::success(std::move(consumed));
}

core::Result<std::string> StreamCliSession::execute(const std::string& command) {
    using R = core::Result<std::string>;
    buffer_.clear();
    if (!writeAll(command + newline_)) {
        return R::failure("write failed");
    }

    auto raw = readUntil(&endsWithPrompt, timeout_);
    if (!raw) {
        return raw;
    }
    LOG_TRACE("CliSession", "'{}' returned {} byte(s)", command, raw->size());
    return R::success(cleanCommandOutput(*raw, command));
}

}  // namespace probe
}  // namespace netmap
