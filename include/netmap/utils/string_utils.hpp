/**
 * @file string_utils.hpp
 * @brief String helpers shared by the probes, decoders and configuration.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace netmap {
namespace utils {

/**
 * @brief Convert string to lowercase
 * @param str Input string
 * @return Lowercase version of the string
 */
inline std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Trim whitespace from both ends of a string
 * @param str Input string
 * @return Trimmed string
 */
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Split string by delimiter, dropping empty tokens
 * @param str Input string
 * @param delimiter Character to split on
 * @return Vector of tokens
 */
inline std::vector<std::string> split(const std::string& str, char delimiter = ' ') {
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;
    while (std::getline(stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

/**
 * @brief Split on any run of whitespace
 */
inline std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

/**
 * @brief Split text into lines, stripping trailing carriage returns
 */
inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

/**
 * @brief Check if string starts with prefix
 */
inline bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Case-insensitive substring test
 */
inline bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

/**
 * @brief Join strings with delimiter
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& delimiter = " ") {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter + parts[i];
    }
    return result;
}

/**
 * @brief Check for a dotted-quad IPv4 address ("10.0.0.1")
 */
inline bool is_ipv4(const std::string& str) {
    auto octets = split(str, '.');
    if (octets.size() != 4 || std::count(str.begin(), str.end(), '.') != 3) {
        return false;
    }
    for (const auto& octet : octets) {
        if (octet.empty() || octet.size() > 3) return false;
        if (!std::all_of(octet.begin(), octet.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        if (std::stoi(octet) > 255) return false;
    }
    return true;
}

}  // namespace utils
}  // namespace netmap
