/**
 * @file logger.cpp
 * @brief Logger support functions.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/utils/logger.hpp"

#include <algorithm>
#include <cctype>

namespace netmap {
namespace utils {

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    if (upper == "OFF" || upper == "NONE") return LogLevel::OFF;
    return LogLevel::INFO;
}

}  // namespace utils
}  // namespace netmap
