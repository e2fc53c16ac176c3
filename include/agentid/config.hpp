/**
 * @file config.hpp
 * @brief Runtime configuration for AgentID
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Settings are read from the environment:
 * - AGENTID_LOG_LEVEL (debug, info, warn, error, critical)
 * - AGENTID_LOG_FILE  (rotating log file, empty for console only)
 */

#pragma once

#include "agentid/utilities.hpp"
#include <optional>
#include <string>

namespace agentid {
namespace config {

/// Environment variable selecting the minimum log level
constexpr const char* LOG_LEVEL_ENV = "AGENTID_LOG_LEVEL";

/// Environment variable naming the log file
constexpr const char* LOG_FILE_ENV = "AGENTID_LOG_FILE";

/// Log level used when none (or an unknown one) is configured
constexpr utilities::LogLevel DEFAULT_LOG_LEVEL = utilities::LogLevel::INFO;

/**
 * @brief Effective runtime settings
 */
struct Settings {
    utilities::LogLevel log_level = DEFAULT_LOG_LEVEL;   ///< Minimum log level
    std::string log_file;                                ///< Empty for console only
    std::string rejected_log_level;                      ///< Unrecognized AGENTID_LOG_LEVEL value, if any
};

/**
 * @brief Parse a log level name
 * @param text Level name, case-insensitive ("warning" is accepted as warn)
 * @return Level, or std::nullopt if unrecognized
 */
std::optional<utilities::LogLevel> parse_log_level(const std::string& text);

/**
 * @brief Read settings from the environment
 * @return Settings with defaults filled in
 */
Settings load();

/**
 * @brief Initialize logging from load()
 * @return true if the logger was installed
 */
bool initialize_logging_from_environment();

} // namespace config
} // namespace agentid
