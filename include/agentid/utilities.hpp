/**
 * @file utilities.hpp
 * @brief Common utility functions for AgentID
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout AgentID:
 * - Logging and error reporting
 * - Time formatting
 * - String manipulation
 * - Hashing
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentid {
namespace utilities {

/**
 * @brief Log levels for AgentID logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 * @return true if the logger was installed, false otherwise
 */
bool initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Log a message with specified level
 *
 * Installs a console logger on first use if none is configured.
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Name of a log level (e.g. "info")
 */
std::string log_level_name(LogLevel level);

/// Largest timestamp format_timestamp accepts (9999-12-31T23:59:59Z)
constexpr uint64_t MAX_TIMESTAMP = 253402300799ULL;

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp Unix timestamp (seconds since epoch)
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z"), or empty string
 *         if timestamp is above MAX_TIMESTAMP or cannot be converted
 */
std::string format_timestamp(uint64_t timestamp);

/**
 * @brief Current Unix timestamp in seconds
 */
uint64_t get_current_timestamp();

/**
 * @brief SHA-256 of a string
 * @param data Bytes to hash
 * @return Lowercase hex digest (64 characters)
 */
std::string sha256_hex(const std::string& data);

/**
 * @brief Convert bytes to hexadecimal string
 */
std::string bytes_to_hex(const std::string& bytes);

/**
 * @brief Convert hexadecimal string to bytes
 * @return Bytes, or std::nullopt if hex has odd length or non-hex digits
 */
std::optional<std::string> hex_to_bytes(const std::string& hex);

/**
 * @brief Check that a byte string is well-formed UTF-8
 *
 * Overlong forms, surrogates and code points above U+10FFFF are rejected.
 */
bool is_valid_utf8(const std::string& str);

/**
 * @brief Parse JSON object text into its compact form
 * @return Compact JSON, or std::nullopt if text is not a JSON object
 */
std::optional<std::string> normalize_json_object(const std::string& text);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set or empty
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace agentid
