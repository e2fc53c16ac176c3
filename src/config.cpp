/**
 * @file config.cpp
 * @brief Implementation of environment-driven configuration
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/config.hpp"

namespace agentid {
namespace config {

std::optional<utilities::LogLevel> parse_log_level(const std::string& text) {
    std::string name = utilities::to_lowercase(utilities::trim_string(text));

    if (name == "debug")                        return utilities::LogLevel::DEBUG;
    if (name == "info")                         return utilities::LogLevel::INFO;
    if (name == "warn" || name == "warning")    return utilities::LogLevel::WARN;
    if (name == "error")                        return utilities::LogLevel::ERROR;
    if (name == "critical")                     return utilities::LogLevel::CRITICAL;

    return std::nullopt;
}

Settings load() {
    Settings settings;

    std::string level_text = utilities::get_env(LOG_LEVEL_ENV);
    if (!level_text.empty()) {
        auto level = parse_log_level(level_text);
        if (level) {
            settings.log_level = *level;
        } else {
            settings.rejected_log_level = level_text;
        }
    }

    settings.log_file = utilities::get_env(LOG_FILE_ENV);

    return settings;
}

bool initialize_logging_from_environment() {
    Settings settings = load();

    if (!utilities::initialize_logging(settings.log_file, settings.log_level)) {
        return false;
    }

    // Reported only now that a logger exists
    if (!settings.rejected_log_level.empty()) {
        utilities::log_warn(std::string("Ignoring unknown ") + LOG_LEVEL_ENV + " value '" +
                            settings.rejected_log_level + "', using " +
                            utilities::log_level_name(settings.log_level));
    }

    return true;
}

} // namespace config
} // namespace agentid
