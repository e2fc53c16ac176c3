/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for AgentID
 *
 * AgentID SDK - Agent Commerce Kit Identity
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentid/utilities.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

// OpenSSL for SHA-256
#include <openssl/evp.h>

namespace agentid {
namespace utilities {

namespace {
    // Global logger instance, guarded by g_logger_mutex
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    // Convert LogLevel to spdlog level
    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    // Caller must hold g_logger_mutex
    bool install_logger(const std::string& log_file, LogLevel level) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink (colored)
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(level));
            sinks.push_back(console_sink);

            // File sink (rotating, 10MB per file, 3 files max)
            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, 1024 * 1024 * 10, 3);
                file_sink->set_level(to_spdlog_level(level));
                sinks.push_back(file_sink);
            }

            auto logger = std::make_shared<spdlog::logger>("agentid", sinks.begin(), sinks.end());
            logger->set_level(to_spdlog_level(level));
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

            // Register as default logger
            spdlog::set_default_logger(logger);
            g_logger = logger;
            return true;

        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
            return false;
        }
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

bool initialize_logging(const std::string& log_file, LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return install_logger(log_file, level);
}

void log(LogLevel level, const std::string& message) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (!g_logger) {
            install_logger("", LogLevel::INFO);
        }
        logger = g_logger;
    }

    if (!logger) {
        std::fprintf(stderr, "%s\n", message.c_str());
        return;
    }

    switch (level) {
        case LogLevel::DEBUG:    logger->debug(message); break;
        case LogLevel::INFO:     logger->info(message); break;
        case LogLevel::WARN:     logger->warn(message); break;
        case LogLevel::ERROR:    logger->error(message); break;
        case LogLevel::CRITICAL: logger->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "debug";
        case LogLevel::INFO:     return "info";
        case LogLevel::WARN:     return "warn";
        case LogLevel::ERROR:    return "error";
        case LogLevel::CRITICAL: return "critical";
        default:                 return "info";
    }
}

// ============================================================================
// TIME FORMATTING FUNCTIONS
// ============================================================================

std::string format_timestamp(uint64_t timestamp) {
    if (timestamp > MAX_TIMESTAMP) {
        log_error("Timestamp out of range: " + std::to_string(timestamp));
        return std::string();
    }

    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;

#ifdef _WIN32
    bool converted = gmtime_s(&tm_buf, &time) == 0;
#else
    bool converted = gmtime_r(&time, &tm_buf) != nullptr;
#endif

    if (!converted) {
        log_error("Failed to convert timestamp: " + std::to_string(timestamp));
        return std::string();
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

uint64_t get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(duration).count());
}

// ============================================================================
// HASHING
// ============================================================================

std::string sha256_hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_length, EVP_sha256(), nullptr) != 1) {
        log_error("SHA-256 digest failed");
        return std::string();
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_length; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(hash[i]);
    }

    return oss.str();
}

// ============================================================================
// ENCODING FUNCTIONS
// ============================================================================

std::string bytes_to_hex(const std::string& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::optional<std::string> hex_to_bytes(const std::string& hex) {
    // Hex string must have even length
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    auto nibble = [](char ch) -> int {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    };

    std::string bytes;
    bytes.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = nibble(hex[i]);
        int low = nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<char>((high << 4) | low));
    }

    return bytes;
}

bool is_valid_utf8(const std::string& str) {
    size_t i = 0;
    const size_t n = str.size();

    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(str[i]);
        if (lead < 0x80) {
            i++;
            continue;
        }

        // Continuation count and allowed range of the first continuation byte
        size_t count = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            count = 1;
        } else if (lead == 0xE0) {
            count = 2;
            lo = 0xA0;
        } else if (lead == 0xED) {
            count = 2;
            hi = 0x9F;
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            count = 2;
        } else if (lead == 0xF0) {
            count = 3;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            count = 3;
        } else if (lead == 0xF4) {
            count = 3;
            hi = 0x8F;
        } else {
            return false;
        }

        if (n - i - 1 < count) {
            return false;
        }

        for (size_t k = 1; k <= count; k++) {
            unsigned char cont = static_cast<unsigned char>(str[i + k]);
            if (cont < lo || cont > hi) {
                return false;
            }
            lo = 0x80;
            hi = 0xBF;
        }

        i += count + 1;
    }

    return true;
}

std::optional<std::string> normalize_json_object(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);

    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    return j.dump();
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

// ============================================================================
// SYSTEM FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return (value && *value) ? std::string(value) : default_value;
}

} // namespace utilities
} // namespace agentid
