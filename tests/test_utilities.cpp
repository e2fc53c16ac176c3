/**
 * @file test_utilities.cpp
 * @brief Unit tests for common utility functions
 *
 * Tests utilities including:
 * - Logging initialization and concurrent logging
 * - Timestamp formatting
 * - SHA-256 hashing
 * - Hex, UTF-8 and JSON object helpers
 * - String helpers and environment lookup
 */

#include <gtest/gtest.h>
#include "agentid/utilities.hpp"
#include <cstdint>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace agentid::utilities;

// Test fixture for utilities tests
class UtilitiesTest : public ::testing::Test {
};

// ============================================================================
// Logging Tests
// ============================================================================

TEST_F(UtilitiesTest, InitializeConsoleLogging) {
    EXPECT_TRUE(initialize_logging("", LogLevel::DEBUG));
    log_debug("debug message");
    log_info("info message");
    log_warn("warn message");
}

TEST_F(UtilitiesTest, ReinitializeLogging) {
    EXPECT_TRUE(initialize_logging("", LogLevel::INFO));
    EXPECT_TRUE(initialize_logging("", LogLevel::ERROR));
    log_error("error message");
}

TEST_F(UtilitiesTest, ConcurrentLogging) {
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; t++) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 20; i++) {
                log(LogLevel::DEBUG, "thread " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    // Reconfigure while other threads log
    EXPECT_TRUE(initialize_logging("", LogLevel::WARN));

    for (auto& thread : threads) {
        thread.join();
    }
}

TEST_F(UtilitiesTest, LogLevelNames) {
    EXPECT_EQ(log_level_name(LogLevel::DEBUG), "debug");
    EXPECT_EQ(log_level_name(LogLevel::INFO), "info");
    EXPECT_EQ(log_level_name(LogLevel::WARN), "warn");
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "error");
    EXPECT_EQ(log_level_name(LogLevel::CRITICAL), "critical");
}

// ============================================================================
// Time Tests
// ============================================================================

TEST_F(UtilitiesTest, FormatTimestamp) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_timestamp(1700000000), "2023-11-14T22:13:20Z");
}

TEST_F(UtilitiesTest, FormatTimestampUpperBound) {
    EXPECT_EQ(format_timestamp(MAX_TIMESTAMP), "9999-12-31T23:59:59Z");
}

TEST_F(UtilitiesTest, FormatTimestampOutOfRangeIsEmpty) {
    EXPECT_EQ(format_timestamp(MAX_TIMESTAMP + 1), "");
    EXPECT_EQ(format_timestamp(100000000000000000ULL), "");
    EXPECT_EQ(format_timestamp(UINT64_MAX), "");
}

TEST_F(UtilitiesTest, CurrentTimestampIsRecent) {
    // 2024-01-01T00:00:00Z
    EXPECT_GT(get_current_timestamp(), 1704067200u);
}

// ============================================================================
// Hashing Tests
// ============================================================================

TEST_F(UtilitiesTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(UtilitiesTest, Sha256HandlesBinaryInput) {
    std::string with_nul("a\0b", 3);

    EXPECT_NE(sha256_hex(with_nul), sha256_hex("a"));
    EXPECT_EQ(sha256_hex(with_nul).size(), 64u);
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST_F(UtilitiesTest, HexConversion) {
    EXPECT_EQ(bytes_to_hex(std::string("\x00\x7f\xff", 3)), "007fff");
    EXPECT_EQ(bytes_to_hex(""), "");

    auto bytes = hex_to_bytes("007FfF");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, std::string("\x00\x7f\xff", 3));
}

TEST_F(UtilitiesTest, HexRejectsMalformedInput) {
    EXPECT_FALSE(hex_to_bytes("abc").has_value());
    EXPECT_FALSE(hex_to_bytes("0g").has_value());
    EXPECT_FALSE(hex_to_bytes("+f").has_value());
    EXPECT_FALSE(hex_to_bytes("0x").has_value());
}

TEST_F(UtilitiesTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8(std::string("a\0b", 3)));
    EXPECT_TRUE(is_valid_utf8("\xC3\xA9"));                // U+00E9
    EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC"));            // U+20AC
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\xA4\x96"));        // U+1F916
    EXPECT_TRUE(is_valid_utf8("\xF4\x8F\xBF\xBF"));        // U+10FFFF

    EXPECT_FALSE(is_valid_utf8("\xFF"));
    EXPECT_FALSE(is_valid_utf8("\x80"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));                // overlong
    EXPECT_FALSE(is_valid_utf8("\xE0\x80\xAF"));            // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));            // surrogate
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));        // above U+10FFFF
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));                // truncated
}

TEST_F(UtilitiesTest, NormalizeJsonObject) {
    auto normalized = normalize_json_object("{ \"b\": 1,  \"a\": [true] }");
    ASSERT_TRUE(normalized.has_value());
    EXPECT_EQ(*normalized, "{\"a\":[true],\"b\":1}");

    EXPECT_FALSE(normalize_json_object("[1]").has_value());
    EXPECT_FALSE(normalize_json_object("\"text\"").has_value());
    EXPECT_FALSE(normalize_json_object("{broken").has_value());
}

// ============================================================================
// String Tests
// ============================================================================

TEST_F(UtilitiesTest, TrimString) {
    EXPECT_EQ(trim_string("  hello  "), "hello");
    EXPECT_EQ(trim_string("\t\nvalue\r\n"), "value");
    EXPECT_EQ(trim_string("   "), "");
    EXPECT_EQ(trim_string(""), "");
}

TEST_F(UtilitiesTest, ToLowercase) {
    EXPECT_EQ(to_lowercase("MiXeD-123"), "mixed-123");
}

TEST_F(UtilitiesTest, GetEnv) {
    setenv("AGENTID_TEST_VAR", "value", 1);
    EXPECT_EQ(get_env("AGENTID_TEST_VAR"), "value");

    setenv("AGENTID_TEST_VAR", "", 1);
    EXPECT_EQ(get_env("AGENTID_TEST_VAR", "fallback"), "fallback");

    unsetenv("AGENTID_TEST_VAR");
    EXPECT_EQ(get_env("AGENTID_TEST_VAR", "fallback"), "fallback");
    EXPECT_EQ(get_env("AGENTID_TEST_VAR"), "");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
