/**
 * @file test_config.cpp
 * @brief Unit tests for client configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing
 * - Error handling
 * - Log level parsing
 */

#include <gtest/gtest.h>
#include <lumen/services/client_config.hpp>

#include <string>
#include <vector>

using namespace lumen::services;
using lumen::utils::LogLevel;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

    ClientConfig parse(const std::vector<std::string>& args) {
        auto [argc, argv] = makeArgs(args);
        return parseArgs(argc, argv.data());
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    ClientConfig config;

    EXPECT_EQ(config.transport.bind_address, "0.0.0.0");
    EXPECT_EQ(config.transport.bind_port, 38899);
    EXPECT_EQ(config.transport.discovery.broadcast_addr, "255.255.255.255");
    EXPECT_EQ(config.transport.discovery.broadcast_interval_ms, 500);
    EXPECT_EQ(config.transport.retry.max_retries, 3);
    EXPECT_EQ(config.transport.retry.initial_delay_ms, 200);
    EXPECT_EQ(config.transport.retry.max_delay_ms, 800);

    EXPECT_EQ(config.device.command_timeout_ms, 5000);
    EXPECT_EQ(config.device.discovery_timeout_ms, 5000);
    EXPECT_EQ(config.device.lookup_scan_ms, 2000);
    EXPECT_EQ(config.device.scan_mode, ScanMode::GetSystemConfig);

    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
}

// =============================================================================
// CLI Parsing
// =============================================================================

TEST_F(ConfigTest, NoArguments) {
    ClientConfig config = parse({"lumen"});
    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.transport.bind_port, 38899);
}

TEST_F(ConfigTest, TransportOptions) {
    ClientConfig config = parse({"lumen", "--bind", "192.168.1.10", "--port", "0",
                                 "--timeout", "1500", "--retries", "5",
                                 "--retry-delay", "100"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.transport.bind_address, "192.168.1.10");
    EXPECT_EQ(config.transport.bind_port, 0);
    EXPECT_EQ(config.device.command_timeout_ms, 1500);
    EXPECT_EQ(config.transport.retry.max_retries, 5);
    EXPECT_EQ(config.transport.retry.initial_delay_ms, 100);
    EXPECT_EQ(config.transport.retry.max_delay_ms, 400);
}

TEST_F(ConfigTest, DiscoveryOptions) {
    ClientConfig config = parse({"lumen", "--broadcast-addr", "192.168.1.255",
                                 "--broadcast-interval", "250",
                                 "--discovery-timeout", "3000",
                                 "--scan-mode", "registration",
                                 "--local-ip", "192.168.1.10",
                                 "--local-mac", "AA:BB:CC:DD:EE:FF"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.transport.discovery.broadcast_addr, "192.168.1.255");
    EXPECT_EQ(config.transport.discovery.broadcast_interval_ms, 250);
    EXPECT_EQ(config.device.discovery_timeout_ms, 3000);
    EXPECT_EQ(config.device.scan_mode, ScanMode::Registration);
    EXPECT_EQ(config.device.local_ip, "192.168.1.10");
    EXPECT_EQ(config.device.local_mac.toCompactString(), "aabbccddeeff");
}

TEST_F(ConfigTest, LogLevelOption) {
    ClientConfig config = parse({"lumen", "--log-level", "DEBUG"});
    EXPECT_EQ(config.log_level, "DEBUG");
}

TEST_F(ConfigTest, HelpFlags) {
    EXPECT_TRUE(parse({"lumen", "--help"}).help);
    EXPECT_TRUE(parse({"lumen", "-h"}).help);
    EXPECT_TRUE(parse({"lumen", "--port", "0", "--help"}).help);
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, MissingValue) {
    EXPECT_TRUE(parse({"lumen", "--port"}).help);
}

TEST_F(ConfigTest, UnknownOption) {
    EXPECT_TRUE(parse({"lumen", "--cluster", "x"}).help);
}

TEST_F(ConfigTest, InvalidNumbers) {
    EXPECT_TRUE(parse({"lumen", "--port", "abc"}).help);
    EXPECT_TRUE(parse({"lumen", "--port", "70000"}).help);
    EXPECT_TRUE(parse({"lumen", "--port", "-1"}).help);
    EXPECT_TRUE(parse({"lumen", "--timeout", "99999999999999"}).help);
}

TEST_F(ConfigTest, InvalidScanModeAndMac) {
    EXPECT_TRUE(parse({"lumen", "--scan-mode", "everything"}).help);
    EXPECT_TRUE(parse({"lumen", "--local-mac", "not-a-mac"}).help);
}

// =============================================================================
// Log Level Parsing
// =============================================================================

TEST_F(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("FATAL"), LogLevel::FATAL);
    EXPECT_EQ(parseLogLevel("OFF"), LogLevel::OFF);
}

TEST_F(ConfigTest, ParseLogLevelInvalid) {
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel(""), LogLevel::INFO);
}
