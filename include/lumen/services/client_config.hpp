/**
 * @file client_config.hpp
 * @brief Client configuration and command-line parsing for embedding
 *        applications.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/udp_transport.hpp"
#include "lumen/services/device_service.hpp"
#include "lumen/utils/logger.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace lumen {
namespace services {

/**
 * @brief Aggregated configuration of a client process.
 */
struct ClientConfig {
    core::TransportConfig transport;
    DeviceServiceConfig device;
    std::string log_level = "INFO";
    bool help = false;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "Lumen - Networked lighting control client\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Transport Options:\n"
              << "  --bind <addr>                Local bind address (default: 0.0.0.0)\n"
              << "  --port <port>                Local UDP port, 0 = ephemeral (default: 38899)\n"
              << "  --timeout <ms>               Per-attempt command timeout (default: 5000)\n"
              << "  --retries <n>                Retries after a failed attempt (default: 3)\n"
              << "  --retry-delay <ms>           Delay before the first retry, doubled each time (default: 200)\n"
              << "\nDiscovery Options:\n"
              << "  --broadcast-addr <addr>      Discovery destination (default: 255.255.255.255)\n"
              << "  --broadcast-interval <ms>    Re-broadcast period (default: 500)\n"
              << "  --discovery-timeout <ms>     Sweep duration (default: 5000)\n"
              << "  --scan-mode <mode>           getPilot, getSystemConfig, registration (default: getSystemConfig)\n"
              << "  --local-ip <addr>            Address announced in registration scans\n"
              << "  --local-mac <mac>            Hardware address announced in registration scans\n"
              << "\n  --log-level <level>          Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "  --help                       Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --port 0 --discovery-timeout 3000 --log-level DEBUG\n"
              << "  " << program_name << " --scan-mode registration --local-ip 192.168.1.10 --local-mac AA:BB:CC:DD:EE:FF\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set on --help or on any error
 */
inline ClientConfig parseArgs(int argc, char* argv[]) {
    ClientConfig config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--bind") == 0) {
                config.transport.bind_address = value;
            } else if (std::strcmp(arg, "--port") == 0) {
                int port = std::stoi(value);
                if (port < 0 || port > 65535) {
                    throw std::out_of_range("port");
                }
                config.transport.bind_port = static_cast<uint16_t>(port);
            } else if (std::strcmp(arg, "--broadcast-addr") == 0) {
                config.transport.discovery.broadcast_addr = value;
            } else if (std::strcmp(arg, "--broadcast-interval") == 0) {
                config.transport.discovery.broadcast_interval_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--timeout") == 0) {
                config.device.command_timeout_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--discovery-timeout") == 0) {
                config.device.discovery_timeout_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--retries") == 0) {
                config.transport.retry.max_retries = std::stoi(value);
            } else if (std::strcmp(arg, "--retry-delay") == 0) {
                config.transport.retry.initial_delay_ms = std::stoi(value);
                config.transport.retry.max_delay_ms = config.transport.retry.initial_delay_ms * 4;
            } else if (std::strcmp(arg, "--local-ip") == 0) {
                config.device.local_ip = value;
            } else if (std::strcmp(arg, "--local-mac") == 0) {
                auto mac = core::MacAddress::parse(value);
                if (!mac) {
                    std::cerr << "Error: Invalid hardware address " << value << "\n";
                    config.help = true;
                    return config;
                }
                config.device.local_mac = *mac;
            } else if (std::strcmp(arg, "--scan-mode") == 0) {
                auto mode = parseScanMode(value);
                if (!mode) {
                    std::cerr << "Error: Unknown scan mode " << value << "\n";
                    config.help = true;
                    return config;
                }
                config.device.scan_mode = *mode;
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                return config;
            }
        } catch (const std::logic_error&) {
            // std::stoi throws invalid_argument / out_of_range
            std::cerr << "Error: Invalid value for " << arg << ": " << value << "\n";
            config.help = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level string
 * @return LogLevel value (defaults to INFO if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    if (level_str == "TRACE") return utils::LogLevel::TRACE;
    if (level_str == "DEBUG") return utils::LogLevel::DEBUG;
    if (level_str == "INFO") return utils::LogLevel::INFO;
    if (level_str == "WARN") return utils::LogLevel::WARN;
    if (level_str == "ERROR") return utils::LogLevel::ERROR;
    if (level_str == "FATAL") return utils::LogLevel::FATAL;
    if (level_str == "OFF") return utils::LogLevel::OFF;
    return utils::LogLevel::INFO;
}

}  // namespace services
}  // namespace lumen
