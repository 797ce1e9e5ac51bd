/**
 * @file traffic_log.cpp
 * @brief Datagram traffic logging implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/utils/traffic_log.hpp"
#include "lumen/utils/logger.hpp"

namespace lumen {
namespace utils {

std::string formatTraffic(const std::string& text, bool inbound,
                          const std::string& localAddr,
                          const std::string& remoteAddr) {
    std::string line = "LOCAL: " + localAddr;
    line += inbound ? " <= " : " => ";
    line += "REMOTE: " + remoteAddr;
    line += inbound ? " - Received: " : " - Sent: ";
    line += text;
    return line;
}

void logInput(const std::string& text,
              const std::string& localAddr,
              const std::string& remoteAddr) {
    if (!Logger::instance().isEnabled(LogLevel::DEBUG)) {
        return;
    }
    LOG_DEBUG("Traffic", "{}", formatTraffic(text, true, localAddr, remoteAddr));
}

void logOutput(const std::string& text,
               const std::string& localAddr,
               const std::string& remoteAddr) {
    if (!Logger::instance().isEnabled(LogLevel::DEBUG)) {
        return;
    }
    LOG_DEBUG("Traffic", "{}", formatTraffic(text, false, localAddr, remoteAddr));
}

}  // namespace utils
}  // namespace lumen
