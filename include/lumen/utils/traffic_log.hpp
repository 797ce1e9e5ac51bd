/**
 * @file traffic_log.hpp
 * @brief Datagram traffic logging.
 *
 * Every datagram the transport sends or receives is reported here, with
 * the local and remote endpoints and the raw payload text. Lines are
 * emitted through the Logger at DEBUG under the "Traffic" component.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/utils/export.hpp"

#include <string>

namespace lumen {
namespace utils {

/**
 * @brief Log a received datagram.
 * @param text Payload text.
 * @param localAddr Local endpoint the datagram arrived on.
 * @param remoteAddr Endpoint it came from.
 */
LUMEN_UTILS_API void logInput(const std::string& text,
                              const std::string& localAddr,
                              const std::string& remoteAddr);

/**
 * @brief Log a sent datagram.
 * @param text Payload text.
 * @param localAddr Local endpoint it was sent from.
 * @param remoteAddr Destination endpoint.
 */
LUMEN_UTILS_API void logOutput(const std::string& text,
                               const std::string& localAddr,
                               const std::string& remoteAddr);

/**
 * @brief Build the traffic line without logging it.
 * @param inbound True for received datagrams.
 */
LUMEN_UTILS_API std::string formatTraffic(const std::string& text, bool inbound,
                                          const std::string& localAddr,
                                          const std::string& remoteAddr);

}  // namespace utils
}  // namespace lumen
