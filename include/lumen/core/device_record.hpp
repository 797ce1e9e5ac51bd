/**
 * @file device_record.hpp
 * @brief Last known state of one device.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/command_envelope.hpp"
#include "lumen/core/mac_address.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace lumen {
namespace core {

/// Port devices listen on for both unicast and broadcast commands.
constexpr uint16_t kDevicePort = 38899;

/**
 * @struct DeviceRecord
 * @brief Identity, address and last reported parameters of a device.
 */
struct DeviceRecord {
    using Clock = std::chrono::system_clock;

    MacAddress mac;                 ///< Identity; cache key
    std::string ip;                 ///< Last address the device answered from
    uint16_t port;                  ///< Command port
    std::string name;               ///< Optional user-facing label
    PilotParams params;             ///< Merged state and config fields
    Clock::time_point last_seen;    ///< Last successful exchange

    DeviceRecord()
        : port(kDevicePort)
        , last_seen()
    {}

    DeviceRecord(const MacAddress& mac_, const std::string& ip_, uint16_t port_ = kDevicePort)
        : mac(mac_)
        , ip(ip_)
        , port(port_)
        , last_seen()
    {}

    std::string endpoint() const {
        return ip + ":" + std::to_string(port);
    }

    bool isPoweredOn() const { return params.state.value_or(false); }

    int brightness() const { return params.dimming.value_or(0); }

    bool operator==(const DeviceRecord& other) const {
        return mac == other.mac &&
               ip == other.ip &&
               port == other.port &&
               name == other.name &&
               params == other.params &&
               last_seen == other.last_seen;
    }
    bool operator!=(const DeviceRecord& other) const { return !(*this == other); }
};

}  // namespace core
}  // namespace lumen
