/**
 * @file device_service.cpp
 * @brief DeviceService implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/services/device_service.hpp"
#include "lumen/core/errors.hpp"
#include "lumen/net/udp_socket.hpp"
#include "lumen/utils/logger.hpp"

#include <stdexcept>
#include <unordered_set>

namespace lumen {
namespace services {

using core::CancellationToken;
using core::CommandEnvelope;
using core::DeviceMethod;
using core::DeviceRecord;
using core::ErrorKind;
using core::MacAddress;
using core::PilotParams;
using core::TransportError;

namespace {

void requireAddress(const std::string& ip) {
    if (ip.empty()) {
        throw std::invalid_argument("Device address is not set");
    }
    if (!net::isValidIpv4(ip)) {
        throw std::invalid_argument("Device address is not an IPv4 address: " + ip);
    }
}

void requireRange(const char* name, int value, int low, int high) {
    if (value < low || value > high) {
        throw std::invalid_argument(std::string(name) + " must be in " +
                                    std::to_string(low) + ".." + std::to_string(high) +
                                    ", got " + std::to_string(value));
    }
}

}  // namespace

const char* scanModeToString(ScanMode mode) {
    switch (mode) {
        case ScanMode::GetPilot: return "getPilot";
        case ScanMode::GetSystemConfig: return "getSystemConfig";
        case ScanMode::Registration: return "registration";
        default: return "unknown";
    }
}

std::optional<ScanMode> parseScanMode(const std::string& name) {
    if (name == "getPilot") return ScanMode::GetPilot;
    if (name == "getSystemConfig") return ScanMode::GetSystemConfig;
    if (name == "registration") return ScanMode::Registration;
    return std::nullopt;
}

DeviceService::DeviceService(std::shared_ptr<core::CommandTransport> transport,
                             std::shared_ptr<core::DeviceCache> cache,
                             const DeviceServiceConfig& config)
    : transport_(std::move(transport))
    , cache_(std::move(cache))
    , config_(config)
{
    if (!transport_) {
        throw std::invalid_argument("DeviceService requires a transport");
    }
    if (!cache_) {
        throw std::invalid_argument("DeviceService requires a device cache");
    }
}

// =============================================================================
// Discovery
// =============================================================================

std::vector<DeviceRecord> DeviceService::discover(ScanMode mode,
                                                  std::chrono::milliseconds timeout,
                                                  DiscoveredCallback onDiscovered,
                                                  const CancellationToken& token) {
    CommandEnvelope command = buildScanCommand(mode);

    LOG_INFO("DeviceService", "Starting discovery with mode {} for {}ms",
             scanModeToString(mode), timeout.count());

    std::vector<DeviceRecord> found;
    std::unordered_set<MacAddress> seen;

    transport_->discover(command, [&](const core::Datagram& reply) {
        const auto& result = reply.envelope.result;
        if (!result || !result->mac) {
            return;
        }

        auto mac = MacAddress::parse(*result->mac);
        if (!mac) {
            LOG_DEBUG("DeviceService", "Ignoring reply from {} with bad mac '{}'",
                      reply.source.toString(), *result->mac);
            return;
        }

        if (!seen.insert(*mac).second) {
            return;
        }

        DeviceRecord device = cache_->get(*mac).value_or(DeviceRecord(*mac, reply.source.ip));
        device.ip = reply.source.ip;
        device.port = core::kDevicePort;
        device = store(device, *result);
        found.push_back(device);

        LOG_DEBUG("DeviceService", "Discovered device {} at {}", device.mac, device.ip);

        if (onDiscovered) {
            onDiscovered(device);
        }
    }, timeout, token);

    LOG_INFO("DeviceService", "Discovery completed. Found {} device(s)", found.size());
    return found;
}

std::vector<DeviceRecord> DeviceService::discover(const CancellationToken& token) {
    return discover(config_.scan_mode,
                    std::chrono::milliseconds(config_.discovery_timeout_ms),
                    nullptr, token);
}

std::optional<DeviceRecord> DeviceService::findByMac(const MacAddress& mac,
                                                     bool forceScan,
                                                     const CancellationToken& token) {
    if (!forceScan) {
        if (auto cached = cache_->get(mac)) {
            LOG_DEBUG("DeviceService", "Returning cached device {}", mac);
            return cached;
        }
    }

    LOG_INFO("DeviceService", "Device {} not in cache, scanning", mac);
    discover(ScanMode::GetSystemConfig,
             std::chrono::milliseconds(config_.lookup_scan_ms),
             nullptr, token);

    auto device = cache_->get(mac);
    if (!device) {
        LOG_WARN("DeviceService", "Device not found: {}", mac);
    }
    return device;
}

// =============================================================================
// Queries
// =============================================================================

DeviceRecord DeviceService::refreshState(const DeviceRecord& device,
                                         const CancellationToken& token) {
    return refresh(device, DeviceMethod::GetPilot, token);
}

DeviceRecord DeviceService::refreshSystemConfig(const DeviceRecord& device,
                                                const CancellationToken& token) {
    return refresh(device, DeviceMethod::GetSystemConfig, token);
}

DeviceRecord DeviceService::refreshModelConfig(const DeviceRecord& device,
                                               const CancellationToken& token) {
    return refresh(device, DeviceMethod::GetModelConfig, token);
}

DeviceRecord DeviceService::queryAddress(const std::string& ip, uint16_t port,
                                         const CancellationToken& token) {
    requireAddress(ip);

    LOG_INFO("DeviceService", "Querying device at {}:{}", ip, port);

    PilotParams result = exchange(ip, port, CommandEnvelope(DeviceMethod::GetPilot), token);

    std::optional<MacAddress> mac;
    if (result.mac) {
        mac = MacAddress::parse(*result.mac);
    }
    if (!mac) {
        throw TransportError(ErrorKind::MalformedReply,
                             "Reply from " + ip + " carries no device address");
    }

    DeviceRecord device = cache_->get(*mac).value_or(DeviceRecord(*mac, ip, port));
    device.ip = ip;
    device.port = port;
    return store(device, result);
}

// =============================================================================
// Control
// =============================================================================

DeviceRecord DeviceService::setPilot(const DeviceRecord& device,
                                     const PilotParams& changes,
                                     const CancellationToken& token) {
    requireAddress(device.ip);

    CommandEnvelope command(DeviceMethod::SetPilot);
    command.params = changes;

    LOG_DEBUG("DeviceService", "setPilot {} {}", device.mac, command.params.toJson().dump());

    PilotParams result = exchange(device.ip, device.port, command, token);

    // The acknowledgement is not device state
    result.success.reset();

    DeviceRecord updated = device;
    updated.params.mergeFrom(changes);
    return store(updated, result);
}

DeviceRecord DeviceService::turnOn(const DeviceRecord& device, const CancellationToken& token) {
    LOG_INFO("DeviceService", "Turning on device {}", device.mac);
    PilotParams changes;
    changes.state = true;
    return setPilot(device, changes, token);
}

DeviceRecord DeviceService::turnOff(const DeviceRecord& device, const CancellationToken& token) {
    LOG_INFO("DeviceService", "Turning off device {}", device.mac);
    PilotParams changes;
    changes.state = false;
    return setPilot(device, changes, token);
}

DeviceRecord DeviceService::setBrightness(const DeviceRecord& device, int brightness,
                                          const CancellationToken& token) {
    requireRange("Brightness", brightness, 0, 100);

    LOG_INFO("DeviceService", "Setting brightness to {}% for device {}", brightness, device.mac);
    PilotParams changes;
    changes.dimming = brightness;
    return setPilot(device, changes, token);
}

DeviceRecord DeviceService::setColor(const DeviceRecord& device, int r, int g, int b,
                                     const CancellationToken& token) {
    requireRange("Red", r, 0, 255);
    requireRange("Green", g, 0, 255);
    requireRange("Blue", b, 0, 255);

    LOG_INFO("DeviceService", "Setting color to RGB({},{},{}) for device {}", r, g, b, device.mac);

    DeviceRecord updated = device;
    updated.params.sceneId.reset();

    PilotParams changes;
    changes.r = r;
    changes.g = g;
    changes.b = b;
    return setPilot(updated, changes, token);
}

DeviceRecord DeviceService::setTemperature(const DeviceRecord& device, int kelvin,
                                           const CancellationToken& token) {
    if (kelvin <= 0) {
        throw std::invalid_argument("Temperature must be positive, got " + std::to_string(kelvin));
    }

    LOG_INFO("DeviceService", "Setting temperature to {}K for device {}", kelvin, device.mac);

    DeviceRecord updated = device;
    updated.params.r.reset();
    updated.params.g.reset();
    updated.params.b.reset();
    updated.params.c.reset();
    updated.params.w.reset();

    PilotParams changes;
    changes.sceneId = 0;
    changes.temp = kelvin;
    return setPilot(updated, changes, token);
}

DeviceRecord DeviceService::setScene(const DeviceRecord& device, int sceneId,
                                     const CancellationToken& token) {
    if (sceneId < 0) {
        throw std::invalid_argument("Scene id must not be negative, got " + std::to_string(sceneId));
    }

    LOG_INFO("DeviceService", "Setting scene to {} for device {}", sceneId, device.mac);
    PilotParams changes;
    changes.sceneId = sceneId;
    return setPilot(device, changes, token);
}

// =============================================================================
// Helpers
// =============================================================================

CommandEnvelope DeviceService::buildScanCommand(ScanMode mode) const {
    switch (mode) {
        case ScanMode::Registration: {
            CommandEnvelope command(DeviceMethod::Registration);
            command.params.phoneMac = config_.local_mac.toCompactString();
            command.params.registration = false;
            command.params.phoneIp = config_.local_ip;
            command.params.id = "12";
            return command;
        }
        case ScanMode::GetPilot:
            return CommandEnvelope(DeviceMethod::GetPilot);
        case ScanMode::GetSystemConfig:
        default:
            return CommandEnvelope(DeviceMethod::GetSystemConfig);
    }
}

PilotParams DeviceService::exchange(const std::string& ip, uint16_t port,
                                    const CommandEnvelope& command,
                                    const CancellationToken& token) {
    std::string reply = transport_->send(command, ip, port,
                                         std::chrono::milliseconds(config_.command_timeout_ms),
                                         token);

    auto envelope = CommandEnvelope::parse(reply);
    if (!envelope) {
        throw TransportError(ErrorKind::MalformedReply, "Undecodable reply from " + ip);
    }
    if (envelope->error) {
        LOG_WARN("DeviceService", "{} to {} failed: {} ({})", command.method, ip,
                 envelope->error->message, envelope->error->code);
        throw core::DeviceError(envelope->error->code, envelope->error->message);
    }
    if (!envelope->result) {
        throw TransportError(ErrorKind::MalformedReply,
                             "Reply from " + ip + " has neither result nor error");
    }
    return *envelope->result;
}

DeviceRecord DeviceService::refresh(const DeviceRecord& device,
                                    DeviceMethod method,
                                    const CancellationToken& token) {
    requireAddress(device.ip);

    LOG_INFO("DeviceService", "{} from device {} at {}",
             core::deviceMethodToString(method), device.mac, device.ip);

    PilotParams result = exchange(device.ip, device.port, CommandEnvelope(method), token);
    return store(device, result);
}

DeviceRecord DeviceService::store(DeviceRecord device, const PilotParams& result) {
    device.params.mergeFrom(result);
    device.last_seen = DeviceRecord::Clock::now();
    cache_->set(device);
    return cache_->get(device.mac).value_or(device);
}

}  // namespace services
}  // namespace lumen
