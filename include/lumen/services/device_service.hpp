/**
 * @file device_service.hpp
 * @brief Device operations built on the command transport.
 *
 * The DeviceService handles:
 * - Discovery sweeps in three scan modes, deduplicated by hardware address
 * - Lookup by hardware address (cache first, scan on miss)
 * - State and configuration refresh of a known device
 * - Light control verbs (power, brightness, color, temperature, scene)
 *
 * Every successful exchange updates the shared DeviceCache.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/cancellation.hpp"
#include "lumen/core/command_envelope.hpp"
#include "lumen/core/command_transport.hpp"
#include "lumen/core/device_cache.hpp"
#include "lumen/core/device_record.hpp"
#include "lumen/core/mac_address.hpp"
#include "lumen/services/export.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lumen {
namespace services {

/**
 * @enum ScanMode
 * @brief Command broadcast during discovery.
 */
enum class ScanMode {
    GetPilot,           ///< Current light state
    GetSystemConfig,    ///< Identity and firmware (default)
    Registration        ///< Registration scan announcing this controller
};

LUMEN_SERVICES_API const char* scanModeToString(ScanMode mode);

LUMEN_SERVICES_API std::optional<ScanMode> parseScanMode(const std::string& name);

/**
 * @struct DeviceServiceConfig
 * @brief Timeouts and identity used by DeviceService.
 */
struct LUMEN_SERVICES_API DeviceServiceConfig {
    int command_timeout_ms = 5000;          ///< Per-attempt unicast timeout
    int discovery_timeout_ms = 5000;        ///< Default sweep duration
    int lookup_scan_ms = 2000;              ///< Sweep used by findByMac() on a miss
    ScanMode scan_mode = ScanMode::GetSystemConfig;
    std::string local_ip = "0.0.0.0";       ///< phoneIp for Registration scans
    core::MacAddress local_mac;             ///< phoneMac for Registration scans
};

/**
 * @brief Called once per newly discovered device during a sweep.
 *
 * Runs on the thread that called DeviceService::discover(), so it may call
 * other DeviceService verbs. The sweep does not re-broadcast while it runs.
 */
using DiscoveredCallback = std::function<void(const core::DeviceRecord& device)>;

/**
 * @class DeviceService
 * @brief Verbs over devices, composed from transport exchanges.
 *
 * Methods taking a DeviceRecord return the updated record, which is also
 * written to the cache. Arguments are validated before any network I/O.
 *
 * Errors:
 * - std::invalid_argument: missing or malformed address, value out of range
 * - core::DeviceError: the device answered with an error object
 * - core::TransportError: transport failure, or a reply with neither
 *   result nor error (MalformedReply)
 *
 * Usage:
 * @code
 * auto transport = std::make_shared<core::UdpTransport>();
 * auto cache = std::make_shared<core::DeviceCache>();
 * DeviceService service(transport, cache);
 *
 * for (const auto& device : service.discover()) {
 *     service.turnOn(device);
 * }
 * @endcode
 */
class LUMEN_SERVICES_API DeviceService {
public:
    DeviceService(std::shared_ptr<core::CommandTransport> transport,
                  std::shared_ptr<core::DeviceCache> cache,
                  const DeviceServiceConfig& config = DeviceServiceConfig());

    // Non-copyable
    DeviceService(const DeviceService&) = delete;
    DeviceService& operator=(const DeviceService&) = delete;

    // =========================================================================
    // Discovery
    // =========================================================================

    /**
     * @brief Broadcast a sweep and collect every device that answers.
     * @param mode Command to broadcast.
     * @param timeout Sweep duration.
     * @param onDiscovered Called once per distinct device, on this thread.
     * @param token Cancels the sweep.
     * @return Distinct devices in order of first reply.
     */
    std::vector<core::DeviceRecord> discover(ScanMode mode,
                                             std::chrono::milliseconds timeout,
                                             DiscoveredCallback onDiscovered = nullptr,
                                             const core::CancellationToken& token =
                                                 core::CancellationToken());

    /**
     * @brief Sweep with the configured mode and duration.
     */
    std::vector<core::DeviceRecord> discover(const core::CancellationToken& token =
                                                 core::CancellationToken());

    /**
     * @brief Find a device by hardware address.
     *
     * Returns the cached record unless @p forceScan; otherwise runs a short
     * sweep and looks again.
     */
    std::optional<core::DeviceRecord> findByMac(const core::MacAddress& mac,
                                                bool forceScan = false,
                                                const core::CancellationToken& token =
                                                    core::CancellationToken());

    // =========================================================================
    // Queries
    // =========================================================================

    core::DeviceRecord refreshState(const core::DeviceRecord& device,
                                    const core::CancellationToken& token =
                                        core::CancellationToken());

    core::DeviceRecord refreshSystemConfig(const core::DeviceRecord& device,
                                           const core::CancellationToken& token =
                                               core::CancellationToken());

    core::DeviceRecord refreshModelConfig(const core::DeviceRecord& device,
                                          const core::CancellationToken& token =
                                              core::CancellationToken());

    /**
     * @brief Query a device known only by address.
     *
     * The record is keyed by the hardware address in the reply.
     * @throws core::TransportError(MalformedReply) if the reply has no
     *         usable "mac".
     */
    core::DeviceRecord queryAddress(const std::string& ip,
                                    uint16_t port = core::kDevicePort,
                                    const core::CancellationToken& token =
                                        core::CancellationToken());

    // =========================================================================
    // Control
    // =========================================================================

    /**
     * @brief Send @p changes with setPilot and merge them into the record.
     */
    core::DeviceRecord setPilot(const core::DeviceRecord& device,
                                const core::PilotParams& changes,
                                const core::CancellationToken& token =
                                    core::CancellationToken());

    core::DeviceRecord turnOn(const core::DeviceRecord& device,
                              const core::CancellationToken& token =
                                  core::CancellationToken());

    core::DeviceRecord turnOff(const core::DeviceRecord& device,
                               const core::CancellationToken& token =
                                   core::CancellationToken());

    /**
     * @param brightness Percentage, 0..100.
     */
    core::DeviceRecord setBrightness(const core::DeviceRecord& device, int brightness,
                                     const core::CancellationToken& token =
                                         core::CancellationToken());

    /**
     * @brief Set an RGB color (0..255 each). Clears the active scene.
     */
    core::DeviceRecord setColor(const core::DeviceRecord& device, int r, int g, int b,
                                const core::CancellationToken& token =
                                    core::CancellationToken());

    /**
     * @brief Set a white color temperature in Kelvin. Selects scene 0 and
     *        clears RGB.
     */
    core::DeviceRecord setTemperature(const core::DeviceRecord& device, int kelvin,
                                      const core::CancellationToken& token =
                                          core::CancellationToken());

    core::DeviceRecord setScene(const core::DeviceRecord& device, int sceneId,
                                const core::CancellationToken& token =
                                    core::CancellationToken());

    const DeviceServiceConfig& config() const { return config_; }

private:
    core::CommandEnvelope buildScanCommand(ScanMode mode) const;

    // Sends one command and returns the result of a successful reply
    core::PilotParams exchange(const std::string& ip, uint16_t port,
                               const core::CommandEnvelope& command,
                               const core::CancellationToken& token);

    core::DeviceRecord refresh(const core::DeviceRecord& device,
                               core::DeviceMethod method,
                               const core::CancellationToken& token);

    // Merges a result into the record, stamps it and stores it
    core::DeviceRecord store(core::DeviceRecord device, const core::PilotParams& result);

    std::shared_ptr<core::CommandTransport> transport_;
    std::shared_ptr<core::DeviceCache> cache_;
    DeviceServiceConfig config_;
};

}  // namespace services
}  // namespace lumen
