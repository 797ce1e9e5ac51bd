/**
 * @file discovery_broadcaster.hpp
 * @brief Repeated broadcast sweeps and fan-out of unsolicited replies.
 *
 * A discovery sends one command to the broadcast address, re-sends it every
 * interval until its window closes, and hands every unsolicited reply
 * received inside the window to the caller's callback. The receive loop only
 * queues replies; callbacks run on the thread blocked in discover(), so a
 * callback may issue unicast requests of its own. Concurrent sweeps have
 * independent listeners.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/cancellation.hpp"
#include "lumen/core/datagram.hpp"
#include "lumen/core/device_record.hpp"
#include "lumen/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lumen {
namespace core {

/**
 * @struct DiscoveryConfig
 * @brief Configuration for broadcast sweeps.
 */
struct LUMEN_CORE_API DiscoveryConfig {
    std::string broadcast_addr;     ///< Destination of sweep datagrams
    uint16_t port;                  ///< Destination port
    int broadcast_interval_ms;      ///< Re-send period; shorter than a sweep

    DiscoveryConfig()
        : broadcast_addr("255.255.255.255")
        , port(kDevicePort)
        , broadcast_interval_ms(500)
    {}
};

/**
 * @brief Receives each reply that arrives during a sweep.
 * Runs on the thread that called discover(). While it runs no re-broadcast
 * is sent, so a slow callback can delay the end of the sweep.
 */
using ReplyCallback = std::function<void(const Datagram& reply)>;

/**
 * @class DiscoveryBroadcaster
 * @brief Runs discovery sweeps over a DatagramSender.
 *
 * Usage:
 * @code
 * DiscoveryBroadcaster broadcaster(transport, DiscoveryConfig());
 * broadcaster.discover(CommandEnvelope(DeviceMethod::GetSystemConfig),
 *                      [](const Datagram& reply) { ... },
 *                      std::chrono::milliseconds(5000));
 * @endcode
 *
 * The receive loop feeds replies in through dispatch().
 */
class LUMEN_CORE_API DiscoveryBroadcaster {
public:
    DiscoveryBroadcaster(DatagramSender& sender, const DiscoveryConfig& config);
    ~DiscoveryBroadcaster() = default;

    // Non-copyable
    DiscoveryBroadcaster(const DiscoveryBroadcaster&) = delete;
    DiscoveryBroadcaster& operator=(const DiscoveryBroadcaster&) = delete;

    /**
     * @brief Broadcast @p command repeatedly for @p timeout.
     *
     * Blocks for the whole window and invokes @p callback on the calling
     * thread. Failed sends are logged and the sweep goes on; exceptions
     * thrown by the callback are logged and dropped. Returns normally when
     * the window (or the token's deadline) ends. After this returns or
     * throws, @p callback is never called again.
     *
     * @throws TransportError(Cancelled) if the token is cancelled.
     * @throws std::invalid_argument on a null callback or non-positive timeout.
     */
    void discover(const CommandEnvelope& command,
                  ReplyCallback callback,
                  std::chrono::milliseconds timeout,
                  const CancellationToken& token = CancellationToken());

    /**
     * @brief Queue an unsolicited reply for every listener whose window
     *        contains its receive time. Never runs a callback.
     * @return Number of listeners that accepted it.
     */
    size_t dispatch(const Datagram& datagram);

    size_t listenerCount() const;

    const DiscoveryConfig& config() const { return config_; }

private:
    struct Listener;

    void removeListener(uint64_t id);

    DatagramSender& sender_;
    DiscoveryConfig config_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Listener>> listeners_;
    uint64_t nextId_;
};

}  // namespace core
}  // namespace lumen
