/**
 * @file device_cache.hpp
 * @brief Thread-safe table of known devices keyed by hardware address.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/device_record.hpp"
#include "lumen/core/export.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace lumen {
namespace core {

/**
 * @class DeviceCache
 * @brief Concurrent map MacAddress -> DeviceRecord.
 *
 * All access is guarded by a read-write lock (shared_mutex). Readers get
 * copies, never references into the table. An entry's last_seen never
 * moves backwards: writes carrying an older timestamp keep the newer one.
 *
 * Usage:
 * @code
 * auto cache = std::make_shared<DeviceCache>();
 * cache->set(record);
 *
 * if (auto known = cache->get(mac)) {
 *     LOG_INFO("App", "{} is at {}", known->mac, known->endpoint());
 * }
 * @endcode
 */
class LUMEN_CORE_API DeviceCache {
public:
    using Mutator = std::function<void(DeviceRecord&)>;

    DeviceCache() = default;
    ~DeviceCache() = default;

    // Non-copyable
    DeviceCache(const DeviceCache&) = delete;
    DeviceCache& operator=(const DeviceCache&) = delete;

    /**
     * @brief Look up a device.
     * @return A copy of the record, or std::nullopt if unknown.
     */
    std::optional<DeviceRecord> get(const MacAddress& mac) const;

    /**
     * @brief Insert or overwrite the record keyed by record.mac.
     * @return True if the device was not known before.
     */
    bool set(const DeviceRecord& record);

    bool contains(const MacAddress& mac) const;

    /**
     * @brief Remove a device.
     * @return True if it was present.
     */
    bool remove(const MacAddress& mac);

    /**
     * @brief Snapshot of every record, in no particular order.
     */
    std::vector<DeviceRecord> getAll() const;

    void clear();

    size_t count() const;

    /**
     * @brief Mutate a record in place under the write lock.
     *
     * The mutator must not call back into the cache. Changing the record's
     * mac is ignored.
     *
     * @return False if the device is unknown (the mutator is not called).
     */
    bool update(const MacAddress& mac, const Mutator& mutator);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<MacAddress, DeviceRecord> devices_;
};

}  // namespace core
}  // namespace lumen
