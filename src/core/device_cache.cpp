/**
 * @file device_cache.cpp
 * @brief DeviceCache implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/device_cache.hpp"
#include "lumen/utils/logger.hpp"

#include <algorithm>
#include <mutex>

namespace lumen {
namespace core {

std::optional<DeviceRecord> DeviceCache::get(const MacAddress& mac) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it != devices_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool DeviceCache::set(const DeviceRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = devices_.find(record.mac);
    if (it == devices_.end()) {
        devices_.emplace(record.mac, record);
        LOG_DEBUG("DeviceCache", "Added device {} at {}", record.mac, record.endpoint());
        return true;
    }

    auto lastSeen = std::max(it->second.last_seen, record.last_seen);
    it->second = record;
    it->second.last_seen = lastSeen;
    LOG_TRACE("DeviceCache", "Updated device {} at {}", record.mac, record.endpoint());
    return false;
}

bool DeviceCache::contains(const MacAddress& mac) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.count(mac) > 0;
}

bool DeviceCache::remove(const MacAddress& mac) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (devices_.erase(mac) == 0) {
        return false;
    }
    LOG_DEBUG("DeviceCache", "Removed device {}", mac);
    return true;
}

std::vector<DeviceRecord> DeviceCache::getAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    result.reserve(devices_.size());
    for (const auto& [mac, record] : devices_) {
        result.push_back(record);
    }
    return result;
}

void DeviceCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    devices_.clear();
}

size_t DeviceCache::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

bool DeviceCache::update(const MacAddress& mac, const Mutator& mutator) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = devices_.find(mac);
    if (it == devices_.end()) {
        return false;
    }

    auto lastSeen = it->second.last_seen;
    mutator(it->second);
    it->second.mac = mac;
    if (it->second.last_seen < lastSeen) {
        it->second.last_seen = lastSeen;
    }
    return true;
}

}  // namespace core
}  // namespace lumen
