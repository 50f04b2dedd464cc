/**
 * @file device_inventory.cpp
 * @brief DeviceInventory implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/core/device_inventory.hpp"
#include "netmap/utils/logger.hpp"

#include <mutex>

namespace netmap {
namespace core {

bool DeviceInventory::upsertDevice(const Device& device) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = devices_.find(device.ip);
    if (it == devices_.end()) {
        devices_[device.ip] = std::make_shared<Device>(device);
        LOG_DEBUG("DeviceInventory", "New device {} ({})", device.ip, toString(device.status));
        return true;
    }

    mergeDevice(*it->second, device);
    LOG_DEBUG("DeviceInventory", "Merged rediscovered device {}", device.ip);
    return false;
}

std::shared_ptr<Device> DeviceInventory::getDevice(const std::string& ip) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(ip);
    if (it != devices_.end()) {
        return std::make_shared<Device>(*it->second);
    }
    return nullptr;
}

std::vector<Device> DeviceInventory::getAllDevices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Device> result;
    result.reserve(devices_.size());
    for (const auto& [ip, device] : devices_) {
        result.push_back(*device);
    }
    return result;
}

bool DeviceInventory::removeDevice(const std::string& ip) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(ip);
    if (it == devices_.end()) {
        return false;
    }
    LOG_INFO("DeviceInventory", "Removing device {}", ip);
    devices_.erase(it);
    return true;
}

size_t DeviceInventory::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

void DeviceInventory::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    devices_.clear();
}

}  // namespace core
}  // namespace netmap
