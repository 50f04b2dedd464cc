/**
 * @file device_inventory.hpp
 * @brief Thread-safe store of devices that spans discovery runs.
 *
 * The inventory keeps one record per IP. Devices found again by a later run
 * are merged into the existing record with mergeDevice(), so facts gathered
 * earlier are kept and only gaps are filled.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/core/export.hpp"
#include "netmap/core/device.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace netmap {
namespace core {

/**
 * @class DeviceInventory
 * @brief Keyed device records guarded by a read-write lock.
 *
 * Usage:
 * @code
 * DeviceInventory inventory;
 * inventory.upsertDevice(device);
 *
 * auto record = inventory.getDevice("10.0.0.1");
 * if (record) { ... }
 * @endcode
 */
class NETMAP_CORE_API DeviceInventory {
public:
    DeviceInventory() = default;
    ~DeviceInventory() = default;

    // Non-copyable
    DeviceInventory(const DeviceInventory&) = delete;
    DeviceInventory& operator=(const DeviceInventory&) = delete;

    /**
     * @brief Add a device or merge it into the existing record.
     * @return True if the ip was not known before.
     */
    bool upsertDevice(const Device& device);

    /**
     * @brief Get a copy of one device record.
     * @return The record, or nullptr if the ip is unknown.
     */
    std::shared_ptr<Device> getDevice(const std::string& ip) const;

    /**
     * @brief Get copies of all records ordered by ip.
     */
    std::vector<Device> getAllDevices() const;

    /**
     * @brief Remove a record.
     * @return True if it existed.
     */
    bool removeDevice(const std::string& ip);

    size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Device>> devices_;
};

}  // namespace core
}  // namespace netmap
