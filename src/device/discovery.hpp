/*
 * discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Interface to the shared network discovery subsystem

**************************************************/

#ifndef PURELINK_DEVICE_DISCOVERY_HPP
#define PURELINK_DEVICE_DISCOVERY_HPP

#include <functional>
#include <string>

#include "device_record.hpp"

namespace purelink::device {

/**
 * @class Discovery
 * @brief Resolves device identities to network addresses.
 *
 * Callbacks are invoked on a context owned by the implementation, possibly
 * long after registerDevice() returned.
 */
class Discovery {
public:
    using OnFound = std::function<void(const std::string& address)>;

    virtual ~Discovery() = default;

    virtual void startDiscovery() = 0;
    virtual void stopDiscovery() = 0;

    /**
     * @brief Ask to be told where a device lives
     * @param identity Device to look for
     * @param onFound Called with the address once the device is seen
     */
    virtual void registerDevice(const DeviceIdentity& identity,
                                OnFound onFound) = 0;
};

}  // namespace purelink::device

#endif  // PURELINK_DEVICE_DISCOVERY_HPP
