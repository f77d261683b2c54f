/*
 * fleet_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Top level configuration: devices, host overrides and sections

**************************************************/

#ifndef PURELINK_CONFIG_FLEET_CONFIG_HPP
#define PURELINK_CONFIG_FLEET_CONFIG_HPP

#include <filesystem>
#include <vector>

#include "connection_config.hpp"
#include "device/device_record.hpp"

namespace purelink::config {

/**
 * @brief Everything the daemon reads from its configuration file
 *
 * @example
 * ```json
 * {
 *   "connection": { "environmentRefreshSeconds": 30, "reconnect": true },
 *   "hosts": { "AB1-UK-0001A": "10.0.0.5" },
 *   "devices": [
 *     { "name": "Living Room", "serial": "AB1-UK-0001A",
 *       "credentials": "c2VjcmV0", "productType": "455" }
 *   ]
 * }
 * ```
 */
struct FleetConfig {
    LoggingConfig logging;
    ConnectionConfig connection;
    SimulationConfig simulation;
    std::vector<device::DeviceRecord> devices;
    device::HostOverrideMap hosts;

    /**
     * @brief Devices to monitor, honouring includeInactiveDevices
     */
    [[nodiscard]] auto monitoredDevices() const
        -> std::vector<device::DeviceRecord>;

    [[nodiscard]] json toJson() const;

    /**
     * @throws ConfigurationException on malformed sections
     */
    [[nodiscard]] static FleetConfig fromJson(const json& j);

    /**
     * @brief Read and parse a JSON configuration file
     * @throws ConfigurationException if the file cannot be read or parsed
     */
    [[nodiscard]] static FleetConfig load(const std::filesystem::path& path);
};

}  // namespace purelink::config

#endif  // PURELINK_CONFIG_FLEET_CONFIG_HPP
