/*
 * fleet_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "fleet_config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "common/connection_exceptions.hpp"

namespace purelink::config {

ConnectionConfig ConnectionConfig::fromJson(const json& j) {
    ConnectionConfig cfg;
    cfg.environmentRefreshSeconds =
        j.value("environmentRefreshSeconds", cfg.environmentRefreshSeconds);
    cfg.retryDelaySeconds = j.value("retryDelaySeconds", cfg.retryDelaySeconds);
    cfg.reconnect = j.value("reconnect", cfg.reconnect);
    cfg.restartDiscoveryOnDisconnect = j.value(
        "restartDiscoveryOnDisconnect", cfg.restartDiscoveryOnDisconnect);
    cfg.includeInactiveDevices =
        j.value("includeInactiveDevices", cfg.includeInactiveDevices);

    if (cfg.environmentRefreshSeconds <= 0) {
        throw ConfigurationException("connection",
                                     "environmentRefreshSeconds must be > 0");
    }
    if (cfg.retryDelaySeconds <= 0) {
        throw ConfigurationException("connection",
                                     "retryDelaySeconds must be > 0");
    }
    return cfg;
}

auto FleetConfig::monitoredDevices() const
    -> std::vector<device::DeviceRecord> {
    std::vector<device::DeviceRecord> result;
    for (const auto& record : devices) {
        if (!record.active && !connection.includeInactiveDevices) {
            spdlog::info(
                "Found device \"{}\" (serial={}) but is not active; skipping",
                record.name, record.serial);
            continue;
        }
        result.push_back(record);
    }
    return result;
}

json FleetConfig::toJson() const {
    json devicesJson = json::array();
    for (const auto& record : devices) {
        devicesJson.push_back(record.toJson());
    }
    return {{"logging", logging.toJson()},
            {"connection", connection.toJson()},
            {"simulation", simulation.toJson()},
            {"hosts", hosts.toJson()},
            {"devices", devicesJson}};
}

FleetConfig FleetConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationException("config", "top level must be an object");
    }

    FleetConfig cfg;
    try {
        cfg.logging = LoggingConfig::fromJson(j.value("logging", json::object()));
        cfg.connection =
            ConnectionConfig::fromJson(j.value("connection", json::object()));
        cfg.simulation =
            SimulationConfig::fromJson(j.value("simulation", json::object()));
        cfg.hosts = device::HostOverrideMap::fromJson(j.value("hosts", json{}));

        if (!j.contains("devices")) {
            spdlog::debug("No devices section in config; nothing to monitor");
            return cfg;
        }
        if (!j["devices"].is_array()) {
            throw ConfigurationException("devices", "expected an array");
        }

        for (const auto& entry : j["devices"]) {
            // Entries without local credentials are not devices.
            if (!entry.is_object() || !entry.contains("credentials")) {
                spdlog::debug("Skipping device entry without credentials");
                continue;
            }
            cfg.devices.push_back(device::DeviceRecord::fromJson(entry));
        }
    } catch (const json::exception& e) {
        throw ConfigurationException("config", e.what());
    }
    return cfg;
}

FleetConfig FleetConfig::load(const std::filesystem::path& path) {
    spdlog::info("Reading \"{}\"", path.string());

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationException(path.string(), "cannot open file");
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        spdlog::critical("Could not read \"{}\": {}", path.string(), e.what());
        throw ConfigurationException(path.string(), e.what());
    }
    return fromJson(j);
}

}  // namespace purelink::config
