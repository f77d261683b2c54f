/*
 * connection_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Connection, logging and simulation configuration sections

**************************************************/

#ifndef PURELINK_CONFIG_CONNECTION_CONFIG_HPP
#define PURELINK_CONFIG_CONNECTION_CONFIG_HPP

#include <chrono>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace purelink::config {

using json = nlohmann::json;

/**
 * @brief Connection lifecycle settings
 */
struct ConnectionConfig {
    int environmentRefreshSeconds{30};  ///< Environmental data poll interval
    int retryDelaySeconds{30};          ///< Fixed delay between connect retries
    bool reconnect{true};               ///< Rediscover devices that drop off
    bool restartDiscoveryOnDisconnect{true};  ///< Restart discovery globally
    bool includeInactiveDevices{false};  ///< Monitor devices marked inactive

    [[nodiscard]] auto environmentRefresh() const -> std::chrono::seconds {
        return std::chrono::seconds(environmentRefreshSeconds);
    }

    [[nodiscard]] auto retryDelay() const -> std::chrono::seconds {
        return std::chrono::seconds(retryDelaySeconds);
    }

    [[nodiscard]] json toJson() const {
        return {{"environmentRefreshSeconds", environmentRefreshSeconds},
                {"retryDelaySeconds", retryDelaySeconds},
                {"reconnect", reconnect},
                {"restartDiscoveryOnDisconnect", restartDiscoveryOnDisconnect},
                {"includeInactiveDevices", includeInactiveDevices}};
    }

    /**
     * @throws ConfigurationException on non-positive intervals
     */
    [[nodiscard]] static ConnectionConfig fromJson(const json& j);
};

/**
 * @brief Logging settings
 */
struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"%Y/%m/%d %H:%M:%S %^%8l%$ %v"};
    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"purelink"};
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};

    [[nodiscard]] json toJson() const {
        return {{"level", level},         {"pattern", pattern},
                {"enableFile", enableFile}, {"logDir", logDir},
                {"logFilename", logFilename}, {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }
};

/**
 * @brief In-process backend used instead of real devices
 */
struct SimulationConfig {
    bool enabled{false};
    int discoveryDelayMs{2000};  ///< Delay before a device is "found"
    std::unordered_map<std::string, std::string> addresses;  ///< serial -> ip

    [[nodiscard]] json toJson() const {
        return {{"enabled", enabled},
                {"discoveryDelayMs", discoveryDelayMs},
                {"addresses", addresses}};
    }

    [[nodiscard]] static SimulationConfig fromJson(const json& j) {
        SimulationConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.discoveryDelayMs = j.value("discoveryDelayMs", cfg.discoveryDelayMs);
        if (j.contains("addresses") && j["addresses"].is_object()) {
            cfg.addresses = j["addresses"]
                                .get<std::unordered_map<std::string,
                                                        std::string>>();
        }
        return cfg;
    }
};

}  // namespace purelink::config

#endif  // PURELINK_CONFIG_CONNECTION_CONFIG_HPP
