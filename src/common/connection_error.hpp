/*
 * connection_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Connection error codes and structures for unified error handling

**************************************************/

#ifndef PURELINK_COMMON_CONNECTION_ERROR_HPP
#define PURELINK_COMMON_CONNECTION_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace purelink {

/**
 * @brief Error codes for the connection lifecycle
 */
enum class ConnectionErrorCode {
    // General errors (0-99)
    Unknown = 0,
    InvalidArgument = 10,
    InvalidState = 11,

    // Connection errors (100-199)
    ConnectionFailed = 100,
    ConnectionTimeout = 101,
    ConnectionRefused = 102,
    ConnectionLost = 103,
    NotConnected = 104,
    AuthenticationFailed = 106,

    // Discovery errors (200-299)
    DiscoveryFailed = 200,

    // Configuration errors (900-999)
    ConfigurationError = 901
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] inline auto connectionErrorCodeToString(ConnectionErrorCode code)
    -> std::string {
    switch (code) {
        case ConnectionErrorCode::Unknown:
            return "Unknown";
        case ConnectionErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ConnectionErrorCode::InvalidState:
            return "InvalidState";
        case ConnectionErrorCode::ConnectionFailed:
            return "ConnectionFailed";
        case ConnectionErrorCode::ConnectionTimeout:
            return "ConnectionTimeout";
        case ConnectionErrorCode::ConnectionRefused:
            return "ConnectionRefused";
        case ConnectionErrorCode::ConnectionLost:
            return "ConnectionLost";
        case ConnectionErrorCode::NotConnected:
            return "NotConnected";
        case ConnectionErrorCode::AuthenticationFailed:
            return "AuthenticationFailed";
        case ConnectionErrorCode::DiscoveryFailed:
            return "DiscoveryFailed";
        case ConnectionErrorCode::ConfigurationError:
            return "ConfigurationError";
        default:
            return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

/**
 * @brief Check if error code is recoverable without operator action
 */
[[nodiscard]] inline auto isRecoverable(ConnectionErrorCode code) -> bool {
    switch (code) {
        case ConnectionErrorCode::ConnectionTimeout:
        case ConnectionErrorCode::ConnectionLost:
        case ConnectionErrorCode::NotConnected:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Connection error with detailed information
 */
struct ConnectionError {
    ConnectionErrorCode code{ConnectionErrorCode::Unknown};
    std::string message;
    std::optional<std::string> deviceName;
    std::optional<std::string> details;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    ConnectionError() = default;

    explicit ConnectionError(ConnectionErrorCode errorCode,
                             std::string errorMessage = "")
        : code(errorCode), message(std::move(errorMessage)) {}

    ConnectionError(ConnectionErrorCode errorCode, std::string errorMessage,
                    std::string device)
        : code(errorCode),
          message(std::move(errorMessage)),
          deviceName(std::move(device)) {}

    /**
     * @brief Get formatted error string
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            "[" + connectionErrorCodeToString(code) + "] " + message;
        if (deviceName) {
            result += " (device: " + *deviceName + ")";
        }
        if (details) {
            result += " - " + *details;
        }
        return result;
    }

    /**
     * @brief Convert to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j;
        j["code"] = static_cast<int>(code);
        j["codeName"] = connectionErrorCodeToString(code);
        j["message"] = message;
        if (deviceName) {
            j["deviceName"] = *deviceName;
        }
        if (details) {
            j["details"] = *details;
        }
        j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
        return j;
    }

    [[nodiscard]] auto isRecoverable() const -> bool {
        return purelink::isRecoverable(code);
    }
};

}  // namespace purelink

#endif  // PURELINK_COMMON_CONNECTION_ERROR_HPP
