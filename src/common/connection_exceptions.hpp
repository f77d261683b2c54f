/*
 * connection_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Exception hierarchy for device connections and configuration

**************************************************/

#ifndef PURELINK_COMMON_CONNECTION_EXCEPTIONS_HPP
#define PURELINK_COMMON_CONNECTION_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "connection_error.hpp"

namespace purelink {

/**
 * @brief Base exception for connection lifecycle failures
 */
class ConnectionException : public std::runtime_error {
public:
    explicit ConnectionException(
        const std::string& message,
        ConnectionErrorCode code = ConnectionErrorCode::ConnectionFailed)
        : std::runtime_error(message), error_(code, message) {}

    explicit ConnectionException(const ConnectionError& error)
        : std::runtime_error(error.toString()), error_(error) {}

    ConnectionException(
        const std::string& message, const std::string& deviceName,
        ConnectionErrorCode code = ConnectionErrorCode::ConnectionFailed)
        : std::runtime_error(message), error_(code, message, deviceName) {}

    [[nodiscard]] auto error() const noexcept -> const ConnectionError& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> ConnectionErrorCode {
        return error_.code;
    }

    [[nodiscard]] auto deviceName() const noexcept
        -> std::optional<std::string> {
        return error_.deviceName;
    }

protected:
    ConnectionError error_;
};

/**
 * @brief Thrown by a protocol client when a connect attempt timed out
 *
 * This is the only connect failure that is retried automatically.
 */
class ConnectTimeoutException : public ConnectionException {
public:
    explicit ConnectTimeoutException(const std::string& deviceName,
                                     const std::string& address = "")
        : ConnectionException(
              "Connection timeout" +
                  (address.empty() ? "" : " connecting to " + address),
              deviceName, ConnectionErrorCode::ConnectionTimeout),
          address_(address) {}

    [[nodiscard]] auto address() const noexcept -> const std::string& {
        return address_;
    }

private:
    std::string address_;
};

/**
 * @brief Thrown when the underlying connection disappeared mid-operation
 */
class ConnectionLostException : public ConnectionException {
public:
    explicit ConnectionLostException(const std::string& deviceName)
        : ConnectionException("Connection lost: " + deviceName, deviceName,
                              ConnectionErrorCode::ConnectionLost) {}
};

/**
 * @brief Exception for invalid or unreadable configuration
 */
class ConfigurationException : public std::runtime_error {
public:
    explicit ConfigurationException(const std::string& message)
        : std::runtime_error(message),
          error_(ConnectionErrorCode::ConfigurationError, message) {}

    ConfigurationException(const std::string& source,
                           const std::string& message)
        : std::runtime_error(source + ": " + message),
          error_(ConnectionErrorCode::ConfigurationError, message) {
        error_.details = source;
    }

    [[nodiscard]] auto error() const noexcept -> const ConnectionError& {
        return error_;
    }

private:
    ConnectionError error_;
};

}  // namespace purelink

#endif  // PURELINK_COMMON_CONNECTION_EXCEPTIONS_HPP
