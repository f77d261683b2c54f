/*
 * protocol_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Interface to the per-device wire protocol client

**************************************************/

#ifndef PURELINK_DEVICE_PROTOCOL_CLIENT_HPP
#define PURELINK_DEVICE_PROTOCOL_CLIENT_HPP

#include <functional>
#include <memory>
#include <string>

#include "device_record.hpp"

namespace purelink::device {

/**
 * @brief Kind of message a device pushed, decided once by the client
 */
enum class MessageType {
    State,          ///< Operating state changed (fan mode, heat mode, ...)
    Environmental,  ///< Fresh sensor readings
    Other           ///< Anything else, including connection status changes
};

[[nodiscard]] inline auto messageTypeToString(MessageType type)
    -> std::string {
    switch (type) {
        case MessageType::State:
            return "state";
        case MessageType::Environmental:
            return "environmental";
        case MessageType::Other:
            return "other";
    }
    return "other";
}

using MessageListener = std::function<void(MessageType)>;

/**
 * @class ProtocolClient
 * @brief Connection to one physical device.
 *
 * Implementations deliver messages on a context they own. connect() must
 * not block on ongoing traffic: it returns once the session is up.
 */
class ProtocolClient {
public:
    virtual ~ProtocolClient() = default;

    /**
     * @brief Open a session to the device
     * @param address IP address or hostname
     * @throws ConnectTimeoutException if the device did not answer in time
     * @throws ConnectionException for every other failure
     */
    virtual void connect(const std::string& address) = 0;

    /**
     * @brief Close the session; a no-op when not connected
     */
    virtual void disconnect() = 0;

    /**
     * @brief Ask the device to publish fresh environmental data
     * @throws ConnectionLostException if the session vanished concurrently
     */
    virtual void requestEnvironmentalData() = 0;

    virtual void addMessageListener(MessageListener listener) = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /**
     * @brief Identity used to register the device with discovery
     */
    [[nodiscard]] virtual auto identity() const -> DeviceIdentity = 0;
};

/**
 * @brief Creates the protocol client for a device record
 */
using ProtocolClientFactory =
    std::function<std::unique_ptr<ProtocolClient>(const DeviceRecord&)>;

}  // namespace purelink::device

#endif  // PURELINK_DEVICE_PROTOCOL_CLIENT_HPP
