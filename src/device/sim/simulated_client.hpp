/*
 * simulated_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: In-process protocol client for running without hardware

**************************************************/

#ifndef PURELINK_DEVICE_SIM_SIMULATED_CLIENT_HPP
#define PURELINK_DEVICE_SIM_SIMULATED_CLIENT_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "device/protocol_client.hpp"

namespace purelink::device::sim {

/**
 * @class SimulatedClient
 * @brief Pretends to be a device reachable at any non-empty address.
 *
 * Publishes a State message on connect, an Environmental message on every
 * refresh request and an Other message when the session drops.
 */
class SimulatedClient : public ProtocolClient {
public:
    explicit SimulatedClient(const DeviceRecord& record);

    void connect(const std::string& address) override;
    void disconnect() override;
    void requestEnvironmentalData() override;
    void addMessageListener(MessageListener listener) override;

    [[nodiscard]] auto isConnected() const -> bool override {
        return connected_.load();
    }

    [[nodiscard]] auto identity() const -> DeviceIdentity override {
        return identity_;
    }

    /**
     * @brief Drop the session as if the device went away
     */
    void simulateConnectionDrop();

    [[nodiscard]] auto address() const -> std::string;

private:
    void publish(MessageType type);

    DeviceIdentity identity_;
    std::atomic<bool> connected_{false};

    mutable std::mutex mutex_;
    std::string address_;
    std::vector<MessageListener> listeners_;
};

}  // namespace purelink::device::sim

#endif  // PURELINK_DEVICE_SIM_SIMULATED_CLIENT_HPP
