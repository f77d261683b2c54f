/*
 * simulated_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "simulated_client.hpp"

#include <spdlog/spdlog.h>

#include "common/connection_exceptions.hpp"

namespace purelink::device::sim {

SimulatedClient::SimulatedClient(const DeviceRecord& record)
    : identity_{record.serial, record.productType} {}

void SimulatedClient::connect(const std::string& address) {
    if (address.empty()) {
        throw ConnectionException("Empty address", identity_.serial,
                                  ConnectionErrorCode::InvalidArgument);
    }
    {
        std::lock_guard lock(mutex_);
        address_ = address;
    }
    connected_ = true;
    spdlog::debug("[sim] {} connected at {}", identity_.serial, address);
    publish(MessageType::State);
}

void SimulatedClient::disconnect() {
    if (connected_.exchange(false)) {
        spdlog::debug("[sim] {} disconnected", identity_.serial);
    }
}

void SimulatedClient::requestEnvironmentalData() {
    if (!connected_.load()) {
        throw ConnectionLostException(identity_.serial);
    }
    publish(MessageType::Environmental);
}

void SimulatedClient::addMessageListener(MessageListener listener) {
    std::lock_guard lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void SimulatedClient::simulateConnectionDrop() {
    if (connected_.exchange(false)) {
        spdlog::info("[sim] {} dropped its connection", identity_.serial);
        publish(MessageType::Other);
    }
}

auto SimulatedClient::address() const -> std::string {
    std::lock_guard lock(mutex_);
    return address_;
}

void SimulatedClient::publish(MessageType type) {
    std::vector<MessageListener> listeners;
    {
        std::lock_guard lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(type);
    }
}

}  // namespace purelink::device::sim
