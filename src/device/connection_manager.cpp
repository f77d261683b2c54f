/*
 * connection_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Connection Manager implementation

**************************************************/

#include "connection_manager.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "common/connection_exceptions.hpp"

namespace purelink::device {

ConnectionManager::ConnectionManager(UpdateSink updateSink,
                                     std::shared_ptr<Discovery> discovery,
                                     ProtocolClientFactory clientFactory,
                                     std::shared_ptr<timer::TimerService> timers,
                                     config::ConnectionConfig config)
    : updateSink_(std::move(updateSink)),
      discovery_(std::move(discovery)),
      clientFactory_(std::move(clientFactory)),
      timers_(std::move(timers)),
      config_(config) {
    if (!updateSink_ || !discovery_ || !clientFactory_ || !timers_) {
        throw ConnectionException("ConnectionManager: missing collaborator",
                                  ConnectionErrorCode::InvalidArgument);
    }
}

ConnectionManager::~ConnectionManager() {
    gate_->close();
    shutdown();
}

void ConnectionManager::start(const std::vector<DeviceRecord>& devices,
                              HostOverrideMap hosts, bool reconnect) {
    if (started_.exchange(true)) {
        throw ConnectionException("ConnectionManager: already started",
                                  ConnectionErrorCode::InvalidState);
    }

    hosts_ = std::move(hosts);
    reconnect_ = reconnect;

    std::unordered_set<std::string> serials;
    for (const auto& record : devices) {
        if (!serials.insert(normalizeSerial(record.serial)).second) {
            throw ConnectionException("Duplicate device serial", record.serial,
                                      ConnectionErrorCode::InvalidArgument);
        }
        auto client = clientFactory_(record);
        if (!client) {
            throw ConnectionException("No protocol client for device",
                                      record.serial,
                                      ConnectionErrorCode::InvalidArgument);
        }
        devices_.push_back(DeviceHandle::createShared(
            record, std::move(client), timers_, config_.environmentRefresh()));
    }

    spdlog::info("Starting discovery...");
    {
        std::lock_guard lock(discoveryMutex_);
        discovery_->startDiscovery();
    }

    for (const auto& handle : devices_) {
        addDevice(handle, true);
    }
}

void ConnectionManager::addDevice(const std::shared_ptr<DeviceHandle>& handle,
                                  bool registerListener) {
    std::weak_ptr<DeviceHandle> weak = handle;

    if (registerListener) {
        handle->client().addMessageListener(
            [this, gate = gate_, weak](MessageType type) {
                CallbackGate::Pass pass(*gate);
                if (pass) {
                    onMessage(weak, type);
                }
            });
    }

    if (auto manualAddress = hosts_.find(handle->serial())) {
        spdlog::info(
            "Attempting connection to device \"{}\" (serial={}) via "
            "configured IP {}",
            handle->name(), handle->serial(), *manualAddress);
        handle->connect(*manualAddress, config_.retryDelay());
        return;
    }

    spdlog::info("Attempting to discover device \"{}\" (serial={})",
                 handle->name(), handle->serial());
    discovery_->registerDevice(
        handle->client().identity(),
        [this, gate = gate_, weak](const std::string& address) {
            CallbackGate::Pass pass(*gate);
            if (pass) {
                onDiscovered(weak, address);
            }
        });
}

void ConnectionManager::shutdown() {
    if (!started_.load() || stopped_.exchange(true)) {
        return;
    }

    {
        std::lock_guard lock(discoveryMutex_);
        discovery_->stopDiscovery();
    }

    for (const auto& handle : devices_) {
        spdlog::info("Disconnecting from {} ({})", handle->name(),
                     handle->serial());
        try {
            handle->disconnect();
        } catch (const ConnectionException& e) {
            spdlog::error("Failed to disconnect {}: {}", handle->serial(),
                          e.what());
        }
    }
}

auto ConnectionManager::findDevice(const std::string& serial) const
    -> std::shared_ptr<DeviceHandle> {
    const auto wanted = normalizeSerial(serial);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&wanted](const auto& handle) {
                               return normalizeSerial(handle->serial()) ==
                                      wanted;
                           });
    return it == devices_.end() ? nullptr : *it;
}

auto ConnectionManager::connectedCount() const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(devices_.begin(), devices_.end(),
                      [](const auto& handle) { return handle->isConnected(); }));
}

auto ConnectionManager::toJson() const -> nlohmann::json {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& handle : devices_) {
        devices.push_back(handle->toJson());
    }
    return {{"started", started_.load()},
            {"stopped", stopped_.load()},
            {"reconnect", reconnect_.load()},
            {"discoveryRestarts", discoveryRestarts_.load()},
            {"connected", connectedCount()},
            {"devices", devices}};
}

void ConnectionManager::onMessage(const std::weak_ptr<DeviceHandle>& weak,
                                  MessageType type) {
    auto handle = weak.lock();
    if (!handle) {
        return;
    }
    if (stopped_.load()) {
        spdlog::debug("Ignoring {} message from {} after shutdown",
                      messageTypeToString(type), handle->serial());
        return;
    }

    spdlog::debug("Received update from {}: {}", handle->serial(),
                  messageTypeToString(type));

    if (!handle->isConnected()) {
        if (reconnect_.load()) {
            reconnectDevice(handle);
            return;
        }
        spdlog::info("Device {} is disconnected; reconnect is disabled",
                     handle->serial());
    }

    const bool isState = type == MessageType::State;
    const bool isEnvironmental = type == MessageType::Environmental;
    try {
        updateSink_(handle->name(), handle->client(), isState,
                    isEnvironmental);
    } catch (const std::exception& e) {
        spdlog::error("Update sink failed for {}: {}", handle->serial(),
                      e.what());
    }
}

void ConnectionManager::onDiscovered(const std::weak_ptr<DeviceHandle>& weak,
                                     const std::string& address) {
    auto handle = weak.lock();
    if (!handle || stopped_.load()) {
        return;
    }

    spdlog::info("Discovered {} on {}", handle->serial(), address);
    try {
        handle->connect(address, config_.retryDelay());
    } catch (const ConnectionException& e) {
        spdlog::error("Could not connect to device \"{}\" (serial={}) at {}: {}",
                      handle->name(), handle->serial(), address, e.what());
    }
}

void ConnectionManager::reconnectDevice(
    const std::shared_ptr<DeviceHandle>& handle) {
    {
        std::lock_guard lock(reconnectMutex_);
        if (!reconnecting_.insert(handle->serial()).second) {
            spdlog::debug("Device {} is already being re-added",
                          handle->serial());
            return;
        }
    }

    spdlog::info("Device {} is now disconnected, clearing it and re-adding",
                 handle->serial());
    try {
        handle->disconnect();
        if (config_.restartDiscoveryOnDisconnect) {
            restartDiscovery();
        }
        addDevice(handle, false);
    } catch (const std::exception& e) {
        spdlog::error("Failed to re-add device {}: {}", handle->serial(),
                      e.what());
    }

    std::lock_guard lock(reconnectMutex_);
    reconnecting_.erase(handle->serial());
}

void ConnectionManager::restartDiscovery() {
    std::lock_guard lock(discoveryMutex_);
    if (stopped_.load()) {
        return;
    }
    spdlog::info("Restarting discovery");
    discovery_->stopDiscovery();
    discovery_->startDiscovery();
    discoveryRestarts_.fetch_add(1);
}

auto ConnectionManager::CallbackGate::enter() -> bool {
    std::lock_guard lock(mutex_);
    if (!open_) {
        return false;
    }
    ++active_[std::this_thread::get_id()];
    return true;
}

void ConnectionManager::CallbackGate::leave() {
    std::lock_guard lock(mutex_);
    auto it = active_.find(std::this_thread::get_id());
    if (it != active_.end() && --it->second == 0) {
        active_.erase(it);
    }
    idle_.notify_all();
}

void ConnectionManager::CallbackGate::close() {
    std::unique_lock lock(mutex_);
    open_ = false;
    const auto self = std::this_thread::get_id();
    idle_.wait(lock, [this, self] {
        return active_.empty() ||
               (active_.size() == 1 && active_.count(self) == 1);
    });
}

}  // namespace purelink::device
