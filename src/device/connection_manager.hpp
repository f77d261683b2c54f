/*
 * connection_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Connection Manager - keeps a fleet of devices connected

**************************************************/

#ifndef PURELINK_DEVICE_CONNECTION_MANAGER_HPP
#define PURELINK_DEVICE_CONNECTION_MANAGER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/connection_config.hpp"
#include "device_handle.hpp"
#include "device_record.hpp"
#include "discovery.hpp"
#include "protocol_client.hpp"
#include "timer/timer_service.hpp"

namespace purelink::device {

/**
 * @brief Receives every accepted device message, already classified
 */
using UpdateSink = std::function<void(const std::string& deviceName,
                                      ProtocolClient& client, bool isState,
                                      bool isEnvironmental)>;

/**
 * @class ConnectionManager
 * @brief Owns the device handles and the shared discovery subsystem.
 *
 * The ConnectionManager is responsible for:
 * - Creating one DeviceHandle per configured device
 * - Connecting directly to devices with a manual address and registering
 *   the others with discovery
 * - Routing discovery results and device messages back to their handle
 * - Rediscovering devices that drop off, when reconnect is enabled
 */
class ConnectionManager {
public:
    /**
     * @param updateSink Consumer of classified device messages
     * @param discovery Shared discovery subsystem
     * @param clientFactory Creates the protocol client of each device
     * @param timers Timer service shared by all handles
     * @param config Refresh interval, retry delay and rediscovery policy
     */
    ConnectionManager(UpdateSink updateSink,
                      std::shared_ptr<Discovery> discovery,
                      ProtocolClientFactory clientFactory,
                      std::shared_ptr<timer::TimerService> timers,
                      config::ConnectionConfig config = {});

    /**
     * @brief Waits for callbacks in flight, then shuts down if still running
     *
     * Discovery and handles may outlive the manager; their callbacks become
     * no-ops once destruction begins.
     */
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Create handles, start discovery and add every device
     * @param devices Device records; serials must be unique
     * @param hosts Manual serial to address overrides
     * @param reconnect Rediscover devices that report a disconnect
     * @throws ConnectionException if already started, on duplicate serials,
     *         or when a manually addressed device fails with a non-timeout
     *         error
     */
    void start(const std::vector<DeviceRecord>& devices, HostOverrideMap hosts,
               bool reconnect = true);

    /**
     * @brief Connect a handle directly or register it with discovery
     * @param handle Handle owned by this manager
     * @param registerListener Attach the message listener; pass false when
     *        the handle was added before, or messages get delivered twice
     * @throws ConnectionException on non-timeout connect failures
     */
    void addDevice(const std::shared_ptr<DeviceHandle>& handle,
                   bool registerListener = true);

    /**
     * @brief Stop discovery, then disconnect every device. Idempotent.
     */
    void shutdown();

    [[nodiscard]] auto devices() const
        -> const std::vector<std::shared_ptr<DeviceHandle>>& {
        return devices_;
    }

    /**
     * @brief Find a handle by serial, ignoring case
     * @return The handle or nullptr
     */
    [[nodiscard]] auto findDevice(const std::string& serial) const
        -> std::shared_ptr<DeviceHandle>;

    [[nodiscard]] auto connectedCount() const -> std::size_t;

    [[nodiscard]] auto isStarted() const -> bool { return started_.load(); }
    [[nodiscard]] auto isReconnectEnabled() const -> bool {
        return reconnect_.load();
    }
    [[nodiscard]] auto discoveryRestarts() const -> std::uint64_t {
        return discoveryRestarts_.load();
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    /**
     * @brief Admits discovery and message callbacks while the manager lives
     *
     * Shared with every callback. close() blocks until callbacks running on
     * other threads have left; nested entries from the closing thread do not
     * count.
     */
    class CallbackGate {
    public:
        class Pass {
        public:
            explicit Pass(CallbackGate& gate) : gate_(gate), ok_(gate.enter()) {}
            ~Pass() {
                if (ok_) {
                    gate_.leave();
                }
            }
            Pass(const Pass&) = delete;
            Pass& operator=(const Pass&) = delete;

            explicit operator bool() const { return ok_; }

        private:
            CallbackGate& gate_;
            bool ok_;
        };

        void close();

    private:
        auto enter() -> bool;
        void leave();

        std::mutex mutex_;
        std::condition_variable idle_;
        bool open_{true};
        std::unordered_map<std::thread::id, int> active_;
    };

    void onMessage(const std::weak_ptr<DeviceHandle>& weak, MessageType type);
    void onDiscovered(const std::weak_ptr<DeviceHandle>& weak,
                      const std::string& address);
    void reconnectDevice(const std::shared_ptr<DeviceHandle>& handle);
    void restartDiscovery();

    UpdateSink updateSink_;
    std::shared_ptr<Discovery> discovery_;
    ProtocolClientFactory clientFactory_;
    std::shared_ptr<timer::TimerService> timers_;
    config::ConnectionConfig config_;

    std::vector<std::shared_ptr<DeviceHandle>> devices_;
    HostOverrideMap hosts_;

    std::atomic<bool> reconnect_{true};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> discoveryRestarts_{0};

    std::shared_ptr<CallbackGate> gate_{std::make_shared<CallbackGate>()};

    std::mutex discoveryMutex_;
    std::mutex reconnectMutex_;
    std::unordered_set<std::string> reconnecting_;
};

}  // namespace purelink::device

#endif  // PURELINK_DEVICE_CONNECTION_MANAGER_HPP
