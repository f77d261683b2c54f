/*
 * device_handle.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Live connection wrapper around one device record

**************************************************/

#ifndef PURELINK_DEVICE_DEVICE_HANDLE_HPP
#define PURELINK_DEVICE_DEVICE_HANDLE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "device_record.hpp"
#include "protocol_client.hpp"
#include "timer/timer_service.hpp"

namespace purelink::device {

/**
 * @class DeviceHandle
 * @brief Owns one device's protocol client, its connect-retry timer and its
 * environmental refresh timer.
 *
 * The handle is responsible for:
 * - Connecting to a known address and retrying timeouts at a fixed interval
 * - Periodically asking a connected device for environmental data
 * - Cancelling both timers on disconnect
 *
 * Connection status is always read from the protocol client. At most one
 * refresh timer and one retry timer are pending at any time.
 */
class DeviceHandle : public std::enable_shared_from_this<DeviceHandle> {
public:
    static constexpr std::chrono::seconds DEFAULT_ENVIRONMENT_REFRESH{30};
    static constexpr std::chrono::seconds DEFAULT_RETRY_DELAY{30};

    /**
     * @brief Creates a shared handle; timers need a shared owner.
     * @param record Static device data
     * @param client Protocol client, owned by the handle from now on
     * @param timers Timer service used for refresh and retry
     * @param environmentRefresh Interval between environmental requests
     */
    static auto createShared(
        DeviceRecord record, std::unique_ptr<ProtocolClient> client,
        std::shared_ptr<timer::TimerService> timers,
        std::chrono::seconds environmentRefresh = DEFAULT_ENVIRONMENT_REFRESH)
        -> std::shared_ptr<DeviceHandle>;

    DeviceHandle(DeviceRecord record, std::unique_ptr<ProtocolClient> client,
                 std::shared_ptr<timer::TimerService> timers,
                 std::chrono::seconds environmentRefresh);
    ~DeviceHandle();

    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;

    [[nodiscard]] auto name() const -> const std::string& {
        return record_.name;
    }
    [[nodiscard]] auto serial() const -> const std::string& {
        return record_.serial;
    }
    [[nodiscard]] auto record() const -> const DeviceRecord& {
        return record_;
    }

    [[nodiscard]] auto client() -> ProtocolClient& { return *client_; }
    [[nodiscard]] auto client() const -> const ProtocolClient& {
        return *client_;
    }

    /**
     * @brief Connect to the device and start the refresh timer
     *
     * A no-op when already connected. A connect timeout schedules one retry
     * after retryDelay, again and again until success or disconnect().
     *
     * @param address IP address or hostname of the device
     * @param retryDelay Fixed delay between timeout retries
     * @throws ConnectionException for connect failures other than timeouts
     */
    void connect(const std::string& address,
                 std::chrono::seconds retryDelay = DEFAULT_RETRY_DELAY);

    /**
     * @brief Cancel both timers and close the session. Idempotent.
     */
    void disconnect();

    [[nodiscard]] auto isConnected() const -> bool;

    [[nodiscard]] auto hasRefreshTimer() const -> bool;
    [[nodiscard]] auto hasRetryTimer() const -> bool;

    [[nodiscard]] auto environmentRefresh() const -> std::chrono::seconds {
        return environmentRefresh_;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    struct PendingTimer {
        timer::TimerId id;
        std::uint64_t token;
    };

    void scheduleRefreshLocked();
    void scheduleRetryLocked(const std::string& address,
                             std::chrono::seconds retryDelay);
    void cancelRefreshLocked();
    void cancelRetryLocked();

    void onRefreshTimer(std::uint64_t token);
    void onRetryTimer(std::uint64_t token, const std::string& address,
                      std::chrono::seconds retryDelay);

    DeviceRecord record_;
    std::unique_ptr<ProtocolClient> client_;
    std::shared_ptr<timer::TimerService> timers_;
    std::chrono::seconds environmentRefresh_;

    mutable std::mutex mutex_;
    std::optional<PendingTimer> refreshTimer_;
    std::optional<PendingTimer> retryTimer_;
    std::uint64_t nextToken_{1};
    std::uint64_t generation_{0};  // bumped by disconnect()

    std::atomic<std::uint64_t> connectAttempts_{0};
    std::atomic<std::uint64_t> timeouts_{0};
};

}  // namespace purelink::device

#endif  // PURELINK_DEVICE_DEVICE_HANDLE_HPP
