/*
 * device_handle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: DeviceHandle connect, retry and refresh timer handling

**************************************************/

#include "device_handle.hpp"

#include <spdlog/spdlog.h>

#include "common/connection_exceptions.hpp"

namespace purelink::device {

auto DeviceHandle::createShared(DeviceRecord record,
                                std::unique_ptr<ProtocolClient> client,
                                std::shared_ptr<timer::TimerService> timers,
                                std::chrono::seconds environmentRefresh)
    -> std::shared_ptr<DeviceHandle> {
    return std::make_shared<DeviceHandle>(std::move(record), std::move(client),
                                          std::move(timers),
                                          environmentRefresh);
}

DeviceHandle::DeviceHandle(DeviceRecord record,
                           std::unique_ptr<ProtocolClient> client,
                           std::shared_ptr<timer::TimerService> timers,
                           std::chrono::seconds environmentRefresh)
    : record_(std::move(record)),
      client_(std::move(client)),
      timers_(std::move(timers)),
      environmentRefresh_(environmentRefresh) {
    if (!client_) {
        throw ConnectionException("No protocol client", record_.serial,
                                  ConnectionErrorCode::InvalidArgument);
    }
    if (!timers_) {
        throw ConnectionException("No timer service", record_.serial,
                                  ConnectionErrorCode::InvalidArgument);
    }
}

DeviceHandle::~DeviceHandle() {
    std::lock_guard lock(mutex_);
    cancelRefreshLocked();
    cancelRetryLocked();
}

void DeviceHandle::connect(const std::string& address,
                           std::chrono::seconds retryDelay) {
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        cancelRetryLocked();
        generation = generation_;
    }

    if (isConnected()) {
        spdlog::info("Already connected to {} ({}); no need to reconnect.",
                     address, serial());
        return;
    }

    connectAttempts_.fetch_add(1);
    try {
        client_->connect(address);
    } catch (const ConnectTimeoutException&) {
        timeouts_.fetch_add(1);
        std::lock_guard lock(mutex_);
        if (generation != generation_) {
            spdlog::debug(
                "Timeout connecting to {} ({}) after disconnect; not retrying",
                address, serial());
            return;
        }
        spdlog::error("Timeout connecting to {} ({}); will retry in {}s",
                      address, serial(), retryDelay.count());
        scheduleRetryLocked(address, retryDelay);
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (generation == generation_) {
            cancelRetryLocked();
            scheduleRefreshLocked();
            spdlog::info("Connected to {} ({}) at {}", name(), serial(),
                         address);
            return;
        }
    }

    spdlog::warn("Connected to {} ({}) after disconnect was requested; "
                 "disconnecting again",
                 address, serial());
    client_->disconnect();
}

void DeviceHandle::disconnect() {
    {
        std::lock_guard lock(mutex_);
        ++generation_;
        cancelRefreshLocked();
        cancelRetryLocked();
    }
    client_->disconnect();
}

auto DeviceHandle::isConnected() const -> bool {
    return client_->isConnected();
}

auto DeviceHandle::hasRefreshTimer() const -> bool {
    std::lock_guard lock(mutex_);
    return refreshTimer_.has_value();
}

auto DeviceHandle::hasRetryTimer() const -> bool {
    std::lock_guard lock(mutex_);
    return retryTimer_.has_value();
}

auto DeviceHandle::toJson() const -> nlohmann::json {
    nlohmann::json j = record_.toJson();
    j["connected"] = isConnected();
    {
        std::lock_guard lock(mutex_);
        j["refreshPending"] = refreshTimer_.has_value();
        j["retryPending"] = retryTimer_.has_value();
    }
    j["connectAttempts"] = connectAttempts_.load();
    j["timeouts"] = timeouts_.load();
    return j;
}

void DeviceHandle::scheduleRefreshLocked() {
    cancelRefreshLocked();

    const auto token = nextToken_++;
    auto weak = weak_from_this();
    auto id = timers_->schedule(environmentRefresh_, [weak, token] {
        if (auto self = weak.lock()) {
            self->onRefreshTimer(token);
        }
    });
    refreshTimer_ = PendingTimer{id, token};
}

void DeviceHandle::scheduleRetryLocked(const std::string& address,
                                       std::chrono::seconds retryDelay) {
    cancelRetryLocked();

    const auto token = nextToken_++;
    auto weak = weak_from_this();
    auto id = timers_->schedule(retryDelay, [weak, token, address, retryDelay] {
        if (auto self = weak.lock()) {
            self->onRetryTimer(token, address, retryDelay);
        }
    });
    retryTimer_ = PendingTimer{id, token};
}

void DeviceHandle::cancelRefreshLocked() {
    if (refreshTimer_) {
        timers_->cancel(refreshTimer_->id);
        refreshTimer_.reset();
    }
}

void DeviceHandle::cancelRetryLocked() {
    if (retryTimer_) {
        timers_->cancel(retryTimer_->id);
        retryTimer_.reset();
    }
}

void DeviceHandle::onRefreshTimer(std::uint64_t token) {
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        if (!refreshTimer_ || refreshTimer_->token != token) {
            return;
        }
        refreshTimer_.reset();
        generation = generation_;
    }

    if (!isConnected()) {
        spdlog::debug("Device {} is disconnected.", serial());
        return;
    }

    spdlog::debug("Requesting updated environmental data from {}", serial());
    try {
        client_->requestEnvironmentalData();
    } catch (const ConnectionLostException& e) {
        spdlog::error("Race with a disconnect on {}? Skipping an iteration: {}",
                      serial(), e.what());
    }

    std::lock_guard lock(mutex_);
    if (generation == generation_) {
        scheduleRefreshLocked();
    }
}

void DeviceHandle::onRetryTimer(std::uint64_t token, const std::string& address,
                                std::chrono::seconds retryDelay) {
    {
        std::lock_guard lock(mutex_);
        if (!retryTimer_ || retryTimer_->token != token) {
            return;
        }
        retryTimer_.reset();
    }

    spdlog::info("Retrying connection to {} ({})", address, serial());
    try {
        connect(address, retryDelay);
    } catch (const ConnectionException& e) {
        spdlog::error("Giving up on {} ({}): {}", address, serial(), e.what());
    }
}

}  // namespace purelink::device
