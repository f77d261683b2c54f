/*
 * device_fakes.hpp - Mocks and a manual clock shared by device tests
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef PURELINK_TESTS_DEVICE_DEVICE_FAKES_HPP
#define PURELINK_TESTS_DEVICE_DEVICE_FAKES_HPP

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "device/discovery.hpp"
#include "device/protocol_client.hpp"
#include "timer/timer_service.hpp"

namespace purelink::test {

/**
 * @brief TimerService driven by advance() instead of a clock
 *
 * Due tasks run on the calling thread, earliest first. Tasks scheduled by a
 * running task are eligible within the same advance() window.
 */
class ManualTimerService : public timer::TimerService {
public:
    auto schedule(std::chrono::milliseconds delay, Task task)
        -> timer::TimerId override {
        std::lock_guard lock(mutex_);
        const auto id = nextId_++;
        tasks_[id] = Entry{now_ + delay, delay, std::move(task)};
        ++scheduledTotal_;
        return id;
    }

    auto cancel(timer::TimerId id) -> bool override {
        std::lock_guard lock(mutex_);
        return tasks_.erase(id) > 0;
    }

    [[nodiscard]] auto pendingCount() const -> std::size_t override {
        std::lock_guard lock(mutex_);
        return tasks_.size();
    }

    void advance(std::chrono::milliseconds duration) {
        const auto target = now() + duration;
        while (true) {
            Task task;
            {
                std::lock_guard lock(mutex_);
                auto next = tasks_.end();
                for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
                    if (it->second.due <= target &&
                        (next == tasks_.end() || it->second.due < next->second.due)) {
                        next = it;
                    }
                }
                if (next == tasks_.end()) {
                    break;
                }
                now_ = next->second.due;
                task = std::move(next->second.task);
                tasks_.erase(next);
            }
            task();
        }
        std::lock_guard lock(mutex_);
        now_ = target;
    }

    [[nodiscard]] auto now() const -> std::chrono::milliseconds {
        std::lock_guard lock(mutex_);
        return now_;
    }

    /**
     * @brief Delays of all pending tasks, in scheduling order
     */
    [[nodiscard]] auto pendingDelays() const
        -> std::vector<std::chrono::milliseconds> {
        std::lock_guard lock(mutex_);
        std::vector<std::chrono::milliseconds> delays;
        for (const auto& [id, entry] : tasks_) {
            delays.push_back(entry.delay);
        }
        return delays;
    }

    [[nodiscard]] auto scheduledTotal() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return scheduledTotal_;
    }

private:
    struct Entry {
        std::chrono::milliseconds due;
        std::chrono::milliseconds delay;
        Task task;
    };

    mutable std::mutex mutex_;
    std::chrono::milliseconds now_{0};
    timer::TimerId nextId_{1};
    std::size_t scheduledTotal_{0};
    std::map<timer::TimerId, Entry> tasks_;
};

/**
 * @brief Protocol client whose connection flag follows connect/disconnect
 */
class MockProtocolClient : public device::ProtocolClient {
public:
    explicit MockProtocolClient(std::string serial = "AB1-UK-0001A",
                                std::string productType = "455")
        : identity_{std::move(serial), std::move(productType)} {
        using ::testing::_;
        ON_CALL(*this, isConnected()).WillByDefault([this]() {
            return connected.load();
        });
        ON_CALL(*this, identity()).WillByDefault([this]() {
            return identity_;
        });
        ON_CALL(*this, connect(_)).WillByDefault([this](const std::string&) {
            connected = true;
        });
        ON_CALL(*this, disconnect()).WillByDefault([this]() {
            connected = false;
        });
        ON_CALL(*this, addMessageListener(_))
            .WillByDefault([this](device::MessageListener listener) {
                std::lock_guard lock(listenerMutex_);
                listeners.push_back(std::move(listener));
            });
    }

    MOCK_METHOD(void, connect, (const std::string&), (override));
    MOCK_METHOD(void, disconnect, (), (override));
    MOCK_METHOD(void, requestEnvironmentalData, (), (override));
    MOCK_METHOD(void, addMessageListener, (device::MessageListener),
                (override));
    MOCK_METHOD(bool, isConnected, (), (const, override));
    MOCK_METHOD(device::DeviceIdentity, identity, (), (const, override));

    /**
     * @brief Deliver a message to every registered listener
     */
    void emit(device::MessageType type) {
        std::vector<device::MessageListener> copy;
        {
            std::lock_guard lock(listenerMutex_);
            copy = listeners;
        }
        for (const auto& listener : copy) {
            listener(type);
        }
    }

    [[nodiscard]] auto listenerCount() {
        std::lock_guard lock(listenerMutex_);
        return listeners.size();
    }

    std::atomic<bool> connected{false};
    std::vector<device::MessageListener> listeners;

private:
    device::DeviceIdentity identity_;
    std::mutex listenerMutex_;
};

/**
 * @brief Discovery that remembers callbacks so tests can fire them
 */
class MockDiscovery : public device::Discovery {
public:
    MockDiscovery() {
        using ::testing::_;
        ON_CALL(*this, registerDevice(_, _))
            .WillByDefault([this](const device::DeviceIdentity& identity,
                                  OnFound onFound) {
                callbacks[identity.serial] = std::move(onFound);
            });
    }

    MOCK_METHOD(void, startDiscovery, (), (override));
    MOCK_METHOD(void, stopDiscovery, (), (override));
    MOCK_METHOD(void, registerDevice,
                (const device::DeviceIdentity&, OnFound), (override));

    /**
     * @brief Fire the discovery callback registered for a serial
     * @return false if nothing is registered for it
     */
    auto found(const std::string& serial, const std::string& address)
        -> bool {
        auto it = callbacks.find(serial);
        if (it == callbacks.end()) {
            return false;
        }
        auto callback = it->second;
        callback(address);
        return true;
    }

    std::unordered_map<std::string, OnFound> callbacks;
};

inline auto makeRecord(const std::string& name, const std::string& serial)
    -> device::DeviceRecord {
    device::DeviceRecord record;
    record.name = name;
    record.serial = serial;
    record.credentials = "c2VjcmV0";
    record.productType = "455";
    return record;
}

}  // namespace purelink::test

#endif  // PURELINK_TESTS_DEVICE_DEVICE_FAKES_HPP
