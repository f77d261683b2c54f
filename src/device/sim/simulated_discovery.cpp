/*
 * simulated_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "simulated_discovery.hpp"

#include <spdlog/spdlog.h>

namespace purelink::device::sim {

SimulatedDiscovery::SimulatedDiscovery(
    std::unordered_map<std::string, std::string> addresses,
    std::shared_ptr<timer::TimerService> timers,
    std::chrono::milliseconds delay)
    : timers_(std::move(timers)), delay_(delay) {
    for (auto& [serial, address] : addresses) {
        addresses_[normalizeSerial(serial)] = std::move(address);
    }
}

SimulatedDiscovery::~SimulatedDiscovery() { stopDiscovery(); }

void SimulatedDiscovery::startDiscovery() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    spdlog::debug("[sim] discovery started with {} registrations",
                  registrations_.size());
    for (auto& [serial, registration] : registrations_) {
        armLocked(serial, registration);
    }
}

void SimulatedDiscovery::stopDiscovery() {
    std::lock_guard lock(mutex_);
    if (!running_) {
        return;
    }
    running_ = false;
    for (auto& [serial, registration] : registrations_) {
        if (registration.timer) {
            timers_->cancel(*registration.timer);
            registration.timer.reset();
        }
    }
    spdlog::debug("[sim] discovery stopped");
}

void SimulatedDiscovery::registerDevice(const DeviceIdentity& identity,
                                        OnFound onFound) {
    const auto serial = normalizeSerial(identity.serial);
    std::lock_guard lock(mutex_);

    auto& registration = registrations_[serial];
    if (registration.timer) {
        timers_->cancel(*registration.timer);
        registration.timer.reset();
    }
    registration.onFound = std::move(onFound);
    if (running_) {
        armLocked(serial, registration);
    }
}

auto SimulatedDiscovery::isRunning() const -> bool {
    std::lock_guard lock(mutex_);
    return running_;
}

auto SimulatedDiscovery::registrationCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return registrations_.size();
}

void SimulatedDiscovery::armLocked(const std::string& serial,
                                   Registration& registration) {
    if (registration.timer || addresses_.find(serial) == addresses_.end()) {
        return;
    }
    registration.timer =
        timers_->schedule(delay_, [this, serial] { found(serial); });
}

void SimulatedDiscovery::found(const std::string& serial) {
    OnFound onFound;
    std::string address;
    {
        std::lock_guard lock(mutex_);
        auto it = registrations_.find(serial);
        if (!running_ || it == registrations_.end()) {
            return;
        }
        onFound = std::move(it->second.onFound);
        registrations_.erase(it);
        address = addresses_.at(serial);
    }

    spdlog::debug("[sim] found {} at {}", serial, address);
    if (onFound) {
        onFound(address);
    }
}

}  // namespace purelink::device::sim
