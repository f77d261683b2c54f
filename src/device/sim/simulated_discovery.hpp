/*
 * simulated_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Discovery that "finds" devices from a fixed address table

**************************************************/

#ifndef PURELINK_DEVICE_SIM_SIMULATED_DISCOVERY_HPP
#define PURELINK_DEVICE_SIM_SIMULATED_DISCOVERY_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "device/discovery.hpp"
#include "timer/timer_service.hpp"

namespace purelink::device::sim {

/**
 * @class SimulatedDiscovery
 * @brief Answers registrations after a fixed delay while running.
 *
 * Registrations survive stop/start; each one is answered at most once.
 * Devices missing from the address table are never found.
 */
class SimulatedDiscovery : public Discovery {
public:
    SimulatedDiscovery(std::unordered_map<std::string, std::string> addresses,
                       std::shared_ptr<timer::TimerService> timers,
                       std::chrono::milliseconds delay);
    ~SimulatedDiscovery() override;

    void startDiscovery() override;
    void stopDiscovery() override;
    void registerDevice(const DeviceIdentity& identity,
                        OnFound onFound) override;

    [[nodiscard]] auto isRunning() const -> bool;
    [[nodiscard]] auto registrationCount() const -> std::size_t;

private:
    struct Registration {
        OnFound onFound;
        std::optional<timer::TimerId> timer;
    };

    void armLocked(const std::string& serial, Registration& registration);
    void found(const std::string& serial);

    std::unordered_map<std::string, std::string> addresses_;
    std::shared_ptr<timer::TimerService> timers_;
    std::chrono::milliseconds delay_;

    mutable std::mutex mutex_;
    bool running_{false};
    std::unordered_map<std::string, Registration> registrations_;
};

}  // namespace purelink::device::sim

#endif  // PURELINK_DEVICE_SIM_SIMULATED_DISCOVERY_HPP
