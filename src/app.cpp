/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: purelink daemon entry point

**************************************************/

#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>

#include "common/connection_exceptions.hpp"
#include "config/fleet_config.hpp"
#include "device/connection_manager.hpp"
#include "device/sim/simulated_client.hpp"
#include "device/sim/simulated_discovery.hpp"
#include "logging/log_setup.hpp"
#include "timer/asio_timer_service.hpp"

using namespace purelink;

namespace {

void logUpdate(const std::string& name, device::ProtocolClient& client,
               bool isState, bool isEnvironmental) {
    spdlog::info("Update from \"{}\" (serial={}): state={} environmental={}",
                 name, client.identity().serial, isState, isEnvironmental);
}

void waitForSignal() {
    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down", signal);
        }
    });
    io.run();
}

}  // namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "purelink.json";

    config::FleetConfig fleet;
    try {
        fleet = config::FleetConfig::load(configPath);
    } catch (const ConfigurationException& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    logging::setupLogging(fleet.logging);
    spdlog::info("Starting up with {} configured devices",
                 fleet.devices.size());
    if (fleet.connection.includeInactiveDevices) {
        spdlog::info("Including devices marked \"inactive\"");
    }

    if (!fleet.simulation.enabled) {
        spdlog::critical(
            "No device protocol backend is built in; enable \"simulation\"");
        return EXIT_FAILURE;
    }

    auto timers = std::make_shared<timer::AsioTimerService>();
    auto discovery = std::make_shared<device::sim::SimulatedDiscovery>(
        fleet.simulation.addresses, timers,
        std::chrono::milliseconds(fleet.simulation.discoveryDelayMs));
    auto clientFactory = [](const device::DeviceRecord& record)
        -> std::unique_ptr<device::ProtocolClient> {
        return std::make_unique<device::sim::SimulatedClient>(record);
    };

    int status = EXIT_SUCCESS;
    {
        device::ConnectionManager manager(logUpdate, discovery, clientFactory,
                                          timers, fleet.connection);
        try {
            manager.start(fleet.monitoredDevices(), fleet.hosts,
                          fleet.connection.reconnect);
            waitForSignal();
        } catch (const ConnectionException& e) {
            spdlog::critical("Could not start: {}", e.what());
            status = EXIT_FAILURE;
        }

        manager.shutdown();
        spdlog::info("Final status: {}", manager.toJson().dump());
    }

    timers->stop();
    return status;
}
