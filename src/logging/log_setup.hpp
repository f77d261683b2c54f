/*
 * log_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Installs the process-wide spdlog logger from configuration

**************************************************/

#ifndef PURELINK_LOGGING_LOG_SETUP_HPP
#define PURELINK_LOGGING_LOG_SETUP_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config/connection_config.hpp"

namespace purelink::logging {

/**
 * @brief Convert a level name ("debug", "warning", ...) to spdlog's enum
 *
 * Unknown names map to info.
 */
[[nodiscard]] auto parseLevel(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Build the default logger: colour console plus optional rotating file
 * @return The logger that is now spdlog's default
 */
auto setupLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace purelink::logging

#endif  // PURELINK_LOGGING_LOG_SETUP_HPP
