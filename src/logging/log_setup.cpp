/*
 * log_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "log_setup.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace purelink::logging {

auto parseLevel(const std::string& level) -> spdlog::level::level_enum {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "critical" || level == "fatal") return spdlog::level::critical;
    if (level == "off" || level == "none") return spdlog::level::off;
    return spdlog::level::info;
}

auto setupLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    const auto level = parseLevel(config.level);
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(level);
    sinks.push_back(console);

    if (config.enableFile) {
        std::filesystem::path path =
            std::filesystem::path(config.logDir) / (config.logFilename + ".log");
        try {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.maxFileSize, config.maxFiles);
            file->set_level(level);
            sinks.push_back(file);
        } catch (const std::exception& e) {
            spdlog::error("Failed to create log file '{}': {}", path.string(),
                          e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("purelink", sinks.begin(),
                                                   sinks.end());
    logger->set_level(level);
    if (!config.pattern.empty()) {
        logger->set_pattern(config.pattern);
    }
    spdlog::set_default_logger(logger);
    return logger;
}

}  // namespace purelink::logging
