#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace usd::config {

constexpr static uint32_t MAX_REQUEST_BYTES = 1024 * 1024; // 1MiB

struct SupervisorConfig {
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_max{60000};
    std::chrono::milliseconds stability_threshold{10000};  // Running this long resets the failure count
    std::chrono::milliseconds start_grace{1000};           // Starting -> Running once alive this long
    unsigned int max_restarts = 0;                         // 0 = unlimited
};

struct ControlConfig {
    std::string socket_path;  // empty = paths::getSocketPath()
    uint32_t max_request_bytes = MAX_REQUEST_BYTES;
};

struct StorageConfig {
    std::string services_file;  // empty = paths::getServicesPath()
    std::string state_dir;      // empty = paths::getStateDir()
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum daemon     = spdlog::level::info;   // Startup, shutdown, fatal conditions
    spdlog::level::level_enum registry   = spdlog::level::info;   // Definition changes and persistence failures
    spdlog::level::level_enum supervisor = spdlog::level::info;   // State transitions, spawn errors, kills
    spdlog::level::level_enum reaper     = spdlog::level::info;   // Exit routing
    spdlog::level::level_enum ctl        = spdlog::level::info;   // Connections and protocol errors
    spdlog::level::level_enum config     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    unsigned int status_log_lines = 50;
};

struct Config {
    SupervisorConfig supervisor;
    ControlConfig control;
    StorageConfig storage;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path socketPath() const;
    [[nodiscard]] std::filesystem::path servicesFile() const;
    [[nodiscard]] std::filesystem::path stateDir() const;
    [[nodiscard]] std::filesystem::path logDir() const;
};

// Missing file yields the defaults; a malformed file throws.
Config loadConfig(const std::filesystem::path& path);

} // namespace usd::config
