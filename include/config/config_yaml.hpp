#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace usd::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline std::chrono::milliseconds as_ms(const Node& node, const std::chrono::milliseconds def) {
    return node ? std::chrono::milliseconds(node.as<int64_t>()) : def;
}

template<>
struct convert<SupervisorConfig> {
    static Node encode(const SupervisorConfig& rhs) {
        Node node;
        node["backoff_base_ms"] = rhs.backoff_base.count();
        node["backoff_max_ms"] = rhs.backoff_max.count();
        node["stability_threshold_ms"] = rhs.stability_threshold.count();
        node["start_grace_ms"] = rhs.start_grace.count();
        node["max_restarts"] = rhs.max_restarts;
        return node;
    }

    static bool decode(const Node& node, SupervisorConfig& rhs) {
        if (!node.IsMap()) return false;
        const SupervisorConfig def;
        rhs.backoff_base = as_ms(node["backoff_base_ms"], def.backoff_base);
        rhs.backoff_max = as_ms(node["backoff_max_ms"], def.backoff_max);
        rhs.stability_threshold = as_ms(node["stability_threshold_ms"], def.stability_threshold);
        rhs.start_grace = as_ms(node["start_grace_ms"], def.start_grace);
        rhs.max_restarts = node["max_restarts"].as<unsigned int>(def.max_restarts);
        return true;
    }
};

template<>
struct convert<ControlConfig> {
    static Node encode(const ControlConfig& rhs) {
        Node node;
        node["socket_path"] = rhs.socket_path;
        node["max_request_bytes"] = rhs.max_request_bytes;
        return node;
    }

    static bool decode(const Node& node, ControlConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.socket_path = node["socket_path"].as<std::string>("");
        rhs.max_request_bytes = node["max_request_bytes"].as<uint32_t>(MAX_REQUEST_BYTES);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["services_file"] = rhs.services_file;
        node["state_dir"] = rhs.state_dir;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.services_file = node["services_file"].as<std::string>("");
        rhs.state_dir = node["state_dir"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["daemon"]     = to_std_string(spdlog::level::to_string_view(rhs.daemon));
        node["registry"]   = to_std_string(spdlog::level::to_string_view(rhs.registry));
        node["supervisor"] = to_std_string(spdlog::level::to_string_view(rhs.supervisor));
        node["reaper"]     = to_std_string(spdlog::level::to_string_view(rhs.reaper));
        node["ctl"]        = to_std_string(spdlog::level::to_string_view(rhs.ctl));
        node["config"]     = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.daemon = spdlog::level::from_str(node["daemon"].as<std::string>("info"));
        rhs.registry = spdlog::level::from_str(node["registry"].as<std::string>("info"));
        rhs.supervisor = spdlog::level::from_str(node["supervisor"].as<std::string>("info"));
        rhs.reaper = spdlog::level::from_str(node["reaper"].as<std::string>("info"));
        rhs.ctl = spdlog::level::from_str(node["ctl"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["status_log_lines"] = rhs.status_log_lines;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.status_log_lines = node["status_log_lines"].as<unsigned int>(50);
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
