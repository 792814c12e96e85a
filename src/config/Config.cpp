#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "paths.hpp"

#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace usd::config {

Config loadConfig(const fs::path& path) {
    Config cfg;
    if (!fs::exists(path)) return cfg;

    YAML::Node root = YAML::LoadFile(path.string());
    if (!root || root.IsNull()) return cfg;

    if (auto node = root["supervisor"]) YAML::convert<SupervisorConfig>::decode(node, cfg.supervisor);
    if (auto node = root["control"]) YAML::convert<ControlConfig>::decode(node, cfg.control);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

fs::path Config::socketPath() const {
    return control.socket_path.empty() ? paths::getSocketPath() : fs::path(control.socket_path);
}

fs::path Config::servicesFile() const {
    return storage.services_file.empty() ? paths::getServicesPath() : fs::path(storage.services_file);
}

fs::path Config::stateDir() const {
    return storage.state_dir.empty() ? paths::getStateDir() : fs::path(storage.state_dir);
}

fs::path Config::logDir() const { return stateDir() / "logs"; }

} // namespace usd::config
