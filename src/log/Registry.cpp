#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>

namespace usd::log {

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    const auto log_file = logDir / "userserversd.log";
    const auto audit_log_file = logDir / "audit.log";

    const auto cnf = config::ConfigRegistry::get().logging;

    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), main_max_bytes_, main_max_files_);
    rotatingSink->set_level(cnf.levels.file_log_level);
    rotatingSink->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{consoleSink, rotatingSink});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("daemon", sub_levels.daemon);
    makeLogger("registry", sub_levels.registry);
    makeLogger("supervisor", sub_levels.supervisor);
    makeLogger("reaper", sub_levels.reaper);
    makeLogger("ctl", sub_levels.ctl);
    makeLogger("config", sub_levels.config);

    // Audit logger (special: append-only file sink, no rotation)
    {
        const auto auditSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(audit_log_file.string(), false);
        const auto logger = std::make_shared<spdlog::logger>("audit", auditSink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    daemon()->debug("[log::Registry] Initialized, log dir: {}", logDir.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
