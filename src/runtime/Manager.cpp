#include "runtime/Manager.hpp"
#include "registry/ServiceRegistry.hpp"
#include "registry/Store.hpp"
#include "supervisor/Supervisor.hpp"
#include "supervisor/Reaper.hpp"
#include "protocols/ctl/Router.hpp"
#include "protocols/ctl/Server.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

using namespace usd::log;

namespace usd::runtime {

Manager::Manager(const config::Config& cfg)
    : cfg_(cfg),
      registry_(std::make_shared<registry::ServiceRegistry>(
          std::make_shared<registry::JsonFileStore>(cfg.servicesFile()))),
      supervisor_(std::make_unique<supervisor::Supervisor>(cfg.supervisor, cfg.logDir())),
      reaper_(std::make_unique<supervisor::Reaper>(*supervisor_)),
      router_(std::make_shared<ctl::Router>(*registry_, *supervisor_, cfg.logging.status_log_lines)),
      server_(std::make_unique<ctl::Server>(router_, cfg.socketPath(), cfg.control.max_request_bytes)) {
    util::ensurePrivateDir(cfg_.servicesFile().parent_path());
}

Manager::~Manager() {
    stopAll();
    // children are gone; the reaper and timers must die before the supervisor
    server_.reset();
    reaper_.reset();
}

void Manager::startAll() {
    std::lock_guard lock(mutex_);
    if (started_) return;

    Registry::daemon()->debug("[Manager] Loading service definitions from {}", cfg_.servicesFile().string());
    registry_->load();
    for (const auto& def : registry_->list()) supervisor_->add(def);

    server_->bind();

    reaper_->start();
    server_->start();
    started_ = true;

    startAutostartServices();
    Registry::daemon()->info("[Manager] Supervising {} service(s), control socket {}",
                             registry_->size(), server_->socketPath().string());
}

void Manager::startAutostartServices() const {
    for (const auto& def : registry_->list()) {
        if (!def.autostart) continue;
        try {
            supervisor_->start(def.name);
        } catch (const Error& e) {
            Registry::daemon()->error("[Manager] Autostart of '{}' failed: {}", def.name, e.what());
        }
    }
}

void Manager::stopAll() {
    std::lock_guard lock(mutex_);
    if (!started_) return;

    Registry::daemon()->debug("[Manager] Stopping control server...");
    server_->stop();

    Registry::daemon()->debug("[Manager] Stopping all services...");
    supervisor_->stopAll();

    reaper_->stop();
    started_ = false;
    Registry::daemon()->debug("[Manager] All components stopped.");
}

bool Manager::allRunning() const {
    std::lock_guard lock(mutex_);
    return started_ && reaper_->isRunning() && server_->isRunning();
}

}
