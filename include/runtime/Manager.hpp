#pragma once

#include "config/Config.hpp"

#include <memory>
#include <mutex>

namespace usd::registry { class ServiceRegistry; }
namespace usd::supervisor { class Supervisor; class Reaper; }
namespace usd::ctl { class Router; class Server; }

namespace usd::runtime {

// Owns the daemon's components and their start/stop ordering.
class Manager {
public:
    explicit Manager(const config::Config& cfg);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Loads definitions, binds the control socket, starts the reaper and the server, then
    // starts every autostart service. Any error here is fatal to the daemon.
    void startAll();

    // Stops accepting requests, stops every child and waits for their reap.
    void stopAll();

    [[nodiscard]] bool allRunning() const;

    [[nodiscard]] registry::ServiceRegistry& registry() const { return *registry_; }
    [[nodiscard]] supervisor::Supervisor& supervisor() const { return *supervisor_; }
    [[nodiscard]] ctl::Router& router() const { return *router_; }

private:
    config::Config cfg_;

    std::shared_ptr<registry::ServiceRegistry> registry_;
    std::unique_ptr<supervisor::Supervisor> supervisor_;
    std::unique_ptr<supervisor::Reaper> reaper_;
    std::shared_ptr<ctl::Router> router_;
    std::unique_ptr<ctl::Server> server_;

    mutable std::mutex mutex_;
    bool started_ = false;

    void startAutostartServices() const;
};

}
