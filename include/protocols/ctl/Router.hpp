#pragma once

#include "protocols/ctl/Request.hpp"

#include <shared_mutex>
#include <string>
#include <vector>

namespace usd::registry { class ServiceRegistry; }
namespace usd::supervisor { class Supervisor; }

namespace usd::ctl {

// Executes control requests against the registry and the supervisor. Mutations hold the
// router lock exclusively, so they are totally ordered; list and status share it. Waiting
// for a child to exit happens with the lock released.
class Router {
public:
    Router(registry::ServiceRegistry& registry, supervisor::Supervisor& supervisor, unsigned int defaultLogLines);

    // Never throws: every failure becomes an error response.
    Response handle(const std::string& body) const;

    Response execute(const Request& req) const;

private:
    registry::ServiceRegistry& registry_;
    supervisor::Supervisor& supervisor_;
    unsigned int defaultLogLines_;
    mutable std::shared_mutex mutex_;

    Response dispatch(const Request& req) const;

    Response add(const Request& req) const;
    Response remove(const Request& req) const;
    Response edit(const Request& req) const;
    Response list(const Request& req) const;
    Response status(const Request& req) const;
    Response control(const Request& req) const;

    // Services addressed by name or group; throws NotFound when nothing matches.
    std::vector<std::string> resolveTargets(const Request& req) const;
    nlohmann::json describe(const std::string& name) const;
};

}
