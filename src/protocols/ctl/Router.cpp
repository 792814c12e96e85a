#include "protocols/ctl/Router.hpp"
#include "registry/ServiceRegistry.hpp"
#include "supervisor/Supervisor.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <mutex>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace usd::types;
using namespace usd::log;
using nlohmann::json;

namespace usd::ctl {

Router::Router(registry::ServiceRegistry& registry, supervisor::Supervisor& supervisor, const unsigned int defaultLogLines)
    : registry_(registry), supervisor_(supervisor), defaultLogLines_(defaultLogLines) {}

Response Router::handle(const std::string& body) const {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        Registry::ctl()->warn("[Router] Undecodable request: {}", e.what());
        return Response::failure(ErrorKind::Protocol, fmt::format("invalid JSON: {}", e.what()));
    }

    try {
        return execute(parseRequest(j));
    } catch (const Error& e) {
        return Response::failure(e.kind(), e.what());
    }
}

Response Router::execute(const Request& req) const {
    try {
        return dispatch(req);
    } catch (const Error& e) {
        Registry::ctl()->debug("[Router] {} failed ({}): {}", to_string(req.cmd), to_string(e.kind()), e.what());
        return Response::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        Registry::ctl()->error("[Router] {} failed with internal error: {}", to_string(req.cmd), e.what());
        return Response::failure(ErrorKind::Internal, e.what());
    }
}

Response Router::dispatch(const Request& req) const {
    switch (req.cmd) {
        case Command::Add: return add(req);
        case Command::Remove: return remove(req);
        case Command::Edit: return edit(req);
        case Command::List: return list(req);
        case Command::Status: return status(req);
        case Command::Start:
        case Command::Stop:
        case Command::Restart: return control(req);
    }
    throw Error(ErrorKind::Protocol, "unhandled command");
}

Response Router::add(const Request& req) const {
    const auto& def = *req.service;
    json data;
    bool spawned = false;
    {
        std::unique_lock lock(mutex_);
        registry_.add(def);
        supervisor_.add(def);
        Registry::audit()->info("add service '{}' ({})", def.name, def.command);

        data = describe(def.name);
        if (def.autostart) {
            try {
                supervisor_.start(def.name);
                spawned = true;
            } catch (const Error& e) {
                data["warning"] = fmt::format("service added but failed to start: {}", e.what());
            }
        }
    }

    if (spawned) {
        try {
            supervisor_.awaitStarted(def.name);
        } catch (const Error& e) {
            data["warning"] = fmt::format("service added but failed to start: {}", e.what());
        }
    }

    if (def.autostart) {
        std::shared_lock lock(mutex_);
        if (supervisor_.contains(def.name)) data["runtime"] = supervisor_.status(def.name);
    }
    return Response::success(std::move(data));
}

// The stop is issued under the lock; waiting for the reap is not.
Response Router::remove(const Request& req) const {
    const auto& name = *req.name;
    {
        std::unique_lock lock(mutex_);
        if (!registry_.contains(name)) throw Error(ErrorKind::NotFound, fmt::format("service '{}' does not exist", name));
        supervisor_.beginRemove(name);
    }

    supervisor_.awaitStopped(name);

    std::unique_lock lock(mutex_);
    try {
        registry_.remove(name);
    } catch (const Error& e) {
        // the definition is still on disk, so it keeps its runtime entry
        supervisor_.abortRemove(name);
        Registry::registry()->error("[Router] Removal of '{}' not persisted, service kept: {}", name, e.what());
        throw;
    }
    supervisor_.finishRemove(name);

    Registry::audit()->info("remove service '{}'", name);
    return Response::success(json{{"removed", name}});
}

Response Router::edit(const Request& req) const {
    std::unique_lock lock(mutex_);
    const auto updated = registry_.edit(*req.name, *req.changes);
    supervisor_.update(updated);
    Registry::audit()->info("edit service '{}'", updated.name);
    return Response::success(describe(updated.name));
}

Response Router::list(const Request& req) const {
    std::shared_lock lock(mutex_);
    std::map<std::string, ServiceRuntimeState> runtime;
    for (auto& rt : supervisor_.snapshot()) runtime.emplace(rt.name, std::move(rt));

    json out = json::array();
    for (const auto& def : registry_.list()) {
        if (req.group && def.group != req.group) continue;
        ServiceRuntimeState rt;
        if (const auto it = runtime.find(def.name); it != runtime.end()) rt = it->second;
        else rt.name = def.name;
        out.push_back({{"definition", def}, {"runtime", rt}});
    }
    return Response::success(std::move(out));
}

Response Router::status(const Request& req) const {
    const auto& name = *req.name;
    std::shared_lock lock(mutex_);
    if (!registry_.contains(name)) throw Error(ErrorKind::NotFound, fmt::format("service '{}' does not exist", name));

    json data = describe(name);
    const auto lines = req.log_lines.value_or(defaultLogLines_);
    data["log"] = lines ? util::tailLines(supervisor_.serviceLogPath(name), lines) : std::vector<std::string>{};
    return Response::success(std::move(data));
}

// Stops and async starts are issued under the lock and awaited outside it, so a slow
// child never holds up other connections. Restart takes the lock again to start.
Response Router::control(const Request& req) const {
    std::vector<std::string> targets;
    std::vector<std::string> failed;
    std::optional<Error> firstError;
    auto fail = [&](const std::string& name, const Error& e) {
        failed.push_back(name);
        if (!firstError) firstError = e;
    };

    std::vector<std::string> issued;
    {
        std::unique_lock lock(mutex_);
        targets = resolveTargets(req);
        for (const auto& name : targets) {
            try {
                if (req.cmd == Command::Start) supervisor_.start(name);
                else supervisor_.stop(name, false);
                issued.push_back(name);
            } catch (const Error& e) {
                fail(name, e);
            }
        }
    }

    std::vector<std::string> settled;
    for (const auto& name : issued) {
        try {
            if (req.cmd == Command::Start) supervisor_.awaitStarted(name);
            else supervisor_.awaitStopped(name);
            settled.push_back(name);
        } catch (const Error& e) {
            fail(name, e);
        }
    }

    if (req.cmd == Command::Restart) {
        std::vector<std::string> restarted;
        {
            std::unique_lock lock(mutex_);
            for (const auto& name : settled) {
                try {
                    supervisor_.start(name);
                    restarted.push_back(name);
                } catch (const Error& e) {
                    fail(name, e);
                }
            }
        }
        settled.clear();
        for (const auto& name : restarted) {
            try {
                supervisor_.awaitStarted(name);
                settled.push_back(name);
            } catch (const Error& e) {
                fail(name, e);
            }
        }
    }

    for (const auto& name : settled) Registry::audit()->info("{} service '{}'", to_string(req.cmd), name);

    json results = json::array();
    {
        std::shared_lock lock(mutex_);
        for (const auto& name : targets) {
            if (!supervisor_.contains(name)) {
                fail(name, Error(ErrorKind::NotFound, fmt::format("service '{}' was removed", name)));
                continue;
            }
            results.push_back({{"name", name}, {"runtime", supervisor_.status(name)}});
        }
    }

    if (firstError) {
        if (targets.size() == 1) throw *firstError;
        throw Error(firstError->kind(), fmt::format("{} failed for {}: {}", to_string(req.cmd),
                                                    fmt::join(failed, ", "), firstError->what()));
    }

    if (req.name) return Response::success(results.front()["runtime"]);
    return Response::success(std::move(results));
}

std::vector<std::string> Router::resolveTargets(const Request& req) const {
    if (req.name) {
        if (!registry_.contains(*req.name))
            throw Error(ErrorKind::NotFound, fmt::format("service '{}' does not exist", *req.name));
        return {*req.name};
    }

    std::vector<std::string> names;
    for (const auto& def : registry_.list())
        if (def.group == req.group) names.push_back(def.name);
    if (names.empty()) throw Error(ErrorKind::NotFound, fmt::format("no services in group '{}'", req.group.value_or("")));
    return names;
}

json Router::describe(const std::string& name) const {
    const auto def = registry_.get(name);
    if (!def) throw Error(ErrorKind::NotFound, fmt::format("service '{}' does not exist", name));
    return {{"definition", *def}, {"runtime", supervisor_.status(name)}};
}

}
