#include "registry/ServiceRegistry.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <mutex>

using namespace usd::types;

namespace usd::registry {

ServiceRegistry::ServiceRegistry(std::shared_ptr<Store> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("ServiceRegistry requires a store");
}

void ServiceRegistry::load() {
    auto loaded = store_->load();
    std::unique_lock lock(mutex_);
    defs_ = std::move(loaded);
    log::Registry::registry()->info("[ServiceRegistry] Loaded {} service definition(s)", defs_.size());
}

void ServiceRegistry::add(const ServiceDefinition& def) {
    def.validate();

    std::unique_lock lock(mutex_);
    if (defs_.contains(def.name))
        throw Error(ErrorKind::DuplicateName, fmt::format("service '{}' already exists", def.name));

    auto next = defs_;
    next.emplace(def.name, def);
    commit(std::move(next));

    log::Registry::registry()->info("[ServiceRegistry] Added service '{}'", def.name);
}

void ServiceRegistry::remove(const std::string& name) {
    std::unique_lock lock(mutex_);
    if (!defs_.contains(name)) throw Error(ErrorKind::NotFound, fmt::format("service '{}' does not exist", name));

    auto next = defs_;
    next.erase(name);
    commit(std::move(next));

    log::Registry::registry()->info("[ServiceRegistry] Removed service '{}'", name);
}

ServiceDefinition ServiceRegistry::edit(const std::string& name, const ServiceDefinitionPatch& patch) {
    std::unique_lock lock(mutex_);
    const auto it = defs_.find(name);
    if (it == defs_.end()) throw Error(ErrorKind::NotFound, fmt::format("service '{}' does not exist", name));

    auto updated = patch.applyTo(it->second);

    auto next = defs_;
    next[name] = updated;
    commit(std::move(next));

    log::Registry::registry()->info("[ServiceRegistry] Edited service '{}'", name);
    return updated;
}

std::optional<ServiceDefinition> ServiceRegistry::get(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto it = defs_.find(name);
    if (it == defs_.end()) return std::nullopt;
    return it->second;
}

std::vector<ServiceDefinition> ServiceRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<ServiceDefinition> out;
    out.reserve(defs_.size());
    for (const auto& [_, def] : defs_) out.push_back(def);
    return out;
}

bool ServiceRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return defs_.contains(name);
}

std::size_t ServiceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return defs_.size();
}

void ServiceRegistry::commit(DefinitionMap next) {
    try {
        store_->save(next);
    } catch (const UnsyncedCommit& e) {
        // on disk already; memory follows
        log::Registry::registry()->warn("[ServiceRegistry] {}", e.what());
    } catch (const Error& e) {
        log::Registry::registry()->error("[ServiceRegistry] Commit failed, keeping previous state: {}", e.what());
        throw;
    }
    defs_ = std::move(next);
}

}
