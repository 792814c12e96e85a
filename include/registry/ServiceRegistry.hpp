#pragma once

#include "registry/Store.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace usd::registry {

// Single source of truth for service definitions. Every mutation is committed to the
// store before it becomes visible in memory, so a failed commit leaves nothing to undo.
class ServiceRegistry {
public:
    explicit ServiceRegistry(std::shared_ptr<Store> store);

    // Replaces the in-memory set with the store's contents.
    void load();

    void add(const types::ServiceDefinition& def);
    void remove(const std::string& name);
    types::ServiceDefinition edit(const std::string& name, const types::ServiceDefinitionPatch& patch);

    [[nodiscard]] std::optional<types::ServiceDefinition> get(const std::string& name) const;
    [[nodiscard]] std::vector<types::ServiceDefinition> list() const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const;

private:
    std::shared_ptr<Store> store_;
    mutable std::shared_mutex mutex_;
    DefinitionMap defs_;

    void commit(DefinitionMap next);
};

}
