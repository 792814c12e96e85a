#pragma once

#include "error/Error.hpp"
#include "types/ServiceDefinition.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace usd::registry {

using DefinitionMap = std::map<std::string, types::ServiceDefinition>;

// The new set is committed and visible to load(), but may not survive a power loss.
class UnsyncedCommit : public Error {
public:
    explicit UnsyncedCommit(const std::string& message) : Error(ErrorKind::Persistence, message) {}
};

class Store {
public:
    virtual ~Store() = default;

    // Returns the last committed set. Throws Error(Persistence) on unreadable data.
    virtual DefinitionMap load() = 0;

    // Durably replaces the whole set. Throws Error(Persistence) when the previous set is
    // still the committed one, UnsyncedCommit when the new set is committed but not flushed.
    virtual void save(const DefinitionMap& defs) = 0;
};

class JsonFileStore final : public Store {
public:
    explicit JsonFileStore(std::filesystem::path path);

    DefinitionMap load() override;
    void save(const DefinitionMap& defs) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    static constexpr int kFormatVersion = 1;

    std::filesystem::path path_;
};

}
