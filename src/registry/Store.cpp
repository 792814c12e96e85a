#include "registry/Store.hpp"
#include "error/Error.hpp"
#include "util/files.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace usd::types;
using nlohmann::json;

namespace fs = std::filesystem;

namespace usd::registry {

JsonFileStore::JsonFileStore(fs::path path) : path_(std::move(path)) {}

DefinitionMap JsonFileStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) return {};

    DefinitionMap defs;
    try {
        const auto root = json::parse(util::readFileToString(path_));
        const int version = root.value("version", kFormatVersion);
        if (version != kFormatVersion)
            throw Error(ErrorKind::Persistence, fmt::format("unsupported store version {} in {}", version, path_.string()));

        for (const auto& [name, body] : root.at("services").items()) {
            auto def = body.get<ServiceDefinition>();
            if (def.name != name)
                throw Error(ErrorKind::Persistence, fmt::format("store key '{}' does not match service name '{}'", name, def.name));
            def.validate();
            defs.emplace(name, std::move(def));
        }
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Persistence) throw;
        throw Error(ErrorKind::Persistence, fmt::format("invalid service store {}: {}", path_.string(), e.what()));
    } catch (const std::exception& e) {
        throw Error(ErrorKind::Persistence, fmt::format("failed to load service store {}: {}", path_.string(), e.what()));
    }
    return defs;
}

void JsonFileStore::save(const DefinitionMap& defs) {
    json services = json::object();
    for (const auto& [name, def] : defs) services[name] = def;

    const json root = {{"version", kFormatVersion}, {"services", services}};

    try {
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path());
        util::writeFileAtomic(path_, root.dump(2) + "\n");
    } catch (const util::UnsyncedRename& e) {
        throw UnsyncedCommit(fmt::format("service store {} written but not flushed: {}", path_.string(), e.what()));
    } catch (const std::exception& e) {
        throw Error(ErrorKind::Persistence, fmt::format("failed to write service store {}: {}", path_.string(), e.what()));
    }
}

}
