#include "paths.hpp"

#include <cstdlib>
#include <optional>
#include <pwd.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const auto* kAppDir = "userservers";

std::optional<fs::path> testRoot_;

std::optional<fs::path> envPath(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    const fs::path p(v);
    if (!p.is_absolute()) return std::nullopt;
    return p;
}

}

namespace usd::paths {

fs::path getHomeDir() {
    if (testRoot_) return *testRoot_ / "home";
    if (const auto home = envPath("HOME")) return *home;
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    throw std::runtime_error("Unable to determine home directory");
}

fs::path getConfigDir() {
    if (testRoot_) return *testRoot_ / "config";
    if (const auto xdg = envPath("XDG_CONFIG_HOME")) return *xdg / kAppDir;
    return getHomeDir() / ".config" / kAppDir;
}

fs::path getConfigPath() { return getConfigDir() / "config.yaml"; }

fs::path getServicesPath() { return getConfigDir() / "services.json"; }

fs::path getStateDir() {
    if (testRoot_) return *testRoot_ / "state";
    if (const auto xdg = envPath("XDG_STATE_HOME")) return *xdg / kAppDir;
    return getHomeDir() / ".local" / "state" / kAppDir;
}

fs::path getLogDir() { return getStateDir() / "logs"; }

fs::path getRuntimeDir() {
    if (testRoot_) return *testRoot_ / "run";
    if (const auto xdg = envPath("XDG_RUNTIME_DIR")) return *xdg / kAppDir;

    const auto uid = std::to_string(getuid());
    std::error_code ec;
    if (const fs::path userRun = fs::path("/run/user") / uid; fs::is_directory(userRun, ec))
        return userRun / kAppDir;
    return fs::path("/tmp") / (std::string(kAppDir) + "-" + uid);
}

fs::path getSocketPath() { return getRuntimeDir() / "userserversd.sock"; }

void enableTestMode(const fs::path& root) { testRoot_ = root; }

bool testModeEnabled() { return testRoot_.has_value(); }

}
