#pragma once

#include <filesystem>

namespace usd::paths {

std::filesystem::path getHomeDir();

// $XDG_CONFIG_HOME/userservers or ~/.config/userservers
std::filesystem::path getConfigDir();
std::filesystem::path getConfigPath();
std::filesystem::path getServicesPath();

// $XDG_STATE_HOME/userservers or ~/.local/state/userservers
std::filesystem::path getStateDir();
std::filesystem::path getLogDir();

// $XDG_RUNTIME_DIR/userservers, /run/user/<uid>/userservers, else /tmp/userservers-<uid>
std::filesystem::path getRuntimeDir();
std::filesystem::path getSocketPath();

// Redirects every path above under root. Used by the test binaries.
void enableTestMode(const std::filesystem::path& root);
bool testModeEnabled();

}
