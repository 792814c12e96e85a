#include "runtime/Manager.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "paths.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <unistd.h>
#include <fmt/core.h>

using namespace usd;
using namespace usd::config;

namespace {

std::atomic<int> receivedSignal{0};

void signalHandler(const int signum) { receivedSignal.store(signum); }

void usage() {
    fmt::print("Usage: userserversd [--config PATH] [--socket PATH]\n"
               "  --config PATH   YAML configuration (default {})\n"
               "  --socket PATH   control socket (overrides control.socket_path)\n",
               paths::getConfigPath().string());
}

}

int main(const int argc, char** argv) {
    std::filesystem::path configPath = paths::getConfigPath();
    std::string socketOverride;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if ((a == "--config" || a == "-c") && i + 1 < argc) configPath = argv[++i];
        else if (a == "--socket" && i + 1 < argc) socketOverride = argv[++i];
        else if (a == "-h" || a == "--help") {
            usage();
            return EXIT_SUCCESS;
        } else {
            fmt::print(stderr, "userserversd: unknown argument '{}'\n", a);
            usage();
            return 2;
        }
    }

    // Every thread inherits this mask; the reaper consumes SIGCHLD with sigtimedwait.
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGCHLD);
    if (::pthread_sigmask(SIG_BLOCK, &blocked, nullptr) != 0) {
        fmt::print(stderr, "userserversd: failed to block SIGCHLD\n");
        return EXIT_FAILURE;
    }
    std::signal(SIGPIPE, SIG_IGN);

    try {
        ConfigRegistry::init(configPath);
    } catch (const std::exception& e) {
        fmt::print(stderr, "userserversd: failed to load {}: {}\n", configPath.string(), e.what());
        return EXIT_FAILURE;
    }

    auto cfg = ConfigRegistry::get();
    if (!socketOverride.empty()) cfg.control.socket_path = socketOverride;

    try {
        util::ensurePrivateDir(cfg.stateDir());
        log::Registry::init(cfg.logDir());
    } catch (const std::exception& e) {
        fmt::print(stderr, "userserversd: cannot prepare state directory {}: {}\n", cfg.stateDir().string(), e.what());
        return EXIT_FAILURE;
    }

    try {
        log::Registry::daemon()->info("[*] Starting userserversd (pid {})", ::getpid());
        log::Registry::config()->info("[Config] {} {}; services {}, socket {}, max_restarts {}",
                                      std::filesystem::exists(configPath) ? "Loaded" : "No config file, defaults for",
                                      configPath.string(), cfg.servicesFile().string(), cfg.socketPath().string(),
                                      cfg.supervisor.max_restarts);

        runtime::Manager manager(cfg);
        manager.startAll();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        log::Registry::daemon()->info("[✓] userserversd ready");

        while (receivedSignal.load() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        log::Registry::daemon()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());
        manager.stopAll();

        log::Registry::daemon()->info("[✓] userserversd shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        log::Registry::daemon()->critical("[-] Fatal: {}", e.what());
        return EXIT_FAILURE;
    }
}
