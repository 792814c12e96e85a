#include "supervisor/Reaper.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <sys/wait.h>

using namespace usd::log;

namespace usd::supervisor {

Reaper::Reaper(ExitSink& sink, const std::chrono::milliseconds pollInterval)
    : AsyncService("Reaper"), sink_(sink), pollInterval_(pollInterval) {}

Reaper::~Reaper() { stop(); }

std::vector<ChildExit> Reaper::drainExited() {
    std::vector<ChildExit> exits;
    for (;;) {
        int status = 0;
        const pid_t pid = ::waitpid(-1, &status, WNOHANG);
        if (pid > 0) {
            exits.push_back({pid, status});
            continue;
        }
        if (pid < 0 && errno == EINTR) continue;
        if (pid < 0 && errno != ECHILD)
            Registry::reaper()->error("[Reaper] waitpid failed: {}", std::strerror(errno));
        break;
    }
    return exits;
}

void Reaper::runLoop() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGCHLD);

    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(pollInterval_);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(pollInterval_ - secs);
    const timespec timeout{static_cast<time_t>(secs.count()), static_cast<long>(nanos.count())};

    Registry::reaper()->debug("[Reaper] Waiting for SIGCHLD (poll {}ms)", pollInterval_.count());

    while (!interruptFlag_.load()) {
        if (::sigtimedwait(&set, nullptr, &timeout) < 0 && errno != EAGAIN && errno != EINTR)
            Registry::reaper()->warn("[Reaper] sigtimedwait failed: {}", std::strerror(errno));

        sink_.routeExits(&Reaper::drainExited);
    }

    // pick up anything that exited while shutting down
    sink_.routeExits(&Reaper::drainExited);
}

}
