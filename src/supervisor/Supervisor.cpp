#include "supervisor/Supervisor.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "paths.hpp"
#include "util/files.hpp"

#include <csignal>
#include <ctime>
#include <utility>
#include <fmt/format.h>

using namespace usd::log;
using namespace usd::types;
namespace fs = std::filesystem;

namespace usd::supervisor {

Supervisor::Supervisor(const config::SupervisorConfig& cfg, fs::path logDir)
    : cfg_(cfg), backoff_(cfg.backoff_base, cfg.backoff_max), logDir_(std::move(logDir)) {
    util::ensurePrivateDir(logDir_);
    timers_.start();
}

Supervisor::~Supervisor() {
    timers_.stop();

    std::lock_guard lock(mutex_);
    for (auto& [name, e] : entries_) {
        if (e.child && !e.child->reaped())
            Registry::supervisor()->warn("[Supervisor] Service '{}' still alive at teardown (pid {})", name, e.child->pid());
        e.child.reset();
    }
    pids_.clear();
}

void Supervisor::setTransitionListener(TransitionListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

fs::path Supervisor::serviceLogPath(const std::string& name) const { return logDir_ / (name + ".log"); }

Supervisor::Entry& Supervisor::entryOrThrow(const std::string& name) {
    const auto it = entries_.find(name);
    if (it == entries_.end() || it->second.removing)
        throw Error(ErrorKind::NotFound, fmt::format("service '{}' not found", name));
    return it->second;
}

const Supervisor::Entry& Supervisor::entryOrThrow(const std::string& name) const {
    const auto it = entries_.find(name);
    if (it == entries_.end() || it->second.removing)
        throw Error(ErrorKind::NotFound, fmt::format("service '{}' not found", name));
    return it->second;
}

void Supervisor::add(const ServiceDefinition& def) {
    std::lock_guard lock(mutex_);
    if (entries_.contains(def.name))
        throw Error(ErrorKind::DuplicateName, fmt::format("service '{}' already exists", def.name));

    Entry e;
    e.def = def;
    e.rt.name = def.name;
    entries_.emplace(def.name, std::move(e));
    Registry::supervisor()->debug("[Supervisor] Registered '{}'", def.name);
}

void Supervisor::update(const ServiceDefinition& def) {
    std::lock_guard lock(mutex_);
    entryOrThrow(def.name).def = def;
}

void Supervisor::remove(const std::string& name) {
    beginRemove(name);
    awaitStopped(name);
    finishRemove(name);
}

void Supervisor::beginRemove(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto& e = entryOrThrow(name);
    e.removing = true;
    e.restartAfterStop = false;
    // a stop already in flight keeps its kill timer
    if (e.rt.state == State::Stopping) return;
    cancelTimer(e);

    if (e.rt.state != State::Starting && e.rt.state != State::Running) return;
    try {
        beginStop(e);
    } catch (const Error& err) {
        Registry::supervisor()->warn("[Supervisor] Removing '{}' without stopping it: {}", name, err.what());
    }
}

void Supervisor::finishRemove(const std::string& name) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end() || !it->second.removing) return;

    cancelTimer(it->second);
    entries_.erase(it);
    settled_.notify_all();
    Registry::supervisor()->info("[Supervisor] Removed '{}'", name);
}

void Supervisor::abortRemove(const std::string& name) {
    std::lock_guard lock(mutex_);
    if (const auto it = entries_.find(name); it != entries_.end()) it->second.removing = false;
}

void Supervisor::start(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto& e = entryOrThrow(name);

    switch (e.rt.state) {
        case State::Starting:
        case State::Running:
            return;
        case State::Stopping:
            e.restartAfterStop = true;
            Registry::supervisor()->debug("[Supervisor] '{}' is stopping, start deferred until exit", name);
            return;
        case State::BackoffWait:
            cancelTimer(e);
            break;
        case State::Stopped:
        case State::Failed:
            break;
    }

    e.rt.consecutive_failures = 0;
    spawnLocked(e);
}

void Supervisor::stop(const std::string& name, const bool wait) {
    std::unique_lock lock(mutex_);
    requestStopLocked(entryOrThrow(name));
    if (wait) waitWhileStopping(lock, name);
}

void Supervisor::awaitStopped(const std::string& name) {
    std::unique_lock lock(mutex_);
    waitWhileStopping(lock, name);
}

void Supervisor::awaitStarted(const std::string& name) {
    std::unique_lock lock(mutex_);
    settled_.wait(lock, [this, &name] {
        const auto it = entries_.find(name);
        return it == entries_.end() || !it->second.asyncRun || it->second.rt.state != State::Starting;
    });

    const auto it = entries_.find(name);
    if (it != entries_.end() && it->second.def.isAsync() && it->second.rt.state == State::Failed)
        throw Error(ErrorKind::Spawn, fmt::format("service '{}' failed to start: {}", name, it->second.rt.last_error));
}

void Supervisor::restart(const std::string& name) {
    std::unique_lock lock(mutex_);
    requestStopLocked(entryOrThrow(name));
    waitWhileStopping(lock, name);

    auto& e = entryOrThrow(name);
    if (e.rt.state == State::Starting || e.rt.state == State::Running) return;
    cancelTimer(e);
    e.rt.consecutive_failures = 0;
    spawnLocked(e);
}

void Supervisor::stopAll() {
    std::unique_lock lock(mutex_);
    for (auto& [name, e] : entries_) {
        try {
            requestStopLocked(e);
        } catch (const Error& err) {
            Registry::supervisor()->error("[Supervisor] Could not stop '{}': {}", name, err.what());
        }
    }

    settled_.wait(lock, [this] {
        for (const auto& [_, e] : entries_)
            if (e.child) return false;
        return true;
    });
    Registry::supervisor()->info("[Supervisor] All services stopped");
}

bool Supervisor::contains(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    return it != entries_.end() && !it->second.removing;
}

ServiceRuntimeState Supervisor::status(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return entryOrThrow(name).rt;
}

std::vector<ServiceRuntimeState> Supervisor::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<ServiceRuntimeState> out;
    out.reserve(entries_.size());
    for (const auto& [_, e] : entries_)
        if (!e.removing) out.push_back(e.rt);
    return out;
}

void Supervisor::routeExits(const std::function<std::vector<ChildExit>()>& reap) {
    std::lock_guard lock(mutex_);
    for (const auto& [pid, raw] : reap()) {
        const auto status = ExitStatus::fromWaitStatus(raw);
        const auto owner = pids_.find(pid);
        if (owner == pids_.end()) {
            Registry::reaper()->debug("[Reaper] Discarding exit of unowned pid {} ({})", pid, status.describe());
            continue;
        }

        const auto name = owner->second;
        pids_.erase(owner);

        const auto it = entries_.find(name);
        if (it == entries_.end() || !it->second.child || it->second.child->pid() != pid) {
            Registry::reaper()->debug("[Reaper] Discarding stale exit of pid {} for '{}'", pid, name);
            continue;
        }

        Registry::reaper()->debug("[Reaper] pid {} of '{}' {}", pid, name, status.describe());
        handleExit(it->second, status);
    }
}

void Supervisor::transition(Entry& e, const State to) {
    const auto from = e.rt.state;
    e.rt.state = to;
    if (from == to) return;

    Registry::supervisor()->info("[Supervisor] {}: {} -> {}", e.def.name, to_string(from), to_string(to));
    if (listener_) listener_(e.def.name, from, to);
}

void Supervisor::cancelTimer(Entry& e) {
    if (e.timer == 0) return;
    timers_.cancel(e.timer);
    e.timer = 0;
    e.rt.backoff_deadline.reset();
}

SpawnSpec Supervisor::specFor(const Entry& e) const {
    SpawnSpec spec;
    spec.name = e.def.name;
    spec.command = e.def.command;
    spec.args = e.def.args;
    spec.workingDirectory = e.def.working_directory ? fs::path(*e.def.working_directory) : paths::getHomeDir();
    spec.environment = mergeEnvironment(e.def.environment);
    spec.logFile = serviceLogPath(e.def.name);
    return spec;
}

void Supervisor::spawnLocked(Entry& e) {
    e.rt.backoff_deadline.reset();
    e.stopRequested = false;
    e.stopCommandRun = false;
    e.asyncRun = e.def.isAsync();

    try {
        e.child = ChildProcess::spawn(specFor(e));
    } catch (const Error& err) {
        e.rt.pid = 0;
        e.rt.last_error = err.what();
        Registry::supervisor()->error("[Supervisor] Failed to spawn '{}': {}", e.def.name, err.what());
        transition(e, State::Failed);
        throw;
    }

    const auto pid = e.child->pid();
    pids_[pid] = e.def.name;
    e.rt.pid = pid;
    e.rt.start_time = std::time(nullptr);
    e.rt.last_error.clear();
    transition(e, State::Starting);

    // an async service is Running once its start command exits cleanly
    if (e.asyncRun) return;

    if (cfg_.start_grace.count() <= 0) {
        e.runningSince = Clock::now();
        transition(e, State::Running);
        return;
    }

    const auto name = e.def.name;
    e.timer = timers_.schedule(cfg_.start_grace, [this, name](const TimerQueue::Id id) { onStartGrace(name, id); });
}

void Supervisor::requestStopLocked(Entry& e) {
    e.restartAfterStop = false;

    switch (e.rt.state) {
        case State::Starting:
        case State::Running:
            beginStop(e);
            break;
        case State::BackoffWait:
        case State::Failed:
            cancelTimer(e);
            transition(e, State::Stopped);
            settled_.notify_all();
            break;
        case State::Stopping:
        case State::Stopped:
            break;
    }
}

void Supervisor::spawnStopCommandLocked(Entry& e) {
    auto spec = specFor(e);
    spec.command = *e.def.stop_command;
    spec.args = e.def.stop_args;

    try {
        e.child = ChildProcess::spawn(spec);
    } catch (const Error& err) {
        e.rt.last_error = fmt::format("stop command: {}", err.what());
        Registry::supervisor()->error("[Supervisor] Failed to run stop command of '{}': {}", e.def.name, err.what());
        throw;
    }

    const auto pid = e.child->pid();
    pids_[pid] = e.def.name;
    e.rt.pid = pid;
    e.stopCommandRun = true;
    e.asyncRun = false;
}

void Supervisor::beginStop(Entry& e) {
    cancelTimer(e);

    if (!e.child) {
        // a running async service; nothing of ours is alive
        if (!e.def.stop_command) {
            transition(e, State::Stopped);
            settled_.notify_all();
            return;
        }
        spawnStopCommandLocked(e);
    } else if (!e.child->signal(SIGTERM)) {
        Registry::supervisor()->debug("[Supervisor] SIGTERM to '{}' (pid {}) found no process", e.def.name, e.child->pid());
    }

    e.stopRequested = true;
    transition(e, State::Stopping);

    const auto name = e.def.name;
    e.timer = timers_.schedule(e.def.stop_timeout, [this, name](const TimerQueue::Id id) { onStopTimeout(name, id); });
}

void Supervisor::waitWhileStopping(std::unique_lock<std::mutex>& lock, const std::string& name) {
    settled_.wait(lock, [this, &name] {
        const auto it = entries_.find(name);
        return it == entries_.end() || it->second.rt.state != State::Stopping;
    });
}

void Supervisor::handleExit(Entry& e, const ExitStatus& status) {
    e.child->markReaped();
    e.child.reset();
    e.rt.pid = 0;
    e.rt.last_exit = status;
    cancelTimer(e);

    const auto from = e.rt.state;
    const bool wasStopCommand = std::exchange(e.stopCommandRun, false);
    const bool wasAsyncStart = std::exchange(e.asyncRun, false);

    if (e.removing || e.stopRequested || from == State::Stopping) {
        e.stopRequested = false;
        if (wasStopCommand && !status.success()) e.rt.last_error = fmt::format("stop command {}", status.describe());
        transition(e, State::Stopped);

        if (e.restartAfterStop && !e.removing) {
            e.restartAfterStop = false;
            e.rt.consecutive_failures = 0;
            try {
                spawnLocked(e);
            } catch (const Error&) {
                // recorded on the entry as Failed
            }
        }
        settled_.notify_all();
        return;
    }

    if (wasAsyncStart) {
        if (status.success()) {
            e.runningSince = Clock::now();
            transition(e, State::Running);
        } else {
            e.rt.last_error = fmt::format("start command {}", status.describe());
            transition(e, State::Failed);
        }
        settled_.notify_all();
        return;
    }

    // An exit during the start grace period counts as a failure whatever the status.
    const bool failed = from == State::Starting || !status.success();

    switch (e.def.restart_policy) {
        case RestartPolicy::Never:
            transition(e, State::Failed);
            break;
        case RestartPolicy::OnFailure:
            if (failed) scheduleRestart(e, from);
            else transition(e, State::Stopped);
            break;
        case RestartPolicy::Always:
            scheduleRestart(e, from);
            break;
    }
    settled_.notify_all();
}

void Supervisor::scheduleRestart(Entry& e, const State from) {
    if (from == State::Running && Clock::now() - e.runningSince >= cfg_.stability_threshold)
        e.rt.consecutive_failures = 0;

    ++e.rt.consecutive_failures;

    if (cfg_.max_restarts > 0 && e.rt.consecutive_failures > cfg_.max_restarts) {
        e.rt.last_error = fmt::format("restart limit of {} reached", cfg_.max_restarts);
        Registry::supervisor()->warn("[Supervisor] '{}' exhausted its restart budget ({} failures)",
                                     e.def.name, e.rt.consecutive_failures);
        transition(e, State::Failed);
        return;
    }

    const auto delay = backoff_.delayFor(e.rt.consecutive_failures);
    e.rt.backoff_deadline = std::time(nullptr) + std::chrono::duration_cast<std::chrono::seconds>(delay).count();

    const auto name = e.def.name;
    e.timer = timers_.schedule(delay, [this, name](const TimerQueue::Id id) { onBackoffElapsed(name, id); });

    Registry::supervisor()->info("[Supervisor] '{}' restarting in {}ms (failure #{})",
                                 e.def.name, delay.count(), e.rt.consecutive_failures);
    transition(e, State::BackoffWait);
}

void Supervisor::onStartGrace(const std::string& name, const TimerQueue::Id id) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end() || it->second.timer != id) return;

    auto& e = it->second;
    e.timer = 0;
    if (e.rt.state != State::Starting) return;

    e.runningSince = Clock::now();
    transition(e, State::Running);
}

void Supervisor::onBackoffElapsed(const std::string& name, const TimerQueue::Id id) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end() || it->second.timer != id) return;

    auto& e = it->second;
    e.timer = 0;
    if (e.rt.state != State::BackoffWait || e.removing) return;

    try {
        spawnLocked(e);
    } catch (const Error& err) {
        Registry::supervisor()->warn("[Supervisor] Restart of '{}' failed, giving up: {}", name, err.what());
    }
}

void Supervisor::onStopTimeout(const std::string& name, const TimerQueue::Id id) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end() || it->second.timer != id) return;

    auto& e = it->second;
    e.timer = 0;
    if (e.rt.state != State::Stopping || !e.child) return;

    Registry::supervisor()->warn("[Supervisor] {}: '{}' (pid {}) ignored SIGTERM for {}ms, sending SIGKILL",
                                 to_string(ErrorKind::ProcessTimeout), name, e.child->pid(), e.def.stop_timeout.count());
    e.child->signal(SIGKILL);
}

}
