#pragma once

#include "config/Config.hpp"
#include "supervisor/Backoff.hpp"
#include "supervisor/Process.hpp"
#include "supervisor/Reaper.hpp"
#include "supervisor/TimerQueue.hpp"
#include "types/ServiceDefinition.hpp"
#include "types/ServiceState.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace usd::supervisor {

// Per-service lifecycle state machines. One lock guards every entry and the pid map;
// waits (stop, restart, remove, stopAll) release it while blocked.
class Supervisor final : public ExitSink {
public:
    using TransitionListener = std::function<void(const std::string& name, types::State from, types::State to)>;

    Supervisor(const config::SupervisorConfig& cfg, std::filesystem::path logDir);
    ~Supervisor() override;

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Registers a Stopped entry. Throws DuplicateName.
    void add(const types::ServiceDefinition& def);

    // Replaces the definition used for the next spawn; a live child is left alone.
    void update(const types::ServiceDefinition& def);

    // Stops the child if alive, waits for its reap and discards the entry.
    void remove(const std::string& name);

    // remove() in steps, for callers that wait without holding their own locks. beginRemove
    // hides the entry and issues the stop; finishRemove drops it once awaitStopped returned;
    // abortRemove brings it back as it is.
    void beginRemove(const std::string& name);
    void finishRemove(const std::string& name);
    void abortRemove(const std::string& name);

    // Returns once the spawn has been issued. Idempotent while Starting or Running;
    // while Stopping the start is deferred until the exit is observed. Throws Spawn.
    void start(const std::string& name);

    // With wait, returns after the child has been reaped. For a running async service
    // this runs the stop command; throws Spawn if it cannot be started.
    void stop(const std::string& name, bool wait = true);

    // Blocks while the service is Stopping. Returns at once for unknown names.
    void awaitStopped(const std::string& name);

    // Blocks while an async service's start command runs. Throws Spawn if it failed.
    void awaitStarted(const std::string& name);

    void restart(const std::string& name);

    // Graceful stop of every live child; returns when all are reaped.
    void stopAll();

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] types::ServiceRuntimeState status(const std::string& name) const;
    [[nodiscard]] std::vector<types::ServiceRuntimeState> snapshot() const;

    // Invoked under the supervisor lock for every state change.
    void setTransitionListener(TransitionListener listener);

    void routeExits(const std::function<std::vector<ChildExit>()>& reap) override;

    [[nodiscard]] std::filesystem::path serviceLogPath(const std::string& name) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        types::ServiceDefinition def;
        types::ServiceRuntimeState rt;
        std::unique_ptr<ChildProcess> child;
        TimerQueue::Id timer = 0;
        bool stopRequested = false;
        bool restartAfterStop = false;
        bool removing = false;
        bool asyncRun = false;       // child is an async service's start command
        bool stopCommandRun = false; // child is an async service's stop command
        Clock::time_point runningSince{};
    };

    config::SupervisorConfig cfg_;
    Backoff backoff_;
    std::filesystem::path logDir_;

    mutable std::mutex mutex_;
    std::condition_variable settled_;
    std::map<std::string, Entry> entries_;
    std::map<pid_t, std::string> pids_;
    TransitionListener listener_;

    TimerQueue timers_;

    Entry& entryOrThrow(const std::string& name);
    const Entry& entryOrThrow(const std::string& name) const;

    void transition(Entry& e, types::State to);
    void cancelTimer(Entry& e);
    SpawnSpec specFor(const Entry& e) const;
    void spawnLocked(Entry& e);
    void spawnStopCommandLocked(Entry& e);
    void beginStop(Entry& e);
    void requestStopLocked(Entry& e);
    void handleExit(Entry& e, const types::ExitStatus& status);
    void scheduleRestart(Entry& e, types::State from);
    void waitWhileStopping(std::unique_lock<std::mutex>& lock, const std::string& name);

    void onStartGrace(const std::string& name, TimerQueue::Id id);
    void onBackoffElapsed(const std::string& name, TimerQueue::Id id);
    void onStopTimeout(const std::string& name, TimerQueue::Id id);
};

}
