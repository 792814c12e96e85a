#include <gtest/gtest.h>
#include "supervisor/Supervisor.hpp"
#include "supervisor/Reaper.hpp"
#include "error/Error.hpp"
#include "util/files.hpp"
#include "TestUtils.hpp"

#include <algorithm>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

using namespace usd;
using namespace usd::supervisor;
using namespace usd::types;
using namespace std::chrono_literals;
using usd::test::TempDir;
using usd::test::asyncService;
using usd::test::shellService;
using usd::test::waitUntil;

namespace {

config::SupervisorConfig fastConfig() {
    config::SupervisorConfig cfg;
    cfg.backoff_base = 50ms;
    cfg.backoff_max = 200ms;
    cfg.stability_threshold = 10s;
    cfg.start_grace = 100ms;
    cfg.max_restarts = 0;
    return cfg;
}

}

class SupervisorTest : public ::testing::Test {
protected:
    void SetUp() override { build(fastConfig()); }

    void TearDown() override {
        if (sup) sup->stopAll();
        reaper.reset();
        sup.reset();
    }

    void build(const config::SupervisorConfig& cfg) {
        if (sup) TearDown();
        sup = std::make_unique<Supervisor>(cfg, dir / "logs");
        sup->setTransitionListener([this](const std::string& name, const State from, const State to) {
            std::lock_guard lock(m);
            transitions.emplace_back(name, from, to);
        });
        reaper = std::make_unique<Reaper>(*sup, 20ms);
        reaper->start();
    }

    State stateOf(const std::string& name) const { return sup->status(name).state; }

    bool waitForState(const std::string& name, const State s, const std::chrono::milliseconds timeout = 5s) {
        return waitUntil([&] { return stateOf(name) == s; }, timeout);
    }

    std::vector<State> targetsOf(const std::string& name) {
        std::lock_guard lock(m);
        std::vector<State> out;
        for (const auto& [n, from, to] : transitions)
            if (n == name) out.push_back(to);
        return out;
    }

    std::size_t count(const std::string& name, const State s) {
        const auto t = targetsOf(name);
        return static_cast<std::size_t>(std::count(t.begin(), t.end(), s));
    }

    TempDir dir;
    std::unique_ptr<Supervisor> sup;
    std::unique_ptr<Reaper> reaper;

    std::mutex m;
    std::vector<std::tuple<std::string, State, State>> transitions;
};

TEST_F(SupervisorTest, NewEntryIsStopped) {
    sup->add(shellService("a", "true"));
    const auto rt = sup->status("a");
    EXPECT_EQ(rt.state, State::Stopped);
    EXPECT_EQ(rt.pid, 0);
    EXPECT_FALSE(rt.last_exit.has_value());
    EXPECT_THROW(sup->add(shellService("a", "true")), Error);
}

TEST_F(SupervisorTest, LongRunningServiceReachesRunning) {
    sup->add(shellService("web", "exec sleep 30"));
    sup->start("web");

    const auto rt = sup->status("web");
    EXPECT_EQ(rt.state, State::Starting);
    EXPECT_GT(rt.pid, 0);
    EXPECT_GT(rt.start_time, 0);

    ASSERT_TRUE(waitForState("web", State::Running));
    EXPECT_EQ(targetsOf("web"), (std::vector<State>{State::Starting, State::Running}));
}

TEST_F(SupervisorTest, StartIsIdempotentWhileAlive) {
    sup->add(shellService("web", "exec sleep 30"));
    sup->start("web");
    const auto pid = sup->status("web").pid;
    sup->start("web");
    EXPECT_EQ(sup->status("web").pid, pid);
    ASSERT_TRUE(waitForState("web", State::Running));
    sup->start("web");
    EXPECT_EQ(sup->status("web").pid, pid);
    EXPECT_EQ(count("web", State::Starting), 1u);
}

TEST_F(SupervisorTest, StopSendsTermAndRecordsExit) {
    sup->add(shellService("web", "exec sleep 30"));
    sup->start("web");
    ASSERT_TRUE(waitForState("web", State::Running));

    sup->stop("web");
    const auto rt = sup->status("web");
    EXPECT_EQ(rt.state, State::Stopped);
    EXPECT_EQ(rt.pid, 0);
    ASSERT_TRUE(rt.last_exit.has_value());
    EXPECT_TRUE(rt.last_exit->signaled);
    EXPECT_EQ(rt.last_exit->signal, SIGTERM);
    EXPECT_EQ(targetsOf("web"), (std::vector<State>{State::Starting, State::Running, State::Stopping, State::Stopped}));
}

TEST_F(SupervisorTest, StopOfStoppedServiceIsNoop) {
    sup->add(shellService("a", "true"));
    EXPECT_NO_THROW(sup->stop("a"));
    EXPECT_EQ(stateOf("a"), State::Stopped);
    EXPECT_TRUE(targetsOf("a").empty());
}

TEST_F(SupervisorTest, IgnoredTermIsEscalatedToKill) {
    auto def = shellService("stubborn", "trap '' TERM; while true; do sleep 0.05; done");
    def.stop_timeout = 300ms;
    sup->add(def);
    sup->start("stubborn");
    ASSERT_TRUE(waitForState("stubborn", State::Running));

    const auto t0 = std::chrono::steady_clock::now();
    sup->stop("stubborn");
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_GE(elapsed, 250ms);
    EXPECT_LT(elapsed, 5s);
    const auto rt = sup->status("stubborn");
    EXPECT_EQ(rt.state, State::Stopped);
    ASSERT_TRUE(rt.last_exit.has_value());
    EXPECT_TRUE(rt.last_exit->signaled);
    EXPECT_EQ(rt.last_exit->signal, SIGKILL);
}

TEST_F(SupervisorTest, OnFailureCrashBacksOffAndRestarts) {
    // Survives the grace period, then fails.
    sup->add(shellService("crashy", "sleep 0.2; exit 3"));
    sup->start("crashy");

    ASSERT_TRUE(waitUntil([&] { return count("crashy", State::Starting) >= 2; }));

    const auto t = targetsOf("crashy");
    ASSERT_GE(t.size(), 5u);
    EXPECT_EQ(t[0], State::Starting);
    EXPECT_EQ(t[1], State::Running);
    EXPECT_EQ(t[2], State::BackoffWait);
    EXPECT_EQ(t[3], State::Starting);

    const auto rt = sup->status("crashy");
    EXPECT_GE(rt.consecutive_failures, 1u);
    ASSERT_TRUE(rt.last_exit.has_value());
    EXPECT_EQ(rt.last_exit->code, 3);
}

TEST_F(SupervisorTest, OnFailureCleanExitStaysStopped) {
    sup->add(shellService("job", "sleep 0.2; exit 0"));
    sup->start("job");
    ASSERT_TRUE(waitForState("job", State::Running));
    ASSERT_TRUE(waitForState("job", State::Stopped));

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(stateOf("job"), State::Stopped);
    EXPECT_EQ(count("job", State::Starting), 1u);
    EXPECT_EQ(sup->status("job").consecutive_failures, 0u);
}

TEST_F(SupervisorTest, ExitDuringStartGraceCountsAsFailure) {
    auto cfg = fastConfig();
    cfg.backoff_base = 10s;
    cfg.backoff_max = 10s;
    build(cfg);

    sup->add(shellService("flash", "exit 0"));
    sup->start("flash");
    ASSERT_TRUE(waitForState("flash", State::BackoffWait));
    EXPECT_EQ(sup->status("flash").consecutive_failures, 1u);
    EXPECT_EQ(count("flash", State::Running), 0u);
}

TEST_F(SupervisorTest, AlwaysRestartsCleanExitsAndCountsThem) {
    sup->add(shellService("loop", "exit 0", RestartPolicy::Always));
    sup->start("loop");

    ASSERT_TRUE(waitUntil([&] { return sup->status("loop").consecutive_failures >= 3; }));
    EXPECT_GE(count("loop", State::Starting), 3u);
    EXPECT_EQ(count("loop", State::Failed), 0u);
}

TEST_F(SupervisorTest, NeverPolicyFailsOnExit) {
    sup->add(shellService("once", "exit 1", RestartPolicy::Never));
    sup->start("once");
    ASSERT_TRUE(waitForState("once", State::Failed));
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(count("once", State::Starting), 1u);
    EXPECT_EQ(sup->status("once").last_exit->code, 1);
}

TEST_F(SupervisorTest, RestartBudgetExhaustionFails) {
    auto cfg = fastConfig();
    cfg.max_restarts = 2;
    build(cfg);

    sup->add(shellService("doomed", "exit 1"));
    sup->start("doomed");
    ASSERT_TRUE(waitForState("doomed", State::Failed));

    const auto rt = sup->status("doomed");
    EXPECT_EQ(rt.consecutive_failures, 3u);
    EXPECT_NE(rt.last_error.find("restart limit"), std::string::npos);
    EXPECT_EQ(count("doomed", State::Starting), 3u);
}

TEST_F(SupervisorTest, StableRunResetsFailureCount) {
    auto cfg = fastConfig();
    cfg.stability_threshold = 200ms;
    build(cfg);

    // Each run lives past the stability threshold before failing.
    sup->add(shellService("steady", "sleep 0.4; exit 1"));
    sup->start("steady");

    ASSERT_TRUE(waitUntil([&] { return count("steady", State::BackoffWait) >= 2; }));
    EXPECT_EQ(sup->status("steady").consecutive_failures, 1u);
}

TEST_F(SupervisorTest, StartFromBackoffCancelsTimerAndResetsCount) {
    auto cfg = fastConfig();
    cfg.backoff_base = 10s;
    cfg.backoff_max = 10s;
    build(cfg);

    // Fails on the first run only.
    const auto marker = (dir / "marker").string();
    sup->add(shellService("slow", "if [ -e " + marker + " ]; then exec sleep 30; fi; touch " + marker + "; exit 1"));
    sup->start("slow");
    ASSERT_TRUE(waitForState("slow", State::BackoffWait));
    EXPECT_TRUE(sup->status("slow").backoff_deadline.has_value());

    sup->start("slow");
    const auto rt = sup->status("slow");
    EXPECT_EQ(rt.consecutive_failures, 0u);
    EXPECT_FALSE(rt.backoff_deadline.has_value());
    EXPECT_EQ(count("slow", State::Starting), 2u);
}

TEST_F(SupervisorTest, StopDuringBackoffCancelsRestart) {
    auto cfg = fastConfig();
    cfg.backoff_base = 300ms;
    build(cfg);

    sup->add(shellService("flaky", "exit 1"));
    sup->start("flaky");
    ASSERT_TRUE(waitForState("flaky", State::BackoffWait));

    sup->stop("flaky");
    EXPECT_EQ(stateOf("flaky"), State::Stopped);
    std::this_thread::sleep_for(500ms);
    EXPECT_EQ(stateOf("flaky"), State::Stopped);
    EXPECT_EQ(count("flaky", State::Starting), 1u);
}

TEST_F(SupervisorTest, StartWhileStoppingIsDeferredWithoutDuplicateSpawn) {
    auto def = shellService("slowstop", "trap 'sleep 0.3; exit 0' TERM; while true; do sleep 0.05; done");
    sup->add(def);
    sup->start("slowstop");
    ASSERT_TRUE(waitForState("slowstop", State::Running));
    const auto firstPid = sup->status("slowstop").pid;

    sup->stop("slowstop", false);
    EXPECT_EQ(stateOf("slowstop"), State::Stopping);
    sup->start("slowstop");
    EXPECT_EQ(stateOf("slowstop"), State::Stopping);

    ASSERT_TRUE(waitUntil([&] {
        const auto rt = sup->status("slowstop");
        return rt.pid != 0 && rt.pid != firstPid;
    }));
    EXPECT_EQ(count("slowstop", State::Starting), 2u);
    EXPECT_EQ(count("slowstop", State::Stopped), 1u);
}

TEST_F(SupervisorTest, RestartReplacesTheProcess) {
    sup->add(shellService("web", "exec sleep 30"));
    sup->start("web");
    ASSERT_TRUE(waitForState("web", State::Running));
    const auto before = sup->status("web").pid;

    sup->restart("web");
    const auto after = sup->status("web");
    EXPECT_NE(after.pid, before);
    EXPECT_TRUE(after.state == State::Starting || after.state == State::Running);
    EXPECT_EQ(::kill(before, 0), -1);
}

TEST_F(SupervisorTest, SpawnErrorMarksFailed) {
    auto def = shellService("ghost", "");
    def.command = "/nonexistent/bin/ghost";
    def.args.clear();
    sup->add(def);

    try {
        sup->start("ghost");
        FAIL() << "start should have thrown";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Spawn);
    }
    const auto rt = sup->status("ghost");
    EXPECT_EQ(rt.state, State::Failed);
    EXPECT_NE(rt.last_error.find("/nonexistent/bin/ghost"), std::string::npos);
}

TEST_F(SupervisorTest, RemoveWhileRunningStopsAndForgets) {
    sup->add(shellService("web", "exec sleep 30"));
    sup->start("web");
    ASSERT_TRUE(waitForState("web", State::Running));
    const auto pid = sup->status("web").pid;

    sup->remove("web");
    EXPECT_FALSE(sup->contains("web"));
    EXPECT_EQ(::kill(pid, 0), -1);
    try {
        (void)sup->status("web");
        FAIL() << "status should have thrown";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(SupervisorTest, RemoveRightAfterStopLeavesNothingBehind) {
    auto def = shellService("stubborn", "trap '' TERM; while true; do sleep 0.05; done", RestartPolicy::Always);
    def.stop_timeout = 500ms;
    sup->add(def);
    sup->start("stubborn");
    ASSERT_TRUE(waitForState("stubborn", State::Running));
    const auto pid = sup->status("stubborn").pid;

    sup->stop("stubborn", false);
    sup->remove("stubborn");

    EXPECT_FALSE(sup->contains("stubborn"));
    EXPECT_EQ(::kill(pid, 0), -1);
    EXPECT_EQ(count("stubborn", State::Starting), 1u);

    // longer than backoff_max, so a leftover restart timer would have fired
    const auto seen = targetsOf("stubborn").size();
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(targetsOf("stubborn").size(), seen);
    EXPECT_TRUE(sup->snapshot().empty());
}

TEST_F(SupervisorTest, RemoveDuringBackoffNeverRespawns) {
    sup->add(shellService("crash", "exit 1", RestartPolicy::Always));
    sup->start("crash");
    ASSERT_TRUE(waitForState("crash", State::BackoffWait));

    sup->remove("crash");
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(count("crash", State::Starting), 1u);
    EXPECT_FALSE(sup->contains("crash"));
}

TEST_F(SupervisorTest, AbortedRemoveKeepsTheEntryStopped) {
    sup->add(shellService("web", "exec sleep 30"));
    sup->start("web");
    ASSERT_TRUE(waitForState("web", State::Running));

    sup->beginRemove("web");
    EXPECT_FALSE(sup->contains("web"));
    sup->awaitStopped("web");
    sup->abortRemove("web");

    ASSERT_TRUE(sup->contains("web"));
    EXPECT_EQ(stateOf("web"), State::Stopped);
    sup->start("web");
    EXPECT_NE(sup->status("web").pid, 0);
}

TEST_F(SupervisorTest, AsyncServiceRunsStartThenStopCommand) {
    const auto started = dir / "started";
    const auto stopped = dir / "stopped";
    sup->add(asyncService("daemonized", "touch '" + started.string() + "'", "touch '" + stopped.string() + "'"));

    sup->start("daemonized");
    sup->awaitStarted("daemonized");
    EXPECT_EQ(stateOf("daemonized"), State::Running);
    EXPECT_TRUE(std::filesystem::exists(started));
    EXPECT_EQ(sup->status("daemonized").pid, 0);

    sup->stop("daemonized");
    EXPECT_EQ(stateOf("daemonized"), State::Stopped);
    EXPECT_TRUE(std::filesystem::exists(stopped));
    EXPECT_TRUE(sup->status("daemonized").last_error.empty());
    EXPECT_EQ(targetsOf("daemonized"),
              (std::vector<State>{State::Starting, State::Running, State::Stopping, State::Stopped}));
}

TEST_F(SupervisorTest, AsyncStartCommandFailureIsSpawnError) {
    sup->add(asyncService("broken", "exit 3", "true"));
    sup->start("broken");

    try {
        sup->awaitStarted("broken");
        FAIL() << "awaitStarted should have thrown";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Spawn);
    }
    const auto rt = sup->status("broken");
    EXPECT_EQ(rt.state, State::Failed);
    EXPECT_NE(rt.last_error.find("exited with code 3"), std::string::npos);
}

TEST_F(SupervisorTest, AsyncStopCommandFailureIsRecorded) {
    sup->add(asyncService("leaky", "true", "exit 4"));
    sup->start("leaky");
    sup->awaitStarted("leaky");

    sup->stop("leaky");
    const auto rt = sup->status("leaky");
    EXPECT_EQ(rt.state, State::Stopped);
    EXPECT_NE(rt.last_error.find("stop command exited with code 4"), std::string::npos);
}

TEST_F(SupervisorTest, HungAsyncStopCommandIsKilled) {
    auto def = asyncService("hang", "true", "trap '' TERM; while true; do sleep 0.05; done");
    def.stop_timeout = 300ms;
    sup->add(def);
    sup->start("hang");
    sup->awaitStarted("hang");

    sup->stop("hang");
    const auto rt = sup->status("hang");
    EXPECT_EQ(rt.state, State::Stopped);
    ASSERT_TRUE(rt.last_exit.has_value());
    EXPECT_EQ(rt.last_exit->signal, SIGKILL);
}

TEST_F(SupervisorTest, AsyncServiceIsNotRestartedByPolicy) {
    auto def = asyncService("oneshot", "true", "true");
    def.restart_policy = RestartPolicy::Always;
    sup->add(def);
    sup->start("oneshot");
    sup->awaitStarted("oneshot");

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(stateOf("oneshot"), State::Running);
    EXPECT_EQ(count("oneshot", State::Starting), 1u);
}

TEST_F(SupervisorTest, RemovingRunningAsyncServiceRunsStopCommand) {
    const auto stopped = dir / "stopped";
    sup->add(asyncService("bg", "true", "touch '" + stopped.string() + "'"));
    sup->start("bg");
    sup->awaitStarted("bg");

    sup->remove("bg");
    EXPECT_FALSE(sup->contains("bg"));
    EXPECT_TRUE(std::filesystem::exists(stopped));
}

TEST_F(SupervisorTest, UpdateAppliesOnNextSpawn) {
    sup->add(shellService("w", "echo v1; exec sleep 30"));
    sup->start("w");
    ASSERT_TRUE(waitForState("w", State::Running));

    sup->update(shellService("w", "echo v2; exec sleep 30"));
    EXPECT_EQ(stateOf("w"), State::Running);

    sup->restart("w");
    ASSERT_TRUE(waitUntil([&] { return util::readFileToString(sup->serviceLogPath("w")).find("v2") != std::string::npos; }));
    EXPECT_NE(util::readFileToString(sup->serviceLogPath("w")).find("v1"), std::string::npos);
}

TEST_F(SupervisorTest, StopAllReapsEverything) {
    std::vector<pid_t> pids;
    for (const auto* name : {"a", "b", "c"}) {
        sup->add(shellService(name, "exec sleep 30"));
        sup->start(name);
        pids.push_back(sup->status(name).pid);
    }
    sup->stopAll();
    for (const auto& rt : sup->snapshot()) EXPECT_EQ(rt.state, State::Stopped);
    for (const auto pid : pids) EXPECT_EQ(::kill(pid, 0), -1);
}

TEST_F(SupervisorTest, UnknownNamesAreNotFound) {
    for (const auto& op : std::vector<std::function<void()>>{
             [&] { sup->start("nope"); },
             [&] { sup->stop("nope"); },
             [&] { sup->restart("nope"); },
             [&] { sup->remove("nope"); },
         }) {
        try {
            op();
            ADD_FAILURE() << "expected NotFound";
        } catch (const Error& e) {
            EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        }
    }
}
