#include <gtest/gtest.h>
#include "supervisor/Process.hpp"
#include "error/Error.hpp"
#include "util/files.hpp"
#include "TestUtils.hpp"

#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

using namespace usd;
using namespace usd::supervisor;
using usd::test::TempDir;

namespace {

SpawnSpec shellSpec(const TempDir& dir, const std::string& script) {
    SpawnSpec spec;
    spec.name = "worker";
    spec.command = "/bin/sh";
    spec.args = {"-c", script};
    spec.workingDirectory = dir.path();
    spec.environment = mergeEnvironment({});
    spec.logFile = dir / "worker.log";
    return spec;
}

int reap(ChildProcess& child) {
    int status = 0;
    const pid_t r = ::waitpid(child.pid(), &status, 0);
    EXPECT_EQ(r, child.pid());
    child.markReaped();
    return status;
}

}

TEST(ProcessTest, ChildOutputLandsInItsLogFile) {
    TempDir dir;
    auto spec = shellSpec(dir, "echo out-line; echo err-line >&2; echo \"$GREETING from $(pwd)\"");
    spec.environment = mergeEnvironment({{"GREETING", "hello"}});

    const auto child = ChildProcess::spawn(spec);
    ASSERT_GT(child->pid(), 0);
    const int status = reap(*child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    const auto log = util::readFileToString(spec.logFile);
    EXPECT_NE(log.find("out-line"), std::string::npos);
    EXPECT_NE(log.find("err-line"), std::string::npos);
    EXPECT_NE(log.find("hello from " + dir.path().string()), std::string::npos);
}

TEST(ProcessTest, LogFileIsAppendedAcrossSpawns) {
    TempDir dir;
    for (const auto* word : {"first", "second"}) {
        const auto child = ChildProcess::spawn(shellSpec(dir, std::string("echo ") + word));
        reap(*child);
    }
    const auto log = util::readFileToString(dir / "worker.log");
    EXPECT_LT(log.find("first"), log.find("second"));
}

TEST(ProcessTest, ChildLeadsItsOwnProcessGroup) {
    TempDir dir;
    const auto child = ChildProcess::spawn(shellSpec(dir, "exec sleep 30"));
    EXPECT_EQ(::getpgid(child->pid()), child->pid());
    EXPECT_NE(::getpgid(child->pid()), ::getpgid(0));

    EXPECT_TRUE(child->signal(SIGTERM));
    const int status = reap(*child);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
}

TEST(ProcessTest, MissingExecutableIsSpawnError) {
    TempDir dir;
    auto spec = shellSpec(dir, "");
    spec.command = "definitely-not-a-real-binary-usd";
    spec.args.clear();

    try {
        (void)ChildProcess::spawn(spec);
        FAIL() << "spawn should have thrown";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Spawn);
        EXPECT_NE(std::string(e.what()).find("definitely-not-a-real-binary-usd"), std::string::npos);
    }
}

TEST(ProcessTest, BadWorkingDirectoryIsSpawnError) {
    TempDir dir;
    auto spec = shellSpec(dir, "true");
    spec.workingDirectory = dir / "does-not-exist";

    try {
        (void)ChildProcess::spawn(spec);
        FAIL() << "spawn should have thrown";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Spawn);
    }

    // the failed child was reaped by spawn itself
    int status = 0;
    EXPECT_LE(::waitpid(-1, &status, WNOHANG), 0);
}

TEST(ProcessTest, DestroyingLiveHandleKillsTheGroup) {
    TempDir dir;
    pid_t pid = 0;
    {
        const auto child = ChildProcess::spawn(shellSpec(dir, "sleep 30 & wait"));
        pid = child->pid();
        ASSERT_EQ(::kill(pid, 0), 0);
    }
    EXPECT_EQ(::kill(pid, 0), -1);
}

TEST(ProcessTest, ResolveExecutableFollowsPath) {
    TempDir dir;
    const auto bin = dir / "tool";
    util::writeFileAtomic(bin, "#!/bin/sh\n");
    std::filesystem::permissions(bin, std::filesystem::perms::owner_all);

    const std::map<std::string, std::string> env{{"PATH", "/nonexistent:" + dir.path().string()}};
    EXPECT_EQ(resolveExecutable("tool", env, "/").value(), bin);
    EXPECT_EQ(resolveExecutable("./tool", env, dir.path()).value(), bin);
    EXPECT_FALSE(resolveExecutable("nope", env, "/").has_value());
    // no PATH at all falls back to the system default
    EXPECT_TRUE(resolveExecutable("sh", {}, "/").has_value());
}

TEST(ProcessTest, MergeEnvironmentOverridesInherited) {
    ::setenv("USD_TEST_INHERITED", "parent", 1);
    const auto env = mergeEnvironment({{"USD_TEST_INHERITED", "child"}, {"USD_TEST_NEW", "1"}});
    EXPECT_EQ(env.at("USD_TEST_INHERITED"), "child");
    EXPECT_EQ(env.at("USD_TEST_NEW"), "1");
    EXPECT_TRUE(env.contains("PATH") || ::getenv("PATH") == nullptr);
    ::unsetenv("USD_TEST_INHERITED");
}
