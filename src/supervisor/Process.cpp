#include "supervisor/Process.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/UniqueFd.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>

extern char** environ;

using namespace usd::log;
using usd::util::UniqueFd;
namespace fs = std::filesystem;

namespace usd::supervisor {

namespace {

constexpr auto DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

enum class ChildStage : int { Stdio = 1, Chdir = 2, Exec = 3 };

struct ChildFailure {
    ChildStage stage;
    int err;
};

bool isExecutableFile(const fs::path& p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}

std::string describeFailure(const ChildFailure& f, const SpawnSpec& spec) {
    switch (f.stage) {
        case ChildStage::Stdio:
            return fmt::format("failed to set up stdio: {}", std::strerror(f.err));
        case ChildStage::Chdir:
            return fmt::format("bad working directory '{}': {}", spec.workingDirectory.string(), std::strerror(f.err));
        case ChildStage::Exec:
            if (f.err == EACCES) return fmt::format("permission denied executing '{}'", spec.command);
            if (f.err == ENOENT) return fmt::format("executable not found: '{}'", spec.command);
            return fmt::format("exec of '{}' failed: {}", spec.command, std::strerror(f.err));
    }
    return "unknown spawn failure";
}

// Only async-signal-safe calls from here until exec.
[[noreturn]] void runChild(const int errFd, const int devNull, const int logFd, const char* cwd,
                           const char* exe, char* const* argv, char* const* envp) {
    auto fail = [errFd](const ChildStage stage) {
        const ChildFailure f{stage, errno};
        [[maybe_unused]] const auto n = ::write(errFd, &f, sizeof(f));
        ::_exit(127);
    };

    ::setsid();

    sigset_t none;
    sigemptyset(&none);
    ::pthread_sigmask(SIG_SETMASK, &none, nullptr);

    struct sigaction dfl{};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    for (int sig = 1; sig < NSIG; ++sig) ::sigaction(sig, &dfl, nullptr);

    if (::dup2(devNull, STDIN_FILENO) < 0) fail(ChildStage::Stdio);
    const int out = logFd >= 0 ? logFd : STDERR_FILENO;
    if (::dup2(out, STDOUT_FILENO) < 0) fail(ChildStage::Stdio);
    if (out != STDERR_FILENO && ::dup2(out, STDERR_FILENO) < 0) fail(ChildStage::Stdio);

    if (::chdir(cwd) != 0) fail(ChildStage::Chdir);

    ::execve(exe, argv, envp);
    fail(ChildStage::Exec);
    ::_exit(127);
}

}

std::map<std::string, std::string> mergeEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view entry(*e);
        const auto eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    for (const auto& [k, v] : overrides) env[k] = v;
    return env;
}

std::optional<fs::path> resolveExecutable(const std::string& command,
                                          const std::map<std::string, std::string>& env,
                                          const fs::path& cwd) {
    if (command.empty()) return std::nullopt;

    if (command.find('/') != std::string::npos) {
        fs::path p(command);
        if (p.is_relative()) p = (cwd / p).lexically_normal();
        return isExecutableFile(p) ? std::optional(p) : std::nullopt;
    }

    const auto it = env.find("PATH");
    const std::string path = it != env.end() ? it->second : DEFAULT_PATH;

    std::size_t begin = 0;
    while (begin <= path.size()) {
        auto end = path.find(':', begin);
        if (end == std::string::npos) end = path.size();
        const auto dir = path.substr(begin, end - begin);
        const fs::path candidate = (dir.empty() ? cwd : fs::path(dir)) / command;
        if (isExecutableFile(candidate)) return candidate;
        begin = end + 1;
    }
    return std::nullopt;
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnSpec& spec) {
    const auto exe = resolveExecutable(spec.command, spec.environment, spec.workingDirectory);
    if (!exe) {
        const fs::path direct(spec.command);
        if (spec.command.find('/') != std::string::npos && fs::exists(direct))
            throw Error(ErrorKind::Spawn, fmt::format("permission denied executing '{}'", spec.command));
        throw Error(ErrorKind::Spawn, fmt::format("executable not found: '{}'", spec.command));
    }

    const UniqueFd devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devNull)
        throw Error(ErrorKind::Spawn, fmt::format("failed to open /dev/null: {}", std::strerror(errno)));

    const UniqueFd logFd(::open(spec.logFile.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600));
    if (!logFd)
        Registry::supervisor()->warn("[ChildProcess] Cannot open log file {} for '{}': {}; using daemon stderr",
                                     spec.logFile.string(), spec.name, std::strerror(errno));

    int pipeFds[2];
    if (::pipe2(pipeFds, O_CLOEXEC) != 0)
        throw Error(ErrorKind::Spawn, fmt::format("pipe2 failed: {}", std::strerror(errno)));
    const UniqueFd errRead(pipeFds[0]);
    UniqueFd errWrite(pipeFds[1]);

    // argv/envp storage must outlive the fork; the child only reads it.
    const std::string exePath = exe->string();
    std::vector<std::string> argStrings;
    argStrings.reserve(spec.args.size() + 1);
    argStrings.push_back(spec.command);
    argStrings.insert(argStrings.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argStrings) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> envStrings;
    envStrings.reserve(spec.environment.size());
    for (const auto& [k, v] : spec.environment) envStrings.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& e : envStrings) envp.push_back(e.data());
    envp.push_back(nullptr);

    const std::string cwd = spec.workingDirectory.string();

    const pid_t pid = ::fork();
    if (pid < 0) throw Error(ErrorKind::Spawn, fmt::format("fork failed: {}", std::strerror(errno)));
    if (pid == 0) runChild(errWrite.get(), devNull.get(), logFd.get(), cwd.c_str(), exePath.c_str(), argv.data(), envp.data());

    errWrite.reset();

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(errRead.get(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n == 0) {
        Registry::supervisor()->debug("[ChildProcess] Spawned '{}' as pid {} ({})", spec.name, pid, exePath);
        return std::make_unique<ChildProcess>(Token{}, pid);
    }

    // exec never happened; the child is ours to reap
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (n != static_cast<ssize_t>(sizeof(failure)))
        throw Error(ErrorKind::Spawn, fmt::format("spawn of '{}' failed before exec", spec.command));
    throw Error(ErrorKind::Spawn, describeFailure(failure, spec));
}

ChildProcess::~ChildProcess() {
    if (reaped_ || pid_ <= 0) return;

    Registry::supervisor()->warn("[ChildProcess] Handle for pid {} dropped while alive, killing", pid_);
    signal(SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
}

bool ChildProcess::signal(const int sig) const {
    if (::kill(-pid_, sig) == 0) return true;
    // setsid may not have run yet in a freshly forked child
    return ::kill(pid_, sig) == 0;
}

}
