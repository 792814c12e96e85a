#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace usd::supervisor {

struct SpawnSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path workingDirectory;
    std::map<std::string, std::string> environment;  // merged, complete environment of the child
    std::filesystem::path logFile;                   // stdout/stderr target, appended
};

// Owns one forked child running in its own session. A handle destroyed before the child
// was reaped kills the process group and reaps it, so no child outlives its handle.
class ChildProcess {
    struct Token {
        explicit Token() = default;
    };

public:
    // Only spawn() can name a Token.
    ChildProcess(Token, pid_t pid) : pid_(pid) {}

    // Throws Error(Spawn) when the executable cannot be resolved or exec fails.
    // A child whose exec failed is reaped here before throwing.
    static std::unique_ptr<ChildProcess> spawn(const SpawnSpec& spec);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool reaped() const noexcept { return reaped_; }

    // Delivers sig to the whole process group. False if the group is already gone.
    bool signal(int sig) const;

    void markReaped() noexcept { reaped_ = true; }

private:
    pid_t pid_;
    bool reaped_ = false;
};

// Current process environment with overrides applied on top.
std::map<std::string, std::string> mergeEnvironment(const std::map<std::string, std::string>& overrides);

// Resolves command the way execvp would, using PATH from env. Commands containing a slash
// are taken relative to cwd.
std::optional<std::filesystem::path> resolveExecutable(const std::string& command,
                                                       const std::map<std::string, std::string>& env,
                                                       const std::filesystem::path& cwd);

}
