#pragma once

#include "services/AsyncService.hpp"

#include <chrono>
#include <functional>
#include <vector>
#include <sys/types.h>

namespace usd::supervisor {

struct ChildExit {
    pid_t pid;
    int status;  // raw waitpid status
};

// Receiver of reaped children. reap must run under the receiver's own lock so a pid
// cannot be recycled by a spawn between waitpid() and attribution.
class ExitSink {
public:
    virtual ~ExitSink() = default;
    virtual void routeExits(const std::function<std::vector<ChildExit>()>& reap) = 0;
};

// Waits for SIGCHLD, which must be blocked in every thread of the process, and drains
// all exited children into the sink. The poll interval bounds the latency of a lost wakeup.
class Reaper final : public services::AsyncService {
public:
    explicit Reaper(ExitSink& sink, std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~Reaper() override;

    // Non-blocking waitpid(-1) until no exited child is left.
    static std::vector<ChildExit> drainExited();

protected:
    void runLoop() override;

private:
    ExitSink& sink_;
    std::chrono::milliseconds pollInterval_;
};

}
