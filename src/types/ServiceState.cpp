#include "types/ServiceState.hpp"
#include "error/Error.hpp"

#include <cstring>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <sys/wait.h>

namespace usd::types {

std::string_view to_string(const State state) {
    switch (state) {
        case State::Stopped: return "stopped";
        case State::Starting: return "starting";
        case State::Running: return "running";
        case State::Stopping: return "stopping";
        case State::BackoffWait: return "backoff-wait";
        case State::Failed: return "failed";
    }
    return "stopped";
}

State stateFromString(const std::string_view s) {
    if (s == "stopped") return State::Stopped;
    if (s == "starting") return State::Starting;
    if (s == "running") return State::Running;
    if (s == "stopping") return State::Stopping;
    if (s == "backoff-wait") return State::BackoffWait;
    if (s == "failed") return State::Failed;
    throw Error(ErrorKind::Protocol, fmt::format("unknown service state '{}'", s));
}

ExitStatus ExitStatus::fromWaitStatus(const int status) {
    ExitStatus e;
    if (WIFSIGNALED(status)) {
        e.signaled = true;
        e.signal = WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        e.code = WEXITSTATUS(status);
    }
    return e;
}

std::string ExitStatus::describe() const {
    if (signaled) return fmt::format("killed by signal {} ({})", signal, ::strsignal(signal));
    return fmt::format("exited with code {}", code);
}

void to_json(nlohmann::json& j, const ExitStatus& e) {
    j = {{"signaled", e.signaled}};
    if (e.signaled) j["signal"] = e.signal;
    else j["code"] = e.code;
}

void from_json(const nlohmann::json& j, ExitStatus& e) {
    e.signaled = j.value("signaled", false);
    e.code = j.value("code", 0);
    e.signal = j.value("signal", 0);
}

void to_json(nlohmann::json& j, const ServiceRuntimeState& s) {
    j = {
        {"name", s.name},
        {"state", std::string(to_string(s.state))},
        {"consecutive_failures", s.consecutive_failures}
    };
    if (s.pid > 0) j["pid"] = s.pid;
    if (s.start_time) j["start_time"] = s.start_time;
    if (s.last_exit) j["last_exit"] = *s.last_exit;
    if (s.backoff_deadline) j["backoff_deadline"] = *s.backoff_deadline;
    if (!s.last_error.empty()) j["last_error"] = s.last_error;
}

void from_json(const nlohmann::json& j, ServiceRuntimeState& s) {
    s.name = j.value("name", std::string{});
    s.state = stateFromString(j.value("state", std::string("stopped")));
    s.pid = j.value("pid", 0);
    s.start_time = j.value("start_time", static_cast<std::time_t>(0));
    s.consecutive_failures = j.value("consecutive_failures", 0u);
    s.last_error = j.value("last_error", std::string{});
    if (j.contains("last_exit")) s.last_exit = j["last_exit"].get<ExitStatus>();
    if (j.contains("backoff_deadline")) s.backoff_deadline = j["backoff_deadline"].get<std::time_t>();
}

}
