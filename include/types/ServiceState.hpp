#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace usd::types {

enum class State { Stopped, Starting, Running, Stopping, BackoffWait, Failed };

std::string_view to_string(State state);
State stateFromString(std::string_view s);

struct ExitStatus {
    bool signaled = false;
    int code = 0;    // exit code when !signaled
    int signal = 0;  // terminating signal when signaled

    static ExitStatus fromWaitStatus(int status);

    [[nodiscard]] bool success() const noexcept { return !signaled && code == 0; }
    [[nodiscard]] std::string describe() const;

    bool operator==(const ExitStatus&) const = default;
};

// Point-in-time copy of a service's runtime state, handed out by the Supervisor.
struct ServiceRuntimeState {
    std::string name;
    State state = State::Stopped;
    pid_t pid = 0;
    std::time_t start_time = 0;
    std::optional<ExitStatus> last_exit;
    unsigned int consecutive_failures = 0;
    std::optional<std::time_t> backoff_deadline;
    std::string last_error;
};

void to_json(nlohmann::json& j, const ExitStatus& e);
void from_json(const nlohmann::json& j, ExitStatus& e);
void to_json(nlohmann::json& j, const ServiceRuntimeState& s);
void from_json(const nlohmann::json& j, ServiceRuntimeState& s);

}
