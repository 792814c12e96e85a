#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace usd::types {

enum class RestartPolicy { Never, OnFailure, Always };

std::string_view to_string(RestartPolicy policy);
RestartPolicy restartPolicyFromString(std::string_view s);

// Simple services are the supervised child itself. An async service's command starts
// something that detaches and exits; stop_command shuts it down again.
enum class ServiceKind { Simple, Async };

std::string_view to_string(ServiceKind kind);
ServiceKind serviceKindFromString(std::string_view s);

struct ServiceDefinition {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;
    RestartPolicy restart_policy = RestartPolicy::OnFailure;
    bool autostart = true;
    std::chrono::milliseconds stop_timeout{10000};
    std::optional<std::string> group;
    ServiceKind kind = ServiceKind::Simple;
    std::optional<std::string> stop_command;
    std::vector<std::string> stop_args;

    bool operator==(const ServiceDefinition&) const = default;

    [[nodiscard]] bool isAsync() const { return kind == ServiceKind::Async; }

    // Throws Error(Validation) describing the first offending field.
    void validate() const;
};

// Partial update applied by `edit`; unset fields keep their current value.
struct ServiceDefinitionPatch {
    std::optional<std::string> name;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::optional<std::string>> working_directory;
    std::optional<std::map<std::string, std::string>> environment;
    std::optional<RestartPolicy> restart_policy;
    std::optional<bool> autostart;
    std::optional<std::chrono::milliseconds> stop_timeout;
    std::optional<std::optional<std::string>> group;
    std::optional<ServiceKind> kind;
    std::optional<std::optional<std::string>> stop_command;
    std::optional<std::vector<std::string>> stop_args;

    [[nodiscard]] bool empty() const;
    [[nodiscard]] ServiceDefinition applyTo(const ServiceDefinition& current) const;
};

bool isValidServiceName(std::string_view name);

void to_json(nlohmann::json& j, const ServiceDefinition& d);
void from_json(const nlohmann::json& j, ServiceDefinition& d);
void to_json(nlohmann::json& j, const ServiceDefinitionPatch& p);
void from_json(const nlohmann::json& j, ServiceDefinitionPatch& p);

}
