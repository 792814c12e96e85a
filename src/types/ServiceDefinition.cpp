#include "types/ServiceDefinition.hpp"
#include "error/Error.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace usd::types {

namespace {

constexpr std::size_t kMaxNameLength = 128;

void invalid(const std::string& msg) { throw Error(ErrorKind::Validation, msg); }

}

std::string_view to_string(const RestartPolicy policy) {
    switch (policy) {
        case RestartPolicy::Never: return "never";
        case RestartPolicy::OnFailure: return "on-failure";
        case RestartPolicy::Always: return "always";
    }
    return "never";
}

RestartPolicy restartPolicyFromString(const std::string_view s) {
    if (s == "never") return RestartPolicy::Never;
    if (s == "on-failure" || s == "on_failure" || s == "onfailure") return RestartPolicy::OnFailure;
    if (s == "always") return RestartPolicy::Always;
    throw Error(ErrorKind::Validation, fmt::format("unknown restart policy '{}' (expected never, on-failure or always)", s));
}

std::string_view to_string(const ServiceKind kind) {
    switch (kind) {
        case ServiceKind::Simple: return "simple";
        case ServiceKind::Async: return "async";
    }
    return "simple";
}

ServiceKind serviceKindFromString(const std::string_view s) {
    if (s == "simple") return ServiceKind::Simple;
    if (s == "async") return ServiceKind::Async;
    throw Error(ErrorKind::Validation, fmt::format("unknown service kind '{}' (expected simple or async)", s));
}

bool isValidServiceName(const std::string_view name) {
    if (name.empty() || name.size() > kMaxNameLength) return false;
    if (name == "." || name == ".." || name.front() == '-') return false;
    return std::ranges::all_of(name, [](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-' || c == '@';
    });
}

void ServiceDefinition::validate() const {
    if (name.empty()) invalid("service name must not be empty");
    if (!isValidServiceName(name))
        invalid(fmt::format("invalid service name '{}': use up to {} characters from [A-Za-z0-9._@-], "
                            "not starting with '-'", name, kMaxNameLength));

    if (command.empty()) invalid("command must not be empty");
    if (command.find('\0') != std::string::npos) invalid("command contains a NUL byte");
    for (const auto& a : args)
        if (a.find('\0') != std::string::npos) invalid("argument contains a NUL byte");

    if (working_directory) {
        if (working_directory->empty() || working_directory->front() != '/')
            invalid(fmt::format("working directory '{}' must be an absolute path", *working_directory));
    }

    for (const auto& [key, value] : environment) {
        if (key.empty()) invalid("environment variable name must not be empty");
        if (key.find('=') != std::string::npos || key.find('\0') != std::string::npos)
            invalid(fmt::format("invalid environment variable name '{}'", key));
        if (value.find('\0') != std::string::npos)
            invalid(fmt::format("environment variable '{}' contains a NUL byte", key));
    }

    if (stop_timeout.count() <= 0) invalid("stop timeout must be positive");

    if (group && !isValidServiceName(*group)) invalid(fmt::format("invalid group name '{}'", *group));

    if (isAsync()) {
        if (!stop_command || stop_command->empty()) invalid("async services need a stop command");
        if (stop_command->find('\0') != std::string::npos) invalid("stop command contains a NUL byte");
        for (const auto& a : stop_args)
            if (a.find('\0') != std::string::npos) invalid("stop argument contains a NUL byte");
    } else if (stop_command || !stop_args.empty()) {
        invalid("a stop command is only used by async services");
    }
}

bool ServiceDefinitionPatch::empty() const {
    return !name && !command && !args && !working_directory && !environment && !restart_policy && !autostart &&
           !stop_timeout && !group && !kind && !stop_command && !stop_args;
}

ServiceDefinition ServiceDefinitionPatch::applyTo(const ServiceDefinition& current) const {
    if (name && *name != current.name)
        invalid(fmt::format("service '{}' cannot be renamed; remove it and add '{}' instead", current.name, *name));

    ServiceDefinition next = current;
    if (command) next.command = *command;
    if (args) next.args = *args;
    if (working_directory) next.working_directory = *working_directory;
    if (environment) next.environment = *environment;
    if (restart_policy) next.restart_policy = *restart_policy;
    if (autostart) next.autostart = *autostart;
    if (stop_timeout) next.stop_timeout = *stop_timeout;
    if (group) next.group = *group;
    if (kind) next.kind = *kind;
    if (stop_command) next.stop_command = *stop_command;
    if (stop_args) next.stop_args = *stop_args;
    // switching to simple drops the stop command unless the patch set one
    if (kind == ServiceKind::Simple && !stop_command) {
        next.stop_command.reset();
        if (!stop_args) next.stop_args.clear();
    }
    next.validate();
    return next;
}

void to_json(nlohmann::json& j, const ServiceDefinition& d) {
    j = {
        {"name", d.name},
        {"command", d.command},
        {"args", d.args},
        {"environment", d.environment},
        {"restart_policy", std::string(to_string(d.restart_policy))},
        {"autostart", d.autostart},
        {"stop_timeout_ms", d.stop_timeout.count()}
    };
    if (d.working_directory) j["working_directory"] = *d.working_directory;
    if (d.group) j["group"] = *d.group;
    j["kind"] = std::string(to_string(d.kind));
    if (d.stop_command) {
        j["stop_command"] = *d.stop_command;
        j["stop_args"] = d.stop_args;
    }
}

void from_json(const nlohmann::json& j, ServiceDefinition& d) {
    d.name = j.at("name").get<std::string>();
    d.command = j.value("command", std::string{});
    d.args = j.value("args", std::vector<std::string>{});
    d.environment = j.value("environment", std::map<std::string, std::string>{});
    d.restart_policy = restartPolicyFromString(j.value("restart_policy", std::string("on-failure")));
    d.autostart = j.value("autostart", true);
    d.stop_timeout = std::chrono::milliseconds(j.value("stop_timeout_ms", static_cast<int64_t>(10000)));

    if (j.contains("working_directory") && !j["working_directory"].is_null())
        d.working_directory = j["working_directory"].get<std::string>();
    else d.working_directory.reset();

    if (j.contains("group") && !j["group"].is_null()) d.group = j["group"].get<std::string>();
    else d.group.reset();

    d.kind = serviceKindFromString(j.value("kind", std::string("simple")));
    if (j.contains("stop_command") && !j["stop_command"].is_null()) d.stop_command = j["stop_command"].get<std::string>();
    else d.stop_command.reset();
    d.stop_args = j.value("stop_args", std::vector<std::string>{});
}

void to_json(nlohmann::json& j, const ServiceDefinitionPatch& p) {
    j = nlohmann::json::object();
    if (p.name) j["name"] = *p.name;
    if (p.command) j["command"] = *p.command;
    if (p.args) j["args"] = *p.args;
    if (p.working_directory) j["working_directory"] = p.working_directory->has_value() ? nlohmann::json(**p.working_directory) : nlohmann::json();
    if (p.environment) j["environment"] = *p.environment;
    if (p.restart_policy) j["restart_policy"] = std::string(to_string(*p.restart_policy));
    if (p.autostart) j["autostart"] = *p.autostart;
    if (p.stop_timeout) j["stop_timeout_ms"] = p.stop_timeout->count();
    if (p.group) j["group"] = p.group->has_value() ? nlohmann::json(**p.group) : nlohmann::json();
    if (p.kind) j["kind"] = std::string(to_string(*p.kind));
    if (p.stop_command) j["stop_command"] = p.stop_command->has_value() ? nlohmann::json(**p.stop_command) : nlohmann::json();
    if (p.stop_args) j["stop_args"] = *p.stop_args;
}

// A null working_directory, group or stop_command clears the field.
void from_json(const nlohmann::json& j, ServiceDefinitionPatch& p) {
    if (!j.is_object()) throw Error(ErrorKind::Validation, "changes must be a JSON object");

    if (j.contains("name")) p.name = j["name"].get<std::string>();
    if (j.contains("command")) p.command = j["command"].get<std::string>();
    if (j.contains("args")) p.args = j["args"].get<std::vector<std::string>>();
    if (j.contains("working_directory")) {
        const auto& wd = j["working_directory"];
        p.working_directory = wd.is_null() ? std::optional<std::string>{} : wd.get<std::string>();
    }
    if (j.contains("environment")) p.environment = j["environment"].get<std::map<std::string, std::string>>();
    if (j.contains("restart_policy")) p.restart_policy = restartPolicyFromString(j["restart_policy"].get<std::string>());
    if (j.contains("autostart")) p.autostart = j["autostart"].get<bool>();
    if (j.contains("stop_timeout_ms")) p.stop_timeout = std::chrono::milliseconds(j["stop_timeout_ms"].get<int64_t>());
    if (j.contains("group")) {
        const auto& g = j["group"];
        p.group = g.is_null() ? std::optional<std::string>{} : g.get<std::string>();
    }
    if (j.contains("kind")) p.kind = serviceKindFromString(j["kind"].get<std::string>());
    if (j.contains("stop_command")) {
        const auto& sc = j["stop_command"];
        p.stop_command = sc.is_null() ? std::optional<std::string>{} : sc.get<std::string>();
    }
    if (j.contains("stop_args")) p.stop_args = j["stop_args"].get<std::vector<std::string>>();
}

}
