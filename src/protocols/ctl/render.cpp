#include "protocols/ctl/render.hpp"
#include "protocols/ctl/Table.hpp"
#include "types/ServiceDefinition.hpp"
#include "types/ServiceState.hpp"

#include <ctime>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace usd::types;
using nlohmann::json;

namespace usd::ctl {

namespace {

std::string commandLine(const std::string& command, const std::vector<std::string>& args) {
    std::string out = command;
    for (const auto& a : args) {
        out += ' ';
        out += a.find(' ') == std::string::npos && !a.empty() ? a : fmt::format("\"{}\"", a);
    }
    return out;
}

std::string localTime(const std::time_t t) {
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

}

std::string renderRuntimeLine(const std::string& name, const json& runtime) {
    const auto rt = runtime.get<ServiceRuntimeState>();
    std::string line = fmt::format("{}: {}", name, to_string(rt.state));
    if (rt.pid) line += fmt::format(" (pid {})", rt.pid);
    if (!rt.last_error.empty()) line += fmt::format(" - {}", rt.last_error);
    return line;
}

std::string renderList(const json& data) {
    Table table({{"NAME"}, {"STATE"}, {"PID", Align::Right}, {"FAILS", Align::Right}, {"GROUP"}, {"COMMAND", Align::Left, 60}});

    for (const auto& item : data) {
        const auto def = item.at("definition").get<ServiceDefinition>();
        const auto rt = item.at("runtime").get<ServiceRuntimeState>();
        table.add_row({def.name,
                       std::string(to_string(rt.state)),
                       rt.pid ? std::to_string(rt.pid) : "-",
                       std::to_string(rt.consecutive_failures),
                       def.group.value_or("-"),
                       commandLine(def.command, def.args)});
    }

    if (table.empty()) return "No services registered.\n";
    return table.render();
}

std::string renderStatus(const json& data) {
    const auto def = data.at("definition").get<ServiceDefinition>();
    const auto rt = data.at("runtime").get<ServiceRuntimeState>();

    std::string out;
    auto field = [&out](const std::string_view key, const std::string& value) {
        fmt::format_to(std::back_inserter(out), "{:>14}: {}\n", key, value);
    };

    field("name", def.name);
    field("state", std::string(to_string(rt.state)));
    if (rt.pid) field("pid", std::to_string(rt.pid));
    if (rt.start_time) field("started", localTime(rt.start_time));
    if (rt.last_exit) field("last exit", rt.last_exit->describe());
    field("failures", std::to_string(rt.consecutive_failures));
    if (rt.backoff_deadline) field("next restart", localTime(*rt.backoff_deadline));
    if (!rt.last_error.empty()) field("last error", rt.last_error);
    field("kind", std::string(to_string(def.kind)));
    field("command", commandLine(def.command, def.args));
    if (def.stop_command) field("stop command", commandLine(*def.stop_command, def.stop_args));
    field("restart", std::string(to_string(def.restart_policy)));
    field("autostart", def.autostart ? "yes" : "no");
    field("stop timeout", fmt::format("{}ms", def.stop_timeout.count()));
    if (def.working_directory) field("directory", *def.working_directory);
    if (def.group) field("group", *def.group);
    for (const auto& [k, v] : def.environment) field("env", fmt::format("{}={}", k, v));

    if (data.contains("log") && !data["log"].empty()) {
        out += "\n";
        for (const auto& line : data["log"]) {
            out += line.get<std::string>();
            out += '\n';
        }
    }
    return out;
}

}
