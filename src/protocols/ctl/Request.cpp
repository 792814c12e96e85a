#include "protocols/ctl/Request.hpp"

#include <array>
#include <utility>
#include <fmt/format.h>

using namespace usd::types;
using nlohmann::json;

namespace usd::ctl {

namespace {

constexpr std::array<std::pair<Command, std::string_view>, 8> kCommands{{
    {Command::Add, "add"},
    {Command::Remove, "remove"},
    {Command::Edit, "edit"},
    {Command::List, "list"},
    {Command::Status, "status"},
    {Command::Start, "start"},
    {Command::Stop, "stop"},
    {Command::Restart, "restart"},
}};

std::string requireString(const json& j, const char* key, const Command cmd) {
    if (!j.contains(key) || !j[key].is_string())
        throw Error(ErrorKind::Protocol, fmt::format("'{}' requires a string '{}' field", to_string(cmd), key));
    return j[key].get<std::string>();
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) throw Error(ErrorKind::Protocol, fmt::format("'{}' must be a string", key));
    return j[key].get<std::string>();
}

}

std::string_view to_string(const Command cmd) {
    for (const auto& [c, s] : kCommands)
        if (c == cmd) return s;
    return "unknown";
}

std::optional<Command> commandFromString(const std::string_view s) {
    for (const auto& [c, name] : kCommands)
        if (name == s) return c;
    return std::nullopt;
}

Request parseRequest(const json& j) {
    if (!j.is_object()) throw Error(ErrorKind::Protocol, "request must be a JSON object");
    if (!j.contains("cmd") || !j["cmd"].is_string()) throw Error(ErrorKind::Protocol, "request is missing 'cmd'");

    const auto cmdName = j["cmd"].get<std::string>();
    const auto cmd = commandFromString(cmdName);
    if (!cmd) throw Error(ErrorKind::Protocol, fmt::format("unknown command '{}'", cmdName));

    Request req;
    req.cmd = *cmd;

    try {
        switch (req.cmd) {
            case Command::Add:
                if (!j.contains("service") || !j["service"].is_object())
                    throw Error(ErrorKind::Protocol, "'add' requires a 'service' object");
                req.service = j["service"].get<ServiceDefinition>();
                break;
            case Command::Remove:
                req.name = requireString(j, "name", req.cmd);
                break;
            case Command::Edit:
                req.name = requireString(j, "name", req.cmd);
                if (!j.contains("changes") || !j["changes"].is_object())
                    throw Error(ErrorKind::Protocol, "'edit' requires a 'changes' object");
                req.changes = j["changes"].get<ServiceDefinitionPatch>();
                break;
            case Command::List:
                req.group = optionalString(j, "group");
                break;
            case Command::Status:
                req.name = requireString(j, "name", req.cmd);
                if (j.contains("log_lines")) {
                    if (!j["log_lines"].is_number_unsigned())
                        throw Error(ErrorKind::Protocol, "'log_lines' must be a non-negative integer");
                    req.log_lines = j["log_lines"].get<unsigned int>();
                }
                break;
            case Command::Start:
            case Command::Stop:
            case Command::Restart:
                req.name = optionalString(j, "name");
                req.group = optionalString(j, "group");
                if (req.name.has_value() == req.group.has_value())
                    throw Error(ErrorKind::Protocol, fmt::format("'{}' requires exactly one of 'name' or 'group'", cmdName));
                break;
        }
    } catch (const json::exception& e) {
        throw Error(ErrorKind::Validation, fmt::format("malformed service definition: {}", e.what()));
    }

    return req;
}

json toJson(const Request& req) {
    json j{{"cmd", std::string(to_string(req.cmd))}};
    if (req.name) j["name"] = *req.name;
    if (req.group) j["group"] = *req.group;
    if (req.service) j["service"] = *req.service;
    if (req.changes) j["changes"] = *req.changes;
    if (req.log_lines) j["log_lines"] = *req.log_lines;
    return j;
}

Response Response::success(json data) {
    Response r;
    r.data = std::move(data);
    return r;
}

Response Response::failure(const ErrorKind kind, std::string message) {
    Response r;
    r.ok = false;
    r.kind = kind;
    r.message = std::move(message);
    return r;
}

json toJson(const Response& res) {
    if (res.ok) return {{"ok", true}, {"data", res.data}};
    return {{"ok", false},
            {"error", {{"kind", std::string(to_string(res.kind.value_or(ErrorKind::Internal)))}, {"message", res.message}}}};
}

Response parseResponse(const json& j) {
    if (!j.is_object() || !j.contains("ok") || !j["ok"].is_boolean())
        throw Error(ErrorKind::Protocol, "malformed response from daemon");

    if (j["ok"].get<bool>()) return Response::success(j.value("data", json()));

    const auto& err = j.value("error", json::object());
    const auto kind = errorKindFromString(err.value("kind", std::string("internal")));
    return Response::failure(kind.value_or(ErrorKind::Internal), err.value("message", std::string("unknown error")));
}

}
