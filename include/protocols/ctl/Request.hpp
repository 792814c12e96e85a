#pragma once

#include "error/Error.hpp"
#include "types/ServiceDefinition.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace usd::ctl {

enum class Command { Add, Remove, Edit, List, Status, Start, Stop, Restart };

std::string_view to_string(Command cmd);
std::optional<Command> commandFromString(std::string_view s);

struct Request {
    Command cmd = Command::List;
    std::optional<std::string> name;
    std::optional<std::string> group;
    std::optional<types::ServiceDefinition> service;        // add
    std::optional<types::ServiceDefinitionPatch> changes;   // edit
    std::optional<unsigned int> log_lines;                  // status
};

// Throws Error(Protocol) for an unknown command or a malformed envelope and
// Error(Validation) for a definition with wrongly typed fields.
Request parseRequest(const nlohmann::json& j);
nlohmann::json toJson(const Request& req);

struct Response {
    bool ok = true;
    nlohmann::json data;
    std::optional<ErrorKind> kind;
    std::string message;

    static Response success(nlohmann::json data = nullptr);
    static Response failure(ErrorKind kind, std::string message);
};

nlohmann::json toJson(const Response& res);

// Throws Error(Protocol) when the body is not a response object.
Response parseResponse(const nlohmann::json& j);

}
