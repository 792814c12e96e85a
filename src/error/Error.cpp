#include "error/Error.hpp"

#include <array>
#include <utility>

namespace usd {

namespace {

constexpr std::array<std::pair<ErrorKind, std::string_view>, 9> kNames{{
    {ErrorKind::Validation, "validation"},
    {ErrorKind::DuplicateName, "duplicate-name"},
    {ErrorKind::NotFound, "not-found"},
    {ErrorKind::Spawn, "spawn"},
    {ErrorKind::Persistence, "persistence"},
    {ErrorKind::Protocol, "protocol"},
    {ErrorKind::ProcessTimeout, "process-timeout"},
    {ErrorKind::Connection, "connection"},
    {ErrorKind::Internal, "internal"},
}};

}

std::string_view to_string(const ErrorKind kind) {
    for (const auto& [k, name] : kNames)
        if (k == kind) return name;
    return "internal";
}

std::optional<ErrorKind> errorKindFromString(const std::string_view s) {
    for (const auto& [k, name] : kNames)
        if (name == s) return k;
    return std::nullopt;
}

int exitCodeFor(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return 3;
        case ErrorKind::Validation:
        case ErrorKind::DuplicateName: return 4;
        case ErrorKind::Connection: return 5;
        default: return 1;
    }
}

}
