#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace usd {

enum class ErrorKind {
    Validation,
    DuplicateName,
    NotFound,
    Spawn,
    Persistence,
    Protocol,
    ProcessTimeout,
    Connection,
    Internal
};

std::string_view to_string(ErrorKind kind);
std::optional<ErrorKind> errorKindFromString(std::string_view s);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Process exit code used by the control client for each error class.
int exitCodeFor(ErrorKind kind);

}
