#pragma once

#include "protocols/ctl/Request.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace usd::ctl {

// Bad command line; the client prints usage and exits with code 2.
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct CliInvocation {
    bool help = false;
    std::optional<std::filesystem::path> socket;  // --socket override
    std::optional<Request> request;
};

// args excludes the program name. Throws UsageError.
CliInvocation parseCliArgs(const std::vector<std::string>& args);

std::string usageText();

}
