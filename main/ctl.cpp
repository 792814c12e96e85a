#include "protocols/ctl/CliArgs.hpp"
#include "protocols/ctl/Client.hpp"
#include "protocols/ctl/render.hpp"
#include "paths.hpp"

#include <cstdlib>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace usd;
using namespace usd::ctl;

namespace {

constexpr int EXIT_USAGE = 2;

std::filesystem::path resolveSocket(const CliInvocation& inv) {
    if (inv.socket) return *inv.socket;
    if (const char* env = std::getenv("USERSERVERS_SOCKET"); env && *env) return env;
    return paths::getSocketPath();
}

void printResult(const Request& req, const nlohmann::json& data) {
    switch (req.cmd) {
        case Command::List:
            fmt::print("{}", renderList(data));
            break;
        case Command::Status:
            fmt::print("{}", renderStatus(data));
            break;
        case Command::Add:
            fmt::print("{}\n", renderRuntimeLine(data.at("definition").at("name").get<std::string>(), data.at("runtime")));
            if (data.contains("warning")) fmt::print(stderr, "warning: {}\n", data["warning"].get<std::string>());
            break;
        case Command::Edit:
            fmt::print("updated {}\n", data.at("definition").at("name").get<std::string>());
            break;
        case Command::Remove:
            fmt::print("removed {}\n", data.value("removed", *req.name));
            break;
        case Command::Start:
        case Command::Stop:
        case Command::Restart:
            if (data.is_array())
                for (const auto& item : data) fmt::print("{}\n", renderRuntimeLine(item.at("name").get<std::string>(), item.at("runtime")));
            else fmt::print("{}\n", renderRuntimeLine(*req.name, data));
            break;
    }
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    CliInvocation inv;
    try {
        inv = parseCliArgs(args);
    } catch (const UsageError& e) {
        fmt::print(stderr, "userserversctl: {}\n\n{}", e.what(), usageText());
        return EXIT_USAGE;
    }

    if (inv.help || !inv.request) {
        fmt::print("{}", usageText());
        return EXIT_SUCCESS;
    }

    try {
        Client client(resolveSocket(inv));
        const auto res = client.call(*inv.request);

        if (!res.ok) {
            const auto kind = res.kind.value_or(ErrorKind::Internal);
            fmt::print(stderr, "error ({}): {}\n", to_string(kind), res.message);
            return exitCodeFor(kind);
        }

        printResult(*inv.request, res.data);
        return EXIT_SUCCESS;
    } catch (const Error& e) {
        fmt::print(stderr, "userserversctl: {}\n", e.what());
        return exitCodeFor(e.kind());
    } catch (const std::exception& e) {
        fmt::print(stderr, "userserversctl: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
