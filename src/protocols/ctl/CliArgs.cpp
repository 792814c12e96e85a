#include "protocols/ctl/CliArgs.hpp"

#include <charconv>
#include <cmath>
#include <fmt/format.h>

using namespace usd::types;

namespace usd::ctl {

namespace {

// Splits "--key=value" into two tokens; everything after "--" is left alone.
std::vector<std::string> normalize(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    out.reserve(args.size() + 2);
    bool passthrough = false;
    for (const auto& a : args) {
        if (passthrough) {
            out.push_back(a);
            continue;
        }
        if (a == "--") {
            passthrough = true;
            out.push_back(a);
            continue;
        }
        if (a.rfind("--", 0) == 0) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                out.push_back(a.substr(0, eq));
                out.push_back(a.substr(eq + 1));
                continue;
            }
        }
        out.push_back(a);
    }
    return out;
}

class Cursor {
public:
    explicit Cursor(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}

    [[nodiscard]] bool done() const { return pos_ >= tokens_.size(); }
    [[nodiscard]] const std::string& peek() const { return tokens_[pos_]; }
    std::string next() { return tokens_[pos_++]; }

    std::string value(const std::string& flag) {
        if (done()) throw UsageError(fmt::format("option {} requires a value", flag));
        return next();
    }

    std::vector<std::string> rest() {
        std::vector<std::string> out(tokens_.begin() + static_cast<std::ptrdiff_t>(pos_), tokens_.end());
        pos_ = tokens_.size();
        return out;
    }

private:
    std::vector<std::string> tokens_;
    std::size_t pos_ = 0;
};

std::pair<std::string, std::string> parseEnv(const std::string& kv) {
    const auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) throw UsageError(fmt::format("expected KEY=VAL, got '{}'", kv));
    return {kv.substr(0, eq), kv.substr(eq + 1)};
}

std::chrono::milliseconds parseSeconds(const std::string& s) {
    double secs = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), secs);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(secs) || secs <= 0)
        throw UsageError(fmt::format("invalid timeout '{}': expected a positive number of seconds", s));
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(secs * 1000.0)));
}

unsigned int parseCount(const std::string& s, const char* what) {
    unsigned int n = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        throw UsageError(fmt::format("invalid {} '{}'", what, s));
    return n;
}

RestartPolicy parsePolicy(const std::string& s) {
    try {
        return restartPolicyFromString(s);
    } catch (const Error&) {
        throw UsageError(fmt::format("unknown restart policy '{}' (never, on-failure, always)", s));
    }
}

ServiceKind parseKind(const std::string& s) {
    try {
        return serviceKindFromString(s);
    } catch (const Error&) {
        throw UsageError(fmt::format("unknown service kind '{}' (simple, async)", s));
    }
}

std::string requireName(Cursor& c, const std::string& cmd) {
    if (c.done() || c.peek().rfind('-', 0) == 0) throw UsageError(fmt::format("'{}' requires a service name", cmd));
    return c.next();
}

void expectEnd(const Cursor& c, const std::string& cmd) {
    if (!c.done()) throw UsageError(fmt::format("unexpected argument '{}' for '{}'", c.peek(), cmd));
}

Request parseAdd(Cursor& c) {
    ServiceDefinition def;
    def.name = requireName(c, "add");

    bool haveCommand = false;
    while (!c.done()) {
        const auto opt = c.next();
        if (opt == "--") {
            auto rest = c.rest();
            if (rest.empty()) break;
            def.command = rest.front();
            def.args.assign(rest.begin() + 1, rest.end());
            haveCommand = true;
        } else if (opt == "-w" || opt == "--workdir") def.working_directory = c.value(opt);
        else if (opt == "-e" || opt == "--env") {
            const auto [k, v] = parseEnv(c.value(opt));
            def.environment.insert_or_assign(k, v);
        } else if (opt == "-r" || opt == "--restart") def.restart_policy = parsePolicy(c.value(opt));
        else if (opt == "-t" || opt == "--stop-timeout") def.stop_timeout = parseSeconds(c.value(opt));
        else if (opt == "-g" || opt == "--group") def.group = c.value(opt);
        else if (opt == "-k" || opt == "--kind") def.kind = parseKind(c.value(opt));
        else if (opt == "--stop") {
            def.stop_command = c.value(opt);
            def.kind = ServiceKind::Async;
        } else if (opt == "--stop-arg") def.stop_args.push_back(c.value(opt));
        else if (opt == "--no-autostart") def.autostart = false;
        else if (opt == "--autostart") def.autostart = true;
        else throw UsageError(fmt::format("unknown option '{}' for 'add'", opt));
    }
    if (!haveCommand) throw UsageError("'add' requires a command after '--'");
    if (def.kind == ServiceKind::Async && !def.stop_command) throw UsageError("an async service needs --stop");

    Request req;
    req.cmd = Command::Add;
    req.service = std::move(def);
    return req;
}

Request parseEdit(Cursor& c) {
    Request req;
    req.cmd = Command::Edit;
    req.name = requireName(c, "edit");

    ServiceDefinitionPatch patch;
    while (!c.done()) {
        const auto opt = c.next();
        if (opt == "--") {
            auto rest = c.rest();
            if (rest.empty()) throw UsageError("'--' must be followed by a command");
            patch.command = rest.front();
            patch.args = std::vector<std::string>(rest.begin() + 1, rest.end());
        } else if (opt == "-w" || opt == "--workdir") {
            auto dir = c.value(opt);
            patch.working_directory = dir.empty() ? std::optional<std::string>{} : std::optional(dir);
        } else if (opt == "-e" || opt == "--env") {
            const auto [k, v] = parseEnv(c.value(opt));
            if (!patch.environment) patch.environment.emplace();
            patch.environment->insert_or_assign(k, v);
        } else if (opt == "-r" || opt == "--restart") patch.restart_policy = parsePolicy(c.value(opt));
        else if (opt == "-t" || opt == "--stop-timeout") patch.stop_timeout = parseSeconds(c.value(opt));
        else if (opt == "-g" || opt == "--group") {
            auto g = c.value(opt);
            patch.group = g.empty() ? std::optional<std::string>{} : std::optional(g);
        } else if (opt == "-k" || opt == "--kind") patch.kind = parseKind(c.value(opt));
        else if (opt == "--stop") {
            auto cmd = c.value(opt);
            patch.stop_command = cmd.empty() ? std::optional<std::string>{} : std::optional(cmd);
        } else if (opt == "--stop-arg") {
            if (!patch.stop_args) patch.stop_args.emplace();
            patch.stop_args->push_back(c.value(opt));
        } else if (opt == "--no-autostart") patch.autostart = false;
        else if (opt == "--autostart") patch.autostart = true;
        else throw UsageError(fmt::format("unknown option '{}' for 'edit'", opt));
    }
    if (patch.empty()) throw UsageError("'edit' needs at least one change");

    req.changes = std::move(patch);
    return req;
}

Request parseTargeted(Cursor& c, const Command cmd) {
    const std::string cmdName(to_string(cmd));
    Request req;
    req.cmd = cmd;

    if (!c.done() && (c.peek() == "-g" || c.peek() == "--group")) {
        const auto opt = c.next();
        req.group = c.value(opt);
    } else {
        req.name = requireName(c, cmdName);
    }
    expectEnd(c, cmdName);
    return req;
}

}

CliInvocation parseCliArgs(const std::vector<std::string>& args) {
    Cursor c(normalize(args));
    CliInvocation inv;

    while (!c.done() && c.peek().rfind('-', 0) == 0) {
        const auto opt = c.next();
        if (opt == "--socket" || opt == "-s") inv.socket = c.value(opt);
        else if (opt == "-h" || opt == "--help") inv.help = true;
        else throw UsageError(fmt::format("unknown option '{}'", opt));
    }

    if (inv.help) return inv;
    if (c.done()) throw UsageError("no command given");

    const auto cmdName = c.next();
    if (cmdName == "help") {
        inv.help = true;
        return inv;
    }

    const auto cmd = commandFromString(cmdName);
    if (!cmd) throw UsageError(fmt::format("unknown command '{}'", cmdName));

    switch (*cmd) {
        case Command::Add:
            inv.request = parseAdd(c);
            break;
        case Command::Edit:
            inv.request = parseEdit(c);
            break;
        case Command::Remove: {
            Request req;
            req.cmd = Command::Remove;
            req.name = requireName(c, cmdName);
            expectEnd(c, cmdName);
            inv.request = std::move(req);
            break;
        }
        case Command::List: {
            Request req;
            req.cmd = Command::List;
            while (!c.done()) {
                const auto opt = c.next();
                if (opt == "-g" || opt == "--group") req.group = c.value(opt);
                else throw UsageError(fmt::format("unknown option '{}' for 'list'", opt));
            }
            inv.request = std::move(req);
            break;
        }
        case Command::Status: {
            Request req;
            req.cmd = Command::Status;
            req.name = requireName(c, cmdName);
            while (!c.done()) {
                const auto opt = c.next();
                if (opt == "-n" || opt == "--lines") req.log_lines = parseCount(c.value(opt), "line count");
                else throw UsageError(fmt::format("unknown option '{}' for 'status'", opt));
            }
            inv.request = std::move(req);
            break;
        }
        case Command::Start:
        case Command::Stop:
        case Command::Restart:
            inv.request = parseTargeted(c, *cmd);
            break;
    }
    return inv;
}

std::string usageText() {
    return R"(Usage: userserversctl [--socket PATH] <command> [options]

Commands:
  add <name> [-w DIR] [-e KEY=VAL]... [-r POLICY] [-t SECS] [-g GROUP] [--no-autostart]
      [--stop CMD [--stop-arg ARG]...] -- <command> [args...]
      Register a service. POLICY is never, on-failure (default) or always.
      With --stop the service is async: <command> starts it and returns, CMD stops it.
  remove <name>
      Stop the service if running and delete its definition.
  edit <name> [-w DIR] [-e KEY=VAL]... [-r POLICY] [-t SECS] [-g GROUP] [--autostart|--no-autostart]
      [-k simple|async] [--stop CMD] [--stop-arg ARG]... [-- <command> [args...]]
      Change a definition. Takes effect on the next start. An empty DIR or GROUP clears it.
  list [-g GROUP]
      Show all services and their state.
  status <name> [-n LINES]
      Show one service with the tail of its log.
  start   (<name> | -g GROUP)
  stop    (<name> | -g GROUP)
  restart (<name> | -g GROUP)
  help

The socket defaults to $USERSERVERS_SOCKET, then <runtime dir>/userserversd.sock.
)";
}

}
