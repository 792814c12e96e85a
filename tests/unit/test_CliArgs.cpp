#include <gtest/gtest.h>
#include "protocols/ctl/CliArgs.hpp"

using namespace usd::ctl;
using namespace usd::types;

namespace {

Request parse(const std::vector<std::string>& args) {
    auto inv = parseCliArgs(args);
    EXPECT_TRUE(inv.request.has_value());
    return *inv.request;
}

}

TEST(CliArgsTest, AddTakesCommandAfterSeparator) {
    const auto req = parse({"add", "web", "-w", "/srv/web", "-e", "PORT=8080", "-e", "MODE=a=b",
                            "-r", "always", "-t", "2.5", "-g", "frontend", "--no-autostart",
                            "--", "python3", "-m", "http.server", "--bind", "::"});
    ASSERT_EQ(req.cmd, Command::Add);
    const auto& def = req.service.value();
    EXPECT_EQ(def.name, "web");
    EXPECT_EQ(def.command, "python3");
    EXPECT_EQ(def.args, (std::vector<std::string>{"-m", "http.server", "--bind", "::"}));
    EXPECT_EQ(def.working_directory.value(), "/srv/web");
    EXPECT_EQ(def.environment.at("PORT"), "8080");
    EXPECT_EQ(def.environment.at("MODE"), "a=b");
    EXPECT_EQ(def.restart_policy, RestartPolicy::Always);
    EXPECT_EQ(def.stop_timeout.count(), 2500);
    EXPECT_EQ(def.group.value(), "frontend");
    EXPECT_FALSE(def.autostart);
}

TEST(CliArgsTest, LongOptionsAcceptEqualsForm) {
    const auto req = parse({"add", "w", "--restart=never", "--group=g", "--", "sleep", "--x=1"});
    EXPECT_EQ(req.service->restart_policy, RestartPolicy::Never);
    EXPECT_EQ(req.service->group.value(), "g");
    EXPECT_EQ(req.service->args, (std::vector<std::string>{"--x=1"}));
}

TEST(CliArgsTest, AddWithoutCommandIsUsageError) {
    EXPECT_THROW(parseCliArgs({"add", "web"}), UsageError);
    EXPECT_THROW(parseCliArgs({"add", "web", "--"}), UsageError);
    EXPECT_THROW(parseCliArgs({"add"}), UsageError);
    EXPECT_THROW(parseCliArgs({"add", "web", "-r", "sometimes", "--", "x"}), UsageError);
    EXPECT_THROW(parseCliArgs({"add", "web", "-t", "0", "--", "x"}), UsageError);
    EXPECT_THROW(parseCliArgs({"add", "web", "-e", "=v", "--", "x"}), UsageError);
    EXPECT_THROW(parseCliArgs({"add", "web", "-w"}), UsageError);
}

TEST(CliArgsTest, StopCommandMakesServiceAsync) {
    const auto req = parse({"add", "db", "--stop", "pg_ctl", "--stop-arg", "stop", "--stop-arg=-D/srv/db",
                            "--", "pg_ctl", "start", "-D/srv/db"});
    const auto& def = req.service.value();
    EXPECT_EQ(def.kind, ServiceKind::Async);
    EXPECT_EQ(def.stop_command.value(), "pg_ctl");
    EXPECT_EQ(def.stop_args, (std::vector<std::string>{"stop", "-D/srv/db"}));
    EXPECT_EQ(def.args, (std::vector<std::string>{"start", "-D/srv/db"}));

    EXPECT_THROW(parseCliArgs({"add", "db", "-k", "async", "--", "x"}), UsageError);
    EXPECT_THROW(parseCliArgs({"add", "db", "-k", "forking", "--", "x"}), UsageError);
}

TEST(CliArgsTest, EditCanSwitchKind) {
    const auto toSimple = parse({"edit", "db", "-k", "simple"});
    EXPECT_EQ(toSimple.changes->kind.value(), ServiceKind::Simple);

    const auto toAsync = parse({"edit", "db", "--kind=async", "--stop", "kill", "--stop-arg", "42"});
    const auto& p = toAsync.changes.value();
    EXPECT_EQ(p.kind.value(), ServiceKind::Async);
    EXPECT_EQ(p.stop_command->value(), "kill");
    EXPECT_EQ(p.stop_args.value(), (std::vector<std::string>{"42"}));

    const auto cleared = parse({"edit", "db", "--stop", ""});
    ASSERT_TRUE(cleared.changes->stop_command.has_value());
    EXPECT_FALSE(cleared.changes->stop_command->has_value());
}

TEST(CliArgsTest, EditBuildsPatchAndClearsWithEmptyValue) {
    const auto req = parse({"edit", "web", "-g", "", "-r", "on-failure", "--", "node", "app.js"});
    ASSERT_EQ(req.cmd, Command::Edit);
    EXPECT_EQ(req.name.value(), "web");
    const auto& p = req.changes.value();
    ASSERT_TRUE(p.group.has_value());
    EXPECT_FALSE(p.group->has_value());
    EXPECT_EQ(p.restart_policy.value(), RestartPolicy::OnFailure);
    EXPECT_EQ(p.command.value(), "node");
    EXPECT_EQ(p.args.value(), (std::vector<std::string>{"app.js"}));
    EXPECT_FALSE(p.working_directory.has_value());

    EXPECT_THROW(parseCliArgs({"edit", "web"}), UsageError);
}

TEST(CliArgsTest, TargetedCommandsTakeNameOrGroup) {
    for (const std::string cmd : {"start", "stop", "restart"}) {
        const auto byName = parse({cmd, "web"});
        EXPECT_EQ(byName.name.value(), "web");
        EXPECT_FALSE(byName.group.has_value());

        const auto byGroup = parse({cmd, "-g", "frontend"});
        EXPECT_EQ(byGroup.group.value(), "frontend");
        EXPECT_FALSE(byGroup.name.has_value());

        EXPECT_THROW(parseCliArgs({cmd}), UsageError);
        EXPECT_THROW(parseCliArgs({cmd, "a", "b"}), UsageError);
    }
}

TEST(CliArgsTest, ListStatusRemove) {
    EXPECT_FALSE(parse({"list"}).group.has_value());
    EXPECT_EQ(parse({"list", "--group", "g"}).group.value(), "g");

    const auto status = parse({"status", "web", "-n", "20"});
    EXPECT_EQ(status.cmd, Command::Status);
    EXPECT_EQ(status.log_lines.value(), 20u);
    EXPECT_THROW(parseCliArgs({"status", "web", "-n", "lots"}), UsageError);

    EXPECT_EQ(parse({"remove", "web"}).cmd, Command::Remove);
    EXPECT_THROW(parseCliArgs({"remove"}), UsageError);
}

TEST(CliArgsTest, GlobalOptionsAndHelp) {
    const auto inv = parseCliArgs({"--socket", "/tmp/x.sock", "list"});
    EXPECT_EQ(inv.socket.value(), std::filesystem::path("/tmp/x.sock"));
    EXPECT_EQ(inv.request->cmd, Command::List);

    EXPECT_TRUE(parseCliArgs({"-h"}).help);
    EXPECT_TRUE(parseCliArgs({"help"}).help);
    EXPECT_FALSE(parseCliArgs({"help"}).request.has_value());

    EXPECT_THROW(parseCliArgs({}), UsageError);
    EXPECT_THROW(parseCliArgs({"frobnicate"}), UsageError);
    EXPECT_THROW(parseCliArgs({"--verbose", "list"}), UsageError);
    EXPECT_NE(usageText().find("restart"), std::string::npos);
}
