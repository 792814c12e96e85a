#include <gtest/gtest.h>
#include "types/ServiceDefinition.hpp"
#include "types/ServiceState.hpp"
#include "error/Error.hpp"

#include <nlohmann/json.hpp>
#include <functional>

using namespace usd;
using namespace usd::types;
using nlohmann::json;

namespace {

ServiceDefinition validDef() {
    ServiceDefinition d;
    d.name = "web";
    d.command = "/usr/bin/python3";
    d.args = {"-m", "http.server", "8080"};
    return d;
}

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind();
    }
    return ErrorKind::Internal;
}

}

TEST(ServiceDefinitionTest, AcceptsMinimalDefinition) {
    EXPECT_NO_THROW(validDef().validate());
}

TEST(ServiceDefinitionTest, NameCharsetIsRestricted) {
    EXPECT_TRUE(isValidServiceName("api-gateway_2.staging@eu"));
    EXPECT_FALSE(isValidServiceName(""));
    EXPECT_FALSE(isValidServiceName("a/b"));
    EXPECT_FALSE(isValidServiceName(".."));
    EXPECT_FALSE(isValidServiceName("."));
    EXPECT_FALSE(isValidServiceName("-flag"));
    EXPECT_FALSE(isValidServiceName("has space"));
    EXPECT_FALSE(isValidServiceName(std::string(129, 'a')));
    EXPECT_TRUE(isValidServiceName(std::string(128, 'a')));
}

TEST(ServiceDefinitionTest, RejectsInvalidFieldsAsValidation) {
    auto d = validDef();
    d.name = "../etc";
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);

    d = validDef();
    d.command.clear();
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);

    d = validDef();
    d.working_directory = "relative/dir";
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);

    d = validDef();
    d.environment["BAD=KEY"] = "x";
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);

    d = validDef();
    d.environment[""] = "x";
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);

    d = validDef();
    d.stop_timeout = std::chrono::milliseconds(0);
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);

    d = validDef();
    d.group = "bad group";
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);
}

TEST(ServiceDefinitionTest, RestartPolicyWireNames) {
    EXPECT_EQ(to_string(RestartPolicy::Never), "never");
    EXPECT_EQ(to_string(RestartPolicy::OnFailure), "on-failure");
    EXPECT_EQ(to_string(RestartPolicy::Always), "always");
    EXPECT_EQ(restartPolicyFromString("always"), RestartPolicy::Always);
    EXPECT_EQ(kindOf([] { (void)restartPolicyFromString("sometimes"); }), ErrorKind::Validation);
}

TEST(ServiceDefinitionTest, JsonKeepsEveryField) {
    auto d = validDef();
    d.working_directory = "/srv/web";
    d.environment = {{"PORT", "8080"}, {"MODE", "dev"}};
    d.restart_policy = RestartPolicy::Always;
    d.autostart = false;
    d.stop_timeout = std::chrono::milliseconds(2500);
    d.group = "frontend";

    const json j = d;
    EXPECT_EQ(j["stop_timeout_ms"], 2500);
    EXPECT_EQ(j["restart_policy"], "always");
    EXPECT_EQ(j.get<ServiceDefinition>(), d);
}

TEST(ServiceDefinitionTest, JsonDefaultsOptionalFields) {
    const auto d = json{{"name", "w"}, {"command", "sleep"}}.get<ServiceDefinition>();
    EXPECT_TRUE(d.args.empty());
    EXPECT_EQ(d.restart_policy, RestartPolicy::OnFailure);
    EXPECT_TRUE(d.autostart);
    EXPECT_EQ(d.stop_timeout, std::chrono::milliseconds(10000));
    EXPECT_FALSE(d.working_directory.has_value());
    EXPECT_FALSE(d.group.has_value());
}

TEST(ServiceDefinitionTest, AsyncKindNeedsItsStopCommand) {
    auto d = validDef();
    d.kind = ServiceKind::Async;
    EXPECT_EQ(kindOf([&] { d.validate(); }), ErrorKind::Validation);

    d.stop_command = "/usr/bin/pkill";
    d.stop_args = {"-f", "http.server"};
    EXPECT_NO_THROW(d.validate());

    const json j = d;
    EXPECT_EQ(j["kind"], "async");
    EXPECT_EQ(j["stop_command"], "/usr/bin/pkill");
    EXPECT_EQ(j.get<ServiceDefinition>(), d);

    auto simple = validDef();
    simple.stop_command = "/bin/true";
    EXPECT_EQ(kindOf([&] { simple.validate(); }), ErrorKind::Validation);
    EXPECT_EQ(kindOf([] { (void)serviceKindFromString("forking"); }), ErrorKind::Validation);
}

TEST(ServiceDefinitionTest, StoredDefinitionWithoutKindIsSimple) {
    const auto d = json{{"name", "w"}, {"command", "sleep"}}.get<ServiceDefinition>();
    EXPECT_EQ(d.kind, ServiceKind::Simple);
    EXPECT_FALSE(d.stop_command.has_value());
    EXPECT_FALSE(d.isAsync());
}

TEST(ServiceDefinitionPatchTest, SwitchingToSimpleDropsStopCommand) {
    auto base = validDef();
    base.kind = ServiceKind::Async;
    base.stop_command = "/usr/bin/pkill";
    base.stop_args = {"python3"};

    const auto p = json{{"kind", "simple"}}.get<ServiceDefinitionPatch>();
    const auto updated = p.applyTo(base);
    EXPECT_EQ(updated.kind, ServiceKind::Simple);
    EXPECT_FALSE(updated.stop_command.has_value());
    EXPECT_TRUE(updated.stop_args.empty());

    const auto toAsync = json{{"kind", "async"}, {"stop_command", "/bin/kill"}}.get<ServiceDefinitionPatch>();
    EXPECT_EQ(toAsync.applyTo(validDef()).stop_command.value(), "/bin/kill");

    const auto clearOnly = json{{"stop_command", nullptr}}.get<ServiceDefinitionPatch>();
    EXPECT_EQ(kindOf([&] { (void)clearOnly.applyTo(base); }), ErrorKind::Validation);
}

TEST(ServiceDefinitionPatchTest, AppliesOnlySetFields) {
    ServiceDefinitionPatch p;
    p.args = std::vector<std::string>{"-m", "http.server", "9090"};
    p.restart_policy = RestartPolicy::Never;

    const auto updated = p.applyTo(validDef());
    EXPECT_EQ(updated.command, "/usr/bin/python3");
    EXPECT_EQ(updated.args.back(), "9090");
    EXPECT_EQ(updated.restart_policy, RestartPolicy::Never);
}

TEST(ServiceDefinitionPatchTest, NullClearsOptionalFields) {
    auto base = validDef();
    base.group = "g1";
    base.working_directory = "/tmp";

    const auto p = json{{"group", nullptr}, {"working_directory", nullptr}}.get<ServiceDefinitionPatch>();
    const auto updated = p.applyTo(base);
    EXPECT_FALSE(updated.group.has_value());
    EXPECT_FALSE(updated.working_directory.has_value());
}

TEST(ServiceDefinitionPatchTest, RenameAndInvalidResultAreRejected) {
    ServiceDefinitionPatch rename;
    rename.name = "other";
    EXPECT_EQ(kindOf([&] { (void)rename.applyTo(validDef()); }), ErrorKind::Validation);

    ServiceDefinitionPatch sameName;
    sameName.name = "web";
    EXPECT_NO_THROW((void)sameName.applyTo(validDef()));

    ServiceDefinitionPatch badDir;
    badDir.working_directory = std::optional<std::string>("not/absolute");
    EXPECT_EQ(kindOf([&] { (void)badDir.applyTo(validDef()); }), ErrorKind::Validation);
}

TEST(ServiceStateTest, WireNamesAndExitStatus) {
    EXPECT_EQ(to_string(State::BackoffWait), "backoff-wait");
    EXPECT_EQ(stateFromString("running"), State::Running);

    const auto exited = ExitStatus::fromWaitStatus(3 << 8);
    EXPECT_FALSE(exited.signaled);
    EXPECT_EQ(exited.code, 3);
    EXPECT_FALSE(exited.success());

    EXPECT_TRUE(ExitStatus::fromWaitStatus(0).success());
}

TEST(ErrorTest, ExitCodesPerKind) {
    EXPECT_EQ(exitCodeFor(ErrorKind::NotFound), 3);
    EXPECT_EQ(exitCodeFor(ErrorKind::Validation), 4);
    EXPECT_EQ(exitCodeFor(ErrorKind::DuplicateName), 4);
    EXPECT_EQ(exitCodeFor(ErrorKind::Connection), 5);
    EXPECT_EQ(exitCodeFor(ErrorKind::Spawn), 1);
    EXPECT_EQ(errorKindFromString("duplicate-name").value(), ErrorKind::DuplicateName);
    EXPECT_FALSE(errorKindFromString("nope").has_value());
}
