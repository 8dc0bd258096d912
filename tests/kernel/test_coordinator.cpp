/// @file test_coordinator.cpp
/// @brief End-to-end tests for the coordinator with shell agents on the host

#include <catch2/catch.hpp>

#include "ipc/mailbox_router.hpp"
#include "ipc/message.hpp"
#include "kernel/coordinator.hpp"
#include "kernel/errors.hpp"
#include "runtime/agent/handle.hpp"
#include "runtime/sandbox/factory.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using namespace hive;
using namespace hive::kernel;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

CoordinatorConfig coordinator_config(const test::TempDir& tmp) {
    auto config = test::shell_config(tmp / "root", test::COOPERATIVE_AGENT);

    AgentTypeProfile crasher;
    crasher.interpreter = "/bin/sh";
    crasher.args = {"-c", "echo giving up >&2; exit 1"};
    config.agent_types["crasher"] = crasher;

    // Executable but not a valid program: execve fails with ENOEXEC
    const std::string bogus = tmp / "bogus-interpreter";
    test::write_file(bogus, "not a program\n");
    fs::permissions(bogus, fs::perms::owner_all);
    AgentTypeProfile broken;
    broken.interpreter = bogus;
    broken.args = {};
    config.agent_types["broken"] = broken;
    return config;
}

std::vector<std::string> regular_files(const std::string& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path().filename().string());
        }
    }
    return files;
}

} // namespace

TEST_CASE("Coordinator agent creation", "[kernel][coordinator]") {
    test::TempDir tmp;
    auto config = coordinator_config(tmp);
    core::paths::Layout layout(config.root_path);
    Coordinator coordinator(config);
    REQUIRE(coordinator.init());

    SECTION("Generated name, registered and running") {
        auto name = coordinator.create_agent(std::nullopt, "general");
        REQUIRE(name == "Alice");

        auto handle = coordinator.handle_for(name);
        REQUIRE(handle);
        REQUIRE(handle->alive());

        auto record = coordinator.store().get(name);
        REQUIRE(record);
        REQUIRE(record->lifecycle == Lifecycle::ACTIVE);
        REQUIRE(record->activation_count == 1);

        auto launch = json::parse(*util::read_file(layout.control_dir(name) + "/config.json"));
        REQUIRE(launch["name"] == "Alice");
        REQUIRE(launch["type"] == "general");

        REQUIRE(coordinator.create_agent(std::nullopt, "general") == "Bob");

        auto rows = coordinator.list_agents();
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0].name == "Alice");
        REQUIRE(rows[0].running);
        REQUIRE(rows[0].pid == handle->pid());
        REQUIRE(to_json(rows[0])["lifecycle"] == "active");
    }

    SECTION("Duplicate names are rejected") {
        coordinator.create_agent(std::string("Alice"), "general");
        REQUIRE_THROWS_AS(coordinator.create_agent(std::string("Alice"), "general"), ConfigurationError);
        REQUIRE(coordinator.list_agents().size() == 1);
    }

    SECTION("Unknown type leaves nothing behind") {
        REQUIRE_THROWS_AS(coordinator.create_agent(std::string("Zed"), "wizard"), ConfigurationError);
        REQUIRE_FALSE(coordinator.store().get("Zed"));
        REQUIRE_FALSE(fs::exists(layout.agent_dir("Zed")));
    }

    SECTION("Launch failure rolls back registration") {
        REQUIRE_THROWS_AS(coordinator.create_agent(std::string("Bad"), "broken"), ProcessLaunchError);
        REQUIRE_FALSE(coordinator.store().get("Bad"));
        REQUIRE_FALSE(coordinator.handle_for("Bad"));
        REQUIRE_FALSE(fs::exists(layout.agent_dir("Bad")));
    }

    SECTION("Crashed agents are dropped by the monitor") {
        auto name = coordinator.create_agent(std::string("Flaky"), "crasher");
        REQUIRE(test::wait_until([&]() { return !coordinator.handle_for(name); }));

        // The record stays; it is still an agent, just not running
        auto rows = coordinator.list_agents();
        REQUIRE(rows.size() == 1);
        REQUIRE_FALSE(rows[0].running);
    }

    coordinator.shutdown();
}

TEST_CASE("Coordinator messaging", "[kernel][coordinator]") {
    test::TempDir tmp;
    auto config = coordinator_config(tmp);
    core::paths::Layout layout(config.root_path);
    Coordinator coordinator(config);
    REQUIRE(coordinator.init());
    coordinator.create_agent(std::string("Alice"), "general");
    coordinator.create_agent(std::string("Bob"), "general");

    SECTION("Background routing delivers outbox messages") {
        test::write_file(layout.outbox("Alice") + "/hello.msg",
            R"({"id":"hello","from":"Alice","to":"Bob","type":"text","content":"hi Bob"})");

        REQUIRE(test::wait_until([&]() { return fs::exists(layout.inbox("Bob") + "/hello.msg"); }));
        REQUIRE(test::wait_until([&]() { return fs::exists(layout.sent("Alice") + "/hello.msg"); }));
    }

    SECTION("Direct message from the orchestrator") {
        REQUIRE(coordinator.send_message("Bob", "status?"));
        auto files = regular_files(layout.inbox("Bob"));
        REQUIRE(files.size() == 1);
        auto msg = ipc::parse_message(*util::read_file(layout.inbox("Bob") + "/" + files[0]));
        REQUIRE(msg.ok());
        REQUIRE(msg.message->from == ipc::SYSTEM_SENDER);
        REQUIRE(std::get<ipc::TextPayload>(msg.message->payload).content == "status?");

        REQUIRE_FALSE(coordinator.send_message("Nobody", "hello?"));
    }

    SECTION("Command to one agent") {
        REQUIRE(coordinator.send_command("Alice", "reflect", json{{"depth", 1}}));
        REQUIRE(regular_files(layout.inbox("Bob")).empty());

        auto files = regular_files(layout.inbox("Alice"));
        REQUIRE(files.size() == 1);
        auto msg = ipc::parse_message(*util::read_file(layout.inbox("Alice") + "/" + files[0]));
        REQUIRE(msg.ok());
        REQUIRE(msg.message->to == "Alice");
        auto& command = std::get<ipc::CommandPayload>(msg.message->payload);
        REQUIRE(command.command == "reflect");
        REQUIRE(command.params["depth"] == 1);

        REQUIRE_FALSE(coordinator.send_command("Nobody", "reflect"));
    }

    SECTION("Broadcast command") {
        REQUIRE(coordinator.broadcast_command("reflect", json{{"depth", 2}}) == 2);
        REQUIRE(regular_files(layout.inbox("Alice")).size() == 1);
        REQUIRE(regular_files(layout.inbox("Bob")).size() == 1);
    }

    coordinator.shutdown();
}

TEST_CASE("Coordinator shutdown and restore", "[kernel][coordinator]") {
    test::TempDir tmp;
    auto config = coordinator_config(tmp);
    core::paths::Layout layout(config.root_path);

    pid_t first_pid = -1;
    {
        Coordinator coordinator(config);
        REQUIRE(coordinator.init());
        coordinator.create_agent(std::string("Alice"), "general", json{{"goal", "map the grid"}, {"depth", 3}});
        coordinator.create_agent(std::string("Bob"), "general", json{{"goal", "answer mail"}});
        test::write_file(layout.memory("Alice") + "/journal.txt", "day one");

        auto handle = coordinator.handle_for("Alice");
        first_pid = handle->pid();

        coordinator.shutdown();
        REQUIRE_FALSE(handle->alive());
        REQUIRE(handle->state() == runtime::ProcessState::STOPPED);
        REQUIRE_FALSE(coordinator.handle_for("Alice"));

        // Agents were told why before being stopped
        bool notified = false;
        for (const auto& file : regular_files(layout.inbox("Alice"))) {
            auto msg = ipc::parse_message(*util::read_file(layout.inbox("Alice") + "/" + file));
            notified = notified || (msg.ok() && msg.message->kind() == ipc::MessageKind::SHUTDOWN);
        }
        REQUIRE(notified);

        REQUIRE(coordinator.store().list(Lifecycle::SLEEPING).size() == 2);
        REQUIRE(coordinator.store().list(Lifecycle::ACTIVE).empty());

        // Second shutdown is harmless
        coordinator.shutdown();
    }

    // Restore must rebuild the launch config from the store, not reuse the old file
    fs::remove(layout.control_dir("Alice") + "/config.json");
    fs::remove(layout.control_dir("Bob") + "/config.json");

    Coordinator restarted(config);
    REQUIRE(restarted.init());
    REQUIRE(restarted.restore_sleeping() == 2);

    auto handle = restarted.handle_for("Alice");
    REQUIRE(handle);
    REQUIRE(handle->alive());
    REQUIRE(handle->pid() != first_pid);

    auto record = restarted.store().get("Alice");
    REQUIRE(record->lifecycle == Lifecycle::ACTIVE);
    REQUIRE(record->activation_count == 2);
    REQUIRE(util::read_file(layout.memory("Alice") + "/journal.txt") == std::string("day one"));
    REQUIRE(record->config == json({{"goal", "map the grid"}, {"depth", 3}}));

    auto alice_launch = json::parse(*util::read_file(layout.control_dir("Alice") + "/config.json"));
    REQUIRE(alice_launch["config"]["goal"] == "map the grid");
    REQUIRE(alice_launch["config"]["depth"] == 3);
    auto bob_launch = json::parse(*util::read_file(layout.control_dir("Bob") + "/config.json"));
    REQUIRE(bob_launch["config"]["goal"] == "answer mail");

    // Nothing left to restore
    REQUIRE(restarted.restore_sleeping() == 0);
    restarted.shutdown();
}

TEST_CASE("Coordinator terminate_agent", "[kernel][coordinator]") {
    test::TempDir tmp;
    auto config = coordinator_config(tmp);
    core::paths::Layout layout(config.root_path);
    Coordinator coordinator(config);
    REQUIRE(coordinator.init());

    auto name = coordinator.create_agent(std::string("Alice"), "general");
    auto handle = coordinator.handle_for(name);

    REQUIRE(coordinator.terminate_agent(name));
    REQUIRE_FALSE(handle->alive());
    REQUIRE_FALSE(coordinator.handle_for(name));
    REQUIRE_FALSE(coordinator.store().get(name));
    REQUIRE_FALSE(fs::exists(layout.agent_dir(name)));

    REQUIRE_FALSE(coordinator.terminate_agent("Nobody"));

    // The name is free again
    REQUIRE(coordinator.create_agent(std::string("Alice"), "general") == "Alice");
    coordinator.shutdown();
}
