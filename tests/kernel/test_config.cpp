/// @file test_config.cpp
/// @brief Tests for configuration loading

#include <catch2/catch.hpp>

#include "kernel/config.hpp"
#include "kernel/errors.hpp"
#include "test_helpers.hpp"

#include <cstdlib>

using namespace hive;
using namespace hive::kernel;

TEST_CASE("Config defaults", "[kernel][config]") {
    CoordinatorConfig config;
    REQUIRE(config.enable_sandboxing);
    REQUIRE(config.agent_types.count("general") == 1);
    REQUIRE(config.agent_types.at("general").interpreter == "python3");
    REQUIRE(config.escalation.cooperative_timeout_ms == 5000);
    REQUIRE(config.brain.command.empty());
    REQUIRE(config.brain.endpoint.empty());
    REQUIRE(config.initial_agents.empty());
}

TEST_CASE("load_config_file", "[kernel][config]") {
    test::TempDir tmp;
    const std::string path = tmp / "hive.json";

    SECTION("Full file") {
        test::write_file(path, R"({
            "root": "/srv/hive",
            "sandboxing": false,
            "agent_types": {
                "general": {"interpreter": "/usr/bin/python3", "args": ["-m", "code"]},
                "io_gateway": {"interpreter": "node", "args": ["code/main.js"], "code_template": "/opt/io"}
            },
            "route_interval_ms": 250,
            "escalation": {"term_grace_ms": 100},
            "agent_logs": {"max_bytes": 4096, "max_files": 2},
            "brain": {"command": ["brain-helper", "--stdio"], "timeout_seconds": 5},
            "agents": [{"name": "Alice"}, {"name": "Ian-io", "type": "io_gateway", "config": {"port": 8080}}]
        })");

        auto config = load_config_file(path);
        REQUIRE(config.root_path == "/srv/hive");
        REQUIRE_FALSE(config.enable_sandboxing);
        REQUIRE(config.agent_types.size() == 2);
        REQUIRE(config.agent_types.at("io_gateway").code_template == "/opt/io");
        REQUIRE(config.route_interval_ms == 250);
        REQUIRE(config.monitor_interval_ms == 1000);
        REQUIRE(config.escalation.term_grace_ms == 100);
        REQUIRE(config.escalation.kill_grace_ms == 2000);
        REQUIRE(config.agent_log_max_bytes == 4096);
        REQUIRE(config.brain.command == std::vector<std::string>{"brain-helper", "--stdio"});
        REQUIRE(config.brain.timeout_seconds == 5);
        REQUIRE(config.initial_agents.size() == 2);
        REQUIRE(config.initial_agents[0].type == "general");
        REQUIRE(config.initial_agents[1].config["port"] == 8080);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_config_file(tmp / "absent.json"), ConfigurationError);
    }

    SECTION("Malformed JSON") {
        test::write_file(path, "{ \"root\": ");
        REQUIRE_THROWS_AS(load_config_file(path), ConfigurationError);
    }

    SECTION("Wrong value type") {
        test::write_file(path, R"({"route_interval_ms": "fast"})");
        REQUIRE_THROWS_AS(load_config_file(path), ConfigurationError);
    }

    SECTION("Initial agent of an unknown type") {
        test::write_file(path, R"({"agents": [{"name": "Zed", "type": "wizard"}]})");
        REQUIRE_THROWS_AS(load_config_file(path), ConfigurationError);
    }

    SECTION("Empty agent type table") {
        test::write_file(path, R"({"agent_types": {}})");
        REQUIRE_THROWS_AS(load_config_file(path), ConfigurationError);
    }
}

TEST_CASE("Environment overrides", "[kernel][config]") {
    CoordinatorConfig config;
    setenv("HIVE_ROOT", "/tmp/elsewhere", 1);
    setenv("HIVE_SANDBOX", "0", 1);
    setenv("HIVE_LOG_LEVEL", "debug", 1);

    apply_env_overrides(config);
    REQUIRE(config.root_path == "/tmp/elsewhere");
    REQUIRE_FALSE(config.enable_sandboxing);
    REQUIRE(config.log_level == "debug");

    unsetenv("HIVE_ROOT");
    unsetenv("HIVE_SANDBOX");
    unsetenv("HIVE_LOG_LEVEL");
}
