#include "kernel/config.hpp"
#include "kernel/errors.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace hive::kernel {

static AgentTypeProfile parse_profile(const json& j) {
    AgentTypeProfile profile;
    profile.interpreter = j.value("interpreter", profile.interpreter);
    profile.args = j.value("args", profile.args);
    profile.code_template = j.value("code_template", "");
    return profile;
}

CoordinatorConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open config file: " + path);
    }

    CoordinatorConfig config;
    try {
        json j = json::parse(in);

        config.root_path = j.value("root", config.root_path);
        config.enable_sandboxing = j.value("sandboxing", config.enable_sandboxing);
        config.bwrap_path = j.value("bwrap", config.bwrap_path);
        config.system_ro_binds = j.value("system_ro_binds", config.system_ro_binds);
        config.env_allowlist = j.value("env_allowlist", config.env_allowlist);

        if (j.contains("agent_types")) {
            config.agent_types.clear();
            for (auto& [type, profile] : j["agent_types"].items()) {
                config.agent_types[type] = parse_profile(profile);
            }
        }

        config.route_interval_ms = j.value("route_interval_ms", config.route_interval_ms);
        config.monitor_interval_ms = j.value("monitor_interval_ms", config.monitor_interval_ms);
        config.shutdown_grace_ms = j.value("shutdown_grace_ms", config.shutdown_grace_ms);

        if (j.contains("escalation")) {
            auto& esc = j["escalation"];
            config.escalation.cooperative_timeout_ms =
                esc.value("cooperative_timeout_ms", config.escalation.cooperative_timeout_ms);
            config.escalation.term_grace_ms = esc.value("term_grace_ms", config.escalation.term_grace_ms);
            config.escalation.kill_grace_ms = esc.value("kill_grace_ms", config.escalation.kill_grace_ms);
        }

        if (j.contains("agent_logs")) {
            auto& logs = j["agent_logs"];
            config.agent_log_max_bytes = logs.value("max_bytes", config.agent_log_max_bytes);
            config.agent_log_max_files = logs.value("max_files", config.agent_log_max_files);
        }
        config.log_level = j.value("log_level", config.log_level);

        if (j.contains("brain")) {
            auto& brain = j["brain"];
            config.brain.command = brain.value("command", config.brain.command);
            config.brain.endpoint = brain.value("endpoint", config.brain.endpoint);
            config.brain.api_key_env = brain.value("api_key_env", config.brain.api_key_env);
            config.brain.timeout_seconds = brain.value("timeout_seconds", config.brain.timeout_seconds);
            config.brain.poll_interval_ms = brain.value("poll_interval_ms", config.brain.poll_interval_ms);
        }

        if (j.contains("agents")) {
            for (const auto& entry : j["agents"]) {
                InitialAgent agent;
                agent.name = entry.value("name", "");
                agent.type = entry.value("type", agent.type);
                agent.config = entry.value("config", json::object());
                config.initial_agents.push_back(std::move(agent));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("invalid config file " + path + ": " + e.what());
    }

    if (config.agent_types.empty()) {
        throw ConfigurationError("config file " + path + " defines no agent types");
    }
    for (const auto& agent : config.initial_agents) {
        if (!config.agent_types.count(agent.type)) {
            throw ConfigurationError("agent '" + agent.name + "' has unknown type '" + agent.type + "'");
        }
    }

    spdlog::debug("Loaded config from {}", path);
    return config;
}

void apply_env_overrides(CoordinatorConfig& config) {
    if (const char* root = std::getenv("HIVE_ROOT")) {
        config.root_path = root;
    }
    if (const char* level = std::getenv("HIVE_LOG_LEVEL")) {
        config.log_level = level;
    }
    if (const char* sandbox = std::getenv("HIVE_SANDBOX")) {
        std::string value = sandbox;
        config.enable_sandboxing = !(value == "0" || value == "false" || value == "off");
    }
}

} // namespace hive::kernel
