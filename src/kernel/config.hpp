#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hive::kernel {

// How agents of one type are launched
struct AgentTypeProfile {
    std::string interpreter = "python3";      // resolved on the host, mounted read-only
    std::vector<std::string> args = {"-m", "code"};
    std::string code_template;                // empty = <root>/templates/<type>
};

// Timings for the termination escalation
struct EscalationConfig {
    uint32_t cooperative_timeout_ms = 5000;   // wait after writing the sentinel
    uint32_t term_grace_ms = 2000;            // wait after SIGTERM
    uint32_t kill_grace_ms = 2000;            // wait after SIGKILL of the group
};

// Backend for the brain bridge. `command` wins over `endpoint`;
// neither set = requests are answered with an error.
struct BrainConfig {
    std::vector<std::string> command;         // long-lived subprocess, one JSON line per request
    std::string endpoint;                     // http(s)://host[:port]/path, payload POSTed as-is
    std::string api_key_env = "HIVE_BRAIN_API_KEY";  // sent as a Bearer token when set
    int timeout_seconds = 60;
    uint32_t poll_interval_ms = 200;
};

// Agent created at startup unless a record with its name already exists
struct InitialAgent {
    std::string name;
    std::string type = "general";
    nlohmann::json config = nlohmann::json::object();
};

// Coordinator configuration
struct CoordinatorConfig {
    std::string root_path = "./subspace";
    bool enable_sandboxing = true;
    std::string bwrap_path = "bwrap";
    std::vector<std::string> system_ro_binds = {"/usr", "/lib", "/lib64", "/bin"};
    std::vector<std::string> env_allowlist = {"LANG", "LC_ALL", "TZ"};
    std::map<std::string, AgentTypeProfile> agent_types = {{"general", AgentTypeProfile{}}};

    uint32_t route_interval_ms = 500;
    uint32_t monitor_interval_ms = 1000;
    uint32_t shutdown_grace_ms = 5000;        // time agents get to persist state
    EscalationConfig escalation;

    uint64_t agent_log_max_bytes = 10 * 1024 * 1024;
    uint32_t agent_log_max_files = 5;
    std::string log_level = "info";

    BrainConfig brain;
    std::vector<InitialAgent> initial_agents;
};

// Load a JSON config file. Missing keys keep their defaults.
// Throws ConfigurationError on unreadable or malformed files.
CoordinatorConfig load_config_file(const std::string& path);

// HIVE_ROOT, HIVE_LOG_LEVEL and HIVE_SANDBOX override file values
void apply_env_overrides(CoordinatorConfig& config);

} // namespace hive::kernel
