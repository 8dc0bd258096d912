/**
 * Hive Sandbox Factory
 *
 * Builds the per-agent execution environment: the agent's directory tree
 * and a bubblewrap isolation spec (all namespaces unshared including
 * network, code and tools read-only, private home and the shared grid
 * read-write, environment cleared then allow-listed).
 */
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/paths.hpp"
#include "kernel/config.hpp"

namespace hive::runtime {

// Mount points as seen from inside the sandbox
inline constexpr const char* HOME_MOUNT = "/home";
inline constexpr const char* CODE_MOUNT = "/home/code";
inline constexpr const char* GRID_MOUNT = "/grid";
inline constexpr const char* TOOLS_MOUNT = "/grid/tools";

// Environment key that also serves as the process signature
inline constexpr const char* AGENT_NAME_ENV = "HIVE_AGENT_NAME";

struct BindMount {
    std::string source;
    std::string target;
    bool read_only = true;
};

struct SandboxSpec {
    std::string name;
    std::string type;
    bool isolated = true;                   // false = run directly on the host

    std::string bwrap_path;
    std::string interpreter;                // resolved host path
    std::vector<std::string> args;

    std::vector<std::string> system_binds;  // read-only, skipped if absent
    std::vector<BindMount> binds;
    std::map<std::string, std::string> environment;
    std::string working_dir;                // as the process sees it

    std::string host_dir;                   // agent's private home on the host
    std::string control_dir;
    std::string sentinel_path;

    // Full argv to exec; `extra_env` is merged over the allow-listed environment
    std::vector<std::string> build_argv(const std::map<std::string, std::string>& extra_env = {}) const;

    // Environment handed to execve. Empty when isolated (bubblewrap sets it).
    std::vector<std::string> build_envp(const std::map<std::string, std::string>& extra_env = {}) const;
};

class SandboxFactory {
public:
    SandboxFactory(core::paths::Layout layout, const kernel::CoordinatorConfig& config);

    // Non-copyable
    SandboxFactory(const SandboxFactory&) = delete;
    SandboxFactory& operator=(const SandboxFactory&) = delete;

    // Create the agent tree if absent, refresh its code, compute the spec.
    // Throws ConfigurationError for bad names, unknown types or missing binaries.
    SandboxSpec provision(const std::string& name, const std::string& type);

    // Forget a provisioning; remove_tree also deletes the agent directory
    bool release(const std::string& name, bool remove_tree);

    bool exists(const std::string& name) const;
    std::optional<SandboxSpec> get(const std::string& name) const;
    std::vector<std::string> list() const;

    static bool is_valid_agent_name(const std::string& name);

    const core::paths::Layout& layout() const { return layout_; }

private:
    core::paths::Layout layout_;
    const kernel::CoordinatorConfig& config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SandboxSpec> sandboxes_;

    void create_tree(const std::string& name);
    void refresh_code(const std::string& name, const std::string& type,
                      const kernel::AgentTypeProfile& profile);
    std::map<std::string, std::string> build_environment(const std::string& name,
                                                         const std::string& type,
                                                         bool isolated) const;
};

} // namespace hive::runtime
