#include "runtime/sandbox/factory.hpp"
#include "kernel/errors.hpp"
#include "ipc/message.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace hive::runtime {

// ============================================================================
// SandboxSpec
// ============================================================================

static bool is_under(const std::string& path, const std::string& dir) {
    if (path.size() < dir.size() || path.compare(0, dir.size(), dir) != 0) {
        return false;
    }
    return path.size() == dir.size() || path[dir.size()] == '/';
}

std::vector<std::string> SandboxSpec::build_argv(
    const std::map<std::string, std::string>& extra_env) const {
    std::vector<std::string> argv;

    if (!isolated) {
        argv.push_back(interpreter);
        argv.insert(argv.end(), args.begin(), args.end());
        return argv;
    }

    argv = {
        bwrap_path,
        "--die-with-parent",
        "--unshare-all",
        "--new-session",
        "--clearenv",
    };

    bool interpreter_visible = false;
    for (const auto& dir : system_binds) {
        argv.insert(argv.end(), {"--ro-bind-try", dir, dir});
        if (is_under(interpreter, dir)) {
            interpreter_visible = true;
        }
    }
    if (!interpreter_visible) {
        argv.insert(argv.end(), {"--ro-bind", interpreter, interpreter});
    }

    argv.insert(argv.end(), {"--proc", "/proc", "--dev", "/dev", "--tmpfs", "/tmp"});

    for (const auto& bind : binds) {
        argv.insert(argv.end(), {bind.read_only ? "--ro-bind" : "--bind", bind.source, bind.target});
    }

    argv.insert(argv.end(), {"--chdir", working_dir});

    auto env = environment;
    for (const auto& [key, value] : extra_env) {
        env[key] = value;
    }
    for (const auto& [key, value] : env) {
        argv.insert(argv.end(), {"--setenv", key, value});
    }

    argv.push_back("--");
    argv.push_back(interpreter);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::vector<std::string> SandboxSpec::build_envp(
    const std::map<std::string, std::string>& extra_env) const {
    std::vector<std::string> envp;
    if (isolated) {
        return envp;
    }

    auto env = environment;
    for (const auto& [key, value] : extra_env) {
        env[key] = value;
    }
    for (const auto& [key, value] : env) {
        envp.push_back(key + "=" + value);
    }
    return envp;
}

// ============================================================================
// SandboxFactory
// ============================================================================

SandboxFactory::SandboxFactory(core::paths::Layout layout, const kernel::CoordinatorConfig& config)
    : layout_(std::move(layout))
    , config_(config) {}

bool SandboxFactory::is_valid_agent_name(const std::string& name) {
    if (name.empty() || name.size() > 64 || name.front() == '.' ||
        name == ipc::BROADCAST_ADDRESS || name == ipc::SYSTEM_SENDER) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

SandboxSpec SandboxFactory::provision(const std::string& name, const std::string& type) {
    if (!is_valid_agent_name(name)) {
        throw ConfigurationError("invalid agent name '" + name + "'");
    }

    auto profile_it = config_.agent_types.find(type);
    if (profile_it == config_.agent_types.end()) {
        throw ConfigurationError("unknown agent type '" + type + "'");
    }
    const auto& profile = profile_it->second;

    auto interpreter = core::paths::find_executable(profile.interpreter);
    if (!interpreter) {
        throw ConfigurationError("interpreter '" + profile.interpreter +
                                 "' for agent type '" + type + "' not found on host");
    }

    std::string bwrap;
    if (config_.enable_sandboxing) {
        auto found = core::paths::find_executable(config_.bwrap_path);
        if (!found) {
            throw ConfigurationError("bubblewrap ('" + config_.bwrap_path + "') not found on host");
        }
        bwrap = *found;
    }

    bool existing = exists(name);
    try {
        create_tree(name);
        refresh_code(name, type, profile);
    } catch (const fs::filesystem_error& e) {
        throw ConfigurationError("cannot provision agent '" + name + "': " + e.what());
    }

    SandboxSpec spec;
    spec.name = name;
    spec.type = type;
    spec.isolated = config_.enable_sandboxing;
    spec.bwrap_path = bwrap;
    spec.interpreter = *interpreter;
    spec.args = profile.args;
    spec.host_dir = layout_.agent_dir(name);
    spec.control_dir = layout_.control_dir(name);
    spec.sentinel_path = layout_.sentinel(name);
    spec.environment = build_environment(name, type, spec.isolated);

    if (spec.isolated) {
        for (const auto& dir : config_.system_ro_binds) {
            std::error_code ec;
            if (fs::exists(dir, ec)) {
                spec.system_binds.push_back(dir);
            }
        }
        spec.binds = {
            {layout_.agent_dir(name), HOME_MOUNT, false},
            {layout_.code(name), CODE_MOUNT, true},
            {layout_.grid_dir(), GRID_MOUNT, false},
            {layout_.tools_dir(), TOOLS_MOUNT, true},
        };
        spec.working_dir = HOME_MOUNT;
    } else {
        spec.working_dir = spec.host_dir;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sandboxes_[name] = spec;
    }

    spdlog::info("{} sandbox for agent {} (type={}, isolated={})",
        existing ? "Refreshed" : "Created", name, type, spec.isolated);
    return spec;
}

void SandboxFactory::create_tree(const std::string& name) {
    for (const auto& dir : {
             layout_.inbox(name), layout_.processed(name),
             layout_.outbox(name), layout_.sent(name),
             layout_.drafts(name), layout_.memory(name),
             layout_.code(name), layout_.control_dir(name),
             layout_.tools_dir(),
             layout_.grid_dir() + "/community",
             layout_.grid_dir() + "/library",
         }) {
        fs::create_directories(dir);
    }
}

void SandboxFactory::refresh_code(const std::string& name, const std::string& type,
                                  const kernel::AgentTypeProfile& profile) {
    fs::path code_dir = layout_.code(name);
    fs::path source = profile.code_template.empty()
        ? fs::path(layout_.template_dir(type))
        : fs::path(profile.code_template);

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        spdlog::debug("No code template for type {} at {}", type, source.string());
        return;
    }

    // Only the code subtree is replaced
    for (const auto& entry : fs::directory_iterator(code_dir)) {
        fs::remove_all(entry.path());
    }
    fs::copy(source, code_dir, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    spdlog::debug("Refreshed code for agent {} from {}", name, source.string());
}

std::map<std::string, std::string> SandboxFactory::build_environment(
    const std::string& name, const std::string& type, bool isolated) const {
    std::map<std::string, std::string> env;

    for (const auto& key : config_.env_allowlist) {
        if (const char* value = std::getenv(key.c_str())) {
            env[key] = value;
        }
    }

    env[AGENT_NAME_ENV] = name;
    env["HIVE_AGENT_TYPE"] = type;
    if (isolated) {
        env["HOME"] = HOME_MOUNT;
        env["HIVE_CONTROL_DIR"] = std::string(HOME_MOUNT) + "/.internal";
        env["PATH"] = std::string(TOOLS_MOUNT) + ":/usr/bin:/bin";
    } else {
        env["HOME"] = layout_.agent_dir(name);
        env["HIVE_CONTROL_DIR"] = layout_.control_dir(name);
        env["PATH"] = layout_.tools_dir() + ":/usr/local/bin:/usr/bin:/bin";
    }
    return env;
}

bool SandboxFactory::release(const std::string& name, bool remove_tree) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sandboxes_.erase(name);
    }

    if (!remove_tree) {
        return true;
    }

    std::error_code ec;
    fs::remove_all(layout_.agent_dir(name), ec);
    if (ec) {
        spdlog::error("Failed to remove agent directory for {}: {}", name, ec.message());
        return false;
    }
    spdlog::info("Removed agent directory for {}", name);
    return true;
}

bool SandboxFactory::exists(const std::string& name) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sandboxes_.count(name)) {
            return true;
        }
    }
    std::error_code ec;
    return !name.empty() && fs::is_directory(layout_.agent_dir(name), ec);
}

std::optional<SandboxSpec> SandboxFactory::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(name);
    if (it == sandboxes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> SandboxFactory::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, spec] : sandboxes_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace hive::runtime
