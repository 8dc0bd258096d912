#include "core/paths.hpp"
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace hive::core::paths {

static bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return fs::absolute(name).string();
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream ss(search);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

Layout::Layout(std::string root)
    : root_(std::move(root)) {}

std::string Layout::agents_dir() const { return root_ + "/agents"; }
std::string Layout::agent_dir(const std::string& name) const { return agents_dir() + "/" + name; }
std::string Layout::inbox(const std::string& name) const { return agent_dir(name) + "/inbox"; }
std::string Layout::processed(const std::string& name) const { return inbox(name) + "/processed"; }
std::string Layout::outbox(const std::string& name) const { return agent_dir(name) + "/outbox"; }
std::string Layout::sent(const std::string& name) const { return outbox(name) + "/sent"; }
std::string Layout::drafts(const std::string& name) const { return agent_dir(name) + "/drafts"; }
std::string Layout::memory(const std::string& name) const { return agent_dir(name) + "/memory"; }
std::string Layout::code(const std::string& name) const { return agent_dir(name) + "/code"; }
std::string Layout::control_dir(const std::string& name) const { return agent_dir(name) + "/.internal"; }
std::string Layout::sentinel(const std::string& name) const { return control_dir(name) + "/shutdown"; }
std::string Layout::brain_dir(const std::string& name) const { return control_dir(name) + "/brain"; }

std::string Layout::grid_dir() const { return root_ + "/grid"; }
std::string Layout::tools_dir() const { return grid_dir() + "/tools"; }
std::string Layout::templates_dir() const { return root_ + "/templates"; }
std::string Layout::template_dir(const std::string& type) const { return templates_dir() + "/" + type; }
std::string Layout::states_dir() const { return root_ + "/agent_states"; }
std::string Layout::agent_logs_dir(const std::string& name) const { return root_ + "/logs/agents/" + name; }

} // namespace hive::core::paths
