#pragma once
#include <optional>
#include <string>

namespace hive::core::paths {

// Resolve an executable the way execvp would: names containing '/' are
// checked directly, bare names are searched along $PATH.
std::optional<std::string> find_executable(const std::string& name);

// On-disk layout of a hive root directory
class Layout {
public:
    explicit Layout(std::string root);

    const std::string& root() const { return root_; }

    std::string agents_dir() const;
    std::string agent_dir(const std::string& name) const;
    std::string inbox(const std::string& name) const;
    std::string processed(const std::string& name) const;
    std::string outbox(const std::string& name) const;
    std::string sent(const std::string& name) const;
    std::string drafts(const std::string& name) const;
    std::string memory(const std::string& name) const;
    std::string code(const std::string& name) const;
    std::string control_dir(const std::string& name) const;
    std::string sentinel(const std::string& name) const;
    std::string brain_dir(const std::string& name) const;

    std::string grid_dir() const;
    std::string tools_dir() const;
    std::string templates_dir() const;
    std::string template_dir(const std::string& type) const;
    std::string states_dir() const;
    std::string agent_logs_dir(const std::string& name) const;

private:
    std::string root_;
};

} // namespace hive::core::paths
