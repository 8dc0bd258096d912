#include "runtime/agent/process_scan.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;

namespace hive::runtime::proc {

namespace {

std::vector<pid_t> list_pids() {
    std::vector<pid_t> pids;
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        spdlog::warn("Cannot scan /proc: {}", ec.message());
        return pids;
    }
    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            continue;
        }
        pids.push_back(static_cast<pid_t>(std::stol(name)));
    }
    return pids;
}

// NUL-separated entries of /proc/<pid>/cmdline or environ
std::vector<std::string> read_nul_list(pid_t pid, const char* file) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/" + file, std::ios::binary);
    if (!in) {
        return {};
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::vector<std::string> entries;
    std::string current;
    for (char c : data) {
        if (c == '\0') {
            entries.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        entries.push_back(std::move(current));
    }
    return entries;
}

} // namespace

pid_t parent_of(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in) {
        return -1;
    }
    std::string line;
    std::getline(in, line);

    // comm may contain spaces and parentheses; fields resume after the last ')'
    auto close = line.rfind(')');
    if (close == std::string::npos) {
        return -1;
    }
    std::istringstream rest(line.substr(close + 1));
    std::string state;
    pid_t ppid = -1;
    rest >> state >> ppid;
    return rest ? ppid : -1;
}

std::vector<pid_t> descendants(pid_t root) {
    std::unordered_map<pid_t, std::vector<pid_t>> children;
    for (pid_t pid : list_pids()) {
        pid_t ppid = parent_of(pid);
        if (ppid > 0) {
            children[ppid].push_back(pid);
        }
    }

    std::vector<pid_t> result;
    std::vector<pid_t> frontier = {root};
    while (!frontier.empty()) {
        pid_t current = frontier.back();
        frontier.pop_back();
        auto it = children.find(current);
        if (it == children.end()) {
            continue;
        }
        for (pid_t child : it->second) {
            if (std::find(result.begin(), result.end(), child) == result.end()) {
                result.push_back(child);
                frontier.push_back(child);
            }
        }
    }
    return result;
}

std::vector<pid_t> find_by_signature(const std::string& key, const std::string& value) {
    std::vector<pid_t> matches;
    const pid_t self = getpid();
    const std::string env_entry = key + "=" + value;

    for (pid_t pid : list_pids()) {
        if (pid == self) {
            continue;
        }

        bool matched = false;
        for (const auto& entry : read_nul_list(pid, "environ")) {
            if (entry == env_entry) {
                matched = true;
                break;
            }
        }

        if (!matched) {
            auto argv = read_nul_list(pid, "cmdline");
            for (size_t i = 0; i + 1 < argv.size(); i++) {
                if (argv[i] == key && argv[i + 1] == value) {
                    matched = true;
                    break;
                }
            }
        }

        if (matched) {
            matches.push_back(pid);
        }
    }
    return matches;
}

} // namespace hive::runtime::proc
