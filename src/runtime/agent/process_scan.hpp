#pragma once
#include <sys/types.h>
#include <string>
#include <vector>

namespace hive::runtime::proc {

// All live descendants of `root` (children, grandchildren, ...), from /proc
std::vector<pid_t> descendants(pid_t root);

// Processes carrying an agent's signature: `key=value` in their environment,
// or `key value` as consecutive argv entries (bubblewrap --setenv).
// Never includes the calling process.
std::vector<pid_t> find_by_signature(const std::string& key, const std::string& value);

// Parent pid from /proc/<pid>/stat, -1 if unreadable
pid_t parent_of(pid_t pid);

} // namespace hive::runtime::proc
