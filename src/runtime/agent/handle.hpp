#pragma once
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include "runtime/agent/types.hpp"

namespace hive::runtime {

class ProcessSupervisor;

// A running (or finished) agent process as seen by the supervisor.
// Only ProcessSupervisor mutates it; everyone else holds it const.
class ProcessHandle {
public:
    ProcessHandle(uint32_t id, AgentIdentity identity, pid_t pid,
                  std::string sentinel_path, std::string signature);

    // Non-copyable
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    uint32_t id() const { return id_; }
    const std::string& name() const { return identity_.name; }
    const AgentIdentity& identity() const { return identity_; }
    pid_t pid() const { return pid_; }
    pid_t pgid() const { return pid_; }  // child leads its own group
    const std::string& sentinel_path() const { return sentinel_path_; }
    const std::string& signature() const { return signature_; }
    std::chrono::steady_clock::time_point started_at() const { return started_at_; }
    double uptime_seconds() const;

    ProcessState state() const { return state_.load(); }
    std::optional<int> exit_code() const;

    // Reap without blocking. True once the process has exited.
    bool poll_exit() const;

    // Liveness of the primary process (reaps as a side effect)
    bool alive() const { return !poll_exit(); }

private:
    friend class ProcessSupervisor;

    bool transition(ProcessState from, ProcessState to);
    void force_state(ProcessState to);

    uint32_t id_;
    AgentIdentity identity_;
    pid_t pid_;
    std::string sentinel_path_;
    std::string signature_;
    std::chrono::steady_clock::time_point started_at_;

    std::atomic<ProcessState> state_{ProcessState::STARTING};

    // waitpid must run exactly once per child
    mutable std::mutex reap_mutex_;
    mutable bool reaped_ = false;
    mutable int exit_code_ = -1;
};

} // namespace hive::runtime
