/**
 * Hive Process Supervisor
 *
 * Launches agent processes from a SandboxSpec, tracks them, and takes them
 * down through the escalation table. The live-process table is guarded by one
 * mutex; escalation waits run outside it.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "kernel/config.hpp"
#include "runtime/agent/escalation.hpp"
#include "runtime/agent/handle.hpp"
#include "runtime/logs/log_tailer.hpp"
#include "runtime/sandbox/factory.hpp"

namespace hive::runtime {

// Called by monitor_once() for every handle that exited on its own, and for
// handles that survived escalation and exited later
using ExitCallback = std::function<void(std::shared_ptr<const ProcessHandle> handle,
                                        const std::string& stderr_tail)>;

using TargetFactory = std::function<std::unique_ptr<TerminationTarget>(const ProcessHandle&)>;

class ProcessSupervisor {
public:
    ProcessSupervisor(const kernel::CoordinatorConfig& config, logs::LogTailer& tailer);
    ~ProcessSupervisor();

    // Non-copyable
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Launch in a new process group. Throws ProcessLaunchError.
    std::shared_ptr<const ProcessHandle> start(const std::string& name, const SandboxSpec& spec,
                                               const std::map<std::string, std::string>& env = {});

    // Sentinel, then SIGTERM, then SIGKILL of the group and descendants.
    // True once the process is gone.
    bool shutdown(const ProcessHandle& handle, std::chrono::milliseconds timeout);

    // Same as shutdown() without the cooperative step
    bool terminate(const ProcessHandle& handle, std::chrono::milliseconds timeout);

    bool is_alive(const ProcessHandle& handle) const { return handle.alive(); }

    // Reap exited processes; returns how many crashed since the last call.
    // Survivors of a failed stop are reaped here too, but are not crashes.
    size_t monitor_once();

    void set_exit_callback(ExitCallback callback);

    // Replaces the process-group target escalation runs against
    void set_target_factory(TargetFactory factory);

    std::vector<std::shared_ptr<const ProcessHandle>> tracked() const;
    std::shared_ptr<const ProcessHandle> find(const std::string& name) const;

private:
    const kernel::CoordinatorConfig& config_;
    logs::LogTailer& tailer_;

    mutable std::mutex mutex_;
    std::unordered_map<uint32_t, std::shared_ptr<ProcessHandle>> handles_;
    ExitCallback exit_callback_;
    TargetFactory target_factory_;
    std::unordered_set<uint32_t> survivors_;   // stop() gave up, still tracked

    std::atomic<uint32_t> next_id_{1};

    std::shared_ptr<ProcessHandle> lookup(const ProcessHandle& handle) const;
    bool stop(const ProcessHandle& handle, ProcessState stopping, const EscalationPolicy& policy);
    void untrack(uint32_t id);
    std::unique_ptr<TerminationTarget> make_target(const ProcessHandle& handle) const;
    bool claim_survivor(uint32_t id);
    void reap_survivor(const std::shared_ptr<ProcessHandle>& handle);
    void notify_exit(const std::shared_ptr<ProcessHandle>& handle, const std::string& stderr_tail);
};

} // namespace hive::runtime
