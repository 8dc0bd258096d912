#include "runtime/agent/supervisor.hpp"
#include "runtime/agent/process_scan.hpp"
#include "kernel/errors.hpp"
#include "util/atomic_file.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace hive::runtime {

namespace {

constexpr auto EXIT_POLL_INTERVAL = std::chrono::milliseconds(20);

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; i++) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Escalation target backed by a real process group
class PosixTerminationTarget : public TerminationTarget {
public:
    explicit PosixTerminationTarget(const ProcessHandle& handle)
        : handle_(handle) {}

    bool request_cooperative_exit() override {
        std::error_code ec;
        fs::create_directories(fs::path(handle_.sentinel_path()).parent_path(), ec);
        return util::write_file_atomic(handle_.sentinel_path(), "SHUTDOWN");
    }

    bool send_signal(int signal, SignalScope scope) override {
        bool primary_alive = handle_.alive();
        bool delivered = false;

        if (scope == SignalScope::PROCESS) {
            return primary_alive && kill(handle_.pid(), signal) == 0;
        }

        // A dead leader's group can still have members
        if (killpg(handle_.pgid(), signal) == 0) {
            delivered = true;
        } else if (errno != ESRCH) {
            spdlog::warn("killpg({}, {}) failed: {}", handle_.pgid(), signal, strerror(errno));
        }

        if (scope == SignalScope::GROUP_AND_DESCENDANTS) {
            std::vector<pid_t> stragglers;
            if (primary_alive) {
                stragglers = proc::descendants(handle_.pid());
            }
            for (pid_t pid : proc::find_by_signature(AGENT_NAME_ENV, handle_.signature())) {
                stragglers.push_back(pid);
            }
            for (pid_t pid : stragglers) {
                if (kill(pid, signal) == 0) {
                    spdlog::debug("Signalled helper process {} of agent {}", pid, handle_.name());
                    delivered = true;
                }
            }
        }

        return delivered || primary_alive;
    }

    bool wait_for_exit(std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (handle_.poll_exit()) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
        }
    }

    bool alive() override {
        return handle_.alive();
    }

    std::string describe() const override {
        return "agent " + handle_.name() + " (pid=" + std::to_string(handle_.pid()) + ")";
    }

private:
    const ProcessHandle& handle_;
};

} // namespace

ProcessSupervisor::ProcessSupervisor(const kernel::CoordinatorConfig& config, logs::LogTailer& tailer)
    : config_(config)
    , tailer_(tailer) {}

ProcessSupervisor::~ProcessSupervisor() {
    std::unordered_map<uint32_t, std::shared_ptr<ProcessHandle>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(handles_);
    }

    for (auto& [id, handle] : remaining) {
        if (handle->alive()) {
            spdlog::warn("Killing agent {} (pid={}) still running at teardown", handle->name(), handle->pid());
            killpg(handle->pgid(), SIGKILL);
            PosixTerminationTarget(*handle).wait_for_exit(std::chrono::milliseconds(config_.escalation.kill_grace_ms));
        }
        handle->force_state(ProcessState::STOPPED);
        tailer_.unwatch(id);
    }
}

std::shared_ptr<const ProcessHandle> ProcessSupervisor::start(
    const std::string& name, const SandboxSpec& spec,
    const std::map<std::string, std::string>& env) {
    auto argv = spec.build_argv(env);
    auto envp = spec.build_envp(env);
    if (argv.empty() || argv[0].empty()) {
        throw ProcessLaunchError("empty command line for agent " + name);
    }

    // No allocation between fork and exec
    std::vector<char*> c_argv;
    for (auto& arg : argv) {
        c_argv.push_back(arg.data());
    }
    c_argv.push_back(nullptr);
    std::vector<char*> c_envp;
    for (auto& entry : envp) {
        c_envp.push_back(entry.data());
    }
    c_envp.push_back(nullptr);

    std::error_code ec;
    fs::create_directories(spec.control_dir, ec);
    fs::remove(spec.sentinel_path, ec);
    if (ec) {
        spdlog::warn("Could not remove stale sentinel for {}: {}", name, ec.message());
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(status_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        throw ProcessLaunchError("pipe failed for agent " + name + ": " + strerror(saved));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        throw ProcessLaunchError("fork failed for agent " + name + ": " + strerror(saved));
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        int err = 0;
        if (chdir(spec.host_dir.c_str()) < 0) {
            err = errno;
        } else {
            execve(c_argv[0], c_argv.data(), c_envp.data());
            err = errno;
        }
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process; also set here so the group exists before we signal it
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        waitpid(pid, nullptr, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        throw ProcessLaunchError("exec of " + argv[0] + " for agent " + name +
                                 " failed: " + strerror(child_errno));
    }

    AgentIdentity identity{name, spec.type, std::chrono::system_clock::now()};
    auto handle = std::make_shared<ProcessHandle>(
        next_id_++, std::move(identity), pid, spec.sentinel_path, name);
    handle->transition(ProcessState::STARTING, ProcessState::RUNNING);

    tailer_.watch(handle->id(), name, out_pipe[0], err_pipe[0]);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_[handle->id()] = handle;
    }

    spdlog::info("Agent {} started (pid={}, handle={}, isolated={})", name, pid, handle->id(), spec.isolated);
    return handle;
}

std::shared_ptr<ProcessHandle> ProcessSupervisor::lookup(const ProcessHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle.id());
    if (it == handles_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ProcessSupervisor::shutdown(const ProcessHandle& handle, std::chrono::milliseconds timeout) {
    return stop(handle, ProcessState::SHUTTING_DOWN, graceful_policy(config_.escalation, timeout));
}

bool ProcessSupervisor::terminate(const ProcessHandle& handle, std::chrono::milliseconds timeout) {
    return stop(handle, ProcessState::KILLING, destructive_policy(config_.escalation, timeout));
}

bool ProcessSupervisor::stop(const ProcessHandle& handle, ProcessState stopping,
                             const EscalationPolicy& policy) {
    auto owned = lookup(handle);
    if (!owned) {
        // Already dropped by the monitor or an earlier stop
        return !handle.alive();
    }

    // A survivor of an earlier stop may be escalated again
    if (!owned->transition(ProcessState::RUNNING, stopping) && !claim_survivor(owned->id())) {
        spdlog::debug("Agent {} is already {}", owned->name(), process_state_to_string(owned->state()));
        return !owned->alive();
    }
    owned->force_state(stopping);

    spdlog::info("Stopping agent {} (pid={}, budget={}ms)",
        owned->name(), owned->pid(), budget(policy).count());

    auto target = make_target(*owned);
    auto outcome = escalate(*target, policy);
    if (!outcome.exited) {
        spdlog::error("Agent {} (pid={}) survived termination, leaving it to the monitor",
            owned->name(), owned->pid());
        std::lock_guard<std::mutex> lock(mutex_);
        survivors_.insert(owned->id());
        return false;
    }

    owned->force_state(ProcessState::STOPPED);
    untrack(owned->id());
    spdlog::info("Agent {} stopped after '{}' in {}ms (exit={})", owned->name(),
        outcome.final_step, outcome.elapsed.count(), owned->exit_code().value_or(-1));
    return true;
}

size_t ProcessSupervisor::monitor_once() {
    std::vector<std::shared_ptr<ProcessHandle>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, handle] : handles_) {
            snapshot.push_back(handle);
        }
    }

    size_t crashed = 0;
    for (const auto& handle : snapshot) {
        if (handle->state() != ProcessState::RUNNING) {
            reap_survivor(handle);
            continue;
        }
        if (!handle->poll_exit()) {
            continue;
        }
        // A concurrent stop() may have claimed it first
        if (!handle->transition(ProcessState::RUNNING, ProcessState::CRASHED)) {
            continue;
        }

        std::string stderr_tail = tailer_.drain(handle->id());
        spdlog::error("Agent {} (pid={}) exited unexpectedly with code {}",
            handle->name(), handle->pid(), handle->exit_code().value_or(-1));
        if (!stderr_tail.empty()) {
            spdlog::error("Agent {} stderr:\n{}", handle->name(), stderr_tail);
        }
        untrack(handle->id());
        crashed++;
        notify_exit(handle, stderr_tail);
    }
    return crashed;
}

void ProcessSupervisor::reap_survivor(const std::shared_ptr<ProcessHandle>& handle) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (survivors_.count(handle->id()) == 0) {
            return;
        }
    }
    if (!handle->poll_exit() || !claim_survivor(handle->id())) {
        return;
    }

    handle->force_state(ProcessState::STOPPED);
    std::string stderr_tail = tailer_.drain(handle->id());
    spdlog::warn("Agent {} (pid={}) finally exited with code {} after a failed stop",
        handle->name(), handle->pid(), handle->exit_code().value_or(-1));
    untrack(handle->id());
    notify_exit(handle, stderr_tail);
}

bool ProcessSupervisor::claim_survivor(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return survivors_.erase(id) > 0;
}

void ProcessSupervisor::notify_exit(const std::shared_ptr<ProcessHandle>& handle,
                                    const std::string& stderr_tail) {
    ExitCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = exit_callback_;
    }
    if (callback) {
        callback(handle, stderr_tail);
    }
}

void ProcessSupervisor::untrack(uint32_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_.erase(id);
        survivors_.erase(id);
    }
    tailer_.unwatch(id);
}

void ProcessSupervisor::set_exit_callback(ExitCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    exit_callback_ = std::move(callback);
}

void ProcessSupervisor::set_target_factory(TargetFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    target_factory_ = std::move(factory);
}

std::unique_ptr<TerminationTarget> ProcessSupervisor::make_target(const ProcessHandle& handle) const {
    TargetFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory = target_factory_;
    }
    if (factory) {
        return factory(handle);
    }
    return std::make_unique<PosixTerminationTarget>(handle);
}

std::vector<std::shared_ptr<const ProcessHandle>> ProcessSupervisor::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<const ProcessHandle>> result;
    for (const auto& [id, handle] : handles_) {
        result.push_back(handle);
    }
    return result;
}

std::shared_ptr<const ProcessHandle> ProcessSupervisor::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, handle] : handles_) {
        if (handle->name() == name) {
            return handle;
        }
    }
    return nullptr;
}

} // namespace hive::runtime
