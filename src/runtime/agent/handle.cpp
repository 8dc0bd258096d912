#include "runtime/agent/handle.hpp"
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

namespace hive::runtime {

const char* process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::STARTING: return "STARTING";
        case ProcessState::RUNNING: return "RUNNING";
        case ProcessState::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case ProcessState::KILLING: return "KILLING";
        case ProcessState::STOPPED: return "STOPPED";
        case ProcessState::CRASHED: return "CRASHED";
    }
    return "UNKNOWN";
}

ProcessHandle::ProcessHandle(uint32_t id, AgentIdentity identity, pid_t pid,
                             std::string sentinel_path, std::string signature)
    : id_(id)
    , identity_(std::move(identity))
    , pid_(pid)
    , sentinel_path_(std::move(sentinel_path))
    , signature_(std::move(signature))
    , started_at_(std::chrono::steady_clock::now()) {}

double ProcessHandle::uptime_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
}

std::optional<int> ProcessHandle::exit_code() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (!reaped_) {
        return std::nullopt;
    }
    return exit_code_;
}

bool ProcessHandle::poll_exit() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_) {
        return true;
    }
    if (pid_ <= 0) {
        reaped_ = true;
        return true;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return false;
    }
    if (result < 0) {
        if (errno == EINTR) {
            return false;
        }
        // ECHILD: someone else reaped it, treat as gone
        spdlog::debug("waitpid({}) failed: {}", pid_, strerror(errno));
        reaped_ = true;
        return true;
    }

    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    spdlog::debug("Agent {} (pid={}) exited with code {}", identity_.name, pid_, exit_code_);
    return true;
}

bool ProcessHandle::transition(ProcessState from, ProcessState to) {
    if (!state_.compare_exchange_strong(from, to)) {
        return false;
    }
    spdlog::debug("Agent {} state: {} -> {}", identity_.name,
        process_state_to_string(from), process_state_to_string(to));
    return true;
}

void ProcessHandle::force_state(ProcessState to) {
    ProcessState from = state_.exchange(to);
    if (from != to) {
        spdlog::debug("Agent {} state: {} -> {}", identity_.name,
            process_state_to_string(from), process_state_to_string(to));
    }
}

} // namespace hive::runtime
