#include "services/brain/subprocess_backend.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

using json = nlohmann::json;

namespace hive::services::brain {

namespace {

constexpr auto STOP_GRACE = std::chrono::milliseconds(1000);
constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(20);

// waitpid() bounded by `timeout`; true once the child is reaped
bool reap_within(pid_t pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid || (result < 0 && errno == ECHILD)) {
            return true;
        }
        if (result < 0 && errno != EINTR) {
            spdlog::warn("waitpid({}) failed: {}", pid, strerror(errno));
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
}

} // namespace

SubprocessBrainBackend::SubprocessBrainBackend(std::vector<std::string> command, int timeout_seconds)
    : command_(std::move(command))
    , timeout_seconds_(timeout_seconds) {}

SubprocessBrainBackend::~SubprocessBrainBackend() {
    stop_subprocess();
}

std::string SubprocessBrainBackend::describe() const {
    return command_.empty() ? "subprocess" : "subprocess " + command_.front();
}

bool SubprocessBrainBackend::start_subprocess() {
    if (subprocess_pid_ > 0) {
        return true;
    }
    if (command_.empty()) {
        return false;
    }

    std::vector<char*> argv;
    for (auto& arg : command_) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        spdlog::error("Failed to create pipes for brain subprocess: {}", strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        spdlog::error("Failed to create pipes for brain subprocess: {}", strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Failed to fork brain subprocess: {}", strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Own group, so stopping it also takes down whatever it spawned
        setpgid(0, 0);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    setpgid(pid, pid);
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    subprocess_pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    buffered_.clear();

    spdlog::info("Started brain subprocess (pid={})", pid);
    return true;
}

void SubprocessBrainBackend::stop_subprocess() {
    if (subprocess_pid_ <= 0) {
        return;
    }

    if (stdin_fd_ >= 0) close(stdin_fd_);
    if (stdout_fd_ >= 0) close(stdout_fd_);

    killpg(subprocess_pid_, SIGTERM);
    if (!reap_within(subprocess_pid_, STOP_GRACE)) {
        spdlog::warn("Brain subprocess (pid={}) ignored SIGTERM, killing it", subprocess_pid_);
        killpg(subprocess_pid_, SIGKILL);
        if (!reap_within(subprocess_pid_, STOP_GRACE)) {
            spdlog::error("Brain subprocess (pid={}) could not be reaped", subprocess_pid_);
        }
    }

    subprocess_pid_ = -1;
    stdin_fd_ = -1;
    stdout_fd_ = -1;
    buffered_.clear();
}

bool SubprocessBrainBackend::read_line(std::string& line) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds_);
    char buf[4096];

    while (true) {
        auto newline = buffered_.find('\n');
        if (newline != std::string::npos) {
            line = buffered_.substr(0, newline);
            buffered_.erase(0, newline + 1);
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return false;
        }

        struct pollfd pfd{stdout_fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            return false;
        }

        ssize_t n = read(stdout_fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        buffered_.append(buf, static_cast<size_t>(n));
    }
}

std::string SubprocessBrainBackend::to_single_line(const std::string& payload) {
    try {
        return json::parse(payload).dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::parse_error&) {
        return json{{"payload", payload}}.dump(-1, ' ', false, json::error_handler_t::replace);
    }
}

BrainResponse SubprocessBrainBackend::parse_response(const std::string& line) {
    BrainResponse result;
    try {
        auto j = json::parse(line);
        result.success = j.value("success", false);
        result.content = j.value("content", "");
        result.error = j.value("error", "");
    } catch (const std::exception& e) {
        result.success = false;
        result.error = std::string("invalid response: ") + e.what();
    }
    return result;
}

BrainResponse SubprocessBrainBackend::complete(const std::string& payload) {
    if (!start_subprocess()) {
        return {false, "", "brain subprocess unavailable"};
    }

    std::string line = to_single_line(payload);
    line.push_back('\n');

    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = write(stdin_fd_, line.data() + written, line.size() - written);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            spdlog::error("Brain subprocess stopped accepting requests: {}", strerror(errno));
            stop_subprocess();
            return {false, "", "failed to write to brain subprocess"};
        }
        written += static_cast<size_t>(n);
    }

    std::string response;
    if (!read_line(response)) {
        spdlog::error("Brain subprocess gave no response within {}s, restarting it", timeout_seconds_);
        stop_subprocess();
        return {false, "", "no response from brain subprocess"};
    }
    return parse_response(response);
}

} // namespace hive::services::brain
