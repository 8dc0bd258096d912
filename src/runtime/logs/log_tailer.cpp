#include "runtime/logs/log_tailer.hpp"
#include "runtime/logs/timestamp_rotating_sink.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace hive::runtime::logs {

namespace {

constexpr size_t READ_CHUNK = 4096;
constexpr size_t STDERR_TAIL_BYTES = 8192;
constexpr size_t MAX_PARTIAL_LINE = 64 * 1024;

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool looks_like_error(const std::string& line) {
    return line.find("ERROR") != std::string::npos || line.find("Traceback") != std::string::npos;
}

} // namespace

LogTailer::LogTailer(core::paths::Layout layout, size_t max_bytes, size_t max_files)
    : layout_(std::move(layout))
    , max_bytes_(max_bytes)
    , max_files_(max_files) {}

LogTailer::~LogTailer() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [fd, stream] : streams_) {
        close(fd);
    }
    streams_.clear();
    for (auto& [id, tail] : tails_) {
        if (tail.logger) {
            tail.logger->flush();
        }
    }
}

bool LogTailer::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return true;
    }
    initialized_ = reactor_.init();
    return initialized_;
}

std::shared_ptr<spdlog::logger> LogTailer::make_logger(const std::string& name) {
    auto sink = std::make_shared<TimestampRotatingFileSink>(
        layout_.agent_logs_dir(name), max_bytes_, max_files_);
    // Not registered globally: two handles for one agent name may overlap briefly
    auto logger = std::make_shared<spdlog::logger>("agent:" + name, sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::trace);
    return logger;
}

bool LogTailer::watch(uint32_t handle_id, const std::string& name, int stdout_fd, int stderr_fd) {
    std::lock_guard<std::mutex> lock(mutex_);

    Tail tail;
    tail.name = name;
    try {
        tail.logger = make_logger(name);
    } catch (const std::exception& e) {
        spdlog::error("Cannot open log file for agent {}: {}", name, e.what());
    }

    const std::pair<int, bool> pipes[] = {{stdout_fd, false}, {stderr_fd, true}};
    for (const auto& [fd, is_stderr] : pipes) {
        if (fd < 0) {
            continue;
        }
        set_nonblocking(fd);
        streams_[fd] = Stream{handle_id, is_stderr, {}};
        if (is_stderr) {
            tail.stderr_fd = fd;
        } else {
            tail.stdout_fd = fd;
        }

        if (initialized_ &&
            !reactor_.watch(fd, [this](int ready_fd, kernel::Readiness) { read_available(ready_fd); })) {
            spdlog::warn("Agent {} output on fd {} will only be read on drain", name, fd);
        }
    }

    tails_[handle_id] = std::move(tail);
    spdlog::debug("Tailing output of agent {} (handle={})", name, handle_id);
    return true;
}

int LogTailer::pump() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_ || reactor_.size() == 0) {
        return 0;
    }
    return reactor_.poll(0);
}

void LogTailer::read_available(int fd) {
    auto stream_it = streams_.find(fd);
    if (stream_it == streams_.end()) {
        return;
    }
    auto tail_it = tails_.find(stream_it->second.handle_id);
    if (tail_it == tails_.end()) {
        close_stream(fd);
        return;
    }
    Stream& stream = stream_it->second;
    Tail& tail = tail_it->second;

    char buf[READ_CHUNK];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            stream.partial.append(buf, static_cast<size_t>(n));
            size_t start = 0;
            size_t newline;
            while ((newline = stream.partial.find('\n', start)) != std::string::npos) {
                emit_line(tail, stream.is_stderr, stream.partial.substr(start, newline - start));
                start = newline + 1;
            }
            stream.partial.erase(0, start);
            if (stream.partial.size() > MAX_PARTIAL_LINE) {
                emit_line(tail, stream.is_stderr, stream.partial);
                stream.partial.clear();
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }

        // EOF or hard error: flush the last partial line and stop watching
        if (n < 0) {
            spdlog::debug("Read from agent {} fd {} failed: {}", tail.name, fd, strerror(errno));
        }
        if (!stream.partial.empty()) {
            emit_line(tail, stream.is_stderr, stream.partial);
            stream.partial.clear();
        }
        if (stream.is_stderr) {
            tail.stderr_fd = -1;
        } else {
            tail.stdout_fd = -1;
        }
        close_stream(fd);
        return;
    }
}

void LogTailer::emit_line(Tail& tail, bool is_stderr, const std::string& line) {
    if (tail.logger) {
        if (is_stderr) {
            tail.logger->info("[stderr] {}", line);
        } else {
            tail.logger->info("{}", line);
        }
    }

    if (is_stderr) {
        tail.stderr_tail.append(line).push_back('\n');
        if (tail.stderr_tail.size() > STDERR_TAIL_BYTES) {
            tail.stderr_tail.erase(0, tail.stderr_tail.size() - STDERR_TAIL_BYTES);
        }
        spdlog::warn("[{}] {}", tail.name, line);
    } else if (looks_like_error(line)) {
        spdlog::error("[{}] {}", tail.name, line);
    } else if (line.find("WARNING") != std::string::npos) {
        spdlog::warn("[{}] {}", tail.name, line);
    }
}

void LogTailer::close_stream(int fd) {
    reactor_.unwatch(fd);
    streams_.erase(fd);
    close(fd);
}

void LogTailer::drain_locked(uint32_t handle_id) {
    auto it = tails_.find(handle_id);
    if (it == tails_.end()) {
        return;
    }
    // read_available may close and clear either fd
    int out_fd = it->second.stdout_fd;
    int err_fd = it->second.stderr_fd;
    if (out_fd >= 0) {
        read_available(out_fd);
    }
    if (err_fd >= 0) {
        read_available(err_fd);
    }
}

std::string LogTailer::drain(uint32_t handle_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    drain_locked(handle_id);
    auto it = tails_.find(handle_id);
    return it == tails_.end() ? std::string() : it->second.stderr_tail;
}

void LogTailer::unwatch(uint32_t handle_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    drain_locked(handle_id);

    auto it = tails_.find(handle_id);
    if (it == tails_.end()) {
        return;
    }
    Tail& tail = it->second;
    for (int fd : {tail.stdout_fd, tail.stderr_fd}) {
        if (fd < 0) {
            continue;
        }
        auto stream_it = streams_.find(fd);
        if (stream_it != streams_.end() && !stream_it->second.partial.empty()) {
            emit_line(tail, stream_it->second.is_stderr, stream_it->second.partial);
        }
        close_stream(fd);
    }
    if (tail.logger) {
        tail.logger->flush();
    }
    spdlog::debug("Stopped tailing agent {} (handle={})", tail.name, handle_id);
    tails_.erase(it);
}

bool LogTailer::watching(uint32_t handle_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tails_.count(handle_id) > 0;
}

std::string LogTailer::stderr_tail(uint32_t handle_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tails_.find(handle_id);
    return it == tails_.end() ? std::string() : it->second.stderr_tail;
}

} // namespace hive::runtime::logs
