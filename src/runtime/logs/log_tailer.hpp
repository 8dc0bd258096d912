/**
 * Agent output tailer
 *
 * Reads agents' stdout/stderr pipes through the epoll reactor and writes each
 * line into that agent's rotating log file. stderr lines and lines that look
 * like errors are echoed to the server log. Owns the pipe fds it watches.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <spdlog/logger.h>
#include "core/paths.hpp"
#include "kernel/reactor.hpp"

namespace hive::runtime::logs {

class LogTailer {
public:
    LogTailer(core::paths::Layout layout, size_t max_bytes, size_t max_files);
    ~LogTailer();

    // Non-copyable
    LogTailer(const LogTailer&) = delete;
    LogTailer& operator=(const LogTailer&) = delete;

    bool init();

    // Take ownership of an agent's pipes and start tailing them
    bool watch(uint32_t handle_id, const std::string& name, int stdout_fd, int stderr_fd);

    // Dispatch whatever output is ready without blocking. Returns events handled.
    int pump();

    // Read everything still buffered in the pipes; returns the recent stderr
    std::string drain(uint32_t handle_id);

    // drain() then close the pipes and the agent's log writer
    void unwatch(uint32_t handle_id);

    bool watching(uint32_t handle_id) const;
    std::string stderr_tail(uint32_t handle_id) const;

private:
    struct Stream {
        uint32_t handle_id;
        bool is_stderr;
        std::string partial;   // bytes after the last newline
    };

    struct Tail {
        std::string name;
        std::shared_ptr<spdlog::logger> logger;
        int stdout_fd = -1;
        int stderr_fd = -1;
        std::string stderr_tail;
    };

    core::paths::Layout layout_;
    size_t max_bytes_;
    size_t max_files_;

    mutable std::mutex mutex_;
    kernel::Reactor reactor_;
    bool initialized_ = false;
    std::unordered_map<int, Stream> streams_;       // fd -> stream
    std::unordered_map<uint32_t, Tail> tails_;      // handle id -> agent

    std::shared_ptr<spdlog::logger> make_logger(const std::string& name);
    void read_available(int fd);
    void emit_line(Tail& tail, bool is_stderr, const std::string& line);
    void close_stream(int fd);
    void drain_locked(uint32_t handle_id);
};

} // namespace hive::runtime::logs
