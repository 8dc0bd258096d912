#pragma once
#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace hive::kernel {

// What epoll reported for a watched fd
struct Readiness {
    bool readable = false;
    bool hangup = false;   // writer side closed
    bool error = false;

    // Worth a read(): data, EOF or an error to collect
    bool any() const { return readable || hangup || error; }
};

using ReadyCallback = std::function<void(int fd, Readiness ready)>;

// Level-triggered epoll over read-side fds (agent pipes).
// Single-threaded; callers serialize access.
class Reactor {
public:
    explicit Reactor(size_t batch_size = 64);
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool init();
    bool ready() const { return epoll_fd_ >= 0; }

    bool watch(int fd, ReadyCallback callback);

    // Safe to call from inside that fd's callback
    bool unwatch(int fd);

    bool watching(int fd) const { return callbacks_.count(fd) > 0; }
    size_t size() const { return callbacks_.size(); }

    // Dispatch ready fds once. timeout_ms: -1 blocks, 0 returns immediately.
    // Returns the number of callbacks run, or -1 on failure.
    int poll(int timeout_ms = 0);

private:
    int epoll_fd_ = -1;
    size_t batch_size_;
    std::unordered_map<int, ReadyCallback> callbacks_;
};

} // namespace hive::kernel
