#include "kernel/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace hive::kernel {

Reactor::Reactor(size_t batch_size)
    : batch_size_(batch_size == 0 ? 1 : batch_size) {}

Reactor::~Reactor() {
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    if (epoll_fd_ >= 0) {
        return true;
    }
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll instance: {}", strerror(errno));
        return false;
    }
    spdlog::debug("Reactor ready (epoll_fd={}, batch={})", epoll_fd_, batch_size_);
    return true;
}

bool Reactor::watch(int fd, ReadyCallback callback) {
    if (epoll_fd_ < 0) {
        spdlog::error("Reactor not initialized, cannot watch fd {}", fd);
        return false;
    }

    struct epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Failed to watch fd {}: {}", fd, strerror(errno));
        return false;
    }

    callbacks_[fd] = std::move(callback);
    spdlog::debug("Watching fd {} ({} total)", fd, callbacks_.size());
    return true;
}

bool Reactor::unwatch(int fd) {
    if (callbacks_.erase(fd) == 0) {
        return false;
    }
    if (epoll_fd_ >= 0 && epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        // The fd may already be closed
        if (errno != ENOENT && errno != EBADF) {
            spdlog::warn("Failed to unwatch fd {}: {}", fd, strerror(errno));
        }
    }
    return true;
}

int Reactor::poll(int timeout_ms) {
    if (epoll_fd_ < 0) {
        return -1;
    }

    std::vector<struct epoll_event> events(batch_size_);
    int n = epoll_wait(epoll_fd_, events.data(), static_cast<int>(events.size()), timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    int dispatched = 0;
    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;
        uint32_t flags = events[i].events;

        Readiness ready;
        ready.readable = (flags & EPOLLIN) != 0;
        ready.hangup = (flags & (EPOLLHUP | EPOLLRDHUP)) != 0;
        ready.error = (flags & EPOLLERR) != 0;

        // An earlier callback in this batch may have unwatched it
        auto it = callbacks_.find(fd);
        if (it == callbacks_.end() || !ready.any()) {
            continue;
        }
        ReadyCallback callback = it->second;
        callback(fd, ready);
        dispatched++;
    }
    return dispatched;
}

} // namespace hive::kernel
