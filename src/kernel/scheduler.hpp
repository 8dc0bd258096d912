#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hive::kernel {

// Shared cancellation flag that sleeping tasks can wait on
class CancellationToken {
public:
    bool cancelled() const;

    // Sleep up to `timeout`; returns true if cancelled meanwhile
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;

    struct State {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        bool cancelled = false;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}
    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }
    void cancel();
    bool cancelled() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

// Hosts the coordinator's long-running loops, one thread each
class TaskScheduler {
public:
    using Tick = std::function<void()>;
    using Body = std::function<void(const CancellationToken&)>;

    TaskScheduler() = default;
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Run `tick` every `interval` until shutdown. Exceptions are logged per tick.
    void spawn_periodic(const std::string& name, std::chrono::milliseconds interval, Tick tick);

    // Run `body` once on its own thread; it should return when the token fires
    std::future<void> spawn(const std::string& name, Body body);

    // Cancel every task and join the threads
    void shutdown();

    size_t task_count() const;

private:
    struct Task {
        std::string name;
        std::thread thread;
    };

    mutable std::mutex mutex_;
    CancellationSource source_;
    std::vector<Task> tasks_;
    bool stopped_ = false;
};

} // namespace hive::kernel
