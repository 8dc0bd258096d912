#include "kernel/scheduler.hpp"
#include <spdlog/spdlog.h>

namespace hive::kernel {

// ============================================================================
// Cancellation
// ============================================================================

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this]() { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationSource::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

// ============================================================================
// TaskScheduler
// ============================================================================

TaskScheduler::~TaskScheduler() {
    shutdown();
}

void TaskScheduler::spawn_periodic(const std::string& name, std::chrono::milliseconds interval, Tick tick) {
    spawn(name, [name, interval, tick = std::move(tick)](const CancellationToken& token) {
        while (!token.cancelled()) {
            try {
                tick();
            } catch (const std::exception& e) {
                spdlog::error("Task {} iteration failed: {}", name, e.what());
            }
            if (token.wait_for(interval)) {
                break;
            }
        }
    });
}

std::future<void> TaskScheduler::spawn(const std::string& name, Body body) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        spdlog::warn("Scheduler stopped, not starting task {}", name);
        promise->set_value();
        return future;
    }

    auto token = source_.token();
    std::thread thread([name, token, promise, body = std::move(body)]() {
        spdlog::debug("Task {} started", name);
        try {
            body(token);
            promise->set_value();
        } catch (const std::exception& e) {
            spdlog::error("Task {} failed: {}", name, e.what());
            promise->set_exception(std::current_exception());
        }
        spdlog::debug("Task {} finished", name);
    });
    tasks_.push_back(Task{name, std::move(thread)});
    return future;
}

void TaskScheduler::shutdown() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        tasks.swap(tasks_);
    }

    source_.cancel();
    for (auto& task : tasks) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
    if (!tasks.empty()) {
        spdlog::info("Scheduler stopped {} tasks", tasks.size());
    }
}

size_t TaskScheduler::task_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace hive::kernel
