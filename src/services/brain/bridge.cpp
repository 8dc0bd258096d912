#include "services/brain/bridge.hpp"
#include "util/atomic_file.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace hive::services::brain {

namespace {

bool has_suffix(const std::string& name, const std::string& suffix) {
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string strip_suffix(const std::string& name, const std::string& suffix) {
    return name.substr(0, name.size() - suffix.size());
}

} // namespace

BrainBridge::BrainBridge(core::paths::Layout layout, BrainBackend& backend)
    : layout_(std::move(layout))
    , backend_(backend) {}

BrainBridge::~BrainBridge() {
    stop();
}

void BrainBridge::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stopping_ = false;
    worker_ = std::thread(&BrainBridge::worker_loop, this);
    spdlog::info("Brain bridge started (backend={})", backend_.describe());
}

void BrainBridge::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    requeue_all_locked();
}

void BrainBridge::freeze() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frozen_) {
            return;
        }
        frozen_ = true;
        requeue_all_locked();
    }
    cv_.notify_all();
    spdlog::info("Brain bridge frozen");
}

bool BrainBridge::frozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

size_t BrainBridge::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.size();
}

void BrainBridge::requeue_all_locked() {
    size_t returned = 0;
    for (auto& [agent, queue] : queues_) {
        for (auto& req : queue) {
            auto request_path = fs::path(req.pending_path).replace_extension(REQUEST_SUFFIX);
            if (std::rename(req.pending_path.c_str(), request_path.c_str()) == 0) {
                returned++;
            } else {
                spdlog::warn("Could not return brain request {} of {}", req.request_id, agent);
            }
            claimed_.erase(req.pending_path);
        }
    }
    queues_.clear();
    round_robin_.clear();
    if (returned > 0) {
        spdlog::info("Returned {} unanswered brain requests", returned);
    }
}

void BrainBridge::enqueue_locked(Request req) {
    claimed_.insert(req.pending_path);
    auto& q = queues_[req.agent];
    bool was_empty = q.empty();
    std::string agent = req.agent;
    q.push_back(std::move(req));
    if (was_empty) {
        round_robin_.push_back(agent);
    }
}

void BrainBridge::claim_from(const std::string& agent, size_t& claimed) {
    std::error_code ec;
    fs::directory_iterator it(layout_.brain_dir(agent), ec);
    if (ec) {
        return;
    }

    for (const auto& entry : it) {
        auto filename = entry.path().filename().string();
        if (filename.empty() || filename.front() == '.') {
            continue;
        }

        std::string pending_path;
        std::string request_id;
        if (has_suffix(filename, REQUEST_SUFFIX)) {
            request_id = strip_suffix(filename, REQUEST_SUFFIX);
            pending_path = (entry.path().parent_path() / (request_id + PENDING_SUFFIX)).string();
            if (std::rename(entry.path().c_str(), pending_path.c_str()) != 0) {
                continue;   // withdrawn by the agent
            }
        } else if (has_suffix(filename, PENDING_SUFFIX)) {
            // Left over from an earlier run
            pending_path = entry.path().string();
            if (claimed_.count(pending_path)) {
                continue;
            }
            request_id = strip_suffix(filename, PENDING_SUFFIX);
        } else {
            continue;
        }

        auto payload = util::read_file(pending_path);
        if (!payload) {
            spdlog::warn("Could not read brain request {} of {}", request_id, agent);
            continue;
        }

        enqueue_locked(Request{agent, request_id, pending_path, std::move(*payload)});
        claimed++;
    }
}

size_t BrainBridge::scan_once() {
    size_t claimed = 0;
    std::error_code ec;
    fs::directory_iterator it(layout_.agents_dir(), ec);
    if (ec) {
        return 0;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frozen_ || stopping_) {
            return 0;
        }
        for (const auto& entry : it) {
            if (entry.is_directory(ec)) {
                claim_from(entry.path().filename().string(), claimed);
            }
        }
    }

    if (claimed > 0) {
        spdlog::debug("Claimed {} brain requests", claimed);
        cv_.notify_one();
    }
    return claimed;
}

bool BrainBridge::next_request(Request& req) {
    if (round_robin_.empty()) {
        return false;
    }
    std::string agent = round_robin_.front();
    round_robin_.pop_front();

    auto& q = queues_[agent];
    req = std::move(q.front());
    q.pop_front();

    if (!q.empty()) {
        round_robin_.push_back(agent);
    } else {
        queues_.erase(agent);
    }
    return true;
}

void BrainBridge::answer(const Request& req) {
    auto result = backend_.complete(req.payload);

    json response = {
        {"success", result.success},
        {"content", result.content},
        {"error", result.error},
    };
    auto response_path = fs::path(req.pending_path).replace_extension(RESPONSE_SUFFIX);
    if (!util::write_file_atomic(response_path.string(), response.dump(-1, ' ', false, json::error_handler_t::replace))) {
        spdlog::error("Failed to write brain response {} for {}", req.request_id, req.agent);
    } else {
        std::error_code ec;
        fs::remove(req.pending_path, ec);
        spdlog::debug("Answered brain request {} for {} (success={})",
            req.request_id, req.agent, result.success);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    claimed_.erase(req.pending_path);
}

void BrainBridge::worker_loop() {
    while (true) {
        Request req;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || (!frozen_ && !round_robin_.empty()); });
            if (stopping_) {
                break;
            }
            next_request(req);
        }
        answer(req);
    }
}

size_t BrainBridge::process_all() {
    size_t answered = 0;
    while (true) {
        Request req;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (frozen_ || !next_request(req)) {
                break;
            }
        }
        answer(req);
        answered++;
    }
    return answered;
}

} // namespace hive::services::brain
