/**
 * Brain bridge
 *
 * File exchange between sandboxed agents and the brain backend. An agent
 * drops <control>/brain/<rid>.request; the bridge claims it by renaming it to
 * <rid>.pending, answers it through the backend, writes <rid>.response
 * atomically and removes the pending file. Requests are served round-robin
 * across agents so one chatty agent cannot starve the rest.
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include "core/paths.hpp"
#include "services/brain/backend.hpp"

namespace hive::services::brain {

inline constexpr const char* REQUEST_SUFFIX = ".request";
inline constexpr const char* PENDING_SUFFIX = ".pending";
inline constexpr const char* RESPONSE_SUFFIX = ".response";

class BrainBridge {
public:
    BrainBridge(core::paths::Layout layout, BrainBackend& backend);
    ~BrainBridge();

    BrainBridge(const BrainBridge&) = delete;
    BrainBridge& operator=(const BrainBridge&) = delete;

    // Start the worker thread
    void start();

    // Stop the worker; queued requests go back to .request for the next run
    void stop();

    // Claim new requests from every agent. Returns how many were queued.
    size_t scan_once();

    // Stop claiming and answering; the request currently in flight completes
    void freeze();
    bool frozen() const;

    // Queued plus in flight
    size_t pending() const;

    // Answer queued requests on the calling thread (no worker needed)
    size_t process_all();

private:
    struct Request {
        std::string agent;
        std::string request_id;
        std::string pending_path;
        std::string payload;
    };

    core::paths::Layout layout_;
    BrainBackend& backend_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, std::deque<Request>> queues_;
    std::deque<std::string> round_robin_;
    std::set<std::string> claimed_;     // pending paths queued or in flight
    std::thread worker_;
    bool stopping_ = false;
    bool frozen_ = false;

    void worker_loop();
    bool next_request(Request& req);
    void answer(const Request& req);
    void enqueue_locked(Request req);
    void requeue_all_locked();
    void claim_from(const std::string& agent, size_t& claimed);
};

} // namespace hive::services::brain
