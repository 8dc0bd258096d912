/**
 * Filesystem mailbox router
 *
 * Moves message files from each agent's outbox into recipients' inboxes.
 * Every transfer is a write-to-temp + rename into the destination followed by
 * a rename of the source into outbox/sent/, so a crash between the two steps
 * can duplicate a message but never corrupt or lose one (at-least-once).
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/paths.hpp"
#include "ipc/message.hpp"

namespace hive::ipc {

struct RouteStats {
    size_t scanned = 0;           // message files looked at
    size_t delivered = 0;         // point-to-point deliveries
    size_t broadcasts = 0;        // broadcast messages fanned out
    size_t delivery_errors = 0;   // DELIVERY_ERROR replies synthesized
    size_t deferred = 0;          // left in the outbox for the next tick
};

class MessageRouter {
public:
    explicit MessageRouter(core::paths::Layout layout);

    // One pass over every outbox
    RouteStats route_once();

    // An agent exists while its inbox directory exists
    bool agent_exists(const std::string& name) const;
    std::vector<std::string> list_agents() const;

    // Write an orchestrator-originated message into one inbox
    bool deliver(const std::string& to, const Message& message);

    // Write a copy into every inbox except `exclude`; returns deliveries made
    size_t broadcast(const Message& message, const std::string& exclude = {});

private:
    core::paths::Layout layout_;

    std::vector<std::filesystem::path> pending_messages(const std::string& agent) const;
    void route_file(const std::string& sender, const std::filesystem::path& file, RouteStats& stats);
    bool write_to_inbox(const std::string& to, const std::string& filename, const std::string& content);
    bool reply_with_error(const std::string& sender, const std::string& error,
                          const std::string& original_id, const nlohmann::json& original);
    bool archive(const std::string& sender, const std::filesystem::path& file);
};

} // namespace hive::ipc
