#include "ipc/mailbox_router.hpp"
#include "util/atomic_file.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace hive::ipc {

namespace {

constexpr size_t MAX_RAW_ECHO = 4096;

bool is_message_file(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    auto name = entry.path().filename().string();
    if (name.empty() || name.front() == '.') {
        return false;
    }
    return entry.path().extension() == MESSAGE_SUFFIX;
}

} // namespace

MessageRouter::MessageRouter(core::paths::Layout layout)
    : layout_(std::move(layout)) {}

bool MessageRouter::agent_exists(const std::string& name) const {
    if (name.empty() || name == BROADCAST_ADDRESS || name.find('/') != std::string::npos ||
        name.front() == '.') {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(layout_.inbox(name), ec);
}

std::vector<std::string> MessageRouter::list_agents() const {
    std::vector<std::string> agents;
    std::error_code ec;
    fs::directory_iterator it(layout_.agents_dir(), ec);
    if (ec) {
        spdlog::error("Failed to list agents directory {}: {}", layout_.agents_dir(), ec.message());
        return agents;
    }

    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (agent_exists(name)) {
            agents.push_back(name);
        }
    }
    std::sort(agents.begin(), agents.end());
    return agents;
}

std::vector<fs::path> MessageRouter::pending_messages(const std::string& agent) const {
    struct Entry {
        fs::path path;
        fs::file_time_type mtime;
    };
    std::vector<Entry> entries;

    std::error_code ec;
    fs::directory_iterator it(layout_.outbox(agent), ec);
    if (ec) {
        spdlog::debug("No outbox for agent {}: {}", agent, ec.message());
        return {};
    }

    for (const auto& entry : it) {
        if (!is_message_file(entry)) {
            continue;
        }
        auto mtime = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        entries.push_back({entry.path(), mtime});
    }

    // Oldest first within this agent; name breaks ties
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.mtime != b.mtime) {
            return a.mtime < b.mtime;
        }
        return a.path.filename() < b.path.filename();
    });

    std::vector<fs::path> paths;
    paths.reserve(entries.size());
    for (auto& e : entries) {
        paths.push_back(std::move(e.path));
    }
    return paths;
}

RouteStats MessageRouter::route_once() {
    RouteStats stats;

    for (const auto& agent : list_agents()) {
        auto files = pending_messages(agent);
        if (files.empty()) {
            continue;
        }

        spdlog::debug("Found {} messages in {}'s outbox", files.size(), agent);
        for (const auto& file : files) {
            stats.scanned++;
            try {
                route_file(agent, file, stats);
            } catch (const std::exception& e) {
                // One bad file must not stall the rest of the scan
                spdlog::error("Routing {} from {} failed: {}", file.filename().string(), agent, e.what());
                stats.deferred++;
            }
        }
    }

    if (stats.delivered + stats.broadcasts + stats.delivery_errors > 0) {
        spdlog::info("Routed {} messages ({} broadcast, {} delivery errors, {} deferred)",
            stats.delivered + stats.broadcasts, stats.broadcasts,
            stats.delivery_errors, stats.deferred);
    }
    return stats;
}

void MessageRouter::route_file(const std::string& sender, const fs::path& file, RouteStats& stats) {
    auto content = util::read_file(file.string());
    if (!content) {
        // Vanished or unreadable; try again next tick
        spdlog::warn("Could not read {}", file.string());
        stats.deferred++;
        return;
    }

    auto parsed = parse_message(*content);
    if (!parsed.ok()) {
        spdlog::warn("Unparseable message {} from {}: {}", file.filename().string(), sender, parsed.error);
        std::string raw = content->substr(0, MAX_RAW_ECHO);
        if (!reply_with_error(sender, "unparseable message " + file.filename().string() + ": " + parsed.error,
                              "", json(raw))) {
            stats.deferred++;
            return;
        }
        stats.delivery_errors++;
        archive(sender, file);
        return;
    }

    const Message& msg = *parsed.message;

    if (msg.is_broadcast()) {
        size_t recipients = 0;
        size_t count = 0;
        for (const auto& agent : list_agents()) {
            if (agent == sender) {
                continue;
            }
            recipients++;
            if (write_to_inbox(agent, msg.filename(), *content)) {
                count++;
            }
        }
        if (count < recipients) {
            // Copies are named by id, so the retry overwrites the ones that landed
            spdlog::warn("Broadcast {} from {} reached {} of {} agents, retrying next tick",
                msg.id, sender, count, recipients);
            stats.deferred++;
            return;
        }
        spdlog::info("Broadcast {} from {} to {} agents", msg.id, sender, count);
        stats.broadcasts++;
        archive(sender, file);
        return;
    }

    if (!agent_exists(msg.to)) {
        if (!reply_with_error(sender, "Agent " + msg.to + " not found", msg.id, to_json(msg))) {
            stats.deferred++;
            return;
        }
        stats.delivery_errors++;
        archive(sender, file);
        return;
    }

    if (!write_to_inbox(msg.to, msg.filename(), *content)) {
        stats.deferred++;
        return;
    }

    spdlog::debug("Delivered {} from {} to {}", msg.id, sender, msg.to);
    stats.delivered++;
    archive(sender, file);
}

bool MessageRouter::write_to_inbox(const std::string& to, const std::string& filename,
                                   const std::string& content) {
    return util::write_file_atomic(layout_.inbox(to) + "/" + filename, content);
}

bool MessageRouter::reply_with_error(const std::string& sender, const std::string& error,
                                     const std::string& original_id, const json& original) {
    Message reply = make_delivery_error(sender, error, original_id, original);
    if (!write_to_inbox(sender, reply.filename(), serialize_message(reply))) {
        spdlog::error("Failed to return delivery error to {}", sender);
        return false;
    }
    spdlog::info("Sent delivery error to {}: {}", sender, error);
    return true;
}

bool MessageRouter::archive(const std::string& sender, const fs::path& file) {
    std::error_code ec;
    fs::create_directories(layout_.sent(sender), ec);

    fs::path target = fs::path(layout_.sent(sender)) / file.filename();
    if (std::rename(file.c_str(), target.c_str()) != 0) {
        // The copy is already delivered; the next tick will deliver it again
        spdlog::error("Failed to archive {}: {}", file.string(), strerror(errno));
        return false;
    }
    return true;
}

bool MessageRouter::deliver(const std::string& to, const Message& message) {
    if (!agent_exists(to)) {
        spdlog::warn("Cannot deliver {} to unknown agent {}", message.id, to);
        return false;
    }
    return write_to_inbox(to, message.filename(), serialize_message(message));
}

size_t MessageRouter::broadcast(const Message& message, const std::string& exclude) {
    size_t count = 0;
    for (const auto& agent : list_agents()) {
        if (agent == exclude) {
            continue;
        }
        Message copy = message;
        copy.to = agent;
        if (write_to_inbox(agent, copy.filename(), serialize_message(copy))) {
            count++;
        }
    }
    return count;
}

} // namespace hive::ipc
