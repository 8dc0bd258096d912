/**
 * Mailbox messages
 *
 * A message file is a UTF-8 JSON object with the envelope fields
 * `id`, `from`, `to`, `type` and an optional ISO-8601 `timestamp`.
 * Everything else is the kind-specific payload. Files are parsed and
 * validated once, when they cross the filesystem boundary.
 */
#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace hive::ipc {

inline constexpr const char* BROADCAST_ADDRESS = "broadcast";
inline constexpr const char* SYSTEM_SENDER = "hive";
inline constexpr const char* MESSAGE_SUFFIX = ".msg";

enum class MessageKind {
    TEXT,
    COMMAND,
    SHUTDOWN,
    DELIVERY_ERROR,
    CUSTOM
};

const char* message_kind_to_string(MessageKind kind);

struct TextPayload {
    std::string content;
};

struct CommandPayload {
    std::string command;
    nlohmann::json params = nlohmann::json::object();
};

struct ShutdownPayload {
    std::string reason;
    uint32_t grace_ms = 0;
};

struct DeliveryErrorPayload {
    std::string error;
    std::string original_id;              // empty when the original was unparseable
    nlohmann::json original_message;      // parsed original, or its raw text
};

// Any type the core does not interpret; non-envelope fields kept verbatim
struct CustomPayload {
    std::string type;
    nlohmann::json body = nlohmann::json::object();
};

using MessagePayload = std::variant<TextPayload, CommandPayload, ShutdownPayload,
                                    DeliveryErrorPayload, CustomPayload>;

struct Message {
    std::string id;
    std::string from;
    std::string to;
    std::optional<std::string> timestamp;
    MessagePayload payload;

    MessageKind kind() const;
    std::string type() const;
    bool is_broadcast() const { return to == BROADCAST_ADDRESS; }
    std::string filename() const { return id + MESSAGE_SUFFIX; }
};

struct ParseResult {
    std::optional<Message> message;
    std::string error;

    bool ok() const { return message.has_value(); }
};

// Parse and validate a message file's contents
ParseResult parse_message(const std::string& text);

// A message id is used verbatim as a file name
bool is_valid_message_id(const std::string& id);

nlohmann::json to_json(const Message& message);
std::string serialize_message(const Message& message);

// Builders for messages the orchestrator itself originates
Message make_delivery_error(const std::string& sender, const std::string& error,
                            const std::string& original_id, const nlohmann::json& original);
Message make_shutdown_notice(const std::string& to, const std::string& reason, uint32_t grace_ms);
Message make_text(const std::string& from, const std::string& to, const std::string& content,
                  const std::string& type = "text");
Message make_command(const std::string& from, const std::string& to, const std::string& command,
                     const nlohmann::json& params);

std::string new_message_id(const std::string& prefix);
std::string iso_timestamp_now();

} // namespace hive::ipc
