#include "ipc/message.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace hive::ipc {

namespace {

constexpr const char* TYPE_TEXT = "text";
constexpr const char* TYPE_COMMAND = "COMMAND";
constexpr const char* TYPE_SHUTDOWN = "SHUTDOWN";
constexpr const char* TYPE_DELIVERY_ERROR = "DELIVERY_ERROR";

std::atomic<uint64_t> g_next_sequence{1};

bool is_envelope_key(const std::string& key) {
    return key == "id" || key == "from" || key == "to" || key == "type" || key == "timestamp";
}

std::optional<std::string> required_string(const json& j, const char* key, std::string& error) {
    auto it = j.find(key);
    if (it == j.end()) {
        error = std::string("missing required field '") + key + "'";
        return std::nullopt;
    }
    if (!it->is_string()) {
        error = std::string("field '") + key + "' must be a string";
        return std::nullopt;
    }
    return it->get<std::string>();
}

json extra_fields(const json& j) {
    json body = json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_envelope_key(it.key())) {
            body[it.key()] = it.value();
        }
    }
    return body;
}

} // namespace

const char* message_kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::TEXT: return "TEXT";
        case MessageKind::COMMAND: return "COMMAND";
        case MessageKind::SHUTDOWN: return "SHUTDOWN";
        case MessageKind::DELIVERY_ERROR: return "DELIVERY_ERROR";
        case MessageKind::CUSTOM: return "CUSTOM";
    }
    return "UNKNOWN";
}

MessageKind Message::kind() const {
    return static_cast<MessageKind>(payload.index());
}

std::string Message::type() const {
    switch (kind()) {
        case MessageKind::TEXT: return TYPE_TEXT;
        case MessageKind::COMMAND: return TYPE_COMMAND;
        case MessageKind::SHUTDOWN: return TYPE_SHUTDOWN;
        case MessageKind::DELIVERY_ERROR: return TYPE_DELIVERY_ERROR;
        case MessageKind::CUSTOM: return std::get<CustomPayload>(payload).type;
    }
    return {};
}

bool is_valid_message_id(const std::string& id) {
    if (id.empty() || id.size() > 200 || id.front() == '.') {
        return false;
    }
    for (char c : id) {
        if (c == '/' || c == '\0' || c == '\n') {
            return false;
        }
    }
    return true;
}

ParseResult parse_message(const std::string& text) {
    ParseResult result;

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        result.error = std::string("invalid JSON: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "message must be a JSON object";
        return result;
    }

    auto id = required_string(j, "id", result.error);
    if (!id) return result;
    auto from = required_string(j, "from", result.error);
    if (!from) return result;
    auto to = required_string(j, "to", result.error);
    if (!to) return result;
    auto type = required_string(j, "type", result.error);
    if (!type) return result;

    if (!is_valid_message_id(*id)) {
        result.error = "invalid message id '" + *id + "'";
        return result;
    }

    Message msg;
    msg.id = *id;
    msg.from = *from;
    msg.to = *to;
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        msg.timestamp = j["timestamp"].get<std::string>();
    }

    try {
        if (*type == TYPE_TEXT) {
            msg.payload = TextPayload{j.value("content", "")};
        } else if (*type == TYPE_COMMAND) {
            CommandPayload cmd;
            cmd.command = j.value("command", "");
            cmd.params = j.value("params", json::object());
            msg.payload = cmd;
        } else if (*type == TYPE_SHUTDOWN) {
            msg.payload = ShutdownPayload{j.value("reason", ""), j.value("grace_ms", 0u)};
        } else if (*type == TYPE_DELIVERY_ERROR) {
            DeliveryErrorPayload err;
            err.error = j.value("error", "");
            err.original_id = j.value("original_id", "");
            err.original_message = j.value("original_message", json());
            msg.payload = err;
        } else {
            msg.payload = CustomPayload{*type, extra_fields(j)};
        }
    } catch (const json::type_error& e) {
        result.error = std::string("invalid payload for type '") + *type + "': " + e.what();
        return result;
    }

    result.message = std::move(msg);
    return result;
}

json to_json(const Message& message) {
    json j;

    if (auto* custom = std::get_if<CustomPayload>(&message.payload)) {
        if (custom->body.is_object()) {
            j = custom->body;
        }
    }

    j["id"] = message.id;
    j["from"] = message.from;
    j["to"] = message.to;
    j["type"] = message.type();
    if (message.timestamp) {
        j["timestamp"] = *message.timestamp;
    }

    std::visit([&j](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, TextPayload>) {
            j["content"] = payload.content;
        } else if constexpr (std::is_same_v<T, CommandPayload>) {
            j["command"] = payload.command;
            j["params"] = payload.params;
        } else if constexpr (std::is_same_v<T, ShutdownPayload>) {
            j["reason"] = payload.reason;
            j["grace_ms"] = payload.grace_ms;
        } else if constexpr (std::is_same_v<T, DeliveryErrorPayload>) {
            j["error"] = payload.error;
            if (!payload.original_id.empty()) {
                j["original_id"] = payload.original_id;
            }
            j["original_message"] = payload.original_message;
        }
    }, message.payload);

    return j;
}

std::string serialize_message(const Message& message) {
    // Echoed raw bytes may not be valid UTF-8
    return to_json(message).dump(2, ' ', false, json::error_handler_t::replace);
}

std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&secs, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

std::string new_message_id(const std::string& prefix) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return prefix + "_" + std::to_string(ms) + "_" + std::to_string(g_next_sequence++);
}

Message make_delivery_error(const std::string& sender, const std::string& error,
                            const std::string& original_id, const json& original) {
    Message msg;
    msg.id = new_message_id("delivery_error");
    msg.from = SYSTEM_SENDER;
    msg.to = sender;
    msg.timestamp = iso_timestamp_now();
    msg.payload = DeliveryErrorPayload{error, original_id, original};
    return msg;
}

Message make_shutdown_notice(const std::string& to, const std::string& reason, uint32_t grace_ms) {
    Message msg;
    msg.id = new_message_id("shutdown");
    msg.from = SYSTEM_SENDER;
    msg.to = to;
    msg.timestamp = iso_timestamp_now();
    msg.payload = ShutdownPayload{reason, grace_ms};
    return msg;
}

Message make_text(const std::string& from, const std::string& to, const std::string& content,
                  const std::string& type) {
    Message msg;
    msg.id = new_message_id(from);
    msg.from = from;
    msg.to = to;
    msg.timestamp = iso_timestamp_now();
    if (type == TYPE_TEXT) {
        msg.payload = TextPayload{content};
    } else {
        msg.payload = CustomPayload{type, json{{"content", content}}};
    }
    return msg;
}

Message make_command(const std::string& from, const std::string& to, const std::string& command,
                     const json& params) {
    Message msg;
    msg.id = new_message_id(from);
    msg.from = from;
    msg.to = to;
    msg.timestamp = iso_timestamp_now();
    msg.payload = CommandPayload{command, params.is_null() ? json::object() : params};
    return msg;
}

} // namespace hive::ipc
