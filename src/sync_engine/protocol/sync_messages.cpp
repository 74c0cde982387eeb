#include "sync_messages.h"
#include "../utils/cpp_logger.h"

#include <chrono>
#include <cstring>
#include <memory>

namespace syncroom {
namespace engine {
namespace protocol {

namespace {

struct TypeNameEntry {
    MessageType type;
    const char* name;
};

const TypeNameEntry kTypeNames[] = {
    {MessageType::Sync, "sync"},
    {MessageType::SyncRequest, "sync_request"},
    {MessageType::Heartbeat, "heartbeat"},
    {MessageType::Ping, "ping"},
    {MessageType::Pong, "pong"},
    {MessageType::Play, "play"},
    {MessageType::Pause, "pause"},
    {MessageType::Seek, "seek"},
    {MessageType::SetItem, "set_item"},
    {MessageType::ItemEnded, "item_ended"},
    {MessageType::QueueAdd, "queue_add"},
    {MessageType::QueueRemove, "queue_remove"},
    {MessageType::QueueReorder, "queue_reorder"},
    {MessageType::QueuePin, "queue_pin"},
    {MessageType::QueuePlay, "queue_play"},
    {MessageType::QueueUpdate, "queue_update"},
    {MessageType::UserJoined, "user_joined"},
    {MessageType::UserLeft, "user_left"},
    {MessageType::Promote, "promote"},
    {MessageType::RolesUpdate, "roles_update"},
    {MessageType::TogglePermanent, "toggle_permanent"},
    {MessageType::RoomSettingsUpdate, "room_settings_update"},
};

const Json::Value* find_member(const Json::Value& obj, const char* key) {
    if (!obj.isObject()) {
        return nullptr;
    }
    return obj.find(key, key + std::strlen(key));
}

} // anonymous namespace

// ============================================================================
// Message type names
// ============================================================================

const char* message_type_name(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

MessageType parse_message_type(const std::string& name) {
    for (const auto& entry : kTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return MessageType::Unknown;
}

// ============================================================================
// Envelope codec
// ============================================================================

std::optional<SyncEnvelope> decode_envelope(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        LOG_CPP_WARNING("[Protocol] Dropping malformed message: %s", errors.c_str());
        return std::nullopt;
    }
    if (!root.isObject()) {
        LOG_CPP_WARNING("[Protocol] Dropping message that is not a JSON object.");
        return std::nullopt;
    }
    const Json::Value* type = find_member(root, "type");
    if (!type || !type->isString()) {
        LOG_CPP_WARNING("[Protocol] Dropping message without a string 'type'.");
        return std::nullopt;
    }

    SyncEnvelope envelope;
    envelope.type_name = type->asString();
    envelope.type = parse_message_type(envelope.type_name);
    const Json::Value* payload = find_member(root, "payload");
    if (payload && payload->isObject()) {
        envelope.payload = *payload;
    }
    return envelope;
}

std::string encode_envelope(MessageType type, const Json::Value& payload) {
    Json::Value root(Json::objectValue);
    root["type"] = message_type_name(type);
    root["payload"] = payload.isNull() ? Json::Value(Json::objectValue) : payload;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

// ============================================================================
// Data type conversion
// ============================================================================

Json::Value media_item_to_json(const MediaItem& item) {
    Json::Value v(Json::objectValue);
    v["id"] = item.id;
    v["title"] = item.title;
    v["is_live"] = item.is_live;
    v["pinned"] = item.pinned;
    v["added_by"] = item.added_by;
    v["thumbnail"] = item.thumbnail;
    return v;
}

std::optional<MediaItem> media_item_from_json(const Json::Value& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    MediaItem item;
    item.id = get_string(value, "id");
    if (item.id.empty()) {
        return std::nullopt;
    }
    item.title = get_string(value, "title");
    item.is_live = get_bool(value, "is_live");
    item.pinned = get_bool(value, "pinned");
    item.added_by = get_string(value, "added_by");
    item.thumbnail = get_string(value, "thumbnail");
    return item;
}

Json::Value queue_to_json(const std::vector<MediaItem>& queue) {
    Json::Value v(Json::arrayValue);
    for (const auto& item : queue) {
        v.append(media_item_to_json(item));
    }
    return v;
}

std::vector<MediaItem> queue_from_json(const Json::Value& value) {
    std::vector<MediaItem> queue;
    if (!value.isArray()) {
        return queue;
    }
    for (const auto& entry : value) {
        if (auto item = media_item_from_json(entry)) {
            queue.push_back(std::move(*item));
        }
    }
    return queue;
}

Json::Value roles_to_json(const std::map<std::string, RoomRole>& roles) {
    Json::Value v(Json::objectValue);
    for (const auto& [identity, role] : roles) {
        v[identity] = room_role_name(role);
    }
    return v;
}

std::map<std::string, RoomRole> roles_from_json(const Json::Value& value) {
    std::map<std::string, RoomRole> roles;
    if (!value.isObject()) {
        return roles;
    }
    for (const auto& identity : value.getMemberNames()) {
        const Json::Value& role = value[identity];
        if (!role.isString()) {
            continue;
        }
        if (auto parsed = parse_room_role(role.asString())) {
            roles[identity] = *parsed;
        }
    }
    return roles;
}

Json::Value strings_to_json(const std::vector<std::string>& values) {
    Json::Value v(Json::arrayValue);
    for (const auto& s : values) {
        v.append(s);
    }
    return v;
}

std::vector<std::string> strings_from_json(const Json::Value& value) {
    std::vector<std::string> out;
    if (!value.isArray()) {
        return out;
    }
    for (const auto& entry : value) {
        if (entry.isString()) {
            out.push_back(entry.asString());
        }
    }
    return out;
}

// ============================================================================
// Field readers
// ============================================================================

double get_number(const Json::Value& obj, const char* key, double fallback) {
    const Json::Value* v = find_member(obj, key);
    return (v && v->isNumeric()) ? v->asDouble() : fallback;
}

int get_int(const Json::Value& obj, const char* key, int fallback) {
    const Json::Value* v = find_member(obj, key);
    return (v && v->isInt()) ? v->asInt() : fallback;
}

bool get_bool(const Json::Value& obj, const char* key, bool fallback) {
    const Json::Value* v = find_member(obj, key);
    return (v && v->isBool()) ? v->asBool() : fallback;
}

std::string get_string(const Json::Value& obj, const char* key, const std::string& fallback) {
    const Json::Value* v = find_member(obj, key);
    return (v && v->isString()) ? v->asString() : fallback;
}

// ============================================================================
// Payload builders
// ============================================================================

Json::Value make_position_payload(double timestamp, bool is_live) {
    Json::Value v(Json::objectValue);
    v["timestamp"] = timestamp;
    v["is_live"] = is_live;
    return v;
}

Json::Value make_heartbeat_payload(double timestamp, bool is_playing, double server_time_ms) {
    Json::Value v(Json::objectValue);
    v["timestamp"] = timestamp;
    v["is_playing"] = is_playing;
    v["server_time"] = server_time_ms;
    return v;
}

Json::Value make_ping_payload(double client_time_ms) {
    Json::Value v(Json::objectValue);
    v["client_time"] = client_time_ms;
    return v;
}

Json::Value make_pong_payload(const Json::Value& client_time, double server_time_ms) {
    Json::Value v(Json::objectValue);
    v["client_time"] = client_time;
    v["server_time"] = server_time_ms;
    return v;
}

double wall_clock_ms() {
    using namespace std::chrono;
    return static_cast<double>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace protocol
} // namespace engine
} // namespace syncroom
