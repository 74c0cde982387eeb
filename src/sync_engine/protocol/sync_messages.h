/**
 * @file sync_messages.h
 * @brief JSON wire codec for room synchronization messages.
 * @details Every message on the room socket is a JSON object `{ "type": <name>, "payload": {...} }`.
 *          This file maps message names to `MessageType`, decodes and encodes envelopes, and
 *          provides helpers that convert the shared data types (media items, queues, role maps)
 *          to and from their JSON form. Keys use snake_case.
 *
 *          Decoding never throws: malformed text yields `std::nullopt` and a logged warning.
 */
#ifndef SYNC_MESSAGES_H
#define SYNC_MESSAGES_H

#include "../sync_types.h"

#include <json/json.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace syncroom {
namespace engine {
namespace protocol {

enum class MessageType {
    // Snapshot and clock
    Sync,
    SyncRequest,
    Heartbeat,
    Ping,
    Pong,
    // Playback commands
    Play,
    Pause,
    Seek,
    SetItem,
    ItemEnded,
    // Queue
    QueueAdd,
    QueueRemove,
    QueueReorder,
    QueuePin,
    QueuePlay,
    QueueUpdate,
    // Membership, roles, settings
    UserJoined,
    UserLeft,
    Promote,
    RolesUpdate,
    TogglePermanent,
    RoomSettingsUpdate,
    Unknown
};

const char* message_type_name(MessageType type);
MessageType parse_message_type(const std::string& name);

/**
 * @struct SyncEnvelope
 * @brief A decoded message. `type_name` keeps the raw name so unknown types can be logged.
 */
struct SyncEnvelope {
    MessageType type = MessageType::Unknown;
    std::string type_name;
    Json::Value payload{Json::objectValue};
};

/**
 * @brief Decodes one text frame.
 * @return The envelope, or `std::nullopt` if the text is not a JSON object with a string `type`.
 *         A missing or non-object payload decodes as an empty object.
 */
std::optional<SyncEnvelope> decode_envelope(const std::string& text);

/** @brief Encodes an envelope as compact JSON. */
std::string encode_envelope(MessageType type, const Json::Value& payload = Json::Value(Json::objectValue));

// --- Data type conversion ---
Json::Value media_item_to_json(const MediaItem& item);
std::optional<MediaItem> media_item_from_json(const Json::Value& value);
Json::Value queue_to_json(const std::vector<MediaItem>& queue);
std::vector<MediaItem> queue_from_json(const Json::Value& value);
Json::Value roles_to_json(const std::map<std::string, RoomRole>& roles);
std::map<std::string, RoomRole> roles_from_json(const Json::Value& value);
Json::Value strings_to_json(const std::vector<std::string>& values);
std::vector<std::string> strings_from_json(const Json::Value& value);

// --- Tolerant field readers (wrong types fall back to the default) ---
double get_number(const Json::Value& obj, const char* key, double fallback = 0.0);
int get_int(const Json::Value& obj, const char* key, int fallback = 0);
bool get_bool(const Json::Value& obj, const char* key, bool fallback = false);
std::string get_string(const Json::Value& obj, const char* key, const std::string& fallback = "");

// --- Payload builders ---
/** @brief `play`, `pause` and `seek` share this payload. */
Json::Value make_position_payload(double timestamp, bool is_live);
Json::Value make_heartbeat_payload(double timestamp, bool is_playing, double server_time_ms);
Json::Value make_ping_payload(double client_time_ms);
Json::Value make_pong_payload(const Json::Value& client_time, double server_time_ms);

/** @brief Wall-clock milliseconds since the Unix epoch, used for `server_time`. */
double wall_clock_ms();

} // namespace protocol
} // namespace engine
} // namespace syncroom

#endif // SYNC_MESSAGES_H
