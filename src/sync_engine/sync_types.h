/**
 * @file sync_types.h
 * @brief Defines the core data types shared by the server and client halves of the sync engine.
 * @details This header contains the plain data structures that describe media items, resolved
 *          streams, room roles and playback operations. They carry no behaviour beyond small
 *          conversion helpers so that every module (wire protocol, coordinator, client) can
 *          include them without pulling in threading or transport code.
 */
#ifndef SYNC_TYPES_H
#define SYNC_TYPES_H

#include <chrono>
#include <string>
#include <vector>
#include <optional>

namespace syncroom {
namespace engine {

using SteadyTime = std::chrono::steady_clock::time_point;

/**
 * @enum RoomRole
 * @brief Permission level of a member within a room.
 */
enum class RoomRole {
    Admin,     ///< May promote members and change room settings.
    Moderator, ///< Reserved for queue moderation.
    User       ///< Default role for every joiner after the first.
};

inline const char* room_role_name(RoomRole role) {
    switch (role) {
        case RoomRole::Admin:     return "admin";
        case RoomRole::Moderator: return "moderator";
        case RoomRole::User:      return "user";
    }
    return "user";
}

/**
 * @brief Parses a wire role name.
 * @param name One of "admin", "moderator", "user".
 * @return The role, or `std::nullopt` if the name is not recognised.
 */
inline std::optional<RoomRole> parse_room_role(const std::string& name) {
    if (name == "admin") return RoomRole::Admin;
    if (name == "moderator") return RoomRole::Moderator;
    if (name == "user") return RoomRole::User;
    return std::nullopt;
}

/**
 * @enum StreamType
 * @brief How a resolved media item is delivered to the player.
 */
enum class StreamType {
    Single, ///< One muxed stream played by a single element.
    Dual    ///< Separate video-only and audio-only streams.
};

inline const char* stream_type_name(StreamType type) {
    return type == StreamType::Dual ? "dual" : "single";
}

/**
 * @struct QualityLevel
 * @brief One selectable video rendition of a dual-stream item.
 */
struct QualityLevel {
    int height = 0;
    int width = 0;
    std::string video_url;
    std::string format_id;
};

/**
 * @struct MediaItem
 * @brief A queue entry. `id` is the original source URL and identifies the item.
 */
struct MediaItem {
    std::string id;
    std::string title;
    bool is_live = false;
    bool pinned = false;
    std::string added_by;
    std::string thumbnail;

    bool operator==(const MediaItem& other) const {
        return id == other.id && title == other.title && is_live == other.is_live &&
               pinned == other.pinned && added_by == other.added_by && thumbnail == other.thumbnail;
    }
    bool operator!=(const MediaItem& other) const { return !(*this == other); }
};

/**
 * @struct ResolvedMedia
 * @brief Playable stream locations for a media item, as produced by an `IMediaResolver`.
 */
struct ResolvedMedia {
    StreamType stream_type = StreamType::Single;
    std::string url;        ///< Used when `stream_type` is Single.
    std::string video_url;  ///< Used when `stream_type` is Dual.
    std::string audio_url;  ///< Used when `stream_type` is Dual.
    std::vector<QualityLevel> available_qualities;
    bool is_live = false;
    std::string title;
};

/**
 * @enum PlaybackOpKind
 * @brief The kinds of authoritative playback mutations a room accepts.
 */
enum class PlaybackOpKind {
    Play,
    Pause,
    Seek,
    SetItem
};

/**
 * @struct PlaybackOp
 * @brief A single mutation applied to a room's authoritative clock.
 */
struct PlaybackOp {
    PlaybackOpKind kind = PlaybackOpKind::Pause;
    double position = 0.0;      ///< Target position for Play, Pause and Seek.
    MediaItem item;             ///< Item for SetItem.

    static PlaybackOp play(double at) { return PlaybackOp{PlaybackOpKind::Play, at, {}}; }
    static PlaybackOp pause(double at) { return PlaybackOp{PlaybackOpKind::Pause, at, {}}; }
    static PlaybackOp seek(double to) { return PlaybackOp{PlaybackOpKind::Seek, to, {}}; }
    static PlaybackOp set_item(MediaItem item) {
        return PlaybackOp{PlaybackOpKind::SetItem, 0.0, std::move(item)};
    }
};

/**
 * @enum SyncHealth
 * @brief Health of the dual-stream sub-engine.
 */
enum class SyncHealth {
    Good,       ///< Streams are aligned or correcting normally.
    Recovering, ///< At least one heavy resync has failed since the last success.
    Failed      ///< Resync retries exhausted. Terminal until new media is attached.
};

inline const char* sync_health_name(SyncHealth health) {
    switch (health) {
        case SyncHealth::Good:       return "good";
        case SyncHealth::Recovering: return "recovering";
        case SyncHealth::Failed:     return "failed";
    }
    return "good";
}

} // namespace engine
} // namespace syncroom

#endif // SYNC_TYPES_H
