/**
 * @file room_sync_session.h
 * @brief Client-side state of one room membership, independent of the transport.
 * @details The session decodes server messages, keeps a `RoomView` of the room, loads media
 *          through the host's resolver and player, and routes clock messages to the
 *          `DriftCorrectionEngine`. Dual-stream media is played through a `DualStreamSync`,
 *          whose tick the session drives. Local user actions are applied to the player and sent
 *          to the server through the configured sender.
 *
 *          Everything here runs on the client loop thread.
 */
#ifndef ROOM_SYNC_SESSION_H
#define ROOM_SYNC_SESSION_H

#include "drift_correction_engine.h"
#include "dual_stream_sync.h"
#include "latency_estimator.h"
#include "media_resolver.h"
#include "single_stream_target.h"
#include "../configuration/sync_engine_settings.h"
#include "../protocol/sync_messages.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace syncroom {
namespace engine {

/**
 * @struct RoomView
 * @brief What the client knows about its room.
 */
struct RoomView {
    std::string identity;
    RoomRole role = RoomRole::User;
    std::vector<std::string> members;
    std::map<std::string, RoomRole> roles;
    std::vector<MediaItem> queue;
    int playing_index = -1;
    std::optional<MediaItem> current_item;
    std::optional<ResolvedMedia> resolved;
    std::optional<QualityLevel> active_quality;
    bool is_playing = false;
    bool permanent = false;
};

class RoomSyncSession {
public:
    using SendFunction = std::function<bool(const std::string&)>;
    using NoticeCallback = std::function<void(const std::string&)>;

    /**
     * @param settings Shared engine settings.
     * @param resolver Resolves queue items. Not owned.
     * @param host Creates media elements. Not owned.
     * @param quality_notifier Optional prefetch hint receiver. Not owned.
     */
    RoomSyncSession(std::shared_ptr<SyncEngineSettings> settings,
                    IMediaResolver* resolver,
                    IPlayerHost* host,
                    IQualitySwitchNotifier* quality_notifier = nullptr);
    ~RoomSyncSession();

    RoomSyncSession(const RoomSyncSession&) = delete;
    RoomSyncSession& operator=(const RoomSyncSession&) = delete;

    void set_sender(SendFunction sender) { sender_ = std::move(sender); }
    void set_notice_callback(NoticeCallback callback);

    // --- Transport events ---
    void on_connected(SteadyTime now);
    void on_disconnected();
    bool connected() const { return connected_; }
    void handle_message(const std::string& text, SteadyTime now);

    /** @brief Sends due pings and drives the dual-stream sub-engine. */
    void tick(SteadyTime now);

    /** @brief True if a ping has gone unanswered for longer than the probe timeout. */
    bool probe_timed_out(SteadyTime now) const;

    // --- Local actions ---
    void play();
    void pause();
    void seek(double position);
    void set_item(const MediaItem& item);
    void report_item_ended();
    void queue_add(const MediaItem& item);
    void queue_remove(int index);
    void queue_reorder(int old_index, int new_index);
    void queue_pin(int index);
    void queue_play(int index);
    void promote(const std::string& target, RoomRole role);
    void toggle_permanent();

    /**
     * @brief Reloads the current dual-stream item with the video rendition of `height`.
     * @details Position and play state are carried over.
     * @return false if the item is not dual-stream or has no such quality.
     */
    bool switch_quality(int height);

    void set_volume(double volume);
    void set_muted(bool muted);
    void set_visibility(bool visible);
    void on_primary_event(PrimaryEvent event, SteadyTime now);

    // --- Observation ---
    const RoomView& view() const { return view_; }
    const LatencyEstimator& latency() const { return latency_; }
    const DriftCorrectionEngine& drift() const { return drift_; }
    const DualStreamSync* dual_stream() const { return target_ && target_ == dual_.get() ? dual_.get() : nullptr; }
    IPlaybackTarget* target() const { return target_; }
    uint64_t skipped_heartbeats() const { return skipped_heartbeats_; }

private:
    bool send(protocol::MessageType type, const Json::Value& payload = Json::Value(Json::objectValue));
    void send_position_command(protocol::MessageType type);
    void send_ping(SteadyTime now);

    void handle_sync(const Json::Value& payload);
    void handle_set_item(const Json::Value& payload);
    void handle_command(protocol::MessageType type, const Json::Value& payload);
    void handle_heartbeat(const Json::Value& payload);
    void handle_pong(const Json::Value& payload, SteadyTime now);
    void update_roles(const Json::Value& roles);

    void load_item(const std::optional<MediaItem>& item);
    bool load_resolved(const ResolvedMedia& media);
    void unload_media();
    void raise_notice(const std::string& message);

    static double monotonic_ms(SteadyTime now);

    std::shared_ptr<SyncEngineSettings> settings_;
    IMediaResolver* resolver_;
    IPlayerHost* host_;
    IQualitySwitchNotifier* quality_notifier_;

    SendFunction sender_;
    NoticeCallback notice_callback_;

    RoomView view_;
    LatencyEstimator latency_;
    DriftCorrectionEngine drift_;
    std::shared_ptr<DualStreamSync> dual_;
    std::shared_ptr<SingleStreamTarget> single_;
    IPlaybackTarget* target_ = nullptr;
    bool media_loaded_ = false;
    bool visible_ = true;

    bool connected_ = false;
    bool connected_before_ = false;
    std::optional<SteadyTime> next_ping_at_;
    std::optional<SteadyTime> probe_sent_at_;
    uint64_t skipped_heartbeats_ = 0;
};

} // namespace engine
} // namespace syncroom

#endif // ROOM_SYNC_SESSION_H
