#include "room_sync_session.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <stdexcept>

namespace syncroom {
namespace engine {

using protocol::MessageType;

RoomSyncSession::RoomSyncSession(std::shared_ptr<SyncEngineSettings> settings,
                                 IMediaResolver* resolver,
                                 IPlayerHost* host,
                                 IQualitySwitchNotifier* quality_notifier)
    : settings_(settings ? std::move(settings) : std::make_shared<SyncEngineSettings>()),
      resolver_(resolver),
      host_(host),
      quality_notifier_(quality_notifier),
      latency_(settings_->latency.smoothing_factor),
      drift_(nullptr, settings_->drift_correction),
      dual_(std::make_shared<DualStreamSync>(settings_->dual_stream)) {
    if (!resolver_ || !host_) {
        throw std::invalid_argument("RoomSyncSession requires a resolver and a player host");
    }
}

RoomSyncSession::~RoomSyncSession() {
    unload_media();
}

void RoomSyncSession::set_notice_callback(NoticeCallback callback) {
    notice_callback_ = std::move(callback);
    dual_->set_notice_callback(notice_callback_);
    if (single_) {
        single_->set_notice_callback(notice_callback_);
    }
}

double RoomSyncSession::monotonic_ms(SteadyTime now) {
    return std::chrono::duration<double, std::milli>(now.time_since_epoch()).count();
}

void RoomSyncSession::raise_notice(const std::string& message) {
    if (notice_callback_) {
        notice_callback_(message);
    }
}

bool RoomSyncSession::send(MessageType type, const Json::Value& payload) {
    if (!sender_ || !connected_) {
        LOG_CPP_DEBUG("[RoomSyncSession] Not connected, '%s' not sent.", protocol::message_type_name(type));
        return false;
    }
    return sender_(protocol::encode_envelope(type, payload));
}

// ============================================================================
// Transport events
// ============================================================================

void RoomSyncSession::on_connected(SteadyTime now) {
    connected_ = true;
    probe_sent_at_.reset();
    LOG_CPP_INFO("[RoomSyncSession] Connected.");

    // Joining yields a snapshot. Reconnects also ask for one explicitly.
    if (connected_before_) {
        send(MessageType::SyncRequest);
    }
    connected_before_ = true;
    send_ping(now);
}

void RoomSyncSession::on_disconnected() {
    connected_ = false;
    probe_sent_at_.reset();
    next_ping_at_.reset();
    LOG_CPP_INFO("[RoomSyncSession] Disconnected.");
}

void RoomSyncSession::send_ping(SteadyTime now) {
    next_ping_at_ = now + std::chrono::milliseconds(settings_->latency.ping_interval_ms);
    if (!probe_sent_at_) {
        probe_sent_at_ = now;
    }
    send(MessageType::Ping, protocol::make_ping_payload(monotonic_ms(now)));
}

bool RoomSyncSession::probe_timed_out(SteadyTime now) const {
    return connected_ && probe_sent_at_ &&
           now - *probe_sent_at_ > std::chrono::milliseconds(settings_->latency.probe_timeout_ms);
}

void RoomSyncSession::tick(SteadyTime now) {
    if (connected_ && next_ping_at_ && now >= *next_ping_at_) {
        send_ping(now);
    }
    if (target_ && target_ == dual_.get()) {
        dual_->tick(now);
    }
}

void RoomSyncSession::handle_message(const std::string& text, SteadyTime now) {
    auto envelope = protocol::decode_envelope(text);
    if (!envelope) {
        return;
    }

    const Json::Value& payload = envelope->payload;
    switch (envelope->type) {
        case MessageType::Sync:
            handle_sync(payload);
            break;
        case MessageType::SetItem:
            handle_set_item(payload);
            break;
        case MessageType::Play:
        case MessageType::Pause:
        case MessageType::Seek:
            handle_command(envelope->type, payload);
            break;
        case MessageType::Heartbeat:
            handle_heartbeat(payload);
            break;
        case MessageType::Pong:
            handle_pong(payload, now);
            break;
        case MessageType::QueueUpdate:
            view_.queue = protocol::queue_from_json(payload["queue"]);
            view_.playing_index = protocol::get_int(payload, "playing_index", view_.playing_index);
            break;
        case MessageType::UserJoined:
            view_.members = protocol::strings_from_json(payload["members"]);
            if (payload.isMember("roles")) {
                update_roles(payload["roles"]);
            }
            LOG_CPP_INFO("[RoomSyncSession] '%s' joined.", protocol::get_string(payload, "identity").c_str());
            break;
        case MessageType::UserLeft:
            view_.members = protocol::strings_from_json(payload["members"]);
            break;
        case MessageType::RolesUpdate:
            update_roles(payload["roles"]);
            break;
        case MessageType::RoomSettingsUpdate:
            view_.permanent = protocol::get_bool(payload, "permanent", view_.permanent);
            break;
        default:
            LOG_CPP_DEBUG("[RoomSyncSession] Ignoring '%s'.", envelope->type_name.c_str());
            break;
    }
}

// ============================================================================
// Server messages
// ============================================================================

void RoomSyncSession::update_roles(const Json::Value& roles) {
    view_.roles = protocol::roles_from_json(roles);
    auto it = view_.roles.find(view_.identity);
    if (it != view_.roles.end()) {
        view_.role = it->second;
    }
}

void RoomSyncSession::handle_sync(const Json::Value& payload) {
    view_.identity = protocol::get_string(payload, "your_identity", view_.identity);
    if (auto role = parse_room_role(protocol::get_string(payload, "your_role"))) {
        view_.role = *role;
    }
    view_.members = protocol::strings_from_json(payload["members"]);
    view_.roles = protocol::roles_from_json(payload["roles"]);
    view_.queue = protocol::queue_from_json(payload["queue"]);
    view_.playing_index = protocol::get_int(payload, "playing_index", -1);
    view_.permanent = protocol::get_bool(payload, "permanent");
    view_.is_playing = protocol::get_bool(payload, "is_playing");

    auto item = protocol::media_item_from_json(payload["item"]);
    load_item(item);

    const bool is_live = protocol::get_bool(payload, "is_live", item && item->is_live);
    const double timestamp = protocol::get_number(payload, "timestamp");
    LOG_CPP_INFO("[RoomSyncSession] Snapshot: %s at %.3f (%s), %zu queued.",
                 item ? item->id.c_str() : "<none>", timestamp,
                 view_.is_playing ? "playing" : "paused", view_.queue.size());
    drift_.apply_snapshot(view_.is_playing, timestamp, is_live);
}

void RoomSyncSession::handle_set_item(const Json::Value& payload) {
    view_.queue = protocol::queue_from_json(payload["queue"]);
    view_.playing_index = protocol::get_int(payload, "playing_index", -1);
    view_.is_playing = protocol::get_bool(payload, "is_playing");

    auto item = protocol::media_item_from_json(payload["item"]);
    load_item(item);
    if (item) {
        drift_.apply_snapshot(view_.is_playing, protocol::get_number(payload, "timestamp"), item->is_live);
    }
}

void RoomSyncSession::handle_command(MessageType type, const Json::Value& payload) {
    PlaybackCommand command;
    command.position = protocol::get_number(payload, "timestamp");
    command.is_live = protocol::get_bool(payload, "is_live");
    switch (type) {
        case MessageType::Play:
            command.kind = PlaybackCommandKind::Play;
            view_.is_playing = true;
            break;
        case MessageType::Pause:
            command.kind = PlaybackCommandKind::Pause;
            view_.is_playing = false;
            break;
        default:
            command.kind = PlaybackCommandKind::Seek;
            break;
    }
    drift_.on_command(command);
}

void RoomSyncSession::handle_heartbeat(const Json::Value& payload) {
    if (target_ && target_ == dual_.get() && dual_->state().is_syncing) {
        skipped_heartbeats_++;
        return;
    }
    drift_.on_heartbeat(protocol::get_number(payload, "timestamp"),
                        protocol::get_bool(payload, "is_playing"),
                        latency_.latency_sec());
}

void RoomSyncSession::handle_pong(const Json::Value& payload, SteadyTime now) {
    const Json::Value& client_time = payload["client_time"];
    if (!client_time.isNumeric()) {
        LOG_CPP_WARNING("[RoomSyncSession] Pong without client_time.");
        return;
    }
    probe_sent_at_.reset();
    latency_.add_sample(monotonic_ms(now) - client_time.asDouble());
}

// ============================================================================
// Media loading
// ============================================================================

void RoomSyncSession::load_item(const std::optional<MediaItem>& item) {
    if (!item) {
        unload_media();
        view_.current_item.reset();
        view_.resolved.reset();
        view_.active_quality.reset();
        return;
    }

    if (view_.current_item && view_.current_item->id == item->id && media_loaded_) {
        view_.current_item = item;
        return;
    }

    unload_media();
    view_.current_item = item;
    view_.resolved.reset();
    view_.active_quality.reset();

    auto resolved = resolver_->resolve(*item);
    if (!resolved) {
        LOG_CPP_ERROR("[RoomSyncSession] Could not resolve '%s'.", item->id.c_str());
        raise_notice("Could not load \"" + (item->title.empty() ? item->id : item->title) + "\".");
        return;
    }
    if (load_resolved(*resolved)) {
        view_.resolved = std::move(resolved);
    }
}

bool RoomSyncSession::load_resolved(const ResolvedMedia& media) {
    LoadedMedia loaded = host_->load(media);
    if (!loaded.primary) {
        LOG_CPP_ERROR("[RoomSyncSession] Player host failed to load media.");
        host_->unload();
        return false;
    }
    media_loaded_ = true;

    if (media.stream_type == StreamType::Dual) {
        if (!dual_->attach(loaded.primary, loaded.secondary)) {
            unload_media();
            return false;
        }
        dual_->on_visibility_changed(visible_);
        target_ = dual_.get();
    } else {
        single_ = std::make_shared<SingleStreamTarget>(loaded.primary);
        single_->set_notice_callback(notice_callback_);
        target_ = single_.get();
    }
    drift_.set_target(target_);
    LOG_CPP_INFO("[RoomSyncSession] Loaded %s media.", stream_type_name(media.stream_type));
    return true;
}

void RoomSyncSession::unload_media() {
    drift_.set_target(nullptr);
    target_ = nullptr;
    dual_->detach();
    single_.reset();
    if (media_loaded_) {
        host_->unload();
        media_loaded_ = false;
    }
}

bool RoomSyncSession::switch_quality(int height) {
    if (!view_.current_item || !view_.resolved || view_.resolved->stream_type != StreamType::Dual) {
        return false;
    }

    const QualityLevel* quality = nullptr;
    for (const auto& q : view_.resolved->available_qualities) {
        if (q.height == height) {
            quality = &q;
            break;
        }
    }
    if (!quality) {
        LOG_CPP_WARNING("[RoomSyncSession] No %dp rendition for '%s'.", height, view_.current_item->id.c_str());
        return false;
    }

    QualityLevel selected = *quality;
    if (quality_notifier_) {
        quality_notifier_->on_quality_switch(*view_.current_item, selected);
    }

    const double position = target_ ? target_->current_time() : 0.0;
    const bool was_playing = target_ && target_->is_playing();

    ResolvedMedia media = *view_.resolved;
    media.video_url = selected.video_url;
    unload_media();
    if (!load_resolved(media)) {
        view_.resolved.reset();
        view_.active_quality.reset();
        return false;
    }
    view_.resolved = media;
    view_.active_quality = selected;

    target_->seek(position);
    if (was_playing) {
        target_->play();
    }
    LOG_CPP_INFO("[RoomSyncSession] Switched to %dp at %.3f.", height, position);
    return true;
}

// ============================================================================
// Local actions
// ============================================================================

void RoomSyncSession::send_position_command(MessageType type) {
    const double position = target_ ? target_->current_time() : 0.0;
    const bool is_live = view_.current_item && view_.current_item->is_live;
    send(type, protocol::make_position_payload(position, is_live));
}

void RoomSyncSession::play() {
    view_.is_playing = true;
    if (target_) {
        target_->play();
    }
    send_position_command(MessageType::Play);
}

void RoomSyncSession::pause() {
    view_.is_playing = false;
    if (target_) {
        target_->pause();
    }
    send_position_command(MessageType::Pause);
}

void RoomSyncSession::seek(double position) {
    if (target_) {
        target_->seek(position);
    }
    const bool is_live = view_.current_item && view_.current_item->is_live;
    send(MessageType::Seek, protocol::make_position_payload(position < 0.0 ? 0.0 : position, is_live));
}

void RoomSyncSession::set_item(const MediaItem& item) {
    Json::Value payload(Json::objectValue);
    payload["item"] = protocol::media_item_to_json(item);
    send(MessageType::SetItem, payload);
}

void RoomSyncSession::report_item_ended() {
    if (!view_.current_item) {
        return;
    }
    Json::Value payload(Json::objectValue);
    payload["item_id"] = view_.current_item->id;
    send(MessageType::ItemEnded, payload);
}

void RoomSyncSession::queue_add(const MediaItem& item) {
    Json::Value payload(Json::objectValue);
    payload["item"] = protocol::media_item_to_json(item);
    send(MessageType::QueueAdd, payload);
}

void RoomSyncSession::queue_remove(int index) {
    Json::Value payload(Json::objectValue);
    payload["index"] = index;
    send(MessageType::QueueRemove, payload);
}

void RoomSyncSession::queue_reorder(int old_index, int new_index) {
    Json::Value payload(Json::objectValue);
    payload["old_index"] = old_index;
    payload["new_index"] = new_index;
    send(MessageType::QueueReorder, payload);
}

void RoomSyncSession::queue_pin(int index) {
    Json::Value payload(Json::objectValue);
    payload["index"] = index;
    send(MessageType::QueuePin, payload);
}

void RoomSyncSession::queue_play(int index) {
    Json::Value payload(Json::objectValue);
    payload["index"] = index;
    send(MessageType::QueuePlay, payload);
}

void RoomSyncSession::promote(const std::string& target, RoomRole role) {
    Json::Value payload(Json::objectValue);
    payload["target"] = target;
    payload["role"] = room_role_name(role);
    send(MessageType::Promote, payload);
}

void RoomSyncSession::toggle_permanent() {
    send(MessageType::TogglePermanent);
}

void RoomSyncSession::set_volume(double volume) {
    dual_->set_volume(volume);
    if (single_ && single_->element()) {
        single_->element()->set_volume(std::clamp(volume, 0.0, 1.0));
    }
}

void RoomSyncSession::set_muted(bool muted) {
    dual_->set_muted(muted);
    if (single_ && single_->element()) {
        single_->element()->set_muted(muted);
    }
}

void RoomSyncSession::set_visibility(bool visible) {
    visible_ = visible;
    dual_->on_visibility_changed(visible);
}

void RoomSyncSession::on_primary_event(PrimaryEvent event, SteadyTime now) {
    if (target_ && target_ == dual_.get()) {
        dual_->on_primary_event(event, now);
    }
    if (event == PrimaryEvent::Ended) {
        report_item_ended();
    }
}

} // namespace engine
} // namespace syncroom
