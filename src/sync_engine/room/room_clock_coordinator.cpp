#include "room_clock_coordinator.h"
#include "../protocol/sync_messages.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace syncroom {
namespace engine {

using protocol::MessageType;
using protocol::encode_envelope;

namespace {

Json::Value build_sync_payload(const RoomSnapshot& snap, const std::string& identity) {
    Json::Value payload(Json::objectValue);
    payload["timestamp"] = snap.position;
    payload["is_playing"] = snap.is_playing;
    payload["is_live"] = snap.is_live;
    payload["item"] = snap.current_item ? protocol::media_item_to_json(*snap.current_item) : Json::Value();
    payload["queue"] = protocol::queue_to_json(snap.queue);
    payload["playing_index"] = snap.playing_index;
    payload["members"] = protocol::strings_to_json(snap.members);
    payload["roles"] = protocol::roles_to_json(snap.roles);
    payload["permanent"] = snap.permanent;
    payload["your_identity"] = identity;
    auto role = snap.roles.find(identity);
    payload["your_role"] = room_role_name(role != snap.roles.end() ? role->second : RoomRole::User);
    return payload;
}

bool valid_index(int index, const std::vector<MediaItem>& queue) {
    return index >= 0 && static_cast<std::size_t>(index) < queue.size();
}

} // anonymous namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

RoomClockCoordinator::RoomClockCoordinator(std::shared_ptr<SyncEngineSettings> settings,
                                           TimeSource time_source)
    : settings_(settings ? std::move(settings) : std::make_shared<SyncEngineSettings>()),
      time_source_(std::move(time_source)) {
    LOG_CPP_INFO("[RoomClockCoordinator] Initialized (tolerance=%.3fs, exclude_originator=%d)",
                 settings_->room_clock.position_change_tolerance_sec,
                 settings_->room_clock.exclude_originator_from_commands ? 1 : 0);
}

RoomClockCoordinator::~RoomClockCoordinator() {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    LOG_CPP_DEBUG("[RoomClockCoordinator] Destroyed with %zu rooms.", rooms_.size());
}

void RoomClockCoordinator::set_room_lifecycle_callbacks(RoomCallback on_created, RoomCallback on_removed) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_room_created_ = std::move(on_created);
    on_room_removed_ = std::move(on_removed);
}

SteadyTime RoomClockCoordinator::now() const {
    return time_source_ ? time_source_() : std::chrono::steady_clock::now();
}

// ============================================================================
// Registry
// ============================================================================

std::shared_ptr<RoomClockCoordinator::RoomRecord>
RoomClockCoordinator::find_room(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(room_id);
    return it != rooms_.end() ? it->second : nullptr;
}

std::shared_ptr<RoomClockCoordinator::RoomRecord>
RoomClockCoordinator::get_or_create_room(const std::string& room_id, const std::string& identity, bool* created) {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        auto room = std::make_shared<RoomRecord>();
        SteadyTime t = now();
        room->authority.room_id = room_id;
        room->authority.last_mutation_time = t;
        room->authority.empty_since = t;
        room->authority.roles[identity] = RoomRole::Admin;
        rooms_[room_id] = room;
        if (created) *created = true;
        LOG_CPP_INFO("[RoomClockCoordinator] Created room '%s' (admin '%s').", room_id.c_str(), identity.c_str());
        return room;
    }

    auto room = it->second;
    std::lock_guard<std::mutex> room_lock(room->mutex);
    auto& roles = room->authority.roles;
    if (roles.find(identity) == roles.end()) {
        roles[identity] = roles.empty() ? RoomRole::Admin : RoomRole::User;
    }
    if (created) *created = false;
    return room;
}

bool RoomClockCoordinator::ensure_room(const std::string& room_id, const std::string& identity) {
    bool created = false;
    get_or_create_room(room_id, identity, &created);
    if (created) {
        RoomCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = on_room_created_;
        }
        if (callback) callback(room_id);
    }
    return created;
}

std::vector<std::string> RoomClockCoordinator::room_ids() const {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    std::vector<std::string> ids;
    ids.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) {
        ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// Locked helpers
// ============================================================================

RoomClockCoordinator::ConnectionList
RoomClockCoordinator::collect_targets(const RoomRecord& room, const std::string& exclude_id) {
    ConnectionList targets;
    targets.reserve(room.connections.size());
    for (const auto& [id, conn] : room.connections) {
        if (!exclude_id.empty() && id == exclude_id) {
            continue;
        }
        targets.push_back(conn);
    }
    return targets;
}

std::vector<std::string> RoomClockCoordinator::member_list(const RoomRecord& room) {
    std::set<std::string> unique;
    for (const auto& [id, conn] : room.connections) {
        unique.insert(conn->identity());
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

RoomSnapshot RoomClockCoordinator::snapshot_locked(const RoomRecord& room, SteadyTime t) const {
    const RoomAuthority& a = room.authority;
    RoomSnapshot snap;
    snap.room_id = a.room_id;
    snap.is_playing = a.is_playing;
    snap.position = a.extrapolated_position(t);
    snap.is_live = a.current_item_is_live();
    snap.current_item = a.current_item;
    snap.queue = a.queue;
    snap.playing_index = a.playing_index;
    snap.roles = a.roles;
    snap.permanent = a.permanent;
    snap.members = member_list(room);
    snap.connection_count = room.connections.size();
    snap.captured_at = t;
    snap.last_mutation_time = a.last_mutation_time;
    return snap;
}

bool RoomClockCoordinator::apply_playback_op(RoomAuthority& a, const PlaybackOp& op, SteadyTime t) const {
    const double tolerance = settings_->room_clock.position_change_tolerance_sec;
    const double target = std::max(0.0, op.position);
    const double current = a.extrapolated_position(t);
    const bool moved = std::fabs(target - current) > tolerance;

    switch (op.kind) {
        case PlaybackOpKind::Play:
        case PlaybackOpKind::Pause: {
            const bool want_playing = op.kind == PlaybackOpKind::Play;
            if (a.is_playing == want_playing && !moved) {
                return false;
            }
            a.is_playing = want_playing;
            a.position = target;
            a.last_mutation_time = t;
            return true;
        }
        case PlaybackOpKind::Seek:
            if (!moved) {
                return false;
            }
            a.position = target;
            a.last_mutation_time = t;
            return true;
        case PlaybackOpKind::SetItem:
            a.queue.insert(a.queue.begin(), op.item);
            a.current_item = op.item;
            a.playing_index = 0;
            a.position = 0.0;
            a.is_playing = true;
            a.last_mutation_time = t;
            return true;
    }
    return false;
}

bool RoomClockCoordinator::advance_locked(RoomAuthority& a, SteadyTime t) const {
    auto& queue = a.queue;
    const int playing = a.playing_index;

    bool was_pinned = false;
    if (valid_index(playing, queue)) {
        was_pinned = queue[playing].pinned;
        if (!was_pinned) {
            queue.erase(queue.begin() + playing);
        }
    }

    int next = -1;
    if (was_pinned) {
        next = (playing + 1 < static_cast<int>(queue.size())) ? playing + 1 : 0;
    } else if (!queue.empty()) {
        next = std::min(playing, static_cast<int>(queue.size()) - 1);
    }

    a.position = 0.0;
    a.last_mutation_time = t;
    if (!queue.empty() && next >= 0) {
        a.current_item = queue[next];
        a.playing_index = next;
        a.is_playing = true;
    } else {
        a.current_item.reset();
        a.playing_index = -1;
        a.is_playing = false;
    }
    return true;
}

std::string RoomClockCoordinator::encode_set_item(const RoomAuthority& a, SteadyTime t) const {
    Json::Value payload(Json::objectValue);
    payload["item"] = a.current_item ? protocol::media_item_to_json(*a.current_item) : Json::Value();
    payload["queue"] = protocol::queue_to_json(a.queue);
    payload["playing_index"] = a.playing_index;
    payload["timestamp"] = a.extrapolated_position(t);
    payload["is_playing"] = a.is_playing;
    return encode_envelope(MessageType::SetItem, payload);
}

std::string RoomClockCoordinator::encode_queue_update(const RoomAuthority& a) const {
    Json::Value payload(Json::objectValue);
    payload["queue"] = protocol::queue_to_json(a.queue);
    payload["playing_index"] = a.playing_index;
    return encode_envelope(MessageType::QueueUpdate, payload);
}

// ============================================================================
// Fan-out
// ============================================================================

std::vector<std::string> RoomClockCoordinator::deliver(const ConnectionList& targets, const std::string& text) {
    std::vector<std::string> dead;
    for (const auto& conn : targets) {
        bool ok = false;
        try {
            ok = conn->send(text);
        } catch (const std::exception& e) {
            LOG_CPP_WARNING("[RoomClockCoordinator] Send to connection '%s' threw: %s", conn->id().c_str(), e.what());
            ok = false;
        }
        if (!ok) {
            dead.push_back(conn->id());
        }
    }
    return dead;
}

void RoomClockCoordinator::remove_dead_connections(const std::string& room_id,
                                                   const std::shared_ptr<RoomRecord>& room,
                                                   std::vector<std::string> dead_ids) {
    while (!dead_ids.empty()) {
        ConnectionList removed;
        ConnectionList targets;
        std::string text;
        {
            std::lock_guard<std::mutex> lock(room->mutex);
            for (const auto& id : dead_ids) {
                auto it = room->connections.find(id);
                if (it != room->connections.end()) {
                    removed.push_back(it->second);
                    room->connections.erase(it);
                }
            }
            if (removed.empty()) {
                return;
            }
            if (room->connections.empty()) {
                room->authority.empty_since = now();
            }
            Json::Value payload(Json::objectValue);
            payload["members"] = protocol::strings_to_json(member_list(*room));
            text = encode_envelope(MessageType::UserLeft, payload);
            targets = collect_targets(*room, "");
        }

        dead_connections_removed_ += removed.size();
        for (const auto& conn : removed) {
            LOG_CPP_WARNING("[RoomClockCoordinator] Removed dead connection '%s' (%s) from room '%s'.",
                            conn->id().c_str(), conn->identity().c_str(), room_id.c_str());
            conn->close();
        }

        dead_ids = deliver(targets, text);
        broadcasts_sent_++;
    }
}

bool RoomClockCoordinator::mutate_and_broadcast(
    const std::string& room_id,
    const std::function<bool(RoomRecord&, SteadyTime, std::string&)>& apply,
    const std::string& exclude_id) {
    auto room = find_room(room_id);
    if (!room) {
        LOG_CPP_WARNING("[RoomClockCoordinator] Unknown room '%s'.", room_id.c_str());
        return false;
    }

    std::unique_lock<std::mutex> fanout(room->fanout_mutex);
    std::string text;
    ConnectionList targets;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        if (room->removed || !apply(*room, now(), text)) {
            return false;
        }
        targets = collect_targets(*room, exclude_id);
    }

    auto dead = deliver(targets, text);
    broadcasts_sent_++;
    fanout.unlock();

    if (!dead.empty()) {
        remove_dead_connections(room_id, room, std::move(dead));
    }
    return true;
}

// ============================================================================
// Membership
// ============================================================================

bool RoomClockCoordinator::join(const std::string& room_id, std::shared_ptr<IRoomConnection> connection) {
    if (!connection) {
        LOG_CPP_ERROR("[RoomClockCoordinator] join called with null connection for room '%s'.", room_id.c_str());
        return false;
    }
    const std::string& identity = connection->identity();

    std::shared_ptr<RoomRecord> room;
    std::unique_lock<std::mutex> fanout;
    std::string sync_text;
    std::string joined_text;
    ConnectionList targets;

    while (true) {
        ensure_room(room_id, identity);
        room = find_room(room_id);
        if (!room) {
            continue; // Removed between create and lookup.
        }
        fanout = std::unique_lock<std::mutex>(room->fanout_mutex);
        std::lock_guard<std::mutex> lock(room->mutex);
        if (room->removed) {
            fanout.unlock();
            continue;
        }
        if (room->connections.count(connection->id())) {
            LOG_CPP_WARNING("[RoomClockCoordinator] Connection '%s' already joined room '%s'.",
                            connection->id().c_str(), room_id.c_str());
            return false;
        }

        room->connections[connection->id()] = connection;
        room->authority.empty_since.reset();
        auto& roles = room->authority.roles;
        if (roles.find(identity) == roles.end()) {
            roles[identity] = roles.empty() ? RoomRole::Admin : RoomRole::User;
        }

        RoomSnapshot snap = snapshot_locked(*room, now());
        sync_text = encode_envelope(MessageType::Sync, build_sync_payload(snap, identity));

        Json::Value joined(Json::objectValue);
        joined["identity"] = identity;
        joined["members"] = protocol::strings_to_json(snap.members);
        joined["roles"] = protocol::roles_to_json(snap.roles);
        joined_text = encode_envelope(MessageType::UserJoined, joined);
        targets = collect_targets(*room, "");
        break;
    }

    LOG_CPP_INFO("[RoomClockCoordinator] '%s' joined room '%s' (connection %s).",
                 identity.c_str(), room_id.c_str(), connection->id().c_str());

    auto dead = deliver({connection}, sync_text);
    auto dead_broadcast = deliver(targets, joined_text);
    broadcasts_sent_++;
    fanout.unlock();

    for (const auto& id : dead_broadcast) {
        if (std::find(dead.begin(), dead.end(), id) == dead.end()) {
            dead.push_back(id);
        }
    }
    if (!dead.empty()) {
        remove_dead_connections(room_id, room, std::move(dead));
    }
    return true;
}

bool RoomClockCoordinator::leave(const std::string& room_id, const std::string& connection_id) {
    auto room = find_room(room_id);
    if (!room) {
        return false;
    }

    std::unique_lock<std::mutex> fanout(room->fanout_mutex);
    std::string text;
    ConnectionList targets;
    std::string identity;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        auto it = room->connections.find(connection_id);
        if (it == room->connections.end()) {
            return false;
        }
        identity = it->second->identity();
        room->connections.erase(it);
        if (room->connections.empty()) {
            room->authority.empty_since = now();
        }
        Json::Value payload(Json::objectValue);
        payload["members"] = protocol::strings_to_json(member_list(*room));
        text = encode_envelope(MessageType::UserLeft, payload);
        targets = collect_targets(*room, "");
    }

    LOG_CPP_INFO("[RoomClockCoordinator] '%s' left room '%s' (connection %s).",
                 identity.c_str(), room_id.c_str(), connection_id.c_str());

    auto dead = deliver(targets, text);
    broadcasts_sent_++;
    fanout.unlock();
    if (!dead.empty()) {
        remove_dead_connections(room_id, room, std::move(dead));
    }
    return true;
}

// ============================================================================
// Playback clock
// ============================================================================

bool RoomClockCoordinator::mutate(const std::string& room_id, const PlaybackOp& op, const std::string& originator_id) {
    // A new item is not applied locally by its sender; it needs the server's queue.
    const bool exclude_originator = settings_->room_clock.exclude_originator_from_commands &&
                                    op.kind != PlaybackOpKind::SetItem;
    const std::string exclude = exclude_originator ? originator_id : std::string();

    return mutate_and_broadcast(room_id, [this, &op](RoomRecord& room, SteadyTime t, std::string& text) {
        RoomAuthority& a = room.authority;
        if (apply_playback_op(a, op, t)) {
            mutations_applied_++;
        }

        switch (op.kind) {
            case PlaybackOpKind::Play:
                text = encode_envelope(MessageType::Play,
                                       protocol::make_position_payload(a.extrapolated_position(t), a.current_item_is_live()));
                break;
            case PlaybackOpKind::Pause:
                text = encode_envelope(MessageType::Pause,
                                       protocol::make_position_payload(a.extrapolated_position(t), a.current_item_is_live()));
                break;
            case PlaybackOpKind::Seek:
                text = encode_envelope(MessageType::Seek,
                                       protocol::make_position_payload(a.extrapolated_position(t), a.current_item_is_live()));
                break;
            case PlaybackOpKind::SetItem:
                text = encode_set_item(a, t);
                break;
        }
        LOG_CPP_DEBUG("[RoomClockCoordinator] Room '%s': op=%d playing=%d position=%.3f",
                      a.room_id.c_str(), static_cast<int>(op.kind), a.is_playing ? 1 : 0, a.position);
        return true;
    }, exclude);
}

bool RoomClockCoordinator::advance(const std::string& room_id, const std::string& ended_item_id) {
    return mutate_and_broadcast(room_id, [this, &ended_item_id](RoomRecord& room, SteadyTime t, std::string& text) {
        RoomAuthority& a = room.authority;
        if (!ended_item_id.empty() && (!a.current_item || a.current_item->id != ended_item_id)) {
            LOG_CPP_DEBUG("[RoomClockCoordinator] Room '%s': ignoring stale end of '%s'.",
                          a.room_id.c_str(), ended_item_id.c_str());
            return false;
        }
        advance_locked(a, t);
        mutations_applied_++;
        text = encode_set_item(a, t);
        LOG_CPP_INFO("[RoomClockCoordinator] Room '%s' advanced to index %d.", a.room_id.c_str(), a.playing_index);
        return true;
    }, "");
}

bool RoomClockCoordinator::heartbeat(const std::string& room_id) {
    auto room = find_room(room_id);
    if (!room) {
        return false;
    }

    std::string text;
    ConnectionList targets;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        const RoomAuthority& a = room->authority;
        if (room->removed || !a.is_playing || room->connections.empty()) {
            return false;
        }
        text = encode_envelope(MessageType::Heartbeat,
                               protocol::make_heartbeat_payload(a.extrapolated_position(now()), true,
                                                                protocol::wall_clock_ms()));
        targets = collect_targets(*room, "");
    }

    auto dead = deliver(targets, text);
    heartbeats_sent_++;
    if (!dead.empty()) {
        remove_dead_connections(room_id, room, std::move(dead));
    }
    return true;
}

std::optional<RoomSnapshot> RoomClockCoordinator::snapshot(const std::string& room_id) const {
    auto room = find_room(room_id);
    if (!room) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(room->mutex);
    return snapshot_locked(*room, now());
}

bool RoomClockCoordinator::send_snapshot(const std::string& room_id, const std::string& connection_id) {
    auto room = find_room(room_id);
    if (!room) {
        return false;
    }

    std::shared_ptr<IRoomConnection> target;
    std::string text;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        auto it = room->connections.find(connection_id);
        if (it == room->connections.end()) {
            return false;
        }
        target = it->second;
        text = encode_envelope(MessageType::Sync, build_sync_payload(snapshot_locked(*room, now()), target->identity()));
    }

    auto dead = deliver({target}, text);
    if (!dead.empty()) {
        remove_dead_connections(room_id, room, std::move(dead));
        return false;
    }
    return true;
}

// ============================================================================
// Queue
// ============================================================================

bool RoomClockCoordinator::queue_add(const std::string& room_id, MediaItem item) {
    return mutate_and_broadcast(room_id, [this, &item](RoomRecord& room, SteadyTime, std::string& text) {
        room.authority.queue.push_back(item);
        text = encode_queue_update(room.authority);
        return true;
    }, "");
}

bool RoomClockCoordinator::queue_remove(const std::string& room_id, int index) {
    return mutate_and_broadcast(room_id, [this, index](RoomRecord& room, SteadyTime, std::string& text) {
        RoomAuthority& a = room.authority;
        if (!valid_index(index, a.queue) || index == a.playing_index) {
            return false;
        }
        a.queue.erase(a.queue.begin() + index);
        if (a.playing_index > index) {
            a.playing_index--;
        }
        text = encode_queue_update(a);
        return true;
    }, "");
}

bool RoomClockCoordinator::queue_reorder(const std::string& room_id, int old_index, int new_index) {
    return mutate_and_broadcast(room_id, [this, old_index, new_index](RoomRecord& room, SteadyTime, std::string& text) {
        RoomAuthority& a = room.authority;
        if (!valid_index(old_index, a.queue) || !valid_index(new_index, a.queue)) {
            return false;
        }
        MediaItem moved = a.queue[old_index];
        a.queue.erase(a.queue.begin() + old_index);
        a.queue.insert(a.queue.begin() + new_index, std::move(moved));

        const int playing = a.playing_index;
        if (playing == old_index) {
            a.playing_index = new_index;
        } else if (old_index < playing && playing <= new_index) {
            a.playing_index = playing - 1;
        } else if (new_index <= playing && playing < old_index) {
            a.playing_index = playing + 1;
        }
        text = encode_queue_update(a);
        return true;
    }, "");
}

bool RoomClockCoordinator::queue_toggle_pin(const std::string& room_id, int index) {
    return mutate_and_broadcast(room_id, [this, index](RoomRecord& room, SteadyTime, std::string& text) {
        RoomAuthority& a = room.authority;
        if (!valid_index(index, a.queue)) {
            return false;
        }
        a.queue[index].pinned = !a.queue[index].pinned;
        if (index == a.playing_index && a.current_item) {
            a.current_item->pinned = a.queue[index].pinned;
        }
        text = encode_queue_update(a);
        return true;
    }, "");
}

bool RoomClockCoordinator::queue_play(const std::string& room_id, int index) {
    return mutate_and_broadcast(room_id, [this, index](RoomRecord& room, SteadyTime t, std::string& text) {
        RoomAuthority& a = room.authority;
        if (!valid_index(index, a.queue)) {
            return false;
        }
        int target = index;
        const int old_playing = a.playing_index;
        if (old_playing != target && valid_index(old_playing, a.queue) && !a.queue[old_playing].pinned) {
            a.queue.erase(a.queue.begin() + old_playing);
            if (target > old_playing) {
                target--;
            }
        }
        a.current_item = a.queue[target];
        a.playing_index = target;
        a.position = 0.0;
        a.is_playing = true;
        a.last_mutation_time = t;
        mutations_applied_++;
        text = encode_set_item(a, t);
        return true;
    }, "");
}

// ============================================================================
// Roles and settings
// ============================================================================

bool RoomClockCoordinator::promote(const std::string& room_id, const std::string& requester,
                                   const std::string& target, RoomRole role) {
    return mutate_and_broadcast(room_id, [&](RoomRecord& room, SteadyTime, std::string& text) {
        auto& roles = room.authority.roles;
        auto it = roles.find(requester);
        if (it == roles.end() || it->second != RoomRole::Admin || target.empty()) {
            LOG_CPP_WARNING("[RoomClockCoordinator] Room '%s': '%s' may not promote '%s'.",
                            room_id.c_str(), requester.c_str(), target.c_str());
            return false;
        }
        roles[target] = role;
        Json::Value payload(Json::objectValue);
        payload["roles"] = protocol::roles_to_json(roles);
        text = encode_envelope(MessageType::RolesUpdate, payload);
        LOG_CPP_INFO("[RoomClockCoordinator] Room '%s': '%s' is now %s.",
                     room_id.c_str(), target.c_str(), room_role_name(role));
        return true;
    }, "");
}

bool RoomClockCoordinator::toggle_permanent(const std::string& room_id, const std::string& requester) {
    return mutate_and_broadcast(room_id, [&](RoomRecord& room, SteadyTime, std::string& text) {
        RoomAuthority& a = room.authority;
        auto it = a.roles.find(requester);
        if (it == a.roles.end() || it->second != RoomRole::Admin) {
            LOG_CPP_WARNING("[RoomClockCoordinator] Room '%s': '%s' may not change settings.",
                            room_id.c_str(), requester.c_str());
            return false;
        }
        a.permanent = !a.permanent;
        Json::Value payload(Json::objectValue);
        payload["permanent"] = a.permanent;
        text = encode_envelope(MessageType::RoomSettingsUpdate, payload);
        return true;
    }, "");
}

// ============================================================================
// Housekeeping
// ============================================================================

std::vector<std::string> RoomClockCoordinator::cleanup_stale_rooms(double ttl_sec) {
    std::vector<std::string> removed;
    const SteadyTime t = now();
    {
        std::lock_guard<std::mutex> lock(rooms_mutex_);
        for (auto it = rooms_.begin(); it != rooms_.end();) {
            auto& room = it->second;
            std::lock_guard<std::mutex> room_lock(room->mutex);
            const RoomAuthority& a = room->authority;
            bool stale = false;
            if (room->connections.empty() && !a.permanent && a.empty_since) {
                std::chrono::duration<double> empty_for = t - *a.empty_since;
                stale = empty_for.count() > ttl_sec;
            }
            if (stale) {
                room->removed = true;
                removed.push_back(it->first);
                it = rooms_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!removed.empty()) {
        RoomCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = on_room_removed_;
        }
        for (const auto& id : removed) {
            LOG_CPP_INFO("[RoomClockCoordinator] Cleaned up stale room '%s'.", id.c_str());
            if (callback) callback(id);
        }
    }
    return removed;
}

CoordinatorStats RoomClockCoordinator::stats() const {
    CoordinatorStats s;
    {
        std::lock_guard<std::mutex> lock(rooms_mutex_);
        s.room_count = rooms_.size();
        for (const auto& [id, room] : rooms_) {
            std::lock_guard<std::mutex> room_lock(room->mutex);
            s.connection_count += room->connections.size();
        }
    }
    s.mutations_applied = mutations_applied_.load();
    s.broadcasts_sent = broadcasts_sent_.load();
    s.heartbeats_sent = heartbeats_sent_.load();
    s.dead_connections_removed = dead_connections_removed_.load();
    return s;
}

} // namespace engine
} // namespace syncroom
