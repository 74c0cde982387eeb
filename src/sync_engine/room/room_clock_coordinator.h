/**
 * @file room_clock_coordinator.h
 * @brief Defines the RoomClockCoordinator, the server-side owner of every room's playback clock.
 * @details The coordinator keeps one `RoomAuthority` per room, applies playback and queue
 *          mutations under a per-room lock, and fans the result out to the room's connections.
 *
 *          Locking:
 *          - `rooms_mutex_` guards the registry. Room creation and the first joiner's admin role
 *            are assigned inside the same critical section.
 *          - Each room has a mutation lock guarding its authority and connection map. Snapshots
 *            are read under the same lock.
 *          - Each room has a fan-out lock held from before the mutation until its broadcast is
 *            delivered, so command broadcasts reach clients in mutation order. Heartbeats do not
 *            take it.
 *          Sends never happen while the mutation lock is held.
 */
#ifndef ROOM_CLOCK_COORDINATOR_H
#define ROOM_CLOCK_COORDINATOR_H

#include "room_authority.h"
#include "room_connection.h"
#include "../configuration/sync_engine_settings.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace syncroom {
namespace engine {

/**
 * @struct CoordinatorStats
 * @brief Counters exposed for monitoring.
 */
struct CoordinatorStats {
    std::size_t room_count = 0;
    std::size_t connection_count = 0;
    uint64_t mutations_applied = 0;
    uint64_t broadcasts_sent = 0;
    uint64_t heartbeats_sent = 0;
    uint64_t dead_connections_removed = 0;
};

/**
 * @class RoomClockCoordinator
 * @brief Holds one authoritative playback position per room and broadcasts it.
 */
class RoomClockCoordinator {
public:
    using TimeSource = std::function<SteadyTime()>;
    using RoomCallback = std::function<void(const std::string& room_id)>;

    /**
     * @brief Constructs the coordinator.
     * @param settings Shared engine settings. Only `room_clock` is read.
     * @param time_source Optional clock override. Defaults to `std::chrono::steady_clock::now`.
     */
    explicit RoomClockCoordinator(std::shared_ptr<SyncEngineSettings> settings,
                                  TimeSource time_source = nullptr);
    ~RoomClockCoordinator();

    RoomClockCoordinator(const RoomClockCoordinator&) = delete;
    RoomClockCoordinator& operator=(const RoomClockCoordinator&) = delete;

    /**
     * @brief Registers callbacks fired (outside all locks) when a room is created or destroyed.
     * @details Used by the heartbeat scheduler to maintain its per-room timers.
     */
    void set_room_lifecycle_callbacks(RoomCallback on_created, RoomCallback on_removed);

    // --- Membership ---
    /**
     * @brief Idempotent get-or-create.
     * @details The identity that creates the room becomes its admin. Identities seen later
     *          default to `user`.
     * @return true if this call created the room.
     */
    bool ensure_room(const std::string& room_id, const std::string& identity);

    /**
     * @brief Registers a connection, sends it a `sync` snapshot and broadcasts `user_joined`.
     * @return false if the connection is null or already registered.
     */
    bool join(const std::string& room_id, std::shared_ptr<IRoomConnection> connection);

    /**
     * @brief Unregisters a connection and broadcasts `user_left`.
     * @return false if the room or connection is unknown.
     */
    bool leave(const std::string& room_id, const std::string& connection_id);

    // --- Playback clock ---
    /**
     * @brief Applies a playback mutation and broadcasts it as one command message.
     * @details `last_mutation_time` moves only when the play state toggles, the position differs
     *          from the extrapolated position by more than the configured tolerance, or a new item
     *          is set.
     * @param room_id Target room.
     * @param op The mutation.
     * @param originator_id Connection that issued the op. Excluded from play, pause and seek
     *        broadcasts when `exclude_originator_from_commands` is set.
     * @return false if the room does not exist.
     */
    bool mutate(const std::string& room_id, const PlaybackOp& op, const std::string& originator_id = "");

    /**
     * @brief Moves to the next queue item after the current one ended.
     * @param ended_item_id If non-empty, the advance only happens while this is still the
     *        current item, so duplicate reports from several clients advance once.
     * @return true if the room advanced.
     */
    bool advance(const std::string& room_id, const std::string& ended_item_id = "");

    /**
     * @brief Broadcasts the extrapolated position as a non-mutating heartbeat.
     * @return true if a heartbeat was sent. Paused rooms and rooms without connections are skipped.
     */
    bool heartbeat(const std::string& room_id);

    /** @brief Consistent snapshot of a room, or nullopt if unknown. */
    std::optional<RoomSnapshot> snapshot(const std::string& room_id) const;

    /** @brief Sends a `sync` snapshot to one connection (answers `sync_request`). */
    bool send_snapshot(const std::string& room_id, const std::string& connection_id);

    // --- Queue ---
    bool queue_add(const std::string& room_id, MediaItem item);
    bool queue_remove(const std::string& room_id, int index);
    bool queue_reorder(const std::string& room_id, int old_index, int new_index);
    bool queue_toggle_pin(const std::string& room_id, int index);
    bool queue_play(const std::string& room_id, int index);

    // --- Roles and settings ---
    /** @brief Sets `target`'s role. Only admins may promote. */
    bool promote(const std::string& room_id, const std::string& requester,
                 const std::string& target, RoomRole role);

    /** @brief Flips the room's `permanent` flag. Admin only. */
    bool toggle_permanent(const std::string& room_id, const std::string& requester);

    // --- Housekeeping ---
    std::vector<std::string> room_ids() const;

    /**
     * @brief Destroys rooms that have had no connections for longer than `ttl_sec`.
     * @details Permanent rooms are kept.
     * @return The ids of the destroyed rooms.
     */
    std::vector<std::string> cleanup_stale_rooms(double ttl_sec);

    CoordinatorStats stats() const;

private:
    struct RoomRecord {
        std::mutex mutex;          ///< Guards `authority`, `connections`, `removed`.
        std::mutex fanout_mutex;   ///< Orders command broadcasts.
        RoomAuthority authority;
        std::map<std::string, std::shared_ptr<IRoomConnection>> connections;
        bool removed = false;
    };

    using ConnectionList = std::vector<std::shared_ptr<IRoomConnection>>;

    std::shared_ptr<RoomRecord> find_room(const std::string& room_id) const;
    std::shared_ptr<RoomRecord> get_or_create_room(const std::string& room_id,
                                                   const std::string& identity,
                                                   bool* created);

    // Callers hold room.mutex.
    static ConnectionList collect_targets(const RoomRecord& room, const std::string& exclude_id);
    static std::vector<std::string> member_list(const RoomRecord& room);
    RoomSnapshot snapshot_locked(const RoomRecord& room, SteadyTime now) const;
    bool apply_playback_op(RoomAuthority& authority, const PlaybackOp& op, SteadyTime now) const;
    bool advance_locked(RoomAuthority& authority, SteadyTime now) const;
    std::string encode_set_item(const RoomAuthority& authority, SteadyTime now) const;
    std::string encode_queue_update(const RoomAuthority& authority) const;

    /**
     * @brief Sends `text` to each target. Never aborts on a failed send.
     * @return Ids of connections whose send failed.
     */
    std::vector<std::string> deliver(const ConnectionList& targets, const std::string& text);

    /** @brief Removes dead connections and notifies the rest, repeating for new failures. */
    void remove_dead_connections(const std::string& room_id,
                                 const std::shared_ptr<RoomRecord>& room,
                                 std::vector<std::string> dead_ids);

    /** @brief Mutates the room under its locks, then broadcasts the produced message. */
    bool mutate_and_broadcast(const std::string& room_id,
                              const std::function<bool(RoomRecord&, SteadyTime, std::string&)>& apply,
                              const std::string& exclude_id);

    SteadyTime now() const;

    std::shared_ptr<SyncEngineSettings> settings_;
    TimeSource time_source_;

    mutable std::mutex rooms_mutex_;
    std::map<std::string, std::shared_ptr<RoomRecord>> rooms_;

    std::mutex callbacks_mutex_;
    RoomCallback on_room_created_;
    RoomCallback on_room_removed_;

    std::atomic<uint64_t> mutations_applied_{0};
    std::atomic<uint64_t> broadcasts_sent_{0};
    std::atomic<uint64_t> heartbeats_sent_{0};
    std::atomic<uint64_t> dead_connections_removed_{0};
};

} // namespace engine
} // namespace syncroom

#endif // ROOM_CLOCK_COORDINATOR_H
