/**
 * @file room_authority.h
 * @brief Defines the authoritative playback record of a room and its snapshot form.
 * @details A `RoomAuthority` stores the position at the moment of the last semantic change
 *          together with the steady-clock time of that change. The live position is never
 *          stored; it is extrapolated on demand from the anchor. This keeps heartbeats read-only.
 */
#ifndef ROOM_AUTHORITY_H
#define ROOM_AUTHORITY_H

#include "../sync_types.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace syncroom {
namespace engine {

/**
 * @struct RoomAuthority
 * @brief The single source of truth for one room. Owned by the coordinator, mutated under the
 *        room's mutation lock only.
 */
struct RoomAuthority {
    std::string room_id;
    bool is_playing = false;
    double position = 0.0;                   ///< Position (seconds) at `last_mutation_time`.
    SteadyTime last_mutation_time{};         ///< Updated only on semantic change.
    std::optional<MediaItem> current_item;
    std::vector<MediaItem> queue;
    int playing_index = -1;
    std::map<std::string, RoomRole> roles;   ///< identity -> role
    bool permanent = false;
    std::optional<SteadyTime> empty_since;

    bool current_item_is_live() const {
        return current_item.has_value() && current_item->is_live;
    }

    /**
     * @brief Position at `now`, advancing at rate 1.0 while playing.
     * @details Live items are not extrapolated: their position is the live edge, which the
     *          client tracks on its own.
     */
    double extrapolated_position(SteadyTime now) const {
        if (!is_playing || current_item_is_live()) {
            return position;
        }
        std::chrono::duration<double> elapsed = now - last_mutation_time;
        if (elapsed.count() <= 0.0) {
            return position;
        }
        return position + elapsed.count();
    }
};

/**
 * @struct RoomSnapshot
 * @brief A consistent copy of a room taken under its lock, with the position extrapolated at
 *        capture time and the member list derived from the live connections.
 */
struct RoomSnapshot {
    std::string room_id;
    bool is_playing = false;
    double position = 0.0;
    bool is_live = false;
    std::optional<MediaItem> current_item;
    std::vector<MediaItem> queue;
    int playing_index = -1;
    std::map<std::string, RoomRole> roles;
    bool permanent = false;
    std::vector<std::string> members;        ///< Sorted, unique identities.
    std::size_t connection_count = 0;
    SteadyTime captured_at{};
    SteadyTime last_mutation_time{};
};

} // namespace engine
} // namespace syncroom

#endif // ROOM_AUTHORITY_H
