/**
 * @file room_message_router.h
 * @brief Decodes client frames and dispatches them to the RoomClockCoordinator.
 * @details The router is transport independent: the WebSocket server (or a test) hands it the
 *          room id, the connection and the raw text. Malformed or unexpected frames are dropped
 *          with a warning and counted.
 */
#ifndef ROOM_MESSAGE_ROUTER_H
#define ROOM_MESSAGE_ROUTER_H

#include "room_clock_coordinator.h"
#include "room_connection.h"
#include "../protocol/sync_messages.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace syncroom {
namespace engine {

/**
 * @struct RoomPathTarget
 * @brief Room and identity parsed from a `/ws/{room_id}?user={identity}` request path.
 */
struct RoomPathTarget {
    std::string room_id;
    std::string identity;
};

/** @brief Identity used when the request carries none. */
inline constexpr const char* kDefaultIdentity = "Guest";

/**
 * @brief Parses a WebSocket request path.
 * @return The target, or nullopt if the path is not `/ws/<non-empty room id>`.
 */
std::optional<RoomPathTarget> parse_room_path(const std::string& path);

/** @brief Decodes `%XX` escapes and `+` in a URL component. Invalid escapes are kept verbatim. */
std::string url_decode(const std::string& text);

class RoomMessageRouter {
public:
    explicit RoomMessageRouter(RoomClockCoordinator* coordinator);

    /** @brief Joins the connection to the room. */
    bool on_open(const std::string& room_id, const std::shared_ptr<IRoomConnection>& connection);

    /** @brief Decodes and dispatches one client frame. */
    void on_message(const std::string& room_id,
                    const std::shared_ptr<IRoomConnection>& connection,
                    const std::string& text);

    /** @brief Removes the connection from the room. */
    void on_close(const std::string& room_id, const std::string& connection_id);

    uint64_t dropped_messages() const { return m_dropped_messages.load(); }

private:
    void reply_pong(const std::shared_ptr<IRoomConnection>& connection, const Json::Value& payload);
    void drop(const std::string& room_id, const std::string& reason);

    RoomClockCoordinator* m_coordinator;
    std::atomic<uint64_t> m_dropped_messages{0};
};

} // namespace engine
} // namespace syncroom

#endif // ROOM_MESSAGE_ROUTER_H
