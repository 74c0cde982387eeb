/**
 * @file websocket_room_connection.h
 * @brief Adapts a libdatachannel WebSocket to the IRoomConnection interface.
 */
#ifndef WEBSOCKET_ROOM_CONNECTION_H
#define WEBSOCKET_ROOM_CONNECTION_H

#include "../room/room_connection.h"

#include <rtc/websocket.hpp>

#include <memory>
#include <string>

namespace syncroom {
namespace engine {

class WebSocketRoomConnection : public IRoomConnection {
public:
    WebSocketRoomConnection(std::string id, std::string identity, std::shared_ptr<rtc::WebSocket> socket);
    ~WebSocketRoomConnection() override = default;

    const std::string& id() const override { return id_; }
    const std::string& identity() const override { return identity_; }

    /**
     * @brief Queues a text frame on the socket.
     * @details `rtc::WebSocket::send` returns false when the frame was buffered rather than written
     *          immediately, which is not a failure. Only a closed socket or an exception counts.
     */
    bool send(const std::string& text) override;
    void close() override;

private:
    std::string id_;
    std::string identity_;
    std::shared_ptr<rtc::WebSocket> socket_;
};

} // namespace engine
} // namespace syncroom

#endif // WEBSOCKET_ROOM_CONNECTION_H
