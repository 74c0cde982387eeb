#include "websocket_room_connection.h"
#include "../utils/cpp_logger.h"

namespace syncroom {
namespace engine {

WebSocketRoomConnection::WebSocketRoomConnection(std::string id, std::string identity,
                                                 std::shared_ptr<rtc::WebSocket> socket)
    : id_(std::move(id)), identity_(std::move(identity)), socket_(std::move(socket)) {}

bool WebSocketRoomConnection::send(const std::string& text) {
    if (!socket_ || !socket_->isOpen()) {
        return false;
    }
    try {
        socket_->send(text);
    } catch (const std::exception& e) {
        LOG_CPP_WARNING("[WebSocketRoomConnection:%s] send failed: %s", id_.c_str(), e.what());
        return false;
    }
    return true;
}

void WebSocketRoomConnection::close() {
    if (!socket_) {
        return;
    }
    try {
        socket_->close();
    } catch (const std::exception& e) {
        LOG_CPP_DEBUG("[WebSocketRoomConnection:%s] Ignoring close exception: %s", id_.c_str(), e.what());
    }
}

} // namespace engine
} // namespace syncroom
