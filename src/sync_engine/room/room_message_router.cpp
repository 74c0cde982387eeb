#include "room_message_router.h"
#include "../utils/cpp_logger.h"

#include <cctype>

namespace syncroom {
namespace engine {

using protocol::MessageType;

// ============================================================================
// Path parsing
// ============================================================================

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<RoomPathTarget> parse_room_path(const std::string& path) {
    static const std::string kPrefix = "/ws/";
    if (path.compare(0, kPrefix.size(), kPrefix) != 0) {
        return std::nullopt;
    }

    std::string rest = path.substr(kPrefix.size());
    std::string query;
    auto q = rest.find('?');
    if (q != std::string::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    if (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    if (rest.empty() || rest.find('/') != std::string::npos) {
        return std::nullopt;
    }

    RoomPathTarget target;
    target.room_id = url_decode(rest);
    target.identity = kDefaultIdentity;

    std::size_t pos = 0;
    while (pos <= query.size() && !query.empty()) {
        auto amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == "user") {
            std::string user = url_decode(pair.substr(eq + 1));
            if (!user.empty()) {
                target.identity = user;
            }
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return target;
}

// ============================================================================
// Router
// ============================================================================

RoomMessageRouter::RoomMessageRouter(RoomClockCoordinator* coordinator)
    : m_coordinator(coordinator) {
    if (!m_coordinator) {
        LOG_CPP_ERROR("[RoomMessageRouter] coordinator pointer is null!");
    }
}

bool RoomMessageRouter::on_open(const std::string& room_id, const std::shared_ptr<IRoomConnection>& connection) {
    if (!m_coordinator) {
        return false;
    }
    return m_coordinator->join(room_id, connection);
}

void RoomMessageRouter::on_close(const std::string& room_id, const std::string& connection_id) {
    if (m_coordinator) {
        m_coordinator->leave(room_id, connection_id);
    }
}

void RoomMessageRouter::drop(const std::string& room_id, const std::string& reason) {
    m_dropped_messages++;
    LOG_CPP_WARNING("[RoomMessageRouter] Room '%s': dropped message (%s).", room_id.c_str(), reason.c_str());
}

void RoomMessageRouter::reply_pong(const std::shared_ptr<IRoomConnection>& connection, const Json::Value& payload) {
    std::string text = protocol::encode_envelope(
        MessageType::Pong,
        protocol::make_pong_payload(payload["client_time"], protocol::wall_clock_ms()));
    try {
        if (!connection->send(text)) {
            LOG_CPP_WARNING("[RoomMessageRouter] Failed to send pong to '%s'.", connection->id().c_str());
        }
    } catch (const std::exception& e) {
        LOG_CPP_WARNING("[RoomMessageRouter] Pong to '%s' threw: %s", connection->id().c_str(), e.what());
    }
}

void RoomMessageRouter::on_message(const std::string& room_id,
                                   const std::shared_ptr<IRoomConnection>& connection,
                                   const std::string& text) {
    if (!m_coordinator || !connection) {
        return;
    }

    auto envelope = protocol::decode_envelope(text);
    if (!envelope) {
        drop(room_id, "malformed from " + connection->identity());
        return;
    }

    const Json::Value& payload = envelope->payload;
    const std::string& identity = connection->identity();

    switch (envelope->type) {
        case MessageType::Play:
            m_coordinator->mutate(room_id, PlaybackOp::play(protocol::get_number(payload, "timestamp")), connection->id());
            break;
        case MessageType::Pause:
            m_coordinator->mutate(room_id, PlaybackOp::pause(protocol::get_number(payload, "timestamp")), connection->id());
            break;
        case MessageType::Seek:
            m_coordinator->mutate(room_id, PlaybackOp::seek(protocol::get_number(payload, "timestamp")), connection->id());
            break;
        case MessageType::SetItem: {
            auto item = protocol::media_item_from_json(payload["item"]);
            if (!item) {
                drop(room_id, "set_item without a valid item");
                break;
            }
            item->added_by = identity;
            m_coordinator->mutate(room_id, PlaybackOp::set_item(std::move(*item)), connection->id());
            break;
        }
        case MessageType::ItemEnded:
            m_coordinator->advance(room_id, protocol::get_string(payload, "item_id"));
            break;
        case MessageType::QueueAdd: {
            auto item = protocol::media_item_from_json(payload["item"]);
            if (!item) {
                drop(room_id, "queue_add without a valid item");
                break;
            }
            item->added_by = identity;
            m_coordinator->queue_add(room_id, std::move(*item));
            break;
        }
        case MessageType::QueueRemove:
            m_coordinator->queue_remove(room_id, protocol::get_int(payload, "index", -1));
            break;
        case MessageType::QueueReorder:
            m_coordinator->queue_reorder(room_id, protocol::get_int(payload, "old_index", -1),
                                         protocol::get_int(payload, "new_index", -1));
            break;
        case MessageType::QueuePin:
            m_coordinator->queue_toggle_pin(room_id, protocol::get_int(payload, "index", -1));
            break;
        case MessageType::QueuePlay:
            m_coordinator->queue_play(room_id, protocol::get_int(payload, "index", -1));
            break;
        case MessageType::Promote: {
            auto role = parse_room_role(protocol::get_string(payload, "role"));
            std::string target = protocol::get_string(payload, "target");
            if (!role || target.empty()) {
                drop(room_id, "promote without target or valid role");
                break;
            }
            m_coordinator->promote(room_id, identity, target, *role);
            break;
        }
        case MessageType::TogglePermanent:
            m_coordinator->toggle_permanent(room_id, identity);
            break;
        case MessageType::Ping:
            reply_pong(connection, payload);
            break;
        case MessageType::SyncRequest:
            m_coordinator->send_snapshot(room_id, connection->id());
            break;
        default:
            drop(room_id, "unexpected type '" + envelope->type_name + "'");
            break;
    }
}

} // namespace engine
} // namespace syncroom
