#include "room_server.h"
#include "websocket_room_connection.h"
#include "../utils/cpp_logger.h"

#include <rtc/rtc.hpp>

#include <variant>

namespace syncroom {
namespace engine {

RoomServer::RoomServer(std::shared_ptr<SyncEngineSettings> settings)
    : m_settings(settings ? std::move(settings) : std::make_shared<SyncEngineSettings>()) {
    LOG_CPP_DEBUG("RoomServer created.");
}

RoomServer::~RoomServer() {
    shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool RoomServer::initialize(int port, const std::string& bind_address) {
    std::scoped_lock lock(m_manager_mutex);
    if (m_running) {
        LOG_CPP_INFO("RoomServer already initialized.");
        return true;
    }
    if (port < 0 || port > 65535) {
        LOG_CPP_ERROR("RoomServer: invalid port %d.", port);
        return false;
    }

    LOG_CPP_INFO("Initializing RoomServer on %s:%d",
                 bind_address.empty() ? "*" : bind_address.c_str(), port);

    try {
        {
            std::lock_guard<std::mutex> clients_lock(m_clients_mutex);
            m_coordinator = std::make_shared<RoomClockCoordinator>(m_settings);
            m_router = std::make_shared<RoomMessageRouter>(m_coordinator.get());
        }
        m_heartbeat_scheduler = std::make_unique<HeartbeatScheduler>(m_coordinator.get(), m_settings);
        m_janitor = std::make_unique<StaleRoomJanitor>(m_coordinator.get(), m_settings);

        HeartbeatScheduler* scheduler = m_heartbeat_scheduler.get();
        m_coordinator->set_room_lifecycle_callbacks(
            [scheduler](const std::string& room_id) { scheduler->add_room(room_id); },
            [scheduler](const std::string& room_id) { scheduler->remove_room(room_id); });

        m_heartbeat_scheduler->start();
        m_janitor->start();

        rtc::InitLogger(rtc::LogLevel::Warning);
        rtc::Preload();

        rtc::WebSocketServer::Configuration config;
        config.port = static_cast<uint16_t>(port);
        config.enableTls = false;
        if (!bind_address.empty()) {
            config.bindAddress = bind_address;
        }

        m_ws_server = std::make_unique<rtc::WebSocketServer>(config);
        m_ws_server->onClient([this](std::shared_ptr<rtc::WebSocket> socket) {
            handle_client(std::move(socket));
        });
        m_port = m_ws_server->port();
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("Failed to initialize RoomServer: %s", e.what());
        // Clean up partially initialized components
        teardown_locked();
        return false;
    }

    m_running = true;
    LOG_CPP_INFO("RoomServer listening on port %d.", m_port);
    return true;
}

void RoomServer::shutdown() {
    std::scoped_lock lock(m_manager_mutex);
    if (!m_running && !m_coordinator) {
        return;
    }
    LOG_CPP_INFO("Shutting down RoomServer...");
    teardown_locked();
    LOG_CPP_INFO("RoomServer shutdown complete.");
}

void RoomServer::teardown_locked() {
    m_running = false;

    if (m_ws_server) {
        m_ws_server->stop();
    }

    std::map<rtc::WebSocket*, std::shared_ptr<rtc::WebSocket>> sockets;
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        sockets.swap(m_sockets);
        m_clients.clear();
    }
    for (auto& [raw, socket] : sockets) {
        try {
            socket->resetCallbacks();
            socket->close();
        } catch (const std::exception& e) {
            LOG_CPP_DEBUG("RoomServer: ignoring socket close exception: %s", e.what());
        }
    }
    m_ws_server.reset();

    if (m_heartbeat_scheduler) {
        m_heartbeat_scheduler->stop();
    }
    if (m_janitor) {
        m_janitor->stop();
    }
    if (m_coordinator) {
        m_coordinator->set_room_lifecycle_callbacks(nullptr, nullptr);
    }

    m_janitor.reset();
    m_heartbeat_scheduler.reset();
    std::lock_guard<std::mutex> lock(m_clients_mutex);
    m_router.reset();
    m_coordinator.reset();
}

// ============================================================================
// Transport callbacks
// ============================================================================

void RoomServer::handle_client(std::shared_ptr<rtc::WebSocket> socket) {
    rtc::WebSocket* raw = socket.get();
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        m_sockets[raw] = socket;
    }

    std::weak_ptr<rtc::WebSocket> weak = socket;
    socket->onOpen([this, weak]() {
        if (auto s = weak.lock()) {
            handle_open(s);
        }
    });
    socket->onMessage([this, raw](rtc::message_variant data) {
        if (std::holds_alternative<std::string>(data)) {
            handle_message(raw, std::get<std::string>(data));
        }
    });
    socket->onError([](std::string error) {
        LOG_CPP_WARNING("RoomServer: WebSocket error: %s", error.c_str());
    });
    socket->onClosed([this, raw]() {
        handle_closed(raw);
    });
}

void RoomServer::handle_open(const std::shared_ptr<rtc::WebSocket>& socket) {
    auto path = socket->path();
    auto target = parse_room_path(path.value_or(""));
    if (!target) {
        LOG_CPP_WARNING("RoomServer: rejecting connection with path '%s'.", path.value_or("").c_str());
        socket->close();
        return;
    }

    auto connection = std::make_shared<WebSocketRoomConnection>(
        "conn-" + std::to_string(m_next_connection_id++), target->identity, socket);

    std::shared_ptr<RoomMessageRouter> router;
    std::shared_ptr<RoomClockCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        if (!m_sockets.count(socket.get())) {
            return; // Closed or shut down before the handshake completed.
        }
        m_clients[socket.get()] = ClientSlot{target->room_id, connection};
        router = m_router;
        coordinator = m_coordinator;
    }

    if (!router || !router->on_open(target->room_id, connection)) {
        LOG_CPP_WARNING("RoomServer: join failed for '%s' in room '%s'.",
                        target->identity.c_str(), target->room_id.c_str());
        socket->close();
    }
}

void RoomServer::handle_message(rtc::WebSocket* socket, const std::string& text) {
    ClientSlot slot;
    std::shared_ptr<RoomMessageRouter> router;
    std::shared_ptr<RoomClockCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        auto it = m_clients.find(socket);
        if (it == m_clients.end()) {
            return;
        }
        slot = it->second;
        router = m_router;
        coordinator = m_coordinator;
    }
    if (router) {
        router->on_message(slot.room_id, slot.connection, text);
    }
}

void RoomServer::handle_closed(rtc::WebSocket* socket) {
    ClientSlot slot;
    bool had_slot = false;
    std::shared_ptr<RoomMessageRouter> router;
    std::shared_ptr<RoomClockCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        auto it = m_clients.find(socket);
        if (it != m_clients.end()) {
            slot = it->second;
            had_slot = true;
            m_clients.erase(it);
        }
        m_sockets.erase(socket);
        router = m_router;
        coordinator = m_coordinator;
    }
    if (had_slot && router) {
        router->on_close(slot.room_id, slot.connection->id());
    }
}

// ============================================================================
// Query API
// ============================================================================

std::vector<std::string> RoomServer::list_rooms() const {
    std::scoped_lock lock(m_manager_mutex);
    return m_coordinator ? m_coordinator->room_ids() : std::vector<std::string>();
}

std::optional<RoomSnapshot> RoomServer::get_room_snapshot(const std::string& room_id) const {
    std::scoped_lock lock(m_manager_mutex);
    return m_coordinator ? m_coordinator->snapshot(room_id) : std::nullopt;
}

CoordinatorStats RoomServer::get_stats() const {
    std::scoped_lock lock(m_manager_mutex);
    return m_coordinator ? m_coordinator->stats() : CoordinatorStats{};
}

uint64_t RoomServer::get_dropped_message_count() const {
    std::scoped_lock lock(m_manager_mutex);
    return m_router ? m_router->dropped_messages() : 0;
}

bool RoomServer::set_settings(const SyncEngineSettings& settings) {
    std::scoped_lock lock(m_manager_mutex);
    if (m_running) {
        LOG_CPP_WARNING("RoomServer: settings cannot change while running.");
        return false;
    }
    *m_settings = settings;
    return true;
}

std::size_t RoomServer::cleanup_stale_rooms() {
    std::scoped_lock lock(m_manager_mutex);
    return m_janitor ? m_janitor->sweep() : 0;
}

} // namespace engine
} // namespace syncroom
