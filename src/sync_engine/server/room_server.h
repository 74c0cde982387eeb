/**
 * @file room_server.h
 * @brief Defines the RoomServer class, the orchestrator of the server half of the sync engine.
 * @details RoomServer owns the settings, the RoomClockCoordinator, the heartbeat scheduler, the
 *          stale-room janitor, the message router and the libdatachannel WebSocket server. It is
 *          the primary C++ API exposed to Python and is also driven by the standalone
 *          `syncroom_server` executable.
 */
#ifndef ROOM_SERVER_H
#define ROOM_SERVER_H

#include "../configuration/sync_engine_settings.h"
#include "../room/room_clock_coordinator.h"
#include "../room/room_message_router.h"
#include "../room/heartbeat_scheduler.h"
#include "../room/stale_room_janitor.h"

#include <rtc/websocket.hpp>
#include <rtc/websocketserver.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace syncroom {
namespace engine {

class RoomServer {
public:
    /**
     * @brief Constructs a stopped server.
     * @param settings Settings to use. A default-constructed set is created if null.
     */
    explicit RoomServer(std::shared_ptr<SyncEngineSettings> settings = nullptr);
    ~RoomServer();

    RoomServer(const RoomServer&) = delete;
    RoomServer& operator=(const RoomServer&) = delete;
    RoomServer(RoomServer&&) = delete;
    RoomServer& operator=(RoomServer&&) = delete;

    // --- Lifecycle Management ---
    /**
     * @brief Creates the coordinator and background components and starts listening.
     * @param port TCP port for the WebSocket server.
     * @param bind_address Address to bind. Empty binds all interfaces.
     * @return true on success, false on failure.
     */
    bool initialize(int port = 8080, const std::string& bind_address = "");

    /** @brief Closes all sockets and stops all background threads. */
    void shutdown();

    bool is_running() const { return m_running.load(); }
    int port() const { return m_port; }

    // --- Query API ---
    std::vector<std::string> list_rooms() const;
    std::optional<RoomSnapshot> get_room_snapshot(const std::string& room_id) const;
    CoordinatorStats get_stats() const;
    uint64_t get_dropped_message_count() const;

    /** @brief Runs one stale-room cleanup pass now. Returns the number of rooms destroyed. */
    std::size_t cleanup_stale_rooms();

    std::shared_ptr<SyncEngineSettings> get_settings() const { return m_settings; }

    /**
     * @brief Replaces the settings values.
     * @return false while the server is running; settings are read by its threads.
     */
    bool set_settings(const SyncEngineSettings& settings);

    /** @brief Access for embedding and tests. Null until initialized. */
    RoomClockCoordinator* coordinator() const { return m_coordinator.get(); }
    RoomMessageRouter* router() const { return m_router.get(); }

private:
    struct ClientSlot {
        std::string room_id;
        std::shared_ptr<IRoomConnection> connection;
    };

    void handle_client(std::shared_ptr<rtc::WebSocket> socket);
    void handle_open(const std::shared_ptr<rtc::WebSocket>& socket);
    void handle_message(rtc::WebSocket* socket, const std::string& text);
    void handle_closed(rtc::WebSocket* socket);

    /** @brief Stops and releases every component. Caller holds m_manager_mutex. */
    void teardown_locked();

    mutable std::mutex m_manager_mutex;
    std::atomic<bool> m_running{false};
    int m_port = 0;

    std::shared_ptr<SyncEngineSettings> m_settings;
    // Shared so in-flight transport callbacks can keep them alive across shutdown.
    std::shared_ptr<RoomClockCoordinator> m_coordinator;
    std::shared_ptr<RoomMessageRouter> m_router;
    std::unique_ptr<HeartbeatScheduler> m_heartbeat_scheduler;
    std::unique_ptr<StaleRoomJanitor> m_janitor;
    std::unique_ptr<rtc::WebSocketServer> m_ws_server;

    std::mutex m_clients_mutex;  ///< Also guards replacing m_coordinator and m_router.
    std::map<rtc::WebSocket*, std::shared_ptr<rtc::WebSocket>> m_sockets;
    std::map<rtc::WebSocket*, ClientSlot> m_clients;
    std::atomic<uint64_t> m_next_connection_id{1};
};

} // namespace engine
} // namespace syncroom

#endif // ROOM_SERVER_H
