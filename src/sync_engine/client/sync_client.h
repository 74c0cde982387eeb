/**
 * @file sync_client.h
 * @brief WebSocket transport and event loop for a RoomSyncSession.
 * @details Transport callbacks run on libdatachannel's threads and only enqueue events. One loop
 *          thread drains the queue, drives the session's periodic tick from a wall-clock timer,
 *          and reconnects with capped exponential backoff when the socket closes or a latency
 *          probe goes unanswered.
 */
#ifndef SYNC_CLIENT_H
#define SYNC_CLIENT_H

#include "reconnect_policy.h"
#include "room_sync_session.h"
#include "../utils/engine_component.h"
#include "../utils/thread_safe_queue.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rtc {
class WebSocket;
}

namespace syncroom {
namespace engine {

class SyncClient : public EngineComponent {
public:
    using SessionAction = std::function<void(RoomSyncSession&)>;
    using NoticeCallback = std::function<void(const std::string&)>;

    /**
     * @param settings Shared engine settings.
     * @param session The session to drive. Not owned; must outlive the client. After `start`,
     *        it must only be touched through `post`.
     */
    SyncClient(std::shared_ptr<SyncEngineSettings> settings, RoomSyncSession* session);
    ~SyncClient() override;

    /** @brief Sets the room to join. Takes effect on the next `start`. */
    void set_target(const std::string& server_url, const std::string& room_id, const std::string& identity);
    void set_notice_callback(NoticeCallback callback) { notice_callback_ = std::move(callback); }

    void start() override;
    void stop() override;

    /** @brief Runs `action` on the loop thread. */
    void post(SessionAction action);

    const std::string& url() const { return url_; }

    /** @brief `ws://host:port` + `/ws/{room_id}?user={identity}`, with both components escaped. */
    static std::string build_room_url(const std::string& server_url,
                                      const std::string& room_id,
                                      const std::string& identity);

protected:
    void run() override;

private:
    enum class ClientEventType {
        Opened,
        Closed,
        Message,
        Action
    };

    struct ClientEvent {
        ClientEventType type = ClientEventType::Action;
        uint64_t socket_generation = 0;
        std::string text;
        SessionAction action;
    };

    bool open_socket();
    void close_socket();
    void drop_connection(SteadyTime now);
    void handle_event(ClientEvent& event, SteadyTime now);
    bool send_text(const std::string& text);

    std::shared_ptr<SyncEngineSettings> settings_;
    RoomSyncSession* session_;
    std::string url_;
    NoticeCallback notice_callback_;

    utils::ThreadSafeQueue<ClientEvent> events_;
    std::shared_ptr<rtc::WebSocket> socket_;
    uint64_t socket_generation_ = 0;
    ReconnectPolicy reconnect_;
    std::optional<SteadyTime> reconnect_at_;
};

} // namespace engine
} // namespace syncroom

#endif // SYNC_CLIENT_H
