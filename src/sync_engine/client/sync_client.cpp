#include "sync_client.h"
#include "../utils/cpp_logger.h"

#include <rtc/rtc.hpp>
#include <rtc/websocket.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <variant>

namespace syncroom {
namespace engine {

namespace {

std::string url_encode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // anonymous namespace

std::string SyncClient::build_room_url(const std::string& server_url,
                                       const std::string& room_id,
                                       const std::string& identity) {
    std::string base = server_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    std::string url = base + "/ws/" + url_encode(room_id);
    if (!identity.empty()) {
        url += "?user=" + url_encode(identity);
    }
    return url;
}

SyncClient::SyncClient(std::shared_ptr<SyncEngineSettings> settings, RoomSyncSession* session)
    : settings_(settings ? std::move(settings) : std::make_shared<SyncEngineSettings>()),
      session_(session),
      reconnect_(settings_->reconnect) {
    if (!session_) {
        throw std::invalid_argument("SyncClient requires a session");
    }
    session_->set_sender([this](const std::string& text) { return send_text(text); });
}

SyncClient::~SyncClient() {
    stop();
    session_->set_sender(nullptr);
}

void SyncClient::set_target(const std::string& server_url, const std::string& room_id, const std::string& identity) {
    url_ = build_room_url(server_url, room_id, identity);
}

// ============================================================================
// Lifecycle
// ============================================================================

void SyncClient::start() {
    if (is_running()) {
        return;
    }
    if (url_.empty()) {
        LOG_CPP_ERROR("[SyncClient] No room target set.");
        return;
    }
    LOG_CPP_INFO("[SyncClient] Starting, connecting to %s", url_.c_str());
    stop_flag_ = false;
    events_.reset();
    reconnect_.reset();
    reconnect_at_.reset();
    component_thread_ = std::thread(&SyncClient::run, this);
}

void SyncClient::stop() {
    if (!component_thread_.joinable()) {
        return;
    }
    LOG_CPP_INFO("[SyncClient] Stopping...");
    stop_flag_ = true;
    events_.stop();
    component_thread_.join();
}

void SyncClient::post(SessionAction action) {
    ClientEvent event;
    event.type = ClientEventType::Action;
    event.action = std::move(action);
    events_.push(std::move(event));
}

// ============================================================================
// Socket
// ============================================================================

bool SyncClient::open_socket() {
    socket_generation_++;
    const uint64_t generation = socket_generation_;

    auto socket = std::make_shared<rtc::WebSocket>();
    socket->onOpen([this, generation]() {
        ClientEvent event;
        event.type = ClientEventType::Opened;
        event.socket_generation = generation;
        events_.push(std::move(event));
    });
    socket->onClosed([this, generation]() {
        ClientEvent event;
        event.type = ClientEventType::Closed;
        event.socket_generation = generation;
        events_.push(std::move(event));
    });
    socket->onError([this, generation](std::string error) {
        LOG_CPP_WARNING("[SyncClient] WebSocket error: %s", error.c_str());
        ClientEvent event;
        event.type = ClientEventType::Closed;
        event.socket_generation = generation;
        events_.push(std::move(event));
    });
    socket->onMessage([this, generation](rtc::message_variant message) {
        if (auto* text = std::get_if<std::string>(&message)) {
            ClientEvent event;
            event.type = ClientEventType::Message;
            event.socket_generation = generation;
            event.text = std::move(*text);
            events_.push(std::move(event));
        }
    });

    try {
        socket->open(url_);
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("[SyncClient] Failed to open %s: %s", url_.c_str(), e.what());
        socket->resetCallbacks();
        return false;
    }
    socket_ = std::move(socket);
    return true;
}

void SyncClient::close_socket() {
    socket_generation_++;
    if (!socket_) {
        return;
    }
    socket_->resetCallbacks();
    try {
        socket_->close();
    } catch (const std::exception& e) {
        LOG_CPP_DEBUG("[SyncClient] Ignoring close exception: %s", e.what());
    }
    socket_.reset();
}

bool SyncClient::send_text(const std::string& text) {
    if (!socket_ || !socket_->isOpen()) {
        return false;
    }
    try {
        socket_->send(text);
    } catch (const std::exception& e) {
        LOG_CPP_WARNING("[SyncClient] send failed: %s", e.what());
        return false;
    }
    return true;
}

void SyncClient::drop_connection(SteadyTime now) {
    close_socket();
    if (session_->connected()) {
        session_->on_disconnected();
    }

    auto delay = reconnect_.next_delay();
    if (!delay) {
        LOG_CPP_ERROR("[SyncClient] Giving up after %d reconnect attempts.", reconnect_.attempts());
        reconnect_at_.reset();
        if (notice_callback_) {
            notice_callback_("Connection lost. Reload to reconnect.");
        }
        return;
    }
    reconnect_at_ = now + *delay;
}

// ============================================================================
// Loop
// ============================================================================

void SyncClient::handle_event(ClientEvent& event, SteadyTime now) {
    switch (event.type) {
        case ClientEventType::Opened:
            if (event.socket_generation != socket_generation_) {
                return;
            }
            LOG_CPP_INFO("[SyncClient] Connected to %s", url_.c_str());
            reconnect_.reset();
            session_->on_connected(now);
            break;
        case ClientEventType::Closed:
            if (event.socket_generation != socket_generation_) {
                return;
            }
            LOG_CPP_WARNING("[SyncClient] Connection closed.");
            drop_connection(now);
            break;
        case ClientEventType::Message:
            if (event.socket_generation != socket_generation_) {
                return;
            }
            session_->handle_message(event.text, now);
            break;
        case ClientEventType::Action:
            if (event.action) {
                event.action(*session_);
            }
            break;
    }
}

void SyncClient::run() {
    LOG_CPP_INFO("[SyncClient] Loop started.");
    const std::chrono::milliseconds tick_interval(resolve_tick_interval_ms(settings_->dual_stream));
    SteadyTime next_tick = std::chrono::steady_clock::now() + tick_interval;

    if (!open_socket()) {
        drop_connection(std::chrono::steady_clock::now());
    }

    while (!stop_flag_) {
        SteadyTime now = std::chrono::steady_clock::now();
        SteadyTime wake = next_tick;
        if (reconnect_at_ && *reconnect_at_ < wake) {
            wake = *reconnect_at_;
        }
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(wake - now);
        if (wait.count() < 0) {
            wait = std::chrono::milliseconds(0);
        }

        ClientEvent event;
        if (events_.pop_for(event, wait)) {
            handle_event(event, std::chrono::steady_clock::now());
        }
        if (stop_flag_) {
            break;
        }

        now = std::chrono::steady_clock::now();
        if (now >= next_tick) {
            session_->tick(now);
            next_tick = now + tick_interval;
            if (session_->probe_timed_out(now)) {
                LOG_CPP_WARNING("[SyncClient] Latency probe timed out, reconnecting.");
                drop_connection(now);
            }
        }
        if (reconnect_at_ && now >= *reconnect_at_) {
            reconnect_at_.reset();
            LOG_CPP_INFO("[SyncClient] Reconnecting (attempt %d).", reconnect_.attempts());
            if (!open_socket()) {
                drop_connection(now);
            }
        }
    }

    close_socket();
    if (session_->connected()) {
        session_->on_disconnected();
    }
    LOG_CPP_INFO("[SyncClient] Loop stopped.");
}

} // namespace engine
} // namespace syncroom
