#include "stale_room_janitor.h"
#include "../utils/cpp_logger.h"

namespace syncroom {
namespace engine {

StaleRoomJanitor::StaleRoomJanitor(RoomClockCoordinator* coordinator, std::shared_ptr<SyncEngineSettings> settings)
    : m_coordinator(coordinator),
      m_settings(settings ? std::move(settings) : std::make_shared<SyncEngineSettings>()) {
    LOG_CPP_INFO("[StaleRoomJanitor] Initialized (ttl=%.0fs, interval=%ldms)",
                 m_settings->room_clock.empty_room_ttl_sec, m_settings->room_clock.cleanup_interval_ms);
}

StaleRoomJanitor::~StaleRoomJanitor() {
    if (!stop_flag_) {
        stop();
    }
}

void StaleRoomJanitor::start() {
    if (is_running()) {
        return;
    }
    LOG_CPP_INFO("[StaleRoomJanitor] Starting...");
    stop_flag_ = false;
    component_thread_ = std::thread(&StaleRoomJanitor::run, this);
}

void StaleRoomJanitor::stop() {
    if (stop_flag_) {
        return;
    }
    LOG_CPP_INFO("[StaleRoomJanitor] Stopping...");
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stop_flag_ = true;
    }
    m_cv.notify_all();
    if (component_thread_.joinable()) {
        component_thread_.join();
    }
}

std::size_t StaleRoomJanitor::sweep() {
    if (!m_coordinator) {
        return 0;
    }
    auto removed = m_coordinator->cleanup_stale_rooms(m_settings->room_clock.empty_room_ttl_sec);
    if (!removed.empty()) {
        LOG_CPP_INFO("[StaleRoomJanitor] Removed %zu stale rooms.", removed.size());
    }
    return removed.size();
}

void StaleRoomJanitor::run() {
    while (!stop_flag_) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            long interval_ms = m_settings->room_clock.cleanup_interval_ms;
            m_cv.wait_for(lock, std::chrono::milliseconds(interval_ms > 0 ? interval_ms : 1000),
                          [this] { return stop_flag_.load(); });
        }
        if (stop_flag_) {
            break;
        }
        sweep();
    }
}

} // namespace engine
} // namespace syncroom
