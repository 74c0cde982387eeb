#include "heartbeat_scheduler.h"
#include "../utils/cpp_logger.h"

#include <vector>

namespace syncroom {
namespace engine {

HeartbeatScheduler::HeartbeatScheduler(RoomClockCoordinator* coordinator, std::shared_ptr<SyncEngineSettings> settings)
    : m_coordinator(coordinator),
      m_settings(settings ? std::move(settings) : std::make_shared<SyncEngineSettings>()) {
    if (!m_coordinator) {
        LOG_CPP_ERROR("[HeartbeatScheduler] coordinator pointer is null!");
    }
    LOG_CPP_INFO("[HeartbeatScheduler] Initialized with interval=%ldms", m_settings->room_clock.heartbeat_interval_ms);
}

HeartbeatScheduler::~HeartbeatScheduler() {
    if (!stop_flag_) {
        stop();
    }
}

void HeartbeatScheduler::start() {
    if (is_running()) {
        return;
    }
    LOG_CPP_INFO("[HeartbeatScheduler] Starting...");
    stop_flag_ = false;
    component_thread_ = std::thread(&HeartbeatScheduler::run, this);
}

void HeartbeatScheduler::stop() {
    if (stop_flag_) {
        return;
    }
    LOG_CPP_INFO("[HeartbeatScheduler] Stopping...");
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stop_flag_ = true;
    }
    m_cv.notify_all();
    if (component_thread_.joinable()) {
        component_thread_.join();
    }
}

std::chrono::milliseconds HeartbeatScheduler::interval() const {
    long ms = m_settings->room_clock.heartbeat_interval_ms;
    return std::chrono::milliseconds(ms > 0 ? ms : 1);
}

void HeartbeatScheduler::add_room(const std::string& room_id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_next_due.count(room_id)) {
            return;
        }
        m_next_due[room_id] = std::chrono::steady_clock::now() + interval();
    }
    LOG_CPP_DEBUG("[HeartbeatScheduler] Scheduled room '%s'.", room_id.c_str());
    m_cv.notify_all();
}

void HeartbeatScheduler::remove_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_next_due.erase(room_id)) {
        LOG_CPP_DEBUG("[HeartbeatScheduler] Unscheduled room '%s'.", room_id.c_str());
    }
}

std::size_t HeartbeatScheduler::scheduled_room_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_next_due.size();
}

void HeartbeatScheduler::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!stop_flag_) {
        if (m_next_due.empty()) {
            m_cv.wait(lock, [this] { return stop_flag_ || !m_next_due.empty(); });
            continue;
        }

        auto earliest = m_next_due.begin()->second;
        for (const auto& [id, due] : m_next_due) {
            if (due < earliest) earliest = due;
        }
        if (std::chrono::steady_clock::now() < earliest) {
            m_cv.wait_until(lock, earliest);
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        std::vector<std::string> due_rooms;
        for (auto& [id, due] : m_next_due) {
            if (due <= now) {
                due_rooms.push_back(id);
                due += interval();
                if (due <= now) {
                    due = now + interval(); // Fell behind by more than one interval.
                }
            }
        }

        lock.unlock();
        for (const auto& id : due_rooms) {
            if (m_coordinator) {
                m_coordinator->heartbeat(id);
            }
        }
        lock.lock();
    }
}

} // namespace engine
} // namespace syncroom
