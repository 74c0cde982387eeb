/**
 * @file heartbeat_scheduler.h
 * @brief Per-room heartbeat timers multiplexed on one thread.
 * @details Each room registered with the scheduler gets its own due time, first set one interval
 *          after registration. The worker sleeps until the earliest due time, fires every due room
 *          through `RoomClockCoordinator::heartbeat` without holding its own lock, then re-arms
 *          those rooms. Rooms therefore beat independently of each other.
 */
#ifndef HEARTBEAT_SCHEDULER_H
#define HEARTBEAT_SCHEDULER_H

#include "../utils/engine_component.h"
#include "../configuration/sync_engine_settings.h"
#include "room_clock_coordinator.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace syncroom {
namespace engine {

class HeartbeatScheduler : public EngineComponent {
public:
    HeartbeatScheduler(RoomClockCoordinator* coordinator, std::shared_ptr<SyncEngineSettings> settings);
    ~HeartbeatScheduler() override;

    void start() override;
    void stop() override;

    /** @brief Arms a timer for `room_id`. No-op if it is already scheduled. */
    void add_room(const std::string& room_id);

    /** @brief Cancels the room's timer. */
    void remove_room(const std::string& room_id);

    std::size_t scheduled_room_count() const;

protected:
    void run() override;

private:
    std::chrono::milliseconds interval() const;

    RoomClockCoordinator* m_coordinator;
    std::shared_ptr<SyncEngineSettings> m_settings;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, std::chrono::steady_clock::time_point> m_next_due;
};

} // namespace engine
} // namespace syncroom

#endif // HEARTBEAT_SCHEDULER_H
