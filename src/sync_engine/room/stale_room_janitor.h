#ifndef STALE_ROOM_JANITOR_H
#define STALE_ROOM_JANITOR_H

#include "../utils/engine_component.h"
#include "../configuration/sync_engine_settings.h"
#include "room_clock_coordinator.h"

#include <condition_variable>
#include <memory>
#include <mutex>

namespace syncroom {
namespace engine {

/**
 * @class StaleRoomJanitor
 * @brief Periodically destroys rooms that stayed empty past `room_clock.empty_room_ttl_sec`.
 */
class StaleRoomJanitor : public EngineComponent {
public:
    StaleRoomJanitor(RoomClockCoordinator* coordinator, std::shared_ptr<SyncEngineSettings> settings);
    ~StaleRoomJanitor() override;

    void start() override;
    void stop() override;

    /** @brief Runs one cleanup pass immediately. Returns the number of rooms destroyed. */
    std::size_t sweep();

protected:
    void run() override;

private:
    RoomClockCoordinator* m_coordinator;
    std::shared_ptr<SyncEngineSettings> m_settings;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace engine
} // namespace syncroom

#endif // STALE_ROOM_JANITOR_H
