/**
 * @file engine_component.h
 * @brief Defines the EngineComponent abstract base class for threaded components.
 * @details Long-running components (the heartbeat scheduler, the stale-room janitor, the client
 *          loop) derive from this class so their lifecycle (start, stop) and thread handling look the same.
 */
#ifndef ENGINE_COMPONENT_H
#define ENGINE_COMPONENT_H

#include <thread>
#include <atomic>

namespace syncroom {
namespace engine {

/**
 * @class EngineComponent
 * @brief Abstract base class for components that own one worker thread.
 */
class EngineComponent {
public:
    virtual ~EngineComponent() = default;

    EngineComponent(const EngineComponent&) = delete;
    EngineComponent& operator=(const EngineComponent&) = delete;
    EngineComponent(EngineComponent&&) = delete;
    EngineComponent& operator=(EngineComponent&&) = delete;

    /**
     * @brief Starts the component's worker thread.
     * @details Implementations set `stop_flag_` to false and launch `component_thread_` on `run()`.
     */
    virtual void start() = 0;

    /**
     * @brief Signals the worker thread to stop and joins it.
     * @details Implementations set `stop_flag_`, wake any condition variable used by `run()`,
     *          and join `component_thread_`.
     */
    virtual void stop() = 0;

    bool is_running() const {
        return component_thread_.joinable() && !stop_flag_;
    }

protected:
    EngineComponent() : stop_flag_(false) {}

    /** @brief The worker loop. Must check `stop_flag_` regularly. */
    virtual void run() = 0;

    std::thread component_thread_;
    std::atomic<bool> stop_flag_;
};

} // namespace engine
} // namespace syncroom

#endif // ENGINE_COMPONENT_H
