#ifndef RECONNECT_POLICY_H
#define RECONNECT_POLICY_H

#include "../configuration/sync_engine_settings.h"

#include <chrono>
#include <optional>

namespace syncroom {
namespace engine {

/**
 * @class ReconnectPolicy
 * @brief Capped exponential backoff with a bounded number of attempts.
 * @details Attempt n (0-based) waits `min(initial * 2^n, max)`. After `max_attempts` delays have
 *          been handed out, `next_delay` returns nullopt until `reset` is called on a successful
 *          connection.
 */
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(const ReconnectTuning& tuning);

    std::optional<std::chrono::milliseconds> next_delay();
    void reset();

    int attempts() const { return attempts_; }
    bool exhausted() const { return attempts_ >= tuning_.max_attempts; }

private:
    ReconnectTuning tuning_;
    int attempts_ = 0;
};

} // namespace engine
} // namespace syncroom

#endif // RECONNECT_POLICY_H
