#include "reconnect_policy.h"
#include "../utils/cpp_logger.h"

#include <algorithm>

namespace syncroom {
namespace engine {

ReconnectPolicy::ReconnectPolicy(const ReconnectTuning& tuning)
    : tuning_(tuning) {
    if (tuning_.initial_delay_ms <= 0) {
        tuning_.initial_delay_ms = 1;
    }
    if (tuning_.max_delay_ms < tuning_.initial_delay_ms) {
        tuning_.max_delay_ms = tuning_.initial_delay_ms;
    }
}

std::optional<std::chrono::milliseconds> ReconnectPolicy::next_delay() {
    if (exhausted()) {
        return std::nullopt;
    }

    long delay = tuning_.initial_delay_ms;
    for (int i = 0; i < attempts_ && delay < tuning_.max_delay_ms; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, tuning_.max_delay_ms);

    attempts_++;
    LOG_CPP_INFO("[ReconnectPolicy] Attempt %d/%d in %ldms", attempts_, tuning_.max_attempts, delay);
    return std::chrono::milliseconds(delay);
}

void ReconnectPolicy::reset() {
    attempts_ = 0;
}

} // namespace engine
} // namespace syncroom
