#include "latency_estimator.h"
#include "../utils/cpp_logger.h"

#include <cmath>

namespace syncroom {
namespace engine {

LatencyEstimator::LatencyEstimator(double smoothing_factor)
    : smoothing_factor_(smoothing_factor) {
    if (!(smoothing_factor_ >= 0.0 && smoothing_factor_ < 1.0)) {
        LOG_CPP_WARNING("[LatencyEstimator] Invalid smoothing factor %.3f, using 0.8", smoothing_factor);
        smoothing_factor_ = 0.8;
    }
}

bool LatencyEstimator::add_sample(double rtt_ms) {
    if (!std::isfinite(rtt_ms) || rtt_ms < 0.0) {
        LOG_CPP_DEBUG("[LatencyEstimator] Rejected RTT sample %.3fms", rtt_ms);
        return false;
    }

    const double one_way = rtt_ms / 2.0;
    if (sample_count_ == 0) {
        estimate_ms_ = one_way;
    } else {
        estimate_ms_ = estimate_ms_ * smoothing_factor_ + one_way * (1.0 - smoothing_factor_);
    }
    sample_count_++;
    LOG_CPP_DEBUG("[LatencyEstimator] rtt=%.1fms latency=%.1fms (n=%zu)", rtt_ms, estimate_ms_, sample_count_);
    return true;
}

void LatencyEstimator::reset() {
    estimate_ms_ = 0.0;
    sample_count_ = 0;
}

} // namespace engine
} // namespace syncroom
