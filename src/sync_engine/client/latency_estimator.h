/**
 * @file latency_estimator.h
 * @brief Smoothed one-way latency estimate from ping/pong round trips.
 * @details One-way latency is taken as half the round-trip time. The first accepted sample seeds
 *          the estimate directly; later samples are blended with an exponentially weighted moving
 *          average: `est = est * smoothing + sample * (1 - smoothing)`.
 */
#ifndef LATENCY_ESTIMATOR_H
#define LATENCY_ESTIMATOR_H

#include <cstddef>

namespace syncroom {
namespace engine {

class LatencyEstimator {
public:
    explicit LatencyEstimator(double smoothing_factor = 0.8);

    /**
     * @brief Adds one round-trip measurement.
     * @param rtt_ms Round-trip time in milliseconds.
     * @return false if the sample was rejected (negative or not finite).
     */
    bool add_sample(double rtt_ms);

    bool has_estimate() const { return sample_count_ > 0; }
    std::size_t sample_count() const { return sample_count_; }

    /** @brief Current one-way estimate in milliseconds. 0 before the first sample. */
    double latency_ms() const { return estimate_ms_; }
    double latency_sec() const { return estimate_ms_ / 1000.0; }

    void reset();

private:
    double smoothing_factor_;
    double estimate_ms_ = 0.0;
    std::size_t sample_count_ = 0;
};

} // namespace engine
} // namespace syncroom

#endif // LATENCY_ESTIMATOR_H
