#ifndef SYNC_ENGINE_SETTINGS_H
#define SYNC_ENGINE_SETTINGS_H

#include <cstddef>
#include <memory>

namespace syncroom {
namespace engine {

struct RoomClockTuning {
    long heartbeat_interval_ms = 5000;
    double position_change_tolerance_sec = 0.01;  // Seeks closer than this to the extrapolated position are not a change
    double empty_room_ttl_sec = 300.0;            // Grace period before an empty, non-permanent room is destroyed
    long cleanup_interval_ms = 60000;
    bool exclude_originator_from_commands = true; // The sender already applied the change locally
};

struct LatencyTuning {
    long ping_interval_ms = 5000;
    double smoothing_factor = 0.8;                // Weight of the previous estimate
    long probe_timeout_ms = 10000;
};

struct DriftCorrectionTuning {
    double hard_seek_threshold_sec = 3.0;
    double rate_adjust_threshold_sec = 0.5;
    double catch_up_rate = 1.05;
    double slow_down_rate = 0.95;
    double join_seek_threshold_sec = 0.5;         // Snapshot positions closer than this are not sought to
};

struct DualStreamTuning {
    double buffer_threshold_sec = 0.3;
    double drift_threshold_sec = 0.15;
    double heavy_sync_threshold_sec = 0.5;
    double sync_frequency_hz = 4.0;

    // --- Heavy resync ---
    long heavy_sync_cooldown_base_ms = 2000;
    int heavy_sync_cooldown_max_exponent = 4;     // Cooldown is base * 2^min(failures, this)
    long heavy_sync_timeout_ms = 3000;
    int max_consecutive_failures = 5;
    int ready_state_threshold = 3;                // HAVE_FUTURE_DATA

    // --- Light correction ---
    double secondary_ahead_rate = 0.97;
    double secondary_behind_rate = 1.03;

    // --- Passive recovery ---
    long recovery_retry_interval_ms = 100;
    int max_recovery_attempts = 3;
    int recovery_min_ready_state = 2;             // HAVE_CURRENT_DATA
};

struct ReconnectTuning {
    long initial_delay_ms = 1000;
    long max_delay_ms = 30000;
    int max_attempts = 10;
};

class SyncEngineSettings {
public:
    RoomClockTuning room_clock;
    LatencyTuning latency;
    DriftCorrectionTuning drift_correction;
    DualStreamTuning dual_stream;
    ReconnectTuning reconnect;
};

inline long resolve_tick_interval_ms(const DualStreamTuning& tuning) {
    if (tuning.sync_frequency_hz <= 0.0) {
        return 250;
    }
    long interval = static_cast<long>(1000.0 / tuning.sync_frequency_hz);
    return interval > 0 ? interval : 1;
}

} // namespace engine
} // namespace syncroom

#endif // SYNC_ENGINE_SETTINGS_H
