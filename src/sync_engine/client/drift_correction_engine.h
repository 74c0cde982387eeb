/**
 * @file drift_correction_engine.h
 * @brief Client-side engine that keeps the local player aligned with the room clock.
 * @details Commands (play, pause, seek) are always obeyed. Heartbeats are advisory: the engine
 *          compensates the broadcast position by the estimated one-way latency, measures the
 *          drift against the local player, and either hard-seeks or nudges the playback rate.
 */
#ifndef DRIFT_CORRECTION_ENGINE_H
#define DRIFT_CORRECTION_ENGINE_H

#include "playback_target.h"
#include "../configuration/sync_engine_settings.h"

#include <optional>

namespace syncroom {
namespace engine {

enum class CorrectionAction {
    None,       ///< Within tolerance. Rate is reset to 1.0.
    RateAdjust, ///< Rate nudged to catch up or slow down.
    HardSeek    ///< Drift too large to absorb. Seek to the compensated position.
};

inline const char* correction_action_name(CorrectionAction action) {
    switch (action) {
        case CorrectionAction::None:       return "none";
        case CorrectionAction::RateAdjust: return "rate_adjust";
        case CorrectionAction::HardSeek:   return "hard_seek";
    }
    return "none";
}

struct CorrectionDecision {
    CorrectionAction action = CorrectionAction::None;
    double drift = 0.0;                 ///< compensated - local, in seconds. Positive means behind.
    double compensated_position = 0.0;
    double target_rate = 1.0;
};

enum class PlaybackCommandKind {
    Play,
    Pause,
    Seek
};

struct PlaybackCommand {
    PlaybackCommandKind kind = PlaybackCommandKind::Pause;
    double position = 0.0;
    bool is_live = false;
};

class DriftCorrectionEngine {
public:
    DriftCorrectionEngine(IPlaybackTarget* target, const DriftCorrectionTuning& tuning);

    /** @brief Replaces the controlled player, e.g. after new media was loaded. May be null. */
    void set_target(IPlaybackTarget* target);
    IPlaybackTarget* target() const { return target_; }

    /** @brief Obeys a play, pause or seek command. Resets the rate to 1.0. */
    void on_command(const PlaybackCommand& command);

    /**
     * @brief Evaluates and applies a heartbeat.
     * @return The applied decision, or nullopt if the heartbeat was ignored because either side
     *         is not playing.
     */
    std::optional<CorrectionDecision> on_heartbeat(double position, bool is_playing, double latency_sec);

    /**
     * @brief Applies a full room snapshot.
     * @details Seeks only when the local position differs by more than the join threshold.
     */
    void apply_snapshot(bool is_playing, double position, bool is_live);

    /** @brief The drift policy. Pure function of its inputs. */
    static CorrectionDecision evaluate(double broadcast_position, double latency_sec,
                                       double local_time, const DriftCorrectionTuning& tuning);

    const std::optional<CorrectionDecision>& last_decision() const { return last_decision_; }

private:
    void seek_unless_live_edge(double position, bool is_live);

    IPlaybackTarget* target_;
    DriftCorrectionTuning tuning_;
    std::optional<CorrectionDecision> last_decision_;
};

} // namespace engine
} // namespace syncroom

#endif // DRIFT_CORRECTION_ENGINE_H
