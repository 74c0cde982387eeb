#include "drift_correction_engine.h"
#include "../utils/cpp_logger.h"

#include <cmath>

namespace syncroom {
namespace engine {

DriftCorrectionEngine::DriftCorrectionEngine(IPlaybackTarget* target, const DriftCorrectionTuning& tuning)
    : target_(target), tuning_(tuning) {}

void DriftCorrectionEngine::set_target(IPlaybackTarget* target) {
    target_ = target;
    last_decision_.reset();
}

CorrectionDecision DriftCorrectionEngine::evaluate(double broadcast_position, double latency_sec,
                                                   double local_time, const DriftCorrectionTuning& tuning) {
    CorrectionDecision decision;
    decision.compensated_position = broadcast_position + latency_sec;
    decision.drift = decision.compensated_position - local_time;

    const double abs_drift = std::fabs(decision.drift);
    if (abs_drift > tuning.hard_seek_threshold_sec) {
        decision.action = CorrectionAction::HardSeek;
        decision.target_rate = 1.0;
    } else if (decision.drift > tuning.rate_adjust_threshold_sec) {
        decision.action = CorrectionAction::RateAdjust;
        decision.target_rate = tuning.catch_up_rate;
    } else if (decision.drift < -tuning.rate_adjust_threshold_sec) {
        decision.action = CorrectionAction::RateAdjust;
        decision.target_rate = tuning.slow_down_rate;
    } else {
        decision.action = CorrectionAction::None;
        decision.target_rate = 1.0;
    }
    return decision;
}

void DriftCorrectionEngine::seek_unless_live_edge(double position, bool is_live) {
    // Position 0 on a live item means "stay at the live edge".
    if (is_live && position == 0.0) {
        return;
    }
    target_->seek(position);
}

void DriftCorrectionEngine::on_command(const PlaybackCommand& command) {
    if (!target_) {
        LOG_CPP_DEBUG("[DriftCorrectionEngine] Command ignored, no player attached.");
        return;
    }

    seek_unless_live_edge(command.position, command.is_live);
    switch (command.kind) {
        case PlaybackCommandKind::Play:
            target_->play();
            break;
        case PlaybackCommandKind::Pause:
            target_->pause();
            break;
        case PlaybackCommandKind::Seek:
            break;
    }
    target_->set_playback_rate(1.0);
    LOG_CPP_DEBUG("[DriftCorrectionEngine] Command %d at %.3f applied.",
                  static_cast<int>(command.kind), command.position);
}

std::optional<CorrectionDecision> DriftCorrectionEngine::on_heartbeat(double position, bool is_playing,
                                                                      double latency_sec) {
    if (!target_ || !is_playing || !target_->is_playing()) {
        return std::nullopt;
    }

    CorrectionDecision decision = evaluate(position, latency_sec, target_->current_time(), tuning_);
    if (decision.action == CorrectionAction::HardSeek) {
        LOG_CPP_INFO("[DriftCorrectionEngine] Drift %.3fs, seeking to %.3f.",
                     decision.drift, decision.compensated_position);
        target_->seek(decision.compensated_position);
    } else if (decision.action == CorrectionAction::RateAdjust) {
        LOG_CPP_DEBUG("[DriftCorrectionEngine] Drift %.3fs, rate %.2f.", decision.drift, decision.target_rate);
    }
    target_->set_playback_rate(decision.target_rate);

    last_decision_ = decision;
    return decision;
}

void DriftCorrectionEngine::apply_snapshot(bool is_playing, double position, bool is_live) {
    if (!target_) {
        return;
    }

    if (!(is_live && position == 0.0) &&
        std::fabs(position - target_->current_time()) > tuning_.join_seek_threshold_sec) {
        LOG_CPP_INFO("[DriftCorrectionEngine] Snapshot at %.3f, local %.3f. Seeking.",
                     position, target_->current_time());
        target_->seek(position);
    }

    if (is_playing) {
        target_->play();
    } else {
        target_->pause();
    }
    target_->set_playback_rate(1.0);
}

} // namespace engine
} // namespace syncroom
