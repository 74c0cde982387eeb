#include "dual_stream_sync.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <cmath>

namespace syncroom {
namespace engine {

DualStreamSync::DualStreamSync(const DualStreamTuning& tuning)
    : tuning_(tuning) {}

// ============================================================================
// Attachment
// ============================================================================

bool DualStreamSync::attach(std::shared_ptr<IMediaElement> primary, std::shared_ptr<IMediaElement> secondary) {
    if (!primary || !secondary) {
        LOG_CPP_ERROR("[DualStreamSync] attach requires both a primary and a secondary element.");
        return false;
    }

    generation_++;
    primary_ = SerializedMediaElement::wrap(std::move(primary));
    secondary_ = SerializedMediaElement::wrap(std::move(secondary));

    const double volume = state_.volume;
    const bool muted = state_.muted;
    const bool visible = state_.visible;
    state_ = DualStreamState{};
    state_.volume = volume;
    state_.muted = muted;
    state_.visible = visible;

    resync_ = HeavyResync{};
    base_rate_ = 1.0;
    last_recovery_attempt_.reset();
    pending_primary_resume_.reset();
    primary_resume_attempts_ = 0;
    last_primary_resume_attempt_.reset();
    pending_stall_notice_ = false;

    primary_->set_muted(true);
    secondary_->set_volume(state_.volume);
    secondary_->set_muted(state_.muted);

    LOG_CPP_INFO("[DualStreamSync] Attached media (generation %llu).",
                 static_cast<unsigned long long>(generation_));
    return true;
}

void DualStreamSync::detach() {
    generation_++;
    primary_.reset();
    secondary_.reset();
    resync_ = HeavyResync{};
    state_.is_syncing = false;
    state_.is_buffering = false;
    state_.is_playing = false;
    pending_primary_resume_.reset();
}

std::chrono::milliseconds DualStreamSync::heavy_sync_cooldown() const {
    int exponent = std::min({state_.consecutive_failures, tuning_.heavy_sync_cooldown_max_exponent,
                             kMaxCooldownExponent});
    exponent = std::max(exponent, 0);
    const long long base_ms = std::max(tuning_.heavy_sync_cooldown_base_ms, 0L);
    return std::chrono::milliseconds(base_ms << exponent);
}

// ============================================================================
// Tick
// ============================================================================

void DualStreamSync::tick(SteadyTime now) {
    if (!attached()) {
        return;
    }

    state_.current_time = primary_->current_time();
    state_.duration = primary_->duration();

    if (resync_.phase == ResyncPhase::Syncing) {
        advance_heavy_resync(now);
        return;
    }

    if (pending_primary_resume_ && now >= *pending_primary_resume_) {
        pending_primary_resume_.reset();
        if (state_.is_playing && primary_->paused()) {
            LOG_CPP_INFO("[DualStreamSync] Resuming primary after an external pause.");
            play_primary();
        }
    }

    if (primary_->paused()) {
        if (state_.is_playing && !pending_primary_resume_) {
            resume_stalled_primary(now);
        }
        return;
    }
    primary_resume_attempts_ = 0;

    if (primary_->seeking() || secondary_->seeking()) {
        return;
    }

    if (monitor_buffers()) {
        return;
    }

    if (secondary_->paused()) {
        attempt_passive_recovery(now);
        return;
    }
    state_.recovery_attempts = 0;

    correct_drift(now);
}

bool DualStreamSync::monitor_buffers() {
    const double ahead = std::min(seconds_buffered_ahead(*primary_), seconds_buffered_ahead(*secondary_));
    const bool near_end = std::isfinite(state_.duration) && state_.duration > 0.0 &&
                          state_.duration - state_.current_time <= tuning_.buffer_threshold_sec;

    if (ahead < tuning_.buffer_threshold_sec && !near_end) {
        if (!state_.is_buffering) {
            LOG_CPP_INFO("[DualStreamSync] Buffer low (%.3fs ahead), holding secondary.", ahead);
            state_.is_buffering = true;
        }
        if (!secondary_->paused()) {
            secondary_->pause();
        }
        return true;
    }

    if (state_.is_buffering) {
        LOG_CPP_INFO("[DualStreamSync] Buffer recovered (%.3fs ahead), resuming secondary.", ahead);
        state_.is_buffering = false;
        align_secondary();
        play_secondary();
        return true;
    }
    return false;
}

void DualStreamSync::attempt_passive_recovery(SteadyTime now) {
    if (state_.is_buffering || state_.is_syncing || secondary_->play_pending()) {
        return;
    }
    if (secondary_->ready_state() < tuning_.recovery_min_ready_state) {
        return;
    }
    if (state_.recovery_attempts >= tuning_.max_recovery_attempts) {
        return;
    }
    if (last_recovery_attempt_ &&
        now - *last_recovery_attempt_ < std::chrono::milliseconds(tuning_.recovery_retry_interval_ms)) {
        return;
    }

    last_recovery_attempt_ = now;
    state_.recovery_attempts++;
    LOG_CPP_WARNING("[DualStreamSync] Secondary paused unexpectedly, recovering (attempt %d/%d).",
                    state_.recovery_attempts, tuning_.max_recovery_attempts);
    align_secondary();
    play_secondary();
}

void DualStreamSync::resume_stalled_primary(SteadyTime now) {
    if (primary_->play_pending() || primary_resume_attempts_ >= tuning_.max_recovery_attempts) {
        return;
    }
    if (last_primary_resume_attempt_ &&
        now - *last_primary_resume_attempt_ < std::chrono::milliseconds(tuning_.recovery_retry_interval_ms)) {
        return;
    }

    last_primary_resume_attempt_ = now;
    primary_resume_attempts_++;
    LOG_CPP_WARNING("[DualStreamSync] Primary stalled while playing, retrying play (attempt %d/%d).",
                    primary_resume_attempts_, tuning_.max_recovery_attempts);
    if (primary_resume_attempts_ == tuning_.max_recovery_attempts) {
        pending_stall_notice_ = true;
    }
    play_primary();
}

void DualStreamSync::correct_drift(SteadyTime now) {
    const double drift = secondary_->current_time() - primary_->current_time();
    state_.last_drift = drift;
    const double abs_drift = std::fabs(drift);

    if (abs_drift <= tuning_.drift_threshold_sec) {
        set_secondary_rate(base_rate_);
        return;
    }

    const double light_rate = drift > 0.0 ? tuning_.secondary_ahead_rate : tuning_.secondary_behind_rate;
    if (abs_drift <= tuning_.heavy_sync_threshold_sec) {
        set_secondary_rate(base_rate_ * light_rate);
        return;
    }

    if (!start_heavy_resync(now, drift)) {
        set_secondary_rate(base_rate_ * light_rate);
    }
}

// ============================================================================
// Heavy resync
// ============================================================================

bool DualStreamSync::start_heavy_resync(SteadyTime now, double drift) {
    if (state_.sync_health == SyncHealth::Failed) {
        return false;
    }
    if (state_.last_heavy_sync_time && now - *state_.last_heavy_sync_time < heavy_sync_cooldown()) {
        return false;
    }

    const double target = primary_->current_time();
    resync_.phase = ResyncPhase::Syncing;
    resync_.started_at = now;
    resync_.was_playing = !primary_->paused();
    resync_.generation = generation_;
    state_.is_syncing = true;
    state_.sync_health = SyncHealth::Recovering;
    state_.last_heavy_sync_time = now;

    LOG_CPP_INFO("[DualStreamSync] Heavy resync: drift %.3fs, aligning both to %.3f (failures so far %d).",
                 drift, target, state_.consecutive_failures);

    primary_->pause();
    secondary_->pause();
    primary_->set_current_time(target);
    secondary_->set_current_time(target);
    set_secondary_rate(base_rate_);
    return true;
}

void DualStreamSync::advance_heavy_resync(SteadyTime now) {
    if (resync_.generation != generation_) {
        resync_ = HeavyResync{};
        state_.is_syncing = false;
        return;
    }

    const bool ready = primary_->ready_state() >= tuning_.ready_state_threshold &&
                       secondary_->ready_state() >= tuning_.ready_state_threshold &&
                       !primary_->seeking() && !secondary_->seeking();
    if (ready) {
        if (state_.consecutive_failures > 0) {
            LOG_CPP_INFO("[DualStreamSync] Heavy resync succeeded after %d failures.", state_.consecutive_failures);
        }
        state_.consecutive_failures = 0;
        state_.sync_health = SyncHealth::Good;
        finish_heavy_resync(now, resync_.was_playing);
        return;
    }

    if (now - resync_.started_at < std::chrono::milliseconds(tuning_.heavy_sync_timeout_ms)) {
        return;
    }

    state_.consecutive_failures++;
    if (state_.consecutive_failures >= tuning_.max_consecutive_failures) {
        state_.sync_health = SyncHealth::Failed;
        LOG_CPP_ERROR("[DualStreamSync] Heavy resync failed %d times, giving up.", state_.consecutive_failures);
        raise_notice("Audio and video could not be resynchronized. Consider reloading.");
    } else {
        state_.sync_health = SyncHealth::Recovering;
        LOG_CPP_WARNING("[DualStreamSync] Heavy resync timed out (%d/%d). Next attempt in %lldms.",
                        state_.consecutive_failures, tuning_.max_consecutive_failures,
                        static_cast<long long>(heavy_sync_cooldown().count()));
    }
    finish_heavy_resync(now, resync_.was_playing || state_.is_playing);
}

void DualStreamSync::finish_heavy_resync(SteadyTime now, bool resume) {
    resync_.phase = ResyncPhase::Idle;
    state_.is_syncing = false;
    if (!resume) {
        return;
    }
    // Each element is resumed on its own; a rejected primary play is retried from tick().
    primary_resume_attempts_ = 0;
    last_primary_resume_attempt_ = now;
    play_primary();
    if (secondary_->paused() && !secondary_->play_pending()) {
        play_secondary();
    }
}

// ============================================================================
// Element control
// ============================================================================

void DualStreamSync::align_secondary() {
    secondary_->set_current_time(primary_->current_time());
}

void DualStreamSync::play_primary() {
    const uint64_t generation = generation_;
    std::weak_ptr<DualStreamSync> weak_self = weak_from_this();
    primary_->play([weak_self, generation](PlayResult result) {
        auto self = weak_self.lock();
        if (!self || generation != self->generation_) {
            return;
        }
        self->on_primary_play_result(result);
    });
}

void DualStreamSync::play_secondary() {
    const uint64_t generation = generation_;
    std::weak_ptr<DualStreamSync> weak_self = weak_from_this();
    secondary_->play([weak_self, generation](PlayResult result) {
        auto self = weak_self.lock();
        if (!self || generation != self->generation_) {
            return;
        }
        self->on_secondary_play_result(result, false);
    });
}

void DualStreamSync::on_primary_play_result(PlayResult result) {
    if (result != PlayResult::Started) {
        LOG_CPP_WARNING("[DualStreamSync] Primary play %s.", play_result_name(result));
        if (pending_stall_notice_) {
            pending_stall_notice_ = false;
            LOG_CPP_ERROR("[DualStreamSync] Primary could not be resumed after %d attempts.",
                          primary_resume_attempts_);
            raise_notice("Playback could not be resumed. Press play to try again.");
        }
        return;
    }
    pending_stall_notice_ = false;
    if (secondary_->paused() && !state_.is_syncing) {
        align_secondary();
        play_secondary();
    }
}

void DualStreamSync::on_secondary_play_result(PlayResult result, bool muted_retry) {
    switch (result) {
        case PlayResult::Started:
            return;
        case PlayResult::NotAllowed: {
            if (muted_retry) {
                LOG_CPP_ERROR("[DualStreamSync] Secondary play not allowed even when muted.");
                return;
            }
            LOG_CPP_WARNING("[DualStreamSync] Audio autoplay blocked, continuing muted.");
            state_.muted = true;
            secondary_->set_muted(true);
            raise_notice("Audio was muted by the browser. Unmute to hear sound.");
            const uint64_t generation = generation_;
            std::weak_ptr<DualStreamSync> weak_self = weak_from_this();
            secondary_->play([weak_self, generation](PlayResult retry_result) {
                auto self = weak_self.lock();
                if (!self || generation != self->generation_) {
                    return;
                }
                self->on_secondary_play_result(retry_result, true);
            });
            return;
        }
        case PlayResult::Aborted:
            LOG_CPP_DEBUG("[DualStreamSync] Secondary play aborted.");
            return;
        case PlayResult::Failed:
            LOG_CPP_WARNING("[DualStreamSync] Secondary play failed.");
            return;
    }
}

void DualStreamSync::set_secondary_rate(double rate) {
    if (secondary_->playback_rate() != rate) {
        secondary_->set_playback_rate(rate);
    }
}

void DualStreamSync::raise_notice(const std::string& message) {
    if (notice_callback_) {
        notice_callback_(message);
    }
}

// ============================================================================
// Events
// ============================================================================

void DualStreamSync::on_visibility_changed(bool visible) {
    state_.visible = visible;
    if (!attached()) {
        return;
    }

    set_secondary_rate(base_rate_);
    if (visible && !state_.is_syncing && !primary_->paused() && secondary_->paused()) {
        LOG_CPP_INFO("[DualStreamSync] Visible again, resuming secondary.");
        state_.recovery_attempts = 0;
        align_secondary();
        play_secondary();
    }
}

void DualStreamSync::on_primary_event(PrimaryEvent event, SteadyTime now) {
    // Pauses and seeks issued by a heavy resync come back as events.
    if (!attached() || state_.is_syncing) {
        return;
    }

    switch (event) {
        case PrimaryEvent::Waiting:
            state_.is_buffering = true;
            secondary_->pause();
            break;
        case PrimaryEvent::CanPlay:
            if (state_.is_buffering) {
                state_.is_buffering = false;
                if (!primary_->paused()) {
                    align_secondary();
                    play_secondary();
                }
            }
            break;
        case PrimaryEvent::Seeking:
            secondary_->pause();
            break;
        case PrimaryEvent::Seeked:
            align_secondary();
            if (!primary_->paused()) {
                play_secondary();
            }
            break;
        case PrimaryEvent::Ended:
            state_.is_playing = false;
            pending_primary_resume_.reset();
            secondary_->pause();
            break;
        case PrimaryEvent::Play:
            if (secondary_->paused()) {
                align_secondary();
                play_secondary();
            }
            break;
        case PrimaryEvent::Pause:
            if (!state_.visible && state_.is_playing) {
                LOG_CPP_INFO("[DualStreamSync] Primary paused while hidden, scheduling resume.");
                pending_primary_resume_ = now + std::chrono::milliseconds(tuning_.recovery_retry_interval_ms);
            } else {
                state_.is_playing = false;
                secondary_->pause();
            }
            break;
    }
}

// ============================================================================
// Controls
// ============================================================================

double DualStreamSync::current_time() const {
    return primary_ ? primary_->current_time() : 0.0;
}

void DualStreamSync::seek(double position) {
    if (!attached()) {
        return;
    }
    position = std::max(0.0, position);
    primary_->set_current_time(position);
    secondary_->set_current_time(position);
    state_.current_time = position;
}

void DualStreamSync::play() {
    state_.is_playing = true;
    pending_primary_resume_.reset();
    primary_resume_attempts_ = 0;
    last_primary_resume_attempt_.reset();
    pending_stall_notice_ = false;
    if (!attached()) {
        return;
    }
    if (state_.is_syncing) {
        resync_.was_playing = true;
        return;
    }
    align_secondary();
    secondary_->set_muted(state_.muted);
    play_primary();
}

void DualStreamSync::pause() {
    state_.is_playing = false;
    pending_primary_resume_.reset();
    if (!attached()) {
        return;
    }
    if (state_.is_syncing) {
        resync_.was_playing = false;
    }
    primary_->pause();
    secondary_->pause();
    set_secondary_rate(base_rate_);
}

void DualStreamSync::set_playback_rate(double rate) {
    base_rate_ = rate;
    if (!attached()) {
        return;
    }
    if (primary_->playback_rate() != rate) {
        primary_->set_playback_rate(rate);
    }
    set_secondary_rate(rate);
}

void DualStreamSync::set_volume(double volume) {
    state_.volume = std::clamp(volume, 0.0, 1.0);
    if (attached()) {
        secondary_->set_volume(state_.volume);
    }
}

void DualStreamSync::set_muted(bool muted) {
    state_.muted = muted;
    if (attached()) {
        secondary_->set_muted(muted);
    }
}

} // namespace engine
} // namespace syncroom
